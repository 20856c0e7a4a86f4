#include "msig/crypto/ecdsa.hpp"

#include <array>
#include <stdexcept>

#include "msig/common/secure_zeroize.hpp"
#include "secp_context.hpp"

namespace msig {
namespace {

using internal::GetSecpContext;

// Longest DER encoding of an (r, s) pair.
constexpr size_t kMaxDerSignatureSize = 72;

}  // namespace

Bytes EcdsaSign(std::span<const uint8_t> digest, const Scalar& private_scalar) {
  if (digest.size() != 32) {
    throw std::invalid_argument("ECDSA digest must be 32 bytes");
  }
  if (private_scalar.IsZero()) {
    throw std::invalid_argument("ECDSA private scalar must be non-zero");
  }

  std::array<uint8_t, 32> seckey = private_scalar.ToCanonicalBytes();
  secp256k1_ecdsa_signature signature;
  const int signed_ok = secp256k1_ecdsa_sign(GetSecpContext(), &signature, digest.data(),
                                             seckey.data(), nullptr, nullptr);
  SecureZeroize(&seckey);
  if (signed_ok != 1) {
    throw std::runtime_error("secp256k1 ECDSA signing failed");
  }

  Bytes der(kMaxDerSignatureSize);
  size_t der_len = der.size();
  if (secp256k1_ecdsa_signature_serialize_der(GetSecpContext(), der.data(), &der_len, &signature) != 1) {
    throw std::runtime_error("Failed to DER-encode ECDSA signature");
  }
  der.resize(der_len);
  return der;
}

bool EcdsaVerify(std::span<const uint8_t> digest,
                 std::span<const uint8_t> der_signature,
                 const ECPoint& public_point) {
  if (digest.size() != 32 || der_signature.empty()) {
    return false;
  }

  secp256k1_ecdsa_signature signature;
  if (secp256k1_ecdsa_signature_parse_der(GetSecpContext(), &signature, der_signature.data(),
                                          der_signature.size()) != 1) {
    return false;
  }
  secp256k1_ecdsa_signature_normalize(GetSecpContext(), &signature, &signature);

  const std::array<uint8_t, 33>& compressed = public_point.compressed();
  secp256k1_pubkey pubkey;
  if (secp256k1_ec_pubkey_parse(GetSecpContext(), &pubkey, compressed.data(), compressed.size()) != 1) {
    return false;
  }
  return secp256k1_ecdsa_verify(GetSecpContext(), &signature, digest.data(), &pubkey) == 1;
}

}  // namespace msig
