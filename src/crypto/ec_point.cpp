#include "msig/crypto/ec_point.hpp"

#include <algorithm>
#include <array>
#include <stdexcept>

#include "secp_context.hpp"

namespace msig {
namespace internal {

secp256k1_context* GetSecpContext() {
  static secp256k1_context* ctx = []() {
    secp256k1_context* created = secp256k1_context_create(SECP256K1_CONTEXT_SIGN | SECP256K1_CONTEXT_VERIFY);
    if (created == nullptr) {
      throw std::runtime_error("Failed to create secp256k1 context");
    }
    return created;
  }();
  return ctx;
}

}  // namespace internal

namespace {

using internal::GetSecpContext;

bool TryParsePubkey(std::span<const uint8_t> compressed, secp256k1_pubkey* pubkey) {
  if (compressed.size() != 33 || (compressed[0] != 0x02 && compressed[0] != 0x03)) {
    return false;
  }
  return secp256k1_ec_pubkey_parse(GetSecpContext(), pubkey, compressed.data(), compressed.size()) == 1;
}

secp256k1_pubkey ParsePubkey(const std::array<uint8_t, 33>& compressed) {
  secp256k1_pubkey pubkey;
  if (!TryParsePubkey(compressed, &pubkey)) {
    throw std::invalid_argument("Compressed point is not a valid secp256k1 point");
  }
  return pubkey;
}

std::array<uint8_t, 33> SerializeCompressed(const secp256k1_pubkey& pubkey) {
  std::array<uint8_t, 33> out{};
  size_t out_len = out.size();
  if (secp256k1_ec_pubkey_serialize(
          GetSecpContext(), out.data(), &out_len, &pubkey, SECP256K1_EC_COMPRESSED) != 1 ||
      out_len != out.size()) {
    throw std::runtime_error("Failed to serialize secp256k1 point");
  }
  return out;
}

}  // namespace

ECPoint::ECPoint() {
  compressed_.fill(0);
  compressed_[0] = 0x02;
}

ECPoint ECPoint::FromCompressed(std::span<const uint8_t> compressed_bytes) {
  if (compressed_bytes.size() != 33) {
    throw std::invalid_argument("Compressed point must be 33 bytes");
  }

  std::array<uint8_t, 33> compressed{};
  std::copy(compressed_bytes.begin(), compressed_bytes.end(), compressed.begin());
  (void)ParsePubkey(compressed);

  ECPoint out;
  out.compressed_ = compressed;
  return out;
}

bool ECPoint::IsValidCompressed(std::span<const uint8_t> compressed_bytes) {
  secp256k1_pubkey pubkey;
  return TryParsePubkey(compressed_bytes, &pubkey);
}

ECPoint ECPoint::GeneratorMultiply(const Scalar& scalar) {
  std::array<uint8_t, 32> scalar_bytes = scalar.ToCanonicalBytes();

  secp256k1_pubkey pubkey;
  if (secp256k1_ec_pubkey_create(GetSecpContext(), &pubkey, scalar_bytes.data()) != 1) {
    throw std::invalid_argument("Generator multiplication failed: scalar must be in [1, n-1]");
  }

  ECPoint out;
  out.compressed_ = SerializeCompressed(pubkey);
  return out;
}

ECPoint ECPoint::Add(const ECPoint& other) const {
  secp256k1_pubkey lhs = ParsePubkey(compressed_);
  secp256k1_pubkey rhs = ParsePubkey(other.compressed_);

  const secp256k1_pubkey* inputs[2] = {&lhs, &rhs};
  secp256k1_pubkey combined;
  if (secp256k1_ec_pubkey_combine(GetSecpContext(), &combined, inputs, 2) != 1) {
    throw std::invalid_argument("Point addition failed (sum is point at infinity?)");
  }

  ECPoint out;
  out.compressed_ = SerializeCompressed(combined);
  return out;
}

Bytes ECPoint::ToCompressedBytes() const {
  return Bytes(compressed_.begin(), compressed_.end());
}

const std::array<uint8_t, 33>& ECPoint::compressed() const {
  return compressed_;
}

bool ECPoint::operator==(const ECPoint& other) const {
  return compressed_ == other.compressed_;
}

bool ECPoint::operator!=(const ECPoint& other) const {
  return !(*this == other);
}

bool ECPoint::operator<(const ECPoint& other) const {
  return std::lexicographical_compare(compressed_.begin(), compressed_.end(),
                                      other.compressed_.begin(), other.compressed_.end());
}

}  // namespace msig
