#pragma once

#include <cstdint>
#include <span>

#include "msig/common/bytes.hpp"
#include "msig/crypto/ec_point.hpp"
#include "msig/crypto/scalar.hpp"

namespace msig {

// RFC6979 deterministic nonce, low-S, strict DER output. `digest` must be 32 bytes.
Bytes EcdsaSign(std::span<const uint8_t> digest, const Scalar& private_scalar);

// Accepts DER signatures; high-S signatures are normalized before verification.
bool EcdsaVerify(std::span<const uint8_t> digest,
                 std::span<const uint8_t> der_signature,
                 const ECPoint& public_point);

}  // namespace msig
