#pragma once

#include <array>
#include <cstdint>
#include <span>

#include "msig/common/bytes.hpp"
#include "msig/crypto/scalar.hpp"

namespace msig {

// A secp256k1 point held in its 33-byte compressed form.
class ECPoint {
 public:
  ECPoint();

  static ECPoint FromCompressed(std::span<const uint8_t> compressed_bytes);
  static bool IsValidCompressed(std::span<const uint8_t> compressed_bytes);
  static ECPoint GeneratorMultiply(const Scalar& scalar);

  ECPoint Add(const ECPoint& other) const;

  Bytes ToCompressedBytes() const;
  const std::array<uint8_t, 33>& compressed() const;

  bool operator==(const ECPoint& other) const;
  bool operator!=(const ECPoint& other) const;
  // Byte-lexicographic over the compressed encoding (canonical key order).
  bool operator<(const ECPoint& other) const;

 private:
  std::array<uint8_t, 33> compressed_{};
};

}  // namespace msig
