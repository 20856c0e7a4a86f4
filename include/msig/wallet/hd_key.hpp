#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "msig/address/network.hpp"
#include "msig/common/bytes.hpp"
#include "msig/crypto/ec_point.hpp"
#include "msig/crypto/scalar.hpp"

namespace msig {

constexpr uint32_t kHardenedOffset = 0x80000000u;

struct PathSegment {
  uint32_t index = 0;
  bool hardened = false;

  uint32_t ChildNumber() const;
  bool operator==(const PathSegment& other) const;
};

class DerivationPath {
 public:
  DerivationPath() = default;
  explicit DerivationPath(std::vector<PathSegment> segments);

  // "m/48'/0'/0'/2'/0"; h and H are accepted as hardened markers.
  // Throws ConfigurationError(kInvalidDerivationPath).
  static DerivationPath Parse(std::string_view text);
  static bool TryParse(std::string_view text, DerivationPath* out);

  DerivationPath Child(uint32_t index, bool hardened) const;
  bool AllHardened() const;

  const std::vector<PathSegment>& segments() const;
  size_t size() const;
  bool empty() const;

  std::string ToString() const;
  bool operator==(const DerivationPath& other) const;
  bool operator!=(const DerivationPath& other) const;

 private:
  std::vector<PathSegment> segments_;
};

// BIP32 node. Holds a private scalar unless built from an xpub or neutered.
class ExtendedKey {
 public:
  ExtendedKey() = default;
  ~ExtendedKey();
  ExtendedKey(const ExtendedKey&) = default;
  ExtendedKey& operator=(const ExtendedKey&) = default;
  ExtendedKey(ExtendedKey&&) = default;
  ExtendedKey& operator=(ExtendedKey&&) = default;

  static ExtendedKey FromSeed(std::span<const uint8_t> seed);
  // Parses xprv/xpub (or tprv/tpub) for `params`. Throws std::invalid_argument.
  static ExtendedKey FromBase58(std::string_view encoded, const NetworkParams& params);

  // Public parents can only derive non-hardened children. Throws std::invalid_argument
  // for that misuse and std::runtime_error for the (negligible) invalid-child case.
  ExtendedKey DeriveChild(uint32_t child_number) const;
  ExtendedKey Derive(const DerivationPath& path) const;
  ExtendedKey Neuter() const;

  bool has_private_key() const;
  const std::optional<Scalar>& private_scalar() const;
  const ECPoint& public_point() const;
  const std::array<uint8_t, 32>& chain_code() const;
  uint8_t depth() const;
  uint32_t parent_fingerprint() const;
  uint32_t child_number() const;

  // First four bytes of HASH160(compressed public key), big-endian.
  uint32_t Fingerprint() const;

  std::string ToBase58(const NetworkParams& params) const;
  std::string ToXpub(const NetworkParams& params) const;

 private:
  std::optional<Scalar> private_scalar_;
  ECPoint public_point_;
  std::array<uint8_t, 32> chain_code_{};
  uint8_t depth_ = 0;
  uint32_t parent_fingerprint_ = 0;
  uint32_t child_number_ = 0;
};

}  // namespace msig
