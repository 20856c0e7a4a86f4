#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "msig/address/network.hpp"
#include "msig/common/bytes.hpp"
#include "msig/crypto/ec_point.hpp"

namespace msig {

// Largest key count whose script still fits a 520-byte P2SH redeem push.
constexpr uint32_t kMaxMultisigKeys = 15;

struct MultisigPolicy {
  uint32_t m = 0;
  uint32_t n = 0;
  // Sorted byte-lexicographically over the compressed encoding.
  std::vector<ECPoint> ordered_keys;

  // Position in the canonical order, or nullopt when `key` is not a member.
  std::optional<size_t> IndexOf(const ECPoint& key) const;
  bool Contains(const ECPoint& key) const;
};

struct WalletAddresses {
  std::string p2sh;
  std::string p2wsh;
};

// Throws ConfigurationError: kInvalidThreshold unless 1 <= m <= |keys|, kInvalidKeySet
// for an empty, oversized or duplicated key set or any invalid compressed point.
MultisigPolicy BuildPolicy(uint32_t m, const std::vector<Bytes>& public_keys);
MultisigPolicy BuildPolicy(uint32_t m, const std::vector<ECPoint>& public_keys);

// OP_m <key1> ... <keyn> OP_n OP_CHECKMULTISIG
Bytes BuildScript(const MultisigPolicy& policy);

// Throws FatalEncodingError(kAddressDerivationFailure) when the script cannot be committed to.
WalletAddresses DeriveAddresses(std::span<const uint8_t> script, const NetworkParams& params);

// Strict inverse of BuildScript. Rejects any other opcode layout, unsorted or duplicate keys.
std::optional<MultisigPolicy> ParseMultisigScript(std::span<const uint8_t> script);
bool IsMultisigScript(std::span<const uint8_t> script);

Bytes P2shScriptPubKey(std::span<const uint8_t> script);
Bytes P2wshScriptPubKey(std::span<const uint8_t> script);

}  // namespace msig
