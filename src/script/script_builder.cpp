#include "msig/script/script_builder.hpp"

#include <algorithm>
#include <exception>
#include <string>

#include "msig/address/address.hpp"
#include "msig/common/errors.hpp"
#include "msig/crypto/hash.hpp"
#include "msig/script/script.hpp"

namespace msig {
namespace {

constexpr size_t kCompressedKeySize = 33;

MultisigPolicy ValidateAndSort(uint32_t m, std::vector<ECPoint> keys) {
  if (m < 1) {
    throw ConfigurationError(ErrorCode::kInvalidThreshold,
                             "Required signatures must be a positive integer");
  }
  if (keys.empty()) {
    throw ConfigurationError(ErrorCode::kInvalidKeySet, "Public keys array cannot be empty");
  }
  if (m > keys.size()) {
    throw ConfigurationError(ErrorCode::kInvalidThreshold,
                             "Required signatures cannot exceed number of public keys");
  }
  if (keys.size() > kMaxMultisigKeys) {
    throw ConfigurationError(ErrorCode::kInvalidKeySet,
                             "At most " + std::to_string(kMaxMultisigKeys) + " public keys are supported");
  }

  std::sort(keys.begin(), keys.end());
  if (std::adjacent_find(keys.begin(), keys.end()) != keys.end()) {
    throw ConfigurationError(ErrorCode::kInvalidKeySet, "Public keys must be distinct");
  }

  MultisigPolicy policy;
  policy.m = m;
  policy.n = static_cast<uint32_t>(keys.size());
  policy.ordered_keys = std::move(keys);
  return policy;
}

}  // namespace

std::optional<size_t> MultisigPolicy::IndexOf(const ECPoint& key) const {
  const auto it = std::lower_bound(ordered_keys.begin(), ordered_keys.end(), key);
  if (it == ordered_keys.end() || *it != key) {
    return std::nullopt;
  }
  return static_cast<size_t>(it - ordered_keys.begin());
}

bool MultisigPolicy::Contains(const ECPoint& key) const {
  return IndexOf(key).has_value();
}

MultisigPolicy BuildPolicy(uint32_t m, const std::vector<Bytes>& public_keys) {
  std::vector<ECPoint> keys;
  keys.reserve(public_keys.size());
  for (size_t i = 0; i < public_keys.size(); ++i) {
    if (!ECPoint::IsValidCompressed(public_keys[i])) {
      throw ConfigurationError(ErrorCode::kInvalidKeySet,
                               "Public key " + std::to_string(i) + " is not a valid compressed point");
    }
    keys.push_back(ECPoint::FromCompressed(public_keys[i]));
  }
  return ValidateAndSort(m, std::move(keys));
}

MultisigPolicy BuildPolicy(uint32_t m, const std::vector<ECPoint>& public_keys) {
  for (size_t i = 0; i < public_keys.size(); ++i) {
    if (!ECPoint::IsValidCompressed(public_keys[i].compressed())) {
      throw ConfigurationError(ErrorCode::kInvalidKeySet,
                               "Public key " + std::to_string(i) + " is not a valid compressed point");
    }
  }
  return ValidateAndSort(m, public_keys);
}

Bytes BuildScript(const MultisigPolicy& policy) {
  Bytes script;
  script.reserve(3 + policy.ordered_keys.size() * (1 + kCompressedKeySize));
  AppendSmallInt(policy.m, &script);
  for (const ECPoint& key : policy.ordered_keys) {
    AppendPushData(key.compressed(), &script);
  }
  AppendSmallInt(policy.n, &script);
  script.push_back(OP_CHECKMULTISIG);
  return script;
}

WalletAddresses DeriveAddresses(std::span<const uint8_t> script, const NetworkParams& params) {
  if (script.empty()) {
    throw FatalEncodingError(ErrorCode::kAddressDerivationFailure, "Cannot derive addresses for an empty script");
  }
  if (script.size() > kMaxScriptElementSize) {
    throw FatalEncodingError(ErrorCode::kAddressDerivationFailure,
                             "Redeem script exceeds the 520-byte push limit");
  }
  if (script.size() > kMaxWitnessScriptSize) {
    throw FatalEncodingError(ErrorCode::kAddressDerivationFailure,
                             "Witness script exceeds the 10000-byte limit");
  }

  try {
    WalletAddresses out;
    out.p2sh = EncodeScriptHashAddress(script, params);
    out.p2wsh = EncodeWitnessScriptHashAddress(script, params);
    return out;
  } catch (const std::exception& ex) {
    throw FatalEncodingError(ErrorCode::kAddressDerivationFailure,
                             std::string("Address encoding failed: ") + ex.what());
  }
}

std::optional<MultisigPolicy> ParseMultisigScript(std::span<const uint8_t> script) {
  // Smallest: OP_1 <key> OP_1 OP_CHECKMULTISIG
  if (script.size() < 3 + 1 + kCompressedKeySize) {
    return std::nullopt;
  }

  uint32_t m = 0;
  uint32_t n = 0;
  if (!DecodeSmallInt(script.front(), &m) || !DecodeSmallInt(script[script.size() - 2], &n) ||
      script.back() != OP_CHECKMULTISIG) {
    return std::nullopt;
  }
  if (m < 1 || n < 1 || m > n || n > kMaxMultisigKeys) {
    return std::nullopt;
  }
  if (script.size() != 3 + n * (1 + kCompressedKeySize)) {
    return std::nullopt;
  }

  MultisigPolicy policy;
  policy.m = m;
  policy.n = n;
  policy.ordered_keys.reserve(n);
  size_t offset = 1;
  for (uint32_t i = 0; i < n; ++i) {
    if (script[offset] != kCompressedKeySize) {
      return std::nullopt;
    }
    const std::span<const uint8_t> key = script.subspan(offset + 1, kCompressedKeySize);
    if (!ECPoint::IsValidCompressed(key)) {
      return std::nullopt;
    }
    policy.ordered_keys.push_back(ECPoint::FromCompressed(key));
    offset += 1 + kCompressedKeySize;
  }

  // Canonical order means strictly increasing, which also excludes duplicates.
  for (size_t i = 1; i < policy.ordered_keys.size(); ++i) {
    if (!(policy.ordered_keys[i - 1] < policy.ordered_keys[i])) {
      return std::nullopt;
    }
  }
  return policy;
}

bool IsMultisigScript(std::span<const uint8_t> script) {
  return ParseMultisigScript(script).has_value();
}

Bytes P2shScriptPubKey(std::span<const uint8_t> script) {
  return ScriptHashScriptPubKey(Hash160(script));
}

Bytes P2wshScriptPubKey(std::span<const uint8_t> script) {
  return WitnessProgramScriptPubKey(0, Sha256(script));
}

}  // namespace msig
