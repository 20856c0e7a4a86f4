#include "msig/address/address.hpp"

#include <stdexcept>
#include <vector>

#include "msig/crypto/base58.hpp"
#include "msig/crypto/bech32.hpp"
#include "msig/crypto/hash.hpp"
#include "msig/script/script.hpp"

namespace msig {
namespace {

constexpr size_t kHash160Size = 20;

std::string EncodeVersionedHash(uint8_t version, std::span<const uint8_t> hash) {
  if (hash.size() != kHash160Size) {
    throw std::invalid_argument("Base58 address payload must be a 20-byte hash");
  }
  Bytes payload;
  payload.reserve(1 + hash.size());
  payload.push_back(version);
  payload.insert(payload.end(), hash.begin(), hash.end());
  return EncodeBase58Check(payload);
}

}  // namespace

std::string EncodeP2pkhAddress(std::span<const uint8_t> pubkey_hash, const NetworkParams& params) {
  return EncodeVersionedHash(params.p2pkh_version, pubkey_hash);
}

std::string EncodeScriptHashAddress(std::span<const uint8_t> script, const NetworkParams& params) {
  return EncodeVersionedHash(params.p2sh_version, Hash160(script));
}

std::string EncodeWitnessScriptHashAddress(std::span<const uint8_t> script, const NetworkParams& params) {
  return EncodeSegwitAddress(params.bech32_hrp, 0, Sha256(script));
}

std::optional<DecodedAddress> DecodeAddress(std::string_view address, const NetworkParams& params) {
  if (address.empty()) {
    return std::nullopt;
  }

  uint8_t witness_version = 0;
  std::vector<uint8_t> program;
  if (DecodeSegwitAddress(address, params.bech32_hrp, &witness_version, &program)) {
    DecodedAddress decoded;
    decoded.witness_version = witness_version;
    decoded.program = std::move(program);
    if (witness_version == 0) {
      decoded.type = decoded.program.size() == 20 ? AddressType::kP2wpkh : AddressType::kP2wsh;
    } else {
      decoded.type = AddressType::kWitnessUnknown;
    }
    return decoded;
  }

  Bytes payload;
  if (!DecodeBase58Check(address, &payload) || payload.size() != 1 + kHash160Size) {
    return std::nullopt;
  }

  DecodedAddress decoded;
  if (payload[0] == params.p2pkh_version) {
    decoded.type = AddressType::kP2pkh;
  } else if (payload[0] == params.p2sh_version) {
    decoded.type = AddressType::kP2sh;
  } else {
    return std::nullopt;
  }
  decoded.program.assign(payload.begin() + 1, payload.end());
  return decoded;
}

bool ValidateAddress(std::string_view address, const NetworkParams& params) {
  return DecodeAddress(address, params).has_value();
}

std::optional<Bytes> AddressToScriptPubKey(std::string_view address, const NetworkParams& params) {
  const std::optional<DecodedAddress> decoded = DecodeAddress(address, params);
  if (!decoded.has_value()) {
    return std::nullopt;
  }

  switch (decoded->type) {
    case AddressType::kP2pkh:
      return PubkeyHashScriptPubKey(decoded->program);
    case AddressType::kP2sh:
      return ScriptHashScriptPubKey(decoded->program);
    case AddressType::kP2wpkh:
    case AddressType::kP2wsh:
    case AddressType::kWitnessUnknown:
      return WitnessProgramScriptPubKey(decoded->witness_version, decoded->program);
  }
  return std::nullopt;
}

Bytes PubkeyHashScriptPubKey(std::span<const uint8_t> pubkey_hash) {
  if (pubkey_hash.size() != kHash160Size) {
    throw std::invalid_argument("P2PKH requires a 20-byte hash");
  }
  Bytes script = {OP_DUP, OP_HASH160};
  AppendPushData(pubkey_hash, &script);
  script.push_back(OP_EQUALVERIFY);
  script.push_back(OP_CHECKSIG);
  return script;
}

Bytes ScriptHashScriptPubKey(std::span<const uint8_t> script_hash) {
  if (script_hash.size() != kHash160Size) {
    throw std::invalid_argument("P2SH requires a 20-byte hash");
  }
  Bytes script = {OP_HASH160};
  AppendPushData(script_hash, &script);
  script.push_back(OP_EQUAL);
  return script;
}

Bytes WitnessProgramScriptPubKey(uint8_t witness_version, std::span<const uint8_t> program) {
  if (witness_version > 16 || program.size() < 2 || program.size() > 40) {
    throw std::invalid_argument("Invalid witness version or program length");
  }
  Bytes script;
  AppendSmallInt(witness_version, &script);
  AppendPushData(program, &script);
  return script;
}

}  // namespace msig
