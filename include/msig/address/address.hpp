#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "msig/address/network.hpp"
#include "msig/common/bytes.hpp"

namespace msig {

enum class AddressType {
  kP2pkh = 0,
  kP2sh = 1,
  kP2wpkh = 2,
  kP2wsh = 3,
  kWitnessUnknown = 4,  // segwit v1+ (Bech32m)
};

struct DecodedAddress {
  AddressType type = AddressType::kP2pkh;
  uint8_t witness_version = 0;
  // HASH160 for P2PKH/P2SH, witness program otherwise.
  Bytes program;
};

std::string EncodeP2pkhAddress(std::span<const uint8_t> pubkey_hash, const NetworkParams& params);
// Base58Check(p2sh_version || HASH160(script)).
std::string EncodeScriptHashAddress(std::span<const uint8_t> script, const NetworkParams& params);
// Bech32 v0 of SHA256(script).
std::string EncodeWitnessScriptHashAddress(std::span<const uint8_t> script, const NetworkParams& params);

std::optional<DecodedAddress> DecodeAddress(std::string_view address, const NetworkParams& params);
bool ValidateAddress(std::string_view address, const NetworkParams& params);
std::optional<Bytes> AddressToScriptPubKey(std::string_view address, const NetworkParams& params);

// Locking scripts for the address forms above.
Bytes PubkeyHashScriptPubKey(std::span<const uint8_t> pubkey_hash);
Bytes ScriptHashScriptPubKey(std::span<const uint8_t> script_hash);
Bytes WitnessProgramScriptPubKey(uint8_t witness_version, std::span<const uint8_t> program);

}  // namespace msig
