#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace msig {

enum class Bech32Variant {
  kBech32 = 0,   // BIP173, witness version 0
  kBech32m = 1,  // BIP350, witness version 1..16
};

// Segwit address for `program` under `hrp`. The variant follows from the witness version.
std::string EncodeSegwitAddress(std::string_view hrp,
                                uint8_t witness_version,
                                std::span<const uint8_t> program);

// Returns false on checksum, HRP, variant, version or program-length mismatch.
bool DecodeSegwitAddress(std::string_view address,
                         std::string_view expected_hrp,
                         uint8_t* witness_version,
                         std::vector<uint8_t>* program);

}  // namespace msig
