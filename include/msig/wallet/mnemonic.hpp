#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

#include "msig/common/bytes.hpp"

namespace msig {

constexpr uint32_t kBip39SeedIterations = 2048;
constexpr size_t kBip39SeedSize = 64;

// Valid strengths are 128, 160, 192, 224 and 256 bits (12 to 24 words).
bool IsValidMnemonicStrength(uint32_t strength_bits);

// Throws std::invalid_argument for entropy that is not 16..32 bytes in 4-byte steps.
std::string EntropyToMnemonic(std::span<const uint8_t> entropy);
std::string GenerateMnemonic(uint32_t strength_bits);

// Word-list membership, word count and checksum. On failure writes the reason to `error`.
bool ValidateMnemonic(std::string_view phrase, std::string* error = nullptr);
// Throws std::invalid_argument when ValidateMnemonic fails.
Bytes MnemonicToEntropy(std::string_view phrase);

// Lowercase words joined by single spaces; the form the seed is computed over.
std::string NormalizeMnemonic(std::string_view phrase);

// PBKDF2-HMAC-SHA512(NormalizeMnemonic(phrase), "mnemonic" + passphrase, 2048) -> 64 bytes.
Bytes MnemonicToSeed(std::string_view phrase, std::string_view passphrase = "");

}  // namespace msig
