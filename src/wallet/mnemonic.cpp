#include "msig/wallet/mnemonic.hpp"

#include <cctype>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include "msig/common/secure_zeroize.hpp"
#include "msig/crypto/hash.hpp"
#include "msig/crypto/random.hpp"
#include "msig/wallet/mnemonic_wordlist_en.hpp"

namespace msig {
namespace {

constexpr int kBitsPerWord = 11;

const std::unordered_map<std::string_view, uint16_t>& EnglishWordIndex() {
  static const std::unordered_map<std::string_view, uint16_t> index = [] {
    std::unordered_map<std::string_view, uint16_t> out;
    out.reserve(kBip39EnglishWordlist.size());
    for (size_t i = 0; i < kBip39EnglishWordlist.size(); ++i) {
      out.emplace(kBip39EnglishWordlist[i], static_cast<uint16_t>(i));
    }
    return out;
  }();
  return index;
}

bool IsSpace(char ch) {
  return std::isspace(static_cast<unsigned char>(ch)) != 0;
}

std::vector<std::string> SplitWords(std::string_view phrase) {
  std::vector<std::string> words;
  size_t pos = 0;
  while (pos < phrase.size()) {
    while (pos < phrase.size() && IsSpace(phrase[pos])) {
      ++pos;
    }
    const size_t start = pos;
    while (pos < phrase.size() && !IsSpace(phrase[pos])) {
      ++pos;
    }
    if (pos > start) {
      std::string word(phrase.substr(start, pos - start));
      for (char& ch : word) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
      }
      words.push_back(std::move(word));
    }
  }
  return words;
}

bool GetBit(const Bytes& data, size_t bit_pos) {
  return ((data[bit_pos / 8] >> (7 - (bit_pos % 8))) & 0x01) != 0;
}

// Recovers entropy from a phrase; returns false with `error` set on any defect.
bool DecodeMnemonic(std::string_view phrase, Bytes* entropy, std::string* error) {
  std::vector<std::string> words = SplitWords(phrase);
  const size_t word_count = words.size();
  if (word_count < 12 || word_count > 24 || word_count % 3 != 0) {
    *error = "mnemonic must contain 12, 15, 18, 21 or 24 words";
    SecureZeroize(&words);
    return false;
  }

  const size_t total_bits = word_count * kBitsPerWord;
  const size_t checksum_bits = total_bits / 33;
  const size_t entropy_bits = total_bits - checksum_bits;

  Bytes packed((total_bits + 7) / 8, 0);
  size_t bit_pos = 0;
  const auto& index = EnglishWordIndex();
  for (const std::string& word : words) {
    const auto it = index.find(word);
    if (it == index.end()) {
      *error = "mnemonic contains a word not in the English wordlist";
      SecureZeroize(&words);
      SecureZeroize(&packed);
      return false;
    }
    for (int bit = kBitsPerWord - 1; bit >= 0; --bit) {
      if (((it->second >> bit) & 0x01u) != 0) {
        packed[bit_pos / 8] = static_cast<uint8_t>(packed[bit_pos / 8] | (0x80u >> (bit_pos % 8)));
      }
      ++bit_pos;
    }
  }
  SecureZeroize(&words);

  Bytes recovered(packed.begin(), packed.begin() + static_cast<std::ptrdiff_t>(entropy_bits / 8));
  const Bytes digest = Sha256(recovered);
  for (size_t i = 0; i < checksum_bits; ++i) {
    if (GetBit(digest, i) != GetBit(packed, entropy_bits + i)) {
      *error = "mnemonic checksum mismatch";
      SecureZeroize(&packed);
      SecureZeroize(&recovered);
      return false;
    }
  }

  SecureZeroize(&packed);
  *entropy = std::move(recovered);
  return true;
}

}  // namespace

bool IsValidMnemonicStrength(uint32_t strength_bits) {
  return strength_bits >= 128 && strength_bits <= 256 && strength_bits % 32 == 0;
}

std::string EntropyToMnemonic(std::span<const uint8_t> entropy) {
  if (!IsValidMnemonicStrength(static_cast<uint32_t>(entropy.size() * 8))) {
    throw std::invalid_argument("Mnemonic entropy must be 16 to 32 bytes in steps of 4");
  }

  const size_t entropy_bits = entropy.size() * 8;
  const size_t checksum_bits = entropy_bits / 32;
  const Bytes digest = Sha256(entropy);

  Bytes packed(entropy.begin(), entropy.end());
  packed.push_back(digest[0]);

  std::string phrase;
  const size_t word_count = (entropy_bits + checksum_bits) / kBitsPerWord;
  for (size_t w = 0; w < word_count; ++w) {
    uint32_t value = 0;
    for (int bit = 0; bit < kBitsPerWord; ++bit) {
      value = (value << 1) | (GetBit(packed, w * kBitsPerWord + static_cast<size_t>(bit)) ? 1u : 0u);
    }
    if (!phrase.empty()) {
      phrase.push_back(' ');
    }
    phrase.append(kBip39EnglishWordlist[value]);
  }

  SecureZeroize(&packed);
  return phrase;
}

std::string GenerateMnemonic(uint32_t strength_bits) {
  if (!IsValidMnemonicStrength(strength_bits)) {
    throw std::invalid_argument("Mnemonic strength must be 128..256 bits in steps of 32");
  }
  Bytes entropy = Csprng::RandomBytes(strength_bits / 8);
  std::string phrase = EntropyToMnemonic(entropy);
  SecureZeroize(&entropy);
  return phrase;
}

bool ValidateMnemonic(std::string_view phrase, std::string* error) {
  std::string reason;
  Bytes entropy;
  const bool ok = DecodeMnemonic(phrase, &entropy, &reason);
  SecureZeroize(&entropy);
  if (error != nullptr) {
    *error = reason;
  }
  return ok;
}

Bytes MnemonicToEntropy(std::string_view phrase) {
  std::string reason;
  Bytes entropy;
  if (!DecodeMnemonic(phrase, &entropy, &reason)) {
    throw std::invalid_argument("Invalid mnemonic: " + reason);
  }
  return entropy;
}

std::string NormalizeMnemonic(std::string_view phrase) {
  std::vector<std::string> words = SplitWords(phrase);
  std::string out;
  for (const std::string& word : words) {
    if (!out.empty()) {
      out.push_back(' ');
    }
    out.append(word);
  }
  SecureZeroize(&words);
  return out;
}

Bytes MnemonicToSeed(std::string_view phrase, std::string_view passphrase) {
  std::string normalized = NormalizeMnemonic(phrase);
  std::string salt = "mnemonic";
  salt.append(passphrase);

  Bytes seed = Pbkdf2HmacSha512(normalized, salt, kBip39SeedIterations, kBip39SeedSize);
  SecureZeroize(&normalized);
  SecureZeroize(&salt);
  return seed;
}

}  // namespace msig
