#include "msig/wallet/key_derivation.hpp"

#include <exception>
#include <string>

#include "msig/common/errors.hpp"
#include "msig/common/secure_zeroize.hpp"
#include "msig/script/script_builder.hpp"
#include "msig/wallet/mnemonic.hpp"

namespace msig {
namespace {

constexpr uint32_t kBip48Purpose = 48;
constexpr uint32_t kBip48Account = 0;
constexpr uint32_t kBip48P2wshScriptType = 2;

}  // namespace

void SignerKey::Wipe() {
  SecureZeroize(&private_scalar);
  SecureZeroize(&backup_phrase);
}

DerivationPath DefaultMultisigPrefix(const NetworkParams& network) {
  return DerivationPath({
      PathSegment{kBip48Purpose, true},
      PathSegment{network.coin_type, true},
      PathSegment{kBip48Account, true},
      PathSegment{kBip48P2wshScriptType, true},
  });
}

bool ValidatePath(const DerivationPath& path) {
  const auto& segments = path.segments();
  if (segments.empty()) {
    return false;
  }
  for (size_t i = 0; i + 1 < segments.size(); ++i) {
    if (!segments[i].hardened) {
      return false;
    }
  }
  return true;
}

bool ValidatePath(std::string_view path) {
  DerivationPath parsed;
  return DerivationPath::TryParse(path, &parsed) && ValidatePath(parsed);
}

KeyDerivation::KeyDerivation(KeyDerivationConfig config) : config_(std::move(config)) {
  if (config_.prefix.empty()) {
    config_.prefix = DefaultMultisigPrefix(config_.network);
  } else if (!config_.prefix.AllHardened()) {
    throw ConfigurationError(ErrorCode::kInvalidDerivationPath,
                             "Derivation prefix must contain only hardened segments: " +
                                 config_.prefix.ToString());
  }
  if (config_.signer_count < 1 || config_.signer_count > kMaxMultisigKeys) {
    throw ConfigurationError(ErrorCode::kInvalidKeySet,
                             "Signer count must be between 1 and " + std::to_string(kMaxMultisigKeys));
  }
  if (!IsValidMnemonicStrength(config_.strength_bits)) {
    throw ConfigurationError(ErrorCode::kInvalidBackupPhrase,
                             "Mnemonic strength must be 128..256 bits in steps of 32");
  }
}

SignerKey KeyDerivation::Generate(uint32_t index) const {
  CheckIndex(index);
  std::string phrase = GenerateMnemonic(config_.strength_bits);
  SignerKey key = DeriveFromPhrase(phrase, index);
  SecureZeroize(&phrase);
  return key;
}

SignerKey KeyDerivation::Recover(std::string_view phrase, uint32_t index) const {
  CheckIndex(index);
  if (!ValidateMnemonic(phrase)) {
    throw ConfigurationError(ErrorCode::kInvalidBackupPhrase, "Invalid mnemonic");
  }
  std::string normalized = NormalizeMnemonic(phrase);
  SignerKey key = DeriveFromPhrase(normalized, index);
  SecureZeroize(&normalized);
  return key;
}

DerivationPath KeyDerivation::SignerPath(uint32_t index) const {
  return config_.prefix.Child(index, false);
}

std::string KeyDerivation::AccountXpub(std::string_view phrase) const {
  if (!ValidateMnemonic(phrase)) {
    throw ConfigurationError(ErrorCode::kInvalidBackupPhrase, "Invalid mnemonic");
  }
  Bytes seed = MnemonicToSeed(phrase, config_.passphrase);
  const ExtendedKey master = ExtendedKey::FromSeed(seed);
  SecureZeroize(&seed);
  return master.Derive(config_.prefix).ToXpub(config_.network);
}

const KeyDerivationConfig& KeyDerivation::config() const {
  return config_;
}

void KeyDerivation::CheckIndex(uint32_t index) const {
  if (index >= config_.signer_count) {
    throw ConfigurationError(ErrorCode::kInvalidIndex,
                             "Invalid signer index " + std::to_string(index) + " for " +
                                 std::to_string(config_.signer_count) + " signers");
  }
}

SignerKey KeyDerivation::DeriveFromPhrase(const std::string& phrase, uint32_t index) const {
  Bytes seed = MnemonicToSeed(phrase, config_.passphrase);
  const DerivationPath path = SignerPath(index);

  SignerKey key;
  try {
    const ExtendedKey leaf = ExtendedKey::FromSeed(seed).Derive(path);
    key.public_point = leaf.public_point();
    key.private_scalar = leaf.private_scalar();
  } catch (const std::exception&) {
    SecureZeroize(&seed);
    throw;
  }
  SecureZeroize(&seed);

  key.backup_phrase = phrase;
  key.path = path;
  return key;
}

}  // namespace msig
