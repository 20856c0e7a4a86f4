#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "msig/address/network.hpp"
#include "msig/crypto/ec_point.hpp"
#include "msig/crypto/scalar.hpp"
#include "msig/wallet/hd_key.hpp"

namespace msig {

struct SignerKey {
  ECPoint public_point;
  // Absent after public-only reconstruction.
  std::optional<Scalar> private_scalar;
  std::string backup_phrase;
  DerivationPath path;

  void Wipe();
};

struct KeyDerivationConfig {
  NetworkParams network = ParamsFor(Network::kTestnet);
  // Empty selects DefaultMultisigPrefix(network). Otherwise every segment must be hardened.
  DerivationPath prefix;
  uint32_t signer_count = 1;
  uint32_t strength_bits = 256;
  std::string passphrase;
};

// BIP48 P2WSH multisig account: m/48'/<coin>'/0'/2'.
DerivationPath DefaultMultisigPrefix(const NetworkParams& network);

// True iff the path has at least one segment and all but the last are hardened.
bool ValidatePath(const DerivationPath& path);
bool ValidatePath(std::string_view path);

class KeyDerivation {
 public:
  // Throws ConfigurationError for a bad prefix, signer count or strength.
  explicit KeyDerivation(KeyDerivationConfig config);

  // Fresh entropy on every call. Safe to call concurrently.
  SignerKey Generate(uint32_t index) const;
  // kInvalidIndex for index >= signer_count, kInvalidBackupPhrase for a bad phrase.
  SignerKey Recover(std::string_view phrase, uint32_t index) const;

  // prefix/index, index non-hardened.
  DerivationPath SignerPath(uint32_t index) const;
  // Account xpub at the prefix, the form cosigners exchange.
  std::string AccountXpub(std::string_view phrase) const;

  const KeyDerivationConfig& config() const;

 private:
  void CheckIndex(uint32_t index) const;
  SignerKey DeriveFromPhrase(const std::string& phrase, uint32_t index) const;

  KeyDerivationConfig config_;
};

}  // namespace msig
