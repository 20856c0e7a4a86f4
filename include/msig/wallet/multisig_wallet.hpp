#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "msig/address/network.hpp"
#include "msig/common/bytes.hpp"
#include "msig/crypto/ec_point.hpp"
#include "msig/script/script_builder.hpp"
#include "msig/wallet/draft.hpp"
#include "msig/wallet/finalizer.hpp"
#include "msig/wallet/key_derivation.hpp"
#include "msig/wallet/signing_coordinator.hpp"
#include "msig/wallet/transaction_assembler.hpp"

namespace msig {

struct WalletConfig {
  Network network = Network::kTestnet;
  // Defaults to BIP48 m/48'/<coin>'/0'/2'.
  std::optional<std::string> derivation_prefix;
  uint32_t mnemonic_strength_bits = 256;
  std::string mnemonic_passphrase;
  // 0 picks ThreadPool::DefaultWorkerCount(n).
  size_t derivation_workers = 0;
};

class MultisigWallet {
 public:
  // Public-key wallet: m-of-|keys|, no private material. Keys are 33-byte compressed points.
  MultisigWallet(uint32_t m, const std::vector<Bytes>& public_keys, WalletConfig config = {});
  MultisigWallet(uint32_t m, const std::vector<std::string>& public_keys_hex, WalletConfig config = {});

  // Derives n fresh signer keys concurrently and builds the m-of-n wallet over them.
  static MultisigWallet Generate(uint32_t m, uint32_t n, WalletConfig config = {});

  MultisigWallet(const MultisigWallet&) = delete;
  MultisigWallet& operator=(const MultisigWallet&) = delete;
  ~MultisigWallet();

  const WalletAddresses& GetAddresses() const;
  const Bytes& GetRedeemScript() const;
  // Compressed hex, in signer order.
  std::vector<std::string> GetPublicKeys() const;
  // Empty for a public-key wallet.
  std::vector<std::string> GetMnemonics() const;
  std::vector<std::string> GetDerivationPaths() const;
  std::string GetAccountXpub(uint32_t index) const;
  const SignerKey& GetSigner(uint32_t index) const;
  bool HasPrivateKeys() const;
  // Throws ConfigurationError (kInvalidIndex, kInvalidBackupPhrase).
  SignerKey RestoreFromMnemonic(std::string_view phrase, uint32_t index) const;

  TransactionDraft CreateTransaction(const std::vector<SpendableOutput>& utxos,
                                     const std::vector<DesiredOutput>& outputs,
                                     int64_t fee) const;
  bool SignTransaction(TransactionDraft* draft, const SignerKey& signer, size_t input_index);
  bool SignTransaction(TransactionDraft* draft,
                       const ECPoint& signer_point,
                       const Scalar& private_scalar,
                       size_t input_index);
  bool VerifyTransaction(const TransactionDraft& draft) const;
  // Hex of the broadcastable encoding.
  std::string FinalizeTransaction(TransactionDraft* draft) const;
  void ResetSigners();

  const MultisigPolicy& policy() const;
  const NetworkParams& network() const;
  uint32_t m() const;
  uint32_t n() const;

 private:
  MultisigWallet(MultisigPolicy policy, std::vector<SignerKey> signers, WalletConfig config);

  static KeyDerivationConfig MakeDerivationConfig(const WalletConfig& config, uint32_t signer_count);

  WalletConfig config_;
  NetworkParams network_;
  MultisigPolicy policy_;
  std::vector<ECPoint> signer_order_;
  std::vector<SignerKey> signers_;
  KeyDerivation derivation_;
  Bytes redeem_script_;
  WalletAddresses addresses_;
  TransactionAssembler assembler_;
  SigningCoordinator coordinator_;
  Finalizer finalizer_;
};

}  // namespace msig
