#include "msig/wallet/multisig_wallet.hpp"

#include <future>
#include <string>
#include <utility>

#include "msig/common/errors.hpp"
#include "msig/common/log.hpp"
#include "msig/common/thread_pool.hpp"

namespace msig {
namespace {

std::vector<Bytes> DecodeKeysHex(const std::vector<std::string>& public_keys_hex) {
  std::vector<Bytes> keys;
  keys.reserve(public_keys_hex.size());
  for (size_t i = 0; i < public_keys_hex.size(); ++i) {
    Bytes key;
    if (!TryHexDecode(public_keys_hex[i], &key)) {
      throw ConfigurationError(ErrorCode::kInvalidKeySet, "Invalid public key at index " + std::to_string(i));
    }
    keys.push_back(std::move(key));
  }
  return keys;
}

}  // namespace

MultisigWallet::MultisigWallet(uint32_t m, const std::vector<Bytes>& public_keys, WalletConfig config)
    : MultisigWallet(BuildPolicy(m, public_keys), {}, std::move(config)) {
  signer_order_.reserve(public_keys.size());
  for (const Bytes& key : public_keys) {
    signer_order_.push_back(ECPoint::FromCompressed(key));
  }
}

MultisigWallet::MultisigWallet(uint32_t m, const std::vector<std::string>& public_keys_hex, WalletConfig config)
    : MultisigWallet(m, DecodeKeysHex(public_keys_hex), std::move(config)) {}

MultisigWallet::MultisigWallet(MultisigPolicy policy, std::vector<SignerKey> signers, WalletConfig config)
    : config_(std::move(config)),
      network_(ParamsFor(config_.network)),
      policy_(std::move(policy)),
      signers_(std::move(signers)),
      derivation_(MakeDerivationConfig(config_, policy_.n)),
      redeem_script_(BuildScript(policy_)),
      addresses_(DeriveAddresses(redeem_script_, network_)),
      assembler_(redeem_script_, network_),
      coordinator_(policy_, redeem_script_),
      finalizer_(policy_) {
  signer_order_.reserve(signers_.size());
  for (const SignerKey& signer : signers_) {
    signer_order_.push_back(signer.public_point);
  }
  LOGINFO << "multisig wallet " << policy_.m << "-of-" << policy_.n << " on " << network_.name
          << ": p2sh=" << addresses_.p2sh << " p2wsh=" << addresses_.p2wsh;
}

MultisigWallet::~MultisigWallet() {
  for (SignerKey& signer : signers_) {
    signer.Wipe();
  }
}

MultisigWallet MultisigWallet::Generate(uint32_t m, uint32_t n, WalletConfig config) {
  if (n < 1 || n > kMaxMultisigKeys) {
    throw ConfigurationError(ErrorCode::kInvalidKeySet,
                             "Total signers must be between 1 and " + std::to_string(kMaxMultisigKeys));
  }
  if (m < 1 || m > n) {
    throw ConfigurationError(ErrorCode::kInvalidThreshold, "Invalid signature requirements");
  }

  const KeyDerivation derivation(MakeDerivationConfig(config, n));
  const size_t workers =
      config.derivation_workers > 0 ? config.derivation_workers : ThreadPool::DefaultWorkerCount(n);

  std::vector<SignerKey> signers;
  signers.reserve(n);
  {
    ThreadPool pool(workers);
    std::vector<std::future<SignerKey>> pending;
    pending.reserve(n);
    for (uint32_t i = 0; i < n; ++i) {
      pending.push_back(pool.Submit([&derivation, i]() { return derivation.Generate(i); }));
    }
    for (std::future<SignerKey>& future : pending) {
      signers.push_back(future.get());
    }
  }

  std::vector<ECPoint> points;
  points.reserve(signers.size());
  for (const SignerKey& signer : signers) {
    points.push_back(signer.public_point);
  }
  return MultisigWallet(BuildPolicy(m, points), std::move(signers), std::move(config));
}

KeyDerivationConfig MultisigWallet::MakeDerivationConfig(const WalletConfig& config, uint32_t signer_count) {
  KeyDerivationConfig out;
  out.network = ParamsFor(config.network);
  if (config.derivation_prefix.has_value()) {
    out.prefix = DerivationPath::Parse(*config.derivation_prefix);
    if (out.prefix.empty()) {
      throw ConfigurationError(ErrorCode::kInvalidDerivationPath,
                               "Derivation prefix must contain at least one segment");
    }
  }
  out.signer_count = signer_count;
  out.strength_bits = config.mnemonic_strength_bits;
  out.passphrase = config.mnemonic_passphrase;
  return out;
}

const WalletAddresses& MultisigWallet::GetAddresses() const {
  return addresses_;
}

const Bytes& MultisigWallet::GetRedeemScript() const {
  return redeem_script_;
}

std::vector<std::string> MultisigWallet::GetPublicKeys() const {
  std::vector<std::string> out;
  out.reserve(signer_order_.size());
  for (const ECPoint& point : signer_order_) {
    out.push_back(HexEncode(point.ToCompressedBytes()));
  }
  return out;
}

std::vector<std::string> MultisigWallet::GetMnemonics() const {
  std::vector<std::string> out;
  out.reserve(signers_.size());
  for (const SignerKey& signer : signers_) {
    out.push_back(signer.backup_phrase);
  }
  return out;
}

std::vector<std::string> MultisigWallet::GetDerivationPaths() const {
  std::vector<std::string> out;
  out.reserve(policy_.n);
  for (uint32_t i = 0; i < policy_.n; ++i) {
    out.push_back(derivation_.SignerPath(i).ToString());
  }
  return out;
}

std::string MultisigWallet::GetAccountXpub(uint32_t index) const {
  return derivation_.AccountXpub(GetSigner(index).backup_phrase);
}

const SignerKey& MultisigWallet::GetSigner(uint32_t index) const {
  if (index >= signers_.size()) {
    throw ConfigurationError(ErrorCode::kInvalidIndex, "Invalid signer index " + std::to_string(index));
  }
  return signers_[index];
}

bool MultisigWallet::HasPrivateKeys() const {
  return !signers_.empty();
}

SignerKey MultisigWallet::RestoreFromMnemonic(std::string_view phrase, uint32_t index) const {
  return derivation_.Recover(phrase, index);
}

TransactionDraft MultisigWallet::CreateTransaction(const std::vector<SpendableOutput>& utxos,
                                                   const std::vector<DesiredOutput>& outputs,
                                                   int64_t fee) const {
  return assembler_.Assemble(utxos, outputs, fee);
}

bool MultisigWallet::SignTransaction(TransactionDraft* draft, const SignerKey& signer, size_t input_index) {
  return SignTransaction(draft, signer.public_point, signer.private_scalar.value_or(Scalar()), input_index);
}

bool MultisigWallet::SignTransaction(TransactionDraft* draft,
                                     const ECPoint& signer_point,
                                     const Scalar& private_scalar,
                                     size_t input_index) {
  return coordinator_.SubmitSignature(draft, signer_point, private_scalar, input_index);
}

bool MultisigWallet::VerifyTransaction(const TransactionDraft& draft) const {
  return finalizer_.Verify(draft);
}

std::string MultisigWallet::FinalizeTransaction(TransactionDraft* draft) const {
  return finalizer_.Finalize(draft).WireHex();
}

void MultisigWallet::ResetSigners() {
  coordinator_.ResetSession();
}

const MultisigPolicy& MultisigWallet::policy() const {
  return policy_;
}

const NetworkParams& MultisigWallet::network() const {
  return network_;
}

uint32_t MultisigWallet::m() const {
  return policy_.m;
}

uint32_t MultisigWallet::n() const {
  return policy_.n;
}

}  // namespace msig
