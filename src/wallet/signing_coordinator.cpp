#include "msig/wallet/signing_coordinator.hpp"

#include <exception>
#include <stdexcept>
#include <string>
#include <variant>

#include "msig/common/errors.hpp"
#include "msig/common/log.hpp"
#include "msig/crypto/ecdsa.hpp"
#include "msig/tx/sighash.hpp"

namespace msig {
namespace {

std::string ShortKey(const ECPoint& point) {
  return HexEncode(point.ToCompressedBytes()).substr(0, 16);
}

}  // namespace

Bytes InputSignatureHash(const TransactionDraft& draft, size_t input_index) {
  if (input_index >= draft.inputs.size()) {
    throw std::invalid_argument("Input index out of range");
  }
  const DraftInput& input = draft.inputs[input_index];
  if (const auto* witness = std::get_if<WitnessInput>(&input.kind)) {
    return WitnessV0SignatureHash(draft.unsigned_tx, input_index, input.locking_script, witness->amount,
                                  kSighashAll);
  }
  return LegacySignatureHash(draft.unsigned_tx, input_index, input.locking_script, kSighashAll);
}

SigningCoordinator::SigningCoordinator(MultisigPolicy policy, Bytes locking_script)
    : policy_(std::move(policy)), locking_script_(std::move(locking_script)) {}

bool SigningCoordinator::SubmitSignature(TransactionDraft* draft,
                                         const ECPoint& signer_point,
                                         const Scalar& private_scalar,
                                         size_t input_index) {
  std::lock_guard<std::mutex> lock(mu_);

  if (!policy_.Contains(signer_point)) {
    throw AuthorizationError(ErrorCode::kUnauthorizedSigner, "Signer is not part of the multisig setup");
  }
  if (used_signers_.count(signer_point) != 0) {
    throw AuthorizationError(ErrorCode::kDuplicateSignature, "This key has already signed");
  }

  bool signed_ok = false;
  try {
    signed_ok = SignLocked(draft, signer_point, private_scalar, input_index);
  } catch (const std::exception& ex) {
    LOGERR << "Signing error for signer " << ShortKey(signer_point) << " on input " << input_index
           << ": " << ex.what();
    return false;
  }
  if (signed_ok) {
    used_signers_.insert(signer_point);
  }
  return signed_ok;
}

void SigningCoordinator::ResetSession() {
  std::lock_guard<std::mutex> lock(mu_);
  used_signers_.clear();
}

bool SigningCoordinator::HasSigned(const ECPoint& signer_point) const {
  std::lock_guard<std::mutex> lock(mu_);
  return used_signers_.count(signer_point) != 0;
}

size_t SigningCoordinator::session_size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return used_signers_.size();
}

bool SigningCoordinator::SignLocked(TransactionDraft* draft,
                                    const ECPoint& signer_point,
                                    const Scalar& private_scalar,
                                    size_t input_index) {
  const std::string who = ShortKey(signer_point);
  if (draft == nullptr) {
    LOGERR << "Signing error for signer " << who << ": no draft";
    return false;
  }
  if (draft->IsFinalized()) {
    LOGERR << "Signing error for signer " << who << ": draft is already finalized";
    return false;
  }
  if (input_index >= draft->inputs.size() || draft->inputs.size() != draft->unsigned_tx.inputs.size()) {
    LOGERR << "Signing error for signer " << who << ": input index " << input_index << " out of range";
    return false;
  }

  DraftInput& input = draft->inputs[input_index];
  if (input.locking_script != locking_script_) {
    LOGERR << "Signing error for signer " << who << ": input " << input_index
           << " is not locked by this wallet's script";
    return false;
  }
  if (input.HasSignatureFrom(signer_point)) {
    LOGERR << "Signing error for signer " << who << ": input " << input_index
           << " already carries this signer's signature";
    return false;
  }
  if (private_scalar.IsZero() || ECPoint::GeneratorMultiply(private_scalar) != signer_point) {
    LOGERR << "Signing error for signer " << who << ": private key does not match the signer";
    return false;
  }

  const Bytes digest = InputSignatureHash(*draft, input_index);
  Bytes signature = EcdsaSign(digest, private_scalar);
  if (!EcdsaVerify(digest, signature, signer_point)) {
    LOGERR << "Signing error for signer " << who << ": produced signature does not verify";
    return false;
  }
  signature.push_back(static_cast<uint8_t>(kSighashAll));

  input.partial_signatures.push_back(PartialSignature{signer_point, std::move(signature)});
  LOGINFO << "signer " << who << " signed input " << input_index << " ("
          << input.partial_signatures.size() << "/" << policy_.m << ")";
  return true;
}

}  // namespace msig
