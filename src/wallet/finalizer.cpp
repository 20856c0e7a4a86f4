#include "msig/wallet/finalizer.hpp"

#include <algorithm>
#include <exception>
#include <set>
#include <stdexcept>
#include <string>

#include "msig/common/errors.hpp"
#include "msig/common/log.hpp"
#include "msig/crypto/ecdsa.hpp"
#include "msig/script/script.hpp"
#include "msig/tx/sighash.hpp"
#include "msig/wallet/signing_coordinator.hpp"

namespace msig {
namespace {

// Signatures for one input ordered by their signer's position in the script.
std::vector<const PartialSignature*> SelectSignatures(const MultisigPolicy& policy, const DraftInput& input) {
  std::vector<const PartialSignature*> ordered;
  ordered.reserve(input.partial_signatures.size());
  for (const PartialSignature& sig : input.partial_signatures) {
    ordered.push_back(&sig);
  }
  std::sort(ordered.begin(), ordered.end(), [&policy](const PartialSignature* lhs, const PartialSignature* rhs) {
    return *policy.IndexOf(lhs->signer) < *policy.IndexOf(rhs->signer);
  });
  if (ordered.size() > policy.m) {
    ordered.resize(policy.m);
  }
  return ordered;
}

}  // namespace

Finalizer::Finalizer(MultisigPolicy policy) : policy_(std::move(policy)) {}

bool Finalizer::Verify(const TransactionDraft& draft) const {
  if (draft.inputs.empty() || draft.inputs.size() != draft.unsigned_tx.inputs.size()) {
    return false;
  }

  for (const DraftInput& input : draft.inputs) {
    if (input.partial_signatures.size() < policy_.m) {
      return false;
    }

    std::set<ECPoint> signers;
    for (const PartialSignature& sig : input.partial_signatures) {
      if (!signers.insert(sig.signer).second) {
        return false;
      }
      if (!policy_.Contains(sig.signer)) {
        return false;
      }
    }
  }
  return true;
}

const FinalizedTransaction& Finalizer::Finalize(TransactionDraft* draft) const {
  if (draft == nullptr) {
    throw std::invalid_argument("Finalize requires a draft");
  }
  if (draft->finalized.has_value()) {
    return *draft->finalized;
  }
  if (!Verify(*draft)) {
    throw VerificationError(ErrorCode::kVerificationFailed, "Transaction verification failed");
  }

  const Transaction signed_tx = BuildSignedTransaction(*draft);

  FinalizedTransaction result;
  try {
    result.wire = SerializeTransaction(signed_tx, true);
    result.txid_hex = TxidToHex(ComputeTxid(signed_tx));
    result.wtxid_hex = TxidToHex(ComputeWtxid(signed_tx));
  } catch (const std::exception& ex) {
    throw FatalEncodingError(ErrorCode::kFinalizationFailure,
                             std::string("Transaction finalization failed: ") + ex.what());
  }

  draft->finalized = std::move(result);
  LOGINFO << "finalized transaction " << draft->finalized->txid_hex << " (" << draft->finalized->wire.size()
          << " bytes, " << draft->inputs.size() << " inputs)";
  return *draft->finalized;
}

Transaction Finalizer::BuildSignedTransaction(const TransactionDraft& draft) const {
  Transaction tx = draft.unsigned_tx;

  for (size_t i = 0; i < draft.inputs.size(); ++i) {
    const DraftInput& input = draft.inputs[i];
    const std::vector<const PartialSignature*> selected = SelectSignatures(policy_, input);

    Bytes digest;
    try {
      digest = InputSignatureHash(draft, i);
    } catch (const std::exception& ex) {
      throw FatalEncodingError(ErrorCode::kFinalizationFailure,
                               "Transaction finalization failed on input " + std::to_string(i) + ": " + ex.what());
    }
    for (const PartialSignature* sig : selected) {
      const bool well_formed = sig->signature.size() > 1 && sig->signature.back() == kSighashAll;
      if (!well_formed ||
          !EcdsaVerify(digest, std::span<const uint8_t>(sig->signature.data(), sig->signature.size() - 1),
                       sig->signer)) {
        throw VerificationError(ErrorCode::kVerificationFailed,
                                "Transaction verification failed: bad signature on input " + std::to_string(i));
      }
    }

    // CHECKMULTISIG consumes one extra stack element.
    std::vector<Bytes> stack;
    stack.reserve(selected.size() + 2);
    stack.emplace_back();
    for (const PartialSignature* sig : selected) {
      stack.push_back(sig->signature);
    }
    stack.push_back(input.locking_script);

    try {
      if (input.IsWitness()) {
        tx.inputs[i].script_sig.clear();
        tx.inputs[i].witness = std::move(stack);
      } else {
        tx.inputs[i].script_sig = BuildPushOnlyScript(stack);
        tx.inputs[i].witness.clear();
      }
    } catch (const std::exception& ex) {
      throw FatalEncodingError(ErrorCode::kFinalizationFailure,
                               "Transaction finalization failed on input " + std::to_string(i) + ": " + ex.what());
    }
  }
  return tx;
}

}  // namespace msig
