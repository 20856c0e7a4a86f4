#include "msig/wallet/draft.hpp"

#include <algorithm>

namespace msig {

bool DraftInput::IsWitness() const {
  return std::holds_alternative<WitnessInput>(kind);
}

bool DraftInput::HasSignatureFrom(const ECPoint& signer) const {
  return std::any_of(partial_signatures.begin(), partial_signatures.end(),
                     [&signer](const PartialSignature& sig) { return sig.signer == signer; });
}

std::string FinalizedTransaction::WireHex() const {
  return HexEncode(wire);
}

const char* DraftStatusName(DraftStatus status) {
  switch (status) {
    case DraftStatus::kEmpty:
      return "empty";
    case DraftStatus::kPartiallySigned:
      return "partially-signed";
    case DraftStatus::kSignable:
      return "signable";
    case DraftStatus::kFinalized:
      return "finalized";
  }
  return "unknown";
}

DraftStatus TransactionDraft::Status() const {
  if (finalized.has_value()) {
    return DraftStatus::kFinalized;
  }
  if (SignatureCount() == 0) {
    return DraftStatus::kEmpty;
  }
  const bool every_input_met =
      !inputs.empty() && required_signatures > 0 &&
      std::all_of(inputs.begin(), inputs.end(), [this](const DraftInput& input) {
        return input.partial_signatures.size() >= required_signatures;
      });
  return every_input_met ? DraftStatus::kSignable : DraftStatus::kPartiallySigned;
}

bool TransactionDraft::IsFinalized() const {
  return finalized.has_value();
}

size_t TransactionDraft::SignatureCount() const {
  size_t count = 0;
  for (const DraftInput& input : inputs) {
    count += input.partial_signatures.size();
  }
  return count;
}

}  // namespace msig
