#pragma once

#include "msig/script/script_builder.hpp"
#include "msig/wallet/draft.hpp"

namespace msig {

class Finalizer {
 public:
  explicit Finalizer(MultisigPolicy policy);

  // True iff every input carries at least m contributions, all from distinct policy members.
  bool Verify(const TransactionDraft& draft) const;

  // Throws VerificationError (draft untouched) when Verify fails or a selected signature
  // does not check out, FatalEncodingError(kFinalizationFailure) when encoding fails.
  // The result is cached on the draft; later calls return the same bytes.
  const FinalizedTransaction& Finalize(TransactionDraft* draft) const;

 private:
  Transaction BuildSignedTransaction(const TransactionDraft& draft) const;

  MultisigPolicy policy_;
};

}  // namespace msig
