#pragma once

#include <cstddef>
#include <mutex>
#include <set>

#include "msig/common/bytes.hpp"
#include "msig/crypto/ec_point.hpp"
#include "msig/crypto/scalar.hpp"
#include "msig/script/script_builder.hpp"
#include "msig/wallet/draft.hpp"

namespace msig {

// Collects partial signatures. Each policy member may contribute once per session,
// across all drafts and inputs, until ResetSession().
class SigningCoordinator {
 public:
  SigningCoordinator(MultisigPolicy policy, Bytes locking_script);

  SigningCoordinator(const SigningCoordinator&) = delete;
  SigningCoordinator& operator=(const SigningCoordinator&) = delete;

  // Throws AuthorizationError for a non-member (kUnauthorizedSigner) or a signer already
  // in the session (kDuplicateSignature). Returns false, leaving draft and session
  // unchanged, when the signing step itself cannot be carried out.
  bool SubmitSignature(TransactionDraft* draft,
                       const ECPoint& signer_point,
                       const Scalar& private_scalar,
                       size_t input_index);

  void ResetSession();

  bool HasSigned(const ECPoint& signer_point) const;
  size_t session_size() const;

 private:
  bool SignLocked(TransactionDraft* draft,
                  const ECPoint& signer_point,
                  const Scalar& private_scalar,
                  size_t input_index);

  MultisigPolicy policy_;
  Bytes locking_script_;

  mutable std::mutex mu_;
  std::set<ECPoint> used_signers_;
};

// Digest an input must be signed over: BIP143 for witness inputs, legacy otherwise.
Bytes InputSignatureHash(const TransactionDraft& draft, size_t input_index);

}  // namespace msig
