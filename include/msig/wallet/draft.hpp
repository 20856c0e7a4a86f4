#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <variant>
#include <vector>

#include "msig/common/bytes.hpp"
#include "msig/crypto/ec_point.hpp"
#include "msig/tx/transaction.hpp"

namespace msig {

// An unspent output the wallet controls.
struct SpendableOutput {
  // Display (big-endian) order.
  std::string txid_hex;
  uint32_t vout = 0;
  int64_t amount = 0;
  // scriptPubKey of the output being spent.
  Bytes committed_script;
  // Full funding transaction; required for legacy (P2SH) inputs.
  Bytes prior_transaction;
};

struct DesiredOutput {
  std::string address;
  int64_t amount = 0;
};

struct LegacyInput {
  Bytes prior_transaction;
};

struct WitnessInput {
  Bytes committed_script;
  int64_t amount = 0;
};

using InputKind = std::variant<LegacyInput, WitnessInput>;

struct PartialSignature {
  ECPoint signer;
  // DER signature followed by the sighash byte.
  Bytes signature;
};

struct DraftInput {
  InputKind kind;
  Bytes locking_script;
  std::vector<PartialSignature> partial_signatures;

  bool IsWitness() const;
  bool HasSignatureFrom(const ECPoint& signer) const;
};

struct FinalizedTransaction {
  Bytes wire;
  std::string txid_hex;
  std::string wtxid_hex;

  std::string WireHex() const;
};

enum class DraftStatus {
  kEmpty = 0,
  kPartiallySigned = 1,
  kSignable = 2,
  kFinalized = 3,
};

const char* DraftStatusName(DraftStatus status);

struct TransactionDraft {
  Transaction unsigned_tx;
  std::vector<DraftInput> inputs;
  // Threshold m of the policy the draft was assembled for.
  uint32_t required_signatures = 0;
  // Set once by the Finalizer; the draft is terminal afterwards.
  std::optional<FinalizedTransaction> finalized;

  DraftStatus Status() const;
  bool IsFinalized() const;
  size_t SignatureCount() const;
};

// Versioned, u32 length-prefixed encoding so a draft can travel between signers.
Bytes EncodeDraft(const TransactionDraft& draft);
// Throws std::invalid_argument on malformed input, version mismatch or trailing bytes.
TransactionDraft DecodeDraft(std::span<const uint8_t> encoded);

}  // namespace msig
