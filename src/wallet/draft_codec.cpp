#include <stdexcept>
#include <string>

#include "msig/crypto/encoding.hpp"
#include "msig/wallet/draft.hpp"

namespace msig {
namespace {

constexpr uint32_t kDraftMagic = 0x4d534454;  // "MSDT"
constexpr uint32_t kDraftVersion = 1;
constexpr uint32_t kLegacyTag = 0;
constexpr uint32_t kWitnessTag = 1;

constexpr size_t kMaxTransactionLen = 4000000;
constexpr size_t kMaxScriptLen = 10000;
constexpr size_t kMaxSignatureLen = 73;
constexpr uint32_t kMaxSignaturesPerInput = 16;

}  // namespace

Bytes EncodeDraft(const TransactionDraft& draft) {
  if (draft.inputs.size() != draft.unsigned_tx.inputs.size()) {
    throw std::invalid_argument("Draft inputs do not match the unsigned transaction");
  }

  Bytes out;
  AppendU32Be(kDraftMagic, &out);
  AppendU32Be(kDraftVersion, &out);
  AppendU32Be(draft.required_signatures, &out);
  AppendSizedField(SerializeTransaction(draft.unsigned_tx, false), &out);

  AppendU32Be(static_cast<uint32_t>(draft.inputs.size()), &out);
  for (const DraftInput& input : draft.inputs) {
    if (const auto* witness = std::get_if<WitnessInput>(&input.kind)) {
      AppendU32Be(kWitnessTag, &out);
      AppendSizedField(witness->committed_script, &out);
      AppendU64Be(static_cast<uint64_t>(witness->amount), &out);
    } else {
      AppendU32Be(kLegacyTag, &out);
      AppendSizedField(std::get<LegacyInput>(input.kind).prior_transaction, &out);
    }
    AppendSizedField(input.locking_script, &out);

    AppendU32Be(static_cast<uint32_t>(input.partial_signatures.size()), &out);
    for (const PartialSignature& sig : input.partial_signatures) {
      AppendSizedField(EncodePoint(sig.signer), &out);
      AppendSizedField(sig.signature, &out);
    }
  }

  if (draft.finalized.has_value()) {
    AppendU32Be(1, &out);
    AppendSizedField(draft.finalized->wire, &out);
  } else {
    AppendU32Be(0, &out);
  }
  return out;
}

TransactionDraft DecodeDraft(std::span<const uint8_t> encoded) {
  size_t offset = 0;
  if (ReadU32Be(encoded, &offset) != kDraftMagic) {
    throw std::invalid_argument("Draft magic mismatch");
  }
  const uint32_t version = ReadU32Be(encoded, &offset);
  if (version != kDraftVersion) {
    throw std::invalid_argument("Unsupported draft version " + std::to_string(version));
  }

  TransactionDraft draft;
  draft.required_signatures = ReadU32Be(encoded, &offset);
  const Bytes tx_bytes = ReadSizedField(encoded, &offset, kMaxTransactionLen, "unsigned_tx");
  draft.unsigned_tx = DeserializeTransaction(tx_bytes);

  const uint32_t input_count = ReadU32Be(encoded, &offset);
  if (input_count != draft.unsigned_tx.inputs.size()) {
    throw std::invalid_argument("Draft input count does not match the unsigned transaction");
  }

  draft.inputs.reserve(input_count);
  for (uint32_t i = 0; i < input_count; ++i) {
    DraftInput input;
    const uint32_t tag = ReadU32Be(encoded, &offset);
    if (tag == kWitnessTag) {
      WitnessInput witness;
      witness.committed_script = ReadSizedField(encoded, &offset, kMaxScriptLen, "committed_script");
      witness.amount = static_cast<int64_t>(ReadU64Be(encoded, &offset));
      input.kind = std::move(witness);
    } else if (tag == kLegacyTag) {
      LegacyInput legacy;
      legacy.prior_transaction = ReadSizedField(encoded, &offset, kMaxTransactionLen, "prior_transaction");
      input.kind = std::move(legacy);
    } else {
      throw std::invalid_argument("Unknown draft input tag " + std::to_string(tag));
    }
    input.locking_script = ReadSizedField(encoded, &offset, kMaxScriptLen, "locking_script");

    const uint32_t sig_count = ReadU32Be(encoded, &offset);
    if (sig_count > kMaxSignaturesPerInput) {
      throw std::invalid_argument("Draft input carries too many signatures");
    }
    for (uint32_t s = 0; s < sig_count; ++s) {
      PartialSignature sig;
      sig.signer = DecodePoint(ReadSizedField(encoded, &offset, 33, "signer"));
      sig.signature = ReadSizedField(encoded, &offset, kMaxSignatureLen, "signature");
      input.partial_signatures.push_back(std::move(sig));
    }
    draft.inputs.push_back(std::move(input));
  }

  const uint32_t has_final = ReadU32Be(encoded, &offset);
  if (has_final > 1) {
    throw std::invalid_argument("Draft finalization flag is malformed");
  }
  if (has_final == 1) {
    FinalizedTransaction finalized;
    finalized.wire = ReadSizedField(encoded, &offset, kMaxTransactionLen, "final_tx");
    const Transaction tx = DeserializeTransaction(finalized.wire);
    finalized.txid_hex = TxidToHex(ComputeTxid(tx));
    finalized.wtxid_hex = TxidToHex(ComputeWtxid(tx));
    draft.finalized = std::move(finalized);
  }

  if (offset != encoded.size()) {
    throw std::invalid_argument("Draft has trailing bytes");
  }
  return draft;
}

}  // namespace msig
