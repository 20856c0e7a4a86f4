#include "msig/tx/sighash.hpp"

#include <stdexcept>

#include "msig/crypto/hash.hpp"
#include "msig/tx/serialize.hpp"

namespace msig {
namespace {

void RequireSighashAll(uint32_t sighash_type) {
  if (sighash_type != kSighashAll) {
    throw std::invalid_argument("Only SIGHASH_ALL is supported");
  }
}

Bytes HashPrevouts(const Transaction& tx) {
  Bytes buffer;
  buffer.reserve(tx.inputs.size() * (32 + 4));
  for (const TxIn& input : tx.inputs) {
    buffer.insert(buffer.end(), input.prevout.txid.begin(), input.prevout.txid.end());
    WriteUint32Le(input.prevout.index, &buffer);
  }
  return DoubleSha256(buffer);
}

Bytes HashSequences(const Transaction& tx) {
  Bytes buffer;
  buffer.reserve(tx.inputs.size() * 4);
  for (const TxIn& input : tx.inputs) {
    WriteUint32Le(input.sequence, &buffer);
  }
  return DoubleSha256(buffer);
}

Bytes HashOutputs(const Transaction& tx) {
  Bytes buffer;
  for (const TxOut& output : tx.outputs) {
    WriteUint64Le(static_cast<uint64_t>(output.value), &buffer);
    WriteVarBytes(output.script_pubkey, &buffer);
  }
  return DoubleSha256(buffer);
}

}  // namespace

Bytes LegacySignatureHash(const Transaction& tx,
                          size_t input_index,
                          std::span<const uint8_t> script_code,
                          uint32_t sighash_type) {
  RequireSighashAll(sighash_type);
  if (input_index >= tx.inputs.size()) {
    throw std::invalid_argument("Sighash input index out of range");
  }

  Transaction copy = tx;
  for (size_t i = 0; i < copy.inputs.size(); ++i) {
    copy.inputs[i].witness.clear();
    if (i == input_index) {
      copy.inputs[i].script_sig.assign(script_code.begin(), script_code.end());
    } else {
      copy.inputs[i].script_sig.clear();
    }
  }

  Bytes preimage = SerializeTransaction(copy, false);
  WriteUint32Le(sighash_type, &preimage);
  return DoubleSha256(preimage);
}

Bytes WitnessV0SignatureHash(const Transaction& tx,
                             size_t input_index,
                             std::span<const uint8_t> script_code,
                             int64_t amount,
                             uint32_t sighash_type) {
  RequireSighashAll(sighash_type);
  if (input_index >= tx.inputs.size()) {
    throw std::invalid_argument("Sighash input index out of range");
  }
  const TxIn& input = tx.inputs[input_index];

  const Bytes hash_prevouts = HashPrevouts(tx);
  const Bytes hash_sequences = HashSequences(tx);
  const Bytes hash_outputs = HashOutputs(tx);

  Bytes preimage;
  preimage.reserve(4 + 32 + 32 + 36 + script_code.size() + 9 + 8 + 4 + 32 + 4 + 4);
  WriteUint32Le(static_cast<uint32_t>(tx.version), &preimage);
  preimage.insert(preimage.end(), hash_prevouts.begin(), hash_prevouts.end());
  preimage.insert(preimage.end(), hash_sequences.begin(), hash_sequences.end());
  preimage.insert(preimage.end(), input.prevout.txid.begin(), input.prevout.txid.end());
  WriteUint32Le(input.prevout.index, &preimage);
  WriteVarBytes(script_code, &preimage);
  WriteUint64Le(static_cast<uint64_t>(amount), &preimage);
  WriteUint32Le(input.sequence, &preimage);
  preimage.insert(preimage.end(), hash_outputs.begin(), hash_outputs.end());
  WriteUint32Le(tx.lock_time, &preimage);
  WriteUint32Le(sighash_type, &preimage);
  return DoubleSha256(preimage);
}

}  // namespace msig
