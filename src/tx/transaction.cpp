#include "msig/tx/transaction.hpp"

#include <algorithm>
#include <stdexcept>

#include "msig/crypto/hash.hpp"
#include "msig/tx/serialize.hpp"

namespace msig {
namespace {

constexpr uint8_t kSegwitMarker = 0x00;
constexpr uint8_t kSegwitFlag = 0x01;
constexpr size_t kTxidSize = 32;
constexpr size_t kMaxScriptSize = 10000;
constexpr size_t kMaxWitnessItemSize = 4000000;
constexpr uint64_t kMaxVectorCount = 100000;

void SerializeInputs(const Transaction& tx, Bytes* out) {
  WriteCompactSize(tx.inputs.size(), out);
  for (const TxIn& input : tx.inputs) {
    if (input.prevout.txid.size() != kTxidSize) {
      throw std::invalid_argument("Outpoint txid must be 32 bytes");
    }
    out->insert(out->end(), input.prevout.txid.begin(), input.prevout.txid.end());
    WriteUint32Le(input.prevout.index, out);
    WriteVarBytes(input.script_sig, out);
    WriteUint32Le(input.sequence, out);
  }
}

void SerializeOutputs(const Transaction& tx, Bytes* out) {
  WriteCompactSize(tx.outputs.size(), out);
  for (const TxOut& output : tx.outputs) {
    WriteUint64Le(static_cast<uint64_t>(output.value), out);
    WriteVarBytes(output.script_pubkey, out);
  }
}

std::vector<TxIn> ReadInputs(std::span<const uint8_t> data, size_t* offset) {
  uint64_t count = 0;
  if (!ReadCompactSize(data, offset, &count) || count > kMaxVectorCount) {
    throw std::invalid_argument("Transaction input count is malformed");
  }

  std::vector<TxIn> inputs(static_cast<size_t>(count));
  for (TxIn& input : inputs) {
    if (!ReadFixedBytes(data, offset, kTxidSize, &input.prevout.txid) ||
        !ReadUint32Le(data, offset, &input.prevout.index) ||
        !ReadVarBytes(data, offset, kMaxScriptSize, &input.script_sig) ||
        !ReadUint32Le(data, offset, &input.sequence)) {
      throw std::invalid_argument("Transaction input is truncated");
    }
  }
  return inputs;
}

std::vector<TxOut> ReadOutputs(std::span<const uint8_t> data, size_t* offset) {
  uint64_t count = 0;
  if (!ReadCompactSize(data, offset, &count) || count > kMaxVectorCount) {
    throw std::invalid_argument("Transaction output count is malformed");
  }

  std::vector<TxOut> outputs(static_cast<size_t>(count));
  for (TxOut& output : outputs) {
    uint64_t value = 0;
    if (!ReadUint64Le(data, offset, &value) ||
        !ReadVarBytes(data, offset, kMaxScriptSize, &output.script_pubkey)) {
      throw std::invalid_argument("Transaction output is truncated");
    }
    output.value = static_cast<int64_t>(value);
  }
  return outputs;
}

}  // namespace

bool Transaction::HasWitness() const {
  return std::any_of(inputs.begin(), inputs.end(),
                     [](const TxIn& input) { return !input.witness.empty(); });
}

Bytes SerializeTransaction(const Transaction& tx, bool include_witness) {
  const bool with_witness = include_witness && tx.HasWitness();

  Bytes out;
  WriteUint32Le(static_cast<uint32_t>(tx.version), &out);
  if (with_witness) {
    out.push_back(kSegwitMarker);
    out.push_back(kSegwitFlag);
  }
  SerializeInputs(tx, &out);
  SerializeOutputs(tx, &out);
  if (with_witness) {
    for (const TxIn& input : tx.inputs) {
      WriteCompactSize(input.witness.size(), &out);
      for (const Bytes& item : input.witness) {
        WriteVarBytes(item, &out);
      }
    }
  }
  WriteUint32Le(tx.lock_time, &out);
  return out;
}

Transaction DeserializeTransaction(std::span<const uint8_t> data) {
  size_t offset = 0;
  Transaction tx;

  uint32_t version = 0;
  if (!ReadUint32Le(data, &offset, &version)) {
    throw std::invalid_argument("Transaction version is truncated");
  }
  tx.version = static_cast<int32_t>(version);

  bool with_witness = false;
  if (offset + 2 <= data.size() && data[offset] == kSegwitMarker) {
    if (data[offset + 1] != kSegwitFlag) {
      throw std::invalid_argument("Unsupported segwit flag");
    }
    with_witness = true;
    offset += 2;
  }

  tx.inputs = ReadInputs(data, &offset);
  tx.outputs = ReadOutputs(data, &offset);

  if (with_witness) {
    for (TxIn& input : tx.inputs) {
      uint64_t items = 0;
      if (!ReadCompactSize(data, &offset, &items) || items > kMaxVectorCount) {
        throw std::invalid_argument("Witness item count is malformed");
      }
      input.witness.resize(static_cast<size_t>(items));
      for (Bytes& item : input.witness) {
        if (!ReadVarBytes(data, &offset, kMaxWitnessItemSize, &item)) {
          throw std::invalid_argument("Witness item is truncated");
        }
      }
    }
    if (!tx.HasWitness()) {
      throw std::invalid_argument("Segwit encoding without witness data");
    }
  }

  if (!ReadUint32Le(data, &offset, &tx.lock_time)) {
    throw std::invalid_argument("Transaction lock time is truncated");
  }
  if (offset != data.size()) {
    throw std::invalid_argument("Transaction has trailing bytes");
  }
  return tx;
}

Bytes ComputeTxid(const Transaction& tx) {
  return DoubleSha256(SerializeTransaction(tx, false));
}

Bytes ComputeWtxid(const Transaction& tx) {
  return DoubleSha256(SerializeTransaction(tx, true));
}

std::string TxidToHex(std::span<const uint8_t> txid) {
  Bytes reversed(txid.rbegin(), txid.rend());
  return HexEncode(reversed);
}

Bytes TxidFromHex(std::string_view hex) {
  if (hex.size() != kTxidSize * 2) {
    throw std::invalid_argument("Txid must be 64 hex characters");
  }
  Bytes txid = HexDecode(hex);
  std::reverse(txid.begin(), txid.end());
  return txid;
}

}  // namespace msig
