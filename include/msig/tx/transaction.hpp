#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "msig/common/bytes.hpp"

namespace msig {

constexpr int32_t kTransactionVersion = 2;
constexpr uint32_t kFinalSequence = 0xFFFFFFFF;

struct OutPoint {
  // Internal (little-endian) byte order, as serialized on the wire.
  Bytes txid;
  uint32_t index = 0;
};

struct TxIn {
  OutPoint prevout;
  Bytes script_sig;
  uint32_t sequence = kFinalSequence;
  std::vector<Bytes> witness;
};

struct TxOut {
  int64_t value = 0;
  Bytes script_pubkey;
};

struct Transaction {
  int32_t version = kTransactionVersion;
  std::vector<TxIn> inputs;
  std::vector<TxOut> outputs;
  uint32_t lock_time = 0;

  bool HasWitness() const;
};

// BIP144 encoding with marker/flag whenever `include_witness` and any input carries a witness.
Bytes SerializeTransaction(const Transaction& tx, bool include_witness = true);
// Throws std::invalid_argument on malformed or trailing data.
Transaction DeserializeTransaction(std::span<const uint8_t> data);

// Internal byte order. Txid ignores witness data, wtxid includes it.
Bytes ComputeTxid(const Transaction& tx);
Bytes ComputeWtxid(const Transaction& tx);

// Display order (byte-reversed hex) <-> internal order.
std::string TxidToHex(std::span<const uint8_t> txid);
// Throws std::invalid_argument unless `hex` is 64 hex characters.
Bytes TxidFromHex(std::string_view hex);

}  // namespace msig
