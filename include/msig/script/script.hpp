#pragma once

#include <cstdint>
#include <span>
#include <vector>

#include "msig/common/bytes.hpp"

namespace msig {

enum Opcode : uint8_t {
  OP_0 = 0x00,
  OP_PUSHDATA1 = 0x4c,
  OP_PUSHDATA2 = 0x4d,
  OP_PUSHDATA4 = 0x4e,
  OP_1 = 0x51,
  OP_16 = 0x60,
  OP_DUP = 0x76,
  OP_EQUAL = 0x87,
  OP_EQUALVERIFY = 0x88,
  OP_HASH160 = 0xa9,
  OP_CHECKSIG = 0xac,
  OP_CHECKMULTISIG = 0xae,
};

// Consensus limits on redeem and witness scripts.
constexpr size_t kMaxScriptElementSize = 520;
constexpr size_t kMaxWitnessScriptSize = 10000;

// Minimal push of `data` (direct push, PUSHDATA1/2/4).
void AppendPushData(std::span<const uint8_t> data, Bytes* script);
// OP_1..OP_16 for 1..16, OP_0 for 0.
void AppendSmallInt(uint32_t value, Bytes* script);
// Inverse of AppendSmallInt; false for any other opcode.
bool DecodeSmallInt(uint8_t opcode, uint32_t* value);

// A scriptSig built only from data pushes.
Bytes BuildPushOnlyScript(const std::vector<Bytes>& elements);

}  // namespace msig
