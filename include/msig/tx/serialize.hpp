#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

#include "msig/common/bytes.hpp"

namespace msig {

// Little-endian Bitcoin wire primitives.
void WriteUint32Le(uint32_t value, Bytes* out);
void WriteUint64Le(uint64_t value, Bytes* out);
void WriteCompactSize(uint64_t value, Bytes* out);
void WriteVarBytes(std::span<const uint8_t> data, Bytes* out);

bool ReadUint32Le(std::span<const uint8_t> data, size_t* offset, uint32_t* value);
bool ReadUint64Le(std::span<const uint8_t> data, size_t* offset, uint64_t* value);
// Rejects non-canonical encodings.
bool ReadCompactSize(std::span<const uint8_t> data, size_t* offset, uint64_t* value);
bool ReadVarBytes(std::span<const uint8_t> data, size_t* offset, size_t max_len, Bytes* out);
bool ReadFixedBytes(std::span<const uint8_t> data, size_t* offset, size_t len, Bytes* out);

}  // namespace msig
