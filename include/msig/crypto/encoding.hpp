#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

#include "msig/common/bytes.hpp"
#include "msig/crypto/ec_point.hpp"

namespace msig {

// Big-endian, u32 length-prefixed fields used by the draft codec.
void AppendU32Be(uint32_t value, Bytes* out);
void AppendU64Be(uint64_t value, Bytes* out);
void AppendSizedField(std::span<const uint8_t> field, Bytes* out);

uint32_t ReadU32Be(std::span<const uint8_t> input, size_t* offset);
uint64_t ReadU64Be(std::span<const uint8_t> input, size_t* offset);
Bytes ReadSizedField(std::span<const uint8_t> input,
                     size_t* offset,
                     size_t max_len,
                     const char* field_name);

Bytes EncodePoint(const ECPoint& point);
ECPoint DecodePoint(std::span<const uint8_t> encoded);

}  // namespace msig
