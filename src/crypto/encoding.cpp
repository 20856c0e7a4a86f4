#include "msig/crypto/encoding.hpp"

#include <stdexcept>
#include <string>

namespace msig {

void AppendU32Be(uint32_t value, Bytes* out) {
  out->push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
  out->push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
  out->push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
  out->push_back(static_cast<uint8_t>(value & 0xFF));
}

void AppendU64Be(uint64_t value, Bytes* out) {
  AppendU32Be(static_cast<uint32_t>(value >> 32), out);
  AppendU32Be(static_cast<uint32_t>(value & 0xFFFFFFFFu), out);
}

void AppendSizedField(std::span<const uint8_t> field, Bytes* out) {
  if (field.size() > UINT32_MAX) {
    throw std::invalid_argument("Field exceeds uint32 length");
  }
  AppendU32Be(static_cast<uint32_t>(field.size()), out);
  out->insert(out->end(), field.begin(), field.end());
}

uint32_t ReadU32Be(std::span<const uint8_t> input, size_t* offset) {
  if (*offset + 4 > input.size()) {
    throw std::invalid_argument("Not enough bytes to read u32");
  }

  const size_t i = *offset;
  *offset += 4;
  return (static_cast<uint32_t>(input[i]) << 24) |
         (static_cast<uint32_t>(input[i + 1]) << 16) |
         (static_cast<uint32_t>(input[i + 2]) << 8) |
         static_cast<uint32_t>(input[i + 3]);
}

uint64_t ReadU64Be(std::span<const uint8_t> input, size_t* offset) {
  const uint64_t hi = ReadU32Be(input, offset);
  const uint64_t lo = ReadU32Be(input, offset);
  return (hi << 32) | lo;
}

Bytes ReadSizedField(std::span<const uint8_t> input,
                     size_t* offset,
                     size_t max_len,
                     const char* field_name) {
  const uint32_t len = ReadU32Be(input, offset);
  if (len > max_len) {
    throw std::invalid_argument(std::string(field_name) + " exceeds max length");
  }
  if (*offset + len > input.size()) {
    throw std::invalid_argument(std::string(field_name) + " has inconsistent length");
  }

  Bytes out(input.begin() + static_cast<std::ptrdiff_t>(*offset),
            input.begin() + static_cast<std::ptrdiff_t>(*offset + len));
  *offset += len;
  return out;
}

Bytes EncodePoint(const ECPoint& point) {
  return point.ToCompressedBytes();
}

ECPoint DecodePoint(std::span<const uint8_t> encoded) {
  return ECPoint::FromCompressed(encoded);
}

}  // namespace msig
