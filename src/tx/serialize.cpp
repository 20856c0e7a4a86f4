#include "msig/tx/serialize.hpp"

namespace msig {

void WriteUint32Le(uint32_t value, Bytes* out) {
  for (int i = 0; i < 4; ++i) {
    out->push_back(static_cast<uint8_t>((value >> (8 * i)) & 0xFF));
  }
}

void WriteUint64Le(uint64_t value, Bytes* out) {
  for (int i = 0; i < 8; ++i) {
    out->push_back(static_cast<uint8_t>((value >> (8 * i)) & 0xFF));
  }
}

void WriteCompactSize(uint64_t value, Bytes* out) {
  if (value < 0xFD) {
    out->push_back(static_cast<uint8_t>(value));
  } else if (value <= 0xFFFF) {
    out->push_back(0xFD);
    out->push_back(static_cast<uint8_t>(value & 0xFF));
    out->push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
  } else if (value <= 0xFFFFFFFF) {
    out->push_back(0xFE);
    WriteUint32Le(static_cast<uint32_t>(value), out);
  } else {
    out->push_back(0xFF);
    WriteUint64Le(value, out);
  }
}

void WriteVarBytes(std::span<const uint8_t> data, Bytes* out) {
  WriteCompactSize(data.size(), out);
  out->insert(out->end(), data.begin(), data.end());
}

bool ReadUint32Le(std::span<const uint8_t> data, size_t* offset, uint32_t* value) {
  if (*offset > data.size() || data.size() - *offset < 4) {
    return false;
  }
  uint32_t out = 0;
  for (int i = 0; i < 4; ++i) {
    out |= static_cast<uint32_t>(data[*offset + i]) << (8 * i);
  }
  *offset += 4;
  *value = out;
  return true;
}

bool ReadUint64Le(std::span<const uint8_t> data, size_t* offset, uint64_t* value) {
  if (*offset > data.size() || data.size() - *offset < 8) {
    return false;
  }
  uint64_t out = 0;
  for (int i = 0; i < 8; ++i) {
    out |= static_cast<uint64_t>(data[*offset + i]) << (8 * i);
  }
  *offset += 8;
  *value = out;
  return true;
}

bool ReadCompactSize(std::span<const uint8_t> data, size_t* offset, uint64_t* value) {
  if (*offset >= data.size()) {
    return false;
  }
  const uint8_t prefix = data[(*offset)++];
  if (prefix < 0xFD) {
    *value = prefix;
    return true;
  }
  if (prefix == 0xFD) {
    if (data.size() - *offset < 2) {
      return false;
    }
    const uint64_t out = static_cast<uint64_t>(data[*offset]) |
                         (static_cast<uint64_t>(data[*offset + 1]) << 8);
    *offset += 2;
    if (out < 0xFD) {
      return false;
    }
    *value = out;
    return true;
  }
  if (prefix == 0xFE) {
    uint32_t out = 0;
    if (!ReadUint32Le(data, offset, &out) || out <= 0xFFFF) {
      return false;
    }
    *value = out;
    return true;
  }
  uint64_t out = 0;
  if (!ReadUint64Le(data, offset, &out) || out <= 0xFFFFFFFFull) {
    return false;
  }
  *value = out;
  return true;
}

bool ReadFixedBytes(std::span<const uint8_t> data, size_t* offset, size_t len, Bytes* out) {
  if (*offset > data.size() || data.size() - *offset < len) {
    return false;
  }
  out->assign(data.begin() + static_cast<std::ptrdiff_t>(*offset),
              data.begin() + static_cast<std::ptrdiff_t>(*offset + len));
  *offset += len;
  return true;
}

bool ReadVarBytes(std::span<const uint8_t> data, size_t* offset, size_t max_len, Bytes* out) {
  uint64_t len = 0;
  if (!ReadCompactSize(data, offset, &len) || len > max_len) {
    return false;
  }
  return ReadFixedBytes(data, offset, static_cast<size_t>(len), out);
}

}  // namespace msig
