#include "msig/common/bytes.hpp"

#include <stdexcept>

namespace msig {
namespace {

constexpr char kHexLower[] = "0123456789abcdef";

int FromHexDigit(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return 10 + (c - 'a');
  }
  if (c >= 'A' && c <= 'F') {
    return 10 + (c - 'A');
  }
  return -1;
}

}  // namespace

std::string HexEncode(std::span<const uint8_t> data) {
  std::string out;
  out.resize(data.size() * 2);
  for (size_t i = 0; i < data.size(); ++i) {
    out[i * 2] = kHexLower[(data[i] >> 4) & 0x0F];
    out[i * 2 + 1] = kHexLower[data[i] & 0x0F];
  }
  return out;
}

bool TryHexDecode(std::string_view hex, Bytes* out) {
  if (out == nullptr || hex.size() % 2 != 0) {
    return false;
  }

  Bytes decoded;
  decoded.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    const int hi = FromHexDigit(hex[i]);
    const int lo = FromHexDigit(hex[i + 1]);
    if (hi < 0 || lo < 0) {
      return false;
    }
    decoded.push_back(static_cast<uint8_t>((hi << 4) | lo));
  }
  *out = std::move(decoded);
  return true;
}

Bytes HexDecode(std::string_view hex) {
  Bytes out;
  if (!TryHexDecode(hex, &out)) {
    throw std::invalid_argument("Malformed hex string");
  }
  return out;
}

}  // namespace msig
