#include "msig/crypto/base58.hpp"

#include <algorithm>
#include <array>

#include "msig/crypto/hash.hpp"

namespace msig {
namespace {

constexpr char kAlphabet[] = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

constexpr std::array<int8_t, 128> CreateDecodeMap() {
  std::array<int8_t, 128> map{};
  map.fill(-1);
  for (int i = 0; i < 58; ++i) {
    map[static_cast<unsigned char>(kAlphabet[i])] = static_cast<int8_t>(i);
  }
  return map;
}

constexpr auto kDecodeMap = CreateDecodeMap();
constexpr size_t kChecksumSize = 4;

}  // namespace

std::string EncodeBase58(std::span<const uint8_t> data) {
  size_t leading_zeros = 0;
  while (leading_zeros < data.size() && data[leading_zeros] == 0) {
    ++leading_zeros;
  }

  // log(256) / log(58) ~= 1.37
  std::vector<uint8_t> digits((data.size() - leading_zeros) * 138 / 100 + 1, 0);
  size_t length = 0;
  for (size_t i = leading_zeros; i < data.size(); ++i) {
    uint32_t carry = data[i];
    size_t j = 0;
    for (auto it = digits.rbegin(); (carry != 0 || j < length) && it != digits.rend(); ++it, ++j) {
      carry += 256u * (*it);
      *it = static_cast<uint8_t>(carry % 58);
      carry /= 58;
    }
    length = j;
  }

  auto it = digits.begin() + static_cast<std::ptrdiff_t>(digits.size() - length);
  while (it != digits.end() && *it == 0) {
    ++it;
  }

  std::string out(leading_zeros, '1');
  out.reserve(leading_zeros + static_cast<size_t>(digits.end() - it));
  for (; it != digits.end(); ++it) {
    out.push_back(kAlphabet[*it]);
  }
  return out;
}

bool DecodeBase58(std::string_view encoded, Bytes* out) {
  if (out == nullptr) {
    return false;
  }

  size_t leading_ones = 0;
  while (leading_ones < encoded.size() && encoded[leading_ones] == '1') {
    ++leading_ones;
  }

  // log(58) / log(256) ~= 0.733
  std::vector<uint8_t> b256((encoded.size() - leading_ones) * 733 / 1000 + 1, 0);
  size_t length = 0;
  for (size_t i = leading_ones; i < encoded.size(); ++i) {
    const unsigned char c = static_cast<unsigned char>(encoded[i]);
    if (c >= 128 || kDecodeMap[c] < 0) {
      return false;
    }
    uint32_t carry = static_cast<uint32_t>(kDecodeMap[c]);
    size_t j = 0;
    for (auto it = b256.rbegin(); (carry != 0 || j < length) && it != b256.rend(); ++it, ++j) {
      carry += 58u * (*it);
      *it = static_cast<uint8_t>(carry % 256);
      carry /= 256;
    }
    if (carry != 0) {
      return false;
    }
    length = j;
  }

  auto it = b256.begin() + static_cast<std::ptrdiff_t>(b256.size() - length);
  while (it != b256.end() && *it == 0) {
    ++it;
  }

  Bytes decoded(leading_ones, 0x00);
  decoded.insert(decoded.end(), it, b256.end());
  *out = std::move(decoded);
  return true;
}

std::string EncodeBase58Check(std::span<const uint8_t> payload) {
  Bytes data(payload.begin(), payload.end());
  const Bytes checksum = DoubleSha256(payload);
  data.insert(data.end(), checksum.begin(), checksum.begin() + kChecksumSize);
  return EncodeBase58(data);
}

bool DecodeBase58Check(std::string_view encoded, Bytes* payload) {
  if (payload == nullptr) {
    return false;
  }

  Bytes data;
  if (!DecodeBase58(encoded, &data) || data.size() < kChecksumSize) {
    return false;
  }

  const std::span<const uint8_t> body(data.data(), data.size() - kChecksumSize);
  const Bytes checksum = DoubleSha256(body);
  if (!std::equal(checksum.begin(), checksum.begin() + kChecksumSize, data.end() - kChecksumSize)) {
    return false;
  }

  payload->assign(body.begin(), body.end());
  return true;
}

}  // namespace msig
