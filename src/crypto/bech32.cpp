#include "msig/crypto/bech32.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <stdexcept>

namespace msig {
namespace {

constexpr std::array<char, 32> kCharset = {
    'q', 'p', 'z', 'r', 'y', '9', 'x', '8', 'g', 'f', '2', 't', 'v', 'd', 'w', '0',
    's', '3', 'j', 'n', '5', '4', 'k', 'h', 'c', 'e', '6', 'm', 'u', 'a', '7', 'l'};

constexpr std::array<int, 128> CreateDecodeMap() {
  std::array<int, 128> map{};
  map.fill(-1);
  for (size_t i = 0; i < kCharset.size(); ++i) {
    map[static_cast<unsigned>(kCharset[i])] = static_cast<int>(i);
  }
  return map;
}

constexpr auto kDecodeMap = CreateDecodeMap();
constexpr uint32_t kBech32Constant = 1;
constexpr uint32_t kBech32mConstant = 0x2bc830a3;

uint32_t ChecksumConstant(Bech32Variant variant) {
  return variant == Bech32Variant::kBech32 ? kBech32Constant : kBech32mConstant;
}

Bech32Variant VariantForVersion(uint8_t witness_version) {
  return witness_version == 0 ? Bech32Variant::kBech32 : Bech32Variant::kBech32m;
}

uint32_t Polymod(const std::vector<uint8_t>& values) {
  uint32_t chk = 1;
  for (uint8_t v : values) {
    uint8_t top = chk >> 25;
    chk = (chk & 0x1ffffff) << 5 ^ v;
    if (top & 0x01) chk ^= 0x3b6a57b2;
    if (top & 0x02) chk ^= 0x26508e6d;
    if (top & 0x04) chk ^= 0x1ea119fa;
    if (top & 0x08) chk ^= 0x3d4233dd;
    if (top & 0x10) chk ^= 0x2a1462b3;
  }
  return chk;
}

std::vector<uint8_t> HrpExpand(std::string_view hrp) {
  std::vector<uint8_t> ret;
  ret.reserve(hrp.size() * 2 + 1);
  for (char c : hrp) {
    ret.push_back(static_cast<uint8_t>(std::tolower(static_cast<unsigned char>(c)) >> 5));
  }
  ret.push_back(0);
  for (char c : hrp) {
    ret.push_back(static_cast<uint8_t>(std::tolower(static_cast<unsigned char>(c)) & 0x1F));
  }
  return ret;
}

bool ConvertBits(std::vector<uint8_t>* out, int from_bits, int to_bits, bool pad,
                 std::span<const uint8_t> data) {
  uint32_t acc = 0;
  int bits = 0;
  const uint32_t maxv = (1u << to_bits) - 1;
  for (uint8_t value : data) {
    if (value >> from_bits) {
      return false;
    }
    acc = (acc << from_bits) | value;
    bits += from_bits;
    while (bits >= to_bits) {
      bits -= to_bits;
      out->push_back(static_cast<uint8_t>((acc >> bits) & maxv));
    }
  }
  if (pad) {
    if (bits) {
      out->push_back(static_cast<uint8_t>((acc << (to_bits - bits)) & maxv));
    }
  } else if (bits >= from_bits || ((acc << (to_bits - bits)) & maxv)) {
    return false;
  }
  return true;
}

bool IsValidHrp(std::string_view hrp) {
  if (hrp.size() < 1 || hrp.size() > 83) {
    return false;
  }
  for (char c : hrp) {
    if (c < 0x21 || c > 0x7E) return false;
  }
  return true;
}

// BIP141: 2..40 byte programs; version 0 only allows 20 (P2WPKH) and 32 (P2WSH).
bool IsValidProgram(uint8_t witness_version, size_t program_size) {
  if (witness_version > 16 || program_size < 2 || program_size > 40) {
    return false;
  }
  return witness_version != 0 || program_size == 20 || program_size == 32;
}

bool EqualsIgnoreCase(std::string_view lhs, std::string_view rhs) {
  return std::equal(lhs.begin(), lhs.end(), rhs.begin(), rhs.end(), [](char a, char b) {
    return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
  });
}

}  // namespace

std::string EncodeSegwitAddress(std::string_view hrp,
                                uint8_t witness_version,
                                std::span<const uint8_t> program) {
  if (!IsValidHrp(hrp)) {
    throw std::invalid_argument("Invalid HRP");
  }
  if (!IsValidProgram(witness_version, program.size())) {
    throw std::invalid_argument("Invalid witness version or program length");
  }

  std::vector<uint8_t> data;
  data.reserve(program.size() * 8 / 5 + 2);
  data.push_back(witness_version);
  if (!ConvertBits(&data, 8, 5, true, program)) {
    throw std::invalid_argument("Invalid witness program");
  }

  std::vector<uint8_t> values = HrpExpand(hrp);
  values.insert(values.end(), data.begin(), data.end());
  values.insert(values.end(), 6, 0);
  const uint32_t polymod = Polymod(values) ^ ChecksumConstant(VariantForVersion(witness_version));

  std::string ret;
  ret.reserve(hrp.size() + data.size() + 7);
  for (char c : hrp) {
    ret.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  ret.push_back('1');
  for (uint8_t v : data) {
    ret.push_back(kCharset[v]);
  }
  for (int i = 0; i < 6; ++i) {
    ret.push_back(kCharset[(polymod >> (5 * (5 - i))) & 31]);
  }
  return ret;
}

bool DecodeSegwitAddress(std::string_view address,
                         std::string_view expected_hrp,
                         uint8_t* witness_version,
                         std::vector<uint8_t>* program) {
  if (witness_version == nullptr || program == nullptr) {
    return false;
  }
  if (address.size() < 8 || address.size() > 90) {
    return false;
  }
  bool lower = false;
  bool upper = false;
  for (char c : address) {
    if (std::isupper(static_cast<unsigned char>(c))) upper = true;
    if (std::islower(static_cast<unsigned char>(c))) lower = true;
  }
  if (upper && lower) {
    return false;
  }

  const auto pos = address.rfind('1');
  if (pos == std::string_view::npos || pos == 0 || pos + 7 > address.size()) {
    return false;
  }
  const std::string_view hrp = address.substr(0, pos);
  const std::string_view data_part = address.substr(pos + 1);
  if (!IsValidHrp(hrp) || !EqualsIgnoreCase(hrp, expected_hrp)) {
    return false;
  }

  std::vector<uint8_t> data;
  data.reserve(data_part.size());
  for (char c : data_part) {
    const unsigned char lowered = static_cast<unsigned char>(std::tolower(static_cast<unsigned char>(c)));
    if (lowered > 127 || kDecodeMap[lowered] == -1) {
      return false;
    }
    data.push_back(static_cast<uint8_t>(kDecodeMap[lowered]));
  }
  if (data.size() < 7) {  // version + 6 checksum values
    return false;
  }

  std::vector<uint8_t> verify_values = HrpExpand(hrp);
  verify_values.insert(verify_values.end(), data.begin(), data.end());
  const uint32_t residue = Polymod(verify_values);

  data.resize(data.size() - 6);
  const uint8_t version = data.front();
  if (version > 16 || residue != ChecksumConstant(VariantForVersion(version))) {
    return false;
  }

  std::vector<uint8_t> decoded;
  if (!ConvertBits(&decoded, 5, 8, false, std::span<const uint8_t>(data.data() + 1, data.size() - 1))) {
    return false;
  }
  if (!IsValidProgram(version, decoded.size())) {
    return false;
  }

  *witness_version = version;
  *program = std::move(decoded);
  return true;
}

}  // namespace msig
