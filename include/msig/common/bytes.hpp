#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace msig {

using Bytes = std::vector<uint8_t>;

std::string HexEncode(std::span<const uint8_t> data);

// Throws std::invalid_argument on odd length or non-hex characters.
Bytes HexDecode(std::string_view hex);
bool TryHexDecode(std::string_view hex, Bytes* out);

}  // namespace msig
