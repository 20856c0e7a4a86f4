#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

#include "msig/common/bytes.hpp"

namespace msig {

std::string EncodeBase58(std::span<const uint8_t> data);
bool DecodeBase58(std::string_view encoded, Bytes* out);

// payload || first four bytes of DoubleSha256(payload).
std::string EncodeBase58Check(std::span<const uint8_t> payload);
bool DecodeBase58Check(std::string_view encoded, Bytes* payload);

}  // namespace msig
