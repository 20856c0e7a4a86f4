#pragma once

#include <cstdint>
#include <span>
#include <string_view>

#include "msig/common/bytes.hpp"

namespace msig {

Bytes Sha256(std::span<const uint8_t> data);
Bytes Sha512(std::span<const uint8_t> data);
Bytes Ripemd160(std::span<const uint8_t> data);

// SHA256(SHA256(data)): txids, sighashes, Base58Check checksums.
Bytes DoubleSha256(std::span<const uint8_t> data);
// RIPEMD160(SHA256(data)): P2SH script hashes, BIP32 fingerprints.
Bytes Hash160(std::span<const uint8_t> data);

Bytes HmacSha512(std::span<const uint8_t> key, std::span<const uint8_t> data);
Bytes Pbkdf2HmacSha512(std::string_view password,
                       std::string_view salt,
                       uint32_t iterations,
                       size_t output_len);

}  // namespace msig
