#include "msig/crypto/hash.hpp"

#include <array>
#include <limits>
#include <stdexcept>

#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/ripemd.h>
#include <openssl/sha.h>

namespace msig {

Bytes Sha256(std::span<const uint8_t> data) {
  std::array<uint8_t, SHA256_DIGEST_LENGTH> digest{};
  if (SHA256(data.data(), data.size(), digest.data()) == nullptr) {
    throw std::runtime_error("SHA256 failed");
  }
  return Bytes(digest.begin(), digest.end());
}

Bytes Sha512(std::span<const uint8_t> data) {
  std::array<uint8_t, SHA512_DIGEST_LENGTH> digest{};
  if (SHA512(data.data(), data.size(), digest.data()) == nullptr) {
    throw std::runtime_error("SHA512 failed");
  }
  return Bytes(digest.begin(), digest.end());
}

Bytes Ripemd160(std::span<const uint8_t> data) {
  std::array<uint8_t, RIPEMD160_DIGEST_LENGTH> digest{};
  if (RIPEMD160(data.data(), data.size(), digest.data()) == nullptr) {
    throw std::runtime_error("RIPEMD160 failed");
  }
  return Bytes(digest.begin(), digest.end());
}

Bytes DoubleSha256(std::span<const uint8_t> data) {
  return Sha256(Sha256(data));
}

Bytes Hash160(std::span<const uint8_t> data) {
  return Ripemd160(Sha256(data));
}

Bytes HmacSha512(std::span<const uint8_t> key, std::span<const uint8_t> data) {
  if (key.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
    throw std::invalid_argument("HMAC key is too long");
  }

  std::array<uint8_t, SHA512_DIGEST_LENGTH> mac{};
  unsigned int mac_len = 0;
  if (HMAC(EVP_sha512(), key.data(), static_cast<int>(key.size()), data.data(), data.size(),
           mac.data(), &mac_len) == nullptr ||
      mac_len != mac.size()) {
    throw std::runtime_error("HMAC-SHA512 failed");
  }
  return Bytes(mac.begin(), mac.end());
}

Bytes Pbkdf2HmacSha512(std::string_view password,
                       std::string_view salt,
                       uint32_t iterations,
                       size_t output_len) {
  if (iterations == 0 || output_len == 0) {
    throw std::invalid_argument("PBKDF2 requires non-zero iterations and output length");
  }
  constexpr size_t kIntMax = static_cast<size_t>(std::numeric_limits<int>::max());
  if (password.size() > kIntMax || salt.size() > kIntMax || output_len > kIntMax ||
      iterations > static_cast<uint32_t>(std::numeric_limits<int>::max())) {
    throw std::invalid_argument("PBKDF2 parameter exceeds int range");
  }

  Bytes out(output_len);
  if (PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()),
                        reinterpret_cast<const unsigned char*>(salt.data()),
                        static_cast<int>(salt.size()), static_cast<int>(iterations), EVP_sha512(),
                        static_cast<int>(out.size()), out.data()) != 1) {
    throw std::runtime_error("PBKDF2-HMAC-SHA512 failed");
  }
  return out;
}

}  // namespace msig
