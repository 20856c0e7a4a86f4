#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "msig/common/bytes.hpp"
#include "msig/crypto/scalar.hpp"

namespace msig {

inline void SecureZeroizeMemory(void* data, size_t size) noexcept {
  if (data == nullptr || size == 0) {
    return;
  }

  volatile uint8_t* ptr = static_cast<volatile uint8_t*>(data);
  while (size > 0) {
    *ptr = 0;
    ++ptr;
    --size;
  }
}

inline void SecureZeroize(Bytes* value) noexcept {
  if (value == nullptr) {
    return;
  }
  if (!value->empty()) {
    SecureZeroizeMemory(value->data(), value->size());
  }
  value->clear();
}

// Mnemonics and passphrases.
inline void SecureZeroize(std::string* value) noexcept {
  if (value == nullptr) {
    return;
  }
  if (!value->empty()) {
    SecureZeroizeMemory(value->data(), value->size());
  }
  value->clear();
}

template <size_t N>
inline void SecureZeroize(std::array<uint8_t, N>* value) noexcept {
  if (value == nullptr) {
    return;
  }
  SecureZeroizeMemory(value->data(), value->size());
}

inline void SecureZeroize(Scalar* value) noexcept {
  if (value == nullptr) {
    return;
  }
  *value = Scalar();
}

inline void SecureZeroize(std::optional<Scalar>* value) noexcept {
  if (value == nullptr) {
    return;
  }
  if (value->has_value()) {
    SecureZeroize(&value->value());
  }
  value->reset();
}

inline void SecureZeroize(std::vector<std::string>* values) noexcept {
  if (values == nullptr) {
    return;
  }
  for (std::string& value : *values) {
    SecureZeroize(&value);
  }
  values->clear();
}

}  // namespace msig
