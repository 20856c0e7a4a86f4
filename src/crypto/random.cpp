#include "msig/crypto/random.hpp"

#include <limits>
#include <stdexcept>

#include <openssl/rand.h>

namespace msig {

Bytes Csprng::RandomBytes(size_t size) {
  Bytes out(size);
  if (size == 0) {
    return out;
  }
  if (size > static_cast<size_t>(std::numeric_limits<int>::max())) {
    throw std::invalid_argument("RandomBytes request is too large");
  }

  if (RAND_bytes(out.data(), static_cast<int>(out.size())) != 1) {
    throw std::runtime_error("RAND_bytes failed");
  }
  return out;
}

Scalar Csprng::RandomScalar() {
  while (true) {
    const Bytes bytes = RandomBytes(32);
    try {
      Scalar candidate = Scalar::FromCanonicalBytes(bytes);
      if (!candidate.IsZero()) {
        return candidate;
      }
    } catch (const std::invalid_argument&) {
      continue;
    }
  }
}

}  // namespace msig
