#pragma once

#include <cstddef>

#include "msig/common/bytes.hpp"
#include "msig/crypto/scalar.hpp"

namespace msig {

class Csprng {
 public:
  static Bytes RandomBytes(size_t size);
  // Uniform in [1, n-1].
  static Scalar RandomScalar();
};

}  // namespace msig
