#pragma once

extern "C" {
#include <secp256k1.h>
}

namespace msig::internal {

// Shared by ec_point.cpp and ecdsa.cpp; created once, never destroyed.
secp256k1_context* GetSecpContext();

}  // namespace msig::internal
