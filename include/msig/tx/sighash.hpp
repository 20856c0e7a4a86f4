#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

#include "msig/common/bytes.hpp"
#include "msig/tx/transaction.hpp"

namespace msig {

// The only hash mode this library signs with.
constexpr uint32_t kSighashAll = 0x01;

// Pre-segwit digest: every scriptSig blanked, `script_code` placed on the signed input.
Bytes LegacySignatureHash(const Transaction& tx,
                          size_t input_index,
                          std::span<const uint8_t> script_code,
                          uint32_t sighash_type = kSighashAll);

// BIP143 digest committing to the spent `amount`.
Bytes WitnessV0SignatureHash(const Transaction& tx,
                             size_t input_index,
                             std::span<const uint8_t> script_code,
                             int64_t amount,
                             uint32_t sighash_type = kSighashAll);

}  // namespace msig
