#pragma once

#include <cstdint>
#include <vector>

#include "msig/address/network.hpp"
#include "msig/common/bytes.hpp"
#include "msig/script/script_builder.hpp"
#include "msig/wallet/draft.hpp"

namespace msig {

// 21 million BTC in satoshis.
constexpr int64_t kMaxMoney = 2100000000000000LL;

class TransactionAssembler {
 public:
  // `locking_script` must be a canonical multisig script (ConfigurationError otherwise).
  TransactionAssembler(Bytes locking_script, NetworkParams network);

  // Builds an unsigned draft spending `inputs` to `outputs` with `fee` left to miners.
  // Checks run in order: empty inputs, empty outputs, negative fee, each output,
  // each input, then the funds balance. Failures throw FundsError.
  TransactionDraft Assemble(const std::vector<SpendableOutput>& inputs,
                            const std::vector<DesiredOutput>& outputs,
                            int64_t fee) const;

  const Bytes& locking_script() const;

 private:
  TxOut BuildOutput(const DesiredOutput& output, size_t index) const;
  DraftInput ResolveInput(const SpendableOutput& input, size_t index) const;

  Bytes locking_script_;
  NetworkParams network_;
  MultisigPolicy policy_;
  Bytes p2sh_script_pubkey_;
  Bytes p2wsh_script_pubkey_;
};

// OP_0 <32 bytes>
bool IsP2wshScriptPubKey(const Bytes& script);

}  // namespace msig
