#include "msig/wallet/transaction_assembler.hpp"

#include <exception>
#include <optional>
#include <string>

#include "msig/address/address.hpp"
#include "msig/common/errors.hpp"
#include "msig/common/log.hpp"
#include "msig/script/script.hpp"
#include "msig/tx/transaction.hpp"

namespace msig {
namespace {

[[noreturn]] void ThrowInvalidInput(size_t index, const std::string& reason) {
  throw FundsError(ErrorCode::kInvalidSpendableOutput,
                   "Invalid spendable output " + std::to_string(index) + ": " + reason);
}

bool TryTxidFromHex(const std::string& hex, Bytes* txid) {
  if (hex.size() != 64) {
    return false;
  }
  try {
    *txid = TxidFromHex(hex);
  } catch (const std::invalid_argument&) {
    return false;
  }
  return true;
}

}  // namespace

bool IsP2wshScriptPubKey(const Bytes& script) {
  return script.size() == 34 && script[0] == OP_0 && script[1] == 0x20;
}

TransactionAssembler::TransactionAssembler(Bytes locking_script, NetworkParams network)
    : locking_script_(std::move(locking_script)), network_(std::move(network)) {
  std::optional<MultisigPolicy> policy = ParseMultisigScript(locking_script_);
  if (!policy.has_value()) {
    throw ConfigurationError(ErrorCode::kInvalidKeySet, "Locking script is not a canonical multisig script");
  }
  policy_ = std::move(*policy);
  p2sh_script_pubkey_ = P2shScriptPubKey(locking_script_);
  p2wsh_script_pubkey_ = P2wshScriptPubKey(locking_script_);
}

TransactionDraft TransactionAssembler::Assemble(const std::vector<SpendableOutput>& inputs,
                                                const std::vector<DesiredOutput>& outputs,
                                                int64_t fee) const {
  if (inputs.empty()) {
    throw FundsError(ErrorCode::kEmptyInputSet, "UTXOs array cannot be empty");
  }
  if (outputs.empty()) {
    throw FundsError(ErrorCode::kEmptyOutputSet, "Outputs array cannot be empty");
  }
  if (fee < 0) {
    throw FundsError(ErrorCode::kNegativeFee, "Fee cannot be negative");
  }

  TransactionDraft draft;
  draft.required_signatures = policy_.m;
  draft.unsigned_tx.version = kTransactionVersion;
  draft.unsigned_tx.lock_time = 0;

  int64_t total_out = 0;
  draft.unsigned_tx.outputs.reserve(outputs.size());
  for (size_t i = 0; i < outputs.size(); ++i) {
    TxOut out = BuildOutput(outputs[i], i);
    total_out += out.value;
    if (total_out > kMaxMoney) {
      throw FundsError(ErrorCode::kNonPositiveOutputAmount, "Total output amount exceeds the money range");
    }
    draft.unsigned_tx.outputs.push_back(std::move(out));
  }

  int64_t total_in = 0;
  draft.inputs.reserve(inputs.size());
  draft.unsigned_tx.inputs.reserve(inputs.size());
  for (size_t i = 0; i < inputs.size(); ++i) {
    DraftInput resolved = ResolveInput(inputs[i], i);

    TxIn tx_in;
    tx_in.prevout.txid = TxidFromHex(inputs[i].txid_hex);
    tx_in.prevout.index = inputs[i].vout;
    tx_in.sequence = kFinalSequence;
    draft.unsigned_tx.inputs.push_back(std::move(tx_in));
    draft.inputs.push_back(std::move(resolved));

    total_in += inputs[i].amount;
    if (total_in > kMaxMoney) {
      ThrowInvalidInput(i, "total input amount exceeds the money range");
    }
  }

  if (total_in - total_out < fee) {
    throw FundsError(ErrorCode::kInsufficientFunds,
                     "Insufficient funds for transaction: inputs " + std::to_string(total_in) +
                         " < outputs " + std::to_string(total_out) + " + fee " + std::to_string(fee));
  }

  LOGDEBUG << "assembled draft: inputs=" << draft.inputs.size()
           << " outputs=" << draft.unsigned_tx.outputs.size() << " fee=" << fee
           << " change_to_miners=" << (total_in - total_out - fee);
  return draft;
}

const Bytes& TransactionAssembler::locking_script() const {
  return locking_script_;
}

TxOut TransactionAssembler::BuildOutput(const DesiredOutput& output, size_t index) const {
  std::optional<Bytes> script_pubkey = AddressToScriptPubKey(output.address, network_);
  if (!script_pubkey.has_value()) {
    throw FundsError(ErrorCode::kInvalidDestination, "Invalid address: " + output.address);
  }
  if (output.amount <= 0 || output.amount > kMaxMoney) {
    throw FundsError(ErrorCode::kNonPositiveOutputAmount,
                     "Output value must be positive (output " + std::to_string(index) + ")");
  }

  TxOut out;
  out.value = output.amount;
  out.script_pubkey = std::move(*script_pubkey);
  return out;
}

DraftInput TransactionAssembler::ResolveInput(const SpendableOutput& input, size_t index) const {
  Bytes txid;
  if (!TryTxidFromHex(input.txid_hex, &txid)) {
    ThrowInvalidInput(index, "txid must be 64 hex characters");
  }
  if (input.amount < 0 || input.amount > kMaxMoney) {
    ThrowInvalidInput(index, "amount out of range");
  }

  DraftInput resolved;
  resolved.locking_script = locking_script_;

  if (IsP2wshScriptPubKey(input.committed_script)) {
    if (input.committed_script != p2wsh_script_pubkey_) {
      LOGWARN << "input " << index << " (" << input.txid_hex << ":" << input.vout
              << ") commits to a witness script that is not this wallet's P2WSH output";
    }
    resolved.kind = WitnessInput{input.committed_script, input.amount};
    return resolved;
  }

  if (input.prior_transaction.empty()) {
    ThrowInvalidInput(index, "legacy input requires the full prior transaction");
  }

  Transaction prior;
  try {
    prior = DeserializeTransaction(input.prior_transaction);
  } catch (const std::exception& ex) {
    ThrowInvalidInput(index, std::string("prior transaction does not decode: ") + ex.what());
  }
  if (ComputeTxid(prior) != txid) {
    ThrowInvalidInput(index, "prior transaction hash does not match txid");
  }
  if (input.vout >= prior.outputs.size()) {
    ThrowInvalidInput(index, "prior transaction lacks output " + std::to_string(input.vout));
  }

  const TxOut& spent = prior.outputs[input.vout];
  if (!input.committed_script.empty() && spent.script_pubkey != input.committed_script) {
    ThrowInvalidInput(index, "committed script disagrees with the prior transaction");
  }
  if (spent.value != input.amount) {
    ThrowInvalidInput(index, "amount disagrees with the prior transaction");
  }
  if (spent.script_pubkey != p2sh_script_pubkey_) {
    LOGWARN << "input " << index << " (" << input.txid_hex << ":" << input.vout
            << ") is not locked to this wallet's P2SH output";
  }

  resolved.kind = LegacyInput{input.prior_transaction};
  return resolved;
}

}  // namespace msig
