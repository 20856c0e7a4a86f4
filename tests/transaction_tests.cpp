#include <cstdio>
#include <fstream>
#include <functional>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "msig/address/address.hpp"
#include "msig/address/network.hpp"
#include "msig/common/bytes.hpp"
#include "msig/common/errors.hpp"
#include "msig/common/log.hpp"
#include "msig/crypto/ec_point.hpp"
#include "msig/crypto/scalar.hpp"
#include "msig/script/script_builder.hpp"
#include "msig/tx/serialize.hpp"
#include "msig/tx/sighash.hpp"
#include "msig/tx/transaction.hpp"
#include "msig/wallet/draft.hpp"
#include "msig/wallet/transaction_assembler.hpp"

namespace {

using msig::Bytes;
using msig::DesiredOutput;
using msig::ErrorCode;
using msig::HexDecode;
using msig::HexEncode;
using msig::Network;
using msig::ParamsFor;
using msig::SpendableOutput;
using msig::Transaction;
using msig::TransactionAssembler;
using msig::TransactionDraft;

constexpr char kGenesisCoinbase[] =
    "01000000010000000000000000000000000000000000000000000000000000000000000000ffffffff4d04ffff001d"
    "0104455468652054696d65732030332f4a616e2f32303039204368616e63656c6c6f72206f6e206272696e6b206f66"
    "207365636f6e64206261696c6f757420666f722062616e6b73ffffffff0100f2052a01000000434104678afdb0fe55"
    "48271967f1a67130b7105cd6a828e03909a67962e0ea1f61deb649f6bc3f4cef38c4f35504e51ec112de5c384df7ba"
    "0b8d578a4c702b6bf11d5fac00000000";
constexpr char kGenesisTxid[] = "4a5e1e4baab89f3a32518a88c31bc87f618f76673e2cc77ab2127b7afdeda33b";
constexpr char kDestination[] = "tb1qw508d6qejxtdg4y5r3zarvary0c5xw7kxpjzsx";

void Expect(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error("Test failed: " + message);
  }
}

void ExpectThrow(const std::function<void()>& fn, const std::string& message) {
  try {
    fn();
  } catch (const std::exception&) {
    return;
  }
  throw std::runtime_error("Expected exception: " + message);
}

void ExpectWalletError(const std::function<void()>& fn, ErrorCode expected, const std::string& message) {
  try {
    fn();
  } catch (const msig::WalletError& ex) {
    if (ex.code() != expected) {
      throw std::runtime_error("Unexpected error code " + std::string(msig::ErrorCodeName(ex.code())) +
                               " (" + ex.what() + "): " + message);
    }
    return;
  }
  throw std::runtime_error("Expected wallet error: " + message);
}

Bytes WalletScript() {
  std::vector<msig::ECPoint> keys;
  for (uint64_t i = 1; i <= 3; ++i) {
    keys.push_back(msig::ECPoint::GeneratorMultiply(msig::Scalar::FromUint64(i)));
  }
  return msig::BuildScript(msig::BuildPolicy(2, keys));
}

// A one-output transaction paying `value` to `script_pubkey`.
Transaction FundingTransaction(const Bytes& script_pubkey, int64_t value) {
  Transaction tx;
  msig::TxIn in;
  in.prevout.txid = Bytes(32, 0x11);
  in.prevout.index = 3;
  in.script_sig = Bytes{0x51};
  tx.inputs.push_back(in);
  tx.outputs.push_back(msig::TxOut{value, script_pubkey});
  return tx;
}

SpendableOutput WitnessUtxo(const Bytes& script, int64_t amount) {
  SpendableOutput utxo;
  utxo.txid_hex = std::string(64, 'a');
  utxo.vout = 1;
  utxo.amount = amount;
  utxo.committed_script = msig::P2wshScriptPubKey(script);
  return utxo;
}

SpendableOutput LegacyUtxo(const Transaction& funding, int64_t amount) {
  SpendableOutput utxo;
  utxo.prior_transaction = msig::SerializeTransaction(funding);
  utxo.txid_hex = msig::TxidToHex(msig::ComputeTxid(funding));
  utxo.vout = 0;
  utxo.amount = amount;
  utxo.committed_script = funding.outputs[0].script_pubkey;
  return utxo;
}

void TestWirePrimitives() {
  Bytes out;
  msig::WriteCompactSize(0xfc, &out);
  msig::WriteCompactSize(0xfd, &out);
  msig::WriteCompactSize(0x10000, &out);
  Expect(HexEncode(out) == "fcfdfd00fe00000100", "CompactSize encodings");

  size_t offset = 0;
  uint64_t value = 0;
  Expect(msig::ReadCompactSize(out, &offset, &value) && value == 0xfc, "Single-byte CompactSize");
  Expect(msig::ReadCompactSize(out, &offset, &value) && value == 0xfd, "Three-byte CompactSize");
  Expect(msig::ReadCompactSize(out, &offset, &value) && value == 0x10000, "Five-byte CompactSize");

  const Bytes non_canonical = {0xfd, 0x10, 0x00};
  offset = 0;
  Expect(!msig::ReadCompactSize(non_canonical, &offset, &value), "Non-canonical CompactSize is rejected");

  Bytes var;
  msig::WriteVarBytes(Bytes{0x01, 0x02, 0x03}, &var);
  Bytes decoded;
  offset = 0;
  Expect(!msig::ReadVarBytes(var, &offset, 2, &decoded), "ReadVarBytes honours max_len");
  offset = 0;
  Expect(msig::ReadVarBytes(var, &offset, 3, &decoded) && decoded == Bytes({0x01, 0x02, 0x03}), "ReadVarBytes");
}

void TestSerialization() {
  const Bytes raw = HexDecode(kGenesisCoinbase);
  const Transaction genesis = msig::DeserializeTransaction(raw);
  Expect(genesis.version == 1 && genesis.inputs.size() == 1 && genesis.outputs.size() == 1,
         "Genesis coinbase shape");
  Expect(genesis.outputs[0].value == 5000000000LL, "Genesis output value");
  Expect(!genesis.HasWitness(), "Genesis has no witness");
  Expect(msig::SerializeTransaction(genesis) == raw, "Legacy serialization is byte-exact");
  Expect(msig::TxidToHex(msig::ComputeTxid(genesis)) == kGenesisTxid, "Genesis txid");
  Expect(msig::ComputeWtxid(genesis) == msig::ComputeTxid(genesis), "wtxid equals txid without witness");

  Bytes trailing = raw;
  trailing.push_back(0x00);
  ExpectThrow([&]() { (void)msig::DeserializeTransaction(trailing); }, "Trailing bytes are rejected");
  const Bytes truncated(raw.begin(), raw.end() - 1);
  ExpectThrow([&]() { (void)msig::DeserializeTransaction(truncated); }, "Truncated data is rejected");

  Transaction segwit = genesis;
  segwit.version = 2;
  segwit.inputs[0].witness = {Bytes{}, Bytes{0xaa, 0xbb}};
  const Bytes with_witness = msig::SerializeTransaction(segwit);
  Expect(with_witness[4] == 0x00 && with_witness[5] == 0x01, "Marker and flag follow the version");
  const Transaction reparsed = msig::DeserializeTransaction(with_witness);
  Expect(reparsed.inputs[0].witness == segwit.inputs[0].witness, "Witness stack survives decoding");
  Expect(msig::ComputeTxid(segwit) == msig::ComputeTxid(reparsed), "Txid is stable across decoding");
  Expect(msig::ComputeWtxid(segwit) != msig::ComputeTxid(segwit), "wtxid commits to the witness");
  Expect(msig::SerializeTransaction(segwit, false).size() < with_witness.size(), "Witness can be stripped");

  const Bytes txid = msig::TxidFromHex(kGenesisTxid);
  Expect(txid.front() == 0x3b && txid.back() == 0x4a, "TxidFromHex reverses into internal order");
  Expect(msig::TxidToHex(txid) == kGenesisTxid, "TxidToHex reverses back");
  ExpectThrow([]() { (void)msig::TxidFromHex("abcd"); }, "Short txid hex");
}

void TestSignatureHashes() {
  const Bytes script = WalletScript();
  Transaction tx = FundingTransaction(msig::P2wshScriptPubKey(script), 50000);
  tx.version = 2;
  msig::TxIn second = tx.inputs[0];
  second.prevout.index = 4;
  tx.inputs.push_back(second);

  const Bytes legacy0 = msig::LegacySignatureHash(tx, 0, script);
  const Bytes legacy1 = msig::LegacySignatureHash(tx, 1, script);
  const Bytes witness0 = msig::WitnessV0SignatureHash(tx, 0, script, 100000);
  Expect(legacy0.size() == 32 && witness0.size() == 32, "Digests are 32 bytes");
  Expect(legacy0 != legacy1, "Legacy digest depends on the input index");
  Expect(legacy0 != witness0, "Legacy and BIP143 digests differ");
  Expect(witness0 != msig::WitnessV0SignatureHash(tx, 0, script, 100001), "BIP143 commits to the amount");
  Expect(witness0 == msig::WitnessV0SignatureHash(tx, 0, script, 100000), "Digests are deterministic");

  Transaction signed_copy = tx;
  signed_copy.inputs[1].script_sig = Bytes{0x00, 0x01, 0x02};
  signed_copy.inputs[1].witness = {Bytes{0x01}};
  Expect(msig::LegacySignatureHash(signed_copy, 0, script) == legacy0, "Other scriptSigs are blanked");
  Expect(msig::WitnessV0SignatureHash(signed_copy, 0, script, 100000) == witness0,
         "BIP143 ignores witness data");

  Transaction other_output = tx;
  other_output.outputs[0].value += 1;
  Expect(msig::WitnessV0SignatureHash(other_output, 0, script, 100000) != witness0, "Digest commits to outputs");

  ExpectThrow([&]() { (void)msig::LegacySignatureHash(tx, 2, script); }, "Legacy index out of range");
  ExpectThrow([&]() { (void)msig::WitnessV0SignatureHash(tx, 2, script, 1); }, "Witness index out of range");
  ExpectThrow([&]() { (void)msig::WitnessV0SignatureHash(tx, 0, script, 1, 0x03); }, "Only SIGHASH_ALL");
}

void TestAddressDecoding() {
  const auto& testnet = ParamsFor(Network::kTestnet);
  const auto decoded = msig::DecodeAddress(kDestination, testnet);
  Expect(decoded.has_value() && decoded->type == msig::AddressType::kP2wpkh, "P2WPKH decodes");
  Expect(msig::AddressToScriptPubKey(kDestination, testnet) ==
             HexDecode("0014751e76e8199196d454941c45d1b3a323f1433bd6"),
         "P2WPKH scriptPubKey");

  const auto& mainnet = ParamsFor(Network::kMainnet);
  const auto p2pkh = msig::DecodeAddress("1BgGZ9tcN4rm9KBzDn7KprQz87SZ26SAMH", mainnet);
  Expect(p2pkh.has_value() && p2pkh->type == msig::AddressType::kP2pkh, "P2PKH decodes");
  Expect(msig::AddressToScriptPubKey("1BgGZ9tcN4rm9KBzDn7KprQz87SZ26SAMH", mainnet) ==
             HexDecode("76a914751e76e8199196d454941c45d1b3a323f1433bd688ac"),
         "P2PKH scriptPubKey");
  Expect(msig::EncodeP2pkhAddress(HexDecode("751e76e8199196d454941c45d1b3a323f1433bd6"), mainnet) ==
             "1BgGZ9tcN4rm9KBzDn7KprQz87SZ26SAMH",
         "P2PKH encoding");

  const auto taproot = msig::DecodeAddress("tb1pqqqsyqcyq5rqwzqfpg9scrgwpugpzysnzs23v9ccrydpk8qarc0slua5fd", testnet);
  Expect(taproot.has_value() && taproot->type == msig::AddressType::kWitnessUnknown &&
             taproot->witness_version == 1,
         "Version 1 witness address decodes");

  Expect(!msig::ValidateAddress("", testnet), "Empty address");
  Expect(!msig::ValidateAddress("not-an-address", testnet), "Garbage address");
  Expect(!msig::ValidateAddress("1BgGZ9tcN4rm9KBzDn7KprQz87SZ26SAMH", testnet), "Mainnet P2PKH on testnet");

  Expect(msig::ParseNetwork("bitcoin") == Network::kMainnet, "Network alias");
  Expect(msig::ParseNetwork("regtest") == Network::kRegtest, "Regtest");
  ExpectWalletError([]() { (void)msig::ParseNetwork("litecoin"); }, ErrorCode::kInvalidNetwork, "Unknown network");
}

void TestAssemblerOrdering() {
  const Bytes script = WalletScript();
  const TransactionAssembler assembler(script, ParamsFor(Network::kTestnet));
  const std::vector<SpendableOutput> utxos = {WitnessUtxo(script, 100000)};
  const std::vector<DesiredOutput> outputs = {{kDestination, 50000}};

  ExpectWalletError([&]() { (void)assembler.Assemble({}, {}, -1); }, ErrorCode::kEmptyInputSet,
                    "Empty inputs are reported first");
  ExpectWalletError([&]() { (void)assembler.Assemble(utxos, {}, -1); }, ErrorCode::kEmptyOutputSet,
                    "Empty outputs are reported before the fee");
  ExpectWalletError([&]() { (void)assembler.Assemble(utxos, outputs, -1); }, ErrorCode::kNegativeFee,
                    "Negative fee");
  ExpectWalletError([&]() { (void)assembler.Assemble(utxos, {{"bogus", 0}}, 1000); },
                    ErrorCode::kInvalidDestination, "Address is checked before the amount");
  ExpectWalletError([&]() { (void)assembler.Assemble(utxos, {{kDestination, 0}}, 1000); },
                    ErrorCode::kNonPositiveOutputAmount, "Zero output");
  ExpectWalletError([&]() { (void)assembler.Assemble(utxos, {{kDestination, msig::kMaxMoney + 1}}, 1000); },
                    ErrorCode::kNonPositiveOutputAmount, "Output above the money range");
  ExpectWalletError([&]() { (void)assembler.Assemble(utxos, {{kDestination, 99001}}, 1000); },
                    ErrorCode::kInsufficientFunds, "Outputs plus fee exceed inputs");

  SpendableOutput bad_txid = utxos[0];
  bad_txid.txid_hex = "xyz";
  ExpectWalletError([&]() { (void)assembler.Assemble({bad_txid}, outputs, 1000); },
                    ErrorCode::kInvalidSpendableOutput, "Malformed txid");

  const TransactionDraft exact = assembler.Assemble(utxos, {{kDestination, 99000}}, 1000);
  Expect(exact.unsigned_tx.outputs.size() == 1, "Exact spend leaves no change output");

  const TransactionDraft draft = assembler.Assemble(utxos, outputs, 1000);
  Expect(draft.required_signatures == 2, "Draft carries the threshold");
  Expect(draft.unsigned_tx.version == 2 && draft.unsigned_tx.lock_time == 0, "Version 2, locktime 0");
  Expect(draft.unsigned_tx.inputs.size() == 1 && draft.inputs.size() == 1, "One input");
  Expect(draft.unsigned_tx.inputs[0].sequence == msig::kFinalSequence, "Final sequence");
  Expect(draft.unsigned_tx.inputs[0].script_sig.empty() && draft.unsigned_tx.inputs[0].witness.empty(),
         "Unsigned input carries no signature data");
  Expect(msig::TxidToHex(draft.unsigned_tx.inputs[0].prevout.txid) == utxos[0].txid_hex, "Outpoint txid");
  Expect(draft.inputs[0].IsWitness() && draft.inputs[0].locking_script == script, "Witness input resolved");
  Expect(draft.Status() == msig::DraftStatus::kEmpty, "Fresh draft is empty");
  Expect(std::string(msig::DraftStatusName(draft.Status())) == "empty", "Status name");

  ExpectWalletError([]() { TransactionAssembler unused(Bytes{0x51}, ParamsFor(Network::kTestnet)); },
                    ErrorCode::kInvalidKeySet, "Locking script must be a multisig script");
}

void TestLegacyInputs() {
  const Bytes script = WalletScript();
  const TransactionAssembler assembler(script, ParamsFor(Network::kTestnet));
  const std::vector<DesiredOutput> outputs = {{kDestination, 50000}};
  const Transaction funding = FundingTransaction(msig::P2shScriptPubKey(script), 100000);

  const TransactionDraft draft = assembler.Assemble({LegacyUtxo(funding, 100000)}, outputs, 1000);
  Expect(!draft.inputs[0].IsWitness(), "P2SH input is legacy");

  SpendableOutput missing = LegacyUtxo(funding, 100000);
  missing.prior_transaction.clear();
  ExpectWalletError([&]() { (void)assembler.Assemble({missing}, outputs, 1000); },
                    ErrorCode::kInvalidSpendableOutput, "Legacy input without prior transaction");

  SpendableOutput wrong_txid = LegacyUtxo(funding, 100000);
  wrong_txid.txid_hex = std::string(64, 'b');
  ExpectWalletError([&]() { (void)assembler.Assemble({wrong_txid}, outputs, 1000); },
                    ErrorCode::kInvalidSpendableOutput, "Prior transaction must hash to the txid");

  SpendableOutput wrong_vout = LegacyUtxo(funding, 100000);
  wrong_vout.vout = 1;
  ExpectWalletError([&]() { (void)assembler.Assemble({wrong_vout}, outputs, 1000); },
                    ErrorCode::kInvalidSpendableOutput, "Output index must exist");

  SpendableOutput wrong_amount = LegacyUtxo(funding, 100000);
  wrong_amount.amount = 100001;
  ExpectWalletError([&]() { (void)assembler.Assemble({wrong_amount}, outputs, 1000); },
                    ErrorCode::kInvalidSpendableOutput, "Amount must match the prior output");

  SpendableOutput garbage = LegacyUtxo(funding, 100000);
  garbage.prior_transaction = Bytes{0x01, 0x02};
  ExpectWalletError([&]() { (void)assembler.Assemble({garbage}, outputs, 1000); },
                    ErrorCode::kInvalidSpendableOutput, "Prior transaction must decode");
}

std::string ReadFile(const std::string& path) {
  std::ifstream in(path);
  std::ostringstream contents;
  contents << in.rdbuf();
  return contents.str();
}

void TestForeignScriptWarning() {
  const Bytes script = WalletScript();
  const TransactionAssembler assembler(script, ParamsFor(Network::kTestnet));
  const std::vector<DesiredOutput> outputs = {{kDestination, 50000}};

  const std::string log_path = "transaction_tests_warn.log";
  std::remove(log_path.c_str());
  msig::Logger& logger = msig::Logger::Instance();
  logger.SetStderrEnabled(false);
  logger.OpenFile(log_path);

  SpendableOutput foreign = WitnessUtxo(script, 100000);
  foreign.committed_script = msig::WitnessProgramScriptPubKey(0, Bytes(32, 0x42));
  const TransactionDraft witness = assembler.Assemble({foreign}, outputs, 1000);

  const Transaction funding = FundingTransaction(msig::ScriptHashScriptPubKey(Bytes(20, 0x42)), 100000);
  const TransactionDraft legacy = assembler.Assemble({LegacyUtxo(funding, 100000)}, outputs, 1000);

  logger.CloseFile();
  logger.SetStderrEnabled(true);

  Expect(witness.inputs.size() == 1 && legacy.inputs.size() == 1, "Foreign inputs are still accepted");
  const std::string log = ReadFile(log_path);
  Expect(log.find("[WARN]") != std::string::npos, "A warning is logged");
  Expect(log.find("not this wallet's P2WSH") != std::string::npos, "Foreign witness script is reported");
  Expect(log.find("not locked to this wallet's P2SH") != std::string::npos, "Foreign P2SH output is reported");
  std::remove(log_path.c_str());
}

void TestDraftCodec() {
  const Bytes script = WalletScript();
  const TransactionAssembler assembler(script, ParamsFor(Network::kTestnet));
  const Transaction funding = FundingTransaction(msig::P2shScriptPubKey(script), 40000);
  TransactionDraft draft = assembler.Assemble({WitnessUtxo(script, 100000), LegacyUtxo(funding, 40000)},
                                              {{kDestination, 50000}, {kDestination, 60000}}, 1000);

  const msig::ECPoint signer = msig::ECPoint::GeneratorMultiply(msig::Scalar::FromUint64(2));
  draft.inputs[1].partial_signatures.push_back({signer, Bytes{0x30, 0x06, 0x02, 0x01, 0x01, 0x02, 0x01, 0x01, 0x01}});
  Expect(draft.Status() == msig::DraftStatus::kPartiallySigned, "One signature means partially signed");

  const Bytes encoded = msig::EncodeDraft(draft);
  const TransactionDraft decoded = msig::DecodeDraft(encoded);
  Expect(decoded.required_signatures == 2, "Threshold survives");
  Expect(msig::SerializeTransaction(decoded.unsigned_tx) == msig::SerializeTransaction(draft.unsigned_tx),
         "Unsigned transaction survives");
  Expect(decoded.inputs.size() == 2 && decoded.inputs[0].IsWitness() && !decoded.inputs[1].IsWitness(),
         "Input kinds survive");
  Expect(std::get<msig::WitnessInput>(decoded.inputs[0].kind).amount == 100000, "Witness amount survives");
  Expect(decoded.inputs[1].HasSignatureFrom(signer) &&
             decoded.inputs[1].partial_signatures[0].signature == draft.inputs[1].partial_signatures[0].signature,
         "Partial signature survives");
  Expect(!decoded.IsFinalized(), "No final transaction");
  Expect(msig::EncodeDraft(decoded) == encoded, "Re-encoding is stable");

  Bytes trailing = encoded;
  trailing.push_back(0x00);
  ExpectThrow([&]() { (void)msig::DecodeDraft(trailing); }, "Trailing bytes");
  ExpectThrow([&]() { (void)msig::DecodeDraft(Bytes(encoded.begin(), encoded.end() - 1)); }, "Truncated draft");
  Bytes bad_magic = encoded;
  bad_magic[0] ^= 0xff;
  ExpectThrow([&]() { (void)msig::DecodeDraft(bad_magic); }, "Magic mismatch");
  Bytes bad_version = encoded;
  bad_version[7] = 0x09;
  ExpectThrow([&]() { (void)msig::DecodeDraft(bad_version); }, "Version mismatch");
}

}  // namespace

int main() {
  try {
    TestWirePrimitives();
    TestSerialization();
    TestSignatureHashes();
    TestAddressDecoding();
    TestAssemblerOrdering();
    TestLegacyInputs();
    TestForeignScriptWarning();
    TestDraftCodec();
  } catch (const std::exception& ex) {
    std::cerr << ex.what() << '\n';
    return 1;
  }

  std::cout << "Transaction tests passed" << '\n';
  return 0;
}
