#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "msig/common/log.hpp"
#include "msig/script/script_builder.hpp"
#include "msig/tx/transaction.hpp"
#include "msig/wallet/draft.hpp"
#include "msig/wallet/key_derivation.hpp"
#include "msig/wallet/multisig_wallet.hpp"

namespace {

using msig::Bytes;
using msig::MultisigWallet;
using msig::SpendableOutput;
using msig::TransactionDraft;

constexpr char kDestination[] = "tb1qw508d6qejxtdg4y5r3zarvary0c5xw7kxpjzsx";
constexpr int64_t kInputAmount = 100000;
constexpr int64_t kFee = 1000;

struct BenchArgs {
  uint32_t m = 2;
  uint32_t n = 3;
  uint32_t inputs = 2;
  uint32_t keygen_iters = 1;
  uint32_t sign_iters = 10;
  bool legacy = false;
};

struct PhaseMetric {
  double total_ms = 0.0;
  uint64_t total_bytes = 0;
  uint64_t samples = 0;
};

struct SpendMetrics {
  PhaseMetric assemble;
  PhaseMetric sign;
  PhaseMetric verify;
  PhaseMetric finalize;
};

void Expect(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

uint32_t ParsePositiveU32(const char* value, const char* flag) {
  try {
    const unsigned long parsed = std::stoul(value);
    if (parsed == 0 || parsed > UINT32_MAX) {
      throw std::out_of_range("out of range");
    }
    return static_cast<uint32_t>(parsed);
  } catch (const std::exception&) {
    throw std::invalid_argument(std::string("invalid value for ") + flag + ": " + value);
  }
}

BenchArgs ParseArgs(int argc, char** argv) {
  BenchArgs args;
  for (int i = 1; i < argc; ++i) {
    const std::string flag = argv[i];
    if (flag == "--m" && i + 1 < argc) {
      args.m = ParsePositiveU32(argv[++i], "--m");
    } else if (flag == "--n" && i + 1 < argc) {
      args.n = ParsePositiveU32(argv[++i], "--n");
    } else if (flag == "--inputs" && i + 1 < argc) {
      args.inputs = ParsePositiveU32(argv[++i], "--inputs");
    } else if (flag == "--keygen-iters" && i + 1 < argc) {
      args.keygen_iters = ParsePositiveU32(argv[++i], "--keygen-iters");
    } else if (flag == "--sign-iters" && i + 1 < argc) {
      args.sign_iters = ParsePositiveU32(argv[++i], "--sign-iters");
    } else if (flag == "--legacy") {
      args.legacy = true;
    } else if (flag == "--help") {
      std::cout << "Usage: msig_bench [--m M] [--n N] [--inputs I] [--keygen-iters K] [--sign-iters S] [--legacy]\n";
      std::exit(0);
    } else {
      throw std::invalid_argument("unknown argument: " + flag);
    }
  }

  if (args.n > msig::kMaxMultisigKeys) {
    throw std::invalid_argument("--n must be <= " + std::to_string(msig::kMaxMultisigKeys));
  }
  if (args.m > args.n) {
    throw std::invalid_argument("--m must be <= n");
  }
  return args;
}

void RecordMetric(PhaseMetric* metric,
                  std::chrono::steady_clock::time_point start,
                  std::chrono::steady_clock::time_point end,
                  uint64_t bytes) {
  metric->total_ms += std::chrono::duration<double, std::milli>(end - start).count();
  metric->total_bytes += bytes;
  metric->samples += 1;
}

SpendableOutput MakeUtxo(const MultisigWallet& wallet, bool legacy, uint32_t iteration, uint32_t index) {
  SpendableOutput utxo;
  utxo.amount = kInputAmount;
  if (!legacy) {
    Bytes txid(32, 0);
    txid[0] = static_cast<uint8_t>(index & 0xFF);
    txid[1] = static_cast<uint8_t>((iteration >> 8) & 0xFF);
    txid[2] = static_cast<uint8_t>(iteration & 0xFF);
    utxo.txid_hex = msig::TxidToHex(txid);
    utxo.vout = index;
    utxo.committed_script = msig::P2wshScriptPubKey(wallet.GetRedeemScript());
    return utxo;
  }

  msig::Transaction funding;
  msig::TxIn in;
  in.prevout.txid = Bytes(32, static_cast<uint8_t>(index & 0xFF));
  in.prevout.index = iteration;
  funding.inputs.push_back(in);
  funding.outputs.push_back(msig::TxOut{kInputAmount, msig::P2shScriptPubKey(wallet.GetRedeemScript())});
  utxo.prior_transaction = msig::SerializeTransaction(funding);
  utxo.txid_hex = msig::TxidToHex(msig::ComputeTxid(funding));
  utxo.vout = 0;
  utxo.committed_script = funding.outputs[0].script_pubkey;
  return utxo;
}

void RunSpendRound(const BenchArgs& args, MultisigWallet* wallet, uint32_t iteration, SpendMetrics* metrics) {
  std::vector<SpendableOutput> utxos;
  utxos.reserve(args.inputs);
  for (uint32_t i = 0; i < args.inputs; ++i) {
    utxos.push_back(MakeUtxo(*wallet, args.legacy, iteration, i));
  }
  const int64_t send = kInputAmount * static_cast<int64_t>(args.inputs) - kFee;

  TransactionDraft draft;
  {
    const auto start = std::chrono::steady_clock::now();
    draft = wallet->CreateTransaction(utxos, {{kDestination, send}}, kFee);
    const auto end = std::chrono::steady_clock::now();
    RecordMetric(&metrics->assemble, start, end, msig::EncodeDraft(draft).size());
  }

  {
    const auto start = std::chrono::steady_clock::now();
    for (uint32_t input = 0; input < args.inputs; ++input) {
      wallet->ResetSigners();
      for (uint32_t s = 0; s < args.m; ++s) {
        Expect(wallet->SignTransaction(&draft, wallet->GetSigner(s), input), "signing step was refused");
      }
    }
    const auto end = std::chrono::steady_clock::now();
    RecordMetric(&metrics->sign, start, end, msig::EncodeDraft(draft).size());
  }

  {
    const auto start = std::chrono::steady_clock::now();
    Expect(wallet->VerifyTransaction(draft), "signed draft did not verify");
    const auto end = std::chrono::steady_clock::now();
    RecordMetric(&metrics->verify, start, end, 0);
  }

  {
    const auto start = std::chrono::steady_clock::now();
    const std::string hex = wallet->FinalizeTransaction(&draft);
    const auto end = std::chrono::steady_clock::now();
    RecordMetric(&metrics->finalize, start, end, hex.size() / 2);
  }
  wallet->ResetSigners();
}

void PrintMetricLine(const std::string& name, const PhaseMetric& metric) {
  const double avg_ms = metric.total_ms / static_cast<double>(metric.samples);
  const double avg_bytes = static_cast<double>(metric.total_bytes) / static_cast<double>(metric.samples);
  std::cout << std::left << std::setw(14) << name << "  "
            << std::right << std::setw(12) << std::fixed << std::setprecision(3) << avg_ms << "  "
            << std::setw(14) << std::fixed << std::setprecision(1) << avg_bytes << '\n';
}

void PrintHeader(const char* title) {
  std::cout << "\n[" << title << "]\n";
  std::cout << std::left << std::setw(14) << "Phase"
            << "  " << std::right << std::setw(12) << "Avg ms"
            << "  " << std::setw(14) << "Avg bytes\n";
}

}  // namespace

int main(int argc, char** argv) {
  try {
    const BenchArgs args = ParseArgs(argc, argv);
    msig::Logger::Instance().SetLevel(msig::LogLevel::kWarn);
    std::cout << "wallet benchmark config: m=" << args.m
              << ", n=" << args.n
              << ", inputs=" << args.inputs
              << ", keygen_iters=" << args.keygen_iters
              << ", sign_iters=" << args.sign_iters
              << ", spend=" << (args.legacy ? "p2sh" : "p2wsh") << '\n';

    PhaseMetric keygen;
    for (uint32_t i = 0; i + 1 < args.keygen_iters; ++i) {
      const auto start = std::chrono::steady_clock::now();
      MultisigWallet discarded = MultisigWallet::Generate(args.m, args.n);
      const auto end = std::chrono::steady_clock::now();
      RecordMetric(&keygen, start, end, discarded.GetRedeemScript().size());
    }
    const auto start = std::chrono::steady_clock::now();
    MultisigWallet wallet = MultisigWallet::Generate(args.m, args.n);
    const auto end = std::chrono::steady_clock::now();
    RecordMetric(&keygen, start, end, wallet.GetRedeemScript().size());

    PhaseMetric recover;
    const std::vector<std::string> phrases = wallet.GetMnemonics();
    for (uint32_t i = 0; i < args.keygen_iters; ++i) {
      for (uint32_t index = 0; index < args.n; ++index) {
        const auto recover_start = std::chrono::steady_clock::now();
        msig::SignerKey restored = wallet.RestoreFromMnemonic(phrases[index], index);
        const auto recover_end = std::chrono::steady_clock::now();
        Expect(restored.public_point == wallet.GetSigner(index).public_point, "restored key does not match");
        RecordMetric(&recover, recover_start, recover_end, restored.backup_phrase.size());
        restored.Wipe();
      }
    }

    SpendMetrics spend;
    for (uint32_t i = 0; i < args.sign_iters; ++i) {
      RunSpendRound(args, &wallet, i, &spend);
    }

    PrintHeader("Keygen");
    PrintMetricLine("generate", keygen);
    PrintMetricLine("recover", recover);
    PrintHeader("Spend");
    PrintMetricLine("assemble", spend.assemble);
    PrintMetricLine("sign", spend.sign);
    PrintMetricLine("verify", spend.verify);
    PrintMetricLine("finalize", spend.finalize);
  } catch (const std::exception& ex) {
    std::cerr << "benchmark failed: " << ex.what() << '\n';
    return 1;
  }
  return 0;
}
