#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace msig {

enum class Network {
  kMainnet = 0,
  kTestnet = 1,
  kSignet = 2,
  kRegtest = 3,
};

struct NetworkParams {
  Network network = Network::kTestnet;
  std::string name;
  uint8_t p2pkh_version = 0;
  uint8_t p2sh_version = 0;
  std::string bech32_hrp;
  // BIP44/BIP48 coin type: 0 on mainnet, 1 on every test network.
  uint32_t coin_type = 0;
  uint32_t xpub_version = 0;
  uint32_t xprv_version = 0;
};

const NetworkParams& ParamsFor(Network network);

// Accepts "mainnet"/"main"/"bitcoin", "testnet"/"test", "signet", "regtest".
// Throws ConfigurationError(kInvalidNetwork) for anything else.
Network ParseNetwork(std::string_view name);

}  // namespace msig
