#include "msig/address/network.hpp"

#include <string>

#include "msig/common/errors.hpp"

namespace msig {
namespace {

NetworkParams MakeParams(Network network,
                         const char* name,
                         uint8_t p2pkh_version,
                         uint8_t p2sh_version,
                         const char* hrp,
                         uint32_t coin_type,
                         uint32_t xpub_version,
                         uint32_t xprv_version) {
  NetworkParams params;
  params.network = network;
  params.name = name;
  params.p2pkh_version = p2pkh_version;
  params.p2sh_version = p2sh_version;
  params.bech32_hrp = hrp;
  params.coin_type = coin_type;
  params.xpub_version = xpub_version;
  params.xprv_version = xprv_version;
  return params;
}

}  // namespace

const NetworkParams& ParamsFor(Network network) {
  static const NetworkParams kMainnet =
      MakeParams(Network::kMainnet, "mainnet", 0x00, 0x05, "bc", 0, 0x0488B21E, 0x0488ADE4);
  static const NetworkParams kTestnet =
      MakeParams(Network::kTestnet, "testnet", 0x6F, 0xC4, "tb", 1, 0x043587CF, 0x04358394);
  static const NetworkParams kSignet =
      MakeParams(Network::kSignet, "signet", 0x6F, 0xC4, "tb", 1, 0x043587CF, 0x04358394);
  static const NetworkParams kRegtest =
      MakeParams(Network::kRegtest, "regtest", 0x6F, 0xC4, "bcrt", 1, 0x043587CF, 0x04358394);

  switch (network) {
    case Network::kMainnet:
      return kMainnet;
    case Network::kTestnet:
      return kTestnet;
    case Network::kSignet:
      return kSignet;
    case Network::kRegtest:
      return kRegtest;
  }
  throw ConfigurationError(ErrorCode::kInvalidNetwork, "Unknown network");
}

Network ParseNetwork(std::string_view name) {
  if (name == "mainnet" || name == "main" || name == "bitcoin") {
    return Network::kMainnet;
  }
  if (name == "testnet" || name == "test") {
    return Network::kTestnet;
  }
  if (name == "signet") {
    return Network::kSignet;
  }
  if (name == "regtest") {
    return Network::kRegtest;
  }
  throw ConfigurationError(ErrorCode::kInvalidNetwork, "Unknown network: " + std::string(name));
}

}  // namespace msig
