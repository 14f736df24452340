#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "chain/pubkey.hpp"

namespace x1memo::config {

enum class NetworkType {
  kTestnet,
  kProdStaging,
  kMainnet,
};

struct ProgramIds {
  chain::Pubkey mint_program;
  chain::Pubkey burn_program;
  chain::Pubkey chat_program;
  chain::Pubkey profile_program;
  chain::Pubkey project_program;
  chain::Pubkey blog_program;
  chain::Pubkey forum_program;
  chain::Pubkey token_mint;
  chain::Pubkey token_program;
};

struct NetworkConfig {
  NetworkType type{NetworkType::kTestnet};
  std::string network_id{"testnet"};
  std::string display_name{"Testnet"};
  // Candidate JSON-RPC endpoints; one is picked per client.
  std::vector<std::string> rpc_endpoints;
  ProgramIds programs;
  // Production deployments move real assets.
  bool production{false};
};

// Immutable preset for |type|. Callers copy it into the client they build.
const NetworkConfig& ConfigFor(NetworkType type);
std::optional<NetworkType> NetworkFromString(std::string_view name);
std::string_view NetworkName(NetworkType type);

}  // namespace x1memo::config
