#include "config/network.hpp"

#include "chain/program_ids.hpp"

namespace x1memo::config {

namespace {

struct ProgramLiterals {
  std::string_view mint;
  std::string_view burn;
  std::string_view chat;
  std::string_view profile;
  std::string_view project;
  std::string_view blog;
  std::string_view forum;
  std::string_view token_mint;
};

constexpr ProgramLiterals kTestnetPrograms{
    "A31a17bhgQyRQygeZa1SybytjbCdjMpu6oPr9M3iQWzy", "FEjJ9KKJETocmaStfsFteFrktPchDLAVNTMeTvndoxaP",
    "54ky4LNnRsbYioDSBKNrc5hG8HoDyZ6yhf8TuncxTBRF", "BwQTxuShrwJR15U6Utdfmfr4kZ18VT6FA1fcp58sT8US",
    "ENVapgjzzMjbRhLJ279yNsSgaQtDYYVgWq98j54yYnyx", "HPvqPUneCLwb8YYoYTrWmy6o7viRKsnLTgxwkg7CCpfB",
    "9kwS5nSidmoHq84TyNzqFrtD29odp4sdRxm97tCbdpbS", "HLCoc7wNDavNMfWWw2Bwd7U7A24cesuhBSNkxZgvZm1"};

// Prod-staging runs the mainnet programs against the testnet cluster.
constexpr ProgramLiterals kMainnetPrograms{
    "8iq6zqaEVcfaym2u8t939PAN5jmfPVc6Z333RuxKTTZX", "2sb3gz5Cmr2g1ia5si2rmCZqPACxgaZXEmiS5k6Htcvh",
    "Hni4qE8GGW5uwBWzUEkpPBDRwXvKCWhM96teieAReRyd", "2BY8vPpQRFFwAqK3HqU5qL3qsGMH3VnX9Gv9bud3vzH8",
    "6Vavot6ybhWBG3rjNXnLfNRPVTz7Garf6E4EZk3byp3a", "3EKdp88FgyPC41bxRDzFAtCDUMV2g9SVt5UiytE8wdzM",
    "6gzhG5BveTkJfTi466toX4qmN3BtU9qp1Grnk61GvmXD", "memoX1sJsBY6od7CfQ58XooRALwnocAZen4L7mW1ick"};

ProgramIds ResolvePrograms(const ProgramLiterals& literals) {
  ProgramIds ids;
  ids.mint_program = chain::PubkeyFromLiteral(literals.mint);
  ids.burn_program = chain::PubkeyFromLiteral(literals.burn);
  ids.chat_program = chain::PubkeyFromLiteral(literals.chat);
  ids.profile_program = chain::PubkeyFromLiteral(literals.profile);
  ids.project_program = chain::PubkeyFromLiteral(literals.project);
  ids.blog_program = chain::PubkeyFromLiteral(literals.blog);
  ids.forum_program = chain::PubkeyFromLiteral(literals.forum);
  ids.token_mint = chain::PubkeyFromLiteral(literals.token_mint);
  ids.token_program = chain::Token2022ProgramId();
  return ids;
}

NetworkConfig BuildConfig(NetworkType type, std::string id, std::string display_name,
                          std::vector<std::string> endpoints, const ProgramLiterals& programs,
                          bool production) {
  NetworkConfig cfg;
  cfg.type = type;
  cfg.network_id = std::move(id);
  cfg.display_name = std::move(display_name);
  cfg.rpc_endpoints = std::move(endpoints);
  cfg.programs = ResolvePrograms(programs);
  cfg.production = production;
  return cfg;
}

}  // namespace

const NetworkConfig& ConfigFor(NetworkType type) {
  static const NetworkConfig testnet =
      BuildConfig(NetworkType::kTestnet, "testnet", "Testnet", {"https://rpc.testnet.x1.xyz"},
                  kTestnetPrograms, false);
  static const NetworkConfig prod_staging =
      BuildConfig(NetworkType::kProdStaging, "prod-staging", "Production Staging",
                  {"https://rpc.testnet.x1.xyz"}, kMainnetPrograms, true);
  static const NetworkConfig mainnet =
      BuildConfig(NetworkType::kMainnet, "mainnet", "Mainnet", {"https://rpc.mainnet.x1.xyz"},
                  kMainnetPrograms, true);
  switch (type) {
    case NetworkType::kTestnet:
      return testnet;
    case NetworkType::kProdStaging:
      return prod_staging;
    case NetworkType::kMainnet:
      return mainnet;
  }
  return testnet;
}

std::optional<NetworkType> NetworkFromString(std::string_view name) {
  if (name == "testnet" || name == "test") return NetworkType::kTestnet;
  if (name == "prod-staging" || name == "staging") return NetworkType::kProdStaging;
  if (name == "mainnet" || name == "main") return NetworkType::kMainnet;
  return std::nullopt;
}

std::string_view NetworkName(NetworkType type) {
  switch (type) {
    case NetworkType::kTestnet:
      return "testnet";
    case NetworkType::kProdStaging:
      return "prod-staging";
    case NetworkType::kMainnet:
      return "mainnet";
  }
  return "testnet";
}

}  // namespace x1memo::config
