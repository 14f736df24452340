#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "accounts/parser.hpp"
#include "chain/pubkey.hpp"
#include "config/network.hpp"
#include "engine/pipeline.hpp"

namespace x1memo::domain {

constexpr std::uint64_t kMinBurnPerTx = 1'000'000;
constexpr std::uint64_t kMaxBurnPerTx = 1'000'000'000'000'000'000;

struct BurnerEntry {
  chain::Pubkey user;
  std::uint64_t total_burned{0};
  std::uint64_t burn_count{0};
};

class BurnService {
 public:
  BurnService(std::shared_ptr<const engine::TransactionPipeline> pipeline,
              config::NetworkConfig network);

  // |message| is carried verbatim as the burn memo payload.
  engine::OperationDescriptor DescribeBurn(const chain::Pubkey& user, std::uint64_t amount,
                                           std::span<const std::uint8_t> message) const;
  engine::OperationDescriptor DescribeInitializeStats(const chain::Pubkey& user) const;

  engine::BuiltTransaction BuildBurn(const chain::Pubkey& user, std::uint64_t amount,
                                     std::span<const std::uint8_t> message) const;
  engine::BuiltTransaction BuildInitializeStats(const chain::Pubkey& user) const;

  // nullopt when the user never burned.
  std::optional<accounts::UserGlobalBurnStats> FetchUserStats(const chain::Pubkey& user) const;
  // Users with a non-zero total, largest first, at most |limit| entries.
  std::vector<BurnerEntry> TopBurners(std::size_t limit) const;

 private:
  std::shared_ptr<const engine::TransactionPipeline> pipeline_;
  config::NetworkConfig network_;
};

}  // namespace x1memo::domain
