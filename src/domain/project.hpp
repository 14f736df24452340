#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "accounts/parser.hpp"
#include "chain/pubkey.hpp"
#include "codec/records.hpp"
#include "config/network.hpp"
#include "engine/pipeline.hpp"

namespace x1memo::domain {

constexpr std::uint64_t kProjectMinCreateBurn = 42'069'000'000;
constexpr std::uint64_t kProjectMinUpdateBurn = 42'069'000'000;
constexpr std::uint64_t kProjectMinBurn = 420'000'000;

chain::Pubkey ProjectCounterAddress(const chain::Pubkey& project_program);
chain::Pubkey ProjectAddress(std::uint64_t project_id, const chain::Pubkey& project_program);
chain::Pubkey BurnLeaderboardAddress(const chain::Pubkey& project_program);

struct ProjectStatistics {
  std::uint64_t total_projects{0};
  std::uint64_t valid_projects{0};
  std::uint64_t total_memos{0};
  std::uint64_t total_burned{0};
  std::vector<accounts::ProjectInfo> projects;
};

struct ProjectBurnMessage {
  std::string signature;
  std::string burner;
  std::string message;
  std::int64_t timestamp{0};
  std::uint64_t slot{0};
  std::uint64_t burn_amount{0};
};

struct ProjectBurnMessages {
  std::uint64_t project_id{0};
  // Newest first.
  std::vector<ProjectBurnMessage> messages;
  bool has_more{false};
};

class ProjectService {
 public:
  ProjectService(std::shared_ptr<const engine::TransactionPipeline> pipeline,
                 config::NetworkConfig network);

  engine::OperationDescriptor DescribeCreate(const chain::Pubkey& user,
                                             const codec::ProjectCreationData& record,
                                             std::uint64_t burn_amount) const;
  engine::OperationDescriptor DescribeUpdate(const chain::Pubkey& user,
                                             const codec::ProjectUpdateData& record,
                                             std::uint64_t burn_amount) const;
  engine::OperationDescriptor DescribeBurn(const chain::Pubkey& user,
                                           const codec::ProjectBurnData& record,
                                           std::uint64_t burn_amount) const;

  // Assigns the next id from the global counter before building.
  engine::BuiltTransaction BuildCreate(const chain::Pubkey& user,
                                       codec::ProjectCreationData record,
                                       std::uint64_t burn_amount) const;
  engine::BuiltTransaction BuildUpdate(const chain::Pubkey& user,
                                       const codec::ProjectUpdateData& record,
                                       std::uint64_t burn_amount) const;
  engine::BuiltTransaction BuildBurn(const chain::Pubkey& user,
                                     const codec::ProjectBurnData& record,
                                     std::uint64_t burn_amount) const;

  std::uint64_t TotalProjects() const;
  std::optional<accounts::ProjectInfo> Fetch(std::uint64_t project_id) const;
  bool Exists(std::uint64_t project_id) const;
  // Existing projects with ids in [start_id, end_id); lookups that fail are
  // skipped. Throws RpcError(kInvalidParameter) for an empty range.
  std::vector<accounts::ProjectInfo> FetchRange(std::uint64_t start_id,
                                                std::uint64_t end_id) const;
  ProjectStatistics FetchAll() const;
  // Throws RpcError(kOther) when the leaderboard was never initialized.
  accounts::BurnLeaderboard FetchLeaderboard() const;
  std::optional<std::uint32_t> BurnRank(std::uint64_t project_id) const;
  ProjectBurnMessages BurnMessages(std::uint64_t project_id, std::size_t limit,
                                   const std::optional<std::string>& before = std::nullopt) const;

 private:
  std::vector<tx::AccountMeta> BurnAccounts(const chain::Pubkey& user,
                                            std::uint64_t project_id) const;

  std::shared_ptr<const engine::TransactionPipeline> pipeline_;
  config::NetworkConfig network_;
};

}  // namespace x1memo::domain
