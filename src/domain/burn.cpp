#include "domain/burn.hpp"

#include <algorithm>
#include <stdexcept>

#include "chain/pda.hpp"
#include "chain/program_ids.hpp"
#include "domain/common.hpp"
#include "util/log.hpp"

namespace x1memo::domain {

BurnService::BurnService(std::shared_ptr<const engine::TransactionPipeline> pipeline,
                         config::NetworkConfig network)
    : pipeline_(std::move(pipeline)), network_(std::move(network)) {
  if (!pipeline_) {
    throw std::invalid_argument("BurnService requires a pipeline");
  }
}

engine::OperationDescriptor BurnService::DescribeBurn(const chain::Pubkey& user,
                                                      std::uint64_t amount,
                                                      std::span<const std::uint8_t> message) const {
  RequireBurnAmount(amount, kMinBurnPerTx, true);
  if (amount > kMaxBurnPerTx) {
    rpc::ThrowInvalidParameter("burn amount " + std::to_string(amount) + " exceeds the maximum of " +
                               std::to_string(kMaxBurnPerTx / kUnitsPerToken) + " tokens");
  }
  const auto& programs = network_.programs;

  engine::OperationDescriptor op;
  op.name = "process_burn";
  op.memo_text = engine::EncodePayloadMemo(message, amount);
  op.policy = engine::BurnComputePolicy();

  tx::Instruction instruction;
  instruction.program_id = programs.burn_program;
  instruction.data = InstructionData("process_burn", {amount});
  instruction.accounts = {
      tx::AccountMeta::Writable(user, true),
      tx::AccountMeta::Writable(programs.token_mint),
      tx::AccountMeta::Writable(
          chain::AssociatedTokenAddress(user, programs.token_mint, programs.token_program)),
      tx::AccountMeta::Writable(UserBurnStatsAddress(user, programs.burn_program)),
      tx::AccountMeta::ReadOnly(programs.token_program),
      tx::AccountMeta::ReadOnly(chain::SysvarInstructionsId()),
  };
  op.program_instructions.push_back(std::move(instruction));
  return op;
}

engine::OperationDescriptor BurnService::DescribeInitializeStats(const chain::Pubkey& user) const {
  const auto& programs = network_.programs;
  engine::OperationDescriptor op;
  op.name = "initialize_user_global_burn_stats";
  op.policy = engine::BurnComputePolicy();

  tx::Instruction instruction;
  instruction.program_id = programs.burn_program;
  instruction.data = InstructionData("initialize_user_global_burn_stats");
  instruction.accounts = {
      tx::AccountMeta::Writable(user, true),
      tx::AccountMeta::Writable(UserBurnStatsAddress(user, programs.burn_program)),
      tx::AccountMeta::ReadOnly(chain::SystemProgramId()),
  };
  op.program_instructions.push_back(std::move(instruction));
  return op;
}

engine::BuiltTransaction BurnService::BuildBurn(const chain::Pubkey& user, std::uint64_t amount,
                                                std::span<const std::uint8_t> message) const {
  util::LogInfo("burn", "building burn of " + std::to_string(amount / kUnitsPerToken) +
                            " tokens for " + user.ToBase58());
  return pipeline_->Build(DescribeBurn(user, amount, message), user);
}

engine::BuiltTransaction BurnService::BuildInitializeStats(const chain::Pubkey& user) const {
  return pipeline_->Build(DescribeInitializeStats(user), user);
}

std::optional<accounts::UserGlobalBurnStats> BurnService::FetchUserStats(
    const chain::Pubkey& user) const {
  const auto& program = network_.programs.burn_program;
  const auto account = FetchOwnedAccount(pipeline_->client(), UserBurnStatsAddress(user, program),
                                         program, "burn stats");
  if (!account) {
    return std::nullopt;
  }
  return ParseAccountOrThrow<accounts::UserGlobalBurnStats>(accounts::ParseUserGlobalBurnStats,
                                                            account->data, "burn stats");
}

std::vector<BurnerEntry> BurnService::TopBurners(std::size_t limit) const {
  const auto accounts_list = pipeline_->client().GetProgramAccounts(
      network_.programs.burn_program, accounts::kUserGlobalBurnStatsSize);

  std::vector<BurnerEntry> burners;
  for (const auto& entry : accounts_list) {
    accounts::UserGlobalBurnStats stats;
    accounts::ParseError error;
    if (!accounts::ParseUserGlobalBurnStats(entry.account.data, &stats, &error)) {
      util::LogDebug("burn", "skipping " + entry.pubkey.ToBase58() + ": " + error.message);
      continue;
    }
    if (stats.total_burned == 0) {
      continue;
    }
    burners.push_back(BurnerEntry{stats.user, stats.total_burned, stats.burn_count});
  }
  std::stable_sort(burners.begin(), burners.end(), [](const BurnerEntry& a, const BurnerEntry& b) {
    return a.total_burned > b.total_burned;
  });
  if (burners.size() > limit) {
    burners.resize(limit);
  }
  util::LogInfo("burn", "found " + std::to_string(burners.size()) + " burners (limit " +
                            std::to_string(limit) + ")");
  return burners;
}

}  // namespace x1memo::domain
