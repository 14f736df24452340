#include "domain/project.hpp"

#include <stdexcept>
#include <variant>

#include "chain/pda.hpp"
#include "chain/program_ids.hpp"
#include "domain/common.hpp"
#include "domain/history.hpp"
#include "util/log.hpp"

namespace x1memo::domain {

chain::Pubkey ProjectCounterAddress(const chain::Pubkey& project_program) {
  return chain::FindProgramAddress({chain::SeedOf("global_counter")}, project_program).address;
}

chain::Pubkey ProjectAddress(std::uint64_t project_id, const chain::Pubkey& project_program) {
  const auto id = IdSeed(project_id);
  return chain::FindProgramAddress({chain::SeedOf("project"), id}, project_program).address;
}

chain::Pubkey BurnLeaderboardAddress(const chain::Pubkey& project_program) {
  return chain::FindProgramAddress({chain::SeedOf("burn_leaderboard")}, project_program).address;
}

ProjectService::ProjectService(std::shared_ptr<const engine::TransactionPipeline> pipeline,
                               config::NetworkConfig network)
    : pipeline_(std::move(pipeline)), network_(std::move(network)) {
  if (!pipeline_) {
    throw std::invalid_argument("ProjectService requires a pipeline");
  }
}

std::vector<tx::AccountMeta> ProjectService::BurnAccounts(const chain::Pubkey& user,
                                                          std::uint64_t project_id) const {
  const auto& programs = network_.programs;
  return {
      tx::AccountMeta::Writable(user, true),
      tx::AccountMeta::Writable(ProjectAddress(project_id, programs.project_program)),
      tx::AccountMeta::Writable(BurnLeaderboardAddress(programs.project_program)),
      tx::AccountMeta::Writable(programs.token_mint),
      tx::AccountMeta::Writable(
          chain::AssociatedTokenAddress(user, programs.token_mint, programs.token_program)),
      tx::AccountMeta::Writable(UserBurnStatsAddress(user, programs.burn_program)),
      tx::AccountMeta::ReadOnly(programs.token_program),
      tx::AccountMeta::ReadOnly(programs.burn_program),
      tx::AccountMeta::ReadOnly(chain::SysvarInstructionsId()),
  };
}

engine::OperationDescriptor ProjectService::DescribeCreate(
    const chain::Pubkey& user, const codec::ProjectCreationData& record,
    std::uint64_t burn_amount) const {
  RequireBurnAmount(burn_amount, kProjectMinCreateBurn, false);
  const auto& programs = network_.programs;

  engine::OperationDescriptor op;
  op.name = "create_project";
  op.memo_text = engine::EncodeRecordMemo(record, burn_amount);
  op.policy = engine::ContentComputePolicy();

  tx::Instruction instruction;
  instruction.program_id = programs.project_program;
  instruction.data = InstructionData("create_project", {record.project_id, burn_amount});
  instruction.accounts = {
      tx::AccountMeta::Writable(user, true),
      tx::AccountMeta::Writable(ProjectCounterAddress(programs.project_program)),
      tx::AccountMeta::Writable(ProjectAddress(record.project_id, programs.project_program)),
      tx::AccountMeta::Writable(BurnLeaderboardAddress(programs.project_program)),
      tx::AccountMeta::Writable(programs.token_mint),
      tx::AccountMeta::Writable(
          chain::AssociatedTokenAddress(user, programs.token_mint, programs.token_program)),
      tx::AccountMeta::Writable(UserBurnStatsAddress(user, programs.burn_program)),
      tx::AccountMeta::ReadOnly(programs.token_program),
      tx::AccountMeta::ReadOnly(programs.burn_program),
      tx::AccountMeta::ReadOnly(chain::SystemProgramId()),
      tx::AccountMeta::ReadOnly(chain::SysvarInstructionsId()),
  };
  op.program_instructions.push_back(std::move(instruction));
  return op;
}

engine::OperationDescriptor ProjectService::DescribeUpdate(
    const chain::Pubkey& user, const codec::ProjectUpdateData& record,
    std::uint64_t burn_amount) const {
  RequireBurnAmount(burn_amount, kProjectMinUpdateBurn, false);
  engine::OperationDescriptor op;
  op.name = "update_project";
  op.memo_text = engine::EncodeRecordMemo(record, burn_amount);
  op.policy = engine::ContentComputePolicy();

  tx::Instruction instruction;
  instruction.program_id = network_.programs.project_program;
  instruction.data = InstructionData("update_project", {record.project_id, burn_amount});
  instruction.accounts = BurnAccounts(user, record.project_id);
  op.program_instructions.push_back(std::move(instruction));
  return op;
}

engine::OperationDescriptor ProjectService::DescribeBurn(const chain::Pubkey& user,
                                                         const codec::ProjectBurnData& record,
                                                         std::uint64_t burn_amount) const {
  RequireBurnAmount(burn_amount, kProjectMinBurn, false);
  RequireRecordAddress("burner", record.burner, user);
  engine::OperationDescriptor op;
  op.name = "burn_for_project";
  op.memo_text = engine::EncodeRecordMemo(record, burn_amount);
  op.policy = engine::ContentComputePolicy();

  tx::Instruction instruction;
  instruction.program_id = network_.programs.project_program;
  instruction.data = InstructionData("burn_for_project", {record.project_id, burn_amount});
  instruction.accounts = BurnAccounts(user, record.project_id);
  op.program_instructions.push_back(std::move(instruction));
  return op;
}

engine::BuiltTransaction ProjectService::BuildCreate(const chain::Pubkey& user,
                                                     codec::ProjectCreationData record,
                                                     std::uint64_t burn_amount) const {
  record.project_id = TotalProjects();
  util::LogInfo("project", "creating project " + std::to_string(record.project_id));
  return pipeline_->Build(DescribeCreate(user, record, burn_amount), user);
}

engine::BuiltTransaction ProjectService::BuildUpdate(const chain::Pubkey& user,
                                                     const codec::ProjectUpdateData& record,
                                                     std::uint64_t burn_amount) const {
  return pipeline_->Build(DescribeUpdate(user, record, burn_amount), user);
}

engine::BuiltTransaction ProjectService::BuildBurn(const chain::Pubkey& user,
                                                   const codec::ProjectBurnData& record,
                                                   std::uint64_t burn_amount) const {
  return pipeline_->Build(DescribeBurn(user, record, burn_amount), user);
}

std::uint64_t ProjectService::TotalProjects() const {
  const auto& program = network_.programs.project_program;
  return FetchGlobalCounter(pipeline_->client(), ProjectCounterAddress(program), program,
                            "project counter");
}

std::optional<accounts::ProjectInfo> ProjectService::Fetch(std::uint64_t project_id) const {
  const auto& program = network_.programs.project_program;
  const auto account = FetchOwnedAccount(pipeline_->client(), ProjectAddress(project_id, program),
                                         program, "project");
  if (!account) {
    return std::nullopt;
  }
  auto project = ParseAccountOrThrow<accounts::ProjectInfo>(accounts::ParseProjectInfo,
                                                            account->data, "project");
  RequireRecordId("project_id", project.project_id, project_id);
  return project;
}

bool ProjectService::Exists(std::uint64_t project_id) const {
  return Fetch(project_id).has_value();
}

std::vector<accounts::ProjectInfo> ProjectService::FetchRange(std::uint64_t start_id,
                                                              std::uint64_t end_id) const {
  if (start_id >= end_id) {
    rpc::ThrowInvalidParameter("invalid range: start_id " + std::to_string(start_id) +
                               " >= end_id " + std::to_string(end_id));
  }
  std::vector<accounts::ProjectInfo> projects;
  for (std::uint64_t id = start_id; id < end_id; ++id) {
    try {
      if (auto project = Fetch(id)) {
        projects.push_back(std::move(*project));
      }
    } catch (const rpc::RpcError& ex) {
      util::LogDebug("project", "failed to fetch project " + std::to_string(id) + ": " + ex.what());
    }
  }
  util::LogInfo("project", "fetched " + std::to_string(projects.size()) + " projects from range " +
                               std::to_string(start_id) + "-" + std::to_string(end_id));
  return projects;
}

ProjectStatistics ProjectService::FetchAll() const {
  auto bulk = FetchBulk<accounts::ProjectInfo>(
      TotalProjects(), "project",
      [this](std::uint64_t id) {
        auto project = Fetch(id);
        if (!project) {
          throw rpc::RpcError(rpc::ErrorKind::kOther, "project account missing");
        }
        return std::move(*project);
      },
      [](const accounts::ProjectInfo& project) { return project.project_id; });

  ProjectStatistics stats;
  stats.total_projects = bulk.total;
  stats.valid_projects = bulk.valid;
  for (const auto& project : bulk.records) {
    stats.total_memos += project.memo_count;
    stats.total_burned += project.burned_amount;
  }
  stats.projects = std::move(bulk.records);
  return stats;
}

accounts::BurnLeaderboard ProjectService::FetchLeaderboard() const {
  const auto& program = network_.programs.project_program;
  const auto account = FetchOwnedAccount(pipeline_->client(), BurnLeaderboardAddress(program),
                                         program, "burn leaderboard");
  if (!account) {
    throw rpc::RpcError(rpc::ErrorKind::kOther, "project burn leaderboard not initialized");
  }
  return ParseAccountOrThrow<accounts::BurnLeaderboard>(accounts::ParseBurnLeaderboard,
                                                        account->data, "burn leaderboard");
}

std::optional<std::uint32_t> ProjectService::BurnRank(std::uint64_t project_id) const {
  return FetchLeaderboard().RankOf(project_id);
}

ProjectBurnMessages ProjectService::BurnMessages(std::uint64_t project_id, std::size_t limit,
                                                 const std::optional<std::string>& before) const {
  const auto history = ReplayMemoHistory(
      pipeline_->client(), ProjectAddress(project_id, network_.programs.project_program), limit,
      before);

  ProjectBurnMessages result;
  result.project_id = project_id;
  result.has_more = history.has_more;
  for (const auto& entry : history.entries) {
    const auto* burn = std::get_if<codec::ProjectBurnData>(&entry.memo.record);
    if (!burn || burn->project_id != project_id) {
      continue;
    }
    ProjectBurnMessage message;
    message.signature = entry.signature;
    message.burner = burn->burner;
    message.message = burn->message;
    message.timestamp = entry.block_time;
    message.slot = entry.slot;
    message.burn_amount = entry.memo.burn_amount;
    result.messages.push_back(std::move(message));
  }
  return result;
}

}  // namespace x1memo::domain
