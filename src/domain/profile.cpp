#include "domain/profile.hpp"

#include <stdexcept>

#include "chain/pda.hpp"
#include "chain/program_ids.hpp"
#include "codec/borsh.hpp"
#include "domain/common.hpp"
#include "util/log.hpp"

namespace x1memo::domain {

chain::Pubkey ProfileAddress(const chain::Pubkey& user, const chain::Pubkey& profile_program) {
  return chain::FindProgramAddress({chain::SeedOf("profile"), chain::SeedOf(user)}, profile_program)
      .address;
}

ProfileService::ProfileService(std::shared_ptr<const engine::TransactionPipeline> pipeline,
                               config::NetworkConfig network)
    : pipeline_(std::move(pipeline)), network_(std::move(network)) {
  if (!pipeline_) {
    throw std::invalid_argument("ProfileService requires a pipeline");
  }
}

engine::OperationDescriptor ProfileService::DescribeCreate(
    const chain::Pubkey& user, const codec::ProfileCreationData& record,
    std::uint64_t burn_amount) const {
  RequireBurnAmount(burn_amount, kProfileMinBurn, false);
  RequireRecordAddress("user_pubkey", record.user_pubkey, user);
  const auto& programs = network_.programs;

  engine::OperationDescriptor op;
  op.name = "create_profile";
  op.memo_text = engine::EncodeRecordMemo(record, burn_amount);
  op.policy = engine::ContentComputePolicy();

  tx::Instruction instruction;
  instruction.program_id = programs.profile_program;
  instruction.data = InstructionData("create_profile", {burn_amount});
  instruction.accounts = {
      tx::AccountMeta::Writable(user, true),
      tx::AccountMeta::Writable(ProfileAddress(user, programs.profile_program)),
      tx::AccountMeta::Writable(programs.token_mint),
      tx::AccountMeta::Writable(
          chain::AssociatedTokenAddress(user, programs.token_mint, programs.token_program)),
      tx::AccountMeta::ReadOnly(programs.token_program),
      tx::AccountMeta::ReadOnly(programs.burn_program),
      tx::AccountMeta::ReadOnly(chain::SystemProgramId()),
      tx::AccountMeta::ReadOnly(chain::SysvarInstructionsId()),
  };
  op.program_instructions.push_back(std::move(instruction));
  return op;
}

engine::OperationDescriptor ProfileService::DescribeUpdate(const chain::Pubkey& user,
                                                           const codec::ProfileUpdateData& record,
                                                           std::uint64_t burn_amount) const {
  RequireBurnAmount(burn_amount, kProfileMinBurn, false);
  RequireRecordAddress("user_pubkey", record.user_pubkey, user);
  const auto& programs = network_.programs;

  engine::OperationDescriptor op;
  op.name = "update_profile";
  op.memo_text = engine::EncodeRecordMemo(record, burn_amount);
  op.policy = engine::ContentComputePolicy();

  tx::Instruction instruction;
  instruction.program_id = programs.profile_program;
  instruction.data = InstructionData("update_profile", {burn_amount});
  codec::WriteOptionString(&instruction.data, record.username);
  codec::WriteOptionString(&instruction.data, record.image);
  codec::WriteOptionOptionString(&instruction.data, record.about_me);
  instruction.accounts = {
      tx::AccountMeta::Writable(user, true),
      tx::AccountMeta::Writable(programs.token_mint),
      tx::AccountMeta::Writable(
          chain::AssociatedTokenAddress(user, programs.token_mint, programs.token_program)),
      tx::AccountMeta::Writable(ProfileAddress(user, programs.profile_program)),
      tx::AccountMeta::ReadOnly(programs.token_program),
      tx::AccountMeta::ReadOnly(chain::SysvarInstructionsId()),
      tx::AccountMeta::ReadOnly(programs.burn_program),
  };
  op.program_instructions.push_back(std::move(instruction));
  return op;
}

engine::OperationDescriptor ProfileService::DescribeDelete(const chain::Pubkey& user) const {
  const auto& programs = network_.programs;
  engine::OperationDescriptor op;
  op.name = "delete_profile";
  op.policy = engine::ContentComputePolicy();

  tx::Instruction instruction;
  instruction.program_id = programs.profile_program;
  instruction.data = InstructionData("delete_profile");
  instruction.accounts = {
      tx::AccountMeta::Writable(user, true),
      tx::AccountMeta::Writable(ProfileAddress(user, programs.profile_program)),
  };
  op.program_instructions.push_back(std::move(instruction));
  return op;
}

engine::BuiltTransaction ProfileService::BuildCreate(const chain::Pubkey& user,
                                                     const codec::ProfileCreationData& record,
                                                     std::uint64_t burn_amount) const {
  return pipeline_->Build(DescribeCreate(user, record, burn_amount), user);
}

engine::BuiltTransaction ProfileService::BuildUpdate(const chain::Pubkey& user,
                                                     const codec::ProfileUpdateData& record,
                                                     std::uint64_t burn_amount) const {
  return pipeline_->Build(DescribeUpdate(user, record, burn_amount), user);
}

engine::BuiltTransaction ProfileService::BuildDelete(const chain::Pubkey& user) const {
  return pipeline_->Build(DescribeDelete(user), user);
}

std::optional<accounts::UserProfile> ProfileService::Fetch(const chain::Pubkey& user) const {
  const auto& program = network_.programs.profile_program;
  const auto account =
      FetchOwnedAccount(pipeline_->client(), ProfileAddress(user, program), program, "profile");
  if (!account) {
    return std::nullopt;
  }
  return ParseAccountOrThrow<accounts::UserProfile>(accounts::ParseUserProfile, account->data,
                                                    "profile");
}

std::vector<std::pair<chain::Pubkey, std::optional<accounts::UserProfile>>>
ProfileService::FetchBatch(const std::vector<chain::Pubkey>& users) const {
  std::vector<std::pair<chain::Pubkey, std::optional<accounts::UserProfile>>> results;
  results.reserve(users.size());
  for (const auto& user : users) {
    std::optional<accounts::UserProfile> profile;
    try {
      profile = Fetch(user);
    } catch (const rpc::RpcError& ex) {
      util::LogWarn("profile", "profile lookup for " + user.ToBase58() + " failed: " + ex.what());
    }
    results.emplace_back(user, std::move(profile));
  }
  return results;
}

}  // namespace x1memo::domain
