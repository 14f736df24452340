#include "domain/mint.hpp"

#include <cstdio>
#include <limits>
#include <stdexcept>

#include "chain/pda.hpp"
#include "chain/program_ids.hpp"
#include "codec/memo.hpp"
#include "domain/common.hpp"
#include "util/log.hpp"

namespace x1memo::domain {

const std::vector<SupplyTier>& SupplyTiers() {
  static const std::vector<SupplyTier> kTiers = {
      {0, 100'000'000'000'000, 1.0, "0-100M"},
      {100'000'000'000'000, 1'000'000'000'000'000, 0.1, "100M-1B"},
      {1'000'000'000'000'000, 10'000'000'000'000'000, 0.01, "1B-10B"},
      {10'000'000'000'000'000, 100'000'000'000'000'000, 0.001, "10B-100B"},
      {100'000'000'000'000'000, 1'000'000'000'000'000'000, 0.0001, "100B-1T"},
      {1'000'000'000'000'000'000, std::numeric_limits<std::uint64_t>::max(), 0.000001, "1T+"},
  };
  return kTiers;
}

const SupplyTier& SupplyTierFor(std::uint64_t supply) {
  const auto& tiers = SupplyTiers();
  for (const auto& tier : tiers) {
    if (supply >= tier.min && supply < tier.max) {
      return tier;
    }
  }
  return tiers.back();
}

double MintReward(std::uint64_t supply) { return SupplyTierFor(supply).reward; }

std::string FormatMintReward(double reward) {
  char buffer[64];
  std::snprintf(buffer, sizeof(buffer), "+%.6f MEMO", reward);
  return buffer;
}

MintService::MintService(std::shared_ptr<const engine::TransactionPipeline> pipeline,
                         config::NetworkConfig network)
    : pipeline_(std::move(pipeline)), network_(std::move(network)) {
  if (!pipeline_) {
    throw std::invalid_argument("MintService requires a pipeline");
  }
}

engine::OperationDescriptor MintService::DescribeMint(const chain::Pubkey& user,
                                                      std::string_view memo,
                                                      bool create_token_account) const {
  std::string error;
  if (!codec::CheckMemoLength(memo.size(), codec::kDefaultMemoRange, &error)) {
    rpc::ThrowInvalidParameter(error);
  }
  const auto& programs = network_.programs;
  const auto token_account =
      chain::AssociatedTokenAddress(user, programs.token_mint, programs.token_program);

  engine::OperationDescriptor op;
  op.name = "process_mint";
  op.memo_text = std::string(memo);
  op.policy = engine::ContentComputePolicy();
  if (create_token_account) {
    op.program_instructions.push_back(tx::BuildCreateAssociatedTokenAccountIdempotent(
        user, user, programs.token_mint, programs.token_program));
  }

  tx::Instruction instruction;
  instruction.program_id = programs.mint_program;
  instruction.data = InstructionData("process_mint");
  instruction.accounts = {
      tx::AccountMeta::Writable(user, true),
      tx::AccountMeta::Writable(programs.token_mint),
      tx::AccountMeta::ReadOnly(MintAuthorityAddress(programs.mint_program)),
      tx::AccountMeta::Writable(token_account),
      tx::AccountMeta::ReadOnly(programs.token_program),
      tx::AccountMeta::ReadOnly(chain::SysvarInstructionsId()),
  };
  op.program_instructions.push_back(std::move(instruction));
  return op;
}

engine::BuiltTransaction MintService::BuildMint(const chain::Pubkey& user,
                                                std::string_view memo) const {
  const auto& programs = network_.programs;
  const auto token_account =
      chain::AssociatedTokenAddress(user, programs.token_mint, programs.token_program);
  const bool missing = !pipeline_->client().GetAccountInfo(token_account).has_value();
  if (missing) {
    util::LogInfo("mint", "token account " + token_account.ToBase58() + " will be created");
  }
  return pipeline_->Build(DescribeMint(user, memo, missing), user);
}

std::uint64_t MintService::TokenSupply() const {
  return pipeline_->client().GetTokenSupply(network_.programs.token_mint).amount;
}

}  // namespace x1memo::domain
