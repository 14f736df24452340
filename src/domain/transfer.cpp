#include "domain/transfer.hpp"

#include <stdexcept>

#include "chain/pda.hpp"
#include "rpc/error.hpp"
#include "tx/instruction.hpp"
#include "util/log.hpp"

namespace x1memo::domain {

TransferService::TransferService(std::shared_ptr<const engine::TransactionPipeline> pipeline,
                                 config::NetworkConfig network)
    : pipeline_(std::move(pipeline)), network_(std::move(network)) {
  if (!pipeline_) {
    throw std::invalid_argument("TransferService requires a pipeline");
  }
}

engine::OperationDescriptor TransferService::DescribeNativeTransfer(const chain::Pubkey& from,
                                                                    const chain::Pubkey& to,
                                                                    std::uint64_t lamports) const {
  if (lamports == 0) {
    rpc::ThrowInvalidParameter("transfer amount must be greater than zero");
  }
  engine::OperationDescriptor op;
  op.name = "native_transfer";
  op.policy = engine::TransferComputePolicy();
  op.program_instructions.push_back(tx::BuildSystemTransfer(from, to, lamports));
  return op;
}

engine::OperationDescriptor TransferService::DescribeTokenTransfer(const chain::Pubkey& from,
                                                                   const chain::Pubkey& to,
                                                                   std::uint64_t amount,
                                                                   bool create_destination) const {
  if (amount == 0) {
    rpc::ThrowInvalidParameter("transfer amount must be greater than zero");
  }
  const auto& programs = network_.programs;
  engine::OperationDescriptor op;
  op.name = "token_transfer";
  op.policy = engine::TransferComputePolicy();
  if (create_destination) {
    op.program_instructions.push_back(tx::BuildCreateAssociatedTokenAccount(
        from, to, programs.token_mint, programs.token_program));
  }
  op.program_instructions.push_back(tx::BuildTransferChecked(
      programs.token_program,
      chain::AssociatedTokenAddress(from, programs.token_mint, programs.token_program),
      programs.token_mint,
      chain::AssociatedTokenAddress(to, programs.token_mint, programs.token_program), from,
      amount, kTokenDecimals));
  return op;
}

engine::BuiltTransaction TransferService::BuildNativeTransfer(const chain::Pubkey& from,
                                                              const std::string& to_address,
                                                              std::uint64_t lamports) const {
  const auto to = rpc::RequirePubkey(to_address);
  util::LogInfo("transfer", "native transfer of " + std::to_string(lamports) + " lamports to " +
                                to.ToBase58());
  return pipeline_->Build(DescribeNativeTransfer(from, to, lamports), from);
}

engine::BuiltTransaction TransferService::BuildTokenTransfer(const chain::Pubkey& from,
                                                             const std::string& to_address,
                                                             std::uint64_t amount) const {
  const auto to = rpc::RequirePubkey(to_address);
  const auto& programs = network_.programs;
  const auto destination =
      chain::AssociatedTokenAddress(to, programs.token_mint, programs.token_program);
  const bool missing = !pipeline_->client().GetAccountInfo(destination).has_value();
  if (missing) {
    util::LogInfo("transfer", "destination token account " + destination.ToBase58() +
                                  " will be created");
  }
  return pipeline_->Build(DescribeTokenTransfer(from, to, amount, missing), from);
}

}  // namespace x1memo::domain
