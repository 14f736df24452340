#include "tx/instruction.hpp"

#include "chain/pda.hpp"
#include "chain/program_ids.hpp"
#include "codec/borsh.hpp"

namespace x1memo::tx {

Instruction BuildMemoInstruction(std::string_view memo, const std::vector<chain::Pubkey>& signers) {
  Instruction instruction;
  instruction.program_id = chain::MemoProgramId();
  instruction.accounts.reserve(signers.size());
  for (const auto& signer : signers) {
    instruction.accounts.push_back(AccountMeta::ReadOnly(signer, /*signer=*/true));
  }
  instruction.data.assign(memo.begin(), memo.end());
  return instruction;
}

Instruction BuildSetComputeUnitLimit(std::uint32_t units) {
  Instruction instruction;
  instruction.program_id = chain::ComputeBudgetProgramId();
  codec::WriteU8(&instruction.data, kSetComputeUnitLimitTag);
  codec::WriteU32(&instruction.data, units);
  return instruction;
}

Instruction BuildSetComputeUnitPrice(std::uint64_t micro_lamports) {
  Instruction instruction;
  instruction.program_id = chain::ComputeBudgetProgramId();
  codec::WriteU8(&instruction.data, kSetComputeUnitPriceTag);
  codec::WriteU64(&instruction.data, micro_lamports);
  return instruction;
}

namespace {

Instruction CreateAssociatedTokenAccount(const chain::Pubkey& payer, const chain::Pubkey& owner,
                                         const chain::Pubkey& mint,
                                         const chain::Pubkey& token_program, std::uint8_t tag) {
  Instruction instruction;
  instruction.program_id = chain::AssociatedTokenProgramId();
  instruction.accounts = {
      AccountMeta::Writable(payer, /*signer=*/true),
      AccountMeta::Writable(chain::AssociatedTokenAddress(owner, mint, token_program)),
      AccountMeta::ReadOnly(owner),
      AccountMeta::ReadOnly(mint),
      AccountMeta::ReadOnly(chain::SystemProgramId()),
      AccountMeta::ReadOnly(token_program),
  };
  instruction.data = {tag};
  return instruction;
}

}  // namespace

Instruction BuildCreateAssociatedTokenAccountIdempotent(const chain::Pubkey& payer,
                                                        const chain::Pubkey& owner,
                                                        const chain::Pubkey& mint,
                                                        const chain::Pubkey& token_program) {
  return CreateAssociatedTokenAccount(payer, owner, mint, token_program, kCreateIdempotentTag);
}

Instruction BuildCreateAssociatedTokenAccount(const chain::Pubkey& payer,
                                              const chain::Pubkey& owner,
                                              const chain::Pubkey& mint,
                                              const chain::Pubkey& token_program) {
  return CreateAssociatedTokenAccount(payer, owner, mint, token_program, kCreateTag);
}

Instruction BuildSystemTransfer(const chain::Pubkey& from, const chain::Pubkey& to,
                                std::uint64_t lamports) {
  Instruction instruction;
  instruction.program_id = chain::SystemProgramId();
  instruction.accounts = {
      AccountMeta::Writable(from, /*signer=*/true),
      AccountMeta::Writable(to),
  };
  codec::WriteU32(&instruction.data, kSystemTransferTag);
  codec::WriteU64(&instruction.data, lamports);
  return instruction;
}

Instruction BuildTransferChecked(const chain::Pubkey& token_program, const chain::Pubkey& source,
                                 const chain::Pubkey& mint, const chain::Pubkey& destination,
                                 const chain::Pubkey& owner, std::uint64_t amount,
                                 std::uint8_t decimals) {
  Instruction instruction;
  instruction.program_id = token_program;
  instruction.accounts = {
      AccountMeta::Writable(source),
      AccountMeta::ReadOnly(mint),
      AccountMeta::Writable(destination),
      AccountMeta::ReadOnly(owner, /*signer=*/true),
  };
  codec::WriteU8(&instruction.data, kTransferCheckedTag);
  codec::WriteU64(&instruction.data, amount);
  codec::WriteU8(&instruction.data, decimals);
  return instruction;
}

bool IsComputeBudgetInstruction(const Instruction& instruction) {
  return instruction.program_id == chain::ComputeBudgetProgramId();
}

}  // namespace x1memo::tx
