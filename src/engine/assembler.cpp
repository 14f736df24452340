#include "engine/assembler.hpp"

#include "engine/signer.hpp"
#include "rpc/error.hpp"

namespace x1memo::engine {

std::vector<tx::Instruction> AssembleInstructions(
    const std::optional<tx::Instruction>& memo,
    const std::vector<tx::Instruction>& program_instructions, std::uint32_t unit_limit,
    const std::optional<std::uint64_t>& unit_price, bool memo_after_unit_limit) {
  std::vector<tx::Instruction> instructions;
  instructions.reserve(program_instructions.size() + 3);
  if (memo_after_unit_limit) {
    instructions.push_back(tx::BuildSetComputeUnitLimit(unit_limit));
  }
  if (memo) {
    instructions.push_back(*memo);
  }
  instructions.insert(instructions.end(), program_instructions.begin(),
                      program_instructions.end());
  if (!memo_after_unit_limit) {
    instructions.push_back(tx::BuildSetComputeUnitLimit(unit_limit));
  }
  if (unit_price) {
    instructions.push_back(tx::BuildSetComputeUnitPrice(*unit_price));
  }
  return instructions;
}

tx::Transaction AssembleTransaction(const std::vector<tx::Instruction>& instructions,
                                    const chain::Pubkey& fee_payer,
                                    const tx::Blockhash& recent_blockhash) {
  tx::Message message;
  std::string error;
  if (!tx::CompileMessage(instructions, fee_payer, recent_blockhash, &message, &error)) {
    rpc::ThrowInvalidParameter(error);
  }
  auto transaction = tx::MakeUnsignedTransaction(std::move(message));
  std::vector<std::uint8_t> bytes;
  tx::SerializeTransaction(transaction, &bytes);
  if (bytes.size() > tx::kMaxTransactionSize) {
    rpc::ThrowInvalidParameter("transaction is " + std::to_string(bytes.size()) +
                               " bytes (max: " + std::to_string(tx::kMaxTransactionSize) + ")");
  }
  return transaction;
}

void SignTransaction(tx::Transaction* transaction, const TransactionSigner& signer) {
  const auto signature = signer.SignMessage(tx::MessageBytes(transaction->message));
  std::string error;
  if (!tx::ApplySignature(transaction, signer.PublicKey(), signature, &error)) {
    throw rpc::RpcError(rpc::ErrorKind::kOther, error);
  }
}

}  // namespace x1memo::engine
