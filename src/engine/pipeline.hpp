#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "chain/pubkey.hpp"
#include "codec/memo.hpp"
#include "codec/records.hpp"
#include "config/settings.hpp"
#include "engine/compute_budget.hpp"
#include "engine/signer.hpp"
#include "rpc/client.hpp"
#include "rpc/error.hpp"
#include "tx/instruction.hpp"
#include "tx/transaction.hpp"

namespace x1memo::engine {

// Everything that distinguishes one domain operation from another. Domain
// services fill it in; the pipeline never inspects the program instructions.
struct OperationDescriptor {
  std::string name;
  // Base64 memo text placed at instruction index 0; nullopt for operations
  // without a memo.
  std::optional<std::string> memo_text;
  std::vector<tx::Instruction> program_instructions;
  ComputePolicy policy;
  // The chat program reads the memo at index 1, behind the unit limit.
  bool memo_after_unit_limit{false};
};

struct BuiltTransaction {
  tx::Transaction transaction;
  ComputeDecision compute;
};

// Wraps |payload| in the burn envelope and enforces |range| on the text.
// Throws RpcError(kInvalidParameter).
std::string EncodePayloadMemo(std::span<const std::uint8_t> payload, std::uint64_t burn_amount,
                              const codec::MemoLengthRange& range = codec::kDefaultMemoRange);

// Validates |record| before anything is serialized, then encodes it as
// memo text. Throws RpcError(kInvalidParameter) naming the offending field.
template <typename Record>
std::string EncodeRecordMemo(const Record& record, std::uint64_t burn_amount,
                             const codec::MemoLengthRange& range = codec::kDefaultMemoRange) {
  std::string error;
  if (!record.Validate(&error)) {
    rpc::ThrowInvalidParameter(error);
  }
  const auto payload = codec::SerializeRecord(record);
  return EncodePayloadMemo(payload, burn_amount, range);
}

// Memo text length |record| would produce, computed without encoding it.
template <typename Record>
std::size_t EstimateRecordMemoSize(const Record& record) {
  return codec::EncodedMemoSize(codec::SerializeRecord(record).size());
}

// Simulate-then-finalize. Both passes fetch their own blockhash and use the
// same instruction order; only the unit limit differs. Settings are read
// once at construction and never written.
class TransactionPipeline {
 public:
  TransactionPipeline(std::shared_ptr<const rpc::RpcClient> client,
                      std::optional<config::UserSettings> settings = std::nullopt);

  const rpc::RpcClient& client() const noexcept { return *client_; }
  const std::optional<config::UserSettings>& settings() const noexcept { return settings_; }

  // Simulation pass. A simulation that reports an execution error throws
  // RpcError(kTransactionFailed) carrying the program's message when the
  // logs contain one.
  ComputeDecision Estimate(const OperationDescriptor& operation,
                           const chain::Pubkey& fee_payer) const;

  // Estimate() followed by the final unsigned transaction.
  BuiltTransaction Build(const OperationDescriptor& operation,
                         const chain::Pubkey& fee_payer) const;

  // Returns the signature reported by the node.
  std::string Submit(const tx::Transaction& signed_transaction) const;

  // Build, sign with |signer| as fee payer, submit.
  std::string Execute(const OperationDescriptor& operation, const TransactionSigner& signer) const;

 private:
  tx::Blockhash FetchBlockhash() const;
  std::optional<tx::Instruction> MemoInstruction(const OperationDescriptor& operation,
                                                 const chain::Pubkey& fee_payer) const;
  std::optional<std::uint64_t> UnitPrice() const;

  std::shared_ptr<const rpc::RpcClient> client_;
  std::optional<config::UserSettings> settings_;
};

}  // namespace x1memo::engine
