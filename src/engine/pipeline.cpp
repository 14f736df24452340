#include "engine/pipeline.hpp"

#include <algorithm>
#include <sstream>

#include "engine/assembler.hpp"
#include "util/log.hpp"

namespace x1memo::engine {

std::string EncodePayloadMemo(std::span<const std::uint8_t> payload, std::uint64_t burn_amount,
                              const codec::MemoLengthRange& range) {
  std::string error;
  const std::size_t expected = codec::EncodedMemoSize(payload.size());
  if (!codec::CheckMemoLength(expected, range, &error)) {
    rpc::ThrowInvalidParameter(error);
  }
  codec::BurnMemo memo;
  memo.burn_amount = burn_amount;
  memo.payload.assign(payload.begin(), payload.end());
  return codec::EncodeMemoText(memo);
}

TransactionPipeline::TransactionPipeline(std::shared_ptr<const rpc::RpcClient> client,
                                         std::optional<config::UserSettings> settings)
    : client_(std::move(client)), settings_(std::move(settings)) {
  if (!client_) {
    throw std::invalid_argument("TransactionPipeline requires an RPC client");
  }
}

tx::Blockhash TransactionPipeline::FetchBlockhash() const {
  const auto latest = client_->GetLatestBlockhash();
  tx::Blockhash blockhash{};
  std::string error;
  if (!tx::ParseBlockhash(latest.blockhash, &blockhash, &error)) {
    throw rpc::RpcError(rpc::ErrorKind::kOther, error);
  }
  return blockhash;
}

std::optional<tx::Instruction> TransactionPipeline::MemoInstruction(
    const OperationDescriptor& operation, const chain::Pubkey& fee_payer) const {
  if (!operation.memo_text) {
    return std::nullopt;
  }
  return tx::BuildMemoInstruction(*operation.memo_text, {fee_payer});
}

std::optional<std::uint64_t> TransactionPipeline::UnitPrice() const {
  if (!settings_) {
    return std::nullopt;
  }
  return settings_->CuPriceMicroLamports();
}

ComputeDecision TransactionPipeline::Estimate(const OperationDescriptor& operation,
                                              const chain::Pubkey& fee_payer) const {
  ComputeDecision decision;
  decision.unit_price = UnitPrice();
  decision.multiplier = settings_ ? settings_->CuBufferMultiplier() : operation.policy.multiplier;

  const auto memo = MemoInstruction(operation, fee_payer);
  const auto instructions =
      AssembleInstructions(memo, operation.program_instructions, kSimulationComputeUnits,
                           decision.unit_price, operation.memo_after_unit_limit);
  const auto simulation_tx = AssembleTransaction(instructions, fee_payer, FetchBlockhash());

  util::LogDebug("pipeline", "simulating " + operation.name);
  const auto result = client_->SimulateTransaction(tx::EncodeTransactionBase64(simulation_tx));
  if (result.err) {
    auto detail = rpc::ExtractLogDetail(result.logs);
    util::LogWarn("pipeline", operation.name + " simulation failed: " + *result.err);
    throw rpc::RpcError(rpc::ErrorKind::kTransactionFailed,
                        operation.name + " simulation failed: " + detail.value_or(*result.err));
  }

  if (result.units_consumed) {
    decision.simulated_units = *result.units_consumed;
    util::LogInfo("pipeline", operation.name + " simulation consumed " +
                                  std::to_string(decision.simulated_units) + " compute units");
  } else {
    const std::size_t memo_length = operation.memo_text ? operation.memo_text->size() : 0;
    decision.simulated_units = operation.policy.FallbackUnits(memo_length);
    decision.used_fallback = true;
    util::LogWarn("pipeline", operation.name + " simulation reported no units consumed; using " +
                                  std::to_string(decision.simulated_units) +
                                  " for a memo of " + std::to_string(memo_length) + " bytes");
  }

  decision.unit_limit = static_cast<std::uint32_t>(std::min<std::uint64_t>(
      FinalComputeUnits(decision.simulated_units, decision.multiplier, operation.policy.floor),
      operation.policy.ceiling));
  std::ostringstream oss;
  oss << operation.name << " compute unit limit " << decision.unit_limit << " (x"
      << decision.multiplier << ", floor " << operation.policy.floor << ")";
  if (decision.unit_price) {
    oss << ", price " << *decision.unit_price << " micro-lamports";
  }
  util::LogInfo("pipeline", oss.str());
  return decision;
}

BuiltTransaction TransactionPipeline::Build(const OperationDescriptor& operation,
                                            const chain::Pubkey& fee_payer) const {
  BuiltTransaction built;
  built.compute = Estimate(operation, fee_payer);
  const auto memo = MemoInstruction(operation, fee_payer);
  const auto instructions =
      AssembleInstructions(memo, operation.program_instructions, built.compute.unit_limit,
                           built.compute.unit_price, operation.memo_after_unit_limit);
  built.transaction = AssembleTransaction(instructions, fee_payer, FetchBlockhash());
  util::LogInfo("pipeline", operation.name + " transaction built, ready for signing");
  return built;
}

std::string TransactionPipeline::Submit(const tx::Transaction& signed_transaction) const {
  const auto signature = client_->SendTransaction(tx::EncodeTransactionBase64(signed_transaction));
  util::LogInfo("pipeline", "submitted transaction " + signature);
  return signature;
}

std::string TransactionPipeline::Execute(const OperationDescriptor& operation,
                                         const TransactionSigner& signer) const {
  auto built = Build(operation, signer.PublicKey());
  SignTransaction(&built.transaction, signer);
  return Submit(built.transaction);
}

}  // namespace x1memo::engine
