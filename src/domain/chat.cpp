#include "domain/chat.hpp"

#include <algorithm>
#include <stdexcept>

#include "chain/pda.hpp"
#include "chain/program_ids.hpp"
#include "codec/memo.hpp"
#include "domain/common.hpp"
#include "domain/history.hpp"
#include "util/log.hpp"

namespace x1memo::domain {

chain::Pubkey ChatCounterAddress(const chain::Pubkey& chat_program) {
  return chain::FindProgramAddress({chain::SeedOf("global_counter")}, chat_program).address;
}

chain::Pubkey ChatGroupAddress(std::uint64_t group_id, const chain::Pubkey& chat_program) {
  const auto id = IdSeed(group_id);
  return chain::FindProgramAddress({chain::SeedOf("chat_group"), id}, chat_program).address;
}

ChatService::ChatService(std::shared_ptr<const engine::TransactionPipeline> pipeline,
                         config::NetworkConfig network)
    : pipeline_(std::move(pipeline)), network_(std::move(network)) {
  if (!pipeline_) {
    throw std::invalid_argument("ChatService requires a pipeline");
  }
}

engine::OperationDescriptor ChatService::DescribeSendMessage(const chain::Pubkey& sender,
                                                             const codec::ChatMessageData& record,
                                                             bool create_token_account) const {
  std::string error;
  if (!record.Validate(&error)) {
    rpc::ThrowInvalidParameter(error);
  }
  RequireRecordAddress("sender", record.sender, sender);
  const auto memo = codec::EncodeChatMemoText(record);
  if (!codec::CheckMemoLength(memo.size(), codec::kDefaultMemoRange, &error)) {
    rpc::ThrowInvalidParameter(error);
  }
  const auto& programs = network_.programs;

  engine::OperationDescriptor op;
  op.name = "send_memo_to_group";
  op.memo_text = memo;
  op.policy = engine::ChatComputePolicy();
  op.memo_after_unit_limit = true;
  if (create_token_account) {
    op.program_instructions.push_back(tx::BuildCreateAssociatedTokenAccountIdempotent(
        sender, sender, programs.token_mint, programs.token_program));
  }

  tx::Instruction instruction;
  instruction.program_id = programs.chat_program;
  instruction.data = InstructionData("send_memo_to_group", {record.group_id});
  instruction.accounts = {
      tx::AccountMeta::Writable(sender, true),
      tx::AccountMeta::Writable(ChatGroupAddress(record.group_id, programs.chat_program)),
      tx::AccountMeta::Writable(programs.token_mint),
      tx::AccountMeta::Writable(MintAuthorityAddress(programs.mint_program)),
      tx::AccountMeta::Writable(
          chain::AssociatedTokenAddress(sender, programs.token_mint, programs.token_program)),
      tx::AccountMeta::ReadOnly(programs.token_program),
      tx::AccountMeta::ReadOnly(programs.mint_program),
      tx::AccountMeta::ReadOnly(chain::SysvarInstructionsId()),
  };
  op.program_instructions.push_back(std::move(instruction));
  return op;
}

engine::BuiltTransaction ChatService::BuildSendMessage(
    const chain::Pubkey& sender, const codec::ChatMessageData& record) const {
  const auto& programs = network_.programs;
  const auto token_account =
      chain::AssociatedTokenAddress(sender, programs.token_mint, programs.token_program);
  const bool missing = !pipeline_->client().GetAccountInfo(token_account).has_value();
  if (missing) {
    util::LogInfo("chat", "token account " + token_account.ToBase58() + " will be created");
  }
  util::LogInfo("chat", "sending " + std::to_string(record.message.size()) +
                            " byte message to group " + std::to_string(record.group_id));
  return pipeline_->Build(DescribeSendMessage(sender, record, missing), sender);
}

std::uint64_t ChatService::TotalGroups() const {
  const auto& program = network_.programs.chat_program;
  return FetchGlobalCounter(pipeline_->client(), ChatCounterAddress(program), program,
                            "chat counter");
}

std::optional<accounts::ChatGroupInfo> ChatService::Fetch(std::uint64_t group_id) const {
  const auto& program = network_.programs.chat_program;
  const auto account = FetchOwnedAccount(pipeline_->client(), ChatGroupAddress(group_id, program),
                                         program, "chat group");
  if (!account) {
    return std::nullopt;
  }
  auto group = ParseAccountOrThrow<accounts::ChatGroupInfo>(accounts::ParseChatGroupInfo,
                                                            account->data, "chat group");
  RequireRecordId("group_id", group.group_id, group_id);
  return group;
}

bool ChatService::Exists(std::uint64_t group_id) const { return Fetch(group_id).has_value(); }

ChatStatistics ChatService::FetchAll() const {
  auto bulk = FetchBulk<accounts::ChatGroupInfo>(
      TotalGroups(), "chat group",
      [this](std::uint64_t id) {
        auto group = Fetch(id);
        if (!group) {
          throw rpc::RpcError(rpc::ErrorKind::kOther, "chat group account missing");
        }
        return std::move(*group);
      },
      [](const accounts::ChatGroupInfo& group) { return group.group_id; });

  ChatStatistics stats;
  stats.total_groups = bulk.total;
  stats.valid_groups = bulk.valid;
  for (const auto& group : bulk.records) {
    stats.total_memos += group.memo_count;
    stats.total_burned += group.burned_amount;
  }
  stats.groups = std::move(bulk.records);
  return stats;
}

std::vector<accounts::ChatGroupInfo> ChatService::FetchRange(std::uint64_t start_id,
                                                             std::uint64_t end_id) const {
  if (start_id >= end_id) {
    rpc::ThrowInvalidParameter("invalid range: start_id " + std::to_string(start_id) +
                               " >= end_id " + std::to_string(end_id));
  }
  std::vector<accounts::ChatGroupInfo> groups;
  for (std::uint64_t id = start_id; id < end_id; ++id) {
    try {
      if (auto group = Fetch(id)) {
        groups.push_back(std::move(*group));
      }
    } catch (const rpc::RpcError& ex) {
      util::LogWarn("chat", "failed to fetch chat group " + std::to_string(id) + ": " + ex.what());
    }
  }
  return groups;
}

ChatMessages ChatService::Messages(std::uint64_t group_id, std::size_t limit,
                                   const std::optional<std::string>& before) const {
  if (limit == 0 || limit > kMaxHistoryLimit) {
    rpc::ThrowInvalidParameter("limit must be between 1 and " + std::to_string(kMaxHistoryLimit));
  }
  const auto signatures = pipeline_->client().GetSignaturesForAddress(
      ChatGroupAddress(group_id, network_.programs.chat_program), limit, before);

  ChatMessages result;
  result.group_id = group_id;
  for (const auto& info : signatures) {
    if (info.failed || !info.memo || info.signature.empty()) {
      continue;
    }
    codec::ChatMessageData record;
    std::string error;
    if (!codec::DecodeChatMemo(rpc::StripMemoLengthPrefix(*info.memo), &record, &error)) {
      util::LogDebug("chat", "skipping memo of " + info.signature + ": " + error);
      continue;
    }
    if (record.group_id != group_id || record.message.empty()) {
      continue;
    }
    ChatMessage message;
    message.signature = info.signature;
    message.sender = std::move(record.sender);
    message.message = std::move(record.message);
    message.receiver = std::move(record.receiver);
    message.reply_to_sig = std::move(record.reply_to_sig);
    message.timestamp = info.block_time.value_or(0);
    message.slot = info.slot;
    result.messages.push_back(std::move(message));
  }
  std::stable_sort(result.messages.begin(), result.messages.end(),
                   [](const ChatMessage& a, const ChatMessage& b) {
                     return a.timestamp < b.timestamp;
                   });
  result.has_more = signatures.size() == limit;
  util::LogInfo("chat", "found " + std::to_string(result.messages.size()) +
                            " messages for group " + std::to_string(group_id));
  return result;
}

}  // namespace x1memo::domain
