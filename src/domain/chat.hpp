#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "accounts/parser.hpp"
#include "chain/pubkey.hpp"
#include "codec/records.hpp"
#include "config/network.hpp"
#include "engine/pipeline.hpp"

namespace x1memo::domain {

constexpr std::size_t kDefaultChatMessageLimit = 50;

chain::Pubkey ChatCounterAddress(const chain::Pubkey& chat_program);
chain::Pubkey ChatGroupAddress(std::uint64_t group_id, const chain::Pubkey& chat_program);

struct ChatStatistics {
  std::uint64_t total_groups{0};
  std::uint64_t valid_groups{0};
  std::uint64_t total_memos{0};
  std::uint64_t total_burned{0};
  std::vector<accounts::ChatGroupInfo> groups;
};

struct ChatMessage {
  std::string signature;
  std::string sender;
  std::string message;
  std::optional<std::string> receiver;
  std::optional<std::string> reply_to_sig;
  std::int64_t timestamp{0};
  std::uint64_t slot{0};
};

struct ChatMessages {
  std::uint64_t group_id{0};
  // Oldest first, the order a conversation is read in.
  std::vector<ChatMessage> messages;
  bool has_more{false};
};

// Group chat. Sending a message mints to the sender, so the memo is the bare
// ChatMessageData record and no burn amount is involved.
class ChatService {
 public:
  ChatService(std::shared_ptr<const engine::TransactionPipeline> pipeline,
              config::NetworkConfig network);

  engine::OperationDescriptor DescribeSendMessage(const chain::Pubkey& sender,
                                                  const codec::ChatMessageData& record,
                                                  bool create_token_account) const;
  // Creates the sender's token account first when it does not exist yet.
  engine::BuiltTransaction BuildSendMessage(const chain::Pubkey& sender,
                                            const codec::ChatMessageData& record) const;

  std::uint64_t TotalGroups() const;
  std::optional<accounts::ChatGroupInfo> Fetch(std::uint64_t group_id) const;
  bool Exists(std::uint64_t group_id) const;
  ChatStatistics FetchAll() const;
  // Groups in [start_id, end_id); missing or unreadable ones are skipped.
  std::vector<accounts::ChatGroupInfo> FetchRange(std::uint64_t start_id,
                                                  std::uint64_t end_id) const;
  ChatMessages Messages(std::uint64_t group_id, std::size_t limit = kDefaultChatMessageLimit,
                        const std::optional<std::string>& before = std::nullopt) const;

 private:
  std::shared_ptr<const engine::TransactionPipeline> pipeline_;
  config::NetworkConfig network_;
};

}  // namespace x1memo::domain
