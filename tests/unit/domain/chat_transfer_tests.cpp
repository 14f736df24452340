#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "accounts/parser.hpp"
#include "chain/pda.hpp"
#include "chain/program_ids.hpp"
#include "chain/pubkey.hpp"
#include "codec/records.hpp"
#include "config/network.hpp"
#include "domain/chat.hpp"
#include "domain/common.hpp"
#include "domain/transfer.hpp"
#include "engine/compute_budget.hpp"
#include "nlohmann/json.hpp"
#include "rpc/error.hpp"
#include "tests/unit/util/account_fixtures.hpp"
#include "tests/unit/util/fake_node.hpp"
#include "tx/instruction.hpp"
#include "tx/message.hpp"

namespace {

using namespace x1memo;
using nlohmann::json;
using test::FakeNode;

using AccountMap = std::map<std::string, json>;

chain::Pubkey Sender() {
  return chain::PubkeyFromLiteral("9xQeWvG816bUx9EPjHmaT23yvVM2ZWbrrpZb9PusVFin");
}

chain::Pubkey Recipient() {
  return chain::PubkeyFromLiteral("4Nd1mBQtrMJVYVfKf2PJy9NZUZdTAsp7D4xWLs4gDB4T");
}

const config::NetworkConfig& Testnet() { return config::ConfigFor(config::NetworkType::kTestnet); }

const chain::Pubkey& ChatProgram() { return Testnet().programs.chat_program; }

template <typename Fn>
bool ExpectKind(Fn&& fn, rpc::ErrorKind kind, const char* label) {
  try {
    fn();
  } catch (const rpc::RpcError& ex) {
    if (ex.kind() == kind) {
      return true;
    }
    std::cerr << "chat_transfer_tests: " << label << " threw " << ex.what() << "\n";
    return false;
  }
  std::cerr << "chat_transfer_tests: " << label << " did not throw\n";
  return false;
}

const chain::Pubkey& ProgramAt(const tx::Message& message, std::size_t index) {
  return message.account_keys.at(message.instructions.at(index).program_id_index);
}

codec::ChatMessageData Message(std::uint64_t group_id, const std::string& text) {
  codec::ChatMessageData record;
  record.group_id = group_id;
  record.sender = Sender().ToBase58();
  record.message = text;
  return record;
}

std::string Listed(const std::string& text) {
  return "[" + std::to_string(text.size()) + "] " + text;
}

bool TestSendMessageLayout() {
  FakeNode node(50'000);
  node.ServeAccounts(std::make_shared<AccountMap>());
  domain::ChatService service(node.pipeline, Testnet());
  const auto built = service.BuildSendMessage(Sender(), Message(3, "gm"));

  // 50k * 1.2 falls under the chat floor.
  if (built.compute.unit_limit != 120'000) {
    std::cerr << "chat_transfer_tests: chat unit limit " << built.compute.unit_limit << "\n";
    return false;
  }
  const auto& message = built.transaction.message;
  if (message.instructions.size() != 4 || ProgramAt(message, 0) != chain::ComputeBudgetProgramId() ||
      message.instructions[0].data != tx::BuildSetComputeUnitLimit(120'000).data ||
      ProgramAt(message, 1) != chain::MemoProgramId() ||
      ProgramAt(message, 2) != chain::AssociatedTokenProgramId() ||
      ProgramAt(message, 3) != ChatProgram()) {
    std::cerr << "chat_transfer_tests: send_memo_to_group instruction order\n";
    return false;
  }
  const auto& memo_ix = message.instructions[1];
  codec::ChatMessageData decoded;
  if (!codec::DecodeChatMemo(std::string(memo_ix.data.begin(), memo_ix.data.end()), &decoded) ||
      decoded.group_id != 3 || decoded.message != "gm" || decoded.receiver.has_value()) {
    std::cerr << "chat_transfer_tests: chat memo\n";
    return false;
  }
  const auto& send_ix = message.instructions[3];
  if (send_ix.data != domain::InstructionData("send_memo_to_group", {3}) ||
      message.account_keys.at(send_ix.accounts.at(1)) !=
          domain::ChatGroupAddress(3, ChatProgram()) ||
      message.account_keys.at(send_ix.accounts.at(3)) !=
          domain::MintAuthorityAddress(Testnet().programs.mint_program)) {
    std::cerr << "chat_transfer_tests: send_memo_to_group accounts\n";
    return false;
  }

  const auto simulated = node.Simulated();
  if (simulated.size() != 1 || ProgramAt(simulated[0].message, 1) != chain::MemoProgramId() ||
      simulated[0].message.instructions[0].data !=
          tx::BuildSetComputeUnitLimit(engine::kSimulationComputeUnits).data) {
    std::cerr << "chat_transfer_tests: simulation order differs\n";
    return false;
  }
  return true;
}

bool TestChatLimitCeiling() {
  FakeNode node(500'000);
  AccountMap existing;
  const auto& programs = Testnet().programs;
  existing[chain::AssociatedTokenAddress(Sender(), programs.token_mint, programs.token_program)
               .ToBase58()] = test::EncodedAccount({0}, programs.token_program);
  node.ServeAccounts(std::make_shared<AccountMap>(std::move(existing)));
  domain::ChatService service(node.pipeline, Testnet());
  const auto built = service.BuildSendMessage(Sender(), Message(0, "hello group"));
  if (built.compute.unit_limit != 400'000 || built.transaction.message.instructions.size() != 3) {
    std::cerr << "chat_transfer_tests: chat ceiling or existing token account\n";
    return false;
  }
  return true;
}

bool TestSendMessageRejections() {
  FakeNode node;
  domain::ChatService service(node.pipeline, Testnet());
  auto foreign = Message(1, "hi");
  foreign.sender = Recipient().ToBase58();
  if (!ExpectKind([&] { (void)service.DescribeSendMessage(Sender(), Message(1, ""), false); },
                  rpc::ErrorKind::kInvalidParameter, "empty message") ||
      !ExpectKind(
          [&] {
            (void)service.DescribeSendMessage(Sender(), Message(1, std::string(513, 'x')), false);
          },
          rpc::ErrorKind::kInvalidParameter, "513 byte message") ||
      !ExpectKind([&] { (void)service.DescribeSendMessage(Sender(), foreign, false); },
                  rpc::ErrorKind::kInvalidParameter, "foreign sender")) {
    return false;
  }
  if (!node.http->Requests().empty()) {
    std::cerr << "chat_transfer_tests: rejected message reached the node\n";
    return false;
  }
  return true;
}

bool TestMessagesOldestFirst() {
  FakeNode node;
  auto reply = Message(2, "second");
  reply.reply_to_sig = "a";
  node.http->OnResult(
      "getSignaturesForAddress",
      json::array({
          {{"signature", "b"}, {"slot", 9}, {"blockTime", 200}, {"err", nullptr},
           {"memo", Listed(codec::EncodeChatMemoText(reply))}},
          {{"signature", "x"}, {"slot", 8}, {"blockTime", 150}, {"err", {{"Custom", 1}}},
           {"memo", Listed(codec::EncodeChatMemoText(Message(2, "failed")))}},
          {{"signature", "y"}, {"slot", 7}, {"blockTime", 120}, {"err", nullptr},
           {"memo", Listed(codec::EncodeChatMemoText(Message(5, "other group")))}},
          {{"signature", "z"}, {"slot", 6}, {"blockTime", 110}, {"err", nullptr},
           {"memo", "[4] junk"}},
          {{"signature", "a"}, {"slot", 5}, {"blockTime", 100}, {"err", nullptr},
           {"memo", Listed(codec::EncodeChatMemoText(Message(2, "first")))}},
      }));
  domain::ChatService service(node.pipeline, Testnet());
  const auto page = service.Messages(2, 50);
  if (page.messages.size() != 2 || page.has_more || page.messages[0].message != "first" ||
      page.messages[1].message != "second" ||
      page.messages[1].reply_to_sig != std::optional<std::string>("a") ||
      page.messages[0].sender != Sender().ToBase58()) {
    std::cerr << "chat_transfer_tests: chat messages\n";
    return false;
  }
  return ExpectKind([&] { (void)service.Messages(2, 0); }, rpc::ErrorKind::kInvalidParameter,
                    "message limit 0");
}

bool TestChatStatistics() {
  FakeNode node;
  auto accounts_map = std::make_shared<AccountMap>();
  (*accounts_map)[domain::ChatCounterAddress(ChatProgram()).ToBase58()] =
      test::EncodedAccount(test::CounterAccount(3), ChatProgram());
  for (std::uint64_t id : {0, 2}) {
    accounts::ChatGroupInfo group;
    group.group_id = id;
    group.creator = Sender();
    group.name = "group " + std::to_string(id);
    group.tags = {"x1"};
    group.memo_count = 10 + id;
    group.burned_amount = 1'000'000 * (id + 1);
    group.min_memo_interval = 60;
    (*accounts_map)[domain::ChatGroupAddress(id, ChatProgram()).ToBase58()] =
        test::EncodedAccount(test::ChatGroupAccount(group), ChatProgram());
  }
  // Group 1 is cut off inside its name.
  auto truncated = test::AccountHeader();
  truncated.resize(truncated.size() + 50, 0x01);
  (*accounts_map)[domain::ChatGroupAddress(1, ChatProgram()).ToBase58()] =
      test::EncodedAccount(truncated, ChatProgram());
  node.ServeAccounts(accounts_map);

  domain::ChatService service(node.pipeline, Testnet());
  const auto stats = service.FetchAll();
  if (stats.total_groups != 3 || stats.valid_groups != 2 || stats.total_memos != 22 ||
      stats.total_burned != 4'000'000 || stats.groups.at(1).group_id != 2 ||
      stats.groups.at(1).min_memo_interval != 60) {
    std::cerr << "chat_transfer_tests: chat statistics\n";
    return false;
  }
  const auto range = service.FetchRange(1, 4);
  if (range.size() != 1 || range[0].group_id != 2) {
    std::cerr << "chat_transfer_tests: chat group range\n";
    return false;
  }
  return ExpectKind([&] { (void)service.FetchRange(2, 2); }, rpc::ErrorKind::kInvalidParameter,
                    "empty group range");
}

bool TestNativeTransfer() {
  FakeNode node;
  domain::TransferService service(node.pipeline, Testnet());
  const auto built = service.BuildNativeTransfer(Sender(), Recipient().ToBase58(), 5'000);
  const auto& message = built.transaction.message;
  const std::vector<std::uint8_t> expected_data = {2, 0, 0, 0, 0x88, 0x13, 0, 0, 0, 0, 0, 0};
  if (built.compute.unit_limit != 110'000 || message.instructions.size() != 2 ||
      ProgramAt(message, 0) != chain::SystemProgramId() ||
      message.instructions[0].data != expected_data ||
      message.account_keys.at(message.instructions[0].accounts.at(1)) != Recipient()) {
    std::cerr << "chat_transfer_tests: native transfer\n";
    return false;
  }
  return ExpectKind([&] { (void)service.BuildNativeTransfer(Sender(), "not-a-key", 5'000); },
                    rpc::ErrorKind::kInvalidAddress, "malformed recipient") &&
         ExpectKind([&] { (void)service.DescribeNativeTransfer(Sender(), Recipient(), 0); },
                    rpc::ErrorKind::kInvalidParameter, "zero lamports");
}

bool TestTokenTransfer() {
  const auto& programs = Testnet().programs;
  const auto destination =
      chain::AssociatedTokenAddress(Recipient(), programs.token_mint, programs.token_program);

  FakeNode missing;
  missing.ServeAccounts(std::make_shared<AccountMap>());
  domain::TransferService creating(missing.pipeline, Testnet());
  const auto built = creating.BuildTokenTransfer(Sender(), Recipient().ToBase58(), 2'500'000);
  const auto& message = built.transaction.message;
  const std::vector<std::uint8_t> expected_data = {12, 0xA0, 0x25, 0x26, 0, 0, 0, 0, 0, 6};
  if (message.instructions.size() != 3 ||
      ProgramAt(message, 0) != chain::AssociatedTokenProgramId() ||
      message.instructions[0].data != std::vector<std::uint8_t>{0} ||
      ProgramAt(message, 1) != programs.token_program ||
      message.instructions[1].data != expected_data ||
      message.account_keys.at(message.instructions[1].accounts.at(2)) != destination) {
    std::cerr << "chat_transfer_tests: token transfer with new destination\n";
    return false;
  }

  FakeNode existing;
  AccountMap accounts_map;
  accounts_map[destination.ToBase58()] = test::EncodedAccount({0}, programs.token_program);
  existing.ServeAccounts(std::make_shared<AccountMap>(std::move(accounts_map)));
  domain::TransferService plain(existing.pipeline, Testnet());
  if (plain.BuildTokenTransfer(Sender(), Recipient().ToBase58(), 1).transaction.message
          .instructions.size() != 2) {
    std::cerr << "chat_transfer_tests: token transfer to existing account\n";
    return false;
  }
  return true;
}

}  // namespace

int main() {
  try {
    if (!TestSendMessageLayout()) return EXIT_FAILURE;
    if (!TestChatLimitCeiling()) return EXIT_FAILURE;
    if (!TestSendMessageRejections()) return EXIT_FAILURE;
    if (!TestMessagesOldestFirst()) return EXIT_FAILURE;
    if (!TestChatStatistics()) return EXIT_FAILURE;
    if (!TestNativeTransfer()) return EXIT_FAILURE;
    if (!TestTokenTransfer()) return EXIT_FAILURE;
  } catch (const std::exception& ex) {
    std::cerr << "chat_transfer_tests: unexpected exception: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
