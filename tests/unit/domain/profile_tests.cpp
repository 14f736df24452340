#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "accounts/parser.hpp"
#include "chain/discriminator.hpp"
#include "chain/pda.hpp"
#include "chain/program_ids.hpp"
#include "chain/pubkey.hpp"
#include "codec/records.hpp"
#include "config/network.hpp"
#include "domain/profile.hpp"
#include "nlohmann/json.hpp"
#include "rpc/error.hpp"
#include "tests/unit/util/account_fixtures.hpp"
#include "tests/unit/util/fake_node.hpp"
#include "tx/message.hpp"

namespace {

using namespace x1memo;
using nlohmann::json;
using test::FakeNode;

chain::Pubkey User() {
  return chain::PubkeyFromLiteral("54ky4LNnRsbYioDSBKNrc5hG8HoDyZ6yhf8TuncxTBRF");
}

const config::NetworkConfig& Testnet() { return config::ConfigFor(config::NetworkType::kTestnet); }

codec::ProfileCreationData Alice() {
  codec::ProfileCreationData record;
  record.user_pubkey = User().ToBase58();
  record.username = "alice";
  record.image = "https://example.org/alice.png";
  record.about_me = "memo enthusiast";
  return record;
}

template <typename Fn>
bool ExpectInvalid(Fn&& fn, const std::string& needle, const char* label) {
  try {
    fn();
  } catch (const rpc::RpcError& ex) {
    if (ex.kind() == rpc::ErrorKind::kInvalidParameter &&
        ex.message().find(needle) != std::string::npos) {
      return true;
    }
    std::cerr << "profile_tests: " << label << " threw " << ex.what() << "\n";
    return false;
  }
  std::cerr << "profile_tests: " << label << " accepted\n";
  return false;
}

bool TestCreateProfileTransaction() {
  FakeNode node;
  domain::ProfileService service(node.pipeline, Testnet());
  const std::uint64_t burn = domain::kProfileMinBurn;
  const auto built = service.BuildCreate(User(), Alice(), burn);
  const auto& message = built.transaction.message;

  // Memo first, carrying the record and the burn amount.
  const auto& memo_ix = message.instructions.front();
  if (message.account_keys.at(memo_ix.program_id_index) != chain::MemoProgramId()) {
    std::cerr << "profile_tests: memo is not the first instruction\n";
    return false;
  }
  const std::string memo_text(memo_ix.data.begin(), memo_ix.data.end());
  codec::DecodedMemo decoded;
  std::string error;
  if (!codec::DecodeDomainMemo(memo_text, &decoded, &error)) {
    std::cerr << "profile_tests: memo does not decode: " << error << "\n";
    return false;
  }
  const auto* record = std::get_if<codec::ProfileCreationData>(&decoded.record);
  if (record == nullptr || record->username != "alice" || decoded.burn_amount != burn ||
      record->about_me != std::optional<std::string>("memo enthusiast")) {
    std::cerr << "profile_tests: memo record mismatch\n";
    return false;
  }

  const auto& programs = Testnet().programs;
  const auto& create_ix = message.instructions.at(1);
  if (message.account_keys.at(create_ix.program_id_index) != programs.profile_program) {
    std::cerr << "profile_tests: second instruction is not the profile program\n";
    return false;
  }
  const auto disc = chain::InstructionDiscriminator("create_profile");
  std::vector<std::uint8_t> expected_data(disc.begin(), disc.end());
  for (int i = 0; i < 8; ++i) {
    expected_data.push_back(static_cast<std::uint8_t>(burn >> (8 * i)));
  }
  if (create_ix.data != expected_data) {
    std::cerr << "profile_tests: create_profile data\n";
    return false;
  }
  const auto profile_pda = domain::ProfileAddress(User(), programs.profile_program);
  if (message.account_keys.at(create_ix.accounts.at(0)) != User() ||
      message.account_keys.at(create_ix.accounts.at(1)) != profile_pda ||
      message.account_keys.at(create_ix.accounts.at(3)) !=
          chain::AssociatedTokenAddress(User(), programs.token_mint, programs.token_program)) {
    std::cerr << "profile_tests: create_profile accounts\n";
    return false;
  }
  if (create_ix.accounts.size() != 8) {
    std::cerr << "profile_tests: create_profile account count " << create_ix.accounts.size()
              << "\n";
    return false;
  }
  return true;
}

bool TestCreateProfileRejectsBadInput() {
  FakeNode node;
  domain::ProfileService service(node.pipeline, Testnet());
  if (!ExpectInvalid([&] { (void)service.DescribeCreate(User(), Alice(), 1'000'000); }, "minimum",
                     "small burn")) {
    return false;
  }
  auto long_name = Alice();
  long_name.username = std::string(33, 'a');
  if (!ExpectInvalid(
          [&] { (void)service.DescribeCreate(User(), long_name, domain::kProfileMinBurn); },
          "username", "33-byte username")) {
    return false;
  }
  auto other_user = Alice();
  other_user.user_pubkey = Testnet().programs.forum_program.ToBase58();
  if (!ExpectInvalid(
          [&] { (void)service.DescribeCreate(User(), other_user, domain::kProfileMinBurn); },
          "does not match signer", "foreign user_pubkey")) {
    return false;
  }
  // Nothing reached the node.
  if (!node.http->Requests().empty()) {
    std::cerr << "profile_tests: invalid input caused RPC traffic\n";
    return false;
  }
  return true;
}

bool TestUpdateAndDelete() {
  FakeNode node;
  domain::ProfileService service(node.pipeline, Testnet());
  codec::ProfileUpdateData update;
  update.user_pubkey = User().ToBase58();
  update.username = "alice2";
  update.about_me.emplace();
  const auto op = service.DescribeUpdate(User(), update, domain::kProfileMinBurn);
  const auto& data = op.program_instructions.at(0).data;
  // disc(8) + burn(8) + Some("alice2") + None + Some(None)
  const std::vector<std::uint8_t> tail = {1, 6, 0, 0, 0, 'a', 'l', 'i', 'c', 'e', '2', 0, 1, 0};
  if (data.size() != 16 + tail.size() ||
      !std::equal(tail.begin(), tail.end(), data.begin() + 16)) {
    std::cerr << "profile_tests: update_profile optional encoding\n";
    return false;
  }

  const auto remove = service.DescribeDelete(User());
  if (remove.memo_text.has_value() || remove.program_instructions.at(0).accounts.size() != 2) {
    std::cerr << "profile_tests: delete_profile shape\n";
    return false;
  }
  return true;
}

bool TestFetchProfile() {
  FakeNode node;
  const auto& programs = Testnet().programs;
  accounts::UserProfile stored;
  stored.user = User();
  stored.username = "alice";
  stored.image = "img";
  stored.created_at = 1'700'000'000;
  stored.last_updated = 1'700'000'100;
  stored.bump = 254;
  auto accounts_map = std::make_shared<std::map<std::string, json>>();
  (*accounts_map)[domain::ProfileAddress(User(), programs.profile_program).ToBase58()] =
      test::EncodedAccount(test::ProfileAccount(stored), programs.profile_program);
  node.ServeAccounts(accounts_map);

  domain::ProfileService service(node.pipeline, Testnet());
  const auto profile = service.Fetch(User());
  if (!profile || profile->username != "alice" || profile->about_me.has_value() ||
      profile->created_at != 1'700'000'000) {
    std::cerr << "profile_tests: fetched profile\n";
    return false;
  }
  const auto missing = service.FetchBatch({User(), programs.forum_program});
  if (missing.size() != 2 || !missing[0].second || missing[1].second) {
    std::cerr << "profile_tests: batch lookup\n";
    return false;
  }
  return true;
}

bool TestForeignOwnerRejected() {
  FakeNode node;
  const auto& programs = Testnet().programs;
  accounts::UserProfile stored;
  stored.user = User();
  stored.username = "mallory";
  auto accounts_map = std::make_shared<std::map<std::string, json>>();
  (*accounts_map)[domain::ProfileAddress(User(), programs.profile_program).ToBase58()] =
      test::EncodedAccount(test::ProfileAccount(stored), chain::SystemProgramId());
  node.ServeAccounts(accounts_map);
  domain::ProfileService service(node.pipeline, Testnet());
  try {
    (void)service.Fetch(User());
  } catch (const rpc::RpcError& ex) {
    return ex.kind() == rpc::ErrorKind::kOther;
  }
  std::cerr << "profile_tests: account owned by another program accepted\n";
  return false;
}

}  // namespace

int main() {
  try {
    if (!TestCreateProfileTransaction()) return EXIT_FAILURE;
    if (!TestCreateProfileRejectsBadInput()) return EXIT_FAILURE;
    if (!TestUpdateAndDelete()) return EXIT_FAILURE;
    if (!TestFetchProfile()) return EXIT_FAILURE;
    if (!TestForeignOwnerRejected()) return EXIT_FAILURE;
  } catch (const std::exception& ex) {
    std::cerr << "profile_tests: unexpected exception: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
