#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include "accounts/parser.hpp"
#include "chain/pubkey.hpp"
#include "codec/records.hpp"
#include "config/network.hpp"
#include "domain/common.hpp"
#include "domain/forum.hpp"
#include "engine/pipeline.hpp"
#include "nlohmann/json.hpp"
#include "rpc/error.hpp"
#include "tests/unit/util/account_fixtures.hpp"
#include "tests/unit/util/fake_node.hpp"

namespace {

using namespace x1memo;
using nlohmann::json;
using test::FakeNode;

chain::Pubkey User() {
  return chain::PubkeyFromLiteral("54ky4LNnRsbYioDSBKNrc5hG8HoDyZ6yhf8TuncxTBRF");
}

const config::NetworkConfig& Testnet() { return config::ConfigFor(config::NetworkType::kTestnet); }

const chain::Pubkey& Forum() { return Testnet().programs.forum_program; }

using AccountMap = std::map<std::string, json>;

void AddCounter(AccountMap* accounts_map, std::uint64_t total) {
  (*accounts_map)[domain::ForumCounterAddress(Forum()).ToBase58()] =
      test::EncodedAccount(test::CounterAccount(total), Forum());
}

accounts::PostInfo MakePost(std::uint64_t post_id, std::uint64_t burned) {
  accounts::PostInfo post;
  post.post_id = post_id;
  post.creator = User();
  post.title = "post " + std::to_string(post_id);
  post.content = "body";
  post.reply_count = 1;
  post.burned_amount = burned;
  return post;
}

void AddPost(AccountMap* accounts_map, std::uint64_t post_id, std::uint64_t burned) {
  (*accounts_map)[domain::PostAddress(post_id, Forum()).ToBase58()] =
      test::EncodedAccount(test::PostAccount(MakePost(post_id, burned)), Forum());
}

// A post account owned by the forum program whose data stops after |keep| bytes.
void AddTruncatedPost(AccountMap* accounts_map, std::uint64_t post_id, std::size_t keep) {
  auto data = test::PostAccount(MakePost(post_id, 9'000'000));
  data.resize(keep);
  (*accounts_map)[domain::PostAddress(post_id, Forum()).ToBase58()] =
      test::EncodedAccount(data, Forum());
}

// Memo as getSignaturesForAddress reports it: "[<len>] <text>".
std::string ListedMemo(const std::string& text) {
  return "[" + std::to_string(text.size()) + "] " + text;
}

bool TestCreatePostTakesIdFromCounter() {
  FakeNode node;
  auto accounts_map = std::make_shared<AccountMap>();
  AddCounter(accounts_map.get(), 7);
  node.ServeAccounts(accounts_map);
  domain::ForumService service(node.pipeline, Testnet());

  codec::PostCreationData record;
  record.creator = User().ToBase58();
  record.post_id = 999;
  record.title = "hello forum";
  record.content = "first post";
  const auto built = service.BuildCreatePost(User(), record, 2'000'000);
  const auto& message = built.transaction.message;
  const auto& memo_ix = message.instructions.front();
  codec::DecodedMemo decoded;
  if (!codec::DecodeDomainMemo(std::string(memo_ix.data.begin(), memo_ix.data.end()), &decoded)) {
    std::cerr << "forum_tests: create_post memo does not decode\n";
    return false;
  }
  const auto* post = std::get_if<codec::PostCreationData>(&decoded.record);
  if (post == nullptr || post->post_id != 7) {
    std::cerr << "forum_tests: post id not taken from the counter\n";
    return false;
  }
  const auto& create_ix = message.instructions.at(1);
  if (create_ix.data != domain::InstructionData("create_post", {7, 2'000'000}) ||
      message.account_keys.at(create_ix.accounts.at(2)) != domain::PostAddress(7, Forum())) {
    std::cerr << "forum_tests: create_post instruction\n";
    return false;
  }
  return true;
}

bool TestBurnAmountMustBeWholeTokens() {
  FakeNode node;
  domain::ForumService service(node.pipeline, Testnet());
  codec::PostBurnData record;
  record.user = User().ToBase58();
  record.post_id = 3;
  record.message = "gm";
  try {
    (void)service.DescribeBurnForPost(User(), record, 1'500'000);
  } catch (const rpc::RpcError& ex) {
    if (ex.kind() != rpc::ErrorKind::kInvalidParameter) {
      std::cerr << "forum_tests: fractional burn error kind\n";
      return false;
    }
    const auto op = service.DescribeBurnForPost(User(), record, 2'000'000);
    if (op.memo_text->size() != domain::EstimateBurnForPostMemoSize(record)) {
      std::cerr << "forum_tests: memo size estimate differs from the encoded memo\n";
      return false;
    }
    return true;
  }
  std::cerr << "forum_tests: fractional burn accepted\n";
  return false;
}

bool TestFetchAllSkipsMissingPosts() {
  FakeNode node;
  auto accounts_map = std::make_shared<AccountMap>();
  AddCounter(accounts_map.get(), 5);
  AddPost(accounts_map.get(), 0, 1'000'000);
  AddPost(accounts_map.get(), 1, 2'000'000);
  AddPost(accounts_map.get(), 3, 4'000'000);
  // Post 2 loses its trailing bump byte; post 4 ends inside the creator key.
  AddTruncatedPost(accounts_map.get(), 2, test::PostAccount(MakePost(2, 9'000'000)).size() - 1);
  AddTruncatedPost(accounts_map.get(), 4, test::AccountHeader().size() + 20);
  node.ServeAccounts(accounts_map);
  domain::ForumService service(node.pipeline, Testnet());

  try {
    (void)service.Fetch(2);
    std::cerr << "forum_tests: truncated post parsed\n";
    return false;
  } catch (const rpc::RpcError& ex) {
    if (ex.kind() != rpc::ErrorKind::kOther) {
      std::cerr << "forum_tests: truncated post error " << ex.what() << "\n";
      return false;
    }
  }

  const auto stats = service.FetchAll();
  if (stats.total_posts != 5 || stats.valid_posts != 3 || stats.posts.size() != 3 ||
      stats.posts[0].post_id != 0 || stats.posts[1].post_id != 1 || stats.posts[2].post_id != 3 ||
      stats.total_burned != 7'000'000 || stats.total_replies != 3) {
    std::cerr << "forum_tests: bulk summary " << stats.valid_posts << "/" << stats.total_posts
              << "\n";
    return false;
  }
  return true;
}

bool TestFetchBulkDropsOnlyRpcErrors() {
  const auto result = domain::FetchBulk<std::uint64_t>(
      5, "item",
      [](std::uint64_t id) {
        if (id == 2 || id == 4) {
          throw rpc::RpcError(rpc::ErrorKind::kConnectionFailed, "node went away");
        }
        return id * 10;
      },
      [](std::uint64_t value) { return value; });
  if (result.total != 5 || result.valid != 3 ||
      result.records != std::vector<std::uint64_t>{0, 10, 30}) {
    std::cerr << "forum_tests: FetchBulk result\n";
    return false;
  }
  try {
    (void)domain::FetchBulk<std::uint64_t>(
        3, "item",
        [](std::uint64_t id) -> std::uint64_t {
          if (id == 1) throw std::logic_error("bug");
          return id;
        },
        [](std::uint64_t value) { return value; });
  } catch (const std::logic_error&) {
    return true;
  }
  std::cerr << "forum_tests: non-RPC failure swallowed\n";
  return false;
}

bool TestRepliesFilterAndOrder() {
  FakeNode node;
  auto accounts_map = std::make_shared<AccountMap>();
  AddPost(accounts_map.get(), 3, 0);
  node.ServeAccounts(accounts_map);

  codec::PostBurnData burn;
  burn.user = User().ToBase58();
  burn.post_id = 3;
  burn.message = "burned for you";
  codec::PostMintData mint;
  mint.user = User().ToBase58();
  mint.post_id = 3;
  mint.message = "minted a reply";
  codec::PostBurnData other_post = burn;
  other_post.post_id = 9;

  const json listing = json::array({
      {{"signature", "sig-burn"}, {"slot", 10}, {"blockTime", 100}, {"err", nullptr},
       {"memo", ListedMemo(engine::EncodeRecordMemo(burn, 3'000'000))}},
      {{"signature", "sig-mint"}, {"slot", 20}, {"blockTime", 200}, {"err", nullptr},
       {"memo", ListedMemo(engine::EncodeRecordMemo(mint, 0))}},
      {{"signature", "sig-other"}, {"slot", 30}, {"blockTime", 300}, {"err", nullptr},
       {"memo", ListedMemo(engine::EncodeRecordMemo(other_post, 1'000'000))}},
      {{"signature", "sig-failed"}, {"slot", 40}, {"blockTime", 400},
       {"err", {{"InstructionError", {1, "Custom"}}}},
       {"memo", ListedMemo(engine::EncodeRecordMemo(burn, 1'000'000))}},
      {{"signature", "sig-junk"}, {"slot", 50}, {"blockTime", 500}, {"err", nullptr},
       {"memo", ListedMemo("hello")}},
      {{"signature", "sig-plain"}, {"slot", 60}, {"blockTime", 600}, {"err", nullptr}},
  });
  node.http->OnResult("getSignaturesForAddress", listing);

  domain::ForumService service(node.pipeline, Testnet());
  const auto replies = service.Replies(3, 6);
  if (replies.replies.size() != 2 || !replies.has_more) {
    std::cerr << "forum_tests: reply count " << replies.replies.size() << "\n";
    return false;
  }
  const auto& newest = replies.replies[0];
  const auto& oldest = replies.replies[1];
  if (newest.signature != "sig-mint" || !newest.is_mint || newest.burn_amount != 0 ||
      oldest.signature != "sig-burn" || oldest.is_mint || oldest.burn_amount != 3'000'000 ||
      oldest.message != "burned for you" || oldest.timestamp != 100) {
    std::cerr << "forum_tests: reply contents\n";
    return false;
  }
  // The history query targets the post account.
  const auto requests = node.http->RequestsFor("getSignaturesForAddress");
  if (requests.size() != 1 ||
      requests[0].params.at(0).get<std::string>() != domain::PostAddress(3, Forum()).ToBase58()) {
    std::cerr << "forum_tests: history address\n";
    return false;
  }

  try {
    (void)service.Replies(4, 10);
  } catch (const rpc::RpcError& ex) {
    return ex.kind() == rpc::ErrorKind::kOther;
  }
  std::cerr << "forum_tests: replies for a missing post\n";
  return false;
}

}  // namespace

int main() {
  try {
    if (!TestCreatePostTakesIdFromCounter()) return EXIT_FAILURE;
    if (!TestBurnAmountMustBeWholeTokens()) return EXIT_FAILURE;
    if (!TestFetchAllSkipsMissingPosts()) return EXIT_FAILURE;
    if (!TestFetchBulkDropsOnlyRpcErrors()) return EXIT_FAILURE;
    if (!TestRepliesFilterAndOrder()) return EXIT_FAILURE;
  } catch (const std::exception& ex) {
    std::cerr << "forum_tests: unexpected exception: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
