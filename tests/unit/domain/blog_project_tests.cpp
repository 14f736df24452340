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
#include "chain/pubkey.hpp"
#include "codec/records.hpp"
#include "config/network.hpp"
#include "domain/blog.hpp"
#include "domain/common.hpp"
#include "domain/project.hpp"
#include "engine/pipeline.hpp"
#include "nlohmann/json.hpp"
#include "rpc/error.hpp"
#include "tests/unit/util/account_fixtures.hpp"
#include "tests/unit/util/fake_node.hpp"

namespace {

using namespace x1memo;
using nlohmann::json;
using test::FakeNode;

using AccountMap = std::map<std::string, json>;

chain::Pubkey User() {
  return chain::PubkeyFromLiteral("54ky4LNnRsbYioDSBKNrc5hG8HoDyZ6yhf8TuncxTBRF");
}

const config::NetworkConfig& Testnet() { return config::ConfigFor(config::NetworkType::kTestnet); }

const chain::Pubkey& ProjectProgram() { return Testnet().programs.project_program; }

template <typename Fn>
bool ExpectKind(Fn&& fn, rpc::ErrorKind kind, const char* label) {
  try {
    fn();
  } catch (const rpc::RpcError& ex) {
    if (ex.kind() == kind) {
      return true;
    }
    std::cerr << "blog_project_tests: " << label << " threw " << ex.what() << "\n";
    return false;
  }
  std::cerr << "blog_project_tests: " << label << " did not throw\n";
  return false;
}

void AddProject(AccountMap* accounts_map, std::uint64_t project_id) {
  accounts::ProjectInfo project;
  project.project_id = project_id;
  project.creator = User();
  project.name = "project " + std::to_string(project_id);
  project.tags = {"defi"};
  (*accounts_map)[domain::ProjectAddress(project_id, ProjectProgram()).ToBase58()] =
      test::EncodedAccount(test::ProjectAccount(project), ProjectProgram());
}

bool TestBlogBurnLayout() {
  FakeNode node;
  domain::BlogService service(node.pipeline, Testnet());
  codec::BlogBurnData record;
  record.blog_id = 4;
  record.burner = User().ToBase58();
  record.message = "for the blog";
  const auto op = service.DescribeBurn(User(), record, 2'000'000);
  const auto& instruction = op.program_instructions.at(0);
  if (instruction.program_id != Testnet().programs.blog_program ||
      instruction.data != domain::InstructionData("burn_for_blog", {4, 2'000'000}) ||
      instruction.accounts.at(1).pubkey !=
          domain::BlogAddress(4, Testnet().programs.blog_program) ||
      !instruction.accounts.at(0).is_signer) {
    std::cerr << "blog_project_tests: burn_for_blog instruction\n";
    return false;
  }

  auto foreign = record;
  foreign.burner = Testnet().programs.forum_program.ToBase58();
  if (!ExpectKind([&] { (void)service.DescribeBurn(User(), foreign, 2'000'000); },
                  rpc::ErrorKind::kInvalidParameter, "foreign burner")) {
    return false;
  }
  if (!ExpectKind([&] { (void)service.History(4, 0); }, rpc::ErrorKind::kInvalidParameter,
                  "history limit 0") ||
      !ExpectKind([&] { (void)service.History(4, domain::kMaxHistoryLimit + 1); },
                  rpc::ErrorKind::kInvalidParameter, "history limit 1001")) {
    return false;
  }
  if (!node.http->Requests().empty()) {
    std::cerr << "blog_project_tests: rejected input reached the node\n";
    return false;
  }
  return true;
}

bool TestProjectCreate() {
  FakeNode node;
  auto accounts_map = std::make_shared<AccountMap>();
  (*accounts_map)[domain::ProjectCounterAddress(ProjectProgram()).ToBase58()] =
      test::EncodedAccount(test::CounterAccount(12), ProjectProgram());
  node.ServeAccounts(accounts_map);
  domain::ProjectService service(node.pipeline, Testnet());

  codec::ProjectCreationData record;
  record.name = "Memo Explorer";
  record.description = "Indexes memo burns";
  record.website = "https://example.org";
  record.tags = {"tools", "explorer"};
  if (!ExpectKind([&] { (void)service.DescribeCreate(User(), record, 1'000'000); },
                  rpc::ErrorKind::kInvalidParameter, "small project burn")) {
    return false;
  }

  const auto built = service.BuildCreate(User(), record, domain::kProjectMinCreateBurn);
  const auto& message = built.transaction.message;
  const auto& create_ix = message.instructions.at(1);
  if (create_ix.data !=
          domain::InstructionData("create_project", {12, domain::kProjectMinCreateBurn}) ||
      message.account_keys.at(create_ix.accounts.at(2)) !=
          domain::ProjectAddress(12, ProjectProgram()) ||
      message.account_keys.at(create_ix.accounts.at(3)) !=
          domain::BurnLeaderboardAddress(ProjectProgram())) {
    std::cerr << "blog_project_tests: create_project instruction\n";
    return false;
  }
  const auto& memo_ix = message.instructions.front();
  codec::DecodedMemo decoded;
  if (!codec::DecodeDomainMemo(std::string(memo_ix.data.begin(), memo_ix.data.end()), &decoded)) {
    std::cerr << "blog_project_tests: create_project memo\n";
    return false;
  }
  const auto* project = std::get_if<codec::ProjectCreationData>(&decoded.record);
  if (project == nullptr || project->project_id != 12 || project->tags.size() != 2) {
    std::cerr << "blog_project_tests: create_project record\n";
    return false;
  }
  return true;
}

bool TestLeaderboardAndRange() {
  FakeNode node;
  auto accounts_map = std::make_shared<AccountMap>();
  node.ServeAccounts(accounts_map);
  domain::ProjectService empty(node.pipeline, Testnet());
  if (!ExpectKind([&] { (void)empty.FetchLeaderboard(); }, rpc::ErrorKind::kOther,
                  "missing leaderboard")) {
    return false;
  }

  auto populated = std::make_shared<AccountMap>();
  (*populated)[domain::BurnLeaderboardAddress(ProjectProgram()).ToBase58()] =
      test::EncodedAccount(test::LeaderboardAccount({{5, 900}, {1, 500}, {3, 100}}),
                           ProjectProgram());
  AddProject(populated.get(), 1);
  AddProject(populated.get(), 3);
  node.ServeAccounts(populated);
  domain::ProjectService service(node.pipeline, Testnet());
  if (service.BurnRank(5) != std::optional<std::uint32_t>(1) ||
      service.BurnRank(3) != std::optional<std::uint32_t>(3) || service.BurnRank(8).has_value()) {
    std::cerr << "blog_project_tests: burn rank\n";
    return false;
  }
  if (service.FetchLeaderboard().total_burned != 1500) {
    std::cerr << "blog_project_tests: leaderboard total\n";
    return false;
  }

  const auto range = service.FetchRange(0, 4);
  if (range.size() != 2 || range[0].project_id != 1 || range[1].project_id != 3) {
    std::cerr << "blog_project_tests: project range\n";
    return false;
  }
  return ExpectKind([&] { (void)service.FetchRange(4, 4); }, rpc::ErrorKind::kInvalidParameter,
                    "empty range");
}

bool TestBurnMessagesForProject() {
  FakeNode node;
  codec::ProjectBurnData mine;
  mine.project_id = 3;
  mine.burner = User().ToBase58();
  mine.message = "keep building";
  codec::ProjectBurnData elsewhere = mine;
  elsewhere.project_id = 4;
  const auto listed = [](const std::string& text) {
    return "[" + std::to_string(text.size()) + "] " + text;
  };
  node.http->OnResult(
      "getSignaturesForAddress",
      json::array({
          {{"signature", "a"}, {"slot", 1}, {"blockTime", 10}, {"err", nullptr},
           {"memo", listed(engine::EncodeRecordMemo(mine, domain::kProjectMinBurn))}},
          {{"signature", "b"}, {"slot", 2}, {"blockTime", 20}, {"err", nullptr},
           {"memo", listed(engine::EncodeRecordMemo(elsewhere, domain::kProjectMinBurn))}},
      }));
  domain::ProjectService service(node.pipeline, Testnet());
  const auto messages = service.BurnMessages(3, 50);
  if (messages.messages.size() != 1 || messages.has_more ||
      messages.messages[0].message != "keep building" ||
      messages.messages[0].burn_amount != domain::kProjectMinBurn) {
    std::cerr << "blog_project_tests: project burn messages\n";
    return false;
  }
  return true;
}

}  // namespace

int main() {
  try {
    if (!TestBlogBurnLayout()) return EXIT_FAILURE;
    if (!TestProjectCreate()) return EXIT_FAILURE;
    if (!TestLeaderboardAndRange()) return EXIT_FAILURE;
    if (!TestBurnMessagesForProject()) return EXIT_FAILURE;
  } catch (const std::exception& ex) {
    std::cerr << "blog_project_tests: unexpected exception: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
