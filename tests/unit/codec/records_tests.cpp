#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <variant>
#include <vector>

#include "codec/borsh.hpp"
#include "codec/memo.hpp"
#include "codec/records.hpp"
#include "engine/pipeline.hpp"

namespace {

using namespace x1memo::codec;

constexpr const char* kUser = "54ky4LNnRsbYioDSBKNrc5hG8HoDyZ6yhf8TuncxTBRF";

std::string WrapPayload(const std::vector<std::uint8_t>& payload, std::uint64_t burn) {
  BurnMemo memo;
  memo.burn_amount = burn;
  memo.payload = payload;
  return EncodeMemoText(memo);
}

bool TestValidationNamesField() {
  BlogCreationData blog;
  blog.name = "My blog";
  blog.description = std::string(300, 'd');
  std::string error;
  if (blog.Validate(&error) || error.find("description") == std::string::npos) {
    std::cerr << "records_tests: 300-byte description error was '" << error << "'\n";
    return false;
  }

  ProfileCreationData profile;
  profile.user_pubkey = kUser;
  profile.username = "";
  if (profile.Validate(&error) || error.find("username") == std::string::npos) {
    std::cerr << "records_tests: empty username not reported\n";
    return false;
  }
  profile.username = "alice";
  profile.user_pubkey = "not-a-key";
  if (profile.Validate(&error) || error.find("user_pubkey") == std::string::npos) {
    std::cerr << "records_tests: bad user_pubkey not reported\n";
    return false;
  }

  ProjectCreationData project;
  project.name = "proj";
  project.tags = {"a", "b", "c", "d", "e"};
  if (project.Validate(&error) || error.find("tags") == std::string::npos) {
    std::cerr << "records_tests: five tags accepted\n";
    return false;
  }
  project.tags = {"a", ""};
  if (project.Validate(&error) || error.find("tags[1]") == std::string::npos) {
    std::cerr << "records_tests: empty tag accepted\n";
    return false;
  }
  return true;
}

bool TestProfileUpdateLayout() {
  ProfileUpdateData update;
  update.user_pubkey = kUser;
  update.username = "bob";
  update.about_me = std::optional<std::string>{};  // clear
  const auto payload = SerializeRecord(update);

  BorshReader reader(payload);
  std::uint8_t version = 0;
  std::string category, operation, user;
  std::optional<std::string> username, image;
  std::optional<std::optional<std::string>> about_me;
  if (!reader.ReadU8(&version, "version") || !reader.ReadString(&category, "category") ||
      !reader.ReadString(&operation, "operation") || !reader.ReadString(&user, "user") ||
      !reader.ReadOptionString(&username, "username") ||
      !reader.ReadOptionString(&image, "image") ||
      !reader.ReadOptionOptionString(&about_me, "about_me") || !reader.AtEnd()) {
    std::cerr << "records_tests: update layout: " << reader.error() << "\n";
    return false;
  }
  if (version != kRecordVersion || category != "profile" || operation != "update_profile" ||
      username != std::optional<std::string>("bob") || image.has_value() || !about_me ||
      about_me->has_value()) {
    std::cerr << "records_tests: update fields mismatch\n";
    return false;
  }
  return true;
}

bool TestDomainMemoReplay() {
  PostCreationData post;
  post.creator = kUser;
  post.post_id = 7;
  post.title = "hello";
  post.content = "first post";
  const auto text = WrapPayload(SerializeRecord(post), 1'000'000);

  DecodedMemo decoded;
  std::string error;
  if (!DecodeDomainMemo(text, &decoded, &error)) {
    std::cerr << "records_tests: replay failed: " << error << "\n";
    return false;
  }
  const auto* replayed = std::get_if<PostCreationData>(&decoded.record);
  if (decoded.category != "forum" || decoded.operation != "create_post" ||
      decoded.burn_amount != 1'000'000 || !replayed || replayed->post_id != 7 ||
      replayed->title != "hello") {
    std::cerr << "records_tests: replayed record mismatch\n";
    return false;
  }

  // A trailing byte after a well-formed record is not a domain memo.
  auto padded = SerializeRecord(post);
  padded.push_back(0);
  if (DecodeDomainMemo(WrapPayload(padded, 1'000'000), &decoded, &error)) {
    std::cerr << "records_tests: record with trailing byte accepted\n";
    return false;
  }

  // Unknown category/operation pair.
  std::vector<std::uint8_t> unknown;
  WriteU8(&unknown, kRecordVersion);
  WriteString(&unknown, "chat");
  WriteString(&unknown, "send_message");
  if (DecodeDomainMemo(WrapPayload(unknown, 0), &decoded, &error) ||
      error.find("unknown") == std::string::npos) {
    std::cerr << "records_tests: unknown record accepted\n";
    return false;
  }

  // A valid envelope around random bytes.
  if (DecodeDomainMemo(WrapPayload({0xFF, 0xFF, 0xFF, 0xFF, 0xFF}, 0), &decoded, &error)) {
    std::cerr << "records_tests: garbage payload accepted\n";
    return false;
  }
  return true;
}

struct ReplayCase {
  std::string label;
  DomainRecord record;
  std::uint64_t burn_amount{0};
  std::string category;
  std::string operation;
};

std::vector<ReplayCase> ReplayCases() {
  constexpr const char* kOther = "9xQeWvG816bUx9EPjHmaT23yvVM2ZWbrrpZb9PusVFin";
  std::vector<ReplayCase> cases;

  ProfileCreationData create_profile;
  create_profile.user_pubkey = kUser;
  create_profile.username = "alice";
  create_profile.image = "https://example.com/alice.png";
  create_profile.about_me = "builder on x1";
  cases.push_back({"create_profile", create_profile, 420'000'000, "profile", "create_profile"});

  // about_me is Option<Option<String>>: Some(None) clears it, Some(Some) sets it.
  ProfileUpdateData clear_about;
  clear_about.user_pubkey = kUser;
  clear_about.image = "https://example.com/alice-2.png";
  clear_about.about_me.emplace();
  cases.push_back({"update_profile clear about_me", clear_about, 420'000'000, "profile",
                   "update_profile"});
  ProfileUpdateData set_about;
  set_about.user_pubkey = kOther;
  set_about.username = "bob";
  set_about.about_me.emplace("new bio");
  cases.push_back({"update_profile set about_me", set_about, 500'000'000, "profile",
                   "update_profile"});

  BlogCreationData create_blog;
  create_blog.blog_id = 7;
  create_blog.name = "Field notes";
  create_blog.description = "Weekly notes from the validator room";
  cases.push_back({"create_blog", create_blog, 1'000'000, "blog", "create_blog"});

  BlogUpdateData update_blog;
  update_blog.blog_id = 7;
  update_blog.description = "Notes from the validator room, now daily";
  cases.push_back({"update_blog", update_blog, 2'000'000, "blog", "update_blog"});

  BlogBurnData blog_burn;
  blog_burn.blog_id = 7;
  blog_burn.burner = kOther;
  blog_burn.message = "great write-up";
  cases.push_back({"burn_for_blog", blog_burn, 3'000'000, "blog", "burn_for_blog"});

  BlogMintData blog_mint;
  blog_mint.blog_id = 7;
  blog_mint.minter = kUser;
  blog_mint.message = "minting for the blog";
  cases.push_back({"mint_for_blog", blog_mint, 0, "blog", "mint_for_blog"});

  PostCreationData create_post;
  create_post.creator = kUser;
  create_post.post_id = 3;
  create_post.title = "Fee markets";
  create_post.content = "How should priority fees be set?";
  cases.push_back({"create_post", create_post, 1'000'000, "forum", "create_post"});

  PostBurnData post_burn;
  post_burn.user = kOther;
  post_burn.post_id = 3;
  post_burn.message = "simulate first, then add ten percent";
  cases.push_back({"burn_for_post", post_burn, 1'000'000, "forum", "burn_for_post"});

  PostMintData post_mint;
  post_mint.user = kOther;
  post_mint.post_id = 3;
  post_mint.message = "agreed";
  cases.push_back({"mint_for_post", post_mint, 0, "forum", "mint_for_post"});

  ProjectCreationData create_project;
  create_project.project_id = 2;
  create_project.name = "Memo explorer";
  create_project.description = "Browse memos by program";
  create_project.website = "https://example.com";
  create_project.tags = {"explorer", "x1"};
  cases.push_back({"create_project", create_project, 42'069'000'000, "project", "create_project"});

  // tags is Option<Vec<String>>: None leaves them, Some replaces them.
  ProjectUpdateData retag;
  retag.project_id = 2;
  retag.tags = std::vector<std::string>{"explorer", "tools", "memo"};
  cases.push_back({"update_project set tags", retag, 42'069'000'000, "project",
                   "update_project"});
  ProjectUpdateData keep_tags;
  keep_tags.project_id = 2;
  keep_tags.name = "Memo explorer 2";
  keep_tags.website = "https://explorer.example.com";
  cases.push_back({"update_project keep tags", keep_tags, 42'069'000'000, "project",
                   "update_project"});

  ProjectBurnData project_burn;
  project_burn.project_id = 2;
  project_burn.burner = kUser;
  project_burn.message = "for the roadmap";
  cases.push_back({"burn_for_project", project_burn, 420'000'000, "project", "burn_for_project"});
  return cases;
}

bool TestEveryRecordReplays() {
  const auto cases = ReplayCases();
  std::vector<DecodedMemo> replayed;
  for (const auto& c : cases) {
    const auto text = std::visit(
        [&](const auto& record) {
          return x1memo::engine::EncodeRecordMemo(record, c.burn_amount);
        },
        c.record);
    DecodedMemo decoded;
    std::string error;
    if (!DecodeDomainMemo(text, &decoded, &error)) {
      std::cerr << "records_tests: " << c.label << " did not replay: " << error << "\n";
      return false;
    }
    if (decoded.category != c.category || decoded.operation != c.operation ||
        decoded.burn_amount != c.burn_amount) {
      std::cerr << "records_tests: " << c.label << " replayed as " << decoded.category << "/"
                << decoded.operation << " burning " << decoded.burn_amount << "\n";
      return false;
    }
    if (decoded.record.index() != c.record.index() || !(decoded.record == c.record)) {
      std::cerr << "records_tests: " << c.label << " fields differ after replay\n";
      return false;
    }
    replayed.push_back(std::move(decoded));
  }

  const auto& cleared = std::get<ProfileUpdateData>(replayed.at(1).record);
  const auto& assigned = std::get<ProfileUpdateData>(replayed.at(2).record);
  const auto& retagged = std::get<ProjectUpdateData>(replayed.at(11).record);
  const auto& kept = std::get<ProjectUpdateData>(replayed.at(12).record);
  if (!cleared.about_me || cleared.about_me->has_value() || !assigned.about_me ||
      assigned.about_me->value_or("") != "new bio" || !retagged.tags ||
      retagged.tags->size() != 3 || kept.tags) {
    std::cerr << "records_tests: nested options lost after replay\n";
    return false;
  }
  return true;
}

bool TestTypedDeserializeChecksTags() {
  BlogBurnData burn;
  burn.blog_id = 3;
  burn.burner = kUser;
  burn.message = "gm";
  const auto payload = SerializeRecord(burn);
  BlogMintData mint;
  std::string error;
  if (DeserializeRecord(payload, &mint, &error)) {
    std::cerr << "records_tests: burn payload read as a mint record\n";
    return false;
  }
  BlogBurnData back;
  if (!DeserializeRecord(payload, &back, &error) || back.blog_id != 3 || back.message != "gm") {
    std::cerr << "records_tests: typed deserialize failed: " << error << "\n";
    return false;
  }
  return true;
}

}  // namespace

int main() {
  try {
    if (!TestValidationNamesField()) return EXIT_FAILURE;
    if (!TestProfileUpdateLayout()) return EXIT_FAILURE;
    if (!TestDomainMemoReplay()) return EXIT_FAILURE;
    if (!TestEveryRecordReplays()) return EXIT_FAILURE;
    if (!TestTypedDeserializeChecksTags()) return EXIT_FAILURE;
  } catch (const std::exception& ex) {
    std::cerr << "records_tests: unexpected exception: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
