#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

#include "accounts/parser.hpp"
#include "chain/discriminator.hpp"
#include "chain/pda.hpp"
#include "chain/pubkey.hpp"
#include "codec/memo.hpp"
#include "codec/records.hpp"
#include "config/network.hpp"
#include "config/settings.hpp"
#include "domain/blog.hpp"
#include "domain/burn.hpp"
#include "domain/chat.hpp"
#include "domain/common.hpp"
#include "domain/forum.hpp"
#include "domain/profile.hpp"
#include "domain/project.hpp"
#include "domain/transfer.hpp"
#include "engine/pipeline.hpp"
#include "nlohmann/json.hpp"
#include "rpc/client.hpp"
#include "rpc/error.hpp"
#include "rpc/http_client.hpp"
#include "rpc/transport.hpp"
#include "tx/transaction.hpp"
#include "util/base64.hpp"
#include "util/hex.hpp"
#include "util/log.hpp"

namespace {

using namespace x1memo;
using nlohmann::json;

constexpr std::uintmax_t kLogFileMaxBytes = 10 * 1024 * 1024;
constexpr std::size_t kLogFileCount = 5;

struct CliOptions {
  std::string network{"testnet"};
  std::optional<std::string> rpc_url;
  std::optional<std::string> settings_path;
  std::optional<std::string> log_level;
  std::optional<std::string> log_file;
  std::uint32_t timeout_ms{30000};
  bool raw{false};
  std::vector<std::string> args;
};

std::optional<std::string> GetEnvValue(std::string_view name) {
  std::string key(name);
  const char* value = std::getenv(key.c_str());
  if (!value || value[0] == '\0') {
    return std::nullopt;
  }
  return std::string(value);
}

std::optional<std::string> FindPrefixedOptionValue(const std::vector<std::string>& args,
                                                   std::string_view prefix) {
  for (std::size_t i = 1; i < args.size(); ++i) {
    const auto& arg = args[i];
    if (arg.rfind(prefix, 0) == 0) {
      return arg.substr(prefix.size());
    }
  }
  return std::nullopt;
}

// Positional arguments after the command, skipping --name=value options.
std::vector<std::string> Positionals(const std::vector<std::string>& args) {
  std::vector<std::string> out;
  for (std::size_t i = 1; i < args.size(); ++i) {
    if (args[i].rfind("--", 0) != 0) {
      out.push_back(args[i]);
    }
  }
  return out;
}

const std::string& RequireArg(const std::vector<std::string>& positionals, std::size_t index,
                              std::string_view label) {
  if (index >= positionals.size()) {
    throw std::runtime_error("missing argument <" + std::string(label) + ">");
  }
  return positionals[index];
}

std::uint64_t ParseU64(const std::string& text, std::string_view label) {
  std::size_t consumed = 0;
  unsigned long long value = 0;
  try {
    value = std::stoull(text, &consumed, 10);
  } catch (const std::exception&) {
    throw std::runtime_error("invalid " + std::string(label) + ": " + text);
  }
  if (consumed != text.size() || text.front() == '-') {
    throw std::runtime_error("invalid " + std::string(label) + ": " + text);
  }
  return value;
}

void PrintUsage() {
  std::cout << "Usage: x1memo-cli [options] <command> [params]\n"
            << "Offline commands:\n"
            << "  pda <program> <seed...>     Seeds as str:<text>, key:<base58>, u64:<n>, hex:<bytes>\n"
            << "  discriminator <name>\n"
            << "  ata <owner> [mint] [token_program]\n"
            << "  memo-encode <burn_units> <payload_text>\n"
            << "  memo-decode <memo_text>\n"
            << "Node queries:\n"
            << "  version\n"
            << "  balance <address>\n"
            << "  blockhash\n"
            << "  account <address>\n"
            << "  profile <user>\n"
            << "  blog <id>\n"
            << "  post <id>\n"
            << "  project <id>\n"
            << "  leaderboard\n"
            << "  blog-stats\n"
            << "  forum-stats\n"
            << "  project-stats\n"
            << "  burn-stats [user] [--limit=N]  User totals, or top burners without a user\n"
            << "  chat-stats\n"
            << "  chat-group <id>\n"
            << "  chat-messages <group_id> [--limit=N] [--before=<signature>]\n"
            << "Transactions (printed unsigned, Base64):\n"
            << "  build-burn <user> <tokens> <message>\n"
            << "  build-create-profile <user> <username> [--image=<url>] [--about=<text>] [--burn=<tokens>]\n"
            << "  build-create-post <user> <title> <content> [--image=<url>] [--burn=<tokens>]\n"
            << "  build-chat <user> <group_id> <message> [--reply-to=<signature>]\n"
            << "  build-transfer <from> <to> <lamports>\n"
            << "  build-token-transfer <from> <to> <units>\n"
            << "  send <signed_transaction_base64>\n"
            << "Options:\n"
            << "  --network <net>     testnet, prod-staging, mainnet (default testnet; env X1MEMO_NETWORK)\n"
            << "  --rpc-url <url>     Endpoint override (env X1MEMO_RPC_URL)\n"
            << "  --settings <path>   User settings JSON (custom RPC, compute unit buffer and price)\n"
            << "  --log-level <lvl>   debug, info, warn, error (env X1MEMO_LOG_LEVEL)\n"
            << "  --log-file <path>   Also log to <path>, rotated at 10 MiB, 5 files kept\n"
            << "  --timeout-ms <n>    Per-request timeout (default 30000)\n"
            << "  --raw               Print compact JSON\n";
}

CliOptions ParseOptions(int argc, char** argv) {
  CliOptions opts;
  if (auto value = GetEnvValue("X1MEMO_NETWORK")) opts.network = *value;
  if (auto value = GetEnvValue("X1MEMO_RPC_URL")) opts.rpc_url = *value;
  if (auto value = GetEnvValue("X1MEMO_LOG_LEVEL")) opts.log_level = *value;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--network") {
      if (++i >= argc) throw std::runtime_error("missing value for --network");
      opts.network = argv[i];
    } else if (arg == "--rpc-url") {
      if (++i >= argc) throw std::runtime_error("missing value for --rpc-url");
      opts.rpc_url = argv[i];
    } else if (arg == "--settings") {
      if (++i >= argc) throw std::runtime_error("missing value for --settings");
      opts.settings_path = argv[i];
    } else if (arg == "--log-level") {
      if (++i >= argc) throw std::runtime_error("missing value for --log-level");
      opts.log_level = argv[i];
    } else if (arg == "--log-file") {
      if (++i >= argc) throw std::runtime_error("missing value for --log-file");
      opts.log_file = argv[i];
    } else if (arg == "--timeout-ms") {
      if (++i >= argc) throw std::runtime_error("missing value for --timeout-ms");
      const auto parsed = ParseU64(argv[i], "--timeout-ms");
      if (parsed == 0 || parsed > 600000) {
        throw std::runtime_error("--timeout-ms out of range (1-600000)");
      }
      opts.timeout_ms = static_cast<std::uint32_t>(parsed);
    } else if (arg == "--raw") {
      opts.raw = true;
    } else if (arg == "--help" || arg == "-h") {
      PrintUsage();
      std::exit(0);
    } else {
      opts.args.emplace_back(arg);
    }
  }
  return opts;
}

// Everything a node-facing command needs, built once per invocation.
struct Session {
  config::NetworkConfig network;
  std::shared_ptr<const rpc::RpcClient> client;
  std::shared_ptr<const engine::TransactionPipeline> pipeline;
};

Session OpenSession(const CliOptions& opts, const config::NetworkConfig& network) {
  std::optional<config::UserSettings> settings;
  if (opts.settings_path) {
    settings = config::LoadUserSettings(*opts.settings_path, network.type);
    if (!settings) {
      util::LogWarn("cli", "no settings for " + network.network_id + " in " + *opts.settings_path);
    }
  }
  std::optional<std::string> override_url = opts.rpc_url;
  if (!override_url && settings) {
    override_url = settings->CustomRpcEndpoint();
  }
  rpc::TransportOptions transport_options;
  transport_options.timeout = std::chrono::milliseconds(opts.timeout_ms);
  auto transport = std::make_shared<const rpc::Transport>(
      network.rpc_endpoints, override_url, rpc::MakeDefaultHttpClient(), transport_options);

  Session session;
  session.network = network;
  session.client = std::make_shared<const rpc::RpcClient>(std::move(transport));
  session.pipeline =
      std::make_shared<const engine::TransactionPipeline>(session.client, std::move(settings));
  return session;
}

json ProfileToJson(const accounts::UserProfile& profile) {
  json out;
  out["user"] = profile.user.ToBase58();
  out["username"] = profile.username;
  out["image"] = profile.image;
  out["created_at"] = profile.created_at;
  out["last_updated"] = profile.last_updated;
  out["about_me"] = profile.about_me ? json(*profile.about_me) : json(nullptr);
  return out;
}

json BlogToJson(const accounts::BlogInfo& blog) {
  return json{{"blog_id", blog.blog_id},
              {"creator", blog.creator.ToBase58()},
              {"created_at", blog.created_at},
              {"last_updated", blog.last_updated},
              {"name", blog.name},
              {"description", blog.description},
              {"image", blog.image},
              {"memo_count", blog.memo_count},
              {"burned_amount", blog.burned_amount},
              {"minted_amount", blog.minted_amount},
              {"last_memo_time", blog.last_memo_time}};
}

json PostToJson(const accounts::PostInfo& post) {
  return json{{"post_id", post.post_id},
              {"creator", post.creator.ToBase58()},
              {"created_at", post.created_at},
              {"last_updated", post.last_updated},
              {"title", post.title},
              {"content", post.content},
              {"image", post.image},
              {"reply_count", post.reply_count},
              {"burned_amount", post.burned_amount},
              {"last_reply_time", post.last_reply_time}};
}

json ProjectToJson(const accounts::ProjectInfo& project) {
  return json{{"project_id", project.project_id},
              {"creator", project.creator.ToBase58()},
              {"created_at", project.created_at},
              {"last_updated", project.last_updated},
              {"name", project.name},
              {"description", project.description},
              {"image", project.image},
              {"website", project.website},
              {"tags", project.tags},
              {"memo_count", project.memo_count},
              {"burned_amount", project.burned_amount},
              {"last_memo_time", project.last_memo_time}};
}

json OptionalJson(const std::optional<std::string>& value) {
  return value ? json(*value) : json(nullptr);
}

json ChatGroupToJson(const accounts::ChatGroupInfo& group) {
  return json{{"group_id", group.group_id},
              {"creator", group.creator.ToBase58()},
              {"created_at", group.created_at},
              {"name", group.name},
              {"description", group.description},
              {"image", group.image},
              {"tags", group.tags},
              {"memo_count", group.memo_count},
              {"burned_amount", group.burned_amount},
              {"min_memo_interval", group.min_memo_interval},
              {"last_memo_time", group.last_memo_time}};
}

// Domain-specific fields of a replayed memo record; the header is reported
// separately.
json RecordFields(const codec::DomainRecord& record) {
  return std::visit(
      [](const auto& r) -> json {
        using T = std::decay_t<decltype(r)>;
        json out = json::object();
        if constexpr (std::is_same_v<T, codec::ProfileCreationData>) {
          out = {{"user_pubkey", r.user_pubkey}, {"username", r.username}, {"image", r.image},
                 {"about_me", OptionalJson(r.about_me)}};
        } else if constexpr (std::is_same_v<T, codec::ProfileUpdateData>) {
          out = {{"user_pubkey", r.user_pubkey}, {"username", OptionalJson(r.username)},
                 {"image", OptionalJson(r.image)}};
        } else if constexpr (std::is_same_v<T, codec::BlogCreationData>) {
          out = {{"blog_id", r.blog_id}, {"name", r.name}, {"description", r.description},
                 {"image", r.image}};
        } else if constexpr (std::is_same_v<T, codec::BlogUpdateData>) {
          out = {{"blog_id", r.blog_id}, {"name", OptionalJson(r.name)},
                 {"description", OptionalJson(r.description)}, {"image", OptionalJson(r.image)}};
        } else if constexpr (std::is_same_v<T, codec::BlogBurnData>) {
          out = {{"blog_id", r.blog_id}, {"burner", r.burner}, {"message", r.message}};
        } else if constexpr (std::is_same_v<T, codec::BlogMintData>) {
          out = {{"blog_id", r.blog_id}, {"minter", r.minter}, {"message", r.message}};
        } else if constexpr (std::is_same_v<T, codec::PostCreationData>) {
          out = {{"post_id", r.post_id}, {"creator", r.creator}, {"title", r.title},
                 {"content", r.content}, {"image", r.image}};
        } else if constexpr (std::is_same_v<T, codec::PostBurnData> ||
                             std::is_same_v<T, codec::PostMintData>) {
          out = {{"post_id", r.post_id}, {"user", r.user}, {"message", r.message}};
        } else if constexpr (std::is_same_v<T, codec::ProjectCreationData>) {
          out = {{"project_id", r.project_id}, {"name", r.name}, {"description", r.description},
                 {"image", r.image}, {"website", r.website}, {"tags", r.tags}};
        } else if constexpr (std::is_same_v<T, codec::ProjectUpdateData>) {
          out = {{"project_id", r.project_id}, {"name", OptionalJson(r.name)},
                 {"description", OptionalJson(r.description)}, {"image", OptionalJson(r.image)},
                 {"website", OptionalJson(r.website)}};
        } else if constexpr (std::is_same_v<T, codec::ProjectBurnData>) {
          out = {{"project_id", r.project_id}, {"burner", r.burner}, {"message", r.message}};
        }
        return out;
      },
      record);
}

json BuiltToJson(const engine::BuiltTransaction& built) {
  json compute;
  compute["simulated_units"] = built.compute.simulated_units;
  compute["used_fallback"] = built.compute.used_fallback;
  compute["multiplier"] = built.compute.multiplier;
  compute["unit_limit"] = built.compute.unit_limit;
  compute["unit_price"] = built.compute.unit_price ? json(*built.compute.unit_price) : json(nullptr);
  return json{{"transaction", tx::EncodeTransactionBase64(built.transaction)},
              {"required_signatures", built.transaction.message.header.num_required_signatures},
              {"compute", compute}};
}

chain::Seed AppendSeed(const std::string& spec, std::vector<std::vector<std::uint8_t>>* storage) {
  const auto colon = spec.find(':');
  if (colon == std::string::npos) {
    throw std::runtime_error("seed must be <kind>:<value>: " + spec);
  }
  const std::string kind = spec.substr(0, colon);
  const std::string value = spec.substr(colon + 1);
  std::vector<std::uint8_t> bytes;
  if (kind == "str") {
    bytes.assign(value.begin(), value.end());
  } else if (kind == "key") {
    const auto key = rpc::RequirePubkey(value);
    bytes.assign(key.bytes.begin(), key.bytes.end());
  } else if (kind == "u64") {
    const auto id = domain::IdSeed(ParseU64(value, "u64 seed"));
    bytes.assign(id.begin(), id.end());
  } else if (kind == "hex") {
    if (!util::HexDecode(value, &bytes)) {
      throw std::runtime_error("invalid hex seed: " + value);
    }
  } else {
    throw std::runtime_error("unknown seed kind: " + kind);
  }
  storage->push_back(std::move(bytes));
  return storage->back();
}

json HandlePda(const CliOptions& opts) {
  const auto positionals = Positionals(opts.args);
  const auto program = rpc::RequirePubkey(RequireArg(positionals, 0, "program"));
  std::vector<std::vector<std::uint8_t>> storage;
  storage.reserve(positionals.size());
  std::vector<chain::Seed> seeds;
  for (std::size_t i = 1; i < positionals.size(); ++i) {
    seeds.push_back(AppendSeed(positionals[i], &storage));
  }
  const auto derived = chain::FindProgramAddress(seeds, program);
  return json{{"address", derived.address.ToBase58()}, {"bump", derived.bump}};
}

json HandleMemoDecode(const std::string& text) {
  codec::DecodedMemo decoded;
  std::string error;
  if (codec::DecodeDomainMemo(text, &decoded, &error)) {
    return json{{"burn_amount", decoded.burn_amount},
                {"category", decoded.category},
                {"operation", decoded.operation},
                {"fields", RecordFields(decoded.record)}};
  }
  codec::BurnMemo memo;
  std::string envelope_error;
  if (!codec::DecodeMemoText(text, &memo, &envelope_error)) {
    throw std::runtime_error("not a burn memo: " + envelope_error);
  }
  return json{{"burn_amount", memo.burn_amount},
              {"version", memo.version},
              {"payload_hex", util::HexEncode(memo.payload)},
              {"record_error", error}};
}

bool IsOfflineCommand(const std::string& command) {
  return command == "pda" || command == "discriminator" || command == "ata" ||
         command == "memo-encode" || command == "memo-decode";
}

json HandleOffline(const CliOptions& opts, const config::NetworkConfig& network,
                   const std::string& command) {
  const auto positionals = Positionals(opts.args);
  if (command == "pda") {
    return HandlePda(opts);
  }
  if (command == "discriminator") {
    const auto disc = chain::InstructionDiscriminator(RequireArg(positionals, 0, "name"));
    return json{{"hex", util::HexEncode(disc)}, {"bytes", util::FormatByteList(disc)}};
  }
  if (command == "ata") {
    const auto owner = rpc::RequirePubkey(RequireArg(positionals, 0, "owner"));
    const auto mint = positionals.size() > 1 ? rpc::RequirePubkey(positionals[1])
                                             : network.programs.token_mint;
    const auto token_program = positionals.size() > 2 ? rpc::RequirePubkey(positionals[2])
                                                      : network.programs.token_program;
    return json{{"address", chain::AssociatedTokenAddress(owner, mint, token_program).ToBase58()}};
  }
  if (command == "memo-encode") {
    const auto burn = ParseU64(RequireArg(positionals, 0, "burn_units"), "burn amount");
    const auto& payload = RequireArg(positionals, 1, "payload_text");
    const std::vector<std::uint8_t> bytes(payload.begin(), payload.end());
    const auto text = engine::EncodePayloadMemo(bytes, burn);
    return json{{"memo", text}, {"length", text.size()}};
  }
  if (command == "memo-decode") {
    return HandleMemoDecode(RequireArg(positionals, 0, "memo_text"));
  }
  throw std::runtime_error("unknown command: " + command);
}

json HandleOnline(const CliOptions& opts, const Session& session, const std::string& command) {
  const auto positionals = Positionals(opts.args);
  const auto& client = *session.client;
  domain::ProfileService profiles(session.pipeline, session.network);
  domain::BlogService blogs(session.pipeline, session.network);
  domain::ForumService forum(session.pipeline, session.network);
  domain::ProjectService projects(session.pipeline, session.network);
  domain::BurnService burns(session.pipeline, session.network);
  domain::ChatService chat(session.pipeline, session.network);
  domain::TransferService transfers(session.pipeline, session.network);

  if (command == "version") {
    const auto version = client.GetVersion();
    return json{{"solana-core", version.core_version},
                {"feature-set", version.feature_set ? json(*version.feature_set) : json(nullptr)},
                {"endpoint", client.transport().endpoint()}};
  }
  if (command == "balance") {
    const auto address = rpc::RequirePubkey(RequireArg(positionals, 0, "address"));
    return json{{"lamports", client.GetBalance(address)}};
  }
  if (command == "blockhash") {
    const auto latest = client.GetLatestBlockhash();
    return json{{"blockhash", latest.blockhash},
                {"last_valid_block_height", latest.last_valid_block_height}};
  }
  if (command == "account") {
    const auto address = rpc::RequirePubkey(RequireArg(positionals, 0, "address"));
    const auto account = client.GetAccountInfo(address);
    if (!account) {
      return nullptr;
    }
    return json{{"lamports", account->lamports},
                {"owner", account->owner.ToBase58()},
                {"executable", account->executable},
                {"data_length", account->data.size()},
                {"data", util::Base64Encode(std::span<const std::uint8_t>(account->data))}};
  }
  if (command == "profile") {
    const auto profile = profiles.Fetch(rpc::RequirePubkey(RequireArg(positionals, 0, "user")));
    return profile ? ProfileToJson(*profile) : json(nullptr);
  }
  if (command == "blog") {
    const auto blog = blogs.Fetch(ParseU64(RequireArg(positionals, 0, "id"), "blog id"));
    return blog ? BlogToJson(*blog) : json(nullptr);
  }
  if (command == "post") {
    const auto post = forum.Fetch(ParseU64(RequireArg(positionals, 0, "id"), "post id"));
    return post ? PostToJson(*post) : json(nullptr);
  }
  if (command == "project") {
    const auto project =
        projects.Fetch(ParseU64(RequireArg(positionals, 0, "id"), "project id"));
    return project ? ProjectToJson(*project) : json(nullptr);
  }
  if (command == "leaderboard") {
    const auto board = projects.FetchLeaderboard();
    json entries = json::array();
    for (const auto& entry : board.entries) {
      entries.push_back(json{{"rank", entry.rank},
                             {"project_id", entry.project_id},
                             {"burned_amount", entry.burned_amount}});
    }
    return json{{"total_burned", board.total_burned}, {"entries", entries}};
  }
  if (command == "blog-stats") {
    const auto stats = blogs.FetchAll();
    json list = json::array();
    for (const auto& blog : stats.blogs) list.push_back(BlogToJson(blog));
    return json{{"total_blogs", stats.total_blogs},     {"valid_blogs", stats.valid_blogs},
                {"total_memos", stats.total_memos},     {"total_burned", stats.total_burned},
                {"total_minted", stats.total_minted},   {"blogs", list}};
  }
  if (command == "forum-stats") {
    const auto stats = forum.FetchAll();
    json list = json::array();
    for (const auto& post : stats.posts) list.push_back(PostToJson(post));
    return json{{"total_posts", stats.total_posts},
                {"valid_posts", stats.valid_posts},
                {"total_replies", stats.total_replies},
                {"total_burned", stats.total_burned},
                {"posts", list}};
  }
  if (command == "project-stats") {
    const auto stats = projects.FetchAll();
    json list = json::array();
    for (const auto& project : stats.projects) list.push_back(ProjectToJson(project));
    return json{{"total_projects", stats.total_projects},
                {"valid_projects", stats.valid_projects},
                {"total_memos", stats.total_memos},
                {"total_burned", stats.total_burned},
                {"projects", list}};
  }
  if (command == "burn-stats") {
    if (!positionals.empty()) {
      const auto stats = burns.FetchUserStats(rpc::RequirePubkey(positionals[0]));
      if (!stats) {
        return nullptr;
      }
      return json{{"user", stats->user.ToBase58()},
                  {"total_burned", stats->total_burned},
                  {"burn_count", stats->burn_count},
                  {"last_burn_time", stats->last_burn_time}};
    }
    std::size_t limit = 20;
    if (auto value = FindPrefixedOptionValue(opts.args, "--limit=")) {
      limit = static_cast<std::size_t>(ParseU64(*value, "--limit"));
    }
    json list = json::array();
    for (const auto& burner : burns.TopBurners(limit)) {
      list.push_back(json{{"user", burner.user.ToBase58()},
                          {"total_burned", burner.total_burned},
                          {"burn_count", burner.burn_count}});
    }
    return list;
  }
  if (command == "chat-stats") {
    const auto stats = chat.FetchAll();
    json list = json::array();
    for (const auto& group : stats.groups) list.push_back(ChatGroupToJson(group));
    return json{{"total_groups", stats.total_groups},
                {"valid_groups", stats.valid_groups},
                {"total_memos", stats.total_memos},
                {"total_burned", stats.total_burned},
                {"groups", list}};
  }
  if (command == "chat-group") {
    const auto group = chat.Fetch(ParseU64(RequireArg(positionals, 0, "id"), "group id"));
    return group ? ChatGroupToJson(*group) : json(nullptr);
  }
  if (command == "chat-messages") {
    const auto group_id = ParseU64(RequireArg(positionals, 0, "group_id"), "group id");
    std::size_t limit = domain::kDefaultChatMessageLimit;
    if (auto value = FindPrefixedOptionValue(opts.args, "--limit=")) {
      limit = static_cast<std::size_t>(ParseU64(*value, "--limit"));
    }
    const auto page =
        chat.Messages(group_id, limit, FindPrefixedOptionValue(opts.args, "--before="));
    json list = json::array();
    for (const auto& message : page.messages) {
      list.push_back(json{{"signature", message.signature},
                          {"sender", message.sender},
                          {"message", message.message},
                          {"receiver", OptionalJson(message.receiver)},
                          {"reply_to_sig", OptionalJson(message.reply_to_sig)},
                          {"timestamp", message.timestamp},
                          {"slot", message.slot}});
    }
    return json{{"group_id", page.group_id}, {"has_more", page.has_more}, {"messages", list}};
  }
  if (command == "build-chat") {
    const auto user = rpc::RequirePubkey(RequireArg(positionals, 0, "user"));
    codec::ChatMessageData record;
    record.group_id = ParseU64(RequireArg(positionals, 1, "group_id"), "group id");
    record.sender = user.ToBase58();
    record.message = RequireArg(positionals, 2, "message");
    record.reply_to_sig = FindPrefixedOptionValue(opts.args, "--reply-to=");
    return BuiltToJson(chat.BuildSendMessage(user, record));
  }
  if (command == "build-transfer") {
    const auto from = rpc::RequirePubkey(RequireArg(positionals, 0, "from"));
    const auto lamports = ParseU64(RequireArg(positionals, 2, "lamports"), "lamports");
    return BuiltToJson(
        transfers.BuildNativeTransfer(from, RequireArg(positionals, 1, "to"), lamports));
  }
  if (command == "build-token-transfer") {
    const auto from = rpc::RequirePubkey(RequireArg(positionals, 0, "from"));
    const auto units = ParseU64(RequireArg(positionals, 2, "units"), "token units");
    return BuiltToJson(transfers.BuildTokenTransfer(from, RequireArg(positionals, 1, "to"), units));
  }
  if (command == "build-burn") {
    const auto user = rpc::RequirePubkey(RequireArg(positionals, 0, "user"));
    const auto tokens = ParseU64(RequireArg(positionals, 1, "tokens"), "token amount");
    if (tokens > domain::kMaxBurnPerTx / domain::kUnitsPerToken) {
      rpc::ThrowInvalidParameter("token amount " + std::to_string(tokens) + " is too large");
    }
    const auto& message = RequireArg(positionals, 2, "message");
    const std::vector<std::uint8_t> payload(message.begin(), message.end());
    return BuiltToJson(burns.BuildBurn(user, tokens * domain::kUnitsPerToken, payload));
  }
  if (command == "build-create-profile") {
    const auto user = rpc::RequirePubkey(RequireArg(positionals, 0, "user"));
    codec::ProfileCreationData record;
    record.user_pubkey = user.ToBase58();
    record.username = RequireArg(positionals, 1, "username");
    record.image = FindPrefixedOptionValue(opts.args, "--image=").value_or("");
    record.about_me = FindPrefixedOptionValue(opts.args, "--about=");
    std::uint64_t burn = domain::kProfileMinBurn;
    if (auto value = FindPrefixedOptionValue(opts.args, "--burn=")) {
      burn = ParseU64(*value, "--burn") * domain::kUnitsPerToken;
    }
    return BuiltToJson(profiles.BuildCreate(user, record, burn));
  }
  if (command == "build-create-post") {
    const auto user = rpc::RequirePubkey(RequireArg(positionals, 0, "user"));
    codec::PostCreationData record;
    record.creator = user.ToBase58();
    record.title = RequireArg(positionals, 1, "title");
    record.content = RequireArg(positionals, 2, "content");
    record.image = FindPrefixedOptionValue(opts.args, "--image=").value_or("");
    std::uint64_t burn = domain::kPostMinBurn;
    if (auto value = FindPrefixedOptionValue(opts.args, "--burn=")) {
      burn = ParseU64(*value, "--burn") * domain::kUnitsPerToken;
    }
    return BuiltToJson(forum.BuildCreatePost(user, record, burn));
  }
  if (command == "send") {
    tx::Transaction transaction;
    std::string error;
    if (!tx::DecodeTransactionBase64(RequireArg(positionals, 0, "signed_transaction_base64"),
                                     &transaction, &error)) {
      rpc::ThrowInvalidParameter("invalid transaction: " + error);
    }
    return json{{"signature", session.pipeline->Submit(transaction)}};
  }
  throw std::runtime_error("unknown command: " + command);
}

void PrintResponse(const CliOptions& opts, const json& response) {
  if (opts.raw) {
    std::cout << response.dump() << "\n";
    return;
  }
  if (response.is_null()) {
    std::cout << "not found\n";
    return;
  }
  std::cout << response.dump(2) << "\n";
}

}  // namespace

int main(int argc, char** argv) {
  try {
    auto opts = ParseOptions(argc, argv);
    if (opts.log_level) {
      util::SetLogLevel(util::ParseLogLevelString(*opts.log_level));
    } else {
      util::SetLogLevel(util::LogLevel::kWarn);
    }
    if (opts.log_file) {
      util::EnableLogFile(*opts.log_file, kLogFileMaxBytes, kLogFileCount);
    }
    if (opts.args.empty()) {
      PrintUsage();
      return 1;
    }
    const auto net = config::NetworkFromString(opts.network);
    if (!net) {
      throw std::runtime_error("unknown network: " + opts.network);
    }
    const auto& network = config::ConfigFor(*net);
    const std::string command = opts.args.front();

    if (IsOfflineCommand(command)) {
      PrintResponse(opts, HandleOffline(opts, network, command));
    } else {
      const auto session = OpenSession(opts, network);
      PrintResponse(opts, HandleOnline(opts, session, command));
    }
  } catch (const x1memo::rpc::RpcError& ex) {
    std::cerr << "x1memo-cli: " << ex.what() << "\n";
    if (ex.detail()) {
      std::cerr << "  detail: " << *ex.detail() << "\n";
    }
    return 1;
  } catch (const std::exception& ex) {
    std::cerr << "x1memo-cli: " << ex.what() << "\n";
    return 1;
  }
  return 0;
}
