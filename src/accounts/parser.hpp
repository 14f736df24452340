#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "chain/pubkey.hpp"
#include "codec/borsh.hpp"

namespace x1memo::accounts {

// Account layouts of the memo programs. Each begins with an 8-byte account
// discriminator, which is skipped. Trailing bytes beyond the last field are
// tolerated since accounts are allocated at their maximum size.

constexpr std::size_t kAccountDiscriminatorSize = 8;
constexpr std::size_t kUserGlobalBurnStatsSize = 65;
constexpr std::size_t kGlobalCounterMinSize = 16;

struct ParseError {
  codec::ReadFailure kind{codec::ReadFailure::kNone};
  std::string message;
};

struct UserProfile {
  chain::Pubkey user;
  std::string username;
  std::string image;
  std::int64_t created_at{0};
  std::int64_t last_updated{0};
  std::optional<std::string> about_me;
  std::uint8_t bump{0};
};

struct BlogInfo {
  std::uint64_t blog_id{0};
  chain::Pubkey creator;
  std::int64_t created_at{0};
  std::int64_t last_updated{0};
  std::string name;
  std::string description;
  std::string image;
  std::uint64_t memo_count{0};
  std::uint64_t burned_amount{0};
  std::uint64_t minted_amount{0};
  std::int64_t last_memo_time{0};
  std::uint8_t bump{0};
};

struct PostInfo {
  std::uint64_t post_id{0};
  chain::Pubkey creator;
  std::int64_t created_at{0};
  std::int64_t last_updated{0};
  std::string title;
  std::string content;
  std::string image;
  std::uint64_t reply_count{0};
  std::uint64_t burned_amount{0};
  std::int64_t last_reply_time{0};
  std::uint8_t bump{0};
};

struct ProjectInfo {
  std::uint64_t project_id{0};
  chain::Pubkey creator;
  std::int64_t created_at{0};
  std::int64_t last_updated{0};
  std::string name;
  std::string description;
  std::string image;
  std::string website;
  std::vector<std::string> tags;
  std::uint64_t memo_count{0};
  std::uint64_t burned_amount{0};
  std::int64_t last_memo_time{0};
  std::uint8_t bump{0};
};

struct ChatGroupInfo {
  std::uint64_t group_id{0};
  chain::Pubkey creator;
  std::int64_t created_at{0};
  std::string name;
  std::string description;
  std::string image;
  std::vector<std::string> tags;
  std::uint64_t memo_count{0};
  std::uint64_t burned_amount{0};
  // Seconds a sender must wait between messages.
  std::int64_t min_memo_interval{0};
  std::int64_t last_memo_time{0};
  std::uint8_t bump{0};
};

struct UserGlobalBurnStats {
  chain::Pubkey user;
  std::uint64_t total_burned{0};
  std::uint64_t burn_count{0};
  std::int64_t last_burn_time{0};
  std::uint8_t bump{0};
};

struct LeaderboardEntry {
  std::uint64_t project_id{0};
  std::uint64_t burned_amount{0};
  // 1-based position in the stored order.
  std::uint32_t rank{0};
};

struct BurnLeaderboard {
  std::vector<LeaderboardEntry> entries;
  // Saturating sum over the entries.
  std::uint64_t total_burned{0};

  std::optional<std::uint32_t> RankOf(std::uint64_t project_id) const;
};

bool ParseUserProfile(std::span<const std::uint8_t> data, UserProfile* out, ParseError* error);
bool ParseBlogInfo(std::span<const std::uint8_t> data, BlogInfo* out, ParseError* error);
bool ParsePostInfo(std::span<const std::uint8_t> data, PostInfo* out, ParseError* error);
bool ParseProjectInfo(std::span<const std::uint8_t> data, ProjectInfo* out, ParseError* error);
bool ParseChatGroupInfo(std::span<const std::uint8_t> data, ChatGroupInfo* out,
                        ParseError* error);
bool ParseUserGlobalBurnStats(std::span<const std::uint8_t> data, UserGlobalBurnStats* out,
                              ParseError* error);
bool ParseBurnLeaderboard(std::span<const std::uint8_t> data, BurnLeaderboard* out,
                          ParseError* error);
// Global counters hold the number of entities created so far, which is
// also the id of the next one.
bool ParseGlobalCounter(std::span<const std::uint8_t> data, std::uint64_t* total,
                        ParseError* error);

}  // namespace x1memo::accounts
