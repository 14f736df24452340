#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "accounts/parser.hpp"
#include "codec/borsh.hpp"

namespace x1memo::test {

// Serialized account images in the layouts the memo programs store, each
// prefixed with an 8-byte account discriminator.

inline std::vector<std::uint8_t> AccountHeader() {
  return std::vector<std::uint8_t>(accounts::kAccountDiscriminatorSize, 0x5A);
}

inline std::vector<std::uint8_t> ProfileAccount(const accounts::UserProfile& profile) {
  auto out = AccountHeader();
  codec::WritePubkey(&out, profile.user);
  codec::WriteString(&out, profile.username);
  codec::WriteString(&out, profile.image);
  codec::WriteI64(&out, profile.created_at);
  codec::WriteI64(&out, profile.last_updated);
  codec::WriteOptionString(&out, profile.about_me);
  codec::WriteU8(&out, profile.bump);
  return out;
}

inline std::vector<std::uint8_t> BlogAccount(const accounts::BlogInfo& blog) {
  auto out = AccountHeader();
  codec::WriteU64(&out, blog.blog_id);
  codec::WritePubkey(&out, blog.creator);
  codec::WriteI64(&out, blog.created_at);
  codec::WriteI64(&out, blog.last_updated);
  codec::WriteString(&out, blog.name);
  codec::WriteString(&out, blog.description);
  codec::WriteString(&out, blog.image);
  codec::WriteU64(&out, blog.memo_count);
  codec::WriteU64(&out, blog.burned_amount);
  codec::WriteU64(&out, blog.minted_amount);
  codec::WriteI64(&out, blog.last_memo_time);
  codec::WriteU8(&out, blog.bump);
  return out;
}

inline std::vector<std::uint8_t> PostAccount(const accounts::PostInfo& post) {
  auto out = AccountHeader();
  codec::WriteU64(&out, post.post_id);
  codec::WritePubkey(&out, post.creator);
  codec::WriteI64(&out, post.created_at);
  codec::WriteI64(&out, post.last_updated);
  codec::WriteString(&out, post.title);
  codec::WriteString(&out, post.content);
  codec::WriteString(&out, post.image);
  codec::WriteU64(&out, post.reply_count);
  codec::WriteU64(&out, post.burned_amount);
  codec::WriteI64(&out, post.last_reply_time);
  codec::WriteU8(&out, post.bump);
  return out;
}

inline std::vector<std::uint8_t> ProjectAccount(const accounts::ProjectInfo& project) {
  auto out = AccountHeader();
  codec::WriteU64(&out, project.project_id);
  codec::WritePubkey(&out, project.creator);
  codec::WriteI64(&out, project.created_at);
  codec::WriteI64(&out, project.last_updated);
  codec::WriteString(&out, project.name);
  codec::WriteString(&out, project.description);
  codec::WriteString(&out, project.image);
  codec::WriteString(&out, project.website);
  codec::WriteStringVector(&out, project.tags);
  codec::WriteU64(&out, project.memo_count);
  codec::WriteU64(&out, project.burned_amount);
  codec::WriteI64(&out, project.last_memo_time);
  codec::WriteU8(&out, project.bump);
  return out;
}

inline std::vector<std::uint8_t> ChatGroupAccount(const accounts::ChatGroupInfo& group) {
  auto out = AccountHeader();
  codec::WriteU64(&out, group.group_id);
  codec::WritePubkey(&out, group.creator);
  codec::WriteI64(&out, group.created_at);
  codec::WriteString(&out, group.name);
  codec::WriteString(&out, group.description);
  codec::WriteString(&out, group.image);
  codec::WriteStringVector(&out, group.tags);
  codec::WriteU64(&out, group.memo_count);
  codec::WriteU64(&out, group.burned_amount);
  codec::WriteI64(&out, group.min_memo_interval);
  codec::WriteI64(&out, group.last_memo_time);
  codec::WriteU8(&out, group.bump);
  return out;
}

inline std::vector<std::uint8_t> BurnStatsAccount(const accounts::UserGlobalBurnStats& stats) {
  auto out = AccountHeader();
  codec::WritePubkey(&out, stats.user);
  codec::WriteU64(&out, stats.total_burned);
  codec::WriteU64(&out, stats.burn_count);
  codec::WriteI64(&out, stats.last_burn_time);
  codec::WriteU8(&out, stats.bump);
  return out;
}

inline std::vector<std::uint8_t> CounterAccount(std::uint64_t total) {
  auto out = AccountHeader();
  codec::WriteU64(&out, total);
  return out;
}

inline std::vector<std::uint8_t> LeaderboardAccount(
    const std::vector<std::pair<std::uint64_t, std::uint64_t>>& entries) {
  auto out = AccountHeader();
  codec::WriteU32(&out, static_cast<std::uint32_t>(entries.size()));
  for (const auto& [project_id, burned] : entries) {
    codec::WriteU64(&out, project_id);
    codec::WriteU64(&out, burned);
  }
  return out;
}

}  // namespace x1memo::test
