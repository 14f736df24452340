#include "accounts/parser.hpp"

#include <algorithm>
#include <limits>

namespace x1memo::accounts {

namespace {

bool Failed(const codec::BorshReader& reader, ParseError* error) {
  if (error) {
    error->kind = reader.failure();
    error->message = reader.error();
  }
  return false;
}

}  // namespace

std::optional<std::uint32_t> BurnLeaderboard::RankOf(std::uint64_t project_id) const {
  for (const auto& entry : entries) {
    if (entry.project_id == project_id) {
      return entry.rank;
    }
  }
  return std::nullopt;
}

bool ParseUserProfile(std::span<const std::uint8_t> data, UserProfile* out, ParseError* error) {
  codec::BorshReader reader(data);
  UserProfile profile;
  if (!reader.Skip(kAccountDiscriminatorSize, "discriminator") ||
      !reader.ReadPubkey(&profile.user, "user") ||
      !reader.ReadString(&profile.username, "username") ||
      !reader.ReadString(&profile.image, "image") ||
      !reader.ReadI64(&profile.created_at, "created_at") ||
      !reader.ReadI64(&profile.last_updated, "last_updated") ||
      !reader.ReadOptionString(&profile.about_me, "about_me") ||
      !reader.ReadU8(&profile.bump, "bump")) {
    return Failed(reader, error);
  }
  *out = std::move(profile);
  return true;
}

bool ParseBlogInfo(std::span<const std::uint8_t> data, BlogInfo* out, ParseError* error) {
  codec::BorshReader reader(data);
  BlogInfo blog;
  if (!reader.Skip(kAccountDiscriminatorSize, "discriminator") ||
      !reader.ReadU64(&blog.blog_id, "blog_id") ||
      !reader.ReadPubkey(&blog.creator, "creator") ||
      !reader.ReadI64(&blog.created_at, "created_at") ||
      !reader.ReadI64(&blog.last_updated, "last_updated") ||
      !reader.ReadString(&blog.name, "name") ||
      !reader.ReadString(&blog.description, "description") ||
      !reader.ReadString(&blog.image, "image") ||
      !reader.ReadU64(&blog.memo_count, "memo_count") ||
      !reader.ReadU64(&blog.burned_amount, "burned_amount") ||
      !reader.ReadU64(&blog.minted_amount, "minted_amount") ||
      !reader.ReadI64(&blog.last_memo_time, "last_memo_time") ||
      !reader.ReadU8(&blog.bump, "bump")) {
    return Failed(reader, error);
  }
  *out = std::move(blog);
  return true;
}

bool ParsePostInfo(std::span<const std::uint8_t> data, PostInfo* out, ParseError* error) {
  codec::BorshReader reader(data);
  PostInfo post;
  if (!reader.Skip(kAccountDiscriminatorSize, "discriminator") ||
      !reader.ReadU64(&post.post_id, "post_id") ||
      !reader.ReadPubkey(&post.creator, "creator") ||
      !reader.ReadI64(&post.created_at, "created_at") ||
      !reader.ReadI64(&post.last_updated, "last_updated") ||
      !reader.ReadString(&post.title, "title") ||
      !reader.ReadString(&post.content, "content") ||
      !reader.ReadString(&post.image, "image") ||
      !reader.ReadU64(&post.reply_count, "reply_count") ||
      !reader.ReadU64(&post.burned_amount, "burned_amount") ||
      !reader.ReadI64(&post.last_reply_time, "last_reply_time") ||
      !reader.ReadU8(&post.bump, "bump")) {
    return Failed(reader, error);
  }
  *out = std::move(post);
  return true;
}

bool ParseProjectInfo(std::span<const std::uint8_t> data, ProjectInfo* out, ParseError* error) {
  codec::BorshReader reader(data);
  ProjectInfo project;
  if (!reader.Skip(kAccountDiscriminatorSize, "discriminator") ||
      !reader.ReadU64(&project.project_id, "project_id") ||
      !reader.ReadPubkey(&project.creator, "creator") ||
      !reader.ReadI64(&project.created_at, "created_at") ||
      !reader.ReadI64(&project.last_updated, "last_updated") ||
      !reader.ReadString(&project.name, "name") ||
      !reader.ReadString(&project.description, "description") ||
      !reader.ReadString(&project.image, "image") ||
      !reader.ReadString(&project.website, "website") ||
      !reader.ReadStringVector(&project.tags, "tags") ||
      !reader.ReadU64(&project.memo_count, "memo_count") ||
      !reader.ReadU64(&project.burned_amount, "burned_amount") ||
      !reader.ReadI64(&project.last_memo_time, "last_memo_time") ||
      !reader.ReadU8(&project.bump, "bump")) {
    return Failed(reader, error);
  }
  *out = std::move(project);
  return true;
}

bool ParseChatGroupInfo(std::span<const std::uint8_t> data, ChatGroupInfo* out,
                        ParseError* error) {
  codec::BorshReader reader(data);
  ChatGroupInfo group;
  if (!reader.Skip(kAccountDiscriminatorSize, "discriminator") ||
      !reader.ReadU64(&group.group_id, "group_id") ||
      !reader.ReadPubkey(&group.creator, "creator") ||
      !reader.ReadI64(&group.created_at, "created_at") ||
      !reader.ReadString(&group.name, "name") ||
      !reader.ReadString(&group.description, "description") ||
      !reader.ReadString(&group.image, "image") ||
      !reader.ReadStringVector(&group.tags, "tags") ||
      !reader.ReadU64(&group.memo_count, "memo_count") ||
      !reader.ReadU64(&group.burned_amount, "burned_amount") ||
      !reader.ReadI64(&group.min_memo_interval, "min_memo_interval") ||
      !reader.ReadI64(&group.last_memo_time, "last_memo_time") ||
      !reader.ReadU8(&group.bump, "bump")) {
    return Failed(reader, error);
  }
  *out = std::move(group);
  return true;
}

bool ParseUserGlobalBurnStats(std::span<const std::uint8_t> data, UserGlobalBurnStats* out,
                              ParseError* error) {
  codec::BorshReader reader(data);
  UserGlobalBurnStats stats;
  if (!reader.Skip(kAccountDiscriminatorSize, "discriminator") ||
      !reader.ReadPubkey(&stats.user, "user") ||
      !reader.ReadU64(&stats.total_burned, "total_burned") ||
      !reader.ReadU64(&stats.burn_count, "burn_count") ||
      !reader.ReadI64(&stats.last_burn_time, "last_burn_time") ||
      !reader.ReadU8(&stats.bump, "bump")) {
    return Failed(reader, error);
  }
  *out = stats;
  return true;
}

bool ParseBurnLeaderboard(std::span<const std::uint8_t> data, BurnLeaderboard* out,
                          ParseError* error) {
  codec::BorshReader reader(data);
  std::uint32_t count = 0;
  if (!reader.Skip(kAccountDiscriminatorSize, "discriminator") ||
      !reader.ReadU32(&count, "entries")) {
    return Failed(reader, error);
  }
  BurnLeaderboard board;
  // Each entry is 16 bytes; the reader rejects a count the data cannot hold.
  board.entries.reserve(std::min<std::size_t>(count, reader.remaining() / 16));
  for (std::uint32_t i = 0; i < count; ++i) {
    LeaderboardEntry entry;
    const std::string field = "entries[" + std::to_string(i) + "]";
    if (!reader.ReadU64(&entry.project_id, field + ".project_id") ||
        !reader.ReadU64(&entry.burned_amount, field + ".burned_amount")) {
      return Failed(reader, error);
    }
    entry.rank = i + 1;
    board.total_burned =
        entry.burned_amount > std::numeric_limits<std::uint64_t>::max() - board.total_burned
            ? std::numeric_limits<std::uint64_t>::max()
            : board.total_burned + entry.burned_amount;
    board.entries.push_back(entry);
  }
  *out = std::move(board);
  return true;
}

bool ParseGlobalCounter(std::span<const std::uint8_t> data, std::uint64_t* total,
                        ParseError* error) {
  codec::BorshReader reader(data);
  std::uint64_t value = 0;
  if (!reader.Skip(kAccountDiscriminatorSize, "discriminator") ||
      !reader.ReadU64(&value, "total")) {
    return Failed(reader, error);
  }
  *total = value;
  return true;
}

}  // namespace x1memo::accounts
