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

constexpr std::uint64_t kPostMinBurn = 1'000'000;

chain::Pubkey ForumCounterAddress(const chain::Pubkey& forum_program);
chain::Pubkey PostAddress(std::uint64_t post_id, const chain::Pubkey& forum_program);

struct ForumStatistics {
  std::uint64_t total_posts{0};
  std::uint64_t valid_posts{0};
  std::uint64_t total_replies{0};
  std::uint64_t total_burned{0};
  std::vector<accounts::PostInfo> posts;
};

// A burn_for_post or mint_for_post memo replayed from a post's history.
struct PostReply {
  std::string signature;
  std::string user;
  std::string message;
  std::int64_t timestamp{0};
  std::uint64_t slot{0};
  // Zero for mints.
  std::uint64_t burn_amount{0};
  bool is_mint{false};
};

struct PostReplies {
  std::uint64_t post_id{0};
  // Newest first.
  std::vector<PostReply> replies;
  bool has_more{false};
};

class ForumService {
 public:
  ForumService(std::shared_ptr<const engine::TransactionPipeline> pipeline,
               config::NetworkConfig network);

  engine::OperationDescriptor DescribeCreatePost(const chain::Pubkey& user,
                                                 const codec::PostCreationData& record,
                                                 std::uint64_t burn_amount) const;
  engine::OperationDescriptor DescribeBurnForPost(const chain::Pubkey& user,
                                                  const codec::PostBurnData& record,
                                                  std::uint64_t burn_amount) const;
  engine::OperationDescriptor DescribeMintForPost(const chain::Pubkey& user,
                                                  const codec::PostMintData& record) const;

  // Assigns the next id from the global counter before building.
  engine::BuiltTransaction BuildCreatePost(const chain::Pubkey& user,
                                           codec::PostCreationData record,
                                           std::uint64_t burn_amount) const;
  engine::BuiltTransaction BuildBurnForPost(const chain::Pubkey& user,
                                            const codec::PostBurnData& record,
                                            std::uint64_t burn_amount) const;
  engine::BuiltTransaction BuildMintForPost(const chain::Pubkey& user,
                                            const codec::PostMintData& record) const;

  std::uint64_t TotalPosts() const;
  std::optional<accounts::PostInfo> Fetch(std::uint64_t post_id) const;
  bool Exists(std::uint64_t post_id) const;
  ForumStatistics FetchAll() const;
  // Throws RpcError(kOther) when the post does not exist.
  PostReplies Replies(std::uint64_t post_id, std::size_t limit,
                      const std::optional<std::string>& before = std::nullopt) const;

 private:
  std::shared_ptr<const engine::TransactionPipeline> pipeline_;
  config::NetworkConfig network_;
};

// Memo text lengths the forum operations would produce.
std::size_t EstimateCreatePostMemoSize(const codec::PostCreationData& record);
std::size_t EstimateBurnForPostMemoSize(const codec::PostBurnData& record);
std::size_t EstimateMintForPostMemoSize(const codec::PostMintData& record);

}  // namespace x1memo::domain
