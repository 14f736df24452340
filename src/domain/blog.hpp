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
#include "domain/history.hpp"
#include "engine/pipeline.hpp"

namespace x1memo::domain {

constexpr std::uint64_t kBlogMinBurn = 1'000'000;

chain::Pubkey BlogCounterAddress(const chain::Pubkey& blog_program);
chain::Pubkey BlogAddress(std::uint64_t blog_id, const chain::Pubkey& blog_program);

struct BlogStatistics {
  std::uint64_t total_blogs{0};
  std::uint64_t valid_blogs{0};
  std::uint64_t total_memos{0};
  std::uint64_t total_burned{0};
  std::uint64_t total_minted{0};
  std::vector<accounts::BlogInfo> blogs;
};

class BlogService {
 public:
  BlogService(std::shared_ptr<const engine::TransactionPipeline> pipeline,
              config::NetworkConfig network);

  // Targets the blog named by record.blog_id.
  engine::OperationDescriptor DescribeCreate(const chain::Pubkey& user,
                                             const codec::BlogCreationData& record,
                                             std::uint64_t burn_amount) const;
  engine::OperationDescriptor DescribeUpdate(const chain::Pubkey& user,
                                             const codec::BlogUpdateData& record,
                                             std::uint64_t burn_amount) const;
  engine::OperationDescriptor DescribeBurn(const chain::Pubkey& user,
                                           const codec::BlogBurnData& record,
                                           std::uint64_t burn_amount) const;
  engine::OperationDescriptor DescribeMint(const chain::Pubkey& user,
                                           const codec::BlogMintData& record) const;

  // Assigns the next id from the global counter before building.
  engine::BuiltTransaction BuildCreate(const chain::Pubkey& user, codec::BlogCreationData record,
                                       std::uint64_t burn_amount) const;
  engine::BuiltTransaction BuildUpdate(const chain::Pubkey& user,
                                       const codec::BlogUpdateData& record,
                                       std::uint64_t burn_amount) const;
  engine::BuiltTransaction BuildBurn(const chain::Pubkey& user, const codec::BlogBurnData& record,
                                     std::uint64_t burn_amount) const;
  engine::BuiltTransaction BuildMint(const chain::Pubkey& user,
                                     const codec::BlogMintData& record) const;

  std::uint64_t TotalBlogs() const;
  std::optional<accounts::BlogInfo> Fetch(std::uint64_t blog_id) const;
  bool Exists(std::uint64_t blog_id) const;
  BlogStatistics FetchAll() const;
  MemoHistory History(std::uint64_t blog_id, std::size_t limit,
                      const std::optional<std::string>& before = std::nullopt) const;

 private:
  std::vector<tx::AccountMeta> BurnAccounts(const chain::Pubkey& user,
                                            std::uint64_t blog_id) const;

  std::shared_ptr<const engine::TransactionPipeline> pipeline_;
  config::NetworkConfig network_;
};

}  // namespace x1memo::domain
