#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "accounts/parser.hpp"
#include "chain/pubkey.hpp"
#include "codec/records.hpp"
#include "config/network.hpp"
#include "engine/pipeline.hpp"

namespace x1memo::domain {

constexpr std::uint64_t kProfileMinBurn = 420'000'000;

// ["profile", user] under the profile program.
chain::Pubkey ProfileAddress(const chain::Pubkey& user, const chain::Pubkey& profile_program);

class ProfileService {
 public:
  ProfileService(std::shared_ptr<const engine::TransactionPipeline> pipeline,
                 config::NetworkConfig network);

  // Describe* validate their input and never touch the network.
  engine::OperationDescriptor DescribeCreate(const chain::Pubkey& user,
                                             const codec::ProfileCreationData& record,
                                             std::uint64_t burn_amount) const;
  engine::OperationDescriptor DescribeUpdate(const chain::Pubkey& user,
                                             const codec::ProfileUpdateData& record,
                                             std::uint64_t burn_amount) const;
  engine::OperationDescriptor DescribeDelete(const chain::Pubkey& user) const;

  engine::BuiltTransaction BuildCreate(const chain::Pubkey& user,
                                       const codec::ProfileCreationData& record,
                                       std::uint64_t burn_amount) const;
  engine::BuiltTransaction BuildUpdate(const chain::Pubkey& user,
                                       const codec::ProfileUpdateData& record,
                                       std::uint64_t burn_amount) const;
  engine::BuiltTransaction BuildDelete(const chain::Pubkey& user) const;

  // nullopt when the user has no profile.
  std::optional<accounts::UserProfile> Fetch(const chain::Pubkey& user) const;
  // One entry per input in input order; lookups that fail are logged and
  // reported as nullopt.
  std::vector<std::pair<chain::Pubkey, std::optional<accounts::UserProfile>>> FetchBatch(
      const std::vector<chain::Pubkey>& users) const;

 private:
  std::shared_ptr<const engine::TransactionPipeline> pipeline_;
  config::NetworkConfig network_;
};

}  // namespace x1memo::domain
