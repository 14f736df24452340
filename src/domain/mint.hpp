#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "chain/pubkey.hpp"
#include "config/network.hpp"
#include "engine/pipeline.hpp"

namespace x1memo::domain {

// Reward per mint for a circulating supply in [min, max), in base units.
struct SupplyTier {
  std::uint64_t min{0};
  std::uint64_t max{0};
  double reward{0.0};
  std::string label;
};

const std::vector<SupplyTier>& SupplyTiers();
const SupplyTier& SupplyTierFor(std::uint64_t supply);
// Tokens minted per call at |supply|.
double MintReward(std::uint64_t supply);
// "+1.000000 MEMO".
std::string FormatMintReward(double reward);

class MintService {
 public:
  MintService(std::shared_ptr<const engine::TransactionPipeline> pipeline,
              config::NetworkConfig network);

  // |memo| is placed as-is and must be 69-800 bytes. A create-token-account
  // instruction precedes the mint when |create_token_account| is set.
  engine::OperationDescriptor DescribeMint(const chain::Pubkey& user, std::string_view memo,
                                           bool create_token_account) const;
  // Adds the create-token-account instruction when the user's token account
  // does not exist yet.
  engine::BuiltTransaction BuildMint(const chain::Pubkey& user, std::string_view memo) const;

  std::uint64_t TokenSupply() const;

 private:
  std::shared_ptr<const engine::TransactionPipeline> pipeline_;
  config::NetworkConfig network_;
};

}  // namespace x1memo::domain
