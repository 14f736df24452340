#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "chain/pubkey.hpp"
#include "config/network.hpp"
#include "engine/pipeline.hpp"

namespace x1memo::domain {

// Decimals of the memo token mint.
constexpr std::uint8_t kTokenDecimals = 6;

// Plain value transfers. They carry no memo and go through the same
// simulate-then-finalize pipeline as the memo operations.
class TransferService {
 public:
  TransferService(std::shared_ptr<const engine::TransactionPipeline> pipeline,
                  config::NetworkConfig network);

  engine::OperationDescriptor DescribeNativeTransfer(const chain::Pubkey& from,
                                                     const chain::Pubkey& to,
                                                     std::uint64_t lamports) const;
  // The destination token account is created first when
  // |create_destination| is set; the sender pays for it.
  engine::OperationDescriptor DescribeTokenTransfer(const chain::Pubkey& from,
                                                    const chain::Pubkey& to,
                                                    std::uint64_t amount,
                                                    bool create_destination) const;

  // |to_address| is Base58; a malformed one throws RpcError(kInvalidAddress).
  engine::BuiltTransaction BuildNativeTransfer(const chain::Pubkey& from,
                                               const std::string& to_address,
                                               std::uint64_t lamports) const;
  engine::BuiltTransaction BuildTokenTransfer(const chain::Pubkey& from,
                                              const std::string& to_address,
                                              std::uint64_t amount) const;

 private:
  std::shared_ptr<const engine::TransactionPipeline> pipeline_;
  config::NetworkConfig network_;
};

}  // namespace x1memo::domain
