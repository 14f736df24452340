#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "chain/pubkey.hpp"
#include "codec/records.hpp"
#include "rpc/client.hpp"

namespace x1memo::domain {

constexpr std::size_t kMaxHistoryLimit = 1000;

struct MemoHistoryEntry {
  std::string signature;
  std::uint64_t slot{0};
  std::int64_t block_time{0};
  codec::DecodedMemo memo;
};

struct MemoHistory {
  // Newest first.
  std::vector<MemoHistoryEntry> entries;
  // The page was full; more signatures may precede |before|.
  bool has_more{false};
};

// Replays the memos attached to transactions touching |address|. Memos that
// are not domain records and failed transactions are skipped. |limit| must be
// within 1..kMaxHistoryLimit; throws RpcError(kInvalidParameter) otherwise.
MemoHistory ReplayMemoHistory(const rpc::RpcClient& client, const chain::Pubkey& address,
                              std::size_t limit,
                              const std::optional<std::string>& before = std::nullopt);

}  // namespace x1memo::domain
