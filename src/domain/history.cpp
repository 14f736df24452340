#include "domain/history.hpp"

#include <algorithm>

#include "rpc/error.hpp"
#include "util/log.hpp"

namespace x1memo::domain {

MemoHistory ReplayMemoHistory(const rpc::RpcClient& client, const chain::Pubkey& address,
                              std::size_t limit, const std::optional<std::string>& before) {
  if (limit == 0 || limit > kMaxHistoryLimit) {
    rpc::ThrowInvalidParameter("limit must be between 1 and " + std::to_string(kMaxHistoryLimit));
  }
  const auto signatures = client.GetSignaturesForAddress(address, limit, before);

  MemoHistory history;
  for (const auto& info : signatures) {
    if (info.failed || !info.memo || info.signature.empty()) {
      continue;
    }
    MemoHistoryEntry entry;
    std::string error;
    if (!codec::DecodeDomainMemo(rpc::StripMemoLengthPrefix(*info.memo), &entry.memo, &error)) {
      util::LogDebug("history", "skipping memo of " + info.signature + ": " + error);
      continue;
    }
    entry.signature = info.signature;
    entry.slot = info.slot;
    entry.block_time = info.block_time.value_or(0);
    history.entries.push_back(std::move(entry));
  }
  std::stable_sort(history.entries.begin(), history.entries.end(),
                   [](const MemoHistoryEntry& a, const MemoHistoryEntry& b) {
                     return a.block_time > b.block_time;
                   });
  history.has_more = signatures.size() == limit;
  util::LogInfo("history", "replayed " + std::to_string(history.entries.size()) + " memos from " +
                               std::to_string(signatures.size()) + " signatures of " +
                               address.ToBase58());
  return history;
}

}  // namespace x1memo::domain
