#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "accounts/parser.hpp"
#include "chain/discriminator.hpp"
#include "chain/pubkey.hpp"
#include "engine/pipeline.hpp"
#include "rpc/client.hpp"
#include "rpc/error.hpp"
#include "util/fan_out.hpp"
#include "util/log.hpp"

namespace x1memo::domain {

// 1 token = 10^6 base units on every memo mint.
constexpr std::uint64_t kUnitsPerToken = 1'000'000;
constexpr std::size_t kBulkWorkers = 4;

// Little-endian u64 seed used by every "<tag>, id" derived account.
std::array<std::uint8_t, 8> IdSeed(std::uint64_t id);

// ["user_global_burn_stats", user] under the burn program.
chain::Pubkey UserBurnStatsAddress(const chain::Pubkey& user, const chain::Pubkey& burn_program);
// ["mint_authority"] under the mint program.
chain::Pubkey MintAuthorityAddress(const chain::Pubkey& mint_program);

// Throws RpcError(kInvalidParameter) when |amount| is below |minimum| or, if
// |whole_tokens| is set, not a multiple of kUnitsPerToken.
void RequireBurnAmount(std::uint64_t amount, std::uint64_t minimum, bool whole_tokens);

// Throws RpcError(kInvalidParameter) unless the address embedded in a
// record names the signing user.
void RequireRecordAddress(std::string_view field, const std::string& value,
                          const chain::Pubkey& expected);
void RequireRecordId(std::string_view field, std::uint64_t value, std::uint64_t expected);

// Discriminator of |name| followed by each u64 argument little-endian.
std::vector<std::uint8_t> InstructionData(std::string_view name,
                                          std::initializer_list<std::uint64_t> arguments = {});

// Account lookup that also checks the owning program. nullopt when the
// account does not exist; RpcError(kOther) when another program owns it.
std::optional<rpc::AccountInfo> FetchOwnedAccount(const rpc::RpcClient& client,
                                                  const chain::Pubkey& address,
                                                  const chain::Pubkey& owner,
                                                  std::string_view what);

// Parses |data| with |parser| (one of the accounts::Parse* functions) and
// converts a failure into RpcError(kOther).
template <typename Record, typename Parser>
Record ParseAccountOrThrow(Parser parser, std::span<const std::uint8_t> data,
                           std::string_view what) {
  Record record;
  accounts::ParseError error;
  if (!parser(data, &record, &error)) {
    throw rpc::RpcError(rpc::ErrorKind::kOther,
                        "failed to parse " + std::string(what) + ": " + error.message);
  }
  return record;
}

// Global counters hold the number of entities created so far.
std::uint64_t FetchGlobalCounter(const rpc::RpcClient& client, const chain::Pubkey& address,
                                 const chain::Pubkey& owner, std::string_view what);

template <typename Record>
struct BulkResult {
  std::uint64_t total{0};
  std::uint64_t valid{0};
  // Sorted by identifier.
  std::vector<Record> records;
};

// Fetches identifiers [0, total) on at most |workers| threads. An RpcError
// from |fetch| drops that identifier with a warning; any other exception
// aborts the whole operation.
template <typename Record, typename Fetch, typename IdOf>
BulkResult<Record> FetchBulk(std::uint64_t total, std::string_view what, Fetch&& fetch,
                             IdOf&& id_of, std::size_t workers = kBulkWorkers) {
  BulkResult<Record> result;
  result.total = total;
  std::mutex mutex;
  util::ForEachBounded(0, total, workers, [&](std::uint64_t id) {
    try {
      Record record = fetch(id);
      std::lock_guard<std::mutex> lock(mutex);
      result.records.push_back(std::move(record));
    } catch (const rpc::RpcError& ex) {
      util::LogWarn("domain", "failed to fetch " + std::string(what) + " " + std::to_string(id) +
                                  ": " + ex.what());
    }
  });
  std::sort(result.records.begin(), result.records.end(),
            [&](const Record& a, const Record& b) { return id_of(a) < id_of(b); });
  result.valid = result.records.size();
  util::LogInfo("domain", std::string(what) + " summary: " + std::to_string(result.valid) + "/" +
                              std::to_string(result.total) + " valid");
  return result;
}

}  // namespace x1memo::domain
