#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace x1memo::engine {

// Platform ceiling for a transaction's compute unit limit.
constexpr std::uint32_t kMaxComputeUnits = 1'400'000;
// Limit declared during simulation so the dry run is never constrained.
constexpr std::uint32_t kSimulationComputeUnits = kMaxComputeUnits;

struct FallbackBucket {
  std::size_t max_memo_length{0};
  std::uint64_t units{0};
};

// Per-domain tuning. The fallback table is consulted only when a simulation
// reports no consumed units; buckets are checked in order.
struct ComputePolicy {
  double multiplier{1.0};
  std::uint64_t floor{0};
  std::vector<FallbackBucket> fallback;
  std::uint64_t default_units{0};
  std::uint64_t ceiling{kMaxComputeUnits};

  std::uint64_t FallbackUnits(std::size_t memo_length) const;
};

// Profile, blog, forum, project and mint.
const ComputePolicy& ContentComputePolicy();
// Memo-burn program; the floor is high enough for its history bookkeeping.
const ComputePolicy& BurnComputePolicy();

// Group chat; the program rejects limits above 400k.
const ComputePolicy& ChatComputePolicy();
// Native and token transfers, which carry no memo.
const ComputePolicy& TransferComputePolicy();

// max(ceil(simulated * multiplier), floor), clamped to kMaxComputeUnits.
std::uint32_t FinalComputeUnits(std::uint64_t simulated_units, double multiplier,
                                std::uint64_t floor);

struct ComputeDecision {
  std::uint64_t simulated_units{0};
  bool used_fallback{false};
  double multiplier{1.0};
  std::uint32_t unit_limit{0};
  std::optional<std::uint64_t> unit_price;
};

}  // namespace x1memo::engine
