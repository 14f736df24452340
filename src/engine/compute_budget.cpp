#include "engine/compute_budget.hpp"

#include <algorithm>
#include <cmath>

namespace x1memo::engine {

std::uint64_t ComputePolicy::FallbackUnits(std::size_t memo_length) const {
  for (const auto& bucket : fallback) {
    if (memo_length <= bucket.max_memo_length) {
      return bucket.units;
    }
  }
  return default_units;
}

const ComputePolicy& ContentComputePolicy() {
  static const ComputePolicy policy{
      1.1,
      1'000,
      {
          {100, 100'000},
          {200, 150'000},
          {300, 200'000},
          {400, 250'000},
          {500, 300'000},
          {600, 350'000},
          {700, 400'000},
      },
      400'000,
  };
  return policy;
}

const ComputePolicy& BurnComputePolicy() {
  static const ComputePolicy policy{1.0, 300'000, {}, 400'000};
  return policy;
}

const ComputePolicy& ChatComputePolicy() {
  static const ComputePolicy policy{1.2, 120'000, {}, 120'000, 400'000};
  return policy;
}

const ComputePolicy& TransferComputePolicy() {
  static const ComputePolicy policy{1.1, 1'000, {}, 200'000};
  return policy;
}

std::uint32_t FinalComputeUnits(std::uint64_t simulated_units, double multiplier,
                                std::uint64_t floor) {
  // The epsilon absorbs binary rounding of multipliers such as 1.1, so
  // 100000 * 1.1 yields 110000 rather than 110001.
  const double scaled = std::ceil(static_cast<double>(simulated_units) * multiplier - 1e-6);
  std::uint64_t units = scaled >= static_cast<double>(kMaxComputeUnits)
                            ? kMaxComputeUnits
                            : static_cast<std::uint64_t>(std::max(scaled, 0.0));
  units = std::max(units, floor);
  return static_cast<std::uint32_t>(std::min<std::uint64_t>(units, kMaxComputeUnits));
}

}  // namespace x1memo::engine
