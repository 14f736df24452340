#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "chain/pubkey.hpp"

namespace x1memo::chain {

constexpr std::size_t kMaxSeeds = 16;
constexpr std::size_t kMaxSeedLength = 32;

using Seed = std::span<const std::uint8_t>;

struct ProgramAddress {
  Pubkey address;
  std::uint8_t bump{0};
};

// Seed helpers. The returned spans borrow from the argument.
inline Seed SeedOf(std::string_view text) {
  return {reinterpret_cast<const std::uint8_t*>(text.data()), text.size()};
}
inline Seed SeedOf(const Pubkey& key) { return key.Span(); }

// SHA-256(seed_0 || .. || seed_n || program_id || "ProgramDerivedAddress"),
// accepted only when the digest is not an Ed25519 curve point. Returns
// nullopt when the digest lands on the curve or the seeds exceed the limits.
std::optional<Pubkey> CreateProgramAddress(const std::vector<Seed>& seeds,
                                           const Pubkey& program_id);

// Tries bump seeds 255 down to 0 appended as a final one-byte seed and returns
// the first off-curve candidate. Throws std::invalid_argument for seed lists
// over the limits and std::runtime_error if no bump yields an address.
ProgramAddress FindProgramAddress(const std::vector<Seed>& seeds, const Pubkey& program_id);

// Associated token account of |owner| for |mint| under |token_program|.
Pubkey AssociatedTokenAddress(const Pubkey& owner, const Pubkey& mint,
                              const Pubkey& token_program);

}  // namespace x1memo::chain
