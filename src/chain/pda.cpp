#include "chain/pda.hpp"

#include <array>
#include <stdexcept>
#include <string>

#include "chain/program_ids.hpp"
#include "crypto/ed25519.hpp"
#include "crypto/hash.hpp"

namespace x1memo::chain {

namespace {

constexpr std::string_view kPdaMarker = "ProgramDerivedAddress";

bool SeedsWithinLimits(const std::vector<Seed>& seeds) {
  if (seeds.size() > kMaxSeeds) return false;
  for (const auto& seed : seeds) {
    if (seed.size() > kMaxSeedLength) return false;
  }
  return true;
}

}  // namespace

std::optional<Pubkey> CreateProgramAddress(const std::vector<Seed>& seeds,
                                           const Pubkey& program_id) {
  if (!SeedsWithinLimits(seeds)) {
    return std::nullopt;
  }
  std::vector<std::uint8_t> preimage;
  for (const auto& seed : seeds) {
    preimage.insert(preimage.end(), seed.begin(), seed.end());
  }
  preimage.insert(preimage.end(), program_id.bytes.begin(), program_id.bytes.end());
  preimage.insert(preimage.end(), kPdaMarker.begin(), kPdaMarker.end());

  const auto digest = crypto::Sha256(preimage);
  if (crypto::IsOnEd25519Curve(digest)) {
    return std::nullopt;
  }
  Pubkey address;
  address.bytes = digest;
  return address;
}

ProgramAddress FindProgramAddress(const std::vector<Seed>& seeds, const Pubkey& program_id) {
  // The bump occupies one of the sixteen seed slots.
  if (seeds.size() >= kMaxSeeds || !SeedsWithinLimits(seeds)) {
    throw std::invalid_argument("program address seeds exceed " + std::to_string(kMaxSeeds) +
                                " entries of " + std::to_string(kMaxSeedLength) + " bytes");
  }
  std::array<std::uint8_t, 1> bump_seed{};
  std::vector<Seed> with_bump(seeds);
  with_bump.emplace_back(bump_seed);
  for (int bump = 255; bump >= 0; --bump) {
    bump_seed[0] = static_cast<std::uint8_t>(bump);
    if (auto address = CreateProgramAddress(with_bump, program_id)) {
      return ProgramAddress{*address, bump_seed[0]};
    }
  }
  throw std::runtime_error("unable to find a viable program address bump seed");
}

Pubkey AssociatedTokenAddress(const Pubkey& owner, const Pubkey& mint,
                              const Pubkey& token_program) {
  return FindProgramAddress({SeedOf(owner), SeedOf(token_program), SeedOf(mint)},
                            AssociatedTokenProgramId())
      .address;
}

}  // namespace x1memo::chain
