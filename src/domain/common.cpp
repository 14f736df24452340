#include "domain/common.hpp"

#include "chain/pda.hpp"
#include "codec/borsh.hpp"

namespace x1memo::domain {

std::array<std::uint8_t, 8> IdSeed(std::uint64_t id) {
  std::array<std::uint8_t, 8> seed{};
  for (std::size_t i = 0; i < seed.size(); ++i) {
    seed[i] = static_cast<std::uint8_t>(id >> (8 * i));
  }
  return seed;
}

chain::Pubkey UserBurnStatsAddress(const chain::Pubkey& user, const chain::Pubkey& burn_program) {
  return chain::FindProgramAddress({chain::SeedOf("user_global_burn_stats"), chain::SeedOf(user)},
                                   burn_program)
      .address;
}

chain::Pubkey MintAuthorityAddress(const chain::Pubkey& mint_program) {
  return chain::FindProgramAddress({chain::SeedOf("mint_authority")}, mint_program).address;
}

void RequireBurnAmount(std::uint64_t amount, std::uint64_t minimum, bool whole_tokens) {
  if (amount < minimum) {
    rpc::ThrowInvalidParameter("burn amount " + std::to_string(amount) +
                               " is below the minimum of " + std::to_string(minimum / kUnitsPerToken) +
                               " tokens");
  }
  if (whole_tokens && amount % kUnitsPerToken != 0) {
    rpc::ThrowInvalidParameter("burn amount " + std::to_string(amount) +
                               " must be a whole number of tokens");
  }
}

void RequireRecordAddress(std::string_view field, const std::string& value,
                          const chain::Pubkey& expected) {
  const auto text = expected.ToBase58();
  if (value != text) {
    rpc::ThrowInvalidParameter(std::string(field) + " " + value + " does not match signer " + text);
  }
}

void RequireRecordId(std::string_view field, std::uint64_t value, std::uint64_t expected) {
  if (value != expected) {
    rpc::ThrowInvalidParameter(std::string(field) + " " + std::to_string(value) +
                               " does not match expected " + std::to_string(expected));
  }
}

std::vector<std::uint8_t> InstructionData(std::string_view name,
                                          std::initializer_list<std::uint64_t> arguments) {
  const auto discriminator = chain::InstructionDiscriminator(name);
  std::vector<std::uint8_t> data(discriminator.begin(), discriminator.end());
  for (const auto argument : arguments) {
    codec::WriteU64(&data, argument);
  }
  return data;
}

std::optional<rpc::AccountInfo> FetchOwnedAccount(const rpc::RpcClient& client,
                                                  const chain::Pubkey& address,
                                                  const chain::Pubkey& owner,
                                                  std::string_view what) {
  auto account = client.GetAccountInfo(address);
  if (!account) {
    util::LogDebug("domain", std::string(what) + " " + address.ToBase58() + " not found");
    return std::nullopt;
  }
  if (account->owner != owner) {
    throw rpc::RpcError(rpc::ErrorKind::kOther,
                        std::string(what) + " " + address.ToBase58() + " is owned by " +
                            account->owner.ToBase58() + ", expected " + owner.ToBase58());
  }
  return account;
}

std::uint64_t FetchGlobalCounter(const rpc::RpcClient& client, const chain::Pubkey& address,
                                 const chain::Pubkey& owner, std::string_view what) {
  const auto account = FetchOwnedAccount(client, address, owner, what);
  if (!account) {
    throw rpc::RpcError(rpc::ErrorKind::kOther, std::string(what) + " not initialized");
  }
  std::uint64_t total = 0;
  accounts::ParseError error;
  if (!accounts::ParseGlobalCounter(account->data, &total, &error)) {
    throw rpc::RpcError(rpc::ErrorKind::kOther,
                        "failed to parse " + std::string(what) + ": " + error.message);
  }
  return total;
}

}  // namespace x1memo::domain
