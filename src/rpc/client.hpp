#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "chain/pubkey.hpp"
#include "rpc/transport.hpp"
#include "rpc/types.hpp"

namespace x1memo::rpc {

inline constexpr const char* kDefaultCommitment = "confirmed";
inline constexpr std::uint32_t kSendMaxRetries = 3;

// Typed wrappers over the node methods the pipeline and the domain
// services consume.
class RpcClient {
 public:
  explicit RpcClient(std::shared_ptr<const Transport> transport);

  const Transport& transport() const noexcept { return *transport_; }

  LatestBlockhash GetLatestBlockhash() const;
  std::uint64_t GetBalance(const chain::Pubkey& address) const;
  VersionInfo GetVersion() const;
  // nullopt when the account does not exist.
  std::optional<AccountInfo> GetAccountInfo(const chain::Pubkey& address) const;
  // |limit| must be within 1..1000.
  std::vector<SignatureInfo> GetSignaturesForAddress(
      const chain::Pubkey& address, std::size_t limit,
      const std::optional<std::string>& before = std::nullopt) const;
  // Dry run with a fresh blockhash and signature verification disabled.
  SimulationResult SimulateTransaction(const std::string& base64_transaction) const;
  // Returns the transaction signature.
  std::string SendTransaction(const std::string& base64_transaction) const;
  std::vector<ProgramAccount> GetProgramAccounts(
      const chain::Pubkey& program, std::optional<std::uint64_t> data_size = std::nullopt) const;
  TokenSupply GetTokenSupply(const chain::Pubkey& mint) const;
  std::optional<std::string> GetTransactionMemo(const std::string& signature) const;

 private:
  std::shared_ptr<const Transport> transport_;
};

}  // namespace x1memo::rpc
