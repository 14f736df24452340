#include "rpc/client.hpp"

#include <stdexcept>

#include "rpc/error.hpp"

namespace x1memo::rpc {

using nlohmann::json;

RpcClient::RpcClient(std::shared_ptr<const Transport> transport)
    : transport_(std::move(transport)) {
  if (!transport_) {
    throw std::invalid_argument("RpcClient requires a transport");
  }
}

LatestBlockhash RpcClient::GetLatestBlockhash() const {
  const json options = {{"commitment", kDefaultCommitment}};
  return ParseLatestBlockhash(transport_->Call("getLatestBlockhash", json::array({options})));
}

std::uint64_t RpcClient::GetBalance(const chain::Pubkey& address) const {
  return ParseBalance(transport_->Call("getBalance", json::array({address.ToBase58()})));
}

VersionInfo RpcClient::GetVersion() const {
  return ParseVersion(transport_->Call("getVersion", json::array()));
}

std::optional<AccountInfo> RpcClient::GetAccountInfo(const chain::Pubkey& address) const {
  const json options = {{"encoding", "base64"}, {"commitment", kDefaultCommitment}};
  return ParseAccountInfo(
      transport_->Call("getAccountInfo", json::array({address.ToBase58(), options})));
}

std::vector<SignatureInfo> RpcClient::GetSignaturesForAddress(
    const chain::Pubkey& address, std::size_t limit,
    const std::optional<std::string>& before) const {
  if (limit == 0 || limit > 1000) {
    ThrowInvalidParameter("signature limit must be within 1-1000, got " + std::to_string(limit));
  }
  json options = {{"limit", limit}, {"commitment", kDefaultCommitment}};
  if (before) {
    options["before"] = *before;
  }
  return ParseSignatures(
      transport_->Call("getSignaturesForAddress", json::array({address.ToBase58(), options})));
}

SimulationResult RpcClient::SimulateTransaction(const std::string& base64_transaction) const {
  const json options = {
      {"encoding", "base64"},
      {"commitment", kDefaultCommitment},
      {"replaceRecentBlockhash", true},
      {"sigVerify", false},
  };
  return ParseSimulation(
      transport_->Call("simulateTransaction", json::array({base64_transaction, options})));
}

std::string RpcClient::SendTransaction(const std::string& base64_transaction) const {
  const json options = {
      {"encoding", "base64"},
      {"preflightCommitment", kDefaultCommitment},
      {"skipPreflight", false},
      {"maxRetries", kSendMaxRetries},
  };
  const json result =
      transport_->Call("sendTransaction", json::array({base64_transaction, options}));
  if (!result.is_string()) {
    throw RpcError(ErrorKind::kOther, "sendTransaction returned " + result.dump());
  }
  return result.get<std::string>();
}

std::vector<ProgramAccount> RpcClient::GetProgramAccounts(
    const chain::Pubkey& program, std::optional<std::uint64_t> data_size) const {
  json options = {{"encoding", "base64"}, {"commitment", kDefaultCommitment}};
  if (data_size) {
    const json filter = {{"dataSize", *data_size}};
    options["filters"] = json::array({filter});
  }
  return ParseProgramAccounts(
      transport_->Call("getProgramAccounts", json::array({program.ToBase58(), options})));
}

TokenSupply RpcClient::GetTokenSupply(const chain::Pubkey& mint) const {
  const json options = {{"commitment", kDefaultCommitment}};
  return ParseTokenSupply(
      transport_->Call("getTokenSupply", json::array({mint.ToBase58(), options})));
}

std::optional<std::string> RpcClient::GetTransactionMemo(const std::string& signature) const {
  const json options = {{"encoding", "json"}, {"maxSupportedTransactionVersion", 0}};
  return ParseTransactionMemo(transport_->Call("getTransaction", json::array({signature, options})));
}

}  // namespace x1memo::rpc
