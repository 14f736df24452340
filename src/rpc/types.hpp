#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

#include "chain/pubkey.hpp"

namespace x1memo::rpc {

// Typed views of the "result" members the client consumes. Each Parse*
// function throws RpcError(kOther) when the node returns an unexpected shape.

struct LatestBlockhash {
  std::string blockhash;
  std::uint64_t last_valid_block_height{0};
};

struct AccountInfo {
  std::uint64_t lamports{0};
  chain::Pubkey owner;
  std::vector<std::uint8_t> data;
  bool executable{false};
};

struct ProgramAccount {
  chain::Pubkey pubkey;
  AccountInfo account;
};

struct SimulationResult {
  // Serialized "err" value; nullopt when the simulation succeeded.
  std::optional<std::string> err;
  std::vector<std::string> logs;
  std::optional<std::uint64_t> units_consumed;
};

struct SignatureInfo {
  std::string signature;
  std::uint64_t slot{0};
  std::optional<std::int64_t> block_time;
  // Raw "[len] <text>" memo column, when the transaction carried one.
  std::optional<std::string> memo;
  bool failed{false};
};

struct TokenSupply {
  std::uint64_t amount{0};
  std::uint8_t decimals{0};
};

struct VersionInfo {
  std::string core_version;
  std::optional<std::uint32_t> feature_set;
};

LatestBlockhash ParseLatestBlockhash(const nlohmann::json& result);
std::uint64_t ParseBalance(const nlohmann::json& result);
VersionInfo ParseVersion(const nlohmann::json& result);
// Accepts both the {context, value} wrapper and a bare account object.
// A null value yields nullopt.
std::optional<AccountInfo> ParseAccountInfo(const nlohmann::json& result);
std::vector<ProgramAccount> ParseProgramAccounts(const nlohmann::json& result);
SimulationResult ParseSimulation(const nlohmann::json& result);
std::vector<SignatureInfo> ParseSignatures(const nlohmann::json& result);
TokenSupply ParseTokenSupply(const nlohmann::json& result);
// Memo text logged by the memo program in a getTransaction result; nullopt
// when the transaction is unknown or carried no memo.
std::optional<std::string> ParseTransactionMemo(const nlohmann::json& result);

// Text after the "[len] " prefix of a signature's memo column.
std::string StripMemoLengthPrefix(const std::string& memo);

}  // namespace x1memo::rpc
