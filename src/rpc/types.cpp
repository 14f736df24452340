#include "rpc/types.hpp"

#include <charconv>

#include "rpc/error.hpp"
#include "util/base64.hpp"

namespace x1memo::rpc {

namespace {

constexpr std::string_view kMemoLogPrefix = "Program log: Memo";

template <typename Fn>
auto Decode(const char* what, Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const nlohmann::json::exception& ex) {
    throw RpcError(ErrorKind::kOther, std::string("unexpected ") + what + " shape: " + ex.what());
  }
}

[[noreturn]] void ThrowShape(const char* what, const std::string& reason) {
  throw RpcError(ErrorKind::kOther, std::string("unexpected ") + what + " shape: " + reason);
}

// {context, value} wrapper used by most account-level methods.
const nlohmann::json& Unwrap(const nlohmann::json& result) {
  if (result.is_object() && result.contains("value") && result.contains("context")) {
    return result.at("value");
  }
  return result;
}

AccountInfo DecodeAccount(const nlohmann::json& value) {
  AccountInfo info;
  info.lamports = value.at("lamports").get<std::uint64_t>();
  std::string error;
  if (!chain::ParsePubkey(value.at("owner").get<std::string>(), &info.owner, &error)) {
    ThrowShape("account", "owner: " + error);
  }
  info.executable = value.value("executable", false);
  const auto& data = value.at("data");
  // ["<base64>", "base64"]
  if (!data.is_array() || data.size() != 2 || data.at(1).get<std::string>() != "base64") {
    ThrowShape("account", "data is not base64 encoded");
  }
  if (!util::Base64Decode(data.at(0).get<std::string>(), &info.data)) {
    ThrowShape("account", "data is not valid base64");
  }
  return info;
}

std::uint64_t ParseDecimalString(const std::string& text, const char* what) {
  std::uint64_t value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (text.empty() || ec != std::errc() || ptr != text.data() + text.size()) {
    ThrowShape(what, "'" + text + "' is not an unsigned integer");
  }
  return value;
}

}  // namespace

LatestBlockhash ParseLatestBlockhash(const nlohmann::json& result) {
  return Decode("getLatestBlockhash", [&] {
    const auto& value = Unwrap(result);
    LatestBlockhash out;
    out.blockhash = value.at("blockhash").get<std::string>();
    out.last_valid_block_height = value.value("lastValidBlockHeight", std::uint64_t{0});
    return out;
  });
}

std::uint64_t ParseBalance(const nlohmann::json& result) {
  return Decode("getBalance", [&] { return Unwrap(result).get<std::uint64_t>(); });
}

VersionInfo ParseVersion(const nlohmann::json& result) {
  return Decode("getVersion", [&] {
    VersionInfo out;
    out.core_version = result.at("solana-core").get<std::string>();
    const auto feature_set = result.find("feature-set");
    if (feature_set != result.end() && feature_set->is_number_unsigned()) {
      out.feature_set = feature_set->get<std::uint32_t>();
    }
    return out;
  });
}

std::optional<AccountInfo> ParseAccountInfo(const nlohmann::json& result) {
  return Decode("getAccountInfo", [&]() -> std::optional<AccountInfo> {
    const auto& value = Unwrap(result);
    if (value.is_null()) {
      return std::nullopt;
    }
    return DecodeAccount(value);
  });
}

std::vector<ProgramAccount> ParseProgramAccounts(const nlohmann::json& result) {
  return Decode("getProgramAccounts", [&] {
    const auto& value = Unwrap(result);
    if (!value.is_array()) {
      ThrowShape("getProgramAccounts", "result is not an array");
    }
    std::vector<ProgramAccount> out;
    out.reserve(value.size());
    for (const auto& entry : value) {
      ProgramAccount account;
      std::string error;
      if (!chain::ParsePubkey(entry.at("pubkey").get<std::string>(), &account.pubkey, &error)) {
        ThrowShape("getProgramAccounts", "pubkey: " + error);
      }
      account.account = DecodeAccount(entry.at("account"));
      out.push_back(std::move(account));
    }
    return out;
  });
}

SimulationResult ParseSimulation(const nlohmann::json& result) {
  return Decode("simulateTransaction", [&] {
    const auto& value = Unwrap(result);
    SimulationResult out;
    const auto err = value.find("err");
    if (err != value.end() && !err->is_null()) {
      out.err = err->dump();
    }
    const auto logs = value.find("logs");
    if (logs != value.end() && logs->is_array()) {
      for (const auto& line : *logs) {
        if (line.is_string()) {
          out.logs.push_back(line.get<std::string>());
        }
      }
    }
    const auto units = value.find("unitsConsumed");
    if (units != value.end() && units->is_number_unsigned()) {
      out.units_consumed = units->get<std::uint64_t>();
    }
    return out;
  });
}

std::vector<SignatureInfo> ParseSignatures(const nlohmann::json& result) {
  return Decode("getSignaturesForAddress", [&] {
    if (!result.is_array()) {
      ThrowShape("getSignaturesForAddress", "result is not an array");
    }
    std::vector<SignatureInfo> out;
    out.reserve(result.size());
    for (const auto& entry : result) {
      SignatureInfo info;
      info.signature = entry.at("signature").get<std::string>();
      info.slot = entry.value("slot", std::uint64_t{0});
      const auto block_time = entry.find("blockTime");
      if (block_time != entry.end() && block_time->is_number_integer()) {
        info.block_time = block_time->get<std::int64_t>();
      }
      const auto memo = entry.find("memo");
      if (memo != entry.end() && memo->is_string()) {
        info.memo = memo->get<std::string>();
      }
      const auto err = entry.find("err");
      info.failed = err != entry.end() && !err->is_null();
      out.push_back(std::move(info));
    }
    return out;
  });
}

TokenSupply ParseTokenSupply(const nlohmann::json& result) {
  return Decode("getTokenSupply", [&] {
    const auto& value = Unwrap(result);
    TokenSupply out;
    out.amount = ParseDecimalString(value.at("amount").get<std::string>(), "getTokenSupply");
    out.decimals = value.value("decimals", std::uint8_t{0});
    return out;
  });
}

std::optional<std::string> ParseTransactionMemo(const nlohmann::json& result) {
  return Decode("getTransaction", [&]() -> std::optional<std::string> {
    if (result.is_null()) {
      return std::nullopt;
    }
    const auto meta = result.find("meta");
    if (meta == result.end() || !meta->is_object()) {
      return std::nullopt;
    }
    const auto logs = meta->find("logMessages");
    if (logs == meta->end() || !logs->is_array()) {
      return std::nullopt;
    }
    for (const auto& line : *logs) {
      if (!line.is_string()) continue;
      const auto& text = line.get_ref<const std::string&>();
      if (text.rfind(kMemoLogPrefix, 0) != 0) continue;
      // "Program log: Memo (len 12): \"hello world!\""
      const auto start = text.find("): ");
      if (start == std::string::npos) continue;
      const std::string content = text.substr(start + 3);
      const auto unescaped = nlohmann::json::parse(content, nullptr, /*allow_exceptions=*/false);
      if (unescaped.is_string()) {
        return unescaped.get<std::string>();
      }
      std::string_view trimmed(content);
      while (!trimmed.empty() && trimmed.front() == '"') trimmed.remove_prefix(1);
      while (!trimmed.empty() && trimmed.back() == '"') trimmed.remove_suffix(1);
      return std::string(trimmed);
    }
    return std::nullopt;
  });
}

std::string StripMemoLengthPrefix(const std::string& memo) {
  const auto space = memo.find(' ');
  if (space == std::string::npos) {
    return memo;
  }
  return memo.substr(space + 1);
}

}  // namespace x1memo::rpc
