#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#include "chain/pubkey.hpp"
#include "config/settings.hpp"
#include "engine/pipeline.hpp"
#include "engine/signer.hpp"
#include "nlohmann/json.hpp"
#include "rpc/client.hpp"
#include "rpc/transport.hpp"
#include "tests/unit/util/fake_http_client.hpp"
#include "tx/transaction.hpp"
#include "util/base64.hpp"

namespace x1memo::test {

inline constexpr const char* kFirstBlockhash = "US517G5965aydkZ46HS38QLi7UQiSojurfbQfKCELFx";
inline constexpr const char* kSecondBlockhash = "cGfHiC6Kgg3FpFZvgwGcswsCRtp4aBP2fzuXRQPizuN";
inline constexpr const char* kSubmittedSignature =
    "5VERv8NMvzbJMEkV8xnrLkEaWRtSz9CosKDYjCJjBRnbJLgp8uirBgmQpjKhoR4tjF3ZpRzrFmBV6UjKdiSZkQUW";

// Deterministic stand-in for a wallet: the signature is the key repeated.
class FakeSigner final : public engine::TransactionSigner {
 public:
  explicit FakeSigner(chain::Pubkey key) : key_(key) {}

  chain::Pubkey PublicKey() const override { return key_; }

  tx::Signature SignMessage(std::span<const std::uint8_t> message) const override {
    ++calls_;
    last_message_size_ = message.size();
    tx::Signature signature{};
    for (std::size_t i = 0; i < signature.size(); ++i) {
      signature[i] = key_.bytes[i % key_.bytes.size()];
    }
    return signature;
  }

  int calls() const { return calls_.load(); }
  std::size_t last_message_size() const { return last_message_size_.load(); }

 private:
  chain::Pubkey key_;
  mutable std::atomic<int> calls_{0};
  mutable std::atomic<std::size_t> last_message_size_{0};
};

inline tx::Transaction DecodeRequestTransaction(const nlohmann::json& params) {
  tx::Transaction transaction;
  std::string error;
  if (!tx::DecodeTransactionBase64(params.at(0).get<std::string>(), &transaction, &error)) {
    throw std::runtime_error("fake node received a malformed transaction: " + error);
  }
  return transaction;
}

inline nlohmann::json EncodedAccount(const std::vector<std::uint8_t>& data,
                                     const chain::Pubkey& owner) {
  return nlohmann::json{{"lamports", 1'000'000},
                        {"owner", owner.ToBase58()},
                        {"executable", false},
                        {"rentEpoch", 0},
                        {"data",
                         {util::Base64Encode(std::span<const std::uint8_t>(data)), "base64"}}};
}

inline nlohmann::json ContextValue(nlohmann::json value) {
  return nlohmann::json{{"context", {{"slot", 1}}}, {"value", std::move(value)}};
}

// A node with blockhashes that alternate per call and a simulation that
// reports |units| consumed (or nothing when |units| is nullopt).
struct FakeNode {
  std::shared_ptr<FakeHttpClient> http = std::make_shared<FakeHttpClient>();
  std::shared_ptr<const rpc::RpcClient> client;
  std::shared_ptr<const engine::TransactionPipeline> pipeline;
  std::shared_ptr<std::atomic<int>> blockhash_calls = std::make_shared<std::atomic<int>>(0);

  explicit FakeNode(std::optional<std::uint64_t> units = 100'000,
                    std::optional<config::UserSettings> settings = std::nullopt) {
    auto calls = blockhash_calls;
    http->On("getLatestBlockhash", [calls](const nlohmann::json&) {
      const int n = calls->fetch_add(1);
      return nlohmann::json{
          {"result", ContextValue({{"blockhash", n % 2 == 0 ? kFirstBlockhash : kSecondBlockhash},
                                   {"lastValidBlockHeight", 1000 + n}})}};
    });
    SimulateWith(units);
    http->OnResult("sendTransaction", kSubmittedSignature);
    auto transport = std::make_shared<const rpc::Transport>(
        std::vector<std::string>{"http://127.0.0.1:8899"}, std::nullopt, http);
    client = std::make_shared<const rpc::RpcClient>(transport);
    pipeline = std::make_shared<const engine::TransactionPipeline>(client, std::move(settings));
  }

  void SimulateWith(std::optional<std::uint64_t> units) {
    http->On("simulateTransaction", [units](const nlohmann::json&) {
      nlohmann::json value = {{"err", nullptr}, {"logs", nlohmann::json::array()}};
      if (units) {
        value["unitsConsumed"] = *units;
      }
      return nlohmann::json{{"result", ContextValue(value)}};
    });
  }

  // Account store keyed by Base58 address for getAccountInfo.
  void ServeAccounts(std::shared_ptr<const std::map<std::string, nlohmann::json>> accounts) {
    http->On("getAccountInfo", [accounts](const nlohmann::json& params) {
      const auto address = params.at(0).get<std::string>();
      const auto it = accounts->find(address);
      return nlohmann::json{
          {"result", ContextValue(it == accounts->end() ? nlohmann::json(nullptr) : it->second)}};
    });
  }

  std::vector<tx::Transaction> Simulated() const {
    std::vector<tx::Transaction> out;
    for (const auto& request : http->RequestsFor("simulateTransaction")) {
      out.push_back(DecodeRequestTransaction(request.params));
    }
    return out;
  }
};

}  // namespace x1memo::test
