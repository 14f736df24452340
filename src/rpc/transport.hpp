#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

#include "rpc/http_client.hpp"

namespace x1memo::rpc {

struct TransportOptions {
  std::chrono::milliseconds timeout{std::chrono::seconds(30)};
  // Shared with the caller; setting it aborts in-flight and future requests.
  std::shared_ptr<const std::atomic<bool>> cancel;
};

// Override first (trimmed, when non-empty), otherwise a uniformly random
// pick from |endpoints|. Throws RpcError(kInvalidParameter) when nothing is
// configured.
std::string SelectEndpoint(const std::vector<std::string>& endpoints,
                           const std::optional<std::string>& override_url);

// Positive 63-bit identifier from the secure source, falling back to
// (unix millis mod 1e10) * 10000 + a 4-digit random part.
std::uint64_t GenerateRequestId();

// JSON-RPC 2.0 over one endpoint fixed at construction. Stateless beyond
// that choice, so one instance may serve concurrent callers.
class Transport {
 public:
  Transport(const std::vector<std::string>& endpoints,
            const std::optional<std::string>& override_url,
            std::shared_ptr<const HttpClient> http, TransportOptions options = {});

  const std::string& endpoint() const noexcept { return endpoint_; }

  // Returns the "result" member. Failures map to RpcError:
  //   transport / non-2xx status   -> kConnectionFailed (or kTimeout, kCancelled)
  //   "error" object               -> kProtocolError with code, message, detail
  //   unparseable or no result     -> kOther
  nlohmann::json Call(const std::string& method, const nlohmann::json& params) const;

 private:
  std::string endpoint_;
  std::shared_ptr<const HttpClient> http_;
  TransportOptions options_;
};

}  // namespace x1memo::rpc
