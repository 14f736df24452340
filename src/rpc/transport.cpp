#include "rpc/transport.hpp"

#include <cctype>
#include <chrono>
#include <random>

#include "rpc/error.hpp"
#include "util/csprng.hpp"
#include "util/log.hpp"

namespace x1memo::rpc {

namespace {

std::string Trim(const std::string& text) {
  std::size_t begin = 0;
  std::size_t end = text.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
  return text.substr(begin, end - begin);
}

std::uint64_t UnixMillis() {
  return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                        std::chrono::system_clock::now().time_since_epoch())
                                        .count());
}

// Secure source first, then std::random_device, then the clock.
std::size_t RandomIndex(std::size_t count) {
  std::uint64_t value = 0;
  std::string error;
  if (util::SecureRandomBelow(count, &value, &error)) {
    return static_cast<std::size_t>(value);
  }
  util::LogWarn("rpc", "secure random unavailable: " + error);
  try {
    std::random_device device;
    return static_cast<std::size_t>(device() % count);
  } catch (const std::exception& ex) {
    util::LogWarn("rpc", std::string("random_device unavailable: ") + ex.what());
  }
  return static_cast<std::size_t>(UnixMillis() % count);
}

std::optional<std::string> ErrorDetail(const nlohmann::json& error) {
  const auto data = error.find("data");
  if (data == error.end() || !data->is_object()) {
    return std::nullopt;
  }
  const auto logs = data->find("logs");
  if (logs == data->end() || !logs->is_array()) {
    return std::nullopt;
  }
  std::vector<std::string> lines;
  for (const auto& line : *logs) {
    if (line.is_string()) {
      lines.push_back(line.get<std::string>());
    }
  }
  return ExtractLogDetail(lines);
}

}  // namespace

std::string SelectEndpoint(const std::vector<std::string>& endpoints,
                           const std::optional<std::string>& override_url) {
  if (override_url) {
    auto trimmed = Trim(*override_url);
    if (!trimmed.empty()) {
      util::LogInfo("rpc", "using custom endpoint " + trimmed);
      return trimmed;
    }
  }
  if (endpoints.empty()) {
    throw RpcError(ErrorKind::kInvalidParameter, "no RPC endpoints configured");
  }
  std::size_t index = 0;
  if (endpoints.size() > 1) {
    index = RandomIndex(endpoints.size());
  }
  util::LogInfo("rpc", "selected endpoint " + endpoints[index] + " (" + std::to_string(index + 1) +
                           " of " + std::to_string(endpoints.size()) + ")");
  return endpoints[index];
}

std::uint64_t GenerateRequestId() {
  std::uint64_t value = 0;
  if (util::SecureRandomPositiveId(&value)) {
    return value;
  }
  std::uint64_t random_part = 0;
  try {
    std::random_device device;
    random_part = device() % 10000;
  } catch (const std::exception&) {
    random_part = UnixMillis() % 10000;
  }
  return (UnixMillis() % 10'000'000'000ULL) * 10000 + random_part;
}

Transport::Transport(const std::vector<std::string>& endpoints,
                     const std::optional<std::string>& override_url,
                     std::shared_ptr<const HttpClient> http, TransportOptions options)
    : endpoint_(SelectEndpoint(endpoints, override_url)),
      http_(std::move(http)),
      options_(std::move(options)) {
  if (!http_) {
    http_ = MakeDefaultHttpClient();
  }
}

nlohmann::json Transport::Call(const std::string& method, const nlohmann::json& params) const {
  const std::uint64_t id = GenerateRequestId();
  const nlohmann::json request = {
      {"jsonrpc", "2.0"},
      {"id", id},
      {"method", method},
      {"params", params},
  };

  RequestControl control;
  control.timeout = options_.timeout;
  control.cancel = options_.cancel.get();

  HttpResponse response;
  try {
    response = http_->PostJson(endpoint_, request.dump(), control);
  } catch (const RpcError& ex) {
    util::LogWarn("rpc", method + " via " + endpoint_ + " failed: " + ex.what());
    throw;
  }
  if (response.status < 200 || response.status >= 300) {
    util::LogWarn("rpc", method + " via " + endpoint_ + " returned HTTP " +
                             std::to_string(response.status));
    throw RpcError(ErrorKind::kConnectionFailed,
                   "HTTP " + std::to_string(response.status) + " from " + endpoint_);
  }

  nlohmann::json reply;
  try {
    reply = nlohmann::json::parse(response.body);
  } catch (const nlohmann::json::exception& ex) {
    throw RpcError(ErrorKind::kOther, method + ": failed to parse response: " + ex.what());
  }
  if (!reply.is_object()) {
    throw RpcError(ErrorKind::kOther, method + ": response is not a JSON object");
  }

  const auto error = reply.find("error");
  if (error != reply.end() && !error->is_null()) {
    std::int64_t code = 0;
    std::string message = error->dump();
    if (error->is_object()) {
      const auto code_it = error->find("code");
      if (code_it != error->end() && code_it->is_number_integer()) {
        code = code_it->get<std::int64_t>();
      }
      const auto message_it = error->find("message");
      if (message_it != error->end() && message_it->is_string()) {
        message = message_it->get<std::string>();
      }
    }
    auto detail = error->is_object() ? ErrorDetail(*error) : std::nullopt;
    util::LogWarn("rpc", method + " error " + std::to_string(code) + ": " + message);
    throw RpcError::Protocol(code, std::move(message), std::move(detail));
  }

  const auto echoed = reply.find("id");
  if (echoed != reply.end() && echoed->is_number_unsigned() &&
      echoed->get<std::uint64_t>() != id) {
    throw RpcError(ErrorKind::kOther, method + ": response id does not match request id");
  }

  const auto result = reply.find("result");
  if (result == reply.end()) {
    throw RpcError(ErrorKind::kOther, method + ": response missing result field");
  }
  return *result;
}

}  // namespace x1memo::rpc
