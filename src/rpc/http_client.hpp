#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <string>

namespace x1memo::rpc {

struct HttpResponse {
  long status{0};
  std::string body;
};

// Per-request limits. |cancel| is polled before the request starts and from
// the transfer progress callback; it must outlive the call.
struct RequestControl {
  std::chrono::milliseconds timeout{std::chrono::seconds(30)};
  const std::atomic<bool>* cancel{nullptr};

  bool Cancelled() const { return cancel != nullptr && cancel->load(); }
};

// POSTs a JSON body and returns the raw response. Implementations are safe
// to call from several threads at once. Network failures throw
// RpcError(kConnectionFailed); expiry and cancellation throw kTimeout and
// kCancelled. Non-2xx statuses are returned, not thrown.
class HttpClient {
 public:
  virtual ~HttpClient() = default;
  virtual HttpResponse PostJson(const std::string& url, const std::string& body,
                                const RequestControl& control) const = 0;
};

// libcurl easy interface, one handle per request. Serves http:// and
// https:// URLs; any other scheme throws kConnectionFailed.
class CurlHttpClient final : public HttpClient {
 public:
  CurlHttpClient();
  HttpResponse PostJson(const std::string& url, const std::string& body,
                        const RequestControl& control) const override;
};

std::shared_ptr<const HttpClient> MakeDefaultHttpClient();

}  // namespace x1memo::rpc
