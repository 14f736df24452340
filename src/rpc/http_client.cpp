#include "rpc/http_client.hpp"

#include <curl/curl.h>

#include <cctype>
#include <string_view>

#include "rpc/error.hpp"

namespace x1memo::rpc {

namespace {

constexpr std::size_t kMaxBodyBytes = 64 * 1024 * 1024;

void ThrowIfCancelled(const RequestControl& control) {
  if (control.Cancelled()) {
    throw RpcError(ErrorKind::kCancelled, "request cancelled");
  }
}

bool HasHttpScheme(std::string_view url) {
  const auto scheme_end = url.find("://");
  if (scheme_end == std::string_view::npos) return false;
  std::string scheme(url.substr(0, scheme_end));
  for (auto& c : scheme) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return scheme == "http" || scheme == "https";
}

class CurlGlobal {
 public:
  CurlGlobal() { curl_global_init(CURL_GLOBAL_DEFAULT); }
  ~CurlGlobal() { curl_global_cleanup(); }
};

void EnsureCurlGlobal() {
  static CurlGlobal global;
  (void)global;
}

struct CurlBuffer {
  std::string data;
  bool overflow{false};
};

size_t CurlWriteCallback(char* ptr, size_t size, size_t chunk_count, void* userdata) {
  const size_t real_size = size * chunk_count;
  auto* out = static_cast<CurlBuffer*>(userdata);
  if (out->data.size() + real_size > kMaxBodyBytes) {
    out->overflow = true;
    return 0;
  }
  out->data.append(ptr, real_size);
  return real_size;
}

int CurlProgressCallback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
  const auto* control = static_cast<const RequestControl*>(userdata);
  return control->Cancelled() ? 1 : 0;
}

struct CurlHandleDeleter {
  void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct CurlListDeleter {
  void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

}  // namespace

CurlHttpClient::CurlHttpClient() { EnsureCurlGlobal(); }

HttpResponse CurlHttpClient::PostJson(const std::string& url, const std::string& body,
                                      const RequestControl& control) const {
  ThrowIfCancelled(control);
  if (!HasHttpScheme(url)) {
    throw RpcError(ErrorKind::kConnectionFailed, "unsupported URL '" + url + "'");
  }
  std::unique_ptr<CURL, CurlHandleDeleter> curl(curl_easy_init());
  if (!curl) {
    throw RpcError(ErrorKind::kConnectionFailed, "failed to initialize CURL handle");
  }
  std::unique_ptr<curl_slist, CurlListDeleter> headers(
      curl_slist_append(nullptr, "Content-Type: application/json"));
  if (!headers) {
    throw RpcError(ErrorKind::kConnectionFailed, "failed to allocate CURL headers");
  }
  char error_buffer[CURL_ERROR_SIZE];
  error_buffer[0] = '\0';
  CurlBuffer response;

  CURL* handle = curl.get();
  curl_easy_setopt(handle, CURLOPT_ERRORBUFFER, error_buffer);
  curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(handle, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(handle, CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(handle, CURLOPT_URL, url.c_str());
  curl_easy_setopt(handle, CURLOPT_POST, 1L);
  curl_easy_setopt(handle, CURLOPT_POSTFIELDS, body.c_str());
  curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
  curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, &CurlWriteCallback);
  curl_easy_setopt(handle, CURLOPT_WRITEDATA, &response);
  curl_easy_setopt(handle, CURLOPT_NOPROGRESS, 0L);
  curl_easy_setopt(handle, CURLOPT_XFERINFOFUNCTION, &CurlProgressCallback);
  curl_easy_setopt(handle, CURLOPT_XFERINFODATA, &control);
  curl_easy_setopt(handle, CURLOPT_TIMEOUT_MS, static_cast<long>(control.timeout.count()));
  curl_easy_setopt(handle, CURLOPT_SSL_VERIFYPEER, 1L);
  curl_easy_setopt(handle, CURLOPT_SSL_VERIFYHOST, 2L);

  const CURLcode res = curl_easy_perform(handle);
  if (res != CURLE_OK) {
    std::string msg = "CURL error: ";
    msg += curl_easy_strerror(res);
    if (error_buffer[0] != '\0') {
      msg += " | ";
      msg += error_buffer;
    }
    if (res == CURLE_OPERATION_TIMEDOUT) {
      throw RpcError(ErrorKind::kTimeout, msg);
    }
    if (res == CURLE_ABORTED_BY_CALLBACK) {
      throw RpcError(ErrorKind::kCancelled, "request cancelled");
    }
    if (response.overflow) {
      throw RpcError(ErrorKind::kConnectionFailed, "response body too large");
    }
    throw RpcError(ErrorKind::kConnectionFailed, msg);
  }

  HttpResponse result;
  curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &result.status);
  result.body = std::move(response.data);
  return result;
}

std::shared_ptr<const HttpClient> MakeDefaultHttpClient() {
  return std::make_shared<CurlHttpClient>();
}

}  // namespace x1memo::rpc
