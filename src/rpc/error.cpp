#include "rpc/error.hpp"

namespace x1memo::rpc {

namespace {

constexpr std::string_view kErrorMessageMarker = "Error Message: ";

std::string RenderWhat(ErrorKind kind, const std::string& message) {
  return std::string(ErrorKindName(kind)) + ": " + message;
}

std::string_view TrimWhitespace(std::string_view text) {
  while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) {
    text.remove_prefix(1);
  }
  while (!text.empty() && (text.back() == ' ' || text.back() == '\t' || text.back() == '\r' ||
                           text.back() == '\n')) {
    text.remove_suffix(1);
  }
  return text;
}

}  // namespace

const char* ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kConnectionFailed:
      return "ConnectionFailed";
    case ErrorKind::kInvalidAddress:
      return "InvalidAddress";
    case ErrorKind::kInvalidParameter:
      return "InvalidParameter";
    case ErrorKind::kTransactionFailed:
      return "TransactionFailed";
    case ErrorKind::kProtocolError:
      return "ProtocolError";
    case ErrorKind::kOther:
      return "Other";
    case ErrorKind::kCancelled:
      return "Cancelled";
    case ErrorKind::kTimeout:
      return "Timeout";
  }
  return "Other";
}

RpcError::RpcError(ErrorKind kind, std::string message)
    : std::runtime_error(RenderWhat(kind, message)), kind_(kind), message_(std::move(message)) {}

RpcError RpcError::Protocol(std::int64_t code, std::string message,
                            std::optional<std::string> detail) {
  std::string rendered = "code " + std::to_string(code) + ": " + message;
  if (detail) {
    rendered += " (" + *detail + ")";
  }
  RpcError error(ErrorKind::kProtocolError, std::move(rendered));
  error.message_ = std::move(message);
  error.code_ = code;
  error.detail_ = std::move(detail);
  return error;
}

std::optional<std::string> ExtractLogDetail(const std::vector<std::string>& logs) {
  for (const auto& line : logs) {
    const auto pos = line.find(kErrorMessageMarker);
    if (pos == std::string::npos) {
      continue;
    }
    const auto text = TrimWhitespace(std::string_view(line).substr(pos + kErrorMessageMarker.size()));
    if (!text.empty()) {
      return std::string(text);
    }
  }
  return std::nullopt;
}

chain::Pubkey RequirePubkey(std::string_view text) {
  chain::Pubkey key;
  std::string error;
  if (!chain::ParsePubkey(text, &key, &error)) {
    throw RpcError(ErrorKind::kInvalidAddress, error);
  }
  return key;
}

void ThrowInvalidParameter(const std::string& message) {
  throw RpcError(ErrorKind::kInvalidParameter, message);
}

}  // namespace x1memo::rpc
