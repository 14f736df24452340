#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "chain/pubkey.hpp"

namespace x1memo::rpc {

enum class ErrorKind {
  kConnectionFailed,
  kInvalidAddress,
  kInvalidParameter,
  kTransactionFailed,
  kProtocolError,
  kOther,
  kCancelled,
  kTimeout,
};

const char* ErrorKindName(ErrorKind kind);

// Every failure surfaced by the client and the transaction pipeline.
// what() renders "<Kind>: <message>".
class RpcError : public std::runtime_error {
 public:
  RpcError(ErrorKind kind, std::string message);

  // Structured JSON-RPC error object returned by the node.
  static RpcError Protocol(std::int64_t code, std::string message,
                           std::optional<std::string> detail = std::nullopt);

  ErrorKind kind() const noexcept { return kind_; }
  const std::string& message() const noexcept { return message_; }
  std::int64_t code() const noexcept { return code_; }
  const std::optional<std::string>& detail() const noexcept { return detail_; }

 private:
  ErrorKind kind_;
  std::string message_;
  std::int64_t code_{0};
  std::optional<std::string> detail_;
};

// Program error text embedded in simulation logs, e.g. the tail of
// "Program log: AnchorError ... Error Message: Burn amount too small.".
// Returns the first match; nullopt when no line carries the marker.
std::optional<std::string> ExtractLogDetail(const std::vector<std::string>& logs);

// Throwing wrappers used at the pipeline boundary.
chain::Pubkey RequirePubkey(std::string_view text);
[[noreturn]] void ThrowInvalidParameter(const std::string& message);

}  // namespace x1memo::rpc
