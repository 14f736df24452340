#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "chain/pubkey.hpp"

namespace x1memo::codec {

// Borsh writers: little-endian integers, u32 length prefixes for strings and
// vectors, one tag byte (0 or 1) for options.
void WriteU8(std::vector<std::uint8_t>* out, std::uint8_t value);
void WriteU32(std::vector<std::uint8_t>* out, std::uint32_t value);
void WriteU64(std::vector<std::uint8_t>* out, std::uint64_t value);
void WriteI64(std::vector<std::uint8_t>* out, std::int64_t value);
void WriteBool(std::vector<std::uint8_t>* out, bool value);
void WriteFixed(std::vector<std::uint8_t>* out, std::span<const std::uint8_t> bytes);
void WritePubkey(std::vector<std::uint8_t>* out, const chain::Pubkey& key);
void WriteString(std::vector<std::uint8_t>* out, std::string_view value);
void WriteBytes(std::vector<std::uint8_t>* out, std::span<const std::uint8_t> value);
void WriteStringVector(std::vector<std::uint8_t>* out, const std::vector<std::string>& values);
void WriteOptionString(std::vector<std::uint8_t>* out, const std::optional<std::string>& value);
void WriteOptionStringVector(std::vector<std::uint8_t>* out,
                             const std::optional<std::vector<std::string>>& value);
// Option<Option<String>>: None = leave unchanged, Some(None) = clear.
void WriteOptionOptionString(std::vector<std::uint8_t>* out,
                             const std::optional<std::optional<std::string>>& value);

// Byte length of a serialized Borsh string.
constexpr std::size_t BorshStringSize(std::size_t byte_length) { return 4 + byte_length; }

enum class ReadFailure {
  kNone,
  kTruncated,
  kMalformed,
};

// Left-to-right cursor over untrusted bytes. Every Read* returns false once
// the input is exhausted or malformed and records the first failure; the
// cursor never reads past the end of the span.
class BorshReader {
 public:
  explicit BorshReader(std::span<const std::uint8_t> data) : data_(data) {}

  bool ReadU8(std::uint8_t* value, std::string_view field);
  bool ReadU32(std::uint32_t* value, std::string_view field);
  bool ReadU64(std::uint64_t* value, std::string_view field);
  bool ReadI64(std::int64_t* value, std::string_view field);
  bool ReadBool(bool* value, std::string_view field);
  bool ReadFixed(std::span<std::uint8_t> out, std::string_view field);
  bool ReadPubkey(chain::Pubkey* key, std::string_view field);
  bool ReadString(std::string* value, std::string_view field);
  bool ReadBytes(std::vector<std::uint8_t>* value, std::string_view field);
  bool ReadStringVector(std::vector<std::string>* values, std::string_view field);
  bool ReadOptionString(std::optional<std::string>* value, std::string_view field);
  bool ReadOptionStringVector(std::optional<std::vector<std::string>>* value,
                              std::string_view field);
  bool ReadOptionOptionString(std::optional<std::optional<std::string>>* value,
                              std::string_view field);
  bool Skip(std::size_t count, std::string_view field);

  [[nodiscard]] std::size_t offset() const noexcept { return offset_; }
  [[nodiscard]] std::size_t remaining() const noexcept { return data_.size() - offset_; }
  [[nodiscard]] bool AtEnd() const noexcept { return offset_ == data_.size(); }
  [[nodiscard]] ReadFailure failure() const noexcept { return failure_; }
  [[nodiscard]] const std::string& error() const noexcept { return error_; }

 private:
  bool Need(std::size_t count, std::string_view field);
  bool Fail(ReadFailure failure, std::string message);
  bool ReadOptionTag(bool* present, std::string_view field);

  std::span<const std::uint8_t> data_;
  std::size_t offset_{0};
  ReadFailure failure_{ReadFailure::kNone};
  std::string error_;
};

bool IsValidUtf8(std::string_view text);

}  // namespace x1memo::codec
