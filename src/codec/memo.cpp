#include "codec/memo.hpp"

#include "codec/borsh.hpp"
#include "util/base64.hpp"

namespace x1memo::codec {

std::vector<std::uint8_t> SerializeBurnMemo(const BurnMemo& memo) {
  std::vector<std::uint8_t> out;
  out.reserve(kBurnMemoFixedOverhead + memo.payload.size());
  WriteU8(&out, memo.version);
  WriteU64(&out, memo.burn_amount);
  WriteBytes(&out, memo.payload);
  return out;
}

bool DeserializeBurnMemo(std::span<const std::uint8_t> data, BurnMemo* memo,
                         std::string* error) {
  BorshReader reader(data);
  BurnMemo parsed;
  if (!reader.ReadU8(&parsed.version, "version") ||
      !reader.ReadU64(&parsed.burn_amount, "burn_amount") ||
      !reader.ReadBytes(&parsed.payload, "payload")) {
    if (error) *error = reader.error();
    return false;
  }
  if (!reader.AtEnd()) {
    if (error) *error = std::to_string(reader.remaining()) + " trailing bytes after memo envelope";
    return false;
  }
  if (parsed.version != kBurnMemoVersion) {
    if (error) *error = "unsupported memo envelope version " + std::to_string(parsed.version);
    return false;
  }
  *memo = std::move(parsed);
  return true;
}

std::string EncodeMemoText(const BurnMemo& memo) {
  return util::Base64Encode(SerializeBurnMemo(memo));
}

bool DecodeMemoText(std::string_view text, BurnMemo* memo, std::string* error) {
  std::vector<std::uint8_t> raw;
  if (!util::Base64Decode(text, &raw)) {
    if (error) *error = "memo text is not base64";
    return false;
  }
  return DeserializeBurnMemo(raw, memo, error);
}

bool CheckMemoLength(std::size_t length, const MemoLengthRange& range, std::string* error) {
  if (length < range.min) {
    if (error) {
      *error = "memo too short: " + std::to_string(length) + " bytes (min: " +
               std::to_string(range.min) + ")";
    }
    return false;
  }
  if (length > range.max) {
    if (error) {
      *error = "memo too long: " + std::to_string(length) + " bytes (max: " +
               std::to_string(range.max) + ")";
    }
    return false;
  }
  return true;
}

}  // namespace x1memo::codec
