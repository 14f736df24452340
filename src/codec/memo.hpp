#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace x1memo::codec {

constexpr std::uint8_t kBurnMemoVersion = 1;

// version (1) + burn_amount (8) + payload length prefix (4).
constexpr std::size_t kBurnMemoFixedOverhead = 13;

// Inclusive byte range the memo programs accept for the memo text.
struct MemoLengthRange {
  std::size_t min{0};
  std::size_t max{0};
};

constexpr MemoLengthRange kDefaultMemoRange{69, 800};
constexpr std::size_t kMaxPayloadLength = kDefaultMemoRange.max - kBurnMemoFixedOverhead;

// Outer envelope every burn-accounted memo carries. burn_amount must equal the
// amount the accompanying program instruction burns (0 for mint operations).
struct BurnMemo {
  std::uint8_t version{kBurnMemoVersion};
  std::uint64_t burn_amount{0};
  std::vector<std::uint8_t> payload;
};

std::vector<std::uint8_t> SerializeBurnMemo(const BurnMemo& memo);

// Requires the envelope to span |data| exactly.
bool DeserializeBurnMemo(std::span<const std::uint8_t> data, BurnMemo* memo,
                         std::string* error = nullptr);

// Base64 text placed in the memo instruction.
std::string EncodeMemoText(const BurnMemo& memo);
bool DecodeMemoText(std::string_view text, BurnMemo* memo, std::string* error = nullptr);

// Length of EncodeMemoText() for a payload of |payload_size| bytes.
constexpr std::size_t EncodedMemoSize(std::size_t payload_size) {
  return ((kBurnMemoFixedOverhead + payload_size + 2) / 3) * 4;
}

bool CheckMemoLength(std::size_t length, const MemoLengthRange& range,
                     std::string* error = nullptr);

}  // namespace x1memo::codec
