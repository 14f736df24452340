#include "util/base64.hpp"

#include <array>

namespace x1memo::util {

namespace {

constexpr std::string_view kAlphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

constexpr std::array<int, 256> BuildDecodeTable() {
  std::array<int, 256> table{};
  table.fill(-1);
  for (std::size_t i = 0; i < kAlphabet.size(); ++i) {
    table[static_cast<unsigned char>(kAlphabet[i])] = static_cast<int>(i);
  }
  return table;
}

constexpr auto kDecodeTable = BuildDecodeTable();

}  // namespace

std::string Base64Encode(std::span<const std::uint8_t> input) {
  std::string encoded;
  encoded.reserve(Base64EncodedLength(input.size()));
  std::size_t i = 0;
  for (; i + 3 <= input.size(); i += 3) {
    const std::uint32_t triple = (static_cast<std::uint32_t>(input[i]) << 16) |
                                 (static_cast<std::uint32_t>(input[i + 1]) << 8) |
                                 static_cast<std::uint32_t>(input[i + 2]);
    encoded.push_back(kAlphabet[(triple >> 18) & 0x3f]);
    encoded.push_back(kAlphabet[(triple >> 12) & 0x3f]);
    encoded.push_back(kAlphabet[(triple >> 6) & 0x3f]);
    encoded.push_back(kAlphabet[triple & 0x3f]);
  }
  const std::size_t rest = input.size() - i;
  if (rest == 1) {
    const std::uint32_t value = static_cast<std::uint32_t>(input[i]) << 16;
    encoded.push_back(kAlphabet[(value >> 18) & 0x3f]);
    encoded.push_back(kAlphabet[(value >> 12) & 0x3f]);
    encoded.append("==");
  } else if (rest == 2) {
    const std::uint32_t value = (static_cast<std::uint32_t>(input[i]) << 16) |
                                (static_cast<std::uint32_t>(input[i + 1]) << 8);
    encoded.push_back(kAlphabet[(value >> 18) & 0x3f]);
    encoded.push_back(kAlphabet[(value >> 12) & 0x3f]);
    encoded.push_back(kAlphabet[(value >> 6) & 0x3f]);
    encoded.push_back('=');
  }
  return encoded;
}

std::string Base64Encode(std::string_view input) {
  return Base64Encode(std::span<const std::uint8_t>(
      reinterpret_cast<const std::uint8_t*>(input.data()), input.size()));
}

bool Base64Decode(std::string_view input, std::vector<std::uint8_t>* out) {
  if (!out) {
    return false;
  }
  out->clear();
  if (input.size() % 4 != 0) {
    return false;
  }
  out->reserve((input.size() / 4) * 3);
  for (std::size_t i = 0; i < input.size(); i += 4) {
    const bool last_group = (i + 4 == input.size());
    int values[4] = {0, 0, 0, 0};
    std::size_t padding = 0;
    for (std::size_t k = 0; k < 4; ++k) {
      const char c = input[i + k];
      if (c == '=') {
        // Only the final group may be padded, and only in its last two slots.
        if (!last_group || k < 2) {
          return false;
        }
        ++padding;
        continue;
      }
      if (padding > 0) {
        return false;
      }
      const int decoded = kDecodeTable[static_cast<unsigned char>(c)];
      if (decoded < 0) {
        return false;
      }
      values[k] = decoded;
    }
    const std::uint32_t triple = (static_cast<std::uint32_t>(values[0]) << 18) |
                                 (static_cast<std::uint32_t>(values[1]) << 12) |
                                 (static_cast<std::uint32_t>(values[2]) << 6) |
                                 static_cast<std::uint32_t>(values[3]);
    out->push_back(static_cast<std::uint8_t>((triple >> 16) & 0xff));
    if (padding == 2) {
      if ((triple & 0xffff) != 0) {
        out->clear();
        return false;
      }
      continue;
    }
    out->push_back(static_cast<std::uint8_t>((triple >> 8) & 0xff));
    if (padding == 1) {
      if ((triple & 0xff) != 0) {
        out->clear();
        return false;
      }
      continue;
    }
    out->push_back(static_cast<std::uint8_t>(triple & 0xff));
  }
  return true;
}

}  // namespace x1memo::util
