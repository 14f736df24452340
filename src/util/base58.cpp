#include "util/base58.hpp"

#include <array>

namespace x1memo::util {

namespace {

constexpr std::string_view kAlphabet =
    "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

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

std::string Base58Encode(std::span<const std::uint8_t> input) {
  std::size_t zeros = 0;
  while (zeros < input.size() && input[zeros] == 0) {
    ++zeros;
  }
  // log(256) / log(58) ~= 1.37
  std::vector<std::uint8_t> digits((input.size() - zeros) * 138 / 100 + 1, 0);
  std::size_t length = 0;
  for (std::size_t i = zeros; i < input.size(); ++i) {
    int carry = input[i];
    std::size_t j = 0;
    for (auto it = digits.rbegin(); (carry != 0 || j < length) && it != digits.rend();
         ++it, ++j) {
      carry += 256 * (*it);
      *it = static_cast<std::uint8_t>(carry % 58);
      carry /= 58;
    }
    length = j;
  }
  auto it = digits.begin() + static_cast<std::ptrdiff_t>(digits.size() - length);
  while (it != digits.end() && *it == 0) {
    ++it;
  }
  std::string encoded(zeros, '1');
  encoded.reserve(zeros + static_cast<std::size_t>(digits.end() - it));
  for (; it != digits.end(); ++it) {
    encoded.push_back(kAlphabet[*it]);
  }
  return encoded;
}

bool Base58Decode(std::string_view input, std::vector<std::uint8_t>* out) {
  if (!out) {
    return false;
  }
  out->clear();
  std::size_t zeros = 0;
  while (zeros < input.size() && input[zeros] == '1') {
    ++zeros;
  }
  // log(58) / log(256) ~= 0.733
  std::vector<std::uint8_t> bytes((input.size() - zeros) * 733 / 1000 + 1, 0);
  std::size_t length = 0;
  for (std::size_t i = zeros; i < input.size(); ++i) {
    const int value = kDecodeTable[static_cast<unsigned char>(input[i])];
    if (value < 0) {
      return false;
    }
    int carry = value;
    std::size_t j = 0;
    for (auto it = bytes.rbegin(); (carry != 0 || j < length) && it != bytes.rend(); ++it, ++j) {
      carry += 58 * (*it);
      *it = static_cast<std::uint8_t>(carry % 256);
      carry /= 256;
    }
    if (carry != 0) {
      return false;
    }
    length = j;
  }
  auto it = bytes.begin() + static_cast<std::ptrdiff_t>(bytes.size() - length);
  while (it != bytes.end() && *it == 0) {
    ++it;
  }
  out->assign(zeros, 0);
  out->insert(out->end(), it, bytes.end());
  return true;
}

}  // namespace x1memo::util
