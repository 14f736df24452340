#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace x1memo::util {

// RFC 4648 standard alphabet with '=' padding.
std::string Base64Encode(std::span<const std::uint8_t> input);
std::string Base64Encode(std::string_view input);

// Canonical decoder for memo text and account data: the length must be a
// multiple of four, padding may only terminate the input, and the unused
// bits of the final symbol must be zero. Whitespace is rejected.
bool Base64Decode(std::string_view input, std::vector<std::uint8_t>* out);

// Length of Base64Encode() output for |byte_count| input bytes.
constexpr std::size_t Base64EncodedLength(std::size_t byte_count) {
  return ((byte_count + 2) / 3) * 4;
}

}  // namespace x1memo::util
