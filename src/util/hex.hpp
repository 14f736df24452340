#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace x1memo::util {

std::string HexEncode(std::span<const std::uint8_t> data);

// Accepts upper and lower case digits; an optional "0x" prefix is skipped.
bool HexDecode(std::string_view hex, std::vector<std::uint8_t>* out);

// Renders bytes as a comma separated decimal list, e.g. "[220, 214, 24]".
std::string FormatByteList(std::span<const std::uint8_t> data);

}  // namespace x1memo::util
