#pragma once

#include <array>
#include <cstdint>
#include <initializer_list>
#include <span>
#include <string_view>

namespace x1memo::crypto {

using Sha256Hash = std::array<std::uint8_t, 32>;

// FIPS-180-4 SHA-256.
Sha256Hash Sha256(std::span<const std::uint8_t> data);
Sha256Hash Sha256(std::string_view data);

// SHA-256 over the concatenation of |parts| in order.
Sha256Hash Sha256Concat(std::initializer_list<std::span<const std::uint8_t>> parts);

}  // namespace x1memo::crypto
