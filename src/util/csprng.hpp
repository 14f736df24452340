#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace x1memo::util {

// Operating-system entropy (getrandom, then /dev/urandom).
bool FillSecureRandomBytes(std::span<std::uint8_t> out, std::string* error = nullptr);

// Uniform value in [0, bound). |bound| must be non-zero.
bool SecureRandomBelow(std::uint64_t bound, std::uint64_t* out, std::string* error = nullptr);

// Non-zero value that fits a signed 64-bit JSON number.
bool SecureRandomPositiveId(std::uint64_t* out, std::string* error = nullptr);

}  // namespace x1memo::util
