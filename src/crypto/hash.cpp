#include "crypto/hash.hpp"

#include <vector>

#include <oqs/sha2.h>

namespace x1memo::crypto {

Sha256Hash Sha256(std::span<const std::uint8_t> data) {
  Sha256Hash out{};
  OQS_SHA2_sha256(out.data(), data.data(), data.size());
  return out;
}

Sha256Hash Sha256(std::string_view data) {
  return Sha256(std::span<const std::uint8_t>(
      reinterpret_cast<const std::uint8_t*>(data.data()), data.size()));
}

Sha256Hash Sha256Concat(std::initializer_list<std::span<const std::uint8_t>> parts) {
  std::size_t total = 0;
  for (const auto& part : parts) {
    total += part.size();
  }
  std::vector<std::uint8_t> buffer;
  buffer.reserve(total);
  for (const auto& part : parts) {
    buffer.insert(buffer.end(), part.begin(), part.end());
  }
  return Sha256(buffer);
}

}  // namespace x1memo::crypto
