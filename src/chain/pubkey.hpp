#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace x1memo::chain {

// 32-byte ledger address (account key, program id or derived address).
struct Pubkey {
  std::array<std::uint8_t, 32> bytes{};

  bool operator==(const Pubkey& other) const = default;
  auto operator<=>(const Pubkey& other) const = default;

  [[nodiscard]] std::span<const std::uint8_t> Span() const noexcept { return bytes; }
  [[nodiscard]] std::string ToBase58() const;
};

// Decodes a Base58 address. Fails unless the text decodes to exactly 32 bytes.
bool ParsePubkey(std::string_view text, Pubkey* out, std::string* error = nullptr);

// For compiled-in program ids; throws std::invalid_argument on malformed text.
Pubkey PubkeyFromLiteral(std::string_view text);

}  // namespace x1memo::chain
