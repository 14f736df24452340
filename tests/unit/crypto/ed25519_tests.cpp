#include <array>
#include <cstdint>
#include <cstdlib>
#include <iostream>

#include "crypto/ed25519.hpp"

namespace {

std::array<std::uint8_t, 32> WithFirstByte(std::uint8_t value) {
  std::array<std::uint8_t, 32> out{};
  out[0] = value;
  return out;
}

bool Expect(const std::array<std::uint8_t, 32>& encoded, bool expected, const char* label) {
  if (x1memo::crypto::IsOnEd25519Curve(encoded) != expected) {
    std::cerr << "ed25519_tests: " << label << " expected " << (expected ? "on" : "off")
              << " curve\n";
    return false;
  }
  return true;
}

}  // namespace

int main() {
  std::array<std::uint8_t, 32> basepoint{};
  basepoint.fill(0x66);
  basepoint[0] = 0x58;
  if (!Expect(basepoint, true, "basepoint")) return EXIT_FAILURE;

  if (!Expect(WithFirstByte(0), true, "y = 0")) return EXIT_FAILURE;
  if (!Expect(WithFirstByte(1), true, "identity")) return EXIT_FAILURE;
  if (!Expect(WithFirstByte(3), true, "y = 3")) return EXIT_FAILURE;
  if (!Expect(WithFirstByte(2), false, "y = 2")) return EXIT_FAILURE;
  if (!Expect(WithFirstByte(7), false, "y = 7")) return EXIT_FAILURE;
  if (!Expect(WithFirstByte(8), false, "y = 8")) return EXIT_FAILURE;

  // The sign bit does not change the answer.
  auto signed_identity = WithFirstByte(1);
  signed_identity[31] = 0x80;
  if (!Expect(signed_identity, true, "identity with sign bit")) return EXIT_FAILURE;

  // y = p + 1 and y = p + 2 reduce to 1 and 2.
  std::array<std::uint8_t, 32> above_p{};
  above_p.fill(0xFF);
  above_p[0] = 0xEE;
  above_p[31] = 0x7F;
  if (!Expect(above_p, true, "y = p + 1")) return EXIT_FAILURE;
  above_p[0] = 0xEF;
  if (!Expect(above_p, false, "y = p + 2")) return EXIT_FAILURE;
  return EXIT_SUCCESS;
}
