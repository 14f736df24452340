#pragma once

#include <cstdint>
#include <span>

namespace x1memo::crypto {

// True when |encoded| decompresses to a point on the Ed25519 curve, using the
// same acceptance rule as curve25519-dalek's CompressedEdwardsY::decompress:
// the sign bit is ignored, the y coordinate is taken modulo 2^255 - 19 and the
// point exists iff (y^2 - 1) / (d * y^2 + 1) is a square. No subgroup check is
// performed. Program-derived addresses are exactly the hashes for which this
// returns false.
bool IsOnEd25519Curve(std::span<const std::uint8_t, 32> encoded);

}  // namespace x1memo::crypto
