#pragma once

#include <array>
#include <cstdint>
#include <string_view>

namespace x1memo::chain {

using Discriminator = std::array<std::uint8_t, 8>;

// First eight bytes of SHA-256("global:" + name), the selector the on-chain
// programs dispatch on.
Discriminator InstructionDiscriminator(std::string_view operation_name);

}  // namespace x1memo::chain
