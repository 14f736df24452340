#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace x1memo::util {

// Bitcoin-alphabet Base58 without checksum, as used for ledger addresses,
// block hashes and signatures.
std::string Base58Encode(std::span<const std::uint8_t> input);

// Rejects characters outside the alphabet. Leading '1' characters decode to
// leading zero bytes.
bool Base58Decode(std::string_view input, std::vector<std::uint8_t>* out);

}  // namespace x1memo::util
