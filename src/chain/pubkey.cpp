#include "chain/pubkey.hpp"

#include <algorithm>
#include <stdexcept>
#include <vector>

#include "util/base58.hpp"

namespace x1memo::chain {

std::string Pubkey::ToBase58() const { return util::Base58Encode(bytes); }

bool ParsePubkey(std::string_view text, Pubkey* out, std::string* error) {
  std::vector<std::uint8_t> decoded;
  if (text.empty() || text.size() > 44 || !util::Base58Decode(text, &decoded)) {
    if (error) *error = "address '" + std::string(text) + "' is not valid base58";
    return false;
  }
  if (decoded.size() != 32) {
    if (error) {
      *error = "address '" + std::string(text) + "' decodes to " +
               std::to_string(decoded.size()) + " bytes, expected 32";
    }
    return false;
  }
  if (out) {
    std::copy(decoded.begin(), decoded.end(), out->bytes.begin());
  }
  return true;
}

Pubkey PubkeyFromLiteral(std::string_view text) {
  Pubkey key;
  std::string error;
  if (!ParsePubkey(text, &key, &error)) {
    throw std::invalid_argument(error);
  }
  return key;
}

}  // namespace x1memo::chain
