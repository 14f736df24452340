#include "chain/discriminator.hpp"

#include <algorithm>
#include <string>

#include "crypto/hash.hpp"

namespace x1memo::chain {

Discriminator InstructionDiscriminator(std::string_view operation_name) {
  std::string preimage = "global:";
  preimage.append(operation_name);
  const auto digest = crypto::Sha256(preimage);
  Discriminator out{};
  std::copy_n(digest.begin(), out.size(), out.begin());
  return out;
}

}  // namespace x1memo::chain
