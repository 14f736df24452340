#include <array>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>

#include "chain/discriminator.hpp"
#include "util/hex.hpp"

namespace {

struct Vector {
  const char* name;
  x1memo::chain::Discriminator expected;
};

}  // namespace

int main() {
  const Vector vectors[] = {
      {"process_burn", {220, 214, 24, 210, 116, 16, 167, 18}},
      {"create_post", {123, 92, 184, 29, 231, 24, 15, 202}},
      {"update_post", {151, 128, 207, 107, 169, 246, 241, 107}},
      {"create_profile", {225, 205, 234, 143, 17, 186, 50, 220}},
      {"process_mint", {223, 152, 48, 109, 252, 238, 111, 136}},
      {"initialize_user_global_burn_stats", {200, 231, 6, 155, 161, 236, 10, 151}},
  };
  for (const auto& vector : vectors) {
    const auto actual = x1memo::chain::InstructionDiscriminator(vector.name);
    if (actual != vector.expected) {
      std::cerr << "discriminator_tests: " << vector.name << " got "
                << x1memo::util::FormatByteList(actual) << "\n";
      return EXIT_FAILURE;
    }
  }
  if (x1memo::util::FormatByteList(
          x1memo::chain::InstructionDiscriminator("process_burn")) !=
      "[220, 214, 24, 210, 116, 16, 167, 18]") {
    std::cerr << "discriminator_tests: byte list rendering\n";
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
