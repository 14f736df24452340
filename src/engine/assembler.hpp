#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "chain/pubkey.hpp"
#include "tx/instruction.hpp"
#include "tx/transaction.hpp"

namespace x1memo::engine {

// Instruction order shared by the simulation and the final pass:
//   [memo] [program instructions...] [unit limit] [unit price]
// or, with |memo_after_unit_limit|,
//   [unit limit] [memo] [program instructions...] [unit price]
std::vector<tx::Instruction> AssembleInstructions(
    const std::optional<tx::Instruction>& memo,
    const std::vector<tx::Instruction>& program_instructions, std::uint32_t unit_limit,
    const std::optional<std::uint64_t>& unit_price, bool memo_after_unit_limit = false);

// Compiles an unsigned legacy transaction. Throws RpcError(kInvalidParameter)
// when the accounts do not fit a message or the result exceeds the packet
// size.
tx::Transaction AssembleTransaction(const std::vector<tx::Instruction>& instructions,
                                    const chain::Pubkey& fee_payer,
                                    const tx::Blockhash& recent_blockhash);

}  // namespace x1memo::engine
