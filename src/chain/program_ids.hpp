#pragma once

#include "chain/pubkey.hpp"

namespace x1memo::chain {

// Programs and sysvars that are identical on every X1 network.
const Pubkey& SystemProgramId();
const Pubkey& SysvarInstructionsId();
const Pubkey& ComputeBudgetProgramId();
const Pubkey& MemoProgramId();
const Pubkey& AssociatedTokenProgramId();
const Pubkey& Token2022ProgramId();

}  // namespace x1memo::chain
