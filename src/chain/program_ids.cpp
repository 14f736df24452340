#include "chain/program_ids.hpp"

namespace x1memo::chain {

const Pubkey& SystemProgramId() {
  static const Pubkey id = PubkeyFromLiteral("11111111111111111111111111111111");
  return id;
}

const Pubkey& SysvarInstructionsId() {
  static const Pubkey id = PubkeyFromLiteral("Sysvar1nstructions1111111111111111111111111");
  return id;
}

const Pubkey& ComputeBudgetProgramId() {
  static const Pubkey id = PubkeyFromLiteral("ComputeBudget111111111111111111111111111111");
  return id;
}

const Pubkey& MemoProgramId() {
  static const Pubkey id = PubkeyFromLiteral("MemoSq4gqABAXKb96qnH8TysNcWxMyWCqXgDLGmfcHr");
  return id;
}

const Pubkey& AssociatedTokenProgramId() {
  static const Pubkey id = PubkeyFromLiteral("ATokenGPvbdGVxr1b2hvZbsiqW5xWH25efTNsLJA8knL");
  return id;
}

const Pubkey& Token2022ProgramId() {
  static const Pubkey id = PubkeyFromLiteral("TokenzQdBNbLqP5VEhdkAS6EPFLC1PHnBqCXEpPxuEb");
  return id;
}

}  // namespace x1memo::chain
