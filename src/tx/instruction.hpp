#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "chain/pubkey.hpp"

namespace x1memo::tx {

struct AccountMeta {
  chain::Pubkey pubkey;
  bool is_signer{false};
  bool is_writable{false};

  static AccountMeta Writable(const chain::Pubkey& key, bool signer = false) {
    return AccountMeta{key, signer, true};
  }
  static AccountMeta ReadOnly(const chain::Pubkey& key, bool signer = false) {
    return AccountMeta{key, signer, false};
  }

  bool operator==(const AccountMeta& other) const = default;
};

struct Instruction {
  chain::Pubkey program_id;
  std::vector<AccountMeta> accounts;
  std::vector<std::uint8_t> data;

  bool operator==(const Instruction& other) const = default;
};

inline constexpr std::uint8_t kSetComputeUnitLimitTag = 0x02;
inline constexpr std::uint8_t kSetComputeUnitPriceTag = 0x03;
inline constexpr std::uint8_t kCreateTag = 0x00;
inline constexpr std::uint8_t kCreateIdempotentTag = 0x01;
inline constexpr std::uint32_t kSystemTransferTag = 2;
inline constexpr std::uint8_t kTransferCheckedTag = 12;

// Memo program instruction; every signer is attached read-only so the
// program verifies its signature.
Instruction BuildMemoInstruction(std::string_view memo, const std::vector<chain::Pubkey>& signers);

Instruction BuildSetComputeUnitLimit(std::uint32_t units);
Instruction BuildSetComputeUnitPrice(std::uint64_t micro_lamports);

// No-op when the associated token account already exists.
Instruction BuildCreateAssociatedTokenAccountIdempotent(const chain::Pubkey& payer,
                                                        const chain::Pubkey& owner,
                                                        const chain::Pubkey& mint,
                                                        const chain::Pubkey& token_program);

// Fails on chain when the account already exists.
Instruction BuildCreateAssociatedTokenAccount(const chain::Pubkey& payer,
                                              const chain::Pubkey& owner,
                                              const chain::Pubkey& mint,
                                              const chain::Pubkey& token_program);

// System program lamport transfer.
Instruction BuildSystemTransfer(const chain::Pubkey& from, const chain::Pubkey& to,
                                std::uint64_t lamports);

// Token program TransferChecked between two token accounts of |mint|.
Instruction BuildTransferChecked(const chain::Pubkey& token_program, const chain::Pubkey& source,
                                 const chain::Pubkey& mint, const chain::Pubkey& destination,
                                 const chain::Pubkey& owner, std::uint64_t amount,
                                 std::uint8_t decimals);

bool IsComputeBudgetInstruction(const Instruction& instruction);

}  // namespace x1memo::tx
