#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "chain/pubkey.hpp"
#include "tx/instruction.hpp"

namespace x1memo::tx {

using Blockhash = std::array<std::uint8_t, 32>;

// Largest account table a legacy message can index with one byte.
constexpr std::size_t kMaxAccountKeys = 256;

struct MessageHeader {
  std::uint8_t num_required_signatures{0};
  std::uint8_t num_readonly_signed_accounts{0};
  std::uint8_t num_readonly_unsigned_accounts{0};

  bool operator==(const MessageHeader& other) const = default;
};

struct CompiledInstruction {
  std::uint8_t program_id_index{0};
  std::vector<std::uint8_t> accounts;
  std::vector<std::uint8_t> data;

  bool operator==(const CompiledInstruction& other) const = default;
};

// Legacy message: the account table is ordered fee payer, writable signers,
// read-only signers, writable non-signers, read-only non-signers. Within
// each class keys are sorted by their raw bytes.
struct Message {
  MessageHeader header;
  std::vector<chain::Pubkey> account_keys;
  Blockhash recent_blockhash{};
  std::vector<CompiledInstruction> instructions;

  bool IsSigner(std::size_t index) const noexcept;
  bool IsWritable(std::size_t index) const noexcept;
};

// Merges duplicate keys (privileges OR-ed together), adds every program id
// as a read-only non-signer and keeps |instructions| in their given order.
bool CompileMessage(const std::vector<Instruction>& instructions, const chain::Pubkey& payer,
                    const Blockhash& recent_blockhash, Message* out, std::string* error = nullptr);

void WriteCompactU16(std::vector<std::uint8_t>* out, std::uint16_t value);
bool ReadCompactU16(std::span<const std::uint8_t> data, std::size_t* offset,
                    std::uint16_t* value);

void SerializeMessage(const Message& message, std::vector<std::uint8_t>* out);
bool DeserializeMessage(std::span<const std::uint8_t> data, std::size_t* offset, Message* out,
                        std::string* error = nullptr);

bool ParseBlockhash(std::string_view text, Blockhash* out, std::string* error = nullptr);

}  // namespace x1memo::tx
