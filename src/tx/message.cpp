#include "tx/message.hpp"

#include <algorithm>
#include <map>

#include "util/base58.hpp"

namespace x1memo::tx {

namespace {

struct KeyFlags {
  bool is_signer{false};
  bool is_writable{false};
};

bool Fail(std::string* error, const std::string& message) {
  if (error) {
    *error = message;
  }
  return false;
}

bool ReadByte(std::span<const std::uint8_t> data, std::size_t* offset, std::uint8_t* value) {
  if (*offset >= data.size()) {
    return false;
  }
  *value = data[(*offset)++];
  return true;
}

bool ReadByteVector(std::span<const std::uint8_t> data, std::size_t* offset,
                    std::vector<std::uint8_t>* out) {
  std::uint16_t length = 0;
  if (!ReadCompactU16(data, offset, &length) || data.size() - *offset < length) {
    return false;
  }
  out->assign(data.begin() + static_cast<std::ptrdiff_t>(*offset),
              data.begin() + static_cast<std::ptrdiff_t>(*offset + length));
  *offset += length;
  return true;
}

}  // namespace

bool Message::IsSigner(std::size_t index) const noexcept {
  return index < header.num_required_signatures;
}

bool Message::IsWritable(std::size_t index) const noexcept {
  const std::size_t signers = header.num_required_signatures;
  if (index < signers) {
    return index < signers - header.num_readonly_signed_accounts;
  }
  const std::size_t unsigned_count = account_keys.size() - signers;
  return index - signers < unsigned_count - header.num_readonly_unsigned_accounts;
}

bool CompileMessage(const std::vector<Instruction>& instructions, const chain::Pubkey& payer,
                    const Blockhash& recent_blockhash, Message* out, std::string* error) {
  // Ordered by raw key bytes.
  std::map<chain::Pubkey, KeyFlags> keys;
  for (const auto& instruction : instructions) {
    keys.try_emplace(instruction.program_id);
    for (const auto& meta : instruction.accounts) {
      auto& flags = keys[meta.pubkey];
      flags.is_signer |= meta.is_signer;
      flags.is_writable |= meta.is_writable;
    }
  }
  keys.erase(payer);

  std::vector<chain::Pubkey> writable_signers{payer};
  std::vector<chain::Pubkey> readonly_signers;
  std::vector<chain::Pubkey> writable_unsigned;
  std::vector<chain::Pubkey> readonly_unsigned;
  for (const auto& [key, flags] : keys) {
    if (flags.is_signer) {
      (flags.is_writable ? writable_signers : readonly_signers).push_back(key);
    } else {
      (flags.is_writable ? writable_unsigned : readonly_unsigned).push_back(key);
    }
  }

  const std::size_t total = writable_signers.size() + readonly_signers.size() +
                            writable_unsigned.size() + readonly_unsigned.size();
  if (total > kMaxAccountKeys) {
    return Fail(error, "message references " + std::to_string(total) + " accounts (max: " +
                           std::to_string(kMaxAccountKeys) + ")");
  }

  Message message;
  message.header.num_required_signatures =
      static_cast<std::uint8_t>(writable_signers.size() + readonly_signers.size());
  message.header.num_readonly_signed_accounts = static_cast<std::uint8_t>(readonly_signers.size());
  message.header.num_readonly_unsigned_accounts =
      static_cast<std::uint8_t>(readonly_unsigned.size());
  message.account_keys.reserve(total);
  for (const auto* group : {&writable_signers, &readonly_signers, &writable_unsigned,
                            &readonly_unsigned}) {
    message.account_keys.insert(message.account_keys.end(), group->begin(), group->end());
  }
  message.recent_blockhash = recent_blockhash;

  auto index_of = [&](const chain::Pubkey& key) {
    const auto it = std::find(message.account_keys.begin(), message.account_keys.end(), key);
    return static_cast<std::uint8_t>(it - message.account_keys.begin());
  };
  message.instructions.reserve(instructions.size());
  for (const auto& instruction : instructions) {
    if (instruction.accounts.size() > 0xFFFF || instruction.data.size() > 0xFFFF) {
      return Fail(error, "instruction exceeds compact-u16 limits");
    }
    CompiledInstruction compiled;
    compiled.program_id_index = index_of(instruction.program_id);
    compiled.accounts.reserve(instruction.accounts.size());
    for (const auto& meta : instruction.accounts) {
      compiled.accounts.push_back(index_of(meta.pubkey));
    }
    compiled.data = instruction.data;
    message.instructions.push_back(std::move(compiled));
  }
  *out = std::move(message);
  return true;
}

void WriteCompactU16(std::vector<std::uint8_t>* out, std::uint16_t value) {
  std::uint32_t remaining = value;
  while (true) {
    std::uint8_t byte = static_cast<std::uint8_t>(remaining & 0x7F);
    remaining >>= 7;
    if (remaining == 0) {
      out->push_back(byte);
      return;
    }
    out->push_back(static_cast<std::uint8_t>(byte | 0x80));
  }
}

bool ReadCompactU16(std::span<const std::uint8_t> data, std::size_t* offset,
                    std::uint16_t* value) {
  std::uint32_t result = 0;
  for (int i = 0; i < 3; ++i) {
    std::uint8_t byte = 0;
    if (!ReadByte(data, offset, &byte)) {
      return false;
    }
    // The third byte carries the top two bits only.
    if (i == 2 && byte > 0x03) {
      return false;
    }
    // Reject redundant trailing zero bytes.
    if (i > 0 && byte == 0) {
      return false;
    }
    result |= static_cast<std::uint32_t>(byte & 0x7F) << (7 * i);
    if ((byte & 0x80) == 0) {
      *value = static_cast<std::uint16_t>(result);
      return true;
    }
  }
  return false;
}

void SerializeMessage(const Message& message, std::vector<std::uint8_t>* out) {
  out->push_back(message.header.num_required_signatures);
  out->push_back(message.header.num_readonly_signed_accounts);
  out->push_back(message.header.num_readonly_unsigned_accounts);
  WriteCompactU16(out, static_cast<std::uint16_t>(message.account_keys.size()));
  for (const auto& key : message.account_keys) {
    out->insert(out->end(), key.bytes.begin(), key.bytes.end());
  }
  out->insert(out->end(), message.recent_blockhash.begin(), message.recent_blockhash.end());
  WriteCompactU16(out, static_cast<std::uint16_t>(message.instructions.size()));
  for (const auto& instruction : message.instructions) {
    out->push_back(instruction.program_id_index);
    WriteCompactU16(out, static_cast<std::uint16_t>(instruction.accounts.size()));
    out->insert(out->end(), instruction.accounts.begin(), instruction.accounts.end());
    WriteCompactU16(out, static_cast<std::uint16_t>(instruction.data.size()));
    out->insert(out->end(), instruction.data.begin(), instruction.data.end());
  }
}

bool DeserializeMessage(std::span<const std::uint8_t> data, std::size_t* offset, Message* out,
                        std::string* error) {
  Message message;
  if (!ReadByte(data, offset, &message.header.num_required_signatures) ||
      !ReadByte(data, offset, &message.header.num_readonly_signed_accounts) ||
      !ReadByte(data, offset, &message.header.num_readonly_unsigned_accounts)) {
    return Fail(error, "truncated message header");
  }
  std::uint16_t key_count = 0;
  if (!ReadCompactU16(data, offset, &key_count)) {
    return Fail(error, "malformed account key count");
  }
  if (data.size() - *offset < static_cast<std::size_t>(key_count) * 32 + 32) {
    return Fail(error, "truncated account keys");
  }
  message.account_keys.resize(key_count);
  for (auto& key : message.account_keys) {
    std::copy_n(data.begin() + static_cast<std::ptrdiff_t>(*offset), 32, key.bytes.begin());
    *offset += 32;
  }
  std::copy_n(data.begin() + static_cast<std::ptrdiff_t>(*offset), 32,
              message.recent_blockhash.begin());
  *offset += 32;
  if (message.header.num_required_signatures > key_count ||
      message.header.num_readonly_signed_accounts > message.header.num_required_signatures ||
      message.header.num_readonly_unsigned_accounts >
          key_count - message.header.num_required_signatures) {
    return Fail(error, "message header inconsistent with account table");
  }

  std::uint16_t instruction_count = 0;
  if (!ReadCompactU16(data, offset, &instruction_count)) {
    return Fail(error, "malformed instruction count");
  }
  for (std::uint16_t i = 0; i < instruction_count; ++i) {
    CompiledInstruction instruction;
    if (!ReadByte(data, offset, &instruction.program_id_index) ||
        !ReadByteVector(data, offset, &instruction.accounts) ||
        !ReadByteVector(data, offset, &instruction.data)) {
      return Fail(error, "truncated instruction " + std::to_string(i));
    }
    if (instruction.program_id_index >= key_count) {
      return Fail(error, "instruction " + std::to_string(i) + " program index out of range");
    }
    for (auto index : instruction.accounts) {
      if (index >= key_count) {
        return Fail(error, "instruction " + std::to_string(i) + " account index out of range");
      }
    }
    message.instructions.push_back(std::move(instruction));
  }
  *out = std::move(message);
  return true;
}

bool ParseBlockhash(std::string_view text, Blockhash* out, std::string* error) {
  std::vector<std::uint8_t> decoded;
  if (text.empty() || text.size() > 44 || !util::Base58Decode(text, &decoded) ||
      decoded.size() != 32) {
    return Fail(error, "invalid blockhash '" + std::string(text) + "'");
  }
  std::copy(decoded.begin(), decoded.end(), out->begin());
  return true;
}

}  // namespace x1memo::tx
