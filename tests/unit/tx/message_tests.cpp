#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "chain/pubkey.hpp"
#include "tx/instruction.hpp"
#include "tx/message.hpp"
#include "tx/transaction.hpp"

namespace {

using namespace x1memo::tx;
using x1memo::chain::Pubkey;

Pubkey KeyWithByte(std::uint8_t value) {
  Pubkey key;
  key.bytes.fill(value);
  return key;
}

bool TestAccountOrdering() {
  const auto payer = KeyWithByte(0x90);
  const auto writable_signer = KeyWithByte(0x80);
  const auto readonly_signer = KeyWithByte(0x10);
  const auto writable_b = KeyWithByte(0x40);
  const auto writable_a = KeyWithByte(0x30);
  const auto readonly = KeyWithByte(0x20);
  const auto program = KeyWithByte(0x05);

  Instruction first;
  first.program_id = program;
  first.accounts = {AccountMeta::ReadOnly(readonly), AccountMeta::Writable(writable_b),
                    AccountMeta::ReadOnly(readonly_signer, true), AccountMeta::ReadOnly(payer)};
  first.data = {1, 2, 3};
  Instruction second;
  second.program_id = program;
  // Duplicate key promoted to writable by the second reference.
  second.accounts = {AccountMeta::Writable(writable_signer, true),
                     AccountMeta::ReadOnly(writable_a), AccountMeta::Writable(writable_a)};

  Message message;
  std::string error;
  Blockhash blockhash{};
  blockhash.fill(7);
  if (!CompileMessage({first, second}, payer, blockhash, &message, &error)) {
    std::cerr << "message_tests: compile failed: " << error << "\n";
    return false;
  }
  const std::vector<Pubkey> expected = {payer,      writable_signer, readonly_signer,
                                        writable_a, writable_b,      program,
                                        readonly};
  if (message.account_keys != expected) {
    std::cerr << "message_tests: account order mismatch\n";
    return false;
  }
  const MessageHeader header{3, 1, 2};
  if (!(message.header == header)) {
    std::cerr << "message_tests: header " << int(message.header.num_required_signatures) << "/"
              << int(message.header.num_readonly_signed_accounts) << "/"
              << int(message.header.num_readonly_unsigned_accounts) << "\n";
    return false;
  }
  if (!message.IsSigner(0) || !message.IsWritable(0) || message.IsWritable(2) ||
      !message.IsWritable(3) || message.IsWritable(6) || message.IsSigner(3)) {
    std::cerr << "message_tests: privilege lookup\n";
    return false;
  }
  if (message.instructions.size() != 2 || message.instructions[0].program_id_index != 5 ||
      message.instructions[0].accounts != std::vector<std::uint8_t>{6, 4, 2, 0} ||
      message.instructions[0].data != first.data ||
      message.instructions[1].accounts != std::vector<std::uint8_t>{1, 3, 3}) {
    std::cerr << "message_tests: compiled instruction indices\n";
    return false;
  }
  return true;
}

bool TestCompactU16() {
  const struct {
    std::uint16_t value;
    std::vector<std::uint8_t> bytes;
  } cases[] = {
      {0, {0x00}},
      {127, {0x7f}},
      {128, {0x80, 0x01}},
      {16383, {0xff, 0x7f}},
      {16384, {0x80, 0x80, 0x01}},
      {65535, {0xff, 0xff, 0x03}},
  };
  for (const auto& c : cases) {
    std::vector<std::uint8_t> out;
    WriteCompactU16(&out, c.value);
    if (out != c.bytes) {
      std::cerr << "message_tests: compact-u16 encode " << c.value << "\n";
      return false;
    }
    std::size_t offset = 0;
    std::uint16_t value = 0;
    if (!ReadCompactU16(out, &offset, &value) || value != c.value || offset != out.size()) {
      std::cerr << "message_tests: compact-u16 decode " << c.value << "\n";
      return false;
    }
  }
  // Alias encoding of 0.
  const std::vector<std::uint8_t> alias = {0x80, 0x00};
  std::size_t offset = 0;
  std::uint16_t value = 0;
  if (ReadCompactU16(alias, &offset, &value)) {
    std::cerr << "message_tests: non-canonical compact-u16 accepted\n";
    return false;
  }
  return true;
}

bool TestTransactionSignatures() {
  const auto payer = KeyWithByte(0x42);
  const auto other = KeyWithByte(0x43);
  Instruction memo = BuildMemoInstruction("hello", {payer});
  Message message;
  std::string error;
  if (!CompileMessage({memo}, payer, Blockhash{}, &message, &error)) {
    std::cerr << "message_tests: memo compile: " << error << "\n";
    return false;
  }
  auto transaction = MakeUnsignedTransaction(message);
  if (transaction.signatures.size() != 1) {
    std::cerr << "message_tests: signature slots\n";
    return false;
  }
  Signature signature{};
  signature.fill(0xEE);
  if (ApplySignature(&transaction, other, signature, &error)) {
    std::cerr << "message_tests: signature from a non-signer applied\n";
    return false;
  }
  if (!ApplySignature(&transaction, payer, signature, &error)) {
    std::cerr << "message_tests: apply signature: " << error << "\n";
    return false;
  }
  Transaction decoded;
  if (!DecodeTransactionBase64(EncodeTransactionBase64(transaction), &decoded, &error) ||
      decoded.signatures != transaction.signatures ||
      decoded.message.account_keys != transaction.message.account_keys ||
      decoded.message.instructions != transaction.message.instructions) {
    std::cerr << "message_tests: transaction wire form: " << error << "\n";
    return false;
  }
  std::vector<std::uint8_t> wire;
  SerializeTransaction(transaction, &wire);
  wire.push_back(0);
  if (DeserializeTransaction(wire, &decoded, &error)) {
    std::cerr << "message_tests: trailing byte after transaction accepted\n";
    return false;
  }
  return true;
}

}  // namespace

int main() {
  if (!TestAccountOrdering()) return EXIT_FAILURE;
  if (!TestCompactU16()) return EXIT_FAILURE;
  if (!TestTransactionSignatures()) return EXIT_FAILURE;
  return EXIT_SUCCESS;
}
