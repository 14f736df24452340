#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include "tx/message.hpp"

namespace x1memo::tx {

using Signature = std::array<std::uint8_t, 64>;

// Largest serialized transaction the network accepts in one packet.
constexpr std::size_t kMaxTransactionSize = 1232;

struct Transaction {
  std::vector<Signature> signatures;
  Message message;
};

// One zeroed signature slot per required signer.
Transaction MakeUnsignedTransaction(Message message);

// Bytes a signer signs.
std::vector<std::uint8_t> MessageBytes(const Message& message);

void SerializeTransaction(const Transaction& transaction, std::vector<std::uint8_t>* out);
bool DeserializeTransaction(std::span<const std::uint8_t> data, Transaction* out,
                            std::string* error = nullptr);

// Standard Base64 of the serialized transaction, as sent over RPC.
std::string EncodeTransactionBase64(const Transaction& transaction);
bool DecodeTransactionBase64(const std::string& text, Transaction* out,
                             std::string* error = nullptr);

// Places |signature| in the slot of |signer|. Fails when |signer| is not one
// of the message's required signers.
bool ApplySignature(Transaction* transaction, const chain::Pubkey& signer,
                    const Signature& signature, std::string* error = nullptr);

}  // namespace x1memo::tx
