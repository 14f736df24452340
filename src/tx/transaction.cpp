#include "tx/transaction.hpp"

#include <algorithm>

#include "util/base64.hpp"

namespace x1memo::tx {

Transaction MakeUnsignedTransaction(Message message) {
  Transaction transaction;
  transaction.signatures.assign(message.header.num_required_signatures, Signature{});
  transaction.message = std::move(message);
  return transaction;
}

std::vector<std::uint8_t> MessageBytes(const Message& message) {
  std::vector<std::uint8_t> out;
  SerializeMessage(message, &out);
  return out;
}

void SerializeTransaction(const Transaction& transaction, std::vector<std::uint8_t>* out) {
  WriteCompactU16(out, static_cast<std::uint16_t>(transaction.signatures.size()));
  for (const auto& signature : transaction.signatures) {
    out->insert(out->end(), signature.begin(), signature.end());
  }
  SerializeMessage(transaction.message, out);
}

bool DeserializeTransaction(std::span<const std::uint8_t> data, Transaction* out,
                            std::string* error) {
  std::size_t offset = 0;
  std::uint16_t count = 0;
  if (!ReadCompactU16(data, &offset, &count)) {
    if (error) *error = "malformed signature count";
    return false;
  }
  if (data.size() - offset < static_cast<std::size_t>(count) * 64) {
    if (error) *error = "truncated signatures";
    return false;
  }
  Transaction transaction;
  transaction.signatures.resize(count);
  for (auto& signature : transaction.signatures) {
    std::copy_n(data.begin() + static_cast<std::ptrdiff_t>(offset), 64, signature.begin());
    offset += 64;
  }
  if (!DeserializeMessage(data, &offset, &transaction.message, error)) {
    return false;
  }
  if (offset != data.size()) {
    if (error) *error = std::to_string(data.size() - offset) + " trailing bytes after message";
    return false;
  }
  if (count != transaction.message.header.num_required_signatures) {
    if (error) *error = "signature count does not match message header";
    return false;
  }
  *out = std::move(transaction);
  return true;
}

std::string EncodeTransactionBase64(const Transaction& transaction) {
  std::vector<std::uint8_t> bytes;
  SerializeTransaction(transaction, &bytes);
  return util::Base64Encode(bytes);
}

bool DecodeTransactionBase64(const std::string& text, Transaction* out, std::string* error) {
  std::vector<std::uint8_t> bytes;
  if (!util::Base64Decode(text, &bytes)) {
    if (error) *error = "transaction is not valid base64";
    return false;
  }
  return DeserializeTransaction(bytes, out, error);
}

bool ApplySignature(Transaction* transaction, const chain::Pubkey& signer,
                    const Signature& signature, std::string* error) {
  const auto& keys = transaction->message.account_keys;
  const std::size_t signers =
      std::min<std::size_t>(transaction->message.header.num_required_signatures, keys.size());
  for (std::size_t i = 0; i < signers; ++i) {
    if (keys[i] == signer) {
      if (transaction->signatures.size() < signers) {
        transaction->signatures.resize(signers);
      }
      transaction->signatures[i] = signature;
      return true;
    }
  }
  if (error) *error = signer.ToBase58() + " is not a required signer";
  return false;
}

}  // namespace x1memo::tx
