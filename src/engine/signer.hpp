#pragma once

#include <cstdint>
#include <span>

#include "chain/pubkey.hpp"
#include "tx/transaction.hpp"

namespace x1memo::engine {

// Key custody lives outside the engine. Implementations sign the serialized
// message bytes with the key behind PublicKey().
class TransactionSigner {
 public:
  virtual ~TransactionSigner() = default;
  virtual chain::Pubkey PublicKey() const = 0;
  virtual tx::Signature SignMessage(std::span<const std::uint8_t> message) const = 0;
};

// Fills the signer's slot. Throws RpcError(kOther) when the signer is not a
// required signer of |transaction|.
void SignTransaction(tx::Transaction* transaction, const TransactionSigner& signer);

}  // namespace x1memo::engine
