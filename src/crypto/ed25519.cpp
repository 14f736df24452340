#include "crypto/ed25519.hpp"

#include <array>
#include <memory>
#include <stdexcept>
#include <string>

#include <openssl/bn.h>

namespace x1memo::crypto {

namespace {

struct BnDeleter {
  void operator()(BIGNUM* bn) const { BN_free(bn); }
};
struct BnCtxDeleter {
  void operator()(BN_CTX* ctx) const { BN_CTX_free(ctx); }
};
using Bn = std::unique_ptr<BIGNUM, BnDeleter>;
using BnCtx = std::unique_ptr<BN_CTX, BnCtxDeleter>;

// d = -121665/121666 mod p, big-endian.
constexpr std::array<std::uint8_t, 32> kEdwardsD{
    0x52, 0x03, 0x6c, 0xee, 0x2b, 0x6f, 0xfe, 0x73, 0x8c, 0xc7, 0x40, 0x79, 0x77, 0x79, 0xe8, 0x98,
    0x00, 0x70, 0x0a, 0x4d, 0x41, 0x41, 0xd8, 0xab, 0x75, 0xeb, 0x4d, 0xca, 0x13, 0x59, 0x78, 0xa3};

Bn NewBn() {
  Bn bn(BN_new());
  if (!bn) {
    throw std::runtime_error("BN_new failed");
  }
  return bn;
}

void Check(int ok, const char* what) {
  if (ok != 1) {
    throw std::runtime_error(std::string("OpenSSL ") + what + " failed");
  }
}

}  // namespace

bool IsOnEd25519Curve(std::span<const std::uint8_t, 32> encoded) {
  BnCtx ctx(BN_CTX_new());
  if (!ctx) {
    throw std::runtime_error("BN_CTX_new failed");
  }
  Bn p = NewBn();
  Bn y = NewBn();
  Bn d = NewBn();
  Bn y2 = NewBn();
  Bn u = NewBn();
  Bn v = NewBn();
  Bn uv = NewBn();
  Bn exponent = NewBn();
  Bn chi = NewBn();

  // p = 2^255 - 19
  Check(BN_set_word(p.get(), 1), "BN_set_word");
  Check(BN_lshift(p.get(), p.get(), 255), "BN_lshift");
  Check(BN_sub_word(p.get(), 19), "BN_sub_word");

  // Little-endian y with the x sign bit cleared.
  std::array<std::uint8_t, 32> y_be{};
  for (std::size_t i = 0; i < y_be.size(); ++i) {
    y_be[i] = encoded[31 - i];
  }
  y_be[0] &= 0x7F;
  if (BN_bin2bn(y_be.data(), static_cast<int>(y_be.size()), y.get()) == nullptr ||
      BN_bin2bn(kEdwardsD.data(), static_cast<int>(kEdwardsD.size()), d.get()) == nullptr) {
    throw std::runtime_error("BN_bin2bn failed");
  }
  // Non-canonical encodings (y >= p) are reduced, not rejected.
  Check(BN_nnmod(y.get(), y.get(), p.get(), ctx.get()), "BN_nnmod");

  Check(BN_mod_sqr(y2.get(), y.get(), p.get(), ctx.get()), "BN_mod_sqr");
  Check(BN_mod_sub(u.get(), y2.get(), BN_value_one(), p.get(), ctx.get()), "BN_mod_sub");
  Check(BN_mod_mul(v.get(), d.get(), y2.get(), p.get(), ctx.get()), "BN_mod_mul");
  Check(BN_mod_add(v.get(), v.get(), BN_value_one(), p.get(), ctx.get()), "BN_mod_add");

  // v is never zero because -1/d is not a square, so u/v is a square exactly
  // when u*v is.
  Check(BN_mod_mul(uv.get(), u.get(), v.get(), p.get(), ctx.get()), "BN_mod_mul");

  // Legendre symbol (uv)^((p-1)/2).
  if (BN_copy(exponent.get(), p.get()) == nullptr) {
    throw std::runtime_error("BN_copy failed");
  }
  Check(BN_sub_word(exponent.get(), 1), "BN_sub_word");
  Check(BN_rshift1(exponent.get(), exponent.get()), "BN_rshift1");
  Check(BN_mod_exp(chi.get(), uv.get(), exponent.get(), p.get(), ctx.get()), "BN_mod_exp");
  return BN_is_zero(chi.get()) || BN_is_one(chi.get());
}

}  // namespace x1memo::crypto
