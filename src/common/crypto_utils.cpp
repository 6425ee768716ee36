#include "common/crypto_utils.h"
#include <openssl/bn.h>
#include <openssl/evp.h>
#include <openssl/sha.h>
#include <array>
#include <cstring>
#include <memory>
#include <stdexcept>

namespace altprog {
namespace common {

namespace {

struct BnDeleter {
  void operator()(BIGNUM *bn) const { BN_free(bn); }
};
struct BnCtxDeleter {
  void operator()(BN_CTX *ctx) const { BN_CTX_free(ctx); }
};
using BnPtr = std::unique_ptr<BIGNUM, BnDeleter>;
using BnCtxPtr = std::unique_ptr<BN_CTX, BnCtxDeleter>;

BnPtr make_bn() {
  BnPtr bn(BN_new());
  if (!bn) {
    throw std::runtime_error("BN_new failed");
  }
  return bn;
}

void check_bn(int rc, const char *what) {
  if (rc != 1) {
    throw std::runtime_error(std::string("OpenSSL bignum operation failed: ") +
                             what);
  }
}

// Field constants of edwards25519: p = 2^255 - 19, d = -121665/121666,
// and the Euler criterion exponent (p - 1) / 2
struct Ed25519Field {
  BnPtr p;
  BnPtr d;
  BnPtr euler_exponent;
  BnPtr one;

  Ed25519Field()
      : p(make_bn()), d(make_bn()), euler_exponent(make_bn()), one(make_bn()) {
    BnCtxPtr ctx(BN_CTX_new());
    if (!ctx) {
      throw std::runtime_error("BN_CTX_new failed");
    }

    check_bn(BN_set_bit(p.get(), 255), "set_bit");
    check_bn(BN_sub_word(p.get(), 19), "sub_word");
    check_bn(BN_one(one.get()), "one");

    BnPtr numerator = make_bn();
    check_bn(BN_copy(numerator.get(), p.get()) != nullptr, "copy");
    check_bn(BN_sub_word(numerator.get(), 121665), "sub_word");

    BnPtr denominator = make_bn();
    check_bn(BN_set_word(denominator.get(), 121666), "set_word");
    BnPtr inverse(BN_mod_inverse(nullptr, denominator.get(), p.get(), ctx.get()));
    if (!inverse) {
      throw std::runtime_error("BN_mod_inverse failed");
    }
    check_bn(BN_mod_mul(d.get(), numerator.get(), inverse.get(), p.get(), ctx.get()),
             "mod_mul");

    check_bn(BN_copy(euler_exponent.get(), p.get()) != nullptr, "copy");
    check_bn(BN_sub_word(euler_exponent.get(), 1), "sub_word");
    check_bn(BN_rshift1(euler_exponent.get(), euler_exponent.get()), "rshift1");
  }
};

const Ed25519Field &ed25519_field() {
  static const Ed25519Field field;
  return field;
}

} // namespace

Hash CryptoUtils::sha256(const std::vector<uint8_t> &data) {
  return sha256_multi({data});
}

Hash CryptoUtils::sha256_multi(const std::vector<std::vector<uint8_t>> &data_chunks) {
  Hash hash(SHA256_DIGEST_LENGTH);

  EVP_MD_CTX *ctx = EVP_MD_CTX_new();
  if (!ctx) {
    throw std::runtime_error("EVP_MD_CTX_new failed");
  }

  if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
    EVP_MD_CTX_free(ctx);
    throw std::runtime_error("EVP_DigestInit_ex failed");
  }

  for (const auto &chunk : data_chunks) {
    if (!chunk.empty()) {
      if (EVP_DigestUpdate(ctx, chunk.data(), chunk.size()) != 1) {
        EVP_MD_CTX_free(ctx);
        throw std::runtime_error("EVP_DigestUpdate failed");
      }
    }
  }

  unsigned int len = SHA256_DIGEST_LENGTH;
  if (EVP_DigestFinal_ex(ctx, hash.data(), &len) != 1) {
    EVP_MD_CTX_free(ctx);
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }

  EVP_MD_CTX_free(ctx);
  return hash;
}

bool CryptoUtils::is_on_ed25519_curve(const std::vector<uint8_t> &bytes) {
  if (bytes.size() != 32) {
    return false;
  }

  const Ed25519Field &field = ed25519_field();
  BnCtxPtr ctx(BN_CTX_new());
  if (!ctx) {
    throw std::runtime_error("BN_CTX_new failed");
  }

  // Clear the x sign bit; the remaining 255 bits are y, little-endian
  std::array<uint8_t, 32> y_bytes;
  std::memcpy(y_bytes.data(), bytes.data(), y_bytes.size());
  y_bytes[31] &= 0x7f;

  BnPtr y(BN_lebin2bn(y_bytes.data(), static_cast<int>(y_bytes.size()), nullptr));
  if (!y) {
    throw std::runtime_error("BN_lebin2bn failed");
  }
  check_bn(BN_nnmod(y.get(), y.get(), field.p.get(), ctx.get()), "nnmod");

  BnPtr y2 = make_bn();
  check_bn(BN_mod_sqr(y2.get(), y.get(), field.p.get(), ctx.get()), "mod_sqr");

  // u = y^2 - 1, v = d*y^2 + 1
  BnPtr u = make_bn();
  check_bn(BN_mod_sub(u.get(), y2.get(), field.one.get(), field.p.get(), ctx.get()),
           "mod_sub");
  if (BN_is_zero(u.get())) {
    return true;
  }

  BnPtr v = make_bn();
  check_bn(BN_mod_mul(v.get(), field.d.get(), y2.get(), field.p.get(), ctx.get()),
           "mod_mul");
  check_bn(BN_mod_add(v.get(), v.get(), field.one.get(), field.p.get(), ctx.get()),
           "mod_add");

  // d is a non-square, so v is never zero and always invertible
  BnPtr v_inverse(BN_mod_inverse(nullptr, v.get(), field.p.get(), ctx.get()));
  if (!v_inverse) {
    throw std::runtime_error("BN_mod_inverse failed");
  }

  BnPtr x2 = make_bn();
  check_bn(BN_mod_mul(x2.get(), u.get(), v_inverse.get(), field.p.get(), ctx.get()),
           "mod_mul");

  BnPtr legendre = make_bn();
  check_bn(BN_mod_exp(legendre.get(), x2.get(), field.euler_exponent.get(),
                      field.p.get(), ctx.get()),
           "mod_exp");
  return BN_is_one(legendre.get()) == 1;
}

} // namespace common
} // namespace altprog
