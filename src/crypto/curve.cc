#include "curve.hh"
#include "core/logging.hh"
#include <openssl/bn.h>
#include <memory>
#include <stdexcept>

namespace suitegen {

namespace {

// d = -121665 / 121666 mod p
constexpr const char* EDWARDS_D =
    "37095705934669439343138083508754565189542113879843219016388785533085940283555";

struct BnDeleter {
    void operator()(BIGNUM* bn) const { BN_free(bn); }
};

struct BnCtxDeleter {
    void operator()(BN_CTX* ctx) const { BN_CTX_free(ctx); }
};

using BnPtr = std::unique_ptr<BIGNUM, BnDeleter>;
using BnCtxPtr = std::unique_ptr<BN_CTX, BnCtxDeleter>;

BnPtr make_bn() {
    BnPtr bn(BN_new());
    if (!bn) {
        log::crypto.error("BN_new failed");
        throw std::runtime_error("BN_new failed");
    }
    return bn;
}

void check(int rc, const char* what) {
    if (rc != 1) {
        log::crypto.error() << "BIGNUM operation failed: " << what;
        throw std::runtime_error(std::string("BIGNUM operation failed: ") + what);
    }
}

}  // namespace

bool is_on_ed25519_curve(const Pubkey& point) {
    BnCtxPtr ctx(BN_CTX_new());
    if (!ctx) {
        log::crypto.error("BN_CTX_new failed");
        throw std::runtime_error("BN_CTX_new failed");
    }

    // p = 2^255 - 19
    BnPtr p = make_bn();
    check(BN_set_word(p.get(), 1), "set p");
    check(BN_lshift(p.get(), p.get(), 255), "shift p");
    check(BN_sub_word(p.get(), 19), "sub p");

    BIGNUM* d_raw = nullptr;
    if (BN_dec2bn(&d_raw, EDWARDS_D) == 0) {
        log::crypto.error("Failed to load curve constant d");
        throw std::runtime_error("Failed to load curve constant d");
    }
    BnPtr d(d_raw);

    // The top bit carries the sign of x and is not part of y
    auto encoded = point.bytes;
    encoded[PUBKEY_SIZE - 1] &= 0x7F;

    BnPtr y(BN_lebin2bn(encoded.data(), static_cast<int>(encoded.size()), nullptr));
    if (!y) {
        log::crypto.error("BN_lebin2bn failed");
        throw std::runtime_error("BN_lebin2bn failed");
    }
    check(BN_nnmod(y.get(), y.get(), p.get(), ctx.get()), "reduce y");

    BnPtr one = make_bn();
    check(BN_one(one.get()), "one");

    BnPtr y2 = make_bn();
    check(BN_mod_sqr(y2.get(), y.get(), p.get(), ctx.get()), "y^2");

    BnPtr u = make_bn();
    check(BN_mod_sub(u.get(), y2.get(), one.get(), p.get(), ctx.get()), "u");

    BnPtr v = make_bn();
    check(BN_mod_mul(v.get(), d.get(), y2.get(), p.get(), ctx.get()), "d*y^2");
    check(BN_mod_add(v.get(), v.get(), one.get(), p.get(), ctx.get()), "v");

    // v is never zero: -1/d is not a square mod p
    BnPtr v_inv = make_bn();
    if (BN_mod_inverse(v_inv.get(), v.get(), p.get(), ctx.get()) == nullptr) {
        log::crypto.error("BN_mod_inverse failed");
        throw std::runtime_error("BN_mod_inverse failed");
    }

    BnPtr x2 = make_bn();
    check(BN_mod_mul(x2.get(), u.get(), v_inv.get(), p.get(), ctx.get()), "x^2");

    if (BN_is_zero(x2.get())) {
        return true;
    }

    // Euler's criterion: x^2 is a square iff x2^((p-1)/2) == 1
    BnPtr exponent = make_bn();
    check(BN_sub(exponent.get(), p.get(), one.get()), "p-1");
    check(BN_rshift1(exponent.get(), exponent.get()), "(p-1)/2");

    BnPtr legendre = make_bn();
    check(BN_mod_exp(legendre.get(), x2.get(), exponent.get(), p.get(), ctx.get()), "legendre");

    return BN_is_one(legendre.get()) == 1;
}

}  // namespace suitegen
