#include "shared_modpow.h"
#include "shared_net_common_protocol.h"

#include <openssl/bn.h>

#include <cassert>
#include <cstdint>
#include <memory>
#include <random>

namespace {

using BnPtr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;

BnPtr make_bn(std::uint64_t v) {
    BnPtr bn{BN_new(), &BN_free};
    assert(bn);
    const int ok = BN_set_word(bn.get(), static_cast<BN_ULONG>(v));
    assert(ok == 1);
    return bn;
}

// Arbitrary precision reference.
std::uint64_t reference_modpow(std::uint64_t base, std::uint64_t exponent, std::uint64_t modulus) {
    std::unique_ptr<BN_CTX, decltype(&BN_CTX_free)> ctx{BN_CTX_new(), &BN_CTX_free};
    assert(ctx);
    auto b = make_bn(base);
    auto e = make_bn(exponent);
    auto m = make_bn(modulus);
    BnPtr r{BN_new(), &BN_free};
    assert(r);
    const int ok = BN_mod_exp(r.get(), b.get(), e.get(), m.get(), ctx.get());
    assert(ok == 1);
    return static_cast<std::uint64_t>(BN_get_word(r.get()));
}

}  // namespace

int main() {
    // Edge cases
    assert(modpow(5, 3, 1) == 0);
    assert(modpow(0, 0, 1) == 0);
    assert(modpow(3, 0, 7) == 1);
    assert(modpow(123456789, 0, DH_PARAMS.prime) == 1);
    assert(modpow(0, 5, 13) == 0);
    assert(modpow(2, 10, 1000) == 24);
    assert(modpow(DH_PARAMS.prime - 1, 2, DH_PARAMS.prime) == 1);
    assert(modpow(2, 64, DH_PARAMS.prime) == 0x27805C1D6E4B380DULL);
    assert(modpow(2, 0xDEADBEEFULL, DH_PARAMS.prime) == 0x9FDC6BB81B64351FULL);

    // Base larger than the modulus is reduced first.
    assert(modpow(DH_PARAMS.prime + 5, 3, DH_PARAMS.prime) == 125);

    // Operands in the full 64-bit range would overflow a 64-bit product.
    const std::uint64_t big = 0xFFFFFFFFFFFFFFC5ULL;
    assert(modpow(big - 1, big - 2, big) == reference_modpow(big - 1, big - 2, big));

    std::mt19937_64 rng{0xC0FFEEULL};
    for (int i = 0; i < 2000; ++i) {
        const std::uint64_t base = rng();
        const std::uint64_t exponent = (i % 4 == 0) ? (rng() & 0xFF) : rng();
        std::uint64_t modulus = rng();
        if (i % 3 == 0) {
            modulus >>= (rng() % 63);
        }
        if (modulus < 2) {
            modulus = 2;
        }
        assert(modpow(base, exponent, modulus) == reference_modpow(base, exponent, modulus));
    }

    for (int i = 0; i < 500; ++i) {
        const std::uint64_t exponent = rng();
        assert(modpow(DH_PARAMS.generator, exponent, DH_PARAMS.prime) ==
               reference_modpow(DH_PARAMS.generator, exponent, DH_PARAMS.prime));
    }

    return 0;
}
