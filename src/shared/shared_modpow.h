#ifndef SHARED_MODPOW_H
#define SHARED_MODPOW_H

#include <cstdint>

// base^exponent mod modulus by square-and-multiply. Products are taken in 128
// bits so operands may use the full 64-bit range. modulus must be non-zero.
[[nodiscard]] constexpr uint64_t modpow(uint64_t base, uint64_t exponent,
                                        uint64_t modulus) noexcept
{
    if (modulus == 1)
        return 0;

    using wide_t = unsigned __int128;

    const wide_t m      = modulus;
    wide_t       result = 1;
    wide_t       b      = base % modulus;

    while (exponent > 0)
    {
        if ((exponent & 1U) != 0U)
            result = (result * b) % m;
        exponent >>= 1;
        if (exponent > 0)
            b = (b * b) % m;
    }
    return static_cast<uint64_t>(result);
}

#endif
