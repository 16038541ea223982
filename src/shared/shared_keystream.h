#ifndef SHARED_KEYSTREAM_H
#define SHARED_KEYSTREAM_H

#include "shared_net_common_protocol.h"

#include <cstdint>
#include <span>
#include <vector>

// Linear congruential byte generator. One instance per direction of a
// connection, seeded once from the shared secret and only ever advanced.
class KeystreamGenerator
{
  public:
    explicit KeystreamGenerator(uint64_t seed) noexcept : state_(seed) {}

    [[nodiscard]] uint8_t next() noexcept
    {
        state_ = (LCG_MULTIPLIER * state_ + LCG_INCREMENT) & LCG_MASK;
        ++consumed_;
        return static_cast<uint8_t>(state_ & 0xFFU);
    }

    [[nodiscard]] uint64_t state() const noexcept { return state_; }

    // Number of bytes emitted since seeding.
    [[nodiscard]] uint64_t consumed() const noexcept { return consumed_; }

  private:
    uint64_t state_;
    uint64_t consumed_ = 0;
};

// XOR each byte with the next keystream byte. Encryption and decryption are
// the same call; exactly input.size() generator steps are consumed.
inline std::vector<unsigned char>
stream_transform(std::span<const unsigned char> input, KeystreamGenerator &gen,
                 std::vector<unsigned char> *keystream_out = nullptr)
{
    std::vector<unsigned char> out;
    out.reserve(input.size());
    if (keystream_out)
    {
        keystream_out->clear();
        keystream_out->reserve(input.size());
    }

    for (const auto b : input)
    {
        const uint8_t k = gen.next();
        if (keystream_out)
            keystream_out->push_back(k);
        out.push_back(static_cast<unsigned char>(b ^ k));
    }
    return out;
}

// First n bytes a generator would emit from its current position, taken from a
// copy so the caller's generator is left untouched.
inline std::vector<unsigned char> keystream_preview(const KeystreamGenerator &gen,
                                                   size_t n)
{
    KeystreamGenerator         copy = gen;
    std::vector<unsigned char> out(n);
    for (auto &b : out)
        b = copy.next();
    return out;
}

#endif
