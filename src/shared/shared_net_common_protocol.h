#ifndef SHARED_NET_COMMON_PROTOCOL_H
#define SHARED_NET_COMMON_PROTOCOL_H

#include "shared_common_util.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

struct DomainParameters
{
    uint64_t prime;
    uint64_t generator;
};

// Fixed on both peers, never negotiated.
inline constexpr DomainParameters DH_PARAMS{0xD87FA3E291B4C7F3ULL, 2ULL};

constexpr uint64_t LCG_MULTIPLIER = 1103515245ULL;
constexpr uint64_t LCG_INCREMENT  = 12345ULL;
constexpr uint64_t LCG_MASK       = 0xFFFFFFFFULL; // state mod 2^32

constexpr size_t PUBLIC_VALUE_LEN    = 8;
constexpr size_t ENVELOPE_HEADER_LEN = 4;
constexpr size_t MAX_ENVELOPE_LEN    = 16U * 1024U * 1024U;

constexpr size_t DEFAULT_KEYSTREAM_PREVIEW = 12;
constexpr size_t MAX_KEYSTREAM_PREVIEW     = 64;

enum class Role : uint8_t
{
    Responder,
    Initiator
};

enum class Turn : uint8_t
{
    Send,
    Receive
};

[[nodiscard]] constexpr std::string_view role_str(Role r) noexcept
{
    return r == Role::Responder ? "RESPONDER" : "INITIATOR";
}

[[nodiscard]] constexpr Role peer_role(Role r) noexcept
{
    return r == Role::Responder ? Role::Initiator : Role::Responder;
}

// 4-byte big-endian ciphertext length followed by the ciphertext.
[[nodiscard]] inline std::vector<unsigned char>
build_envelope(std::span<const unsigned char> ciphertext)
{
    if (ciphertext.size() > MAX_ENVELOPE_LEN)
        throw std::length_error("envelope payload too large: " +
                                std::to_string(ciphertext.size()));

    std::vector<unsigned char> frame(ENVELOPE_HEADER_LEN + ciphertext.size());
    write_u32_be(frame.data(), static_cast<uint32_t>(ciphertext.size()));
    std::copy(ciphertext.begin(), ciphertext.end(),
              frame.begin() + ENVELOPE_HEADER_LEN);
    return frame;
}

[[nodiscard]] constexpr bool envelope_length_ok(uint32_t len) noexcept
{
    return len <= MAX_ENVELOPE_LEN;
}

#endif
