#ifndef SHARED_COMMON_UTIL_H
#define SHARED_COMMON_UTIL_H

#include <Poco/Timestamp.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <cstdint>
#include <iostream>
#include <span>
#include <sstream>
#include <string>
#include <string_view>

inline std::atomic_bool debug_mode{false};

inline void dev_println(std::string_view s)
{
    if (debug_mode.load())
        std::cout << s << "\n";
}

[[nodiscard]] inline uint64_t get_current_timestamp_ms() noexcept
{
    return static_cast<uint64_t>(Poco::Timestamp().epochMicroseconds() / 1000);
}

// "[<epoch-ms>] msg" as one line.
inline void log_event(std::ostream &out, std::string_view msg)
{
    out << "[" << get_current_timestamp_ms() << "] " << msg << "\n"
        << std::flush;
}

inline std::string trim(std::string s)
{
    const auto is_space = [](unsigned char c) noexcept -> bool
    {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' ||
               c == '\f';
    };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), [&](unsigned char c)
                                    { return !is_space(c); }));
    s.erase(std::find_if(s.rbegin(), s.rend(),
                         [&](unsigned char c) { return !is_space(c); })
                .base(),
            s.end());
    return s;
}

inline std::string to_hex(std::span<const unsigned char> data)
{
    constexpr std::array<char, 16> hex = {'0', '1', '2', '3', '4', '5',
                                          '6', '7', '8', '9', 'a', 'b',
                                          'c', 'd', 'e', 'f'};
    std::string                    s;
    s.reserve(data.size() * 2);
    for (const auto c : data)
    {
        const size_t hi = static_cast<size_t>(c) >> 4;
        const size_t lo = static_cast<size_t>(c) & 0xF;
        s.push_back(hex.at(hi));
        s.push_back(hex.at(lo));
    }
    return s;
}

// Space separated, as shown in the session transcript ("68 69 ").
inline std::string to_hex_spaced(std::span<const unsigned char> data)
{
    std::string s;
    s.reserve(data.size() * 3);
    for (const auto c : data)
    {
        s += to_hex(std::span<const unsigned char>(&c, 1));
        s.push_back(' ');
    }
    return s;
}

inline std::string u64_hex(uint64_t v)
{
    std::ostringstream os;
    os << std::uppercase << std::hex << v;
    return os.str();
}

inline std::span<const unsigned char> as_bytes_view(std::string_view s) noexcept
{
    const void *vptr = s.data();
    return {static_cast<const unsigned char *>(vptr), s.size()};
}

inline uint32_t read_u32_be(std::span<const unsigned char, 4> p) noexcept
{
    return (uint32_t(p[0]) << 24) | (uint32_t(p[1]) << 16) |
           (uint32_t(p[2]) << 8) | uint32_t(p[3]);
}

inline uint32_t read_u32_be(const unsigned char *p)
{
    return read_u32_be(std::span<const unsigned char, 4>(p, 4));
}

inline void write_u32_be(std::span<unsigned char, 4> p, uint32_t v) noexcept
{
    p[0] = static_cast<unsigned char>((v >> 24) & 0xFFU);
    p[1] = static_cast<unsigned char>((v >> 16) & 0xFFU);
    p[2] = static_cast<unsigned char>((v >> 8) & 0xFFU);
    p[3] = static_cast<unsigned char>(v & 0xFFU);
}

inline void write_u32_be(unsigned char *p, uint32_t v)
{
    write_u32_be(std::span<unsigned char, 4>(p, 4), v);
}

inline uint64_t read_u64_be(std::span<const unsigned char, 8> p) noexcept
{
    uint64_t v = 0;
    for (const auto b : p)
        v = (v << 8) | static_cast<uint64_t>(b);
    return v;
}

inline uint64_t read_u64_be(const unsigned char *p)
{
    return read_u64_be(std::span<const unsigned char, 8>(p, 8));
}

inline void write_u64_be(std::span<unsigned char, 8> p, uint64_t v) noexcept
{
    for (size_t i = 0; i < p.size(); ++i)
        p[i] = static_cast<unsigned char>((v >> (8 * (7 - i))) & 0xFFU);
}

inline void write_u64_be(unsigned char *p, uint64_t v)
{
    write_u64_be(std::span<unsigned char, 8>(p, 8), v);
}

#endif
