#ifndef SHARED_NET_FRAME_IO_H
#define SHARED_NET_FRAME_IO_H

#include "shared_common_util.h"
#include "shared_net_common_protocol.h"

#include <asio/buffer.hpp>
#include <asio/read.hpp>
#include <asio/write.hpp>

#include <array>
#include <cstdint>
#include <span>
#include <system_error>
#include <vector>

template <typename SyncWriteStream>
inline std::error_code sync_write_public_value(SyncWriteStream &stream,
                                               uint64_t         value)
{
    std::array<unsigned char, PUBLIC_VALUE_LEN> buf{};
    write_u64_be(buf.data(), value);

    std::error_code ec;
    asio::write(stream, asio::buffer(buf), ec);
    return ec;
}

template <typename SyncReadStream>
inline std::error_code sync_read_public_value(SyncReadStream &stream,
                                              uint64_t       &value_out)
{
    std::array<unsigned char, PUBLIC_VALUE_LEN> buf{};
    std::error_code                             ec;

    asio::read(stream, asio::buffer(buf), ec);
    if (ec)
        return ec;

    value_out = read_u64_be(buf.data());
    return {};
}

template <typename SyncWriteStream>
inline std::error_code
sync_write_envelope(SyncWriteStream                &stream,
                    std::span<const unsigned char> ciphertext)
{
    if (ciphertext.size() > MAX_ENVELOPE_LEN)
        return std::make_error_code(std::errc::message_size);

    const auto      frame = build_envelope(ciphertext);
    std::error_code ec;
    asio::write(stream, asio::buffer(frame), ec);
    return ec;
}

// Reads one envelope. A short header, a short payload or a header announcing
// more than MAX_ENVELOPE_LEN all come back as an error; callers treat every
// one of them as the end of the connection.
template <typename SyncReadStream>
inline std::error_code sync_read_envelope(SyncReadStream             &stream,
                                          std::vector<unsigned char> &ciphertext)
{
    std::array<unsigned char, ENVELOPE_HEADER_LEN> len_buf{};
    std::error_code                                ec;

    asio::read(stream, asio::buffer(len_buf), ec);
    if (ec)
        return ec;

    const uint32_t payload_len = read_u32_be(len_buf.data());
    if (!envelope_length_ok(payload_len))
        return std::make_error_code(std::errc::message_size);

    ciphertext.resize(payload_len);
    if (payload_len == 0)
        return {};

    asio::read(stream, asio::buffer(ciphertext), ec);
    return ec;
}

#endif
