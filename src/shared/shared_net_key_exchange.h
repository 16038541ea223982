#ifndef SHARED_NET_KEY_EXCHANGE_H
#define SHARED_NET_KEY_EXCHANGE_H

#include "shared_modpow.h"
#include "shared_net_common_protocol.h"
#include "shared_net_frame_io.h"
#include "shared_net_socket_util.h"

#include <openssl/err.h>
#include <openssl/rand.h>

#include <array>
#include <cstdint>
#include <cstdio>
#include <limits>
#include <memory>
#include <stdexcept>
#include <system_error>

struct KeyPair
{
    uint64_t private_key = 0;
    uint64_t public_key  = 0;
};

struct HandshakeResult
{
    KeyPair  ours;
    uint64_t peer_public   = 0;
    uint64_t shared_secret = 0;
};

// Uniform over [2, prime-2]. RAND_bytes supplies 64-bit draws; draws above the
// largest multiple of the range are rejected so the reduction stays unbiased.
[[nodiscard]] inline uint64_t
generate_private_key(const DomainParameters &params = DH_PARAMS)
{
    const uint64_t span  = params.prime - 3; // |[2, prime-2]|
    const uint64_t limit = std::numeric_limits<uint64_t>::max() -
                           (std::numeric_limits<uint64_t>::max() % span);

    for (;;)
    {
        std::array<unsigned char, 8> raw{};
        if (RAND_bytes(raw.data(), static_cast<int>(raw.size())) != 1)
        {
            ERR_print_errors_fp(stderr);
            throw std::runtime_error("RAND_bytes failed");
        }
        const uint64_t draw = read_u64_be(raw.data());
        if (draw < limit)
            return 2 + (draw % span);
    }
}

[[nodiscard]] constexpr KeyPair
make_keypair(uint64_t                private_key,
             const DomainParameters &params = DH_PARAMS) noexcept
{
    return {private_key, modpow(params.generator, private_key, params.prime)};
}

// The peer value is not range checked; out-of-range input is reduced like any
// other base.
[[nodiscard]] constexpr uint64_t
derive_shared_secret(uint64_t peer_public, uint64_t private_key,
                     const DomainParameters &params = DH_PARAMS) noexcept
{
    return modpow(peer_public, private_key, params.prime);
}

// Which side speaks first. Chosen once per connection from the role; the same
// object orders both the public value exchange and the first chat turn.
class PeerOrder
{
  public:
    virtual ~PeerOrder() = default;

    [[nodiscard]] virtual std::error_code
    exchange_public_values(Connection &conn, uint64_t ours,
                           uint64_t &theirs) const = 0;

    [[nodiscard]] virtual Turn first_turn() const noexcept = 0;
};

class GoesFirst final : public PeerOrder
{
  public:
    [[nodiscard]] std::error_code
    exchange_public_values(Connection &conn, uint64_t ours,
                           uint64_t &theirs) const override
    {
        if (auto ec = sync_write_public_value(conn, ours))
            return ec;
        return sync_read_public_value(conn, theirs);
    }

    [[nodiscard]] Turn first_turn() const noexcept override
    {
        return Turn::Send;
    }
};

class GoesSecond final : public PeerOrder
{
  public:
    [[nodiscard]] std::error_code
    exchange_public_values(Connection &conn, uint64_t ours,
                           uint64_t &theirs) const override
    {
        if (auto ec = sync_read_public_value(conn, theirs))
            return ec;
        return sync_write_public_value(conn, ours);
    }

    [[nodiscard]] Turn first_turn() const noexcept override
    {
        return Turn::Receive;
    }
};

[[nodiscard]] inline std::unique_ptr<PeerOrder> make_peer_order(Role role)
{
    if (role == Role::Initiator)
        return std::make_unique<GoesFirst>();
    return std::make_unique<GoesSecond>();
}

// One round: swap public values in the order's sequence, then derive the
// secret. No retry; any I/O error is returned as is.
[[nodiscard]] inline std::error_code
perform_key_exchange(Connection &conn, const PeerOrder &order,
                     const KeyPair &ours, HandshakeResult &out,
                     const DomainParameters &params = DH_PARAMS)
{
    uint64_t theirs = 0;
    if (auto ec = order.exchange_public_values(conn, ours.public_key, theirs))
        return ec;

    out.ours          = ours;
    out.peer_public   = theirs;
    out.shared_secret = derive_shared_secret(theirs, ours.private_key, params);
    return {};
}

[[nodiscard]] inline std::error_code
perform_key_exchange(Connection &conn, const PeerOrder &order,
                     HandshakeResult        &out,
                     const DomainParameters &params = DH_PARAMS)
{
    return perform_key_exchange(
        conn, order, make_keypair(generate_private_key(params), params), out,
        params);
}

#endif
