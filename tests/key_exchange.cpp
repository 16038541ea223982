#include "shared_modpow.h"
#include "shared_net_common_protocol.h"
#include "shared_net_frame_io.h"
#include "shared_net_key_exchange.h"
#include "test_support.hpp"

#include <cassert>
#include <cstdint>
#include <random>
#include <set>
#include <system_error>
#include <thread>

using streamchat::test::make_connected_pair;

namespace {

struct ExchangeOutcome {
    std::error_code initiator_ec;
    std::error_code responder_ec;
    HandshakeResult initiator;
    HandshakeResult responder;
};

ExchangeOutcome run_exchange(const KeyPair& initiator_keys, const KeyPair& responder_keys) {
    asio::io_context io;
    Connection responder_conn(io);
    Connection initiator_conn(io);
    make_connected_pair(io, responder_conn, initiator_conn);

    const auto responder_order = make_peer_order(Role::Responder);
    const auto initiator_order = make_peer_order(Role::Initiator);

    ExchangeOutcome outcome;
    std::thread responder([&] {
        outcome.responder_ec =
            perform_key_exchange(responder_conn, *responder_order, responder_keys, outcome.responder);
    });
    outcome.initiator_ec = perform_key_exchange(initiator_conn, *initiator_order, initiator_keys, outcome.initiator);
    responder.join();
    return outcome;
}

}  // namespace

int main() {
    // Role decides who speaks first, both in the exchange and in the chat.
    {
        assert(make_peer_order(Role::Initiator)->first_turn() == Turn::Send);
        assert(make_peer_order(Role::Responder)->first_turn() == Turn::Receive);
    }

    // Private scalars stay in [2, prime-2] and are not constant.
    {
        std::set<std::uint64_t> seen;
        for (int i = 0; i < 256; ++i) {
            const auto priv = generate_private_key();
            assert(priv >= 2);
            assert(priv <= DH_PARAMS.prime - 2);
            seen.insert(priv);
        }
        assert(seen.size() > 250);

        const DomainParameters tiny{7, 3};
        for (int i = 0; i < 200; ++i) {
            const auto priv = generate_private_key(tiny);
            assert(priv >= 2 && priv <= 5);
        }
    }

    // Commutativity for pairs drawn from the valid range.
    {
        std::mt19937_64 rng{99};
        for (int i = 0; i < 200; ++i) {
            const std::uint64_t a = 2 + rng() % (DH_PARAMS.prime - 3);
            const std::uint64_t b = 2 + rng() % (DH_PARAMS.prime - 3);
            const auto ka = make_keypair(a);
            const auto kb = make_keypair(b);
            assert(ka.public_key == modpow(DH_PARAMS.generator, a, DH_PARAMS.prime));
            assert(derive_shared_secret(kb.public_key, a) == derive_shared_secret(ka.public_key, b));
        }
    }

    // Over a connection both peers agree on the secret.
    {
        const auto ka = make_keypair(0x1234567890ABCDEFULL % (DH_PARAMS.prime - 3) + 2);
        const auto kb = make_keypair(0x0FEDCBA987654321ULL);
        const auto outcome = run_exchange(ka, kb);
        assert(!outcome.initiator_ec);
        assert(!outcome.responder_ec);
        assert(outcome.initiator.peer_public == kb.public_key);
        assert(outcome.responder.peer_public == ka.public_key);
        assert(outcome.initiator.shared_secret == outcome.responder.shared_secret);
        assert(outcome.initiator.shared_secret == modpow(kb.public_key, ka.private_key, DH_PARAMS.prime));
    }

    // Freshly generated keys agree as well.
    {
        const auto outcome = run_exchange(make_keypair(generate_private_key()), make_keypair(generate_private_key()));
        assert(!outcome.initiator_ec && !outcome.responder_ec);
        assert(outcome.initiator.shared_secret == outcome.responder.shared_secret);
    }

    // The initiator writes before it reads: its value is on the wire even if
    // the peer never answers.
    {
        asio::io_context io;
        Connection responder_conn(io);
        Connection initiator_conn(io);
        make_connected_pair(io, responder_conn, initiator_conn);

        const auto keys = make_keypair(12345);
        std::uint64_t observed = 0;
        std::thread peer([&] {
            const auto ec = sync_read_public_value(responder_conn, observed);
            assert(!ec);
            responder_conn.close();
        });
        HandshakeResult result;
        const auto ec = perform_key_exchange(initiator_conn, *make_peer_order(Role::Initiator), keys, result);
        peer.join();
        assert(observed == keys.public_key);
        assert(ec);
    }

    // Out-of-range peer values are accepted and used as is.
    {
        asio::io_context io;
        Connection responder_conn(io);
        Connection initiator_conn(io);
        make_connected_pair(io, responder_conn, initiator_conn);

        const std::uint64_t bogus = 0xFFFFFFFFFFFFFFFFULL;
        const auto keys = make_keypair(777);
        assert(!sync_write_public_value(initiator_conn, bogus));

        HandshakeResult result;
        const auto ec = perform_key_exchange(responder_conn, *make_peer_order(Role::Responder), keys, result);
        assert(!ec);
        assert(result.peer_public == bogus);
        assert(result.shared_secret == modpow(bogus, 777, DH_PARAMS.prime));

        std::uint64_t echoed = 0;
        assert(!sync_read_public_value(initiator_conn, echoed));
        assert(echoed == keys.public_key);
    }

    // A peer that hangs up mid-exchange fails the handshake.
    {
        asio::io_context io;
        Connection responder_conn(io);
        Connection initiator_conn(io);
        make_connected_pair(io, responder_conn, initiator_conn);
        initiator_conn.close();

        HandshakeResult result;
        const auto ec =
            perform_key_exchange(responder_conn, *make_peer_order(Role::Responder), make_keypair(99), result);
        assert(ec);
    }

    return 0;
}
