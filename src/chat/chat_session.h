#ifndef CHAT_SESSION_H
#define CHAT_SESSION_H

#include "chat_console.h"
#include "chat_transcript.h"
#include "shared_common_util.h"
#include "shared_keystream.h"
#include "shared_net_common_protocol.h"
#include "shared_net_frame_io.h"
#include "shared_net_key_exchange.h"
#include "shared_net_socket_util.h"

#include <asio/error.hpp>

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

enum class SessionState : uint8_t
{
    Handshaking,
    Established,
    Sending,
    Receiving,
    Closed
};

enum class CloseReason : uint8_t
{
    None,
    InputExhausted,
    PeerClosed,
    WriteFailed,
    HandshakeFailed
};

[[nodiscard]] inline constexpr std::string_view
close_reason_str(CloseReason r) noexcept
{
    constexpr std::array<std::string_view, 5> msgs = {
        "open", "input exhausted", "peer closed connection", "write failed",
        "handshake failed"};
    return msgs[static_cast<size_t>(r)];
}

// One connection, one single-threaded turn-based conversation. Owns both
// keystream generators for the life of the connection; the connection, the
// input source, the output sink and the transcript are lent.
class ChatSession
{
  public:
    ChatSession(Connection &conn, Role role, LineSource &input,
                LineSink &output, SessionTranscript &transcript,
                size_t keystream_preview = DEFAULT_KEYSTREAM_PREVIEW)
        : conn_(conn), role_(role), order_(make_peer_order(role)),
          input_(input), output_(output), transcript_(transcript),
          keystream_preview_(keystream_preview)
    {
    }

    ChatSession(const ChatSession &)            = delete;
    ChatSession &operator=(const ChatSession &) = delete;

    [[nodiscard]] std::error_code handshake()
    {
        return handshake(make_keypair(generate_private_key()));
    }

    // Handshaking -> Established, or Closed on any I/O failure.
    [[nodiscard]] std::error_code handshake(const KeyPair &ours)
    {
        if (state_ != SessionState::Handshaking)
            return std::make_error_code(std::errc::operation_not_permitted);

        transcript_.handshake_started(role_, DH_PARAMS);
        transcript_.keypair_ready(ours);

        HandshakeResult result;
        if (auto ec = perform_key_exchange(conn_, *order_, ours, result))
        {
            transcript_.handshake_failed(ec);
            close(CloseReason::HandshakeFailed);
            return ec;
        }

        transcript_.public_values_exchanged(role_, result.ours.public_key,
                                            result.peer_public);
        transcript_.shared_secret_derived(result.shared_secret);

        shared_secret_ = result.shared_secret;
        outbound_.emplace(shared_secret_);
        inbound_.emplace(shared_secret_);
        next_turn_ = order_->first_turn();
        state_     = SessionState::Established;

        transcript_.keystream_ready(
            keystream_preview(*outbound_, keystream_preview_));
        return {};
    }

    // Reads one line, encodes it with the outbound generator and writes one
    // envelope. Returns false once the session is Closed.
    bool send_turn()
    {
        if (!ready_for_turn())
            return false;
        state_ = SessionState::Sending;

        std::optional<std::string> line;
        for (;;)
        {
            line = input_.read_line();
            if (!line)
            {
                close(CloseReason::InputExhausted);
                return false;
            }
            if (line->size() <= MAX_ENVELOPE_LEN)
                break;
            transcript_.message_refused(line->size());
        }

        const auto                 plain = as_bytes_view(*line);
        std::vector<unsigned char> key;
        const auto cipher = stream_transform(plain, *outbound_, &key);
        transcript_.encrypted(plain, key, cipher);

        if (auto ec = sync_write_envelope(conn_, cipher))
        {
            last_error_ = ec;
            log_event(std::cerr, "send failed: " + ec.message());
            close(CloseReason::WriteFailed);
            return false;
        }

        transcript_.envelope_sent(cipher.size());
        ++envelopes_sent_;
        state_     = SessionState::Established;
        next_turn_ = Turn::Receive;
        return true;
    }

    // Reads one envelope, decodes it with the inbound generator and delivers
    // the plaintext. A failed or short read closes the session quietly.
    bool receive_turn()
    {
        if (!ready_for_turn())
            return false;
        state_ = SessionState::Receiving;

        std::vector<unsigned char> cipher;
        if (auto ec = sync_read_envelope(conn_, cipher))
        {
            if (ec != asio::error::eof)
                dev_println("[NETWORK] receive ended: " + ec.message());
            close(CloseReason::PeerClosed);
            return false;
        }

        transcript_.envelope_received(cipher.size());

        std::vector<unsigned char> key;
        const auto plain = stream_transform(cipher, *inbound_, &key);
        transcript_.decrypted(cipher, key, plain);

        output_.write_line(std::string(plain.begin(), plain.end()));
        ++envelopes_received_;
        state_     = SessionState::Established;
        next_turn_ = Turn::Send;
        return true;
    }

    // Handshake if still pending, then alternate turns until Closed.
    std::error_code run()
    {
        if (state_ == SessionState::Handshaking)
        {
            if (auto ec = handshake())
                return ec;
        }

        while (state_ != SessionState::Closed)
        {
            const bool ok =
                next_turn_ == Turn::Send ? send_turn() : receive_turn();
            if (!ok)
                break;
        }
        return last_error_;
    }

    [[nodiscard]] SessionState state() const noexcept { return state_; }
    [[nodiscard]] CloseReason  close_reason() const noexcept
    {
        return close_reason_;
    }
    [[nodiscard]] Role     role() const noexcept { return role_; }
    [[nodiscard]] Turn     next_turn() const noexcept { return next_turn_; }
    [[nodiscard]] uint64_t shared_secret() const noexcept
    {
        return shared_secret_;
    }
    [[nodiscard]] uint64_t envelopes_sent() const noexcept
    {
        return envelopes_sent_;
    }
    [[nodiscard]] uint64_t envelopes_received() const noexcept
    {
        return envelopes_received_;
    }
    [[nodiscard]] uint64_t outbound_consumed() const noexcept
    {
        return outbound_ ? outbound_->consumed() : 0;
    }
    [[nodiscard]] uint64_t inbound_consumed() const noexcept
    {
        return inbound_ ? inbound_->consumed() : 0;
    }

  private:
    [[nodiscard]] bool ready_for_turn() const noexcept
    {
        return state_ == SessionState::Established && outbound_ && inbound_;
    }

    void close(CloseReason reason)
    {
        state_        = SessionState::Closed;
        close_reason_ = reason;
        transcript_.closed(close_reason_str(reason));
    }

    Connection                &conn_;
    Role                       role_;
    std::unique_ptr<PeerOrder> order_;
    LineSource                &input_;
    LineSink                  &output_;
    SessionTranscript         &transcript_;
    size_t                     keystream_preview_;

    SessionState state_        = SessionState::Handshaking;
    CloseReason  close_reason_ = CloseReason::None;
    Turn         next_turn_    = Turn::Send;
    std::error_code last_error_;

    uint64_t                          shared_secret_ = 0;
    std::optional<KeystreamGenerator> outbound_;
    std::optional<KeystreamGenerator> inbound_;
    uint64_t                          envelopes_sent_     = 0;
    uint64_t                          envelopes_received_ = 0;
};

#endif
