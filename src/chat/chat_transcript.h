#ifndef CHAT_TRANSCRIPT_H
#define CHAT_TRANSCRIPT_H

#include "shared_common_util.h"
#include "shared_net_common_protocol.h"
#include "shared_net_key_exchange.h"

#include <cstdint>
#include <ostream>
#include <span>
#include <string>
#include <string_view>
#include <system_error>

// Human readable log of a session. Purely observational; nothing here touches
// the wire or the generators.
class SessionTranscript
{
  public:
    explicit SessionTranscript(std::ostream &out) : out_(out) {}

    void handshake_started(Role role, const DomainParameters &params)
    {
        out_ << "[DH] Starting key exchange as " << role_str(role) << "...\n"
             << "p = " << u64_hex(params.prime) << " (64-bit prime - public)\n"
             << "g = " << params.generator << " (generator - public)\n\n";
    }

    void keypair_ready(const KeyPair &kp)
    {
        out_ << "[DH] Generated our keypair\n";
        if (debug_mode.load())
            out_ << "private_key = " << u64_hex(kp.private_key) << "\n";
        out_ << "public_key = g^private mod p = " << u64_hex(kp.public_key)
             << "\n\n[DH] Exchanging keys...\n"
             << std::flush;
    }

    void public_values_exchanged(Role role, uint64_t ours, uint64_t theirs)
    {
        if (role == Role::Initiator)
        {
            out_ << "[NETWORK] -> Sent our public (8 bytes): " << u64_hex(ours)
                 << "\n[NETWORK] <- Received their public (8 bytes): "
                 << u64_hex(theirs) << "\n";
        }
        else
        {
            out_ << "[NETWORK] <- Received their public (8 bytes): "
                 << u64_hex(theirs)
                 << "\n[NETWORK] -> Sent our public (8 bytes): " << u64_hex(ours)
                 << "\n";
        }
    }

    void shared_secret_derived(uint64_t secret)
    {
        out_ << "\n[DH] Computing shared secret...\n"
             << "Formula: secret = (their_public)^(our_private) mod p\n";
        if (debug_mode.load())
            out_ << "secret = " << u64_hex(secret) << "\n";
        out_ << "\n";
    }

    void handshake_failed(const std::error_code &ec)
    {
        out_ << "[DH] Key exchange failed: " << ec.message() << "\n"
             << std::flush;
    }

    void keystream_ready(std::span<const unsigned char> preview)
    {
        out_ << "[STREAM] Generating keystream from secret...\n"
             << "Algorithm: LCG (a=" << LCG_MULTIPLIER << ", c=" << LCG_INCREMENT
             << ", m=2^32)\n"
             << "Keystream: " << to_hex_spaced(preview) << "...\n\n"
             << "Secure channel established!\n\n"
             << std::flush;
    }

    void encrypted(std::span<const unsigned char> plain,
                   std::span<const unsigned char> key,
                   std::span<const unsigned char> cipher)
    {
        out_ << "\n[ENCRYPT]\n"
             << "Plain: " << to_hex_spaced(plain) << "(\"" << as_text(plain)
             << "\")\n"
             << "Key: " << to_hex_spaced(key) << "\n"
             << "Cipher: " << to_hex_spaced(cipher) << "\n\n";
    }

    void envelope_sent(size_t len)
    {
        out_ << "[NETWORK] Sent encrypted message (" << len << " bytes)\n\n"
             << std::flush;
    }

    void envelope_received(size_t len)
    {
        out_ << "[NETWORK] Received encrypted message (" << len << " bytes)\n";
    }

    void decrypted(std::span<const unsigned char> cipher,
                   std::span<const unsigned char> key,
                   std::span<const unsigned char> plain)
    {
        out_ << "[DECRYPT]\n"
             << "Cipher: " << to_hex_spaced(cipher) << "\n"
             << "Key: " << to_hex_spaced(key) << "\n"
             << "Plain: " << to_hex_spaced(plain) << "-> \"" << as_text(plain)
             << "\"\n\n"
             << std::flush;
    }

    void message_refused(size_t len)
    {
        out_ << "message too long (" << len << " bytes, max "
             << MAX_ENVELOPE_LEN << ")\n";
    }

    void closed(std::string_view reason)
    {
        log_event(out_, "session closed: " + std::string(reason));
    }

  private:
    static std::string as_text(std::span<const unsigned char> bytes)
    {
        std::string s;
        s.reserve(bytes.size());
        for (const auto b : bytes)
            s.push_back((b >= 0x20 && b <= 0x7E) ? static_cast<char>(b) : '.');
        return s;
    }

    std::ostream &out_;
};

#endif
