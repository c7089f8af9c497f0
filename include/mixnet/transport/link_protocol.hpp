#pragma once

#include "mixnet/core/identity.hpp"
#include "mixnet/crypto/aes_ctr.hpp"
#include "mixnet/crypto/elligator2.hpp"
#include "mixnet/crypto/ntor.hpp"
#include "mixnet/net/connection.hpp"
#include "mixnet/policy/admission.hpp"
#include "mixnet/policy/replay_window.hpp"
#include <array>
#include <chrono>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace mixnet::transport {

using crypto::NodeId;

// Handshake layout. Every field looks like uniform random bytes, even to an
// observer who knows the responder's NodeId and onion key.
//
//   client: X' | pad(32..256) | mark(16) | mac(16)
//   server: Y' | auth(32) | pad(32..256) | mark(16) | mac(16)
//
// X' and Y' are Elligator2 representatives of the ephemeral keys.
// mark = HMAC(K, X')[0..16] lets the reader find the end of the padding; mac
// covers everything before it plus the epoch hour.
constexpr size_t LINK_KEY_LEN = crypto::REPRESENTATIVE_LEN;
constexpr size_t LINK_MARK_LEN = 16;
constexpr size_t LINK_MAC_LEN = 16;
constexpr size_t LINK_MIN_PAD = 32;
constexpr size_t LINK_MAX_PAD = 256;

constexpr size_t LINK_MIN_CLIENT_HANDSHAKE = LINK_KEY_LEN + LINK_MIN_PAD + LINK_MARK_LEN + LINK_MAC_LEN;
constexpr size_t LINK_MAX_CLIENT_HANDSHAKE = LINK_KEY_LEN + LINK_MAX_PAD + LINK_MARK_LEN + LINK_MAC_LEN;
constexpr size_t LINK_MIN_SERVER_HANDSHAKE = LINK_MIN_CLIENT_HANDSHAKE + crypto::NTOR_AUTH_LEN;
constexpr size_t LINK_MAX_SERVER_HANDSHAKE = LINK_MAX_CLIENT_HANDSHAKE + crypto::NTOR_AUTH_LEN;

// Frame: masked_len(2) | AEAD(type(1) | body)
constexpr size_t FRAME_HEADER_LEN = 2;
constexpr size_t MAX_FRAME_BODY = 16384;
constexpr size_t MAX_FRAME_CIPHERTEXT = 1 + MAX_FRAME_BODY + crypto::AEAD_TAG_LEN;

inline constexpr std::string_view LINK_HELLO_CONTEXT = "mixnet-link-hello";

enum class FrameType : uint8_t {
    Hello = 1,      // identity exchange right after the handshake
    Packet = 2,     // admission ticket | sealed packet
    Gossip = 3,     // serialized identity or link-state record
    Keepalive = 4,
};

[[nodiscard]] const char* frame_type_name(FrameType type);

enum class LinkError {
    HandshakeFailed,
    MarkNotFound,
    MacVerificationFailed,
    ReplayedHandshake,
    AuthenticationFailed,
    HelloInvalid,
    IdentityMismatch,
    FrameDecryptFailed,
    FrameTooLarge,
    UnexpectedFrame,
    Timeout,
    Closed,
    IoError,
    InternalError,
};

[[nodiscard]] std::string link_error_message(LinkError err);
[[nodiscard]] LinkError from_connection_error(net::ConnectionError err);

[[nodiscard]] int64_t epoch_hour();
[[nodiscard]] int64_t epoch_hour(std::chrono::system_clock::time_point tp);

struct Frame {
    FrameType type{FrameType::Keepalive};
    std::vector<uint8_t> body;
};

// Seals frames for one direction. Nonces come from a counter under the
// direction's prefix; the length field is XORed with an AES-CTR keystream.
class FrameEncoder {
public:
    FrameEncoder() = default;
    [[nodiscard]] std::expected<void, LinkError> init(const crypto::DirectionKeys& keys);

    [[nodiscard]] std::expected<std::vector<uint8_t>, LinkError>
    encode(FrameType type, std::span<const uint8_t> body);

    [[nodiscard]] uint64_t frames() const { return counter_; }

private:
    crypto::AeadKey key_{};
    std::array<uint8_t, crypto::NONCE_PREFIX_LEN> prefix_{};
    crypto::AesCtr128 length_mask_;
    uint64_t counter_{0};
};

class FrameDecoder {
public:
    FrameDecoder() = default;
    [[nodiscard]] std::expected<void, LinkError> init(const crypto::DirectionKeys& keys);

    // Unmasks a length header; returns the ciphertext length that follows
    [[nodiscard]] std::expected<size_t, LinkError>
    decode_length(std::span<const uint8_t, FRAME_HEADER_LEN> header);

    // Opens the ciphertext following the header last passed to decode_length()
    [[nodiscard]] std::expected<Frame, LinkError>
    decode_body(std::span<const uint8_t> ciphertext);

    [[nodiscard]] uint64_t frames() const { return counter_; }

private:
    crypto::AeadKey key_{};
    std::array<uint8_t, crypto::NONCE_PREFIX_LEN> prefix_{};
    crypto::AesCtr128 length_mask_;
    std::array<uint8_t, FRAME_HEADER_LEN> header_{};
    uint64_t counter_{0};
};

// What each side proves after the key exchange
struct PeerHello {
    core::RelayIdentity identity;
    uint8_t difficulty_bits{0};   // admission work the peer requires from us
    policy::AdmissionScope admission_scope{policy::AdmissionScope::PerLink};
};

// What this node presents
struct LocalCredentials {
    const crypto::NodeKeys* keys{nullptr};
    core::RelayIdentity identity;
    uint8_t difficulty_bits{0};
    policy::AdmissionScope admission_scope{policy::AdmissionScope::PerLink};
};

// An authenticated, encrypted link over a stream. One thread may write
// frames while another reads them; concurrent writers need external locking.
class LinkSession {
public:
    LinkSession(net::Stream& stream, bool initiator);

    LinkSession(const LinkSession&) = delete;
    LinkSession& operator=(const LinkSession&) = delete;

    [[nodiscard]] std::expected<void, LinkError> install(const crypto::LinkSessionKeys& keys);

    [[nodiscard]] std::expected<void, LinkError>
    write_frame(FrameType type, std::span<const uint8_t> body);

    [[nodiscard]] std::expected<Frame, LinkError> read_frame();

    [[nodiscard]] bool initiator() const { return initiator_; }
    [[nodiscard]] const std::array<uint8_t, 32>& session_id() const { return session_id_; }
    [[nodiscard]] net::Stream& stream() { return stream_; }

    // Sends our HELLO and reads the peer's; verifies its signature over the
    // session id and role
    [[nodiscard]] std::expected<PeerHello, LinkError>
    exchange_hello(const LocalCredentials& local);

private:
    net::Stream& stream_;
    bool initiator_;
    std::array<uint8_t, 32> session_id_{};
    FrameEncoder encoder_;
    FrameDecoder decoder_;
};

// Hello body: identity_len(2) | identity | difficulty(1) | scope(1) | signature(64)
[[nodiscard]] std::expected<std::vector<uint8_t>, LinkError>
build_hello(const LocalCredentials& local, std::span<const uint8_t, 32> session_id,
            bool initiator);

[[nodiscard]] std::expected<PeerHello, LinkError>
parse_hello(std::span<const uint8_t> body, std::span<const uint8_t, 32> session_id,
            bool peer_initiator);

// Runs the obfuscated ntor handshake as the dialing side. The responder's
// NodeId and onion key must be known from its published identity.
[[nodiscard]] std::expected<crypto::LinkSessionKeys, LinkError>
client_handshake(net::Stream& stream, const NodeId& server_id,
                 const crypto::OnionPublicKey& server_onion,
                 std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

// Runs the handshake as the accepting side. Marks of accepted hellos are
// remembered in replay so a captured hello cannot be reused.
[[nodiscard]] std::expected<crypto::LinkSessionKeys, LinkError>
server_handshake(net::Stream& stream, const NodeId& our_id,
                 const crypto::OnionSecretKey& our_onion,
                 policy::ReplayWindow& replay,
                 std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

}  // namespace mixnet::transport
