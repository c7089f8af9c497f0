#include "mixnet/transport/link_protocol.hpp"
#include "mixnet/crypto/aead.hpp"
#include "mixnet/crypto/elligator2.hpp"
#include "mixnet/crypto/hash.hpp"
#include "mixnet/util/binary.hpp"
#include "mixnet/util/logging.hpp"
#include <algorithm>
#include <cstring>
#include <optional>

namespace mixnet::transport {

namespace {

std::span<const uint8_t> as_bytes(std::string_view s) {
    return {reinterpret_cast<const uint8_t*>(s.data()), s.size()};
}

// B | NodeId; keys the mark and the epoch MAC
std::vector<uint8_t> responder_key(const NodeId& id, const crypto::OnionPublicKey& onion) {
    std::vector<uint8_t> k;
    k.reserve(crypto::OnionPublicKey::SIZE + NodeId::SIZE);
    k.insert(k.end(), onion.data().begin(), onion.data().end());
    k.insert(k.end(), id.data().begin(), id.data().end());
    return k;
}

crypto::OnionPublicKey key_of(std::span<const uint8_t> representative) {
    return crypto::Elligator2::representative_to_key(
        std::span<const uint8_t, LINK_KEY_LEN>(representative.data(), LINK_KEY_LEN));
}

std::expected<std::array<uint8_t, LINK_MARK_LEN>, LinkError>
compute_mark(std::span<const uint8_t> kb, std::span<const uint8_t> representative) {
    auto mac = crypto::hmac_sha256(kb, representative);
    if (!mac) {
        return std::unexpected(LinkError::InternalError);
    }
    std::array<uint8_t, LINK_MARK_LEN> mark{};
    std::copy_n(mac->begin(), LINK_MARK_LEN, mark.begin());
    return mark;
}

std::expected<std::array<uint8_t, LINK_MAC_LEN>, LinkError>
epoch_mac(std::span<const uint8_t> kb, std::span<const uint8_t> prefix, int64_t hour) {
    crypto::HmacSha256 h;
    util::BinaryWriter w(8);
    w.write_u64(static_cast<uint64_t>(hour));
    if (!h.init(kb) || !h.update(prefix) || !h.update(w.data())) {
        return std::unexpected(LinkError::InternalError);
    }
    auto digest = h.finalize();
    if (!digest) {
        return std::unexpected(LinkError::InternalError);
    }
    std::array<uint8_t, LINK_MAC_LEN> mac{};
    std::copy_n(digest->begin(), LINK_MAC_LEN, mac.begin());
    return mac;
}

// Accepts the previous, current and next hour to tolerate clock skew.
// Returns the hour the MAC was made for.
std::optional<int64_t> verify_epoch_mac(std::span<const uint8_t> kb,
                                        std::span<const uint8_t> prefix,
                                        std::span<const uint8_t> mac, int64_t hour) {
    for (int64_t h = hour - 1; h <= hour + 1; ++h) {
        auto expected = epoch_mac(kb, prefix, h);
        if (expected && crypto::constant_time_compare(*expected, mac)) {
            return h;
        }
    }
    return std::nullopt;
}

std::vector<uint8_t> random_padding() {
    auto r = crypto::random_u64();
    auto len = LINK_MIN_PAD + static_cast<size_t>(r % (LINK_MAX_PAD - LINK_MIN_PAD + 1));
    return crypto::random_bytes(len);
}

// Reads min_len bytes, then one byte at a time until the mark sits right
// before the trailing MAC. Never reads past the end of the peer's message.
std::expected<std::vector<uint8_t>, LinkError>
read_until_mark(net::Stream& stream, size_t min_len, size_t max_len,
                std::span<const uint8_t, LINK_MARK_LEN> mark) {
    std::vector<uint8_t> buf(min_len);
    if (auto r = stream.read_exactly(buf); !r) {
        return std::unexpected(from_connection_error(r.error()));
    }
    for (;;) {
        auto tail = buf.size() - LINK_MAC_LEN - LINK_MARK_LEN;
        if (std::equal(mark.begin(), mark.end(), buf.begin() + static_cast<std::ptrdiff_t>(tail))) {
            return buf;
        }
        if (buf.size() >= max_len) {
            return std::unexpected(LinkError::MarkNotFound);
        }
        uint8_t b = 0;
        if (auto r = stream.read_exactly(std::span<uint8_t>(&b, 1)); !r) {
            return std::unexpected(from_connection_error(r.error()));
        }
        buf.push_back(b);
    }
}

void write_error_log(const char* side, LinkError err, const std::string& peer) {
    LOG_DEBUG("link handshake ({}) with {} failed: {}", side, peer, link_error_message(err));
}

}  // namespace

const char* frame_type_name(FrameType type) {
    switch (type) {
        case FrameType::Hello: return "HELLO";
        case FrameType::Packet: return "PACKET";
        case FrameType::Gossip: return "GOSSIP";
        case FrameType::Keepalive: return "KEEPALIVE";
        default: return "UNKNOWN";
    }
}

std::string link_error_message(LinkError err) {
    switch (err) {
        case LinkError::HandshakeFailed: return "Link handshake failed";
        case LinkError::MarkNotFound: return "HMAC mark not found in handshake";
        case LinkError::MacVerificationFailed: return "Epoch-hour MAC verification failed";
        case LinkError::ReplayedHandshake: return "Replayed handshake";
        case LinkError::AuthenticationFailed: return "Responder authentication failed";
        case LinkError::HelloInvalid: return "Invalid HELLO";
        case LinkError::IdentityMismatch: return "Peer identity does not match";
        case LinkError::FrameDecryptFailed: return "Frame decryption failed";
        case LinkError::FrameTooLarge: return "Frame too large";
        case LinkError::UnexpectedFrame: return "Unexpected frame type";
        case LinkError::Timeout: return "Link timed out";
        case LinkError::Closed: return "Link closed";
        case LinkError::IoError: return "Link I/O error";
        case LinkError::InternalError: return "Internal link error";
        default: return "Unknown link error";
    }
}

LinkError from_connection_error(net::ConnectionError err) {
    switch (err) {
        case net::ConnectionError::Timeout:
            return LinkError::Timeout;
        case net::ConnectionError::Closed:
        case net::ConnectionError::ConnectionReset:
        case net::ConnectionError::NotConnected:
            return LinkError::Closed;
        default:
            return LinkError::IoError;
    }
}

int64_t epoch_hour() {
    return epoch_hour(std::chrono::system_clock::now());
}

int64_t epoch_hour(std::chrono::system_clock::time_point tp) {
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(
        tp.time_since_epoch()).count();
    return secs / 3600;
}

// --- FrameEncoder / FrameDecoder ---

std::expected<void, LinkError> FrameEncoder::init(const crypto::DirectionKeys& keys) {
    key_ = keys.aead_key;
    prefix_ = keys.nonce_prefix;
    counter_ = 0;
    if (!length_mask_.init(keys.length_key)) {
        return std::unexpected(LinkError::InternalError);
    }
    return {};
}

std::expected<std::vector<uint8_t>, LinkError>
FrameEncoder::encode(FrameType type, std::span<const uint8_t> body) {
    if (body.size() > MAX_FRAME_BODY) {
        return std::unexpected(LinkError::FrameTooLarge);
    }
    std::vector<uint8_t> plain;
    plain.reserve(1 + body.size());
    plain.push_back(static_cast<uint8_t>(type));
    plain.insert(plain.end(), body.begin(), body.end());

    auto ct_len = static_cast<uint16_t>(plain.size() + crypto::AEAD_TAG_LEN);
    std::array<uint8_t, FRAME_HEADER_LEN> header{
        static_cast<uint8_t>(ct_len >> 8), static_cast<uint8_t>(ct_len & 0xff)};
    if (!length_mask_.apply(header)) {
        return std::unexpected(LinkError::InternalError);
    }

    auto nonce = crypto::make_counter_nonce(prefix_, counter_);
    auto sealed = crypto::aead_seal(key_, nonce, plain, header);
    if (!sealed) {
        return std::unexpected(LinkError::InternalError);
    }
    ++counter_;

    std::vector<uint8_t> out;
    out.reserve(FRAME_HEADER_LEN + sealed->size());
    out.insert(out.end(), header.begin(), header.end());
    out.insert(out.end(), sealed->begin(), sealed->end());
    return out;
}

std::expected<void, LinkError> FrameDecoder::init(const crypto::DirectionKeys& keys) {
    key_ = keys.aead_key;
    prefix_ = keys.nonce_prefix;
    counter_ = 0;
    if (!length_mask_.init(keys.length_key)) {
        return std::unexpected(LinkError::InternalError);
    }
    return {};
}

std::expected<size_t, LinkError>
FrameDecoder::decode_length(std::span<const uint8_t, FRAME_HEADER_LEN> header) {
    std::copy(header.begin(), header.end(), header_.begin());
    std::array<uint8_t, FRAME_HEADER_LEN> plain = header_;
    if (!length_mask_.apply(plain)) {
        return std::unexpected(LinkError::InternalError);
    }
    size_t len = (static_cast<size_t>(plain[0]) << 8) | plain[1];
    if (len < 1 + crypto::AEAD_TAG_LEN || len > MAX_FRAME_CIPHERTEXT) {
        return std::unexpected(LinkError::FrameTooLarge);
    }
    return len;
}

std::expected<Frame, LinkError>
FrameDecoder::decode_body(std::span<const uint8_t> ciphertext) {
    auto nonce = crypto::make_counter_nonce(prefix_, counter_);
    auto plain = crypto::aead_open(key_, nonce, ciphertext, header_);
    if (!plain || plain->empty()) {
        return std::unexpected(LinkError::FrameDecryptFailed);
    }
    ++counter_;

    auto type = (*plain)[0];
    if (type < static_cast<uint8_t>(FrameType::Hello) ||
        type > static_cast<uint8_t>(FrameType::Keepalive)) {
        return std::unexpected(LinkError::UnexpectedFrame);
    }
    Frame frame;
    frame.type = static_cast<FrameType>(type);
    frame.body.assign(plain->begin() + 1, plain->end());
    return frame;
}

// --- LinkSession ---

LinkSession::LinkSession(net::Stream& stream, bool initiator)
    : stream_(stream), initiator_(initiator) {}

std::expected<void, LinkError> LinkSession::install(const crypto::LinkSessionKeys& keys) {
    if (auto r = encoder_.init(keys.send); !r) return r;
    if (auto r = decoder_.init(keys.recv); !r) return r;
    session_id_ = keys.session_id;
    return {};
}

std::expected<void, LinkError>
LinkSession::write_frame(FrameType type, std::span<const uint8_t> body) {
    auto wire = encoder_.encode(type, body);
    if (!wire) {
        return std::unexpected(wire.error());
    }
    if (auto r = stream_.write_all(*wire); !r) {
        return std::unexpected(from_connection_error(r.error()));
    }
    return {};
}

std::expected<Frame, LinkError> LinkSession::read_frame() {
    std::array<uint8_t, FRAME_HEADER_LEN> header{};
    if (auto r = stream_.read_exactly(header); !r) {
        return std::unexpected(from_connection_error(r.error()));
    }
    auto len = decoder_.decode_length(header);
    if (!len) {
        return std::unexpected(len.error());
    }
    std::vector<uint8_t> ct(*len);
    if (auto r = stream_.read_exactly(ct); !r) {
        return std::unexpected(from_connection_error(r.error()));
    }
    return decoder_.decode_body(ct);
}

std::expected<PeerHello, LinkError>
LinkSession::exchange_hello(const LocalCredentials& local) {
    auto ours = build_hello(local, session_id_, initiator_);
    if (!ours) {
        return std::unexpected(ours.error());
    }
    if (auto r = write_frame(FrameType::Hello, *ours); !r) {
        return std::unexpected(r.error());
    }
    auto frame = read_frame();
    if (!frame) {
        return std::unexpected(frame.error());
    }
    if (frame->type != FrameType::Hello) {
        return std::unexpected(LinkError::UnexpectedFrame);
    }
    return parse_hello(frame->body, session_id_, !initiator_);
}

// --- HELLO ---

namespace {

std::vector<uint8_t> hello_signed_bytes(std::span<const uint8_t> identity,
                                        uint8_t difficulty,
                                        uint8_t scope,
                                        std::span<const uint8_t, 32> session_id,
                                        bool initiator) {
    util::BinaryWriter w;
    w.write_bytes(as_bytes(LINK_HELLO_CONTEXT));
    w.write_bytes(session_id);
    w.write_u8(initiator ? 1 : 0);
    w.write_u8(difficulty);
    w.write_u8(scope);
    w.write_bytes(identity);
    return w.take();
}

}  // namespace

std::expected<std::vector<uint8_t>, LinkError>
build_hello(const LocalCredentials& local, std::span<const uint8_t, 32> session_id,
            bool initiator) {
    if (local.keys == nullptr) {
        return std::unexpected(LinkError::InternalError);
    }
    auto identity = local.identity.serialize();
    auto scope = static_cast<uint8_t>(local.admission_scope);
    auto sig = local.keys->identity.sign(
        hello_signed_bytes(identity, local.difficulty_bits, scope, session_id, initiator));
    if (!sig) {
        return std::unexpected(LinkError::InternalError);
    }

    util::BinaryWriter w(identity.size() + 4 + crypto::SIGNATURE_LEN);
    w.write_u16_prefixed(identity);
    w.write_u8(local.difficulty_bits);
    w.write_u8(scope);
    w.write_bytes(*sig);
    return w.take();
}

std::expected<PeerHello, LinkError>
parse_hello(std::span<const uint8_t> body, std::span<const uint8_t, 32> session_id,
            bool peer_initiator) {
    util::BinaryReader r(body);
    auto identity_bytes = r.read_u16_prefixed();
    auto difficulty = r.read_u8();
    auto scope = r.read_u8();
    auto sig = r.read_array<crypto::SIGNATURE_LEN>();
    if (!identity_bytes || !difficulty || !scope || !sig || !r.expect_end()) {
        return std::unexpected(LinkError::HelloInvalid);
    }
    if (*scope > static_cast<uint8_t>(policy::AdmissionScope::PerSourceIdentity) ||
        *difficulty > policy::MAX_DIFFICULTY_BITS) {
        return std::unexpected(LinkError::HelloInvalid);
    }

    auto identity = core::RelayIdentity::parse(*identity_bytes);
    if (!identity || !identity->verify()) {
        return std::unexpected(LinkError::HelloInvalid);
    }
    auto msg = hello_signed_bytes(*identity_bytes, *difficulty, *scope, session_id, peer_initiator);
    if (!identity->identity_key.verify(msg, *sig)) {
        return std::unexpected(LinkError::AuthenticationFailed);
    }
    return PeerHello{
        .identity = std::move(*identity),
        .difficulty_bits = *difficulty,
        .admission_scope = static_cast<policy::AdmissionScope>(*scope),
    };
}

// --- Handshakes ---

std::expected<crypto::LinkSessionKeys, LinkError>
client_handshake(net::Stream& stream, const NodeId& server_id,
                 const crypto::OnionPublicKey& server_onion,
                 std::chrono::system_clock::time_point now) {
    auto kb = responder_key(server_id, server_onion);

    auto eph = crypto::Elligator2::generate();
    if (!eph) {
        LOG_ERROR("Link handshake: {}", crypto::elligator_error_message(eph.error()));
        return std::unexpected(LinkError::InternalError);
    }
    const auto x_repr = eph->representative;

    crypto::NtorInitiator ntor;
    if (!ntor.start(server_id, server_onion, std::move(eph->secret))) {
        return std::unexpected(LinkError::HandshakeFailed);
    }

    auto hour = epoch_hour(now);
    auto mark = compute_mark(kb, x_repr);
    if (!mark) {
        return std::unexpected(mark.error());
    }
    auto pad = random_padding();

    std::vector<uint8_t> hello;
    hello.reserve(LINK_MAX_CLIENT_HANDSHAKE);
    hello.insert(hello.end(), x_repr.begin(), x_repr.end());
    hello.insert(hello.end(), pad.begin(), pad.end());
    hello.insert(hello.end(), mark->begin(), mark->end());
    auto mac = epoch_mac(kb, hello, hour);
    if (!mac) {
        return std::unexpected(mac.error());
    }
    hello.insert(hello.end(), mac->begin(), mac->end());

    if (auto w = stream.write_all(hello); !w) {
        auto err = from_connection_error(w.error());
        write_error_log("client", err, stream.remote_endpoint());
        return std::unexpected(err);
    }

    // Server reply: the mark covers the representative of Y, which we only learn by reading
    std::array<uint8_t, LINK_KEY_LEN + crypto::NTOR_AUTH_LEN> head{};
    if (auto r = stream.read_exactly(head); !r) {
        auto err = from_connection_error(r.error());
        write_error_log("client", err, stream.remote_endpoint());
        return std::unexpected(err);
    }
    auto server_mark = compute_mark(kb, std::span<const uint8_t>(head.data(), LINK_KEY_LEN));
    if (!server_mark) {
        return std::unexpected(server_mark.error());
    }

    auto rest = read_until_mark(stream, LINK_MIN_SERVER_HANDSHAKE - head.size(),
                                LINK_MAX_SERVER_HANDSHAKE - head.size(), *server_mark);
    if (!rest) {
        write_error_log("client", rest.error(), stream.remote_endpoint());
        return std::unexpected(rest.error());
    }

    std::vector<uint8_t> reply(head.begin(), head.end());
    reply.insert(reply.end(), rest->begin(), rest->end());
    auto mac_at = reply.size() - LINK_MAC_LEN;
    if (!verify_epoch_mac(kb, std::span<const uint8_t>(reply.data(), mac_at),
                          std::span<const uint8_t>(reply.data() + mac_at, LINK_MAC_LEN), hour)) {
        write_error_log("client", LinkError::MacVerificationFailed, stream.remote_endpoint());
        return std::unexpected(LinkError::MacVerificationFailed);
    }

    auto y = key_of(std::span<const uint8_t>(reply.data(), LINK_KEY_LEN));
    auto keys = ntor.finish(y, std::span<const uint8_t>(reply.data() + LINK_KEY_LEN,
                                                        crypto::NTOR_AUTH_LEN));
    if (!keys) {
        write_error_log("client", LinkError::AuthenticationFailed, stream.remote_endpoint());
        return std::unexpected(LinkError::AuthenticationFailed);
    }
    return *keys;
}

std::expected<crypto::LinkSessionKeys, LinkError>
server_handshake(net::Stream& stream, const NodeId& our_id,
                 const crypto::OnionSecretKey& our_onion,
                 policy::ReplayWindow& replay,
                 std::chrono::system_clock::time_point now) {
    auto kb = responder_key(our_id, our_onion.public_key());

    crypto::Representative x_repr{};
    if (auto r = stream.read_exactly(x_repr); !r) {
        auto err = from_connection_error(r.error());
        write_error_log("server", err, stream.remote_endpoint());
        return std::unexpected(err);
    }
    auto mark = compute_mark(kb, x_repr);
    if (!mark) {
        return std::unexpected(mark.error());
    }

    auto rest = read_until_mark(stream, LINK_MIN_CLIENT_HANDSHAKE - LINK_KEY_LEN,
                                LINK_MAX_CLIENT_HANDSHAKE - LINK_KEY_LEN, *mark);
    if (!rest) {
        write_error_log("server", rest.error(), stream.remote_endpoint());
        return std::unexpected(rest.error());
    }

    std::vector<uint8_t> hello(x_repr.begin(), x_repr.end());
    hello.insert(hello.end(), rest->begin(), rest->end());
    auto hour = epoch_hour(now);
    auto mac_at = hello.size() - LINK_MAC_LEN;
    auto hello_hour = verify_epoch_mac(kb, std::span<const uint8_t>(hello.data(), mac_at),
                                       std::span<const uint8_t>(hello.data() + mac_at, LINK_MAC_LEN),
                                       hour);
    if (!hello_hour) {
        write_error_log("server", LinkError::MacVerificationFailed, stream.remote_endpoint());
        return std::unexpected(LinkError::MacVerificationFailed);
    }

    // Marks are remembered for as long as their hour verifies
    core::PacketNonce mark_key{};
    std::copy(mark->begin(), mark->end(), mark_key.begin());
    switch (replay.check_and_insert(mark_key, static_cast<uint32_t>(*hello_hour),
                                    static_cast<uint32_t>(hour))) {
        case policy::ReplayVerdict::Fresh:
            break;
        case policy::ReplayVerdict::Full:
            LOG_WARN("Handshake replay cache full, refusing {}", stream.remote_endpoint());
            return std::unexpected(LinkError::HandshakeFailed);
        default:
            LOG_WARN("Replayed link handshake from {}", stream.remote_endpoint());
            return std::unexpected(LinkError::ReplayedHandshake);
    }

    auto eph = crypto::Elligator2::generate();
    if (!eph) {
        LOG_ERROR("Link handshake: {}", crypto::elligator_error_message(eph.error()));
        return std::unexpected(LinkError::InternalError);
    }
    const auto y_repr = eph->representative;

    auto response = crypto::ntor_respond(key_of(x_repr), our_id, our_onion, std::move(eph->secret));
    if (!response) {
        write_error_log("server", LinkError::HandshakeFailed, stream.remote_endpoint());
        return std::unexpected(LinkError::HandshakeFailed);
    }

    auto server_mark = compute_mark(kb, y_repr);
    if (!server_mark) {
        return std::unexpected(server_mark.error());
    }
    auto pad = random_padding();

    std::vector<uint8_t> reply;
    reply.reserve(LINK_MAX_SERVER_HANDSHAKE);
    reply.insert(reply.end(), y_repr.begin(), y_repr.end());
    reply.insert(reply.end(), response->auth.begin(), response->auth.end());
    reply.insert(reply.end(), pad.begin(), pad.end());
    reply.insert(reply.end(), server_mark->begin(), server_mark->end());
    auto mac = epoch_mac(kb, reply, hour);
    if (!mac) {
        return std::unexpected(mac.error());
    }
    reply.insert(reply.end(), mac->begin(), mac->end());

    if (auto w = stream.write_all(reply); !w) {
        auto err = from_connection_error(w.error());
        write_error_log("server", err, stream.remote_endpoint());
        return std::unexpected(err);
    }
    return response->keys;
}

}  // namespace mixnet::transport
