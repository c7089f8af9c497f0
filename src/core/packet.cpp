#include "mixnet/core/packet.hpp"
#include "mixnet/crypto/aes_ctr.hpp"
#include "mixnet/crypto/hash.hpp"
#include "mixnet/util/logging.hpp"
#include <algorithm>
#include <string_view>

namespace mixnet::core {

namespace {

constexpr std::string_view ONION_KDF_INFO = "mixnet-onion-v1";

struct HopKeys {
    std::array<uint8_t, 32> mac_key{};
    std::array<uint8_t, crypto::AES_KEY_LEN> header_key{};
    std::array<uint8_t, crypto::AES_KEY_LEN> body_key{};

    ~HopKeys() {
        crypto::secure_zero(mac_key.data(), mac_key.size());
        crypto::secure_zero(header_key.data(), header_key.size());
        crypto::secure_zero(body_key.data(), body_key.size());
    }
};

std::expected<HopKeys, MixnetError> derive_hop_keys(
    const crypto::SharedSecret& secret, std::span<const uint8_t> nonce
) {
    auto okm = crypto::hkdf_sha256(nonce, secret, crypto::as_bytes(ONION_KDF_INFO), 64);
    if (!okm) {
        return std::unexpected(MixnetError::CryptoFailure);
    }
    HopKeys keys;
    std::copy_n(okm->begin(), 32, keys.mac_key.begin());
    std::copy_n(okm->begin() + 32, 16, keys.header_key.begin());
    std::copy_n(okm->begin() + 48, 16, keys.body_key.begin());
    crypto::secure_zero(okm->data(), okm->size());
    return keys;
}

std::expected<crypto::Digest, MixnetError> compute_mac(
    const HopKeys& keys,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> alpha,
    std::span<const uint8_t> beta,
    std::span<const uint8_t> body
) {
    const uint8_t version = PACKET_VERSION;
    crypto::HmacSha256 mac;
    if (!mac.init(keys.mac_key) ||
        !mac.update(std::span<const uint8_t>(&version, 1)) ||
        !mac.update(nonce) ||
        !mac.update(alpha) ||
        !mac.update(beta) ||
        !mac.update(body)) {
        return std::unexpected(MixnetError::CryptoFailure);
    }
    auto out = mac.finalize();
    if (!out) {
        return std::unexpected(MixnetError::CryptoFailure);
    }
    return *out;
}

std::expected<std::vector<uint8_t>, MixnetError> keystream(
    std::span<const uint8_t> key, size_t length
) {
    auto ks = crypto::aes_ctr_keystream(key, length);
    if (!ks) {
        return std::unexpected(MixnetError::CryptoFailure);
    }
    return std::move(*ks);
}

void xor_into(std::span<uint8_t> dst, std::span<const uint8_t> src) {
    for (size_t i = 0; i < dst.size() && i < src.size(); ++i) {
        dst[i] ^= src[i];
    }
}

void write_packet(SealedPacket& packet,
                  std::span<const uint8_t> alpha,
                  std::span<const uint8_t> mac,
                  std::span<const uint8_t> beta,
                  std::span<const uint8_t> body,
                  std::span<const uint8_t> nonce) {
    auto out = packet.mutable_bytes();
    std::fill(out.begin(), out.end(), 0);
    out[layout::VERSION] = PACKET_VERSION;
    std::copy(alpha.begin(), alpha.end(), out.begin() + layout::ALPHA);
    std::copy(mac.begin(), mac.end(), out.begin() + layout::MAC);
    std::copy(beta.begin(), beta.end(), out.begin() + layout::BETA);
    std::copy(body.begin(), body.end(), out.begin() + layout::BODY);
    std::copy(nonce.begin(), nonce.end(), out.begin() + layout::NONCE);
}

// Sender-side state for one hop
struct HopSecrets {
    crypto::OnionPublicKey alpha;
    PacketNonce nonce{};
    std::vector<uint8_t> header_stream;  // HEADER_LEN + ROUTING_LEN
    std::vector<uint8_t> body_stream;    // BODY_LEN
    std::array<uint8_t, 32> mac_key{};
};

}  // namespace

SealedPacket::SealedPacket() {
    data_[layout::VERSION] = PACKET_VERSION;
}

std::expected<SealedPacket, MixnetError>
SealedPacket::parse(std::span<const uint8_t> data) {
    if (data.size() != PACKET_LEN) {
        return std::unexpected(MixnetError::MalformedPacket);
    }
    if (data[layout::VERSION] != PACKET_VERSION) {
        return std::unexpected(MixnetError::MalformedPacket);
    }
    auto pad = data.subspan(layout::PAD, PAD_LEN);
    if (std::any_of(pad.begin(), pad.end(), [](uint8_t b) { return b != 0; })) {
        return std::unexpected(MixnetError::MalformedPacket);
    }
    SealedPacket packet;
    std::copy(data.begin(), data.end(), packet.data_.begin());
    return packet;
}

PacketNonce SealedPacket::nonce() const {
    PacketNonce n{};
    std::copy_n(data_.begin() + layout::NONCE, NONCE_LEN, n.begin());
    return n;
}

uint32_t packet_epoch(WallClock::time_point t) {
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(t.time_since_epoch()).count();
    if (secs < 0) {
        return 0;
    }
    return static_cast<uint32_t>(secs / PACKET_EPOCH.count());
}

uint32_t nonce_epoch(const PacketNonce& nonce) {
    return (static_cast<uint32_t>(nonce[0]) << 24) |
           (static_cast<uint32_t>(nonce[1]) << 16) |
           (static_cast<uint32_t>(nonce[2]) << 8) |
           static_cast<uint32_t>(nonce[3]);
}

std::expected<SealedPacket, MixnetError>
encode(const Route& route, std::span<const uint8_t> payload, WallClock::time_point now) {
    const size_t n = route.size();
    if (n == 0 || n > MAX_HOPS || payload.size() > MAX_PAYLOAD_LEN) {
        return std::unexpected(MixnetError::InvalidArgument);
    }

    const uint32_t epoch = packet_epoch(now);
    std::vector<HopSecrets> hops(n);
    for (size_t i = 0; i < n; ++i) {
        auto eph = crypto::OnionSecretKey::generate();
        if (!eph) {
            return std::unexpected(MixnetError::CryptoFailure);
        }
        auto shared = eph->diffie_hellman(route[i].onion_key);
        if (!shared) {
            return std::unexpected(MixnetError::CryptoFailure);
        }
        crypto::random_fill(hops[i].nonce);
        hops[i].nonce[0] = static_cast<uint8_t>(epoch >> 24);
        hops[i].nonce[1] = static_cast<uint8_t>(epoch >> 16);
        hops[i].nonce[2] = static_cast<uint8_t>(epoch >> 8);
        hops[i].nonce[3] = static_cast<uint8_t>(epoch);
        auto keys = derive_hop_keys(*shared, hops[i].nonce);
        if (!keys) {
            return std::unexpected(keys.error());
        }
        hops[i].alpha = eph->public_key();
        hops[i].mac_key = keys->mac_key;

        auto hs = keystream(keys->header_key, HEADER_LEN + ROUTING_LEN);
        auto bs = keystream(keys->body_key, BODY_LEN);
        if (!hs || !bs) {
            return std::unexpected(MixnetError::CryptoFailure);
        }
        hops[i].header_stream = std::move(*hs);
        hops[i].body_stream = std::move(*bs);
    }

    // Filler: the keystream tail each earlier hop will shift into beta
    std::vector<uint8_t> filler;
    for (size_t i = 1; i < n; ++i) {
        filler.resize(filler.size() + ROUTING_LEN, 0);
        const auto& hs = hops[i - 1].header_stream;
        auto from = hs.end() - static_cast<std::ptrdiff_t>(filler.size());
        xor_into(filler, std::span<const uint8_t>(from, hs.end()));
    }

    // Bodies, innermost first
    std::vector<std::vector<uint8_t>> bodies(n);
    {
        std::vector<uint8_t> body(BODY_LEN, 0);
        body[0] = static_cast<uint8_t>(payload.size() >> 8);
        body[1] = static_cast<uint8_t>(payload.size());
        std::copy(payload.begin(), payload.end(), body.begin() + 2);
        for (size_t i = n; i-- > 0;) {
            xor_into(body, hops[i].body_stream);
            bodies[i] = body;
        }
    }

    // Last hop: deliver block, zero padding, then the filler
    std::vector<uint8_t> beta(HEADER_LEN, 0);
    {
        const size_t open = HEADER_LEN - filler.size();
        beta[0] = static_cast<uint8_t>(RoutingKind::Deliver);
        xor_into(std::span<uint8_t>(beta.data(), open), hops[n - 1].header_stream);
        std::copy(filler.begin(), filler.end(), beta.begin() + static_cast<std::ptrdiff_t>(open));
    }

    crypto::Digest mac{};
    {
        HopKeys k;
        k.mac_key = hops[n - 1].mac_key;
        auto m = compute_mac(k, hops[n - 1].nonce, hops[n - 1].alpha.as_span(), beta, bodies[n - 1]);
        if (!m) return std::unexpected(m.error());
        mac = *m;
    }

    for (size_t i = n - 1; i-- > 0;) {
        const auto& next = hops[i + 1];
        std::vector<uint8_t> wrapped(HEADER_LEN, 0);
        util::BinaryWriter routing(ROUTING_LEN);
        routing.write_u8(static_cast<uint8_t>(RoutingKind::Forward));
        routing.write_bytes(route[i + 1].node_id().as_span());
        routing.write_bytes(next.alpha.as_span());
        routing.write_bytes(mac);
        routing.write_bytes(next.nonce);
        std::copy(routing.data().begin(), routing.data().end(), wrapped.begin());
        std::copy(beta.begin(), beta.end() - static_cast<std::ptrdiff_t>(ROUTING_LEN),
                  wrapped.begin() + static_cast<std::ptrdiff_t>(ROUTING_LEN));
        xor_into(wrapped, std::span<const uint8_t>(hops[i].header_stream).first(HEADER_LEN));
        beta = std::move(wrapped);

        HopKeys k;
        k.mac_key = hops[i].mac_key;
        auto m = compute_mac(k, hops[i].nonce, hops[i].alpha.as_span(), beta, bodies[i]);
        if (!m) return std::unexpected(m.error());
        mac = *m;
    }

    for (auto& hop : hops) {
        crypto::secure_zero(hop.mac_key.data(), hop.mac_key.size());
    }

    SealedPacket packet;
    write_packet(packet, hops[0].alpha.as_span(), mac, beta, bodies[0], hops[0].nonce);
    return packet;
}

std::expected<Disposition, MixnetError>
peel(const SealedPacket& packet, const crypto::OnionSecretKey& onion_key) {
    if (packet.version() != PACKET_VERSION) {
        return std::unexpected(MixnetError::MalformedPacket);
    }

    auto alpha = crypto::OnionPublicKey::from_bytes(packet.alpha());
    if (!alpha) {
        return std::unexpected(MixnetError::MalformedPacket);
    }
    // A low-order alpha cannot have come from an honest sender
    auto shared = onion_key.diffie_hellman(*alpha);
    if (!shared) {
        return std::unexpected(MixnetError::DecryptionError);
    }

    const auto nonce = packet.nonce();
    auto keys = derive_hop_keys(*shared, nonce);
    if (!keys) {
        return std::unexpected(keys.error());
    }

    auto expected_mac = compute_mac(*keys, nonce, packet.alpha(), packet.beta(), packet.body());
    if (!expected_mac) {
        return std::unexpected(expected_mac.error());
    }
    if (!crypto::constant_time_compare(*expected_mac, packet.mac())) {
        return std::unexpected(MixnetError::DecryptionError);
    }

    // Header: (beta || 0^R) xor stream; first R bytes are ours
    auto header = keystream(keys->header_key, HEADER_LEN + ROUTING_LEN);
    if (!header) {
        return std::unexpected(header.error());
    }
    auto beta = packet.beta();
    xor_into(std::span<uint8_t>(header->data(), HEADER_LEN), beta);
    std::span<const uint8_t> routing(header->data(), ROUTING_LEN);
    std::span<const uint8_t> next_beta(header->data() + ROUTING_LEN, HEADER_LEN);

    std::vector<uint8_t> body(packet.body().begin(), packet.body().end());
    auto body_stream = keystream(keys->body_key, BODY_LEN);
    if (!body_stream) {
        return std::unexpected(body_stream.error());
    }
    xor_into(body, *body_stream);

    util::BinaryReader reader(routing);
    auto kind = reader.read_u8();
    if (!kind) {
        return std::unexpected(MixnetError::MalformedPacket);
    }

    switch (static_cast<RoutingKind>(*kind)) {
        case RoutingKind::Forward: {
            auto next_id = reader.read_array<crypto::NODE_ID_LEN>();
            auto next_alpha = reader.read_array<ALPHA_LEN>();
            auto next_mac = reader.read_array<MAC_LEN>();
            auto next_nonce = reader.read_array<NONCE_LEN>();
            if (!next_id || !next_alpha || !next_mac || !next_nonce) {
                return std::unexpected(MixnetError::MalformedPacket);
            }
            Forward fwd;
            fwd.next_hop = NodeId(*next_id);
            write_packet(fwd.packet, *next_alpha, *next_mac, next_beta, body, *next_nonce);
            return Disposition{std::move(fwd)};
        }
        case RoutingKind::Deliver: {
            size_t len = (static_cast<size_t>(body[0]) << 8) | body[1];
            if (len > MAX_PAYLOAD_LEN) {
                return std::unexpected(MixnetError::MalformedPacket);
            }
            auto tail = std::span<const uint8_t>(body).subspan(2 + len);
            if (std::any_of(tail.begin(), tail.end(), [](uint8_t b) { return b != 0; })) {
                return std::unexpected(MixnetError::MalformedPacket);
            }
            Deliver del;
            del.payload.assign(body.begin() + 2, body.begin() + 2 + static_cast<std::ptrdiff_t>(len));
            return Disposition{std::move(del)};
        }
        default:
            LOG_DEBUG("peel: unknown routing kind {:#04x}", *kind);
            return std::unexpected(MixnetError::MalformedPacket);
    }
}

}  // namespace mixnet::core
