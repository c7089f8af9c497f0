#include "mixnet/core/circuit_message.hpp"
#include "mixnet/crypto/hash.hpp"
#include "mixnet/util/binary.hpp"
#include <algorithm>
#include <string_view>

namespace mixnet::core {

namespace {

constexpr size_t OPEN_EXTRA_LEN = crypto::NODE_ID_LEN + crypto::X25519_KEY_LEN;
constexpr std::string_view OPEN_SIGNATURE_CONTEXT = "mixnet-circuit-open";

bool valid_type(uint8_t t) {
    return t >= static_cast<uint8_t>(CircuitMessageType::Open) &&
           t <= static_cast<uint8_t>(CircuitMessageType::FinAck);
}

std::vector<uint8_t> encode_body(const CircuitMessage& msg) {
    util::BinaryWriter w;
    switch (msg.type) {
        case CircuitMessageType::Open:
            w.write_u8(msg.priority);
            w.write_bytes(msg.open_signature);
            break;
        case CircuitMessageType::Data:
            w.write_u32(msg.seq);
            w.write_bytes(msg.data);
            break;
        case CircuitMessageType::Ack: {
            w.write_u32(msg.seq);
            auto n = std::min(msg.sacks.size(), MAX_SACK_BLOCKS);
            w.write_u8(static_cast<uint8_t>(n));
            for (size_t i = 0; i < n; ++i) {
                w.write_u32(msg.sacks[i]);
            }
            break;
        }
        case CircuitMessageType::Fin:
            w.write_u32(msg.seq);
            break;
        case CircuitMessageType::OpenAck:
        case CircuitMessageType::FinAck:
            break;
    }
    return w.take();
}

std::expected<void, util::WireError>
decode_body(CircuitMessage& msg, std::span<const uint8_t> body) {
    util::BinaryReader r(body);
    switch (msg.type) {
        case CircuitMessageType::Open: {
            auto p = r.read_u8();
            if (!p) return std::unexpected(p.error());
            msg.priority = *p;
            auto sig = r.read_array<crypto::SIGNATURE_LEN>();
            if (!sig) return std::unexpected(sig.error());
            msg.open_signature = *sig;
            break;
        }
        case CircuitMessageType::Data: {
            auto seq = r.read_u32();
            if (!seq) return std::unexpected(seq.error());
            msg.seq = *seq;
            auto rest = r.rest();
            msg.data.assign(rest.begin(), rest.end());
            return {};
        }
        case CircuitMessageType::Ack: {
            auto seq = r.read_u32();
            if (!seq) return std::unexpected(seq.error());
            msg.seq = *seq;
            auto n = r.read_u8();
            if (!n) return std::unexpected(n.error());
            if (*n > MAX_SACK_BLOCKS) return std::unexpected(util::WireError::InvalidLength);
            for (uint8_t i = 0; i < *n; ++i) {
                auto s = r.read_u32();
                if (!s) return std::unexpected(s.error());
                msg.sacks.push_back(*s);
            }
            break;
        }
        case CircuitMessageType::Fin: {
            auto seq = r.read_u32();
            if (!seq) return std::unexpected(seq.error());
            msg.seq = *seq;
            break;
        }
        case CircuitMessageType::OpenAck:
        case CircuitMessageType::FinAck:
            break;
    }
    return r.expect_end();
}

}  // namespace

const char* circuit_message_type_name(CircuitMessageType type) {
    switch (type) {
        case CircuitMessageType::Open: return "OPEN";
        case CircuitMessageType::OpenAck: return "OPEN_ACK";
        case CircuitMessageType::Data: return "DATA";
        case CircuitMessageType::Ack: return "ACK";
        case CircuitMessageType::Fin: return "FIN";
        case CircuitMessageType::FinAck: return "FIN_ACK";
        default: return "UNKNOWN";
    }
}

std::expected<CircuitKeys, MixnetError>
CircuitKeys::derive(const crypto::SharedSecret& shared, CircuitId id, bool initiator) {
    util::BinaryWriter salt;
    salt.write_u64(id);
    auto okm = crypto::hkdf_sha256(salt.data(), shared,
                                   crypto::as_bytes("mixnet-circuit-v1"), 72);
    if (!okm) {
        return std::unexpected(MixnetError::CryptoFailure);
    }

    CircuitKeys keys;
    auto i2r_key = std::span<const uint8_t>(*okm).subspan(0, 32);
    auto r2i_key = std::span<const uint8_t>(*okm).subspan(32, 32);
    auto i2r_prefix = std::span<const uint8_t>(*okm).subspan(64, 4);
    auto r2i_prefix = std::span<const uint8_t>(*okm).subspan(68, 4);

    std::copy(initiator ? i2r_key.begin() : r2i_key.begin(),
              initiator ? i2r_key.end() : r2i_key.end(), keys.send_key.begin());
    std::copy(initiator ? r2i_key.begin() : i2r_key.begin(),
              initiator ? r2i_key.end() : i2r_key.end(), keys.recv_key.begin());
    std::copy(initiator ? i2r_prefix.begin() : r2i_prefix.begin(),
              initiator ? i2r_prefix.end() : r2i_prefix.end(), keys.send_prefix.begin());
    std::copy(initiator ? r2i_prefix.begin() : i2r_prefix.begin(),
              initiator ? r2i_prefix.end() : i2r_prefix.end(), keys.recv_prefix.begin());

    crypto::secure_zero(okm->data(), okm->size());
    return keys;
}

std::vector<uint8_t>
open_signed_bytes(CircuitId id, const NodeId& initiator,
                  const crypto::OnionPublicKey& ephemeral, const NodeId& responder) {
    util::BinaryWriter w;
    w.write_bytes(crypto::as_bytes(OPEN_SIGNATURE_CONTEXT));
    w.write_u64(id);
    w.write_bytes(initiator.as_span());
    w.write_bytes(ephemeral.as_span());
    w.write_bytes(responder.as_span());
    return w.take();
}

std::expected<CircuitHeader, MixnetError>
peek_circuit_header(std::span<const uint8_t> wire) {
    util::BinaryReader r(wire);
    auto type = r.read_u8();
    auto id = r.read_u64();
    if (!type || !id || !valid_type(*type)) {
        return std::unexpected(MixnetError::MalformedPacket);
    }

    CircuitHeader h;
    h.type = static_cast<CircuitMessageType>(*type);
    h.circuit_id = *id;

    if (h.type == CircuitMessageType::Open) {
        auto initiator = r.read_array<crypto::NODE_ID_LEN>();
        auto eph = r.read_array<crypto::X25519_KEY_LEN>();
        if (!initiator || !eph) {
            return std::unexpected(MixnetError::MalformedPacket);
        }
        h.initiator = NodeId(*initiator);
        h.ephemeral = crypto::OnionPublicKey(*eph);
    }

    // counter + tag must follow
    if (r.remaining() < 8 + crypto::AEAD_TAG_LEN) {
        return std::unexpected(MixnetError::MalformedPacket);
    }
    return h;
}

std::expected<std::vector<uint8_t>, MixnetError>
seal_circuit_message(const CircuitMessage& msg, const CircuitKeys& keys) {
    util::BinaryWriter w;
    w.write_u8(static_cast<uint8_t>(msg.type));
    w.write_u64(msg.circuit_id);
    if (msg.type == CircuitMessageType::Open) {
        w.write_bytes(msg.initiator.as_span());
        w.write_bytes(msg.ephemeral.as_span());
    }
    w.write_u64(msg.counter);

    auto body = encode_body(msg);
    auto nonce = crypto::make_counter_nonce(keys.send_prefix, msg.counter);
    auto sealed = crypto::aead_seal(keys.send_key, nonce, body, w.data());
    if (!sealed) {
        return std::unexpected(MixnetError::CryptoFailure);
    }
    w.write_bytes(*sealed);
    return w.take();
}

std::expected<CircuitMessage, MixnetError>
open_circuit_message(std::span<const uint8_t> wire, const CircuitKeys& keys) {
    auto header = peek_circuit_header(wire);
    if (!header) {
        return std::unexpected(header.error());
    }

    size_t aad_len = 1 + 8 + (header->type == CircuitMessageType::Open ? OPEN_EXTRA_LEN : 0);
    util::BinaryReader r(wire.subspan(aad_len));
    auto counter = r.read_u64();
    if (!counter) {
        return std::unexpected(MixnetError::MalformedPacket);
    }
    aad_len += 8;

    auto nonce = crypto::make_counter_nonce(keys.recv_prefix, *counter);
    auto body = crypto::aead_open(keys.recv_key, nonce, wire.subspan(aad_len),
                                  wire.first(aad_len));
    if (!body) {
        return std::unexpected(MixnetError::DecryptionError);
    }

    CircuitMessage msg;
    msg.type = header->type;
    msg.circuit_id = header->circuit_id;
    msg.counter = *counter;
    msg.initiator = header->initiator;
    msg.ephemeral = header->ephemeral;
    if (!decode_body(msg, *body)) {
        return std::unexpected(MixnetError::MalformedPacket);
    }
    return msg;
}

}  // namespace mixnet::core
