#include "mixnet/crypto/ntor.hpp"
#include "mixnet/crypto/hash.hpp"
#include <algorithm>
#include <vector>

namespace mixnet::crypto {

namespace {

struct Transcript {
    std::vector<uint8_t> bytes;

    Transcript& add(std::span<const uint8_t> part) {
        bytes.insert(bytes.end(), part.begin(), part.end());
        return *this;
    }
    Transcript& add(std::string_view part) { return add(as_bytes(part)); }
};

std::expected<Digest, NtorError> tagged_mac(std::string_view tag,
                                            std::span<const uint8_t> data) {
    auto mac = hmac_sha256(as_bytes(tag), data);
    if (!mac) {
        return std::unexpected(NtorError::InternalError);
    }
    return *mac;
}

// Splits HKDF output into the two directions. The initiator sends with the
// first block, the responder with the second.
std::expected<LinkSessionKeys, NtorError> derive_session(
    const Digest& secret_input, bool initiator
) {
    auto okm = hkdf_sha256({}, secret_input, as_bytes(NTOR_T_KEY), 2 * DirectionKeys::LEN);
    if (!okm) {
        return std::unexpected(NtorError::KeyDerivationFailed);
    }
    auto load = [&](size_t base) {
        DirectionKeys k;
        auto it = okm->begin() + static_cast<std::ptrdiff_t>(base);
        std::copy_n(it, AEAD_KEY_LEN, k.aead_key.begin());
        it += AEAD_KEY_LEN;
        std::copy_n(it, NONCE_PREFIX_LEN, k.nonce_prefix.begin());
        it += NONCE_PREFIX_LEN;
        std::copy_n(it, LENGTH_MASK_KEY_LEN, k.length_key.begin());
        return k;
    };
    auto first = load(0);
    auto second = load(DirectionKeys::LEN);
    secure_zero(okm->data(), okm->size());

    auto session = tagged_mac(NTOR_T_SESSION, secret_input);
    if (!session) {
        return std::unexpected(session.error());
    }

    LinkSessionKeys keys;
    keys.send = initiator ? first : second;
    keys.recv = initiator ? second : first;
    keys.session_id = *session;
    return keys;
}

struct Agreement {
    Digest secret_input;
    Digest auth;
};

std::expected<Agreement, NtorError> agree(
    const SharedSecret& exp_xy,
    const SharedSecret& exp_xb,
    const NodeId& id,
    const OnionPublicKey& b,
    const OnionPublicKey& x,
    const OnionPublicKey& y
) {
    Transcript secret;
    secret.add(exp_xy).add(exp_xb).add(id.as_span()).add(b.as_span())
          .add(x.as_span()).add(y.as_span()).add(NTOR_PROTO_ID);
    auto secret_input = tagged_mac(NTOR_T_MAC, secret.bytes);
    secure_zero(secret.bytes.data(), secret.bytes.size());
    if (!secret_input) {
        return std::unexpected(secret_input.error());
    }

    auto verify = tagged_mac(NTOR_T_VERIFY, *secret_input);
    if (!verify) {
        return std::unexpected(verify.error());
    }

    Transcript auth_input;
    auth_input.add(*verify).add(id.as_span()).add(b.as_span())
              .add(y.as_span()).add(x.as_span()).add(NTOR_PROTO_ID)
              .add(NTOR_RESPONDER_STR);
    auto auth = tagged_mac(NTOR_T_MAC, auth_input.bytes);
    if (!auth) {
        return std::unexpected(auth.error());
    }
    return Agreement{*secret_input, *auth};
}

}  // namespace

std::expected<OnionPublicKey, NtorError>
NtorInitiator::start(const NodeId& responder_id, const OnionPublicKey& responder_onion) {
    auto eph = OnionSecretKey::generate();
    if (!eph) {
        return std::unexpected(NtorError::InternalError);
    }
    return start(responder_id, responder_onion, std::move(*eph));
}

std::expected<OnionPublicKey, NtorError>
NtorInitiator::start(const NodeId& responder_id, const OnionPublicKey& responder_onion,
                     OnionSecretKey ephemeral) {
    if (responder_onion.is_low_order()) {
        return std::unexpected(NtorError::LowOrderPoint);
    }
    ephemeral_ = std::move(ephemeral);
    responder_id_ = responder_id;
    responder_onion_ = responder_onion;
    started_ = true;
    return ephemeral_.public_key();
}

std::expected<LinkSessionKeys, NtorError>
NtorInitiator::finish(const OnionPublicKey& responder_ephemeral,
                      std::span<const uint8_t> auth) const {
    if (!started_) {
        return std::unexpected(NtorError::NotStarted);
    }
    if (responder_ephemeral.is_low_order()) {
        return std::unexpected(NtorError::LowOrderPoint);
    }

    auto exp_xy = ephemeral_.diffie_hellman(responder_ephemeral);
    auto exp_xb = ephemeral_.diffie_hellman(responder_onion_);
    if (!exp_xy || !exp_xb) {
        return std::unexpected(NtorError::KeyDerivationFailed);
    }

    auto agreement = agree(*exp_xy, *exp_xb, responder_id_, responder_onion_,
                           ephemeral_.public_key(), responder_ephemeral);
    if (!agreement) {
        return std::unexpected(agreement.error());
    }
    if (!constant_time_compare(agreement->auth, auth)) {
        return std::unexpected(NtorError::AuthVerificationFailed);
    }
    return derive_session(agreement->secret_input, true);
}

std::expected<NtorResponse, NtorError>
ntor_respond(const OnionPublicKey& initiator_ephemeral,
             const NodeId& our_id,
             const OnionSecretKey& our_onion) {
    auto eph = OnionSecretKey::generate();
    if (!eph) {
        return std::unexpected(NtorError::InternalError);
    }
    return ntor_respond(initiator_ephemeral, our_id, our_onion, std::move(*eph));
}

std::expected<NtorResponse, NtorError>
ntor_respond(const OnionPublicKey& initiator_ephemeral,
             const NodeId& our_id,
             const OnionSecretKey& our_onion,
             OnionSecretKey ephemeral) {
    if (initiator_ephemeral.is_low_order()) {
        return std::unexpected(NtorError::LowOrderPoint);
    }

    auto exp_xy = ephemeral.diffie_hellman(initiator_ephemeral);
    auto exp_xb = our_onion.diffie_hellman(initiator_ephemeral);
    if (!exp_xy || !exp_xb) {
        return std::unexpected(NtorError::KeyDerivationFailed);
    }

    auto agreement = agree(*exp_xy, *exp_xb, our_id, our_onion.public_key(),
                           initiator_ephemeral, ephemeral.public_key());
    if (!agreement) {
        return std::unexpected(agreement.error());
    }
    auto keys = derive_session(agreement->secret_input, false);
    if (!keys) {
        return std::unexpected(keys.error());
    }

    NtorResponse response;
    response.ephemeral = ephemeral.public_key();
    response.auth = agreement->auth;
    response.keys = *keys;
    return response;
}

std::string ntor_error_message(NtorError err) {
    switch (err) {
        case NtorError::NotStarted: return "Handshake not started";
        case NtorError::LowOrderPoint: return "Low-order point rejected";
        case NtorError::KeyDerivationFailed: return "Key derivation failed";
        case NtorError::AuthVerificationFailed: return "Responder auth verification failed";
        case NtorError::InternalError: return "Internal error";
        default: return "Unknown ntor error";
    }
}

}  // namespace mixnet::crypto
