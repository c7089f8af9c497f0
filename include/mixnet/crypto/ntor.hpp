#pragma once

#include "mixnet/crypto/aead.hpp"
#include "mixnet/crypto/keys.hpp"
#include <array>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>

namespace mixnet::crypto {

// ntor-style one-way authenticated key agreement for transport links.
// The initiator knows the responder's NodeId and onion key B in advance.
//
//   secret_input = EXP(Y,x) | EXP(B,x) | ID | B | X | Y | PROTOID
//   verify       = H(secret_input, t_verify)
//   auth         = H(verify | ID | B | Y | X | PROTOID | "Responder", t_mac)
//   keys         = HKDF(secret_input, t_key)

inline constexpr std::string_view NTOR_PROTO_ID = "mixnet-link-x25519-sha256-1";
inline constexpr std::string_view NTOR_T_MAC = "mixnet-link-x25519-sha256-1:mac";
inline constexpr std::string_view NTOR_T_KEY = "mixnet-link-x25519-sha256-1:key_expand";
inline constexpr std::string_view NTOR_T_VERIFY = "mixnet-link-x25519-sha256-1:verify";
inline constexpr std::string_view NTOR_T_SESSION = "mixnet-link-x25519-sha256-1:session";
inline constexpr std::string_view NTOR_RESPONDER_STR = "Responder";

constexpr size_t NTOR_AUTH_LEN = 32;
constexpr size_t NONCE_PREFIX_LEN = 4;
constexpr size_t LENGTH_MASK_KEY_LEN = 16;

enum class NtorError {
    NotStarted,
    LowOrderPoint,
    KeyDerivationFailed,
    AuthVerificationFailed,
    InternalError,
};

// Keys protecting one direction of a link
struct DirectionKeys {
    AeadKey aead_key{};
    std::array<uint8_t, NONCE_PREFIX_LEN> nonce_prefix{};
    std::array<uint8_t, LENGTH_MASK_KEY_LEN> length_key{};

    static constexpr size_t LEN = AEAD_KEY_LEN + NONCE_PREFIX_LEN + LENGTH_MASK_KEY_LEN;
};

struct LinkSessionKeys {
    DirectionKeys send;
    DirectionKeys recv;
    std::array<uint8_t, 32> session_id{};  // binds the initiator's HELLO signature
};

class NtorInitiator {
public:
    NtorInitiator() = default;

    // Generates the ephemeral key; returns X
    [[nodiscard]] std::expected<OnionPublicKey, NtorError>
    start(const NodeId& responder_id, const OnionPublicKey& responder_onion);

    // Uses a caller-chosen ephemeral, e.g. one with an Elligator2 encoding
    [[nodiscard]] std::expected<OnionPublicKey, NtorError>
    start(const NodeId& responder_id, const OnionPublicKey& responder_onion,
          OnionSecretKey ephemeral);

    [[nodiscard]] std::expected<LinkSessionKeys, NtorError>
    finish(const OnionPublicKey& responder_ephemeral,
           std::span<const uint8_t> auth) const;

private:
    OnionSecretKey ephemeral_;
    NodeId responder_id_;
    OnionPublicKey responder_onion_;
    bool started_{false};
};

struct NtorResponse {
    OnionPublicKey ephemeral;                   // Y
    std::array<uint8_t, NTOR_AUTH_LEN> auth{};
    LinkSessionKeys keys;
};

[[nodiscard]] std::expected<NtorResponse, NtorError>
ntor_respond(const OnionPublicKey& initiator_ephemeral,
             const NodeId& our_id,
             const OnionSecretKey& our_onion);

[[nodiscard]] std::expected<NtorResponse, NtorError>
ntor_respond(const OnionPublicKey& initiator_ephemeral,
             const NodeId& our_id,
             const OnionSecretKey& our_onion,
             OnionSecretKey ephemeral);

[[nodiscard]] std::string ntor_error_message(NtorError err);

}  // namespace mixnet::crypto
