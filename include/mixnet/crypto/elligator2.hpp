#pragma once

#include "mixnet/crypto/field25519.hpp"
#include "mixnet/crypto/keys.hpp"
#include <array>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>

namespace mixnet::crypto {

constexpr size_t REPRESENTATIVE_LEN = 32;

using Representative = std::array<uint8_t, REPRESENTATIVE_LEN>;

enum class ElligatorError {
    NotRepresentable,    // roughly half of all public keys
    GenerationFailed,
};

// Ephemeral key whose public half has an Elligator2 representative
struct RepresentableKey {
    OnionSecretKey secret;
    Representative representative{};
};

// Elligator2 map between Curve25519 public keys and strings that are
// indistinguishable from uniform random bytes. Lets the link handshake send
// its ephemeral keys without any key material the observer could know.
class Elligator2 {
public:
    // Every 32-byte string maps to a public key; the top bit is ignored
    static OnionPublicKey representative_to_key(std::span<const uint8_t, 32> representative);

    // tweak bit 0 picks between the two roots, bit 1 fills the unused top bit
    static std::expected<Representative, ElligatorError>
    key_to_representative(const OnionPublicKey& key, uint8_t tweak);

    static bool is_representable(const OnionPublicKey& key);

    // Draws X25519 keys until one is representable (two tries on average)
    static std::expected<RepresentableKey, ElligatorError> generate();

private:
    static FieldElement map_to_u(const FieldElement& r);
    static std::optional<FieldElement> u_to_representative(const FieldElement& u);
};

[[nodiscard]] std::string elligator_error_message(ElligatorError err);

}  // namespace mixnet::crypto
