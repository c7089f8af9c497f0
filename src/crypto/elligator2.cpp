#include "mixnet/crypto/elligator2.hpp"
#include <algorithm>

namespace mixnet::crypto {

namespace {

// Non-square used by the map; 2 is a non-residue since p = 5 (mod 8)
const FieldElement ELLIGATOR_U = FieldElement(2, 0, 0, 0, 0);

constexpr int MAX_GENERATE_ATTEMPTS = 256;

}  // namespace

// Curve y^2 = x^3 + A*x^2 + x:
//   v = -A / (1 + 2*r^2)
//   x = v       if v^3 + A*v^2 + v is a square
//   x = -v - A  otherwise
FieldElement Elligator2::map_to_u(const FieldElement& r) {
    auto A = FieldElement::A();

    // 1 + 2r^2 is never zero because -1/2 is not a square
    auto denom = FieldElement::one() + ELLIGATOR_U * r.square();
    auto v = -(A * denom.invert());

    auto v2 = v.square();
    auto rhs = v2 * v + A * v2 + v;
    bool is_square = rhs.sqrt().second;

    return FieldElement::conditional_select(-v - A, v, is_square);
}

OnionPublicKey Elligator2::representative_to_key(std::span<const uint8_t, 32> representative) {
    std::array<uint8_t, 32> clamped{};
    std::copy(representative.begin(), representative.end(), clamped.begin());
    clamped[31] &= 0x7f;

    auto u = map_to_u(FieldElement::from_bytes(clamped));
    return OnionPublicKey(u.to_bytes());
}

// Inverse of the first branch: r^2 = -(A + u) / (2u)
std::optional<FieldElement> Elligator2::u_to_representative(const FieldElement& u) {
    auto A = FieldElement::A();

    if (u.is_zero() || (u + A).is_zero()) {
        return std::nullopt;
    }

    // The point must lie on the curve rather than its twist
    auto u2 = u.square();
    if (!(u2 * u + A * u2 + u).sqrt().second) {
        return std::nullopt;
    }

    auto r_squared = -(A + u) * (ELLIGATOR_U * u).invert();
    auto [r, exists] = r_squared.sqrt();
    if (!exists) {
        return std::nullopt;
    }
    return r;
}

std::expected<Representative, ElligatorError>
Elligator2::key_to_representative(const OnionPublicKey& key, uint8_t tweak) {
    auto u = FieldElement::from_bytes(std::span<const uint8_t, 32>(key.data().data(), 32));
    auto r = u_to_representative(u);
    if (!r) {
        return std::unexpected(ElligatorError::NotRepresentable);
    }

    // r and -r differ in parity, so a random parity spreads r over [0, p)
    bool odd = (tweak & 1) != 0;
    auto chosen = r->conditional_negate(odd != r->is_negative());

    auto bytes = chosen.to_bytes();
    bytes[31] |= static_cast<uint8_t>((tweak & 2) << 6);
    return bytes;
}

bool Elligator2::is_representable(const OnionPublicKey& key) {
    auto u = FieldElement::from_bytes(std::span<const uint8_t, 32>(key.data().data(), 32));
    return u_to_representative(u).has_value();
}

std::expected<RepresentableKey, ElligatorError> Elligator2::generate() {
    for (int attempt = 0; attempt < MAX_GENERATE_ATTEMPTS; ++attempt) {
        auto secret = OnionSecretKey::generate();
        if (!secret) {
            return std::unexpected(ElligatorError::GenerationFailed);
        }
        auto tweak = random_bytes(1);
        auto representative = key_to_representative(secret->public_key(), tweak[0]);
        if (!representative) {
            continue;
        }
        return RepresentableKey{.secret = std::move(*secret), .representative = *representative};
    }
    return std::unexpected(ElligatorError::GenerationFailed);
}

std::string elligator_error_message(ElligatorError err) {
    switch (err) {
        case ElligatorError::NotRepresentable: return "Key has no Elligator2 representative";
        case ElligatorError::GenerationFailed: return "Failed to generate representable key";
        default: return "Unknown Elligator2 error";
    }
}

}  // namespace mixnet::crypto
