#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <utility>

namespace mixnet::crypto {

// Element of GF(2^255 - 19) in five 51-bit limbs. Only what the Elligator2
// map needs; Diffie-Hellman itself stays in OpenSSL.
class FieldElement {
public:
    static constexpr int LIMBS = 5;
    static constexpr uint64_t MASK51 = (1ULL << 51) - 1;

    FieldElement() : limbs_{} {}

    explicit FieldElement(uint64_t l0, uint64_t l1, uint64_t l2,
                          uint64_t l3, uint64_t l4)
        : limbs_{l0, l1, l2, l3, l4} {}

    // 32 little-endian bytes; bit 255 is ignored
    static FieldElement from_bytes(std::span<const uint8_t, 32> bytes);

    // Canonical little-endian encoding
    [[nodiscard]] std::array<uint8_t, 32> to_bytes() const;

    [[nodiscard]] FieldElement operator+(const FieldElement& rhs) const;
    [[nodiscard]] FieldElement operator-(const FieldElement& rhs) const;
    [[nodiscard]] FieldElement operator*(const FieldElement& rhs) const;
    [[nodiscard]] FieldElement operator-() const;

    [[nodiscard]] bool operator==(const FieldElement& rhs) const;

    [[nodiscard]] FieldElement square() const { return *this * *this; }
    [[nodiscard]] FieldElement square_n(int n) const;

    // a^(p-2)
    [[nodiscard]] FieldElement invert() const;

    // a^((p-5)/8) = a^(2^252-3)
    [[nodiscard]] FieldElement pow_p58() const;

    // {root, true} when a square root exists, {zero, false} otherwise
    [[nodiscard]] std::pair<FieldElement, bool> sqrt() const;

    // Low bit of the canonical encoding
    [[nodiscard]] bool is_negative() const;
    [[nodiscard]] bool is_zero() const;

    [[nodiscard]] FieldElement conditional_negate(bool negate) const;

    // a if !flag, b if flag; branch free
    static FieldElement conditional_select(const FieldElement& a,
                                           const FieldElement& b,
                                           bool flag);

    static FieldElement zero();
    static FieldElement one();
    static FieldElement A();         // 486662, the Curve25519 coefficient
    static FieldElement sqrt_m1();   // sqrt(-1)

private:
    uint64_t limbs_[LIMBS];

    void carry();
    void reduce();
};

}  // namespace mixnet::crypto
