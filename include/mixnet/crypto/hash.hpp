#pragma once

#include <array>
#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace mixnet::crypto {

constexpr size_t SHA256_DIGEST_LEN = 32;

using Digest = std::array<uint8_t, SHA256_DIGEST_LEN>;

enum class HashError {
    InvalidEncoding,
    UpdateFailed,
    FinalizeFailed,
    OpenSSLError,
};

// Incremental SHA-256, used for handshake transcripts
class Sha256 {
public:
    Sha256();
    ~Sha256();

    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;
    Sha256(Sha256&&) noexcept;
    Sha256& operator=(Sha256&&) noexcept;

    [[nodiscard]] std::expected<void, HashError> update(std::span<const uint8_t> data);

    // Returns the digest and restarts the hash
    [[nodiscard]] std::expected<Digest, HashError> finalize();

    // Digest of everything so far without disturbing the running state
    [[nodiscard]] std::expected<Digest, HashError> peek() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// Incremental HMAC-SHA256 over several non-contiguous parts
class HmacSha256 {
public:
    HmacSha256();
    ~HmacSha256();

    HmacSha256(const HmacSha256&) = delete;
    HmacSha256& operator=(const HmacSha256&) = delete;
    HmacSha256(HmacSha256&&) noexcept;
    HmacSha256& operator=(HmacSha256&&) noexcept;

    [[nodiscard]] std::expected<void, HashError> init(std::span<const uint8_t> key);
    [[nodiscard]] std::expected<void, HashError> update(std::span<const uint8_t> data);
    [[nodiscard]] std::expected<Digest, HashError> finalize();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

[[nodiscard]] std::expected<Digest, HashError>
sha256(std::span<const uint8_t> data);

[[nodiscard]] std::expected<Digest, HashError>
hmac_sha256(std::span<const uint8_t> key, std::span<const uint8_t> data);

// HKDF-SHA256 (RFC 5869); empty salt is allowed
[[nodiscard]] std::expected<std::vector<uint8_t>, HashError>
hkdf_sha256(
    std::span<const uint8_t> salt,
    std::span<const uint8_t> ikm,
    std::span<const uint8_t> info,
    size_t length
);

[[nodiscard]] std::string to_hex(std::span<const uint8_t> data);
[[nodiscard]] std::expected<std::vector<uint8_t>, HashError> from_hex(const std::string& hex);

// Standard alphabet with padding, no line breaks
[[nodiscard]] std::string to_base64(std::span<const uint8_t> data);
[[nodiscard]] std::expected<std::vector<uint8_t>, HashError> from_base64(const std::string& b64);

[[nodiscard]] std::string hash_error_message(HashError err);

[[nodiscard]] bool constant_time_compare(
    std::span<const uint8_t> a,
    std::span<const uint8_t> b
);

// Number of leading zero bits, used to grade proof-of-work digests
[[nodiscard]] unsigned leading_zero_bits(std::span<const uint8_t> data);

inline std::span<const uint8_t> as_bytes(std::string_view s) {
    return {reinterpret_cast<const uint8_t*>(s.data()), s.size()};
}

}  // namespace mixnet::crypto
