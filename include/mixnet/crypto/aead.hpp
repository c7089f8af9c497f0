#pragma once

#include <array>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <vector>

namespace mixnet::crypto {

constexpr size_t AEAD_KEY_LEN = 32;
constexpr size_t AEAD_NONCE_LEN = 12;
constexpr size_t AEAD_TAG_LEN = 16;

using AeadKey = std::array<uint8_t, AEAD_KEY_LEN>;
using AeadNonce = std::array<uint8_t, AEAD_NONCE_LEN>;

enum class AeadError {
    InvalidKeyLength,
    InvalidNonceLength,
    TooShort,
    AuthenticationFailed,
    OpenSSLError,
};

// ChaCha20-Poly1305 (RFC 8439). Output is ciphertext || tag.
[[nodiscard]] std::expected<std::vector<uint8_t>, AeadError>
aead_seal(std::span<const uint8_t> key,
          std::span<const uint8_t> nonce,
          std::span<const uint8_t> plaintext,
          std::span<const uint8_t> aad = {});

[[nodiscard]] std::expected<std::vector<uint8_t>, AeadError>
aead_open(std::span<const uint8_t> key,
          std::span<const uint8_t> nonce,
          std::span<const uint8_t> sealed,
          std::span<const uint8_t> aad = {});

// Nonce = 4-byte prefix || 64-bit big-endian counter
[[nodiscard]] AeadNonce make_counter_nonce(std::span<const uint8_t, 4> prefix, uint64_t counter);

[[nodiscard]] std::string aead_error_message(AeadError err);

}  // namespace mixnet::crypto
