#pragma once

#include <array>
#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace mixnet::crypto {

constexpr size_t AES_KEY_LEN = 16;
constexpr size_t AES_CTR_IV_LEN = 16;

enum class AesError {
    InvalidKeyLength,
    InvalidIvLength,
    NotInitialized,
    CipherFailed,
    OpenSSLError,
};

// AES-128-CTR keystream. Onion layers use a zero IV with a fresh key per hop;
// link frames use it to mask length fields.
class AesCtr128 {
public:
    AesCtr128();
    ~AesCtr128();

    AesCtr128(const AesCtr128&) = delete;
    AesCtr128& operator=(const AesCtr128&) = delete;
    AesCtr128(AesCtr128&&) noexcept;
    AesCtr128& operator=(AesCtr128&&) noexcept;

    [[nodiscard]] std::expected<void, AesError> init(
        std::span<const uint8_t> key,
        std::span<const uint8_t> iv
    );

    // Zero IV
    [[nodiscard]] std::expected<void, AesError> init(std::span<const uint8_t> key);

    // XOR the next keystream bytes into data (encrypt and decrypt alike)
    [[nodiscard]] std::expected<void, AesError> apply(std::span<uint8_t> data);

    [[nodiscard]] bool is_initialized() const { return initialized_; }

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    bool initialized_{false};
};

// First `length` bytes of the AES-128-CTR keystream under key with a zero IV
[[nodiscard]] std::expected<std::vector<uint8_t>, AesError>
aes_ctr_keystream(std::span<const uint8_t> key, size_t length);

[[nodiscard]] std::string aes_error_message(AesError err);

}  // namespace mixnet::crypto
