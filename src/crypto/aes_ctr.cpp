#include "mixnet/crypto/aes_ctr.hpp"
#include <openssl/evp.h>
#include <algorithm>
#include <climits>

namespace mixnet::crypto {

struct AesCtr128::Impl {
    struct CtxDeleter {
        void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
    };
    std::unique_ptr<EVP_CIPHER_CTX, CtxDeleter> ctx{EVP_CIPHER_CTX_new()};
};

AesCtr128::AesCtr128() : impl_(std::make_unique<Impl>()) {}
AesCtr128::~AesCtr128() = default;
AesCtr128::AesCtr128(AesCtr128&&) noexcept = default;
AesCtr128& AesCtr128::operator=(AesCtr128&&) noexcept = default;

std::expected<void, AesError> AesCtr128::init(
    std::span<const uint8_t> key,
    std::span<const uint8_t> iv
) {
    if (key.size() != AES_KEY_LEN) {
        return std::unexpected(AesError::InvalidKeyLength);
    }
    if (iv.size() != AES_CTR_IV_LEN) {
        return std::unexpected(AesError::InvalidIvLength);
    }
    if (!impl_ || !impl_->ctx) {
        return std::unexpected(AesError::OpenSSLError);
    }
    if (EVP_EncryptInit_ex(impl_->ctx.get(), EVP_aes_128_ctr(), nullptr,
                           key.data(), iv.data()) != 1) {
        initialized_ = false;
        return std::unexpected(AesError::OpenSSLError);
    }
    initialized_ = true;
    return {};
}

std::expected<void, AesError> AesCtr128::init(std::span<const uint8_t> key) {
    std::array<uint8_t, AES_CTR_IV_LEN> zero_iv{};
    return init(key, zero_iv);
}

std::expected<void, AesError> AesCtr128::apply(std::span<uint8_t> data) {
    if (!initialized_) {
        return std::unexpected(AesError::NotInitialized);
    }
    // EVP_EncryptUpdate takes an int length
    size_t offset = 0;
    while (offset < data.size()) {
        auto chunk = std::min<size_t>(data.size() - offset, INT_MAX / 2);
        int out_len = 0;
        if (EVP_EncryptUpdate(impl_->ctx.get(), data.data() + offset, &out_len,
                              data.data() + offset, static_cast<int>(chunk)) != 1) {
            return std::unexpected(AesError::CipherFailed);
        }
        offset += chunk;
    }
    return {};
}

std::expected<std::vector<uint8_t>, AesError>
aes_ctr_keystream(std::span<const uint8_t> key, size_t length) {
    AesCtr128 cipher;
    if (auto r = cipher.init(key); !r) {
        return std::unexpected(r.error());
    }
    std::vector<uint8_t> stream(length, 0);
    if (auto r = cipher.apply(stream); !r) {
        return std::unexpected(r.error());
    }
    return stream;
}

std::string aes_error_message(AesError err) {
    switch (err) {
        case AesError::InvalidKeyLength: return "Invalid AES key length";
        case AesError::InvalidIvLength: return "Invalid AES IV length";
        case AesError::NotInitialized: return "Cipher not initialized";
        case AesError::CipherFailed: return "AES-CTR operation failed";
        case AesError::OpenSSLError: return "OpenSSL error";
        default: return "Unknown AES error";
    }
}

}  // namespace mixnet::crypto
