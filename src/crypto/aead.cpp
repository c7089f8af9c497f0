#include "mixnet/crypto/aead.hpp"
#include <openssl/evp.h>
#include <algorithm>
#include <memory>

namespace mixnet::crypto {

namespace {

struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};
using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

std::expected<CipherCtxPtr, AeadError> make_ctx(
    bool encrypt,
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> aad
) {
    if (key.size() != AEAD_KEY_LEN) {
        return std::unexpected(AeadError::InvalidKeyLength);
    }
    if (nonce.size() != AEAD_NONCE_LEN) {
        return std::unexpected(AeadError::InvalidNonceLength);
    }
    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return std::unexpected(AeadError::OpenSSLError);
    }
    if (EVP_CipherInit_ex(ctx.get(), EVP_chacha20_poly1305(), nullptr,
                          nullptr, nullptr, encrypt ? 1 : 0) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_IVLEN,
                            static_cast<int>(AEAD_NONCE_LEN), nullptr) != 1 ||
        EVP_CipherInit_ex(ctx.get(), nullptr, nullptr,
                          key.data(), nonce.data(), encrypt ? 1 : 0) != 1) {
        return std::unexpected(AeadError::OpenSSLError);
    }
    if (!aad.empty()) {
        int len = 0;
        if (EVP_CipherUpdate(ctx.get(), nullptr, &len,
                             aad.data(), static_cast<int>(aad.size())) != 1) {
            return std::unexpected(AeadError::OpenSSLError);
        }
    }
    return ctx;
}

}  // namespace

std::expected<std::vector<uint8_t>, AeadError>
aead_seal(std::span<const uint8_t> key,
          std::span<const uint8_t> nonce,
          std::span<const uint8_t> plaintext,
          std::span<const uint8_t> aad) {
    auto ctx = make_ctx(true, key, nonce, aad);
    if (!ctx) {
        return std::unexpected(ctx.error());
    }

    std::vector<uint8_t> out(plaintext.size() + AEAD_TAG_LEN);
    int len = 0;
    if (!plaintext.empty() &&
        EVP_EncryptUpdate(ctx->get(), out.data(), &len,
                          plaintext.data(), static_cast<int>(plaintext.size())) != 1) {
        return std::unexpected(AeadError::OpenSSLError);
    }
    int final_len = 0;
    if (EVP_EncryptFinal_ex(ctx->get(), out.data() + len, &final_len) != 1) {
        return std::unexpected(AeadError::OpenSSLError);
    }
    if (EVP_CIPHER_CTX_ctrl(ctx->get(), EVP_CTRL_AEAD_GET_TAG,
                            static_cast<int>(AEAD_TAG_LEN),
                            out.data() + plaintext.size()) != 1) {
        return std::unexpected(AeadError::OpenSSLError);
    }
    return out;
}

std::expected<std::vector<uint8_t>, AeadError>
aead_open(std::span<const uint8_t> key,
          std::span<const uint8_t> nonce,
          std::span<const uint8_t> sealed,
          std::span<const uint8_t> aad) {
    if (sealed.size() < AEAD_TAG_LEN) {
        return std::unexpected(AeadError::TooShort);
    }
    auto ctx = make_ctx(false, key, nonce, aad);
    if (!ctx) {
        return std::unexpected(ctx.error());
    }

    auto body = sealed.first(sealed.size() - AEAD_TAG_LEN);
    std::array<uint8_t, AEAD_TAG_LEN> tag{};
    std::copy(sealed.end() - AEAD_TAG_LEN, sealed.end(), tag.begin());

    std::vector<uint8_t> out(body.size());
    int len = 0;
    if (!body.empty() &&
        EVP_DecryptUpdate(ctx->get(), out.data(), &len,
                          body.data(), static_cast<int>(body.size())) != 1) {
        return std::unexpected(AeadError::OpenSSLError);
    }
    if (EVP_CIPHER_CTX_ctrl(ctx->get(), EVP_CTRL_AEAD_SET_TAG,
                            static_cast<int>(tag.size()), tag.data()) != 1) {
        return std::unexpected(AeadError::OpenSSLError);
    }
    int final_len = 0;
    if (EVP_DecryptFinal_ex(ctx->get(), out.data() + len, &final_len) != 1) {
        return std::unexpected(AeadError::AuthenticationFailed);
    }
    return out;
}

AeadNonce make_counter_nonce(std::span<const uint8_t, 4> prefix, uint64_t counter) {
    AeadNonce nonce{};
    std::copy(prefix.begin(), prefix.end(), nonce.begin());
    for (int i = 0; i < 8; ++i) {
        nonce[4 + i] = static_cast<uint8_t>(counter >> (56 - 8 * i));
    }
    return nonce;
}

std::string aead_error_message(AeadError err) {
    switch (err) {
        case AeadError::InvalidKeyLength: return "Invalid AEAD key length";
        case AeadError::InvalidNonceLength: return "Invalid AEAD nonce length";
        case AeadError::TooShort: return "Sealed message shorter than tag";
        case AeadError::AuthenticationFailed: return "AEAD authentication failed";
        case AeadError::OpenSSLError: return "OpenSSL error";
        default: return "Unknown AEAD error";
    }
}

}  // namespace mixnet::crypto
