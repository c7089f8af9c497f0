#include "mixnet/crypto/hash.hpp"
#include <openssl/core_names.h>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <bit>

namespace mixnet::crypto {

namespace {

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
struct MacDeleter {
    void operator()(EVP_MAC* mac) const { EVP_MAC_free(mac); }
};
struct MacCtxDeleter {
    void operator()(EVP_MAC_CTX* ctx) const { EVP_MAC_CTX_free(ctx); }
};
struct KdfCtxDeleter {
    void operator()(EVP_KDF_CTX* ctx) const { EVP_KDF_CTX_free(ctx); }
};

using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;
using MacCtxPtr = std::unique_ptr<EVP_MAC_CTX, MacCtxDeleter>;

}  // namespace

// Sha256

struct Sha256::Impl {
    MdCtxPtr ctx{EVP_MD_CTX_new()};
    bool ready{false};

    Impl() {
        ready = ctx && EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) == 1;
    }
};

Sha256::Sha256() : impl_(std::make_unique<Impl>()) {}
Sha256::~Sha256() = default;
Sha256::Sha256(Sha256&&) noexcept = default;
Sha256& Sha256::operator=(Sha256&&) noexcept = default;

std::expected<void, HashError> Sha256::update(std::span<const uint8_t> data) {
    if (!impl_ || !impl_->ready) {
        return std::unexpected(HashError::OpenSSLError);
    }
    if (EVP_DigestUpdate(impl_->ctx.get(), data.data(), data.size()) != 1) {
        return std::unexpected(HashError::UpdateFailed);
    }
    return {};
}

std::expected<Digest, HashError> Sha256::finalize() {
    if (!impl_ || !impl_->ready) {
        return std::unexpected(HashError::OpenSSLError);
    }
    Digest out{};
    unsigned int len = out.size();
    if (EVP_DigestFinal_ex(impl_->ctx.get(), out.data(), &len) != 1) {
        return std::unexpected(HashError::FinalizeFailed);
    }
    impl_->ready = EVP_DigestInit_ex(impl_->ctx.get(), EVP_sha256(), nullptr) == 1;
    return out;
}

std::expected<Digest, HashError> Sha256::peek() const {
    if (!impl_ || !impl_->ready) {
        return std::unexpected(HashError::OpenSSLError);
    }
    MdCtxPtr copy(EVP_MD_CTX_new());
    if (!copy || EVP_MD_CTX_copy_ex(copy.get(), impl_->ctx.get()) != 1) {
        return std::unexpected(HashError::OpenSSLError);
    }
    Digest out{};
    unsigned int len = out.size();
    if (EVP_DigestFinal_ex(copy.get(), out.data(), &len) != 1) {
        return std::unexpected(HashError::FinalizeFailed);
    }
    return out;
}

// HmacSha256

struct HmacSha256::Impl {
    std::unique_ptr<EVP_MAC, MacDeleter> mac{EVP_MAC_fetch(nullptr, "HMAC", nullptr)};
    MacCtxPtr ctx;
};

HmacSha256::HmacSha256() : impl_(std::make_unique<Impl>()) {}
HmacSha256::~HmacSha256() = default;
HmacSha256::HmacSha256(HmacSha256&&) noexcept = default;
HmacSha256& HmacSha256::operator=(HmacSha256&&) noexcept = default;

std::expected<void, HashError> HmacSha256::init(std::span<const uint8_t> key) {
    if (!impl_ || !impl_->mac) {
        return std::unexpected(HashError::OpenSSLError);
    }
    impl_->ctx.reset(EVP_MAC_CTX_new(impl_->mac.get()));
    if (!impl_->ctx) {
        return std::unexpected(HashError::OpenSSLError);
    }

    OSSL_PARAM params[2];
    params[0] = OSSL_PARAM_construct_utf8_string(
        OSSL_MAC_PARAM_DIGEST, const_cast<char*>("SHA256"), 0);
    params[1] = OSSL_PARAM_construct_end();

    // A zero-length key still needs a valid pointer
    static const uint8_t empty_key = 0;
    const uint8_t* key_ptr = key.empty() ? &empty_key : key.data();
    if (EVP_MAC_init(impl_->ctx.get(), key_ptr, key.size(), params) != 1) {
        impl_->ctx.reset();
        return std::unexpected(HashError::OpenSSLError);
    }
    return {};
}

std::expected<void, HashError> HmacSha256::update(std::span<const uint8_t> data) {
    if (!impl_ || !impl_->ctx) {
        return std::unexpected(HashError::OpenSSLError);
    }
    if (EVP_MAC_update(impl_->ctx.get(), data.data(), data.size()) != 1) {
        return std::unexpected(HashError::UpdateFailed);
    }
    return {};
}

std::expected<Digest, HashError> HmacSha256::finalize() {
    if (!impl_ || !impl_->ctx) {
        return std::unexpected(HashError::OpenSSLError);
    }
    Digest out{};
    size_t len = out.size();
    auto rc = EVP_MAC_final(impl_->ctx.get(), out.data(), &len, out.size());
    impl_->ctx.reset();
    if (rc != 1) {
        return std::unexpected(HashError::FinalizeFailed);
    }
    return out;
}

// One-shot helpers

std::expected<Digest, HashError> sha256(std::span<const uint8_t> data) {
    Digest out{};
    unsigned int len = out.size();
    if (EVP_Digest(data.data(), data.size(), out.data(), &len, EVP_sha256(), nullptr) != 1) {
        return std::unexpected(HashError::OpenSSLError);
    }
    return out;
}

std::expected<Digest, HashError>
hmac_sha256(std::span<const uint8_t> key, std::span<const uint8_t> data) {
    HmacSha256 mac;
    if (auto r = mac.init(key); !r) {
        return std::unexpected(r.error());
    }
    if (auto r = mac.update(data); !r) {
        return std::unexpected(r.error());
    }
    return mac.finalize();
}

std::expected<std::vector<uint8_t>, HashError>
hkdf_sha256(
    std::span<const uint8_t> salt,
    std::span<const uint8_t> ikm,
    std::span<const uint8_t> info,
    size_t length
) {
    EVP_KDF* kdf = EVP_KDF_fetch(nullptr, "HKDF", nullptr);
    if (!kdf) {
        return std::unexpected(HashError::OpenSSLError);
    }
    std::unique_ptr<EVP_KDF_CTX, KdfCtxDeleter> ctx(EVP_KDF_CTX_new(kdf));
    EVP_KDF_free(kdf);
    if (!ctx) {
        return std::unexpected(HashError::OpenSSLError);
    }

    // OpenSSL rejects NULL octet-string params even at length 0
    uint8_t dummy = 0;
    auto octets = [&](std::span<const uint8_t> s) -> void* {
        return s.empty() ? static_cast<void*>(&dummy)
                         : const_cast<uint8_t*>(s.data());
    };

    OSSL_PARAM params[5];
    params[0] = OSSL_PARAM_construct_utf8_string(
        OSSL_KDF_PARAM_DIGEST, const_cast<char*>("SHA256"), 0);
    params[1] = OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_KEY, octets(ikm), ikm.size());
    params[2] = OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_SALT, octets(salt), salt.size());
    params[3] = OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_INFO, octets(info), info.size());
    params[4] = OSSL_PARAM_construct_end();

    std::vector<uint8_t> output(length);
    if (EVP_KDF_derive(ctx.get(), output.data(), output.size(), params) <= 0) {
        return std::unexpected(HashError::OpenSSLError);
    }
    return output;
}

// Encodings

std::string to_hex(std::span<const uint8_t> data) {
    static constexpr char digits[] = "0123456789abcdef";
    std::string out(data.size() * 2, '0');
    for (size_t i = 0; i < data.size(); ++i) {
        out[2 * i] = digits[data[i] >> 4];
        out[2 * i + 1] = digits[data[i] & 0x0f];
    }
    return out;
}

std::expected<std::vector<uint8_t>, HashError> from_hex(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        return std::unexpected(HashError::InvalidEncoding);
    }
    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };

    std::vector<uint8_t> out(hex.size() / 2);
    for (size_t i = 0; i < out.size(); ++i) {
        int hi = nibble(hex[2 * i]);
        int lo = nibble(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            return std::unexpected(HashError::InvalidEncoding);
        }
        out[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return out;
}

std::string to_base64(std::span<const uint8_t> data) {
    std::string out(4 * ((data.size() + 2) / 3) + 1, '\0');
    int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                            data.data(), static_cast<int>(data.size()));
    out.resize(n < 0 ? 0 : static_cast<size_t>(n));
    return out;
}

std::expected<std::vector<uint8_t>, HashError> from_base64(const std::string& b64) {
    if (b64.empty()) {
        return std::vector<uint8_t>{};
    }
    if (b64.size() % 4 != 0) {
        return std::unexpected(HashError::InvalidEncoding);
    }
    std::vector<uint8_t> out(b64.size() / 4 * 3);
    int n = EVP_DecodeBlock(out.data(),
                            reinterpret_cast<const unsigned char*>(b64.data()),
                            static_cast<int>(b64.size()));
    if (n < 0) {
        return std::unexpected(HashError::InvalidEncoding);
    }
    // EVP_DecodeBlock keeps the bytes produced by '=' padding
    size_t padding = 0;
    if (b64.back() == '=') ++padding;
    if (b64.size() > 1 && b64[b64.size() - 2] == '=') ++padding;
    out.resize(static_cast<size_t>(n) - padding);
    return out;
}

std::string hash_error_message(HashError err) {
    switch (err) {
        case HashError::InvalidEncoding: return "Invalid encoding";
        case HashError::UpdateFailed: return "Hash update failed";
        case HashError::FinalizeFailed: return "Hash finalize failed";
        case HashError::OpenSSLError: return "OpenSSL error";
        default: return "Unknown hash error";
    }
}

bool constant_time_compare(
    std::span<const uint8_t> a,
    std::span<const uint8_t> b
) {
    if (a.size() != b.size()) {
        return false;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

unsigned leading_zero_bits(std::span<const uint8_t> data) {
    unsigned bits = 0;
    for (uint8_t byte : data) {
        if (byte == 0) {
            bits += 8;
            continue;
        }
        bits += static_cast<unsigned>(std::countl_zero(byte));
        break;
    }
    return bits;
}

}  // namespace mixnet::crypto
