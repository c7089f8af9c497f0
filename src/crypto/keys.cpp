#include "mixnet/crypto/keys.hpp"
#include "mixnet/crypto/hash.hpp"
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <algorithm>
#include <memory>
#include <stdexcept>

namespace mixnet::crypto {

namespace {

struct PkeyDeleter {
    void operator()(EVP_PKEY* p) const { EVP_PKEY_free(p); }
};
struct PkeyCtxDeleter {
    void operator()(EVP_PKEY_CTX* p) const { EVP_PKEY_CTX_free(p); }
};
struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* p) const { EVP_MD_CTX_free(p); }
};

using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;
using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter>;
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

PkeyPtr keygen(int type) {
    PkeyCtxPtr ctx(EVP_PKEY_CTX_new_id(type, nullptr));
    if (!ctx || EVP_PKEY_keygen_init(ctx.get()) <= 0) {
        return nullptr;
    }
    EVP_PKEY* raw = nullptr;
    if (EVP_PKEY_keygen(ctx.get(), &raw) <= 0) {
        return nullptr;
    }
    return PkeyPtr(raw);
}

bool raw_public(EVP_PKEY* pkey, std::array<uint8_t, 32>& out) {
    size_t len = out.size();
    return EVP_PKEY_get_raw_public_key(pkey, out.data(), &len) == 1 && len == out.size();
}

bool raw_private(EVP_PKEY* pkey, std::array<uint8_t, 32>& out) {
    size_t len = out.size();
    return EVP_PKEY_get_raw_private_key(pkey, out.data(), &len) == 1 && len == out.size();
}

template <typename Array>
std::expected<Array, KeyError> fixed_bytes(std::span<const uint8_t> data) {
    Array out{};
    if (data.size() != out.size()) {
        return std::unexpected(KeyError::InvalidKeyLength);
    }
    std::copy(data.begin(), data.end(), out.begin());
    return out;
}

template <typename Array>
std::expected<Array, KeyError> fixed_from_base64(const std::string& encoded) {
    auto decoded = from_base64(encoded);
    if (!decoded) {
        return std::unexpected(KeyError::ParseError);
    }
    return fixed_bytes<Array>(*decoded);
}

}  // namespace

void secure_zero(void* ptr, size_t len) {
    OPENSSL_cleanse(ptr, len);
}

std::vector<uint8_t> random_bytes(size_t len) {
    std::vector<uint8_t> out(len);
    random_fill(out);
    return out;
}

void random_fill(std::span<uint8_t> out) {
    if (out.empty()) return;
    if (RAND_bytes(out.data(), static_cast<int>(out.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
}

uint64_t random_u64() {
    std::array<uint8_t, 8> b{};
    random_fill(b);
    uint64_t v = 0;
    for (auto x : b) v = (v << 8) | x;
    return v;
}

// IdentityPublicKey

std::expected<IdentityPublicKey, KeyError>
IdentityPublicKey::from_bytes(std::span<const uint8_t> data) {
    auto arr = fixed_bytes<std::array<uint8_t, SIZE>>(data);
    if (!arr) return std::unexpected(arr.error());
    return IdentityPublicKey(*arr);
}

std::expected<IdentityPublicKey, KeyError>
IdentityPublicKey::from_base64(const std::string& encoded) {
    auto arr = fixed_from_base64<std::array<uint8_t, SIZE>>(encoded);
    if (!arr) return std::unexpected(arr.error());
    return IdentityPublicKey(*arr);
}

std::string IdentityPublicKey::to_base64() const {
    return crypto::to_base64(data_);
}

bool IdentityPublicKey::verify(
    std::span<const uint8_t> message,
    std::span<const uint8_t> signature
) const {
    if (signature.size() != SIGNATURE_LEN) {
        return false;
    }
    PkeyPtr pkey(EVP_PKEY_new_raw_public_key(
        EVP_PKEY_ED25519, nullptr, data_.data(), data_.size()));
    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!pkey || !ctx) {
        return false;
    }
    if (EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) != 1) {
        return false;
    }
    return EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                            message.data(), message.size()) == 1;
}

// IdentitySecretKey

IdentitySecretKey::~IdentitySecretKey() {
    clear();
}

IdentitySecretKey::IdentitySecretKey(IdentitySecretKey&& other) noexcept
    : seed_(other.seed_), public_key_(other.public_key_),
      initialized_(other.initialized_) {
    other.clear();
}

IdentitySecretKey& IdentitySecretKey::operator=(IdentitySecretKey&& other) noexcept {
    if (this != &other) {
        clear();
        seed_ = other.seed_;
        public_key_ = other.public_key_;
        initialized_ = other.initialized_;
        other.clear();
    }
    return *this;
}

void IdentitySecretKey::clear() {
    secure_zero(seed_.data(), seed_.size());
    initialized_ = false;
}

std::expected<IdentitySecretKey, KeyError> IdentitySecretKey::generate() {
    auto pkey = keygen(EVP_PKEY_ED25519);
    if (!pkey) {
        return std::unexpected(KeyError::GenerationFailed);
    }
    std::array<uint8_t, IDENTITY_SEED_LEN> seed{};
    if (!raw_private(pkey.get(), seed)) {
        return std::unexpected(KeyError::GenerationFailed);
    }
    auto key = from_seed(seed);
    secure_zero(seed.data(), seed.size());
    return key;
}

std::expected<IdentitySecretKey, KeyError>
IdentitySecretKey::from_seed(std::span<const uint8_t> seed) {
    if (seed.size() != IDENTITY_SEED_LEN) {
        return std::unexpected(KeyError::InvalidKeyLength);
    }
    PkeyPtr pkey(EVP_PKEY_new_raw_private_key(
        EVP_PKEY_ED25519, nullptr, seed.data(), seed.size()));
    if (!pkey) {
        return std::unexpected(KeyError::InvalidKey);
    }
    std::array<uint8_t, IDENTITY_KEY_LEN> pub{};
    if (!raw_public(pkey.get(), pub)) {
        return std::unexpected(KeyError::DerivationFailed);
    }

    IdentitySecretKey key;
    std::copy(seed.begin(), seed.end(), key.seed_.begin());
    key.public_key_ = IdentityPublicKey(pub);
    key.initialized_ = true;
    return key;
}

std::expected<Signature, KeyError>
IdentitySecretKey::sign(std::span<const uint8_t> message) const {
    if (!initialized_) {
        return std::unexpected(KeyError::InvalidKey);
    }
    PkeyPtr pkey(EVP_PKEY_new_raw_private_key(
        EVP_PKEY_ED25519, nullptr, seed_.data(), seed_.size()));
    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!pkey || !ctx) {
        return std::unexpected(KeyError::SigningFailed);
    }

    Signature sig{};
    size_t sig_len = sig.size();
    if (EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) != 1 ||
        EVP_DigestSign(ctx.get(), sig.data(), &sig_len,
                       message.data(), message.size()) != 1) {
        return std::unexpected(KeyError::SigningFailed);
    }
    return sig;
}

// OnionPublicKey

std::expected<OnionPublicKey, KeyError>
OnionPublicKey::from_bytes(std::span<const uint8_t> data) {
    auto arr = fixed_bytes<std::array<uint8_t, SIZE>>(data);
    if (!arr) return std::unexpected(arr.error());
    return OnionPublicKey(*arr);
}

std::expected<OnionPublicKey, KeyError>
OnionPublicKey::from_base64(const std::string& encoded) {
    auto arr = fixed_from_base64<std::array<uint8_t, SIZE>>(encoded);
    if (!arr) return std::unexpected(arr.error());
    return OnionPublicKey(*arr);
}

std::string OnionPublicKey::to_base64() const {
    return crypto::to_base64(data_);
}

bool OnionPublicKey::is_low_order() const {
    static constexpr std::array<std::array<uint8_t, 32>, 5> low_order = {{
        {0},
        {1},
        {0xe0, 0xeb, 0x7a, 0x7c, 0x3b, 0x41, 0xb8, 0xae,
         0x16, 0x56, 0xe3, 0xfa, 0xf1, 0x9f, 0xc4, 0x6a,
         0xda, 0x09, 0x8d, 0xeb, 0x9c, 0x32, 0xb1, 0xfd,
         0x86, 0x62, 0x05, 0x16, 0x5f, 0x49, 0xb8, 0x00},
        {0x5f, 0x9c, 0x95, 0xbc, 0xa3, 0x50, 0x8c, 0x24,
         0xb1, 0xd0, 0xb1, 0x55, 0x9c, 0x83, 0xef, 0x5b,
         0x04, 0x44, 0x5c, 0xc4, 0x58, 0x1c, 0x8e, 0x86,
         0xd8, 0x22, 0x4e, 0xdd, 0xd0, 0x9f, 0x11, 0x57},
        {0xec, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
         0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
         0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
         0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0x7f},
    }};
    return std::find(low_order.begin(), low_order.end(), data_) != low_order.end();
}

// OnionSecretKey

OnionSecretKey::~OnionSecretKey() {
    clear();
}

OnionSecretKey::OnionSecretKey(OnionSecretKey&& other) noexcept
    : data_(other.data_), public_key_(other.public_key_),
      initialized_(other.initialized_) {
    other.clear();
}

OnionSecretKey& OnionSecretKey::operator=(OnionSecretKey&& other) noexcept {
    if (this != &other) {
        clear();
        data_ = other.data_;
        public_key_ = other.public_key_;
        initialized_ = other.initialized_;
        other.clear();
    }
    return *this;
}

void OnionSecretKey::clear() {
    secure_zero(data_.data(), data_.size());
    initialized_ = false;
}

std::expected<OnionSecretKey, KeyError> OnionSecretKey::generate() {
    auto pkey = keygen(EVP_PKEY_X25519);
    if (!pkey) {
        return std::unexpected(KeyError::GenerationFailed);
    }
    std::array<uint8_t, SIZE> raw{};
    if (!raw_private(pkey.get(), raw)) {
        return std::unexpected(KeyError::GenerationFailed);
    }
    auto key = from_bytes(raw);
    secure_zero(raw.data(), raw.size());
    return key;
}

std::expected<OnionSecretKey, KeyError>
OnionSecretKey::from_bytes(std::span<const uint8_t> data) {
    if (data.size() != SIZE) {
        return std::unexpected(KeyError::InvalidKeyLength);
    }
    PkeyPtr pkey(EVP_PKEY_new_raw_private_key(
        EVP_PKEY_X25519, nullptr, data.data(), data.size()));
    if (!pkey) {
        return std::unexpected(KeyError::InvalidKey);
    }
    std::array<uint8_t, SIZE> pub{};
    if (!raw_public(pkey.get(), pub)) {
        return std::unexpected(KeyError::DerivationFailed);
    }

    OnionSecretKey key;
    std::copy(data.begin(), data.end(), key.data_.begin());
    key.public_key_ = OnionPublicKey(pub);
    key.initialized_ = true;
    return key;
}

std::expected<SharedSecret, KeyError>
OnionSecretKey::diffie_hellman(const OnionPublicKey& peer_public) const {
    if (!initialized_ || peer_public.is_low_order()) {
        return std::unexpected(KeyError::InvalidKey);
    }

    PkeyPtr ours(EVP_PKEY_new_raw_private_key(
        EVP_PKEY_X25519, nullptr, data_.data(), data_.size()));
    PkeyPtr theirs(EVP_PKEY_new_raw_public_key(
        EVP_PKEY_X25519, nullptr, peer_public.data().data(), peer_public.data().size()));
    if (!ours || !theirs) {
        return std::unexpected(KeyError::DerivationFailed);
    }
    PkeyCtxPtr ctx(EVP_PKEY_CTX_new(ours.get(), nullptr));
    if (!ctx) {
        return std::unexpected(KeyError::DerivationFailed);
    }

    SharedSecret secret{};
    size_t len = secret.size();
    if (EVP_PKEY_derive_init(ctx.get()) != 1 ||
        EVP_PKEY_derive_set_peer(ctx.get(), theirs.get()) != 1 ||
        EVP_PKEY_derive(ctx.get(), secret.data(), &len) != 1) {
        return std::unexpected(KeyError::DerivationFailed);
    }
    return secret;
}

// NodeId

NodeId::NodeId(const IdentityPublicKey& identity_key) {
    auto digest = sha256(identity_key.as_span());
    if (digest) {
        std::copy_n(digest->begin(), SIZE, data_.begin());
    }
}

std::expected<NodeId, KeyError> NodeId::from_bytes(std::span<const uint8_t> data) {
    auto arr = fixed_bytes<std::array<uint8_t, SIZE>>(data);
    if (!arr) return std::unexpected(arr.error());
    return NodeId(*arr);
}

std::expected<NodeId, KeyError> NodeId::from_hex(const std::string& hex) {
    auto decoded = crypto::from_hex(hex);
    if (!decoded) {
        return std::unexpected(KeyError::ParseError);
    }
    return from_bytes(*decoded);
}

std::string NodeId::to_hex() const {
    return crypto::to_hex(data_);
}

std::string NodeId::short_hex() const {
    return crypto::to_hex(std::span<const uint8_t>(data_.data(), 4));
}

bool NodeId::is_zero() const {
    return std::all_of(data_.begin(), data_.end(), [](uint8_t b) { return b == 0; });
}

// NodeKeys

std::expected<NodeKeys, KeyError> NodeKeys::generate() {
    auto identity = IdentitySecretKey::generate();
    if (!identity) {
        return std::unexpected(identity.error());
    }
    auto onion = OnionSecretKey::generate();
    if (!onion) {
        return std::unexpected(onion.error());
    }
    return NodeKeys{std::move(*identity), std::move(*onion)};
}

std::string key_error_message(KeyError err) {
    switch (err) {
        case KeyError::GenerationFailed: return "Key generation failed";
        case KeyError::InvalidKeyLength: return "Invalid key length";
        case KeyError::InvalidKey: return "Invalid key";
        case KeyError::SigningFailed: return "Signing failed";
        case KeyError::DerivationFailed: return "Key derivation failed";
        case KeyError::ParseError: return "Parse error";
        default: return "Unknown key error";
    }
}

}  // namespace mixnet::crypto
