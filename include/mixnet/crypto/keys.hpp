#pragma once

#include <array>
#include <compare>
#include <cstdint>
#include <expected>
#include <functional>
#include <span>
#include <string>
#include <vector>

namespace mixnet::crypto {

constexpr size_t IDENTITY_KEY_LEN = 32;
constexpr size_t IDENTITY_SEED_LEN = 32;
constexpr size_t SIGNATURE_LEN = 64;
constexpr size_t X25519_KEY_LEN = 32;
constexpr size_t NODE_ID_LEN = 20;

using Signature = std::array<uint8_t, SIGNATURE_LEN>;
using SharedSecret = std::array<uint8_t, X25519_KEY_LEN>;

enum class KeyError {
    GenerationFailed,
    InvalidKeyLength,
    InvalidKey,
    SigningFailed,
    DerivationFailed,
    ParseError,
};

// Ed25519 public key; a relay's long-term identity
class IdentityPublicKey {
public:
    static constexpr size_t SIZE = IDENTITY_KEY_LEN;

    IdentityPublicKey() = default;
    explicit IdentityPublicKey(std::array<uint8_t, SIZE> data) : data_(data) {}

    [[nodiscard]] static std::expected<IdentityPublicKey, KeyError>
    from_bytes(std::span<const uint8_t> data);
    [[nodiscard]] static std::expected<IdentityPublicKey, KeyError>
    from_base64(const std::string& encoded);

    [[nodiscard]] const std::array<uint8_t, SIZE>& data() const { return data_; }
    [[nodiscard]] std::span<const uint8_t> as_span() const { return data_; }
    [[nodiscard]] std::string to_base64() const;

    [[nodiscard]] bool verify(
        std::span<const uint8_t> message,
        std::span<const uint8_t> signature
    ) const;

    bool operator==(const IdentityPublicKey&) const = default;

private:
    std::array<uint8_t, SIZE> data_{};
};

// Ed25519 signing key, stored as its 32-byte seed
class IdentitySecretKey {
public:
    IdentitySecretKey() = default;
    ~IdentitySecretKey();

    IdentitySecretKey(const IdentitySecretKey&) = delete;
    IdentitySecretKey& operator=(const IdentitySecretKey&) = delete;
    IdentitySecretKey(IdentitySecretKey&&) noexcept;
    IdentitySecretKey& operator=(IdentitySecretKey&&) noexcept;

    [[nodiscard]] static std::expected<IdentitySecretKey, KeyError> generate();
    [[nodiscard]] static std::expected<IdentitySecretKey, KeyError>
    from_seed(std::span<const uint8_t> seed);

    [[nodiscard]] const IdentityPublicKey& public_key() const { return public_key_; }
    [[nodiscard]] std::span<const uint8_t> seed() const { return seed_; }
    [[nodiscard]] bool valid() const { return initialized_; }

    [[nodiscard]] std::expected<Signature, KeyError>
    sign(std::span<const uint8_t> message) const;

private:
    std::array<uint8_t, IDENTITY_SEED_LEN> seed_{};
    IdentityPublicKey public_key_;
    bool initialized_{false};

    void clear();
};

// X25519 public key; used for onion layers and link handshakes
class OnionPublicKey {
public:
    static constexpr size_t SIZE = X25519_KEY_LEN;

    OnionPublicKey() = default;
    explicit OnionPublicKey(std::array<uint8_t, SIZE> data) : data_(data) {}

    [[nodiscard]] static std::expected<OnionPublicKey, KeyError>
    from_bytes(std::span<const uint8_t> data);
    [[nodiscard]] static std::expected<OnionPublicKey, KeyError>
    from_base64(const std::string& encoded);

    [[nodiscard]] const std::array<uint8_t, SIZE>& data() const { return data_; }
    [[nodiscard]] std::span<const uint8_t> as_span() const { return data_; }
    [[nodiscard]] std::string to_base64() const;

    // Small-subgroup points yield an all-zero or predictable shared secret
    [[nodiscard]] bool is_low_order() const;

    bool operator==(const OnionPublicKey&) const = default;

private:
    std::array<uint8_t, SIZE> data_{};
};

class OnionSecretKey {
public:
    static constexpr size_t SIZE = X25519_KEY_LEN;

    OnionSecretKey() = default;
    ~OnionSecretKey();

    OnionSecretKey(const OnionSecretKey&) = delete;
    OnionSecretKey& operator=(const OnionSecretKey&) = delete;
    OnionSecretKey(OnionSecretKey&&) noexcept;
    OnionSecretKey& operator=(OnionSecretKey&&) noexcept;

    [[nodiscard]] static std::expected<OnionSecretKey, KeyError> generate();
    [[nodiscard]] static std::expected<OnionSecretKey, KeyError>
    from_bytes(std::span<const uint8_t> data);

    [[nodiscard]] const OnionPublicKey& public_key() const { return public_key_; }
    [[nodiscard]] std::span<const uint8_t> as_bytes() const { return data_; }

    [[nodiscard]] std::expected<SharedSecret, KeyError>
    diffie_hellman(const OnionPublicKey& peer_public) const;

private:
    std::array<uint8_t, SIZE> data_{};
    OnionPublicKey public_key_;
    bool initialized_{false};

    void clear();
};

// Short relay identifier: SHA-256(identity key)[0..20]
class NodeId {
public:
    static constexpr size_t SIZE = NODE_ID_LEN;

    NodeId() = default;
    explicit NodeId(std::array<uint8_t, SIZE> data) : data_(data) {}
    explicit NodeId(const IdentityPublicKey& identity_key);

    [[nodiscard]] static std::expected<NodeId, KeyError>
    from_bytes(std::span<const uint8_t> data);
    [[nodiscard]] static std::expected<NodeId, KeyError>
    from_hex(const std::string& hex);

    [[nodiscard]] const std::array<uint8_t, SIZE>& data() const { return data_; }
    [[nodiscard]] std::span<const uint8_t> as_span() const { return data_; }
    [[nodiscard]] std::string to_hex() const;
    [[nodiscard]] std::string short_hex() const;  // first 4 bytes, for logs
    [[nodiscard]] bool is_zero() const;

    auto operator<=>(const NodeId&) const = default;
    bool operator==(const NodeId&) const = default;

private:
    std::array<uint8_t, SIZE> data_{};
};

// Long-term keys of one node
struct NodeKeys {
    IdentitySecretKey identity;
    OnionSecretKey onion;

    [[nodiscard]] static std::expected<NodeKeys, KeyError> generate();
    [[nodiscard]] NodeId node_id() const { return NodeId(identity.public_key()); }
};

[[nodiscard]] std::string key_error_message(KeyError err);

void secure_zero(void* ptr, size_t len);

// Throws std::runtime_error if the CSPRNG fails
[[nodiscard]] std::vector<uint8_t> random_bytes(size_t len);
void random_fill(std::span<uint8_t> out);
[[nodiscard]] uint64_t random_u64();

}  // namespace mixnet::crypto

namespace std {
template<>
struct hash<mixnet::crypto::NodeId> {
    size_t operator()(const mixnet::crypto::NodeId& id) const noexcept {
        // Ids are already uniformly distributed
        size_t h = 0;
        const auto& d = id.data();
        for (size_t i = 0; i < sizeof(size_t) && i < d.size(); ++i) {
            h = (h << 8) | d[i];
        }
        return h;
    }
};
}  // namespace std
