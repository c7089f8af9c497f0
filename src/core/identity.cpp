#include "mixnet/core/identity.hpp"
#include <algorithm>
#include <chrono>

namespace mixnet::core {

namespace {
constexpr size_t MAX_ADDRESSES = 8;
}

uint64_t unix_now() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
}

std::vector<uint8_t> RelayIdentity::signed_bytes() const {
    util::BinaryWriter w(128);
    w.write_bytes(identity_key.as_span());
    w.write_bytes(onion_key.as_span());
    w.write_u64(published_at);
    auto count = std::min(addresses.size(), MAX_ADDRESSES);
    w.write_u8(static_cast<uint8_t>(count));
    for (size_t i = 0; i < count; ++i) {
        w.write_u8_string(addresses[i]);
    }
    return w.take();
}

std::vector<uint8_t> RelayIdentity::serialize() const {
    auto out = signed_bytes();
    out.insert(out.end(), signature.begin(), signature.end());
    return out;
}

bool RelayIdentity::verify() const {
    return identity_key.verify(signed_bytes(), signature);
}

std::expected<RelayIdentity, util::WireError>
RelayIdentity::parse(std::span<const uint8_t> data) {
    util::BinaryReader r(data);
    RelayIdentity id;

    auto ik = r.read_array<crypto::IDENTITY_KEY_LEN>();
    if (!ik) return std::unexpected(ik.error());
    id.identity_key = crypto::IdentityPublicKey(*ik);

    auto ok = r.read_array<crypto::X25519_KEY_LEN>();
    if (!ok) return std::unexpected(ok.error());
    id.onion_key = crypto::OnionPublicKey(*ok);

    auto published = r.read_u64();
    if (!published) return std::unexpected(published.error());
    id.published_at = *published;

    auto count = r.read_u8();
    if (!count) return std::unexpected(count.error());
    if (*count > MAX_ADDRESSES) {
        return std::unexpected(util::WireError::InvalidLength);
    }
    for (uint8_t i = 0; i < *count; ++i) {
        auto addr = r.read_u8_string();
        if (!addr) return std::unexpected(addr.error());
        id.addresses.push_back(std::move(*addr));
    }

    auto sig = r.read_array<crypto::SIGNATURE_LEN>();
    if (!sig) return std::unexpected(sig.error());
    id.signature = *sig;

    if (auto end = r.expect_end(); !end) {
        return std::unexpected(end.error());
    }
    return id;
}

std::expected<RelayIdentity, crypto::KeyError>
RelayIdentity::create(const crypto::NodeKeys& keys,
                      std::vector<std::string> addresses,
                      uint64_t published_at) {
    RelayIdentity id;
    id.identity_key = keys.identity.public_key();
    id.onion_key = keys.onion.public_key();
    id.addresses = std::move(addresses);
    if (id.addresses.size() > MAX_ADDRESSES) {
        id.addresses.resize(MAX_ADDRESSES);
    }
    id.published_at = published_at;

    auto sig = keys.identity.sign(id.signed_bytes());
    if (!sig) {
        return std::unexpected(sig.error());
    }
    id.signature = *sig;
    return id;
}

}  // namespace mixnet::core
