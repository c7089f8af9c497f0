#include "mixnet/topology/link_state.hpp"

namespace mixnet::topology {

std::vector<uint8_t> LinkStateRecord::signed_bytes() const {
    util::BinaryWriter w(40 + edges.size() * 24);
    w.write_bytes(relay_id.as_span());
    w.write_u64(counter);
    w.write_u64(timestamp);
    w.write_u16(static_cast<uint16_t>(edges.size()));
    for (const auto& e : edges) {
        w.write_bytes(e.neighbor.as_span());
        w.write_u32(e.cost);
    }
    return w.take();
}

std::vector<uint8_t> LinkStateRecord::serialize() const {
    auto out = signed_bytes();
    out.insert(out.end(), signature.begin(), signature.end());
    return out;
}

bool LinkStateRecord::verify(const crypto::IdentityPublicKey& key) const {
    if (NodeId(key) != relay_id) {
        return false;
    }
    return key.verify(signed_bytes(), signature);
}

std::expected<LinkStateRecord, util::WireError>
LinkStateRecord::parse(std::span<const uint8_t> data) {
    util::BinaryReader r(data);
    LinkStateRecord rec;

    auto id = r.read_array<crypto::NODE_ID_LEN>();
    auto counter = r.read_u64();
    auto timestamp = r.read_u64();
    auto count = r.read_u16();
    if (!id || !counter || !timestamp || !count) {
        return std::unexpected(util::WireError::Truncated);
    }
    if (*count > MAX_ADVERTISED_EDGES) {
        return std::unexpected(util::WireError::InvalidLength);
    }
    rec.relay_id = NodeId(*id);
    rec.counter = *counter;
    rec.timestamp = *timestamp;

    rec.edges.reserve(*count);
    for (uint16_t i = 0; i < *count; ++i) {
        auto neighbor = r.read_array<crypto::NODE_ID_LEN>();
        auto cost = r.read_u32();
        if (!neighbor || !cost) {
            return std::unexpected(util::WireError::Truncated);
        }
        rec.edges.push_back(EdgeAdvert{NodeId(*neighbor), *cost});
    }

    auto sig = r.read_array<crypto::SIGNATURE_LEN>();
    if (!sig) {
        return std::unexpected(sig.error());
    }
    rec.signature = *sig;

    if (auto end = r.expect_end(); !end) {
        return std::unexpected(end.error());
    }
    return rec;
}

std::expected<LinkStateRecord, crypto::KeyError>
LinkStateRecord::create(const crypto::IdentitySecretKey& key,
                        uint64_t counter,
                        uint64_t timestamp,
                        std::vector<EdgeAdvert> edges) {
    LinkStateRecord rec;
    rec.relay_id = NodeId(key.public_key());
    rec.counter = counter;
    rec.timestamp = timestamp;
    rec.edges = std::move(edges);
    if (rec.edges.size() > MAX_ADVERTISED_EDGES) {
        rec.edges.resize(MAX_ADVERTISED_EDGES);
    }
    auto sig = key.sign(rec.signed_bytes());
    if (!sig) {
        return std::unexpected(sig.error());
    }
    rec.signature = *sig;
    return rec;
}

}  // namespace mixnet::topology
