#include "mixnet/topology/topology_file.hpp"
#include "mixnet/crypto/hash.hpp"
#include "mixnet/util/logging.hpp"
#include <fstream>
#include <sstream>
#include <system_error>
#include <vector>

namespace mixnet::topology {

namespace {

constexpr std::string_view IDENTITY_TAG = "identity";
constexpr std::string_view RECORD_TAG = "record";

bool expired(uint64_t stamp, std::chrono::seconds ttl, uint64_t now) {
    return stamp + static_cast<uint64_t>(ttl.count()) < now;
}

}  // namespace

std::string topology_file_error_message(TopologyFileError err) {
    switch (err) {
        case TopologyFileError::IoError: return "Topology file I/O error";
        default: return "Unknown topology file error";
    }
}

std::expected<void, TopologyFileError>
save_topology(const TopologyStore& store, const std::filesystem::path& path) {
    auto snap = store.snapshot();
    auto records = store.records();

    auto tmp = path;
    tmp += ".tmp";
    {
        std::ofstream file(tmp, std::ios::trunc);
        if (!file.is_open()) {
            LOG_WARN("Cannot write relay graph to {}", tmp.string());
            return std::unexpected(TopologyFileError::IoError);
        }
        file << "# relay graph, generation " << snap->generation << '\n';
        for (const auto& [id, relay] : snap->relays) {
            file << IDENTITY_TAG << ' ' << crypto::to_base64(relay.serialize()) << '\n';
        }
        for (const auto& record : records) {
            file << RECORD_TAG << ' ' << crypto::to_base64(record.serialize()) << '\n';
        }
        file.flush();
        if (!file) {
            return std::unexpected(TopologyFileError::IoError);
        }
    }
    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        LOG_WARN("Cannot replace relay graph {}: {}", path.string(), ec.message());
        return std::unexpected(TopologyFileError::IoError);
    }
    LOG_DEBUG("Saved {} relay(s) and {} record(s) to {}",
              snap->relays.size(), records.size(), path.string());
    return {};
}

std::expected<TopologyLoadResult, TopologyFileError>
load_topology(TopologyStore& store, const std::filesystem::path& path, uint64_t now) {
    TopologyLoadResult result;
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return result;
    }
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(TopologyFileError::IoError);
    }

    const auto& ttl = store.config();
    std::vector<LinkStateRecord> records;
    size_t line_no = 0;
    std::string line;
    while (std::getline(file, line)) {
        ++line_no;
        if (line.empty() || line[0] == '#') continue;

        std::istringstream fields(line);
        std::string tag, b64;
        if (!(fields >> tag >> b64)) {
            LOG_WARN("Relay graph line {} is malformed, skipping", line_no);
            ++result.skipped;
            continue;
        }
        auto bytes = crypto::from_base64(b64);
        if (!bytes) {
            LOG_WARN("Relay graph line {} is not base64, skipping", line_no);
            ++result.skipped;
            continue;
        }

        if (tag == IDENTITY_TAG) {
            auto identity = core::RelayIdentity::parse(*bytes);
            if (!identity) {
                ++result.skipped;
                continue;
            }
            if (identity->node_id() == store.self() ||
                expired(identity->published_at, ttl.identity_ttl, now)) {
                ++result.skipped;
                continue;
            }
            auto inserted = store.insert_identity(*identity);
            if (!inserted) {
                LOG_DEBUG("Relay graph line {}: {}", line_no,
                          topology_error_message(inserted.error()));
                ++result.skipped;
                continue;
            }
            ++result.identities;
        } else if (tag == RECORD_TAG) {
            auto record = LinkStateRecord::parse(*bytes);
            if (!record) {
                ++result.skipped;
                continue;
            }
            records.push_back(std::move(*record));
        } else {
            LOG_WARN("Relay graph line {} has unknown kind '{}', skipping", line_no, tag);
            ++result.skipped;
        }
    }

    // Records need their announcer's identity, so they go in last
    for (const auto& record : records) {
        if (record.relay_id == store.self() || expired(record.timestamp, ttl.edge_ttl, now)) {
            ++result.skipped;
            continue;
        }
        auto merged = store.merge(record);
        if (!merged) {
            LOG_DEBUG("Relay graph record of {}: {}", record.relay_id.short_hex(),
                      topology_error_message(merged.error()));
            ++result.skipped;
            continue;
        }
        ++result.records;
    }

    LOG_DEBUG("Loaded {} relay(s) and {} record(s) from {}",
              result.identities, result.records, path.string());
    return result;
}

}  // namespace mixnet::topology
