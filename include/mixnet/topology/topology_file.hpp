#pragma once

#include "mixnet/topology/topology_store.hpp"
#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>

namespace mixnet::topology {

enum class TopologyFileError {
    IoError,
};

[[nodiscard]] std::string topology_file_error_message(TopologyFileError err);

struct TopologyLoadResult {
    size_t identities{0};
    size_t records{0};
    size_t skipped{0};   // malformed, unverifiable or expired lines
};

// Writes every relay identity and the latest link-state record of each
// relay, one base64 entry per line. Replaces the file atomically.
//
//   identity <base64 RelayIdentity>
//   record <base64 LinkStateRecord>
[[nodiscard]] std::expected<void, TopologyFileError>
save_topology(const TopologyStore& store, const std::filesystem::path& path);

// Feeds a saved graph back through insert_identity() and merge(), so every
// signature is checked again. Our own entries and anything older than the
// store's TTLs at unix time `now` are skipped. A missing file loads nothing.
[[nodiscard]] std::expected<TopologyLoadResult, TopologyFileError>
load_topology(TopologyStore& store, const std::filesystem::path& path, uint64_t now);

}  // namespace mixnet::topology
