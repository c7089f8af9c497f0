#include "mixnet/node/address_book.hpp"
#include "mixnet/crypto/hash.hpp"
#include "mixnet/util/logging.hpp"
#include <algorithm>
#include <charconv>
#include <fstream>
#include <sstream>
#include <system_error>

namespace mixnet::node {

std::string address_book_error_message(AddressBookError err) {
    switch (err) {
        case AddressBookError::IoError: return "Address book I/O error";
        case AddressBookError::ParseError: return "Address book parse error";
        default: return "Unknown address book error";
    }
}

// --- InMemoryAddressBook ---

std::optional<AddressEntry> InMemoryAddressBook::lookup(const NodeId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

void InMemoryAddressBook::insert(const core::RelayIdentity& identity, uint64_t last_seen) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto id = identity.node_id();
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        entries_.emplace(id, AddressEntry{.identity = identity, .last_seen = last_seen});
        return;
    }
    if (identity.published_at >= it->second.identity.published_at) {
        it->second.identity = identity;
    }
    it->second.last_seen = std::max(it->second.last_seen, last_seen);
}

bool InMemoryAddressBook::touch(const NodeId& id, uint64_t last_seen) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) return false;
    it->second.last_seen = std::max(it->second.last_seen, last_seen);
    return true;
}

std::vector<AddressEntry> InMemoryAddressBook::all() const {
    std::vector<AddressEntry> out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        out.reserve(entries_.size());
        for (const auto& [id, entry] : entries_) {
            out.push_back(entry);
        }
    }
    std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
        return a.identity.node_id() < b.identity.node_id();
    });
    return out;
}

size_t InMemoryAddressBook::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

// --- FileAddressBook ---

FileAddressBook::FileAddressBook(std::filesystem::path path)
    : path_(std::move(path)) {}

std::expected<size_t, AddressBookError> FileAddressBook::load() {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        return 0;
    }
    std::ifstream file(path_);
    if (!file.is_open()) {
        return std::unexpected(AddressBookError::IoError);
    }

    size_t loaded = 0;
    size_t line_no = 0;
    std::string line;
    while (std::getline(file, line)) {
        ++line_no;
        if (line.empty() || line[0] == '#') continue;

        std::istringstream fields(line);
        std::string seen_str, identity_b64;
        if (!(fields >> seen_str >> identity_b64)) {
            LOG_WARN("Address book line {} is malformed, skipping", line_no);
            continue;
        }
        uint64_t last_seen = 0;
        auto [ptr, err] = std::from_chars(seen_str.data(), seen_str.data() + seen_str.size(), last_seen);
        auto bytes = crypto::from_base64(identity_b64);
        if (err != std::errc() || !bytes) {
            LOG_WARN("Address book line {} is malformed, skipping", line_no);
            continue;
        }
        auto identity = core::RelayIdentity::parse(*bytes);
        if (!identity || !identity->verify()) {
            LOG_WARN("Address book line {} has an invalid identity, skipping", line_no);
            continue;
        }
        insert(*identity, last_seen);
        ++loaded;
    }
    LOG_DEBUG("Loaded {} relay(s) from {}", loaded, path_.string());
    return loaded;
}

std::expected<void, AddressBookError> FileAddressBook::save() const {
    auto entries = all();
    auto tmp = path_;
    tmp += ".tmp";
    {
        std::ofstream file(tmp, std::ios::trunc);
        if (!file.is_open()) {
            LOG_WARN("Cannot write address book to {}", tmp.string());
            return std::unexpected(AddressBookError::IoError);
        }
        file << "# last_seen identity\n";
        for (const auto& e : entries) {
            file << e.last_seen << ' ' << crypto::to_base64(e.identity.serialize()) << '\n';
        }
        file.flush();
        if (!file) {
            return std::unexpected(AddressBookError::IoError);
        }
    }
    std::error_code ec;
    std::filesystem::rename(tmp, path_, ec);
    if (ec) {
        LOG_WARN("Cannot replace address book {}: {}", path_.string(), ec.message());
        return std::unexpected(AddressBookError::IoError);
    }
    return {};
}

}  // namespace mixnet::node
