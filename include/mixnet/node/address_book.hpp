#pragma once

#include "mixnet/core/identity.hpp"
#include <cstdint>
#include <expected>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace mixnet::node {

using crypto::NodeId;

enum class AddressBookError {
    IoError,
    ParseError,
};

[[nodiscard]] std::string address_book_error_message(AddressBookError err);

struct AddressEntry {
    core::RelayIdentity identity;
    uint64_t last_seen{0};   // unix seconds
};

// Known relay identities and when we last heard from them
class AddressBook {
public:
    virtual ~AddressBook() = default;

    [[nodiscard]] virtual std::optional<AddressEntry> lookup(const NodeId& id) const = 0;

    // Keeps the identity with the newer published_at
    virtual void insert(const core::RelayIdentity& identity, uint64_t last_seen) = 0;

    // Returns false if id is unknown
    virtual bool touch(const NodeId& id, uint64_t last_seen) = 0;

    [[nodiscard]] virtual std::vector<AddressEntry> all() const = 0;
    [[nodiscard]] virtual size_t size() const = 0;
};

class InMemoryAddressBook : public AddressBook {
public:
    [[nodiscard]] std::optional<AddressEntry> lookup(const NodeId& id) const override;
    void insert(const core::RelayIdentity& identity, uint64_t last_seen) override;
    bool touch(const NodeId& id, uint64_t last_seen) override;
    [[nodiscard]] std::vector<AddressEntry> all() const override;
    [[nodiscard]] size_t size() const override;

protected:
    mutable std::mutex mutex_;
    std::unordered_map<NodeId, AddressEntry> entries_;
};

// Address book persisted as one "last_seen identity_b64" line per relay.
// save() writes a temporary file and renames it over the old one.
class FileAddressBook : public InMemoryAddressBook {
public:
    explicit FileAddressBook(std::filesystem::path path);

    // Returns the number of entries read; a missing file is an empty book.
    // Lines that fail to parse or verify are skipped.
    [[nodiscard]] std::expected<size_t, AddressBookError> load();
    [[nodiscard]] std::expected<void, AddressBookError> save() const;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

}  // namespace mixnet::node
