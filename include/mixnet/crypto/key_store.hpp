#pragma once

#include "mixnet/crypto/keys.hpp"
#include <expected>
#include <filesystem>
#include <string>

namespace mixnet::crypto {

enum class KeyStoreError {
    IoError,
    CorruptIdentityKey,  // fatal at startup
    CorruptOnionKey,
    PermissionError,
    KeyGenerationFailed,
};

[[nodiscard]] std::string key_store_error_message(KeyStoreError err);

// Long-term keys under {data_dir}/keys. Each file is
//   magic(8) | kind(1) | key(32) | check(8)
// where check = SHA-256(magic | kind | key)[0..8].
class KeyStore {
public:
    explicit KeyStore(std::filesystem::path data_dir);

    // Loads existing keys, generating whatever is absent. A present but
    // unreadable identity key is reported as CorruptIdentityKey.
    [[nodiscard]] std::expected<NodeKeys, KeyStoreError> load_or_generate();

    // Writes "{data_dir}/peer_line": the [peers] entry other nodes need
    [[nodiscard]] std::expected<void, KeyStoreError>
    write_peer_line(const std::string& nickname, const std::string& address,
                    const NodeKeys& keys);

    [[nodiscard]] const std::filesystem::path& keys_dir() const { return keys_dir_; }

private:
    std::filesystem::path data_dir_;
    std::filesystem::path keys_dir_;
};

}  // namespace mixnet::crypto
