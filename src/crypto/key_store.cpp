#include "mixnet/crypto/key_store.hpp"
#include "mixnet/crypto/hash.hpp"
#include <algorithm>
#include <fstream>
#include <iterator>
#include <vector>

namespace mixnet::crypto {

namespace {

constexpr const char* IDENTITY_KEY_FILE = "identity_ed25519.key";
constexpr const char* ONION_KEY_FILE = "onion_x25519.key";
constexpr const char* PEER_LINE_FILE = "peer_line";

constexpr std::array<uint8_t, 8> KEY_MAGIC = {'M', 'I', 'X', 'K', 'E', 'Y', '0', '1'};
constexpr uint8_t KIND_IDENTITY = 0x01;
constexpr uint8_t KIND_ONION = 0x02;
constexpr size_t RAW_KEY_LEN = 32;
constexpr size_t CHECK_LEN = 8;
constexpr size_t KEY_FILE_LEN = KEY_MAGIC.size() + 1 + RAW_KEY_LEN + CHECK_LEN;

enum class ReadStatus { Ok, Missing, Corrupt };

std::array<uint8_t, CHECK_LEN> checksum(std::span<const uint8_t> body) {
    std::array<uint8_t, CHECK_LEN> out{};
    if (auto d = sha256(body)) {
        std::copy_n(d->begin(), CHECK_LEN, out.begin());
    }
    return out;
}

ReadStatus read_key_file(const std::filesystem::path& path, uint8_t kind,
                         std::array<uint8_t, RAW_KEY_LEN>& out) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return ReadStatus::Missing;
    }
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return ReadStatus::Corrupt;
    }
    std::vector<uint8_t> data((std::istreambuf_iterator<char>(file)),
                              std::istreambuf_iterator<char>());
    if (data.size() != KEY_FILE_LEN ||
        !std::equal(KEY_MAGIC.begin(), KEY_MAGIC.end(), data.begin()) ||
        data[KEY_MAGIC.size()] != kind) {
        return ReadStatus::Corrupt;
    }

    auto body = std::span<const uint8_t>(data.data(), KEY_FILE_LEN - CHECK_LEN);
    auto expected_check = checksum(body);
    if (!constant_time_compare(expected_check,
                               std::span<const uint8_t>(data).subspan(KEY_FILE_LEN - CHECK_LEN))) {
        secure_zero(data.data(), data.size());
        return ReadStatus::Corrupt;
    }
    std::copy_n(data.begin() + KEY_MAGIC.size() + 1, RAW_KEY_LEN, out.begin());
    secure_zero(data.data(), data.size());
    return ReadStatus::Ok;
}

std::expected<void, KeyStoreError> write_key_file(const std::filesystem::path& path,
                                                  uint8_t kind,
                                                  std::span<const uint8_t> key) {
    std::vector<uint8_t> data(KEY_MAGIC.begin(), KEY_MAGIC.end());
    data.push_back(kind);
    data.insert(data.end(), key.begin(), key.end());
    auto check = checksum(data);
    data.insert(data.end(), check.begin(), check.end());

    auto tmp = path;
    tmp += ".tmp";
    {
        std::ofstream file(tmp, std::ios::binary | std::ios::trunc);
        if (!file) {
            return std::unexpected(KeyStoreError::IoError);
        }
        file.write(reinterpret_cast<const char*>(data.data()),
                   static_cast<std::streamsize>(data.size()));
        if (!file) {
            return std::unexpected(KeyStoreError::IoError);
        }
    }
    secure_zero(data.data(), data.size());

    std::error_code ec;
    std::filesystem::permissions(tmp,
        std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
        std::filesystem::perm_options::replace, ec);
    if (ec) {
        return std::unexpected(KeyStoreError::PermissionError);
    }
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        return std::unexpected(KeyStoreError::IoError);
    }
    return {};
}

}  // namespace

KeyStore::KeyStore(std::filesystem::path data_dir)
    : data_dir_(std::move(data_dir))
    , keys_dir_(data_dir_ / "keys") {}

std::expected<NodeKeys, KeyStoreError> KeyStore::load_or_generate() {
    std::error_code ec;
    std::filesystem::create_directories(keys_dir_, ec);
    if (ec) {
        return std::unexpected(KeyStoreError::IoError);
    }
    std::filesystem::permissions(keys_dir_, std::filesystem::perms::owner_all,
                                 std::filesystem::perm_options::replace, ec);
    if (ec) {
        return std::unexpected(KeyStoreError::PermissionError);
    }

    std::array<uint8_t, RAW_KEY_LEN> raw{};

    IdentitySecretKey identity;
    switch (read_key_file(keys_dir_ / IDENTITY_KEY_FILE, KIND_IDENTITY, raw)) {
        case ReadStatus::Corrupt:
            return std::unexpected(KeyStoreError::CorruptIdentityKey);
        case ReadStatus::Ok: {
            auto loaded = IdentitySecretKey::from_seed(raw);
            secure_zero(raw.data(), raw.size());
            if (!loaded) {
                return std::unexpected(KeyStoreError::CorruptIdentityKey);
            }
            identity = std::move(*loaded);
            break;
        }
        case ReadStatus::Missing: {
            auto generated = IdentitySecretKey::generate();
            if (!generated) {
                return std::unexpected(KeyStoreError::KeyGenerationFailed);
            }
            if (auto w = write_key_file(keys_dir_ / IDENTITY_KEY_FILE, KIND_IDENTITY,
                                        generated->seed()); !w) {
                return std::unexpected(w.error());
            }
            identity = std::move(*generated);
            break;
        }
    }

    OnionSecretKey onion;
    switch (read_key_file(keys_dir_ / ONION_KEY_FILE, KIND_ONION, raw)) {
        case ReadStatus::Corrupt:
            return std::unexpected(KeyStoreError::CorruptOnionKey);
        case ReadStatus::Ok: {
            auto loaded = OnionSecretKey::from_bytes(raw);
            secure_zero(raw.data(), raw.size());
            if (!loaded) {
                return std::unexpected(KeyStoreError::CorruptOnionKey);
            }
            onion = std::move(*loaded);
            break;
        }
        case ReadStatus::Missing: {
            auto generated = OnionSecretKey::generate();
            if (!generated) {
                return std::unexpected(KeyStoreError::KeyGenerationFailed);
            }
            if (auto w = write_key_file(keys_dir_ / ONION_KEY_FILE, KIND_ONION,
                                        generated->as_bytes()); !w) {
                return std::unexpected(w.error());
            }
            onion = std::move(*generated);
            break;
        }
    }

    return NodeKeys{std::move(identity), std::move(onion)};
}

std::expected<void, KeyStoreError>
KeyStore::write_peer_line(const std::string& nickname, const std::string& address,
                          const NodeKeys& keys) {
    std::error_code ec;
    std::filesystem::create_directories(data_dir_, ec);
    if (ec) {
        return std::unexpected(KeyStoreError::IoError);
    }

    std::ofstream file(data_dir_ / PEER_LINE_FILE, std::ios::trunc);
    if (!file) {
        return std::unexpected(KeyStoreError::IoError);
    }
    file << "# node id " << keys.node_id().to_hex() << "\n"
         << nickname << " = \"" << address << " "
         << keys.identity.public_key().to_base64() << " "
         << keys.onion.public_key().to_base64() << "\"\n";
    if (!file) {
        return std::unexpected(KeyStoreError::IoError);
    }
    return {};
}

std::string key_store_error_message(KeyStoreError err) {
    switch (err) {
        case KeyStoreError::IoError:             return "I/O error";
        case KeyStoreError::CorruptIdentityKey:  return "Identity key file is corrupt";
        case KeyStoreError::CorruptOnionKey:     return "Onion key file is corrupt";
        case KeyStoreError::PermissionError:     return "Permission error";
        case KeyStoreError::KeyGenerationFailed: return "Key generation failed";
        default:                                 return "Unknown key store error";
    }
}

}  // namespace mixnet::crypto
