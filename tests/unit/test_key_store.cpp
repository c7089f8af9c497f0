#include <catch2/catch_all.hpp>
#include "mixnet/crypto/key_store.hpp"
#include "../fixtures/node_fixtures.hpp"
#include <filesystem>
#include <fstream>
#include <iterator>
#include <vector>

using namespace mixnet::crypto;
using mixnet::test::TempDir;
namespace fs = std::filesystem;

namespace {

constexpr const char* IDENTITY_FILE = "identity_ed25519.key";
constexpr const char* ONION_FILE = "onion_x25519.key";
constexpr size_t KEY_FILE_LEN = 8 + 1 + 32 + 8;

std::vector<uint8_t> read_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    return {std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
}

void write_file(const fs::path& path, const std::vector<uint8_t>& data) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    file.write(reinterpret_cast<const char*>(data.data()),
               static_cast<std::streamsize>(data.size()));
}

}  // namespace

TEST_CASE("KeyStore generates keys on first run", "[crypto][keystore][unit]") {
    TempDir tmp;
    KeyStore store(tmp.path);

    auto result = store.load_or_generate();
    REQUIRE(result.has_value());

    CHECK(store.keys_dir() == tmp.path / "keys");
    CHECK(fs::exists(tmp.path / "keys" / IDENTITY_FILE));
    CHECK(fs::exists(tmp.path / "keys" / ONION_FILE));
    CHECK(fs::file_size(tmp.path / "keys" / IDENTITY_FILE) == KEY_FILE_LEN);
    CHECK(fs::file_size(tmp.path / "keys" / ONION_FILE) == KEY_FILE_LEN);
}

TEST_CASE("KeyStore loads existing keys", "[crypto][keystore][unit]") {
    TempDir tmp;

    NodeId first_id;
    OnionPublicKey first_onion;
    {
        KeyStore store(tmp.path);
        auto result = store.load_or_generate();
        REQUIRE(result.has_value());
        first_id = result->node_id();
        first_onion = result->onion.public_key();
    }

    {
        KeyStore store(tmp.path);
        auto result = store.load_or_generate();
        REQUIRE(result.has_value());
        CHECK(result->node_id() == first_id);
        CHECK(result->onion.public_key() == first_onion);
    }
}

TEST_CASE("KeyStore refuses a corrupt identity key", "[crypto][keystore][unit]") {
    TempDir tmp;
    {
        KeyStore store(tmp.path);
        REQUIRE(store.load_or_generate().has_value());
    }
    auto path = tmp.path / "keys" / IDENTITY_FILE;
    auto data = read_file(path);
    REQUIRE(data.size() == KEY_FILE_LEN);

    SECTION("Flipped key byte") {
        data[12] ^= 0x01;
        write_file(path, data);
    }

    SECTION("Truncated") {
        data.resize(20);
        write_file(path, data);
    }

    SECTION("Wrong kind") {
        data[8] = 0x02;
        write_file(path, data);
    }

    KeyStore store(tmp.path);
    auto result = store.load_or_generate();
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error() == KeyStoreError::CorruptIdentityKey);

    // The damaged file is left for the operator
    CHECK(fs::file_size(path) == data.size());
}

TEST_CASE("KeyStore refuses a corrupt onion key", "[crypto][keystore][unit]") {
    TempDir tmp;
    {
        KeyStore store(tmp.path);
        REQUIRE(store.load_or_generate().has_value());
    }
    auto path = tmp.path / "keys" / ONION_FILE;
    auto data = read_file(path);
    data.back() ^= 0xff;
    write_file(path, data);

    KeyStore store(tmp.path);
    auto result = store.load_or_generate();
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error() == KeyStoreError::CorruptOnionKey);
}

TEST_CASE("KeyStore writes the peer line", "[crypto][keystore][unit]") {
    TempDir tmp;
    KeyStore store(tmp.path);
    auto keys = store.load_or_generate();
    REQUIRE(keys.has_value());

    REQUIRE(store.write_peer_line("alpha", "127.0.0.1:7400", *keys).has_value());

    std::ifstream file(tmp.path / "peer_line");
    REQUIRE(file.is_open());
    std::string comment, entry;
    std::getline(file, comment);
    std::getline(file, entry);

    CHECK(comment == "# node id " + keys->node_id().to_hex());
    CHECK(entry.starts_with("alpha = \"127.0.0.1:7400 "));
    CHECK(entry.find(keys->identity.public_key().to_base64()) != std::string::npos);
    CHECK(entry.find(keys->onion.public_key().to_base64()) != std::string::npos);
}

TEST_CASE("KeyStore sets secure permissions", "[crypto][keystore][unit]") {
    TempDir tmp;
    KeyStore store(tmp.path);
    REQUIRE(store.load_or_generate().has_value());

    auto identity_perms = fs::status(tmp.path / "keys" / IDENTITY_FILE).permissions();
    auto onion_perms = fs::status(tmp.path / "keys" / ONION_FILE).permissions();

    auto expected = fs::perms::owner_read | fs::perms::owner_write;
    CHECK(identity_perms == expected);
    CHECK(onion_perms == expected);
}

TEST_CASE("KeyStore handles missing directory gracefully", "[crypto][keystore][unit]") {
    TempDir tmp;
    auto nested = tmp.path / "deeply" / "nested" / "data";

    KeyStore store(nested);
    REQUIRE(store.load_or_generate().has_value());
    CHECK(fs::exists(nested / "keys" / IDENTITY_FILE));
}

TEST_CASE("Key store error messages", "[crypto][keystore][unit]") {
    CHECK(key_store_error_message(KeyStoreError::CorruptIdentityKey) ==
          "Identity key file is corrupt");
}
