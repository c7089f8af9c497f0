#include <catch2/catch_all.hpp>
#include "mixnet/util/config.hpp"
#include "../fixtures/node_fixtures.hpp"
#include <fstream>

using namespace mixnet::util;
using mixnet::test::TempDir;
using mixnet::test::TestRelay;

namespace {

std::string peer_value(const TestRelay& relay, const std::string& address) {
    return address + " " + relay.keys.identity.public_key().to_base64() + " " +
           relay.keys.onion.public_key().to_base64();
}

}  // namespace

TEST_CASE("Default config", "[config][unit]") {
    auto config = default_config();

    SECTION("Has sensible defaults") {
        CHECK(config.node.listen_port == 7400);
        CHECK(config.routing.max_hops == 3);
        CHECK(config.admission.difficulty_bits == 8);
        CHECK(config.admission.scope == mixnet::policy::AdmissionScope::PerLink);
        CHECK(config.queue.policy == mixnet::policy::SchedulingPolicy::StrictPriority);
        CHECK(config.topology.edge_ttl == std::chrono::seconds(300));
        CHECK(config.peers.empty());
    }

    SECTION("Validates") {
        CHECK(config.validate().has_value());
    }
}

TEST_CASE("Config loads from TOML", "[config][unit]") {
    TestRelay peer;
    std::string toml =
        "# comment line\n"
        "[node]\n"
        "nickname = \"alpha\"   # trailing comment\n"
        "listen_port = 7501\n"
        "advertise = \"203.0.113.7:7501\"\n"
        "\n"
        "[routing]\n"
        "max_hops = 4\n"
        "\n"
        "[admission]\n"
        "difficulty_bits = 12\n"
        "scope = \"source\"\n"
        "rate = 200\n"
        "debt_limit = 5000\n"
        "\n"
        "[queue]\n"
        "capacity = 64\n"
        "policy = \"weighted\"\n"
        "\n"
        "[replay]\n"
        "epoch_slack = 2\n"
        "\n"
        "[link]\n"
        "backoff_initial_ms = 50\n"
        "\n"
        "[peers]\n"
        "beta = \"" + peer_value(peer, "198.51.100.4:7400") + "\"\n"
        "\n"
        "[logging]\n"
        "level = \"debug\"\n"
        "console = false\n";

    auto config = Config::load_from_string(toml);
    REQUIRE(config.has_value());

    CHECK(config->node.nickname == "alpha");
    CHECK(config->node.listen_port == 7501);
    REQUIRE(config->node.advertise.size() == 1);
    CHECK(config->node.advertise[0] == "203.0.113.7:7501");
    CHECK(config->routing.max_hops == 4);
    CHECK(config->admission.difficulty_bits == 12);
    CHECK(config->admission.scope == mixnet::policy::AdmissionScope::PerSourceIdentity);
    CHECK(config->admission.rate == 200);
    CHECK(config->admission.debt_limit == 5000);
    CHECK(config->queue.capacity == 64);
    CHECK(config->queue.policy == mixnet::policy::SchedulingPolicy::WeightedFair);
    CHECK(config->replay.epoch_slack == 2);
    CHECK(config->link.backoff_initial == std::chrono::milliseconds(50));
    CHECK(config->logging.level == "debug");
    CHECK_FALSE(config->logging.console);
    CHECK(config->validate().has_value());

    REQUIRE(config->peers.size() == 1);
    const auto& p = config->peers[0];
    CHECK(p.name == "beta");
    CHECK(p.address == "198.51.100.4:7400");
    CHECK(p.identity_key == peer.keys.identity.public_key());

    auto identity = p.to_identity();
    CHECK(identity.node_id() == peer.id());
    REQUIRE(identity.addresses.size() == 1);
    CHECK(identity.addresses[0] == "198.51.100.4:7400");
}

TEST_CASE("Config rejects bad values", "[config][unit]") {
    SECTION("Not a number") {
        auto r = Config::load_from_string("[node]\nlisten_port = many\n");
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error() == ConfigError::InvalidValue);
    }

    SECTION("Unknown admission scope") {
        CHECK_FALSE(Config::load_from_string("[admission]\nscope = \"planet\"\n").has_value());
    }

    SECTION("Unknown queue policy") {
        CHECK_FALSE(Config::load_from_string("[queue]\npolicy = \"random\"\n").has_value());
    }

    SECTION("Peer with a missing key") {
        CHECK_FALSE(Config::load_from_string("[peers]\nx = \"127.0.0.1:1 abc\"\n").has_value());
    }

    SECTION("Unterminated section header") {
        auto r = Config::load_from_string("[node\nnickname = \"x\"\n");
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error() == ConfigError::ParseError);
    }
}

TEST_CASE("Config validation", "[config][unit]") {
    Config config;

    SECTION("Hop bound") {
        config.routing.max_hops = 0;
        CHECK_FALSE(config.validate().has_value());
        config.routing.max_hops = 9;
        CHECK_FALSE(config.validate().has_value());
    }

    SECTION("Empty queue") {
        config.queue.capacity = 0;
        auto r = config.validate();
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error() == ConfigError::ValidationFailed);
    }

    SECTION("Backoff bounds") {
        config.link.backoff_max = std::chrono::milliseconds(1);
        CHECK_FALSE(config.validate().has_value());
    }

    SECTION("Admission difficulty bound") {
        config.admission.difficulty_bits = mixnet::policy::MAX_DIFFICULTY_BITS;
        CHECK(config.validate().has_value());
        config.admission.difficulty_bits = mixnet::policy::MAX_DIFFICULTY_BITS + 1;
        CHECK_FALSE(config.validate().has_value());
    }

    SECTION("Epoch slack bound") {
        config.replay.epoch_slack = 11;
        CHECK_FALSE(config.validate().has_value());
    }
}

TEST_CASE("Config from file", "[config][unit]") {
    TempDir tmp;

    SECTION("Missing file") {
        auto r = Config::load_from_file(tmp.path / "absent.toml");
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error() == ConfigError::FileNotFound);
    }

    SECTION("The example configuration loads and validates") {
        auto path = tmp.path / "mixnetd.toml";
        {
            std::ofstream file(path);
            file << example_config_toml();
        }
        auto r = Config::load_from_file(path);
        REQUIRE(r.has_value());
        CHECK(r->validate().has_value());
        CHECK(r->node.nickname == "mixnode");
    }
}

TEST_CASE("Command line arguments", "[config][unit]") {
    SECTION("Values override the file") {
        char prog[] = "mixnetd";
        char c[] = "-c";
        char file[] = "node.toml";
        char port[] = "--port";
        char port_v[] = "7600";
        char nick[] = "-n";
        char nick_v[] = "gamma";
        char* argv[] = {prog, c, file, port, port_v, nick, nick_v};

        auto args = parse_cli_args(7, argv);
        REQUIRE(args.has_value());
        REQUIRE(args->config_file.has_value());
        CHECK(*args->config_file == "node.toml");

        Config config;
        config.apply_cli_args(*args);
        CHECK(config.node.listen_port == 7600);
        CHECK(config.node.nickname == "gamma");
    }

    SECTION("Bad port") {
        char prog[] = "mixnetd";
        char port[] = "-p";
        char port_v[] = "99999";
        char* argv[] = {prog, port, port_v};
        CHECK_FALSE(parse_cli_args(3, argv).has_value());
    }

    SECTION("Missing value") {
        char prog[] = "mixnetd";
        char dir[] = "--data-dir";
        char* argv[] = {prog, dir};
        CHECK_FALSE(parse_cli_args(2, argv).has_value());
    }

    SECTION("Unknown option") {
        char prog[] = "mixnetd";
        char opt[] = "--exit-policy";
        char* argv[] = {prog, opt};
        CHECK_FALSE(parse_cli_args(2, argv).has_value());
    }
}

TEST_CASE("Config error messages", "[config][unit]") {
    CHECK(config_error_message(ConfigError::FileNotFound) == "Configuration file not found");
    CHECK(config_error_message(ConfigError::ValidationFailed) == "Configuration validation failed");
}
