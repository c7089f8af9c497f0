#pragma once

#include "mixnet/core/identity.hpp"
#include "mixnet/policy/admission.hpp"
#include "mixnet/policy/scheduler.hpp"
#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace mixnet::util {

// Configuration error types
enum class ConfigError {
    FileNotFound,
    ParseError,
    InvalidValue,
    MissingRequired,
    ValidationFailed,
};

// Node identity and listener
struct NodeConfig {
    std::string nickname{"mixnode"};
    std::filesystem::path data_dir{"./mixnet-data"};
    std::string listen_address{"0.0.0.0"};
    uint16_t listen_port{7400};
    std::vector<std::string> advertise;   // "host:port" published to peers
};

struct RoutingConfig {
    size_t max_hops{3};
};

struct AdmissionConfig {
    unsigned difficulty_bits{8};
    policy::AdmissionScope scope{policy::AdmissionScope::PerLink};
    uint64_t rate{0};      // admitted packets per second per scope, 0 = unlimited
    uint64_t burst{64};
    uint64_t debt_limit{0};   // packets a neighbour may owe us, 0 = unlimited
};

struct QueueConfig {
    size_t capacity{1024};
    policy::SchedulingPolicy policy{policy::SchedulingPolicy::StrictPriority};
};

struct ReplayConfig {
    size_t capacity{65536};    // nonces per packet epoch per link
    uint32_t epoch_slack{1};   // packet epochs accepted either side of ours
};

struct TopologyConfig {
    std::chrono::seconds edge_ttl{300};
    std::chrono::seconds identity_ttl{3600};
    std::chrono::seconds gossip_interval{30};
};

struct LinkConfig {
    uint32_t max_failures{5};
    std::chrono::milliseconds backoff_initial{250};
    std::chrono::milliseconds backoff_max{30000};
    std::chrono::milliseconds handshake_timeout{10000};
    std::chrono::milliseconds keepalive_interval{15000};
    uint64_t rate{0};          // egress bytes per second, 0 = unlimited
    uint64_t burst{256 * 1024};
};

struct CircuitConfig {
    std::chrono::milliseconds open_timeout{5000};
    std::chrono::milliseconds rto{500};
    uint32_t max_retries{8};
    size_t window{32};
    std::chrono::seconds idle_timeout{300};
};

// A directly peered relay: `name = "host:port identity_b64 onion_b64"`
struct PeerConfig {
    std::string name;
    std::string address;
    crypto::IdentityPublicKey identity_key;
    crypto::OnionPublicKey onion_key;

    // Unsigned identity good enough to dial and authenticate the peer
    [[nodiscard]] core::RelayIdentity to_identity() const;
};

[[nodiscard]] std::expected<PeerConfig, ConfigError>
parse_peer(const std::string& name, const std::string& value);

// Logging configuration
struct LoggingConfig {
    std::string level{"info"};
    std::string file;
    bool console{true};
    size_t max_file_mb{10};
    size_t max_files{5};
};

struct CliArgs;

// Complete configuration
class Config {
public:
    Config() = default;

    // Load from TOML file
    [[nodiscard]] static std::expected<Config, ConfigError>
    load_from_file(const std::filesystem::path& path);

    // Load from TOML string
    [[nodiscard]] static std::expected<Config, ConfigError>
    load_from_string(const std::string& toml_content);

    // Validate configuration
    [[nodiscard]] std::expected<void, ConfigError> validate() const;

    // Command-line values win over file values
    void apply_cli_args(const CliArgs& args);

    NodeConfig node;
    RoutingConfig routing;
    AdmissionConfig admission;
    QueueConfig queue;
    ReplayConfig replay;
    TopologyConfig topology;
    LinkConfig link;
    CircuitConfig circuit;
    std::vector<PeerConfig> peers;
    LoggingConfig logging;

private:
    [[nodiscard]] std::expected<void, ConfigError> parse_toml(const std::string& content);
};

// Generate default configuration
[[nodiscard]] Config default_config();

// Generate example configuration file content
[[nodiscard]] std::string example_config_toml();

// Utility
[[nodiscard]] std::string config_error_message(ConfigError err);

// CLI argument parsing
struct CliArgs {
    std::optional<std::filesystem::path> config_file;
    std::optional<uint16_t> port;
    std::optional<std::string> nickname;
    std::optional<std::string> data_dir;
    std::optional<std::string> log_level;
    bool help{false};
    bool version{false};
    bool example_config{false};
    bool verify_config{false};
};

[[nodiscard]] std::expected<CliArgs, std::string>
parse_cli_args(int argc, char* argv[]);

void print_usage(const char* program_name);
void print_version();

}  // namespace mixnet::util
