#include "mixnet/util/config.hpp"
#include "mixnet/core/packet.hpp"
#include "mixnet/util/logging.hpp"
#include <algorithm>
#include <charconv>
#include <fstream>
#include <iostream>
#include <map>
#include <sstream>

namespace mixnet::util {

// --- Minimal TOML parser (standard-library only) ---

namespace {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string unquote(const std::string& s) {
    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

// Drops a trailing comment that is not inside a string
std::string strip_comment(const std::string& s) {
    bool quoted = false;
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '"') quoted = !quoted;
        if (s[i] == '#' && !quoted) return s.substr(0, i);
    }
    return s;
}

// Flat key-value store: "section.key" -> "value", ordered so peers load
// deterministically
using TomlMap = std::map<std::string, std::string>;

std::expected<TomlMap, ConfigError> parse_toml_simple(const std::string& content) {
    TomlMap result;
    std::string current_section;
    std::istringstream stream(content);
    std::string line;
    size_t line_no = 0;

    while (std::getline(stream, line)) {
        ++line_no;
        line = trim(strip_comment(line));

        // Skip empty lines and comments
        if (line.empty()) continue;

        // Section header: [section]
        if (line.front() == '[') {
            if (line.back() != ']') {
                LOG_ERROR("Config line {}: unterminated section header", line_no);
                return std::unexpected(ConfigError::ParseError);
            }
            current_section = trim(line.substr(1, line.size() - 2));
            continue;
        }

        // Key = value
        auto eq = line.find('=');
        if (eq == std::string::npos) {
            LOG_ERROR("Config line {}: expected key = value", line_no);
            return std::unexpected(ConfigError::ParseError);
        }

        auto key = trim(line.substr(0, eq));
        auto value = unquote(trim(line.substr(eq + 1)));
        if (key.empty()) {
            LOG_ERROR("Config line {}: empty key", line_no);
            return std::unexpected(ConfigError::ParseError);
        }

        // Build fully qualified key
        std::string fqkey = current_section.empty() ? key : current_section + "." + key;
        result[fqkey] = value;
    }

    return result;
}

std::string get(const TomlMap& m, const std::string& key, const std::string& def = "") {
    auto it = m.find(key);
    return it != m.end() ? it->second : def;
}

// Leaves out untouched when the key is absent
template <typename T>
std::expected<void, ConfigError> get_uint(const TomlMap& m, const std::string& key, T& out) {
    auto it = m.find(key);
    if (it == m.end()) return {};
    const auto& s = it->second;
    T value{};
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc() || ptr != s.data() + s.size()) {
        LOG_ERROR("Config key {}: '{}' is not a valid number", key, s);
        return std::unexpected(ConfigError::InvalidValue);
    }
    out = value;
    return {};
}

template <typename Duration>
std::expected<void, ConfigError> get_duration(const TomlMap& m, const std::string& key, Duration& out) {
    auto count = static_cast<uint64_t>(out.count());
    if (auto r = get_uint(m, key, count); !r) return r;
    out = Duration(static_cast<typename Duration::rep>(count));
    return {};
}

std::expected<void, ConfigError> get_bool(const TomlMap& m, const std::string& key, bool& out) {
    auto it = m.find(key);
    if (it == m.end()) return {};
    if (it->second == "true" || it->second == "1") {
        out = true;
    } else if (it->second == "false" || it->second == "0") {
        out = false;
    } else {
        LOG_ERROR("Config key {}: '{}' is not a boolean", key, it->second);
        return std::unexpected(ConfigError::InvalidValue);
    }
    return {};
}

std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> out;
    std::string item;
    std::istringstream stream(s);
    while (std::getline(stream, item, sep)) {
        item = trim(item);
        if (!item.empty()) out.push_back(item);
    }
    return out;
}

}  // namespace

// --- PeerConfig ---

core::RelayIdentity PeerConfig::to_identity() const {
    core::RelayIdentity id;
    id.identity_key = identity_key;
    id.onion_key = onion_key;
    id.addresses = {address};
    return id;
}

std::expected<PeerConfig, ConfigError>
parse_peer(const std::string& name, const std::string& value) {
    std::istringstream stream(value);
    std::string address, identity_b64, onion_b64, extra;
    if (!(stream >> address >> identity_b64 >> onion_b64) || (stream >> extra)) {
        LOG_ERROR("Peer {}: expected \"host:port identity_b64 onion_b64\"", name);
        return std::unexpected(ConfigError::InvalidValue);
    }
    auto identity = crypto::IdentityPublicKey::from_base64(identity_b64);
    auto onion = crypto::OnionPublicKey::from_base64(onion_b64);
    if (!identity || !onion) {
        LOG_ERROR("Peer {}: malformed key", name);
        return std::unexpected(ConfigError::InvalidValue);
    }
    return PeerConfig{
        .name = name,
        .address = address,
        .identity_key = *identity,
        .onion_key = *onion,
    };
}

// --- Config implementation ---

std::expected<Config, ConfigError> Config::load_from_file(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return std::unexpected(ConfigError::FileNotFound);
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(ConfigError::FileNotFound);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    return load_from_string(buffer.str());
}

std::expected<Config, ConfigError> Config::load_from_string(const std::string& toml_content) {
    Config config;
    if (auto r = config.parse_toml(toml_content); !r) {
        return std::unexpected(r.error());
    }
    return config;
}

std::expected<void, ConfigError> Config::parse_toml(const std::string& content) {
    auto parsed = parse_toml_simple(content);
    if (!parsed) {
        return std::unexpected(parsed.error());
    }
    const auto& m = *parsed;

#define MIXNET_CONFIG_CHECK(expr) \
    do { if (auto _r = (expr); !_r) return _r; } while (0)

    // [node]
    auto nickname = get(m, "node.nickname");
    if (!nickname.empty()) node.nickname = nickname;
    auto data_dir = get(m, "node.data_dir");
    if (!data_dir.empty()) node.data_dir = data_dir;
    auto listen = get(m, "node.listen_address");
    if (!listen.empty()) node.listen_address = listen;
    MIXNET_CONFIG_CHECK(get_uint(m, "node.listen_port", node.listen_port));
    auto advertise = get(m, "node.advertise");
    if (!advertise.empty()) node.advertise = split(advertise, ',');

    // [routing]
    MIXNET_CONFIG_CHECK(get_uint(m, "routing.max_hops", routing.max_hops));

    // [admission]
    MIXNET_CONFIG_CHECK(get_uint(m, "admission.difficulty_bits", admission.difficulty_bits));
    auto scope = get(m, "admission.scope");
    if (!scope.empty()) {
        auto parsed_scope = policy::parse_admission_scope(scope);
        if (!parsed_scope) {
            LOG_ERROR("Config key admission.scope: unknown scope '{}'", scope);
            return std::unexpected(ConfigError::InvalidValue);
        }
        admission.scope = *parsed_scope;
    }
    MIXNET_CONFIG_CHECK(get_uint(m, "admission.rate", admission.rate));
    MIXNET_CONFIG_CHECK(get_uint(m, "admission.burst", admission.burst));
    MIXNET_CONFIG_CHECK(get_uint(m, "admission.debt_limit", admission.debt_limit));

    // [queue]
    MIXNET_CONFIG_CHECK(get_uint(m, "queue.capacity", queue.capacity));
    auto policy_name = get(m, "queue.policy");
    if (!policy_name.empty()) {
        auto parsed_policy = policy::parse_scheduling_policy(policy_name);
        if (!parsed_policy) {
            LOG_ERROR("Config key queue.policy: unknown policy '{}'", policy_name);
            return std::unexpected(ConfigError::InvalidValue);
        }
        queue.policy = *parsed_policy;
    }

    // [replay]
    MIXNET_CONFIG_CHECK(get_uint(m, "replay.capacity", replay.capacity));
    MIXNET_CONFIG_CHECK(get_uint(m, "replay.epoch_slack", replay.epoch_slack));

    // [topology]
    MIXNET_CONFIG_CHECK(get_duration(m, "topology.edge_ttl", topology.edge_ttl));
    MIXNET_CONFIG_CHECK(get_duration(m, "topology.identity_ttl", topology.identity_ttl));
    MIXNET_CONFIG_CHECK(get_duration(m, "topology.gossip_interval", topology.gossip_interval));

    // [link]
    MIXNET_CONFIG_CHECK(get_uint(m, "link.max_failures", link.max_failures));
    MIXNET_CONFIG_CHECK(get_duration(m, "link.backoff_initial_ms", link.backoff_initial));
    MIXNET_CONFIG_CHECK(get_duration(m, "link.backoff_max_ms", link.backoff_max));
    MIXNET_CONFIG_CHECK(get_duration(m, "link.handshake_timeout_ms", link.handshake_timeout));
    MIXNET_CONFIG_CHECK(get_duration(m, "link.keepalive_ms", link.keepalive_interval));
    MIXNET_CONFIG_CHECK(get_uint(m, "link.rate", link.rate));
    MIXNET_CONFIG_CHECK(get_uint(m, "link.burst", link.burst));

    // [circuit]
    MIXNET_CONFIG_CHECK(get_duration(m, "circuit.open_timeout_ms", circuit.open_timeout));
    MIXNET_CONFIG_CHECK(get_duration(m, "circuit.rto_ms", circuit.rto));
    MIXNET_CONFIG_CHECK(get_uint(m, "circuit.max_retries", circuit.max_retries));
    MIXNET_CONFIG_CHECK(get_uint(m, "circuit.window", circuit.window));
    MIXNET_CONFIG_CHECK(get_duration(m, "circuit.idle_timeout", circuit.idle_timeout));

    // [peers]
    const std::string prefix = "peers.";
    for (auto it = m.lower_bound(prefix); it != m.end() && it->first.starts_with(prefix); ++it) {
        auto peer = parse_peer(it->first.substr(prefix.size()), it->second);
        if (!peer) {
            return std::unexpected(peer.error());
        }
        peers.push_back(std::move(*peer));
    }

    // [logging]
    auto log_level = get(m, "logging.level");
    if (!log_level.empty()) logging.level = log_level;
    auto log_file = get(m, "logging.file");
    if (!log_file.empty()) logging.file = log_file;
    MIXNET_CONFIG_CHECK(get_bool(m, "logging.console", logging.console));
    MIXNET_CONFIG_CHECK(get_uint(m, "logging.max_file_mb", logging.max_file_mb));
    MIXNET_CONFIG_CHECK(get_uint(m, "logging.max_files", logging.max_files));

#undef MIXNET_CONFIG_CHECK
    return {};
}

std::expected<void, ConfigError> Config::validate() const {
    auto fail = [](const char* what) {
        LOG_ERROR("Invalid configuration: {}", what);
        return std::unexpected(ConfigError::ValidationFailed);
    };
    if (node.nickname.empty()) return fail("node.nickname is empty");
    if (routing.max_hops == 0 || routing.max_hops > core::MAX_HOPS) {
        return fail("routing.max_hops must be between 1 and 8");
    }
    if (admission.difficulty_bits > policy::MAX_DIFFICULTY_BITS) {
        return fail("admission.difficulty_bits above 24");
    }
    if (queue.capacity == 0) return fail("queue.capacity is zero");
    if (replay.capacity == 0) return fail("replay.capacity is zero");
    if (replay.epoch_slack > 10) return fail("replay.epoch_slack above 10");
    if (topology.gossip_interval.count() == 0) return fail("topology.gossip_interval is zero");
    if (link.max_failures == 0) return fail("link.max_failures is zero");
    if (link.backoff_initial.count() == 0 || link.backoff_max < link.backoff_initial) {
        return fail("link backoff bounds are inconsistent");
    }
    if (circuit.window == 0) return fail("circuit.window is zero");
    if (circuit.max_retries == 0) return fail("circuit.max_retries is zero");
    return {};
}

void Config::apply_cli_args(const CliArgs& args) {
    if (args.port) node.listen_port = *args.port;
    if (args.nickname) node.nickname = *args.nickname;
    if (args.data_dir) node.data_dir = *args.data_dir;
    if (args.log_level) logging.level = *args.log_level;
}

Config default_config() {
    return Config{};
}

std::string example_config_toml() {
    return R"(# mixnetd configuration

[node]
nickname = "mixnode"
data_dir = "./mixnet-data"
listen_address = "0.0.0.0"
listen_port = 7400
# advertise = "203.0.113.7:7400"

[routing]
max_hops = 3

[admission]
difficulty_bits = 8
scope = "link"        # "link" or "source"
rate = 0              # packets per second per scope, 0 = unlimited
burst = 64
debt_limit = 0        # packets a neighbour may owe us, 0 = unlimited

[queue]
capacity = 1024
policy = "strict"     # "strict" or "weighted"

[replay]
capacity = 65536      # per link per one-minute packet epoch
epoch_slack = 1

[topology]
edge_ttl = 300
identity_ttl = 3600
gossip_interval = 30

[link]
max_failures = 5
backoff_initial_ms = 250
backoff_max_ms = 30000
handshake_timeout_ms = 10000
rate = 0              # bytes per second, 0 = unlimited
burst = 262144

[circuit]
open_timeout_ms = 5000
rto_ms = 500
max_retries = 8
window = 32
idle_timeout = 300

[peers]
# relay-b = "198.51.100.4:7400 <identity_b64> <onion_b64>"

[logging]
level = "info"
console = true
# file = "mixnetd.log"
)";
}

std::string config_error_message(ConfigError err) {
    switch (err) {
        case ConfigError::FileNotFound: return "Configuration file not found";
        case ConfigError::ParseError: return "Failed to parse configuration";
        case ConfigError::InvalidValue: return "Invalid configuration value";
        case ConfigError::MissingRequired: return "Missing required configuration";
        case ConfigError::ValidationFailed: return "Configuration validation failed";
        default: return "Unknown configuration error";
    }
}

std::expected<CliArgs, std::string> parse_cli_args(int argc, char* argv[]) {
    CliArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto value = [&]() -> std::expected<std::string, std::string> {
            if (i + 1 >= argc) {
                return std::unexpected("missing value for " + arg);
            }
            return std::string(argv[++i]);
        };

        if (arg == "--help" || arg == "-h") {
            args.help = true;
        } else if (arg == "--version" || arg == "-v") {
            args.version = true;
        } else if (arg == "--example-config") {
            args.example_config = true;
        } else if (arg == "--verify-config") {
            args.verify_config = true;
        } else if (arg == "--config" || arg == "-c") {
            auto v = value();
            if (!v) return std::unexpected(v.error());
            args.config_file = *v;
        } else if (arg == "--port" || arg == "-p") {
            auto v = value();
            if (!v) return std::unexpected(v.error());
            uint16_t port = 0;
            auto [ptr, ec] = std::from_chars(v->data(), v->data() + v->size(), port);
            if (ec != std::errc() || ptr != v->data() + v->size()) {
                return std::unexpected("invalid port: " + *v);
            }
            args.port = port;
        } else if (arg == "--nickname" || arg == "-n") {
            auto v = value();
            if (!v) return std::unexpected(v.error());
            args.nickname = *v;
        } else if (arg == "--data-dir" || arg == "-d") {
            auto v = value();
            if (!v) return std::unexpected(v.error());
            args.data_dir = *v;
        } else if (arg == "--log-level" || arg == "-l") {
            auto v = value();
            if (!v) return std::unexpected(v.error());
            args.log_level = *v;
        } else {
            return std::unexpected("unknown option: " + arg);
        }
    }
    return args;
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS]\n"
              << "\n"
              << "Options:\n"
              << "  -c, --config <file>      Load configuration from a TOML file\n"
              << "  -p, --port <port>        Listen port for transport links\n"
              << "  -n, --nickname <name>    Node nickname\n"
              << "  -d, --data-dir <dir>     Directory for keys and the address book\n"
              << "  -l, --log-level <level>  trace, debug, info, warn, error\n"
              << "      --example-config     Print an example configuration and exit\n"
              << "      --verify-config      Validate the configuration and exit\n"
              << "  -v, --version            Print version and exit\n"
              << "  -h, --help               Show this help\n";
}

void print_version() {
    std::cout << "mixnetd v0.1.0\n";
}

}  // namespace mixnet::util
