#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>

#include "mixnet/crypto/key_store.hpp"
#include "mixnet/node/node.hpp"
#include "mixnet/util/config.hpp"
#include "mixnet/util/logging.hpp"

namespace {

std::atomic<bool> g_shutdown_requested{false};
std::atomic<bool> g_reload_requested{false};

constexpr auto STATUS_INTERVAL = std::chrono::seconds(60);

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_shutdown_requested = true;
    } else if (signal == SIGHUP) {
        g_reload_requested = true;
    }
}

void setup_signal_handlers() {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::signal(SIGHUP, signal_handler);
    std::signal(SIGPIPE, SIG_IGN);  // Ignore broken pipe
}

void apply_logging(const mixnet::util::LoggingConfig& cfg) {
    mixnet::util::configure_logging(mixnet::util::parse_log_level(cfg.level), cfg.console,
                                    cfg.file, cfg.max_file_mb, cfg.max_files);
}

void log_status(mixnet::node::Node& node) {
    auto stats = node.stats();
    auto snapshot = node.topology().snapshot();
    LOG_INFO("Status: {} link(s) up, {} relay(s) known, generation {}, {} circuit(s)",
             node.links().up_peers().size(), snapshot->relays.size(), snapshot->generation,
             node.circuits().circuit_count());
    LOG_INFO("Traffic: {}", stats.to_string());
}

}  // namespace

int main(int argc, char* argv[]) {
    // Parse command-line arguments
    auto args_result = mixnet::util::parse_cli_args(argc, argv);
    if (!args_result) {
        std::cerr << "Error: " << args_result.error() << "\n";
        mixnet::util::print_usage(argv[0]);
        return 1;
    }

    const auto& args = *args_result;

    if (args.help) {
        mixnet::util::print_usage(argv[0]);
        return 0;
    }

    if (args.version) {
        mixnet::util::print_version();
        return 0;
    }

    if (args.example_config) {
        std::cout << mixnet::util::example_config_toml();
        return 0;
    }

    // Load configuration
    auto config = mixnet::util::default_config();
    if (args.config_file) {
        auto loaded = mixnet::util::Config::load_from_file(*args.config_file);
        if (!loaded) {
            std::cerr << "Error: Failed to load " << args.config_file->string() << ": "
                      << mixnet::util::config_error_message(loaded.error()) << "\n";
            return 1;
        }
        config = std::move(*loaded);
    }
    config.apply_cli_args(args);

    if (auto valid = config.validate(); !valid) {
        std::cerr << "Error: Invalid configuration: "
                  << mixnet::util::config_error_message(valid.error()) << "\n";
        return 1;
    }

    if (args.verify_config) {
        std::cout << "Configuration OK\n";
        return 0;
    }

    apply_logging(config.logging);

    LOG_INFO("mixnetd v{} starting", mixnet::node::VersionInfo::to_string());
    LOG_INFO("Nickname: {}", config.node.nickname);
    LOG_INFO("Port: {}", config.node.listen_port);
    LOG_INFO("Max hops: {}, admission difficulty: {} bits ({})", config.routing.max_hops,
             config.admission.difficulty_bits,
             mixnet::policy::admission_scope_name(config.admission.scope));

    std::error_code ec;
    std::filesystem::create_directories(config.node.data_dir, ec);
    if (ec) {
        LOG_ERROR("Failed to create data directory {}: {}", config.node.data_dir.string(),
                  ec.message());
        return 1;
    }

    setup_signal_handlers();

    try {
        auto node_result = mixnet::node::NodeBuilder()
            .config(config)
            .build();

        if (!node_result) {
            LOG_FATAL("Failed to build node: {}",
                      mixnet::node::node_error_message(node_result.error()));
            return node_result.error() == mixnet::node::NodeError::CorruptIdentityKey ? 2 : 1;
        }

        auto node = std::move(*node_result);

        auto start_result = node->start();
        if (!start_result) {
            LOG_ERROR("Failed to start node: {}",
                      mixnet::node::node_error_message(start_result.error()));
            return 1;
        }

        LOG_INFO("Node id: {}", node->node_id().to_hex());

        auto identity = node->identity();
        if (!identity.addresses.empty()) {
            mixnet::crypto::KeyStore store(config.node.data_dir);
            if (auto r = store.write_peer_line(config.node.nickname, identity.addresses.front(),
                                               node->keys());
                !r) {
                LOG_WARN("Failed to write peer line: {}",
                         mixnet::crypto::key_store_error_message(r.error()));
            }
        }

        // Main loop
        auto last_status = std::chrono::steady_clock::now();
        while (!g_shutdown_requested) {
            if (g_reload_requested.exchange(false)) {
                LOG_INFO("Reloading logging configuration...");
                if (args.config_file) {
                    auto reloaded = mixnet::util::Config::load_from_file(*args.config_file);
                    if (reloaded) {
                        reloaded->apply_cli_args(args);
                        apply_logging(reloaded->logging);
                        LOG_INFO("Logging configuration reloaded");
                    } else {
                        LOG_ERROR("Failed to reload config: {}",
                                  mixnet::util::config_error_message(reloaded.error()));
                    }
                }
            }

            auto now = std::chrono::steady_clock::now();
            if (now - last_status >= STATUS_INTERVAL) {
                log_status(*node);
                last_status = now;
            }

            // Sleep briefly to avoid busy-waiting
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        LOG_INFO("Shutdown requested, stopping node...");

        auto stop_result = node->stop();
        if (!stop_result) {
            LOG_ERROR("Error during shutdown: {}",
                      mixnet::node::node_error_message(stop_result.error()));
        }
        log_status(*node);

    } catch (const std::exception& e) {
        LOG_FATAL("Fatal error: {}", e.what());
        return 1;
    }

    return 0;
}
