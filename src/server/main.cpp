#include "server/relay_server.hpp"
#include "common/config.hpp"
#include "common/log.hpp"
#include "common/io_context_pool.hpp"

#include <boost/asio.hpp>
#include <boost/asio/signal_set.hpp>
#include <sodium.h>

#include <algorithm>
#include <iostream>
#include <optional>
#include <thread>

#ifndef SHELLRELAY_VERSION
#define SHELLRELAY_VERSION "1.0.0"
#endif

using namespace shellrelay;

namespace {

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options]\n"
              << "Options:\n"
              << "  -c, --config <file>      Configuration file path (default: config/relay.json)\n"
              << "  -p, --port <port>        Listen port, overrides the configuration\n"
              << "  -l, --log-level <level>  trace, debug, info, warn, error, off\n"
              << "  -v, --version            Print version and exit\n"
              << "  -h, --help               Show this help message\n"
              << std::endl;
}

// Waits until every session has closed or the grace period ran out
net::awaitable<void> drain(RelayServer& server, IOContextPool& pool, std::chrono::milliseconds grace) {
    net::steady_timer timer(co_await net::this_coro::executor);
    const auto deadline = std::chrono::steady_clock::now() + grace;

    while (server.registry().reserved() > 0 && std::chrono::steady_clock::now() < deadline) {
        timer.expires_after(std::chrono::milliseconds(50));
        boost::system::error_code ec;
        co_await timer.async_wait(net::redirect_error(net::use_awaitable, ec));
    }

    if (auto left = server.registry().reserved(); left > 0) {
        LOG_WARN("{} sessions still open after {}ms, forcing exit", left, grace.count());
    }
    pool.stop();
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    std::string config_path = "config/relay.json";
    std::optional<uint16_t> port_override;
    std::string log_level_override;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-v" || arg == "--version") {
            std::cout << "shellrelay " << SHELLRELAY_VERSION << std::endl;
            return 0;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_path = argv[++i];
        } else if ((arg == "-p" || arg == "--port") && i + 1 < argc) {
            auto port = parse_port(argv[++i]);
            if (!port) {
                std::cerr << "Invalid port: " << argv[i] << std::endl;
                return 1;
            }
            port_override = *port;
        } else if ((arg == "-l" || arg == "--log-level") && i + 1 < argc) {
            log_level_override = argv[++i];
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    // Initialize logging
    log::init_from_env();

    auto loaded = RelayConfig::load(config_path);
    if (!loaded) {
        std::cerr << "Error: Failed to load configuration from '" << config_path << "': "
                  << config_error_message(loaded.error()) << "\n\n";
        print_usage(argv[0]);
        return 1;
    }
    RelayConfig config = std::move(*loaded);
    config.apply_env_overrides();
    if (port_override) {
        config.server.port = *port_override;
    }
    if (!log_level_override.empty()) {
        config.log_level = log_level_override;
    }

    log::LogConfig log_config;
    log_config.level = log::parse_level(config.log_level);
    log_config.file_path = config.log_file;
    log::init(log_config);

    if (auto valid = config.validate(); !valid) {
        LOG_ERROR("Invalid configuration: {}", config_error_message(valid.error()));
        return 1;
    }

    if (sodium_init() < 0) {
        LOG_ERROR("Failed to initialize libsodium");
        return 1;
    }

    LOG_INFO("shellrelay {} starting...", SHELLRELAY_VERSION);
    LOG_INFO("Configuration loaded from: {}", config_path);
    LOG_INFO("Proxmox API at {}:{} (tls={}, verify={})", config.proxmox.host, config.proxmox.api_port,
             config.proxmox.tls, config.proxmox.verify_tls);

    try {
        size_t num_threads = config.server.num_threads;
        if (num_threads == 0) {
            num_threads = std::max(1u, std::thread::hardware_concurrency());
        }
        IOContextPool pool(num_threads);
        auto& control_ioc = pool.get_io_context(0);

        auto server = std::make_shared<RelayServer>(config);
        const auto grace = config.relay.shutdown_grace();

        boost::asio::signal_set signals(control_ioc, SIGINT, SIGTERM);
        signals.async_wait([&](boost::system::error_code ec, int signal_number) {
            if (!ec) {
                LOG_INFO("Received signal {}, shutting down...", signal_number);
                server->stop();
                net::co_spawn(control_ioc, drain(*server, pool, grace), net::detached);
            }
        });

        server->start(pool);

        // Blocks until stopped
        LOG_INFO("Relay running with {} IO threads", pool.size());
        pool.run();

        LOG_INFO("Relay stopped");
        log::shutdown();
        return 0;

    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: {}", e.what());
        return 1;
    }
}
