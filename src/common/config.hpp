#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <string>
#include <unordered_map>

namespace shellrelay {

// ============================================================================
// Configuration Error
// ============================================================================

enum class ConfigError {
    FILE_NOT_FOUND,
    PARSE_ERROR,
    INVALID_VALUE,
    MISSING_REQUIRED,
};

std::string config_error_message(ConfigError error);

// How the relay authenticates to the upstream console endpoint
enum class HandshakeMode {
    UPGRADE,    // vncwebsocket: a successful 101 upgrade is the handshake
    TERMPROXY,  // termproxy: "<user>:<ticket>\n" after the upgrade, expect "OK"
};

// ============================================================================
// Relay Configuration
// ============================================================================

struct RelayConfig {
    // Listener
    struct Server {
        std::string bind_address = "0.0.0.0";
        uint16_t port = 8090;
        size_t num_threads = 0;  // 0 = hardware_concurrency
    } server;

    // Hypervisor control plane (Proxmox VE API)
    struct Proxmox {
        std::string host = "192.168.1.100";
        uint16_t api_port = 8006;
        bool tls = true;
        bool verify_tls = false;
        std::string token_name;    // "root@pam!ucp-token"
        std::string token_value;
        std::chrono::milliseconds request_timeout{10000};
        // Per-node host override for multi-node clusters
        std::unordered_map<std::string, std::string> node_hosts;

        const std::string& host_for(const std::string& node) const {
            auto it = node_hosts.find(node);
            return it != node_hosts.end() ? it->second : host;
        }

        // "root@pam" part of the token name
        std::string token_user() const {
            auto pos = token_name.find('!');
            return pos == std::string::npos ? token_name : token_name.substr(0, pos);
        }
    } proxmox;

    // Console relay behavior
    struct Relay {
        std::chrono::milliseconds connect_timeout{5000};
        std::chrono::milliseconds teardown_timeout{3000};
        std::chrono::seconds idle_timeout{0};  // 0 = disabled
        size_t max_sessions = 0;               // 0 = unlimited
        size_t max_message_bytes = 1024 * 1024;
        HandshakeMode handshake = HandshakeMode::UPGRADE;

        // Upper bound for a cancelled session to finish: a connect still in
        // flight runs to its deadline, then the close handshake to its own.
        std::chrono::milliseconds shutdown_grace() const {
            return connect_timeout + teardown_timeout + std::chrono::milliseconds(500);
        }
    } relay;

    // Console tickets
    struct Tickets {
        std::chrono::seconds ttl{30};
        std::chrono::seconds sweep_interval{10};
        std::chrono::seconds retention{300};
    } tickets;

    // Operator authentication / admission
    struct Auth {
        std::string mode = "token";  // "token" | "disabled"
        std::string jwt_secret;
        std::string owner_tag_prefix = "ucp-owner:";
        std::string admin_role = "admin";
    } auth;

    // Logging
    std::string log_level = "info";
    std::string log_file;

    // Load from JSON file
    static std::expected<RelayConfig, ConfigError> load(const std::string& path);

    // Load from JSON string (for testing)
    static std::expected<RelayConfig, ConfigError> parse(const std::string& json_content);

    // PROXMOX_HOST, PROXMOX_TOKEN_NAME, PROXMOX_TOKEN_VALUE, PROXMOX_VERIFY_SSL,
    // JWT_SECRET, SHELLRELAY_PORT
    void apply_env_overrides();

    std::expected<void, ConfigError> validate() const;
};

std::string_view handshake_mode_name(HandshakeMode mode);

} // namespace shellrelay
