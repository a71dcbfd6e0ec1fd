#include "common/config.hpp"
#include "common/log.hpp"
#include <boost/json.hpp>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace json = boost::json;

// Safe JSON field accessors with defaults
namespace {

std::string jstr(const json::object& obj, std::string_view key, const std::string& def = {}) {
    if (auto it = obj.find(key); it != obj.end() && it->value().is_string())
        return it->value().as_string().c_str();
    return def;
}

bool jbool(const json::object& obj, std::string_view key, bool def = false) {
    if (auto it = obj.find(key); it != obj.end() && it->value().is_bool())
        return it->value().as_bool();
    return def;
}

int64_t jint(const json::object& obj, std::string_view key, int64_t def = 0) {
    if (auto it = obj.find(key); it != obj.end()) {
        if (it->value().is_int64()) return it->value().as_int64();
        if (it->value().is_uint64()) return static_cast<int64_t>(it->value().as_uint64());
    }
    return def;
}

const json::object* jsection(const json::object& obj, std::string_view key) {
    if (auto it = obj.find(key); it != obj.end() && it->value().is_object())
        return &it->value().as_object();
    return nullptr;
}

bool env_flag(const char* value) {
    std::string v(value);
    return v == "1" || v == "true" || v == "TRUE" || v == "True" || v == "yes";
}

}  // anonymous namespace

namespace shellrelay {

std::string config_error_message(ConfigError error) {
    switch (error) {
        case ConfigError::FILE_NOT_FOUND: return "Configuration file not found";
        case ConfigError::PARSE_ERROR: return "Failed to parse configuration file";
        case ConfigError::INVALID_VALUE: return "Invalid configuration value";
        case ConfigError::MISSING_REQUIRED: return "Missing required configuration";
        default: return "Unknown configuration error";
    }
}

std::string_view handshake_mode_name(HandshakeMode mode) {
    switch (mode) {
        case HandshakeMode::UPGRADE: return "upgrade";
        case HandshakeMode::TERMPROXY: return "termproxy";
    }
    return "upgrade";
}

std::expected<RelayConfig, ConfigError> RelayConfig::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(ConfigError::FILE_NOT_FOUND);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str());
}

std::expected<RelayConfig, ConfigError> RelayConfig::parse(const std::string& json_content) {
    json::value jv;
    try {
        jv = json::parse(json_content);
    } catch (const std::exception& e) {
        NLOG_ERROR(log::CONFIG_LOGGER, "Config parse error: {}", e.what());
        return std::unexpected(ConfigError::PARSE_ERROR);
    }
    if (!jv.is_object()) {
        return std::unexpected(ConfigError::PARSE_ERROR);
    }
    const auto& root = jv.as_object();

    RelayConfig config;

    // server section
    if (auto* server = jsection(root, "server")) {
        config.server.bind_address = jstr(*server, "bind", config.server.bind_address);
        auto port = jint(*server, "port", config.server.port);
        if (port <= 0 || port > 65535) {
            return std::unexpected(ConfigError::INVALID_VALUE);
        }
        config.server.port = static_cast<uint16_t>(port);
        auto threads = jint(*server, "threads", 0);
        if (threads < 0) {
            return std::unexpected(ConfigError::INVALID_VALUE);
        }
        config.server.num_threads = static_cast<size_t>(threads);
    }

    // proxmox section
    if (auto* pve = jsection(root, "proxmox")) {
        config.proxmox.host = jstr(*pve, "host", config.proxmox.host);
        auto api_port = jint(*pve, "api_port", config.proxmox.api_port);
        if (api_port <= 0 || api_port > 65535) {
            return std::unexpected(ConfigError::INVALID_VALUE);
        }
        config.proxmox.api_port = static_cast<uint16_t>(api_port);
        config.proxmox.tls = jbool(*pve, "tls", config.proxmox.tls);
        config.proxmox.verify_tls = jbool(*pve, "verify_tls", config.proxmox.verify_tls);
        config.proxmox.token_name = jstr(*pve, "token_name");
        config.proxmox.token_value = jstr(*pve, "token_value");
        if (auto ms = jint(*pve, "request_timeout_ms"))
            config.proxmox.request_timeout = std::chrono::milliseconds(ms);

        if (auto* hosts = jsection(*pve, "node_hosts")) {
            for (const auto& [node, host] : *hosts) {
                if (!host.is_string()) {
                    return std::unexpected(ConfigError::INVALID_VALUE);
                }
                config.proxmox.node_hosts[std::string(node)] = host.as_string().c_str();
            }
        }
    }

    // relay section
    if (auto* relay = jsection(root, "relay")) {
        if (auto ms = jint(*relay, "connect_timeout_ms"))
            config.relay.connect_timeout = std::chrono::milliseconds(ms);
        if (auto ms = jint(*relay, "teardown_timeout_ms"))
            config.relay.teardown_timeout = std::chrono::milliseconds(ms);
        config.relay.idle_timeout = std::chrono::seconds(jint(*relay, "idle_timeout_seconds", 0));
        auto max_sessions = jint(*relay, "max_sessions", 0);
        auto max_bytes = jint(*relay, "max_message_bytes", 0);
        if (max_sessions < 0 || max_bytes < 0) {
            return std::unexpected(ConfigError::INVALID_VALUE);
        }
        config.relay.max_sessions = static_cast<size_t>(max_sessions);
        if (max_bytes > 0)
            config.relay.max_message_bytes = static_cast<size_t>(max_bytes);

        auto handshake = jstr(*relay, "handshake", "upgrade");
        if (handshake == "upgrade") {
            config.relay.handshake = HandshakeMode::UPGRADE;
        } else if (handshake == "termproxy") {
            config.relay.handshake = HandshakeMode::TERMPROXY;
        } else {
            NLOG_ERROR(log::CONFIG_LOGGER, "Unknown relay.handshake '{}'", handshake);
            return std::unexpected(ConfigError::INVALID_VALUE);
        }
    }

    // tickets section
    if (auto* tickets = jsection(root, "tickets")) {
        if (auto s = jint(*tickets, "ttl_seconds"))
            config.tickets.ttl = std::chrono::seconds(s);
        if (auto s = jint(*tickets, "sweep_interval_seconds"))
            config.tickets.sweep_interval = std::chrono::seconds(s);
        if (auto s = jint(*tickets, "retention_seconds"))
            config.tickets.retention = std::chrono::seconds(s);
    }

    // auth section
    if (auto* auth = jsection(root, "auth")) {
        config.auth.mode = jstr(*auth, "mode", config.auth.mode);
        config.auth.jwt_secret = jstr(*auth, "jwt_secret");
        config.auth.owner_tag_prefix = jstr(*auth, "owner_tag_prefix", config.auth.owner_tag_prefix);
        config.auth.admin_role = jstr(*auth, "admin_role", config.auth.admin_role);
    }

    // log section
    if (auto* log_sec = jsection(root, "log")) {
        config.log_level = jstr(*log_sec, "level", config.log_level);
        config.log_file = jstr(*log_sec, "file", config.log_file);
    }

    return config;
}

void RelayConfig::apply_env_overrides() {
    if (const char* v = std::getenv("PROXMOX_HOST")) {
        proxmox.host = v;
    }
    if (const char* v = std::getenv("PROXMOX_TOKEN_NAME")) {
        proxmox.token_name = v;
    }
    if (const char* v = std::getenv("PROXMOX_TOKEN_VALUE")) {
        proxmox.token_value = v;
    }
    if (const char* v = std::getenv("PROXMOX_VERIFY_SSL")) {
        proxmox.verify_tls = env_flag(v);
    }
    if (const char* v = std::getenv("JWT_SECRET")) {
        auth.jwt_secret = v;
    }
    if (const char* v = std::getenv("SHELLRELAY_PORT")) {
        try {
            auto port = std::stoi(v);
            if (port > 0 && port <= 65535) {
                server.port = static_cast<uint16_t>(port);
            } else {
                NLOG_WARN(log::CONFIG_LOGGER, "Ignoring SHELLRELAY_PORT={}", v);
            }
        } catch (const std::exception&) {
            NLOG_WARN(log::CONFIG_LOGGER, "Ignoring SHELLRELAY_PORT={}", v);
        }
    }
}

std::expected<void, ConfigError> RelayConfig::validate() const {
    if (proxmox.host.empty()) {
        NLOG_ERROR(log::CONFIG_LOGGER, "proxmox.host is required");
        return std::unexpected(ConfigError::MISSING_REQUIRED);
    }
    if (auth.mode != "token" && auth.mode != "disabled") {
        NLOG_ERROR(log::CONFIG_LOGGER, "auth.mode must be 'token' or 'disabled'");
        return std::unexpected(ConfigError::INVALID_VALUE);
    }
    if (auth.mode == "token" && auth.jwt_secret.empty()) {
        NLOG_ERROR(log::CONFIG_LOGGER, "auth.jwt_secret is required when auth.mode is 'token'");
        return std::unexpected(ConfigError::MISSING_REQUIRED);
    }
    if (tickets.ttl < std::chrono::seconds(1) || tickets.ttl > std::chrono::seconds(600)) {
        NLOG_ERROR(log::CONFIG_LOGGER, "tickets.ttl_seconds must be within 1..600");
        return std::unexpected(ConfigError::INVALID_VALUE);
    }
    if (tickets.sweep_interval <= std::chrono::seconds(0) ||
        tickets.retention < std::chrono::seconds(0)) {
        return std::unexpected(ConfigError::INVALID_VALUE);
    }
    if (relay.connect_timeout <= std::chrono::milliseconds(0) ||
        relay.teardown_timeout <= std::chrono::milliseconds(0) ||
        relay.idle_timeout < std::chrono::seconds(0)) {
        NLOG_ERROR(log::CONFIG_LOGGER, "relay timeouts must be positive");
        return std::unexpected(ConfigError::INVALID_VALUE);
    }
    if (relay.max_message_bytes == 0) {
        return std::unexpected(ConfigError::INVALID_VALUE);
    }
    if (proxmox.request_timeout <= std::chrono::milliseconds(0)) {
        return std::unexpected(ConfigError::INVALID_VALUE);
    }
    return {};
}

} // namespace shellrelay
