#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <memory>
#include <string>
#include <string_view>

namespace shellrelay {
namespace log {

// ============================================================================
// Channels
// ============================================================================
constexpr const char* MAIN_LOGGER = "shellrelay";
constexpr const char* CONFIG_LOGGER = "config";
constexpr const char* HTTP_LOGGER = "http";
constexpr const char* RELAY_LOGGER = "relay";
constexpr const char* SESSION_LOGGER = "session";
constexpr const char* UPSTREAM_LOGGER = "upstream";
constexpr const char* TICKET_LOGGER = "ticket";
constexpr const char* ADMISSION_LOGGER = "admission";

enum class Level {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Critical = 5,
    Off = 6
};

struct LogConfig {
    Level level{Level::Info};
    std::string pattern{"%Y-%m-%dT%H:%M:%S.%e %^%-5l%$ %-9n %v"};
    bool console{true};
    std::string file_path;                   // empty = no file sink
    size_t max_file_size{10 * 1024 * 1024};
    size_t max_files{5};
};

// (Re)configure sinks. Channels created earlier are rebuilt on the new sinks.
void init(const LogConfig& config = LogConfig{});

// SHELLRELAY_LOG_LEVEL and SHELLRELAY_LOG_FILE
void init_from_env();

// Channel by name, created on first use
std::shared_ptr<spdlog::logger> channel(const std::string& name);

void set_level(Level level);
bool enabled(Level level);

// "debug", "warn", ... Unknown strings map to Info.
Level parse_level(std::string_view level);

void shutdown();

spdlog::level::level_enum to_spdlog_level(Level level);

template<typename... Args>
inline void write(const char* name, Level level, fmt::format_string<Args...> fmt, Args&&... args) {
    if (enabled(level)) {
        channel(name)->log(to_spdlog_level(level), fmt, std::forward<Args>(args)...);
    }
}

#define SHELLRELAY_LOG(name, level, ...) \
    ::shellrelay::log::write(name, ::shellrelay::log::Level::level, __VA_ARGS__)

#define LOG_TRACE(...) SHELLRELAY_LOG(::shellrelay::log::MAIN_LOGGER, Trace, __VA_ARGS__)
#define LOG_DEBUG(...) SHELLRELAY_LOG(::shellrelay::log::MAIN_LOGGER, Debug, __VA_ARGS__)
#define LOG_INFO(...) SHELLRELAY_LOG(::shellrelay::log::MAIN_LOGGER, Info, __VA_ARGS__)
#define LOG_WARN(...) SHELLRELAY_LOG(::shellrelay::log::MAIN_LOGGER, Warn, __VA_ARGS__)
#define LOG_ERROR(...) SHELLRELAY_LOG(::shellrelay::log::MAIN_LOGGER, Error, __VA_ARGS__)

#define NLOG_TRACE(name, ...) SHELLRELAY_LOG(name, Trace, __VA_ARGS__)
#define NLOG_DEBUG(name, ...) SHELLRELAY_LOG(name, Debug, __VA_ARGS__)
#define NLOG_INFO(name, ...) SHELLRELAY_LOG(name, Info, __VA_ARGS__)
#define NLOG_WARN(name, ...) SHELLRELAY_LOG(name, Warn, __VA_ARGS__)
#define NLOG_ERROR(name, ...) SHELLRELAY_LOG(name, Error, __VA_ARGS__)

} // namespace log
} // namespace shellrelay
