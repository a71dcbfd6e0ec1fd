#include "common/log.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace shellrelay::log {

namespace {

struct Registry {
    std::mutex mutex;
    LogConfig config;
    std::vector<spdlog::sink_ptr> sinks;
    std::unordered_map<std::string, std::shared_ptr<spdlog::logger>> channels;
};

Registry& registry() {
    static Registry instance;
    return instance;
}

std::atomic<Level> g_level{Level::Info};

std::vector<spdlog::sink_ptr> build_sinks(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }
    if (!config.file_path.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.file_path, config.max_file_size, config.max_files));
    }

    for (auto& sink : sinks) {
        sink->set_level(to_spdlog_level(config.level));
    }
    return sinks;
}

// Caller holds the registry mutex
std::shared_ptr<spdlog::logger> make_channel(Registry& reg, const std::string& name) {
    if (reg.sinks.empty() && reg.config.console) {
        reg.sinks = build_sinks(reg.config);
    }

    auto logger = std::make_shared<spdlog::logger>(name, reg.sinks.begin(), reg.sinks.end());
    logger->set_level(to_spdlog_level(reg.config.level));
    logger->set_pattern(reg.config.pattern);

    spdlog::drop(name);
    spdlog::register_logger(logger);
    return logger;
}

} // anonymous namespace

spdlog::level::level_enum to_spdlog_level(Level level) {
    switch (level) {
        case Level::Trace: return spdlog::level::trace;
        case Level::Debug: return spdlog::level::debug;
        case Level::Info: return spdlog::level::info;
        case Level::Warn: return spdlog::level::warn;
        case Level::Error: return spdlog::level::err;
        case Level::Critical: return spdlog::level::critical;
        case Level::Off: return spdlog::level::off;
    }
    return spdlog::level::info;
}

Level parse_level(std::string_view level) {
    std::string name(level);
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (name == "trace") return Level::Trace;
    if (name == "debug") return Level::Debug;
    if (name == "warn" || name == "warning") return Level::Warn;
    if (name == "error" || name == "err") return Level::Error;
    if (name == "critical") return Level::Critical;
    if (name == "off" || name == "none") return Level::Off;
    return Level::Info;
}

void init(const LogConfig& config) {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    reg.config = config;
    reg.sinks = build_sinks(config);
    g_level.store(config.level, std::memory_order_relaxed);

    for (auto& [name, logger] : reg.channels) {
        logger = make_channel(reg, name);
    }
    if (!reg.channels.contains(MAIN_LOGGER)) {
        reg.channels[MAIN_LOGGER] = make_channel(reg, MAIN_LOGGER);
    }
}

void init_from_env() {
    LogConfig config;
    if (const char* level = std::getenv("SHELLRELAY_LOG_LEVEL")) {
        config.level = parse_level(level);
    }
    if (const char* file = std::getenv("SHELLRELAY_LOG_FILE")) {
        config.file_path = file;
    }
    init(config);
}

std::shared_ptr<spdlog::logger> channel(const std::string& name) {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    auto& slot = reg.channels[name];
    if (!slot) {
        slot = make_channel(reg, name);
    }
    return slot;
}

void set_level(Level level) {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    reg.config.level = level;
    g_level.store(level, std::memory_order_relaxed);

    const auto spd = to_spdlog_level(level);
    for (auto& sink : reg.sinks) {
        sink->set_level(spd);
    }
    for (auto& [name, logger] : reg.channels) {
        logger->set_level(spd);
    }
}

bool enabled(Level level) {
    const auto current = g_level.load(std::memory_order_relaxed);
    return current != Level::Off && level >= current;
}

void shutdown() {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    for (auto& [name, logger] : reg.channels) {
        logger->flush();
    }
    reg.channels.clear();
    reg.sinks.clear();
    spdlog::shutdown();
}

} // namespace shellrelay::log
