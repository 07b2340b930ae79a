#include "common/log.hpp"
#include <atomic>
#include <cctype>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace novelforge::log {

namespace {

std::mutex g_mutex;
std::unordered_map<std::string, std::shared_ptr<spdlog::logger>> g_loggers;
LogConfig g_config;
bool g_initialized = false;
std::atomic<Level> g_current_level{Level::Info};

spdlog::level::level_enum to_spdlog_level(Level level) {
    switch (level) {
        case Level::Trace: return spdlog::level::trace;
        case Level::Debug: return spdlog::level::debug;
        case Level::Info: return spdlog::level::info;
        case Level::Warn: return spdlog::level::warn;
        case Level::Error: return spdlog::level::err;
        case Level::Critical: return spdlog::level::critical;
        case Level::Off: return spdlog::level::off;
        default: return spdlog::level::info;
    }
}

std::shared_ptr<spdlog::logger> create_logger(const std::string& name) {
    // A previous shutdown() may have left the name registered with spdlog
    spdlog::drop(name);

    std::vector<spdlog::sink_ptr> sinks;
    auto spdlog_level = to_spdlog_level(g_config.level);

    if (g_config.console) {
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_level(spdlog_level);
        sinks.push_back(console_sink);
    }

    if (!g_config.file_path.empty()) {
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            g_config.file_path,
            g_config.max_file_size,
            g_config.max_files
        );
        file_sink->set_level(spdlog_level);
        sinks.push_back(file_sink);
    }

    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(spdlog_level);
    logger->set_pattern(g_config.pattern);

    spdlog::register_logger(logger);

    return logger;
}

} // anonymous namespace

Level parse_level(std::string_view level) {
    std::string lower;
    lower.reserve(level.size());
    for (char c : level) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    if (lower == "trace") return Level::Trace;
    if (lower == "debug") return Level::Debug;
    if (lower == "info") return Level::Info;
    if (lower == "warn" || lower == "warning") return Level::Warn;
    if (lower == "error" || lower == "err") return Level::Error;
    if (lower == "critical" || lower == "crit") return Level::Critical;
    if (lower == "off") return Level::Off;
    return Level::Info;
}

void init(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(g_mutex);

    if (g_initialized) {
        return;
    }

    g_config = config;
    g_current_level.store(config.level, std::memory_order_relaxed);
    g_loggers[MAIN_LOGGER] = create_logger(MAIN_LOGGER);
    g_initialized = true;
}

std::shared_ptr<spdlog::logger> get(const std::string& name) {
    std::lock_guard<std::mutex> lock(g_mutex);

    // Auto-initialize with whatever g_config holds (set_level may have run first)
    if (!g_initialized) {
        g_loggers[MAIN_LOGGER] = create_logger(MAIN_LOGGER);
        g_initialized = true;
    }

    auto it = g_loggers.find(name);
    if (it != g_loggers.end()) {
        return it->second;
    }

    auto logger = create_logger(name);
    g_loggers[name] = logger;
    return logger;
}

void set_level(Level level) {
    std::lock_guard<std::mutex> lock(g_mutex);
    g_config.level = level;
    g_current_level.store(level, std::memory_order_relaxed);

    auto spdlog_level = to_spdlog_level(level);
    spdlog::set_level(spdlog_level);

    for (auto& [name, logger] : g_loggers) {
        logger->set_level(spdlog_level);
        for (auto& sink : logger->sinks()) {
            sink->set_level(spdlog_level);
        }
    }
}

Level get_level() {
    return g_current_level.load(std::memory_order_relaxed);
}

bool is_level_enabled(Level level) {
    return static_cast<int>(level) >= static_cast<int>(g_current_level.load(std::memory_order_relaxed));
}

void shutdown() {
    std::lock_guard<std::mutex> lock(g_mutex);
    g_loggers.clear();
    spdlog::shutdown();
    g_initialized = false;
}

} // namespace novelforge::log
