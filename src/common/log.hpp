#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <memory>
#include <string>
#include <string_view>

namespace novelforge {
namespace log {

// ============================================================================
// Logger Names
// ============================================================================
constexpr const char* MAIN_LOGGER = "novelforge";
constexpr const char* MIGRATE_LOGGER = "migrate";
constexpr const char* REGISTRY_LOGGER = "registry";
constexpr const char* BACKUP_LOGGER = "backup";
constexpr const char* PARSER_LOGGER = "parser";
constexpr const char* CLI_LOGGER = "cli";

// ============================================================================
// Log Levels (runtime configurable)
// ============================================================================
enum class Level {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Critical = 5,
    Off = 6
};

// ============================================================================
// Log Configuration
// ============================================================================
struct LogConfig {
    Level level{Level::Info};
    std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v"};
    bool console{true};
    std::string file_path;
    size_t max_file_size{10 * 1024 * 1024};  // 10 MB
    size_t max_files{5};
};

// Initialize logging with the given configuration. Later calls are ignored
// until shutdown().
void init(const LogConfig& config = LogConfig{});

// Get a logger by name, creates if doesn't exist
std::shared_ptr<spdlog::logger> get(const std::string& name = MAIN_LOGGER);

// Set log level for all loggers (runtime configurable)
void set_level(Level level);

Level get_level();

bool is_level_enabled(Level level);

// Parse "debug", "warning", "err" ... Unknown names map to Info.
Level parse_level(std::string_view level);

void shutdown();

// ============================================================================
// Logger class for component-specific logging
// ============================================================================

class Logger {
public:
    explicit Logger(std::string name) : name_(std::move(name)) {}

    template<typename... Args>
    void trace(fmt::format_string<Args...> fmt, Args&&... args) const {
        if (is_level_enabled(Level::Trace)) {
            get(name_)->trace(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void debug(fmt::format_string<Args...> fmt, Args&&... args) const {
        if (is_level_enabled(Level::Debug)) {
            get(name_)->debug(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void info(fmt::format_string<Args...> fmt, Args&&... args) const {
        if (is_level_enabled(Level::Info)) {
            get(name_)->info(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void warn(fmt::format_string<Args...> fmt, Args&&... args) const {
        if (is_level_enabled(Level::Warn)) {
            get(name_)->warn(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void error(fmt::format_string<Args...> fmt, Args&&... args) const {
        if (is_level_enabled(Level::Error)) {
            get(name_)->error(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void critical(fmt::format_string<Args...> fmt, Args&&... args) const {
        if (is_level_enabled(Level::Critical)) {
            get(name_)->critical(fmt, std::forward<Args>(args)...);
        }
    }

    const std::string& name() const { return name_; }

private:
    std::string name_;
};

} // namespace log
} // namespace novelforge
