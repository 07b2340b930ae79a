#include "common/config.hpp"
#include "common/log.hpp"
#include <boost/json.hpp>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace json = boost::json;

namespace {

std::string jstr(const json::object& obj, std::string_view key, const std::string& def = {}) {
    if (auto it = obj.find(key); it != obj.end() && it->value().is_string())
        return std::string(it->value().as_string());
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

const char* env(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

}  // anonymous namespace

namespace novelforge {

namespace {
const log::Logger logger{log::MAIN_LOGGER};
}  // anonymous namespace

std::string config_error_message(ConfigError error) {
    switch (error) {
        case ConfigError::FILE_NOT_FOUND: return "Configuration file not found";
        case ConfigError::PARSE_ERROR: return "Failed to parse configuration file";
        case ConfigError::INVALID_VALUE: return "Invalid configuration value";
        default: return "Unknown configuration error";
    }
}

std::expected<Config, ConfigError> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(ConfigError::FILE_NOT_FOUND);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str());
}

std::expected<Config, ConfigError> Config::parse(const std::string& json_content) {
    try {
        auto jv = json::parse(json_content);
        auto& root = jv.as_object();

        Config config;

        if (auto* db = jsection(root, "database")) {
            config.database_path = jstr(*db, "path", config.database_path);
        }

        if (auto* backup = jsection(root, "backup")) {
            config.backup_dir = jstr(*backup, "dir", config.backup_dir);
            auto keep = jint(*backup, "max_backups", static_cast<int64_t>(config.max_backups));
            if (keep < 1) {
                logger.error("backup.max_backups must be at least 1, got {}", keep);
                return std::unexpected(ConfigError::INVALID_VALUE);
            }
            config.max_backups = static_cast<size_t>(keep);
        }

        if (auto* schema = jsection(root, "schema")) {
            config.schema_dir = jstr(*schema, "dir", config.schema_dir);
        }

        if (auto* log_sec = jsection(root, "log")) {
            config.log_level = jstr(*log_sec, "level", config.log_level);
            config.log_file = jstr(*log_sec, "file", config.log_file);
        }

        if (config.database_path.empty()) {
            logger.error("database.path must not be empty");
            return std::unexpected(ConfigError::INVALID_VALUE);
        }

        return config;

    } catch (const boost::system::system_error& e) {
        logger.error("JSON parse error: {}", e.what());
        return std::unexpected(ConfigError::PARSE_ERROR);
    } catch (const std::exception& e) {
        logger.error("Config parse error: {}", e.what());
        return std::unexpected(ConfigError::PARSE_ERROR);
    }
}

std::expected<void, ConfigError> Config::apply_env() {
    if (auto v = env("NOVELFORGE_DB_PATH")) database_path = v;
    if (auto v = env("NOVELFORGE_BACKUP_DIR")) backup_dir = v;
    if (auto v = env("NOVELFORGE_SCHEMA_DIR")) schema_dir = v;
    if (auto v = env("NOVELFORGE_LOG_LEVEL")) log_level = v;
    if (auto v = env("NOVELFORGE_LOG_FILE")) log_file = v;

    if (auto v = env("NOVELFORGE_BACKUP_RETENTION")) {
        std::string_view text(v);
        size_t keep = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), keep);
        if (ec != std::errc{} || ptr != text.data() + text.size() || keep == 0) {
            logger.error("NOVELFORGE_BACKUP_RETENTION must be a positive integer, got '{}'", text);
            return std::unexpected(ConfigError::INVALID_VALUE);
        }
        max_backups = keep;
    }

    return {};
}

} // namespace novelforge
