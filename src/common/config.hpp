#pragma once

#include <cstddef>
#include <expected>
#include <filesystem>
#include <string>

namespace novelforge {

// ============================================================================
// Configuration Error
// ============================================================================

enum class ConfigError {
    FILE_NOT_FOUND,
    PARSE_ERROR,
    INVALID_VALUE,
};

std::string config_error_message(ConfigError error);

// ============================================================================
// Subsystem Configuration
// ============================================================================

struct Config {
    // Database settings
    std::string database_path = "data/novelforge.db";

    // Backup settings
    std::string backup_dir = "data/backups";
    size_t max_backups = 10;

    // Migration scripts: <schema_dir>/schema.sql and <schema_dir>/migrations/
    std::string schema_dir = "schema";

    // Logging
    std::string log_level = "info";
    std::string log_file;

    std::filesystem::path base_schema_path() const {
        return std::filesystem::path(schema_dir) / "schema.sql";
    }

    std::filesystem::path migrations_dir() const {
        return std::filesystem::path(schema_dir) / "migrations";
    }

    // Load from JSON file
    static std::expected<Config, ConfigError> load(const std::string& path);

    // Load from JSON string (for testing)
    static std::expected<Config, ConfigError> parse(const std::string& json_content);

    // Overlay NOVELFORGE_DB_PATH, NOVELFORGE_BACKUP_DIR,
    // NOVELFORGE_BACKUP_RETENTION, NOVELFORGE_SCHEMA_DIR,
    // NOVELFORGE_LOG_LEVEL and NOVELFORGE_LOG_FILE onto this config.
    std::expected<void, ConfigError> apply_env();
};

} // namespace novelforge
