#pragma once

#include "db/sqlite.hpp"
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace novelforge::db {

enum class RegistryError {
    DUPLICATE_VERSION,
    QUERY_FAILED,
};

std::string registry_error_message(RegistryError error);

// One row of migration_registry
struct MigrationRecord {
    int version = 0;
    std::string name;
    std::string applied_at;     // "YYYY-MM-DD HH:MM:SS" UTC
    bool can_rollback = false;
    std::string checksum;       // "legacy" for rows imported from schema_migrations
    int64_t execution_time_ms = 0;
};

// Ledger of applied schema versions, stored in the migrated database itself.
// Every call queries the database; nothing is cached.
class MigrationRegistry {
public:
    static constexpr const char* TABLE = "migration_registry";
    static constexpr const char* LEGACY_TABLE = "schema_migrations";
    static constexpr const char* LEGACY_CHECKSUM = "legacy";

    explicit MigrationRegistry(Connection& db);

    std::expected<void, RegistryError> ensure_registry_table();

    // Highest recorded version, 0 for an empty or missing ledger
    std::expected<int, RegistryError> current_version();

    // Highest version in the legacy single-column ledger, 0 when it is absent
    std::expected<int, RegistryError> legacy_version();

    std::expected<bool, RegistryError> is_applied(int version);

    std::expected<void, RegistryError> record_migration(
        int version, const std::string& name, bool can_rollback,
        const std::string& checksum = {}, int64_t execution_time_ms = 0);

    // Ascending by version
    std::expected<std::vector<MigrationRecord>, RegistryError> applied_migrations();

    // Copies schema_migrations rows into an empty registry. Returns the
    // number of imported rows; the legacy table itself is not modified.
    std::expected<int, RegistryError> migrate_from_old_schema();

    // Versions whose recorded checksum no longer matches the given script
    std::expected<std::vector<int>, RegistryError> verify_integrity(
        const std::vector<std::pair<int, std::string>>& scripts);

    // First 16 hex chars of SHA-256 over the trimmed script
    static std::string checksum(std::string_view script);

private:
    Connection& db_;
};

} // namespace novelforge::db
