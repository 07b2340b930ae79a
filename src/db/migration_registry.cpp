#include "db/migration_registry.hpp"
#include "common/log.hpp"
#include <sodium.h>
#include <sqlite3.h>
#include <array>
#include <cctype>

namespace novelforge::db {

namespace {

const log::Logger logger{log::REGISTRY_LOGGER};

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

RegistryError query_failed(Connection& db, std::string_view what) {
    logger.error("{}: {}", what, db_error_message(db.last_error()));
    return RegistryError::QUERY_FAILED;
}

} // anonymous namespace

std::string registry_error_message(RegistryError error) {
    switch (error) {
        case RegistryError::DUPLICATE_VERSION: return "Migration version already recorded";
        case RegistryError::QUERY_FAILED: return "Migration registry query failed";
        default: return "Unknown registry error";
    }
}

MigrationRegistry::MigrationRegistry(Connection& db) : db_(db) {}

std::expected<void, RegistryError> MigrationRegistry::ensure_registry_table() {
    const char* schema = R"(
        CREATE TABLE IF NOT EXISTS migration_registry (
            version INTEGER PRIMARY KEY,
            name TEXT NOT NULL,
            applied_at TEXT NOT NULL DEFAULT (datetime('now')),
            can_rollback INTEGER NOT NULL DEFAULT 0,
            checksum TEXT NOT NULL DEFAULT '',
            execution_time_ms INTEGER NOT NULL DEFAULT 0
        )
    )";

    if (auto result = db_.execute(schema); !result) {
        logger.error("Failed to create migration registry: {}", db_error_message(result.error()));
        return std::unexpected(RegistryError::QUERY_FAILED);
    }

    logger.debug("Migration registry table ensured");
    return {};
}

std::expected<int, RegistryError> MigrationRegistry::current_version() {
    if (!db_.table_exists(TABLE)) {
        return 0;
    }

    auto stmt = db_.prepare("SELECT COALESCE(MAX(version), 0) FROM migration_registry");
    if (!stmt) {
        return std::unexpected(query_failed(db_, "Failed to read current version"));
    }
    if (stmt->step() != SQLITE_ROW) {
        return std::unexpected(query_failed(db_, "Failed to read current version"));
    }
    return stmt->column_int(0);
}

std::expected<int, RegistryError> MigrationRegistry::legacy_version() {
    if (!db_.table_exists(LEGACY_TABLE)) {
        return 0;
    }

    auto stmt = db_.prepare("SELECT COALESCE(MAX(version), 0) FROM schema_migrations");
    if (!stmt || stmt->step() != SQLITE_ROW) {
        return std::unexpected(query_failed(db_, "Failed to read legacy version"));
    }
    return stmt->column_int(0);
}

std::expected<bool, RegistryError> MigrationRegistry::is_applied(int version) {
    if (!db_.table_exists(TABLE)) {
        return false;
    }

    auto stmt = db_.prepare("SELECT 1 FROM migration_registry WHERE version = ?");
    if (!stmt || !stmt->bind_int(1, version)) {
        return std::unexpected(query_failed(db_, "Failed to look up migration"));
    }

    int rc = stmt->step();
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    return std::unexpected(query_failed(db_, "Failed to look up migration"));
}

std::expected<void, RegistryError> MigrationRegistry::record_migration(
    int version, const std::string& name, bool can_rollback,
    const std::string& checksum, int64_t execution_time_ms) {

    auto stmt = db_.prepare(
        "INSERT INTO migration_registry (version, name, can_rollback, checksum, execution_time_ms) "
        "VALUES (?, ?, ?, ?, ?)");
    if (!stmt) {
        return std::unexpected(query_failed(db_, "Failed to prepare migration record"));
    }

    if (!stmt->bind_int(1, version) ||
        !stmt->bind_text(2, name) ||
        !stmt->bind_int(3, can_rollback ? 1 : 0) ||
        !stmt->bind_text(4, checksum) ||
        !stmt->bind_int64(5, execution_time_ms)) {
        return std::unexpected(query_failed(db_, "Failed to bind migration record"));
    }

    if (stmt->step() != SQLITE_DONE) {
        auto error = db_.last_error();
        if (error.extended_code == SQLITE_CONSTRAINT_PRIMARYKEY ||
            error.extended_code == SQLITE_CONSTRAINT_UNIQUE) {
            logger.error("Migration {} is already recorded", version);
            return std::unexpected(RegistryError::DUPLICATE_VERSION);
        }
        return std::unexpected(query_failed(db_, "Failed to record migration"));
    }

    logger.info("Recorded migration {} ({}) checksum={} time={}ms",
                version, name, checksum.empty() ? "-" : checksum, execution_time_ms);
    return {};
}

std::expected<std::vector<MigrationRecord>, RegistryError> MigrationRegistry::applied_migrations() {
    std::vector<MigrationRecord> records;
    if (!db_.table_exists(TABLE)) {
        return records;
    }

    auto stmt = db_.prepare(
        "SELECT version, name, applied_at, can_rollback, checksum, execution_time_ms "
        "FROM migration_registry ORDER BY version ASC");
    if (!stmt) {
        return std::unexpected(query_failed(db_, "Failed to list migrations"));
    }

    int rc;
    while ((rc = stmt->step()) == SQLITE_ROW) {
        MigrationRecord record;
        record.version = stmt->column_int(0);
        record.name = stmt->column_text(1);
        record.applied_at = stmt->column_text(2);
        record.can_rollback = stmt->column_int(3) != 0;
        record.checksum = stmt->column_text(4);
        record.execution_time_ms = stmt->column_int64(5);
        records.push_back(std::move(record));
    }
    if (rc != SQLITE_DONE) {
        return std::unexpected(query_failed(db_, "Failed to list migrations"));
    }

    return records;
}

std::expected<int, RegistryError> MigrationRegistry::migrate_from_old_schema() {
    if (!db_.table_exists(LEGACY_TABLE)) {
        logger.debug("No legacy schema_migrations table");
        return 0;
    }

    auto current = current_version();
    if (!current) {
        return std::unexpected(current.error());
    }
    if (*current > 0) {
        logger.debug("Registry already populated, skipping legacy import");
        return 0;
    }

    auto imported = db_.execute(R"(
        INSERT INTO migration_registry
            (version, name, applied_at, can_rollback, checksum, execution_time_ms)
        SELECT version,
               printf('migration_%03d', version),
               COALESCE(applied_at, datetime('now')),
               0, 'legacy', 0
        FROM schema_migrations
        ORDER BY version ASC
    )");
    if (!imported) {
        logger.error("Failed to import legacy ledger: {}", db_error_message(imported.error()));
        return std::unexpected(RegistryError::QUERY_FAILED);
    }

    int count = sqlite3_changes(db_.handle());
    if (count > 0) {
        logger.info("Imported {} migration(s) from legacy schema_migrations", count);
    }
    return count;
}

std::expected<std::vector<int>, RegistryError> MigrationRegistry::verify_integrity(
    const std::vector<std::pair<int, std::string>>& scripts) {

    std::vector<int> modified;
    if (!db_.table_exists(TABLE)) {
        return modified;
    }

    auto stmt = db_.prepare("SELECT checksum FROM migration_registry WHERE version = ?");
    if (!stmt) {
        return std::unexpected(query_failed(db_, "Failed to prepare checksum lookup"));
    }

    for (const auto& [version, script] : scripts) {
        stmt->reset();
        if (!stmt->bind_int(1, version)) {
            return std::unexpected(query_failed(db_, "Failed to bind checksum lookup"));
        }

        int rc = stmt->step();
        if (rc == SQLITE_DONE) continue;
        if (rc != SQLITE_ROW) {
            return std::unexpected(query_failed(db_, "Failed to read checksum"));
        }

        auto recorded = stmt->column_text(0);
        if (recorded.empty() || recorded == LEGACY_CHECKSUM) continue;

        auto actual = checksum(script);
        if (recorded != actual) {
            logger.warn("Migration {} modified after being applied (expected {}, actual {})",
                        version, recorded, actual);
            modified.push_back(version);
        }
    }

    return modified;
}

std::string MigrationRegistry::checksum(std::string_view script) {
    static const bool sodium_ready = [] {
        if (sodium_init() < 0) {
            logger.error("libsodium initialization failed");
            return false;
        }
        return true;
    }();
    if (!sodium_ready) {
        return {};
    }

    auto text = trim(script);
    std::array<unsigned char, crypto_hash_sha256_BYTES> digest{};
    crypto_hash_sha256(digest.data(),
                       reinterpret_cast<const unsigned char*>(text.data()),
                       text.size());

    std::array<char, crypto_hash_sha256_BYTES * 2 + 1> hex{};
    sodium_bin2hex(hex.data(), hex.size(), digest.data(), digest.size());
    return std::string(hex.data(), 16);
}

} // namespace novelforge::db
