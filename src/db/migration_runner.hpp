#pragma once

#include "db/backup_store.hpp"
#include "db/migration_catalog.hpp"
#include "db/migration_registry.hpp"
#include "db/sqlite.hpp"
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace novelforge::db {

// ============================================================================
// Errors
// ============================================================================

enum class MigrationErrorKind {
    REGISTRY_FAILED,
    SCRIPT_UNREADABLE,
    STATEMENT_FAILED,
    RECORD_FAILED,
    TRANSACTION_FAILED,
    ROLLBACK_UNSUPPORTED,
};

struct MigrationError {
    MigrationErrorKind kind = MigrationErrorKind::STATEMENT_FAILED;
    int version = 0;            // 0 when no particular migration is involved
    std::string detail;
};

std::string migration_error_message(const MigrationError& error);

// ============================================================================
// Results
// ============================================================================

struct MigrationReport {
    int from_version = 0;
    int to_version = 0;
    std::vector<int> applied;
    std::vector<int> skipped_missing;
    int statements_executed = 0;
    int statements_tolerated = 0;
    std::optional<std::filesystem::path> backup_path;
};

struct MigrationStatus {
    int current_version = 0;
    size_t applied_count = 0;
    std::vector<std::string> pending_file_names;
};

// ============================================================================
// MigrationRunner
// ============================================================================
// Brings a database up to the catalog's latest version. Each migration runs
// in its own transaction and is recorded in the registry before COMMIT, so a
// failed migration leaves neither schema changes nor a registry row behind.
class MigrationRunner {
public:
    MigrationRunner(Connection& db, MigrationRegistry& registry,
                    BackupStore& backups, MigrationCatalog catalog);

    // Safe to call on every start; a no-op when nothing is pending
    std::expected<MigrationReport, MigrationError> run_migrations();

    std::expected<MigrationStatus, MigrationError> get_migration_status();

    // Takes a pre-rollback snapshot, then refuses: no down-scripts exist
    std::expected<void, MigrationError> rollback_last_migration();

    // Applied versions whose script changed since it was recorded
    std::expected<std::vector<int>, MigrationError> verify_integrity();

    // Replay failures that mean the change is already in place: an
    // "already exists" or "duplicate column" SQLITE_ERROR raised by a
    // CREATE or ALTER TABLE ... ADD statement.
    static bool is_ignorable_error(const DbError& error, const std::string& statement);

    const MigrationCatalog& catalog() const { return catalog_; }

private:
    std::expected<int, MigrationError> known_version();
    std::expected<void, MigrationError> apply(const MigrationEntry& entry,
                                              const std::string& script,
                                              MigrationReport& report);
    void rollback(int version);

    Connection& db_;
    MigrationRegistry& registry_;
    BackupStore& backups_;
    MigrationCatalog catalog_;
};

} // namespace novelforge::db
