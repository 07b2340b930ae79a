#include "db/migration_runner.hpp"
#include "common/log.hpp"
#include "db/statement_parser.hpp"
#include <sqlite3.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <regex>

namespace novelforge::db {

namespace {

const log::Logger logger{log::MIGRATE_LOGGER};

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// First line of a statement, for log messages
std::string head(const std::string& statement) {
    auto end = statement.find('\n');
    std::string line = statement.substr(0, std::min<size_t>(end, 80));
    return line.size() < statement.size() ? line + "..." : line;
}

MigrationError registry_failure(RegistryError error, int version = 0) {
    return MigrationError{MigrationErrorKind::REGISTRY_FAILED, version, registry_error_message(error)};
}

} // anonymous namespace

std::string migration_error_message(const MigrationError& error) {
    std::string message;
    switch (error.kind) {
        case MigrationErrorKind::REGISTRY_FAILED: message = "Migration registry unavailable"; break;
        case MigrationErrorKind::SCRIPT_UNREADABLE: message = "Migration script unreadable"; break;
        case MigrationErrorKind::STATEMENT_FAILED: message = "Migration statement failed"; break;
        case MigrationErrorKind::RECORD_FAILED: message = "Failed to record migration"; break;
        case MigrationErrorKind::TRANSACTION_FAILED: message = "Migration transaction failed"; break;
        case MigrationErrorKind::ROLLBACK_UNSUPPORTED: message = "Rollback not supported"; break;
        default: message = "Unknown migration error"; break;
    }
    if (error.version > 0) {
        message += " (version " + std::to_string(error.version) + ")";
    }
    if (!error.detail.empty()) {
        message += ": " + error.detail;
    }
    return message;
}

MigrationRunner::MigrationRunner(Connection& db, MigrationRegistry& registry,
                                 BackupStore& backups, MigrationCatalog catalog)
    : db_(db), registry_(registry), backups_(backups), catalog_(std::move(catalog)) {}

bool MigrationRunner::is_ignorable_error(const DbError& error, const std::string& statement) {
    if (error.code != SQLITE_ERROR) {
        return false;
    }

    static const std::regex replayable(
        R"(^\s*(CREATE\b|ALTER\s+TABLE\s+[\s\S]+?\s+ADD\b))",
        std::regex::ECMAScript | std::regex::icase);
    if (!std::regex_search(statement, replayable)) {
        return false;
    }

    auto message = to_lower(error.message);
    return message.find("already exists") != std::string::npos ||
           message.find("duplicate column") != std::string::npos;
}

// Version the apply loop starts from: the registry once it holds rows,
// otherwise the legacy ledger it will be seeded from. Read-only: neither
// table is created or modified.
std::expected<int, MigrationError> MigrationRunner::known_version() {
    auto current = registry_.current_version();
    if (!current) {
        return std::unexpected(registry_failure(current.error()));
    }
    if (*current > 0) {
        return *current;
    }
    auto legacy = registry_.legacy_version();
    if (!legacy) {
        return std::unexpected(registry_failure(legacy.error()));
    }
    return *legacy;
}

std::expected<MigrationReport, MigrationError> MigrationRunner::run_migrations() {
    MigrationReport report;

    auto known = known_version();
    if (!known) {
        return std::unexpected(known.error());
    }
    bool pending = catalog_.latest_version() > *known;

    logger.info("Current schema version: {}, latest: {}", *known, catalog_.latest_version());

    if (pending && db_.created()) {
        logger.info("New database, skipping pre-migration backup");
    } else if (pending) {
        auto backup = backups_.create_backup_sync("pre-migration");
        if (!backup.success) {
            logger.warn("Pre-migration backup failed, continuing: {}", backup.error);
        }
        report.backup_path = backup.backup_path;
    }

    if (auto ensured = registry_.ensure_registry_table(); !ensured) {
        return std::unexpected(registry_failure(ensured.error()));
    }
    if (auto imported = registry_.migrate_from_old_schema(); !imported) {
        return std::unexpected(registry_failure(imported.error()));
    }

    auto current = registry_.current_version();
    if (!current) {
        return std::unexpected(registry_failure(current.error()));
    }
    report.from_version = *current;
    report.to_version = *current;

    for (const auto& entry : catalog_.entries()) {
        if (entry.version <= *current) {
            continue;
        }

        auto script = MigrationCatalog::load(entry);
        if (!script) {
            return std::unexpected(MigrationError{MigrationErrorKind::SCRIPT_UNREADABLE, entry.version,
                                                  catalog_error_message(script.error())});
        }
        if (!*script) {
            logger.info("Migration {:03} ({}) not found, skipping", entry.version, entry.source_name());
            report.skipped_missing.push_back(entry.version);
            continue;
        }

        logger.info("Applying migration {:03}: {}", entry.version, entry.source_name());

        if (auto applied = apply(entry, **script, report); !applied) {
            return std::unexpected(applied.error());
        }

        report.applied.push_back(entry.version);
        report.to_version = entry.version;
        logger.info("Migration {:03} applied successfully", entry.version);
    }

    if (report.applied.empty()) {
        logger.info("Schema is up to date (version {})", report.to_version);
    } else {
        logger.info("Migrated schema from version {} to {} ({} statement(s), {} tolerated)",
                    report.from_version, report.to_version,
                    report.statements_executed, report.statements_tolerated);
    }
    return report;
}

std::expected<void, MigrationError> MigrationRunner::apply(const MigrationEntry& entry,
                                                           const std::string& script,
                                                           MigrationReport& report) {
    auto start = std::chrono::steady_clock::now();

    if (auto begin = db_.execute("BEGIN"); !begin) {
        logger.error("Failed to begin transaction: {}", db_error_message(begin.error()));
        return std::unexpected(MigrationError{MigrationErrorKind::TRANSACTION_FAILED, entry.version,
                                              db_error_message(begin.error())});
    }

    for (const auto& statement : StatementParser::parse(script)) {
        ++report.statements_executed;

        auto result = db_.execute(statement);
        if (result) {
            continue;
        }

        if (is_ignorable_error(result.error(), statement)) {
            logger.warn("Migration {:03}: skipping already applied change ({}): {}",
                        entry.version, result.error().message, head(statement));
            ++report.statements_tolerated;
            continue;
        }

        logger.error("Migration {:03} failed: {} in: {}",
                     entry.version, db_error_message(result.error()), head(statement));
        rollback(entry.version);
        return std::unexpected(MigrationError{MigrationErrorKind::STATEMENT_FAILED, entry.version,
                                              db_error_message(result.error())});
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();

    auto recorded = registry_.record_migration(entry.version, entry.name, false,
                                               MigrationRegistry::checksum(script), elapsed);
    if (!recorded) {
        rollback(entry.version);
        return std::unexpected(MigrationError{MigrationErrorKind::RECORD_FAILED, entry.version,
                                              registry_error_message(recorded.error())});
    }

    if (auto commit = db_.execute("COMMIT"); !commit) {
        logger.error("Failed to commit migration {:03}: {}", entry.version, db_error_message(commit.error()));
        rollback(entry.version);
        return std::unexpected(MigrationError{MigrationErrorKind::TRANSACTION_FAILED, entry.version,
                                              db_error_message(commit.error())});
    }
    return {};
}

void MigrationRunner::rollback(int version) {
    // Some errors (SQLITE_FULL, SQLITE_IOERR, ...) already rolled back
    if (!db_.in_transaction()) {
        return;
    }
    if (auto result = db_.execute("ROLLBACK"); !result) {
        logger.error("Rollback of migration {:03} failed: {}", version, db_error_message(result.error()));
    } else {
        logger.info("Migration {:03} rolled back", version);
    }
}

std::expected<MigrationStatus, MigrationError> MigrationRunner::get_migration_status() {
    MigrationStatus status;

    auto known = known_version();
    if (!known) {
        return std::unexpected(known.error());
    }
    status.current_version = *known;

    auto applied = registry_.applied_migrations();
    if (!applied) {
        return std::unexpected(registry_failure(applied.error()));
    }
    status.applied_count = applied->size();

    for (const auto& entry : catalog_.entries()) {
        if (entry.version > status.current_version) {
            status.pending_file_names.push_back(entry.source_name());
        }
    }
    return status;
}

std::expected<void, MigrationError> MigrationRunner::rollback_last_migration() {
    auto current = registry_.current_version();
    if (!current) {
        return std::unexpected(registry_failure(current.error()));
    }

    auto backup = backups_.create_backup_sync("pre-rollback");
    if (!backup.success) {
        logger.warn("Pre-rollback backup failed: {}", backup.error);
    }

    logger.warn("Rollback of migration {} requested, but no down-scripts are stored; "
                "restore a backup instead", *current);
    return std::unexpected(MigrationError{MigrationErrorKind::ROLLBACK_UNSUPPORTED, *current,
                                          "restore a backup to undo migrations"});
}

std::expected<std::vector<int>, MigrationError> MigrationRunner::verify_integrity() {
    std::vector<std::pair<int, std::string>> scripts;

    for (const auto& entry : catalog_.entries()) {
        auto script = MigrationCatalog::load(entry);
        if (!script) {
            return std::unexpected(MigrationError{MigrationErrorKind::SCRIPT_UNREADABLE, entry.version,
                                                  catalog_error_message(script.error())});
        }
        if (*script) {
            scripts.emplace_back(entry.version, std::move(**script));
        }
    }

    auto modified = registry_.verify_integrity(scripts);
    if (!modified) {
        return std::unexpected(registry_failure(modified.error()));
    }
    return std::move(*modified);
}

} // namespace novelforge::db
