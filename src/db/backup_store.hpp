#pragma once

#include "db/sqlite.hpp"
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace novelforge::db {

namespace asio = boost::asio;

// ============================================================================
// Errors
// ============================================================================

enum class BackupErrorKind {
    BACKUP_FAILED,
    NOT_FOUND,
    INVALID_BACKUP,
    RESTORE_FAILED,
};

struct BackupError {
    BackupErrorKind kind = BackupErrorKind::BACKUP_FAILED;
    std::string detail;
};

std::string backup_error_message(const BackupError& error);

// ============================================================================
// Types
// ============================================================================

struct BackupConfig {
    std::filesystem::path backup_dir = "data/backups";
    size_t max_backups = 10;
    // File copied by create_backup_sync(); empty means the connection's path
    std::filesystem::path database_path;
    std::string product = "novelforge";
    int pages_per_step = 100;
};

struct BackupSnapshot {
    std::string filename;
    std::filesystem::path path;
    uintmax_t size_bytes = 0;
    std::chrono::system_clock::time_point created_at;
    std::string reason;
    int sequence = 0;           // collision counter within one second
};

struct BackupResult {
    bool success = false;
    std::optional<std::filesystem::path> backup_path;
    std::string error;
    int64_t duration_ms = 0;
    uintmax_t size_bytes = 0;
};

struct BackupStats {
    size_t count = 0;
    uintmax_t total_size_bytes = 0;
    std::optional<BackupSnapshot> oldest;
    std::optional<BackupSnapshot> newest;
};

// ============================================================================
// BackupStore
// ============================================================================
// Point-in-time snapshots of one database. A snapshot is the main file plus
// optional -wal and -shm siblings; restore and delete treat them as one unit.
class BackupStore {
public:
    BackupStore(Connection& db, BackupConfig config);

    // Online backup through sqlite3_backup_*, yielding to the executor
    // between page batches. Prunes old snapshots on success.
    asio::awaitable<std::expected<std::filesystem::path, BackupError>>
    create_backup(const std::string& reason);

    // Raw copy of the database file and its side-files. Only safe while no
    // other connection writes to the database. Never throws.
    BackupResult create_backup_sync(const std::string& reason);

    // Replace the live database with the snapshot. The connection is closed
    // for the copy and reopened afterwards.
    asio::awaitable<std::expected<void, BackupError>>
    restore_from_backup(const std::filesystem::path& backup_path);

    // Newest first
    std::vector<BackupSnapshot> list_backups() const;

    // Returns the number of deleted snapshots
    size_t clean_old_backups(size_t keep);
    size_t clean_old_backups() { return clean_old_backups(config_.max_backups); }

    std::expected<void, BackupError> delete_backup(const std::filesystem::path& backup_path);

    std::optional<BackupSnapshot> latest_backup() const;

    BackupStats stats() const;

    // True when the file starts with the 16-byte SQLite header
    static bool verify_backup(const std::filesystem::path& path);

    // "Pre Migration!" -> "pre-migration-"
    static std::string sanitize_reason(const std::string& reason);

    const BackupConfig& config() const { return config_; }

private:
    // Online copy without retention pruning
    asio::awaitable<std::expected<std::filesystem::path, BackupError>>
    snapshot(const std::string& reason);

    std::filesystem::path source_path() const;
    std::filesystem::path next_backup_path(const std::string& reason) const;
    std::optional<BackupSnapshot> parse_snapshot(const std::filesystem::path& path) const;

    Connection& db_;
    BackupConfig config_;
};

} // namespace novelforge::db
