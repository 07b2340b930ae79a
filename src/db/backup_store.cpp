#include "db/backup_store.hpp"
#include "common/log.hpp"
#include <sqlite3.h>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cstring>
#include <ctime>
#include <fstream>
#include <memory>
#include <regex>
#include <system_error>

namespace novelforge::db {

namespace fs = std::filesystem;

namespace {

const log::Logger logger{log::BACKUP_LOGGER};

constexpr std::array<const char*, 2> SIDE_FILES = {"-wal", "-shm"};
constexpr char SQLITE_HEADER[16] = "SQLite format 3";   // includes the trailing NUL
constexpr const char* STAGING_SUFFIX = ".restoring";
constexpr auto BUSY_RETRY_DELAY = std::chrono::milliseconds(50);

fs::path with_suffix(const fs::path& path, const char* suffix) {
    return fs::path(path.string() + suffix);
}

// Removes a snapshot's files, ignoring those that do not exist
void remove_snapshot_files(const fs::path& path) {
    std::error_code ec;
    fs::remove(path, ec);
    for (const char* suffix : SIDE_FILES) {
        fs::remove(with_suffix(path, suffix), ec);
    }
    fs::remove(with_suffix(path, "-journal"), ec);
}

std::optional<int> to_int(const std::string& digits) {
    int value = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec != std::errc() || ptr != digits.data() + digits.size()) {
        return std::nullopt;
    }
    return value;
}

struct InstallFailure {
    std::string message;
    bool partial = false;       // some live files were already replaced
};

// Replaces `live` and its side-files with `source` and its side-files. Every
// copy is staged beside its target first; live files are only touched once
// all copies succeeded. Live side-files the source lacks are removed.
std::expected<void, InstallFailure> install_files(const fs::path& source, const fs::path& live) {
    struct Staged {
        fs::path from;
        fs::path target;
        fs::path staging;
    };

    std::vector<Staged> installs;
    std::vector<fs::path> stale;
    installs.push_back({source, live, with_suffix(live, STAGING_SUFFIX)});
    for (const char* suffix : SIDE_FILES) {
        auto source_side = with_suffix(source, suffix);
        auto live_side = with_suffix(live, suffix);
        std::error_code exists_ec;
        if (fs::exists(source_side, exists_ec)) {
            installs.push_back({source_side, live_side, with_suffix(live_side, STAGING_SUFFIX)});
        } else {
            stale.push_back(live_side);
        }
    }

    auto check_target = [](const fs::path& target) -> std::expected<void, InstallFailure> {
        std::error_code ec;
        auto status = fs::status(target, ec);
        if (status.type() == fs::file_type::not_found || fs::is_regular_file(status)) {
            return {};
        }
        return std::unexpected(InstallFailure{target.string() + " is not a regular file"});
    };
    for (const auto& item : installs) {
        if (auto checked = check_target(item.target); !checked) return checked;
    }
    for (const auto& path : stale) {
        if (auto checked = check_target(path); !checked) return checked;
    }

    auto discard = [&installs]() {
        std::error_code ignored;
        for (const auto& item : installs) {
            fs::remove(item.staging, ignored);
        }
    };

    std::error_code ec;
    for (const auto& item : installs) {
        fs::copy_file(item.from, item.staging, fs::copy_options::overwrite_existing, ec);
        if (ec) {
            discard();
            return std::unexpected(InstallFailure{"copy of " + item.from.filename().string() +
                                                  " failed: " + ec.message()});
        }
    }

    // Stale side-files would be replayed over the restored file
    for (const auto& path : stale) {
        fs::remove(path, ec);
        if (ec) {
            discard();
            return std::unexpected(InstallFailure{"cannot remove " + path.string() + ": " + ec.message()});
        }
    }

    // Side-files before the main file, so a half-finished swap never pairs
    // the new main file with old side-files
    for (auto it = installs.rbegin(); it != installs.rend(); ++it) {
        fs::rename(it->staging, it->target, ec);
        if (ec) {
            bool partial = it != installs.rbegin() || !stale.empty();
            discard();
            return std::unexpected(InstallFailure{"cannot replace " + it->target.string() + ": " +
                                                  ec.message(), partial});
        }
    }
    return {};
}

int64_t elapsed_ms(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
}

struct BackupHandleDeleter {
    void operator()(sqlite3_backup* backup) const { sqlite3_backup_finish(backup); }
};

struct DatabaseDeleter {
    void operator()(sqlite3* db) const { sqlite3_close(db); }
};

} // anonymous namespace

std::string backup_error_message(const BackupError& error) {
    std::string message;
    switch (error.kind) {
        case BackupErrorKind::BACKUP_FAILED: message = "Backup failed"; break;
        case BackupErrorKind::NOT_FOUND: message = "Backup not found"; break;
        case BackupErrorKind::INVALID_BACKUP: message = "Invalid backup file"; break;
        case BackupErrorKind::RESTORE_FAILED: message = "Restore failed"; break;
        default: message = "Unknown backup error"; break;
    }
    if (!error.detail.empty()) {
        message += ": " + error.detail;
    }
    return message;
}

BackupStore::BackupStore(Connection& db, BackupConfig config)
    : db_(db), config_(std::move(config)) {}

std::string BackupStore::sanitize_reason(const std::string& reason) {
    std::string out;
    out.reserve(reason.size());
    for (char c : reason) {
        auto lower = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        bool keep = (lower >= 'a' && lower <= 'z') || (lower >= '0' && lower <= '9');
        out += keep ? lower : '-';
    }
    return out.empty() ? "manual" : out;
}

fs::path BackupStore::source_path() const {
    if (!config_.database_path.empty()) {
        return config_.database_path;
    }
    return fs::path(db_.path());
}

fs::path BackupStore::next_backup_path(const std::string& reason) const {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    gmtime_r(&now, &tm);

    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%d_%H-%M-%S", &tm);

    std::string base = config_.product + "-" + stamp + "-" + sanitize_reason(reason);
    fs::path candidate = config_.backup_dir / (base + ".db");

    // Two snapshots within the same second get _2, _3, ...
    std::error_code ec;
    for (int sequence = 2; fs::exists(candidate, ec); ++sequence) {
        candidate = config_.backup_dir / (base + "_" + std::to_string(sequence) + ".db");
    }
    return candidate;
}

std::optional<BackupSnapshot> BackupStore::parse_snapshot(const fs::path& path) const {
    static const std::regex pattern(
        R"(^(.+)-(\d{4})-(\d{2})-(\d{2})_(\d{2})-(\d{2})-(\d{2})-([a-z0-9-]+?)(?:_(\d{1,9}))?\.db$)");

    std::string filename = path.filename().string();
    std::smatch match;
    if (!std::regex_match(filename, match, pattern) || match[1].str() != config_.product) {
        return std::nullopt;
    }

    std::array<int, 6> fields{};
    for (size_t i = 0; i < fields.size(); ++i) {
        auto value = to_int(match[i + 2].str());
        if (!value) {
            return std::nullopt;
        }
        fields[i] = *value;
    }

    int sequence = 1;
    if (match[9].matched) {
        auto value = to_int(match[9].str());
        if (!value) {
            logger.debug("Ignoring {}: bad sequence number", filename);
            return std::nullopt;
        }
        sequence = *value;
    }

    std::tm tm{};
    tm.tm_year = fields[0] - 1900;
    tm.tm_mon = fields[1] - 1;
    tm.tm_mday = fields[2];
    tm.tm_hour = fields[3];
    tm.tm_min = fields[4];
    tm.tm_sec = fields[5];

    BackupSnapshot snapshot;
    snapshot.filename = filename;
    snapshot.path = path;
    snapshot.created_at = std::chrono::system_clock::from_time_t(timegm(&tm));
    snapshot.reason = match[8].str();
    std::replace(snapshot.reason.begin(), snapshot.reason.end(), '-', ' ');
    snapshot.sequence = sequence;

    std::error_code ec;
    auto size = fs::file_size(path, ec);
    snapshot.size_bytes = ec ? 0 : size;
    return snapshot;
}

// ============================================================================
// Creation
// ============================================================================

asio::awaitable<std::expected<fs::path, BackupError>>
BackupStore::create_backup(const std::string& reason) {
    auto result = co_await snapshot(reason);
    if (result) {
        clean_old_backups();
    }
    co_return result;
}

asio::awaitable<std::expected<fs::path, BackupError>>
BackupStore::snapshot(const std::string& reason) {
    auto executor = co_await asio::this_coro::executor;

    if (!db_.is_open()) {
        co_return std::unexpected(BackupError{BackupErrorKind::BACKUP_FAILED, "database is not open"});
    }

    std::error_code ec;
    fs::create_directories(config_.backup_dir, ec);
    if (ec) {
        logger.error("Cannot create backup directory {}: {}", config_.backup_dir.string(), ec.message());
        co_return std::unexpected(BackupError{BackupErrorKind::BACKUP_FAILED, ec.message()});
    }

    auto dest_path = next_backup_path(reason);
    auto start = std::chrono::steady_clock::now();
    std::string failure;

    {
        sqlite3* raw = nullptr;
        int rc = sqlite3_open_v2(dest_path.string().c_str(), &raw,
                                 SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
        std::unique_ptr<sqlite3, DatabaseDeleter> dest(raw);

        if (rc != SQLITE_OK) {
            failure = dest ? sqlite3_errmsg(dest.get()) : sqlite3_errstr(rc);
        } else {
            std::unique_ptr<sqlite3_backup, BackupHandleDeleter> backup(
                sqlite3_backup_init(dest.get(), "main", db_.handle(), "main"));

            if (!backup) {
                failure = sqlite3_errmsg(dest.get());
            } else {
                asio::steady_timer retry_timer(executor);
                for (;;) {
                    rc = sqlite3_backup_step(backup.get(), config_.pages_per_step);
                    if (rc == SQLITE_OK) {
                        co_await asio::post(executor, asio::use_awaitable);
                    } else if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) {
                        retry_timer.expires_after(BUSY_RETRY_DELAY);
                        co_await retry_timer.async_wait(asio::use_awaitable);
                    } else {
                        break;
                    }
                }

                int finish_rc = sqlite3_backup_finish(backup.release());
                if (rc != SQLITE_DONE) {
                    failure = sqlite3_errstr(rc);
                } else if (finish_rc != SQLITE_OK) {
                    failure = sqlite3_errmsg(dest.get());
                }
            }
        }
    }

    if (!failure.empty()) {
        logger.error("Backup to {} failed: {}", dest_path.string(), failure);
        remove_snapshot_files(dest_path);
        co_return std::unexpected(BackupError{BackupErrorKind::BACKUP_FAILED, failure});
    }

    auto size = fs::file_size(dest_path, ec);
    logger.info("Backup created: {} ({} bytes, {}ms)",
                dest_path.filename().string(), ec ? 0 : size, elapsed_ms(start));
    co_return dest_path;
}

BackupResult BackupStore::create_backup_sync(const std::string& reason) {
    BackupResult result;
    auto start = std::chrono::steady_clock::now();
    auto source = source_path();

    std::error_code ec;
    if (source.empty() || !fs::exists(source, ec)) {
        logger.info("No database file at {}, nothing to back up", source.string());
        result.success = true;
        return result;
    }

    fs::create_directories(config_.backup_dir, ec);
    if (ec) {
        result.error = "cannot create backup directory: " + ec.message();
        logger.error("Backup failed: {}", result.error);
        return result;
    }

    auto dest_path = next_backup_path(reason);

    fs::copy_file(source, dest_path, fs::copy_options::overwrite_existing, ec);
    for (const char* suffix : SIDE_FILES) {
        if (ec) break;
        auto side = with_suffix(source, suffix);
        std::error_code exists_ec;
        if (fs::exists(side, exists_ec)) {
            fs::copy_file(side, with_suffix(dest_path, suffix),
                          fs::copy_options::overwrite_existing, ec);
        }
    }

    if (ec) {
        result.error = "copy failed: " + ec.message();
        logger.error("Backup of {} failed: {}", source.string(), result.error);
        remove_snapshot_files(dest_path);
        return result;
    }

    result.success = true;
    result.backup_path = dest_path;
    result.duration_ms = elapsed_ms(start);
    auto size = fs::file_size(dest_path, ec);
    result.size_bytes = ec ? 0 : size;

    logger.info("Backup created: {} ({} bytes, {}ms)",
                dest_path.filename().string(), result.size_bytes, result.duration_ms);

    clean_old_backups();
    return result;
}

// ============================================================================
// Restore
// ============================================================================

asio::awaitable<std::expected<void, BackupError>>
BackupStore::restore_from_backup(const fs::path& backup_path) {
    std::error_code ec;
    if (!fs::exists(backup_path, ec)) {
        logger.error("Backup not found: {}", backup_path.string());
        co_return std::unexpected(BackupError{BackupErrorKind::NOT_FOUND, backup_path.string()});
    }
    if (!verify_backup(backup_path)) {
        logger.error("Refusing to restore {}: not a SQLite database", backup_path.string());
        co_return std::unexpected(BackupError{BackupErrorKind::INVALID_BACKUP, backup_path.string()});
    }

    auto live = source_path();
    if (live.empty()) {
        co_return std::unexpected(BackupError{BackupErrorKind::RESTORE_FAILED, "no database path"});
    }

    logger.info("Restoring {} from {}", live.string(), backup_path.filename().string());

    std::optional<fs::path> pre_restore_path;
    if (db_.is_open()) {
        // Not pruned: retention could otherwise evict the snapshot being restored
        auto pre_restore = co_await snapshot("pre-restore");
        if (pre_restore) {
            pre_restore_path = *pre_restore;
        } else {
            logger.warn("Pre-restore backup failed, continuing: {}",
                        backup_error_message(pre_restore.error()));
        }

        if (auto checkpoint = db_.execute("PRAGMA wal_checkpoint(TRUNCATE)"); !checkpoint) {
            logger.warn("WAL checkpoint before restore failed: {}",
                        db_error_message(checkpoint.error()));
        }
        db_.close();
    }

    std::string failure;
    if (auto installed = install_files(backup_path, live); !installed) {
        failure = installed.error().message;
        if (installed.error().partial && pre_restore_path) {
            logger.warn("Restore interrupted, reinstating {}", pre_restore_path->filename().string());
            if (auto reverted = install_files(*pre_restore_path, live); !reverted) {
                logger.error("Reinstating {} failed: {}", pre_restore_path->string(),
                             reverted.error().message);
            }
        }
    }

    if (auto reopened = db_.open(live.string()); !reopened) {
        if (failure.empty()) {
            failure = "reopen failed: " + db_error_message(reopened.error());
        }
    }

    if (!failure.empty()) {
        logger.error("Restore from {} failed: {}", backup_path.string(), failure);
        co_return std::unexpected(BackupError{BackupErrorKind::RESTORE_FAILED, failure});
    }

    logger.info("Database restored from {}", backup_path.filename().string());
    co_return std::expected<void, BackupError>{};
}

// ============================================================================
// Listing and retention
// ============================================================================

std::vector<BackupSnapshot> BackupStore::list_backups() const {
    std::vector<BackupSnapshot> snapshots;

    std::error_code ec;
    fs::directory_iterator it(config_.backup_dir, ec);
    if (ec) {
        logger.debug("Backup directory {} not readable: {}", config_.backup_dir.string(), ec.message());
        return snapshots;
    }

    for (const auto& entry : it) {
        if (!entry.is_regular_file(ec) || entry.path().extension() != ".db") {
            continue;
        }
        if (auto snapshot = parse_snapshot(entry.path())) {
            snapshots.push_back(std::move(*snapshot));
        }
    }

    std::sort(snapshots.begin(), snapshots.end(), [](const auto& a, const auto& b) {
        if (a.created_at != b.created_at) return a.created_at > b.created_at;
        if (a.sequence != b.sequence) return a.sequence > b.sequence;
        return a.filename > b.filename;
    });
    return snapshots;
}

size_t BackupStore::clean_old_backups(size_t keep) {
    auto snapshots = list_backups();
    size_t deleted = 0;

    for (size_t i = keep; i < snapshots.size(); ++i) {
        if (auto result = delete_backup(snapshots[i].path); result) {
            ++deleted;
        } else {
            logger.warn("Failed to delete old backup {}: {}",
                        snapshots[i].filename, backup_error_message(result.error()));
        }
    }

    if (deleted > 0) {
        logger.info("Cleaned {} old backup(s), keeping {}", deleted, keep);
    }
    return deleted;
}

std::expected<void, BackupError> BackupStore::delete_backup(const fs::path& backup_path) {
    std::error_code ec;
    if (!fs::exists(backup_path, ec)) {
        return std::unexpected(BackupError{BackupErrorKind::NOT_FOUND, backup_path.string()});
    }

    // Side-files first: a failure leaves the snapshot listed and deletable
    for (const char* suffix : SIDE_FILES) {
        fs::remove(with_suffix(backup_path, suffix), ec);
        if (ec) break;
    }
    if (!ec) {
        fs::remove(backup_path, ec);
    }
    if (ec) {
        return std::unexpected(BackupError{BackupErrorKind::BACKUP_FAILED, ec.message()});
    }

    logger.info("Deleted backup {}", backup_path.filename().string());
    return {};
}

std::optional<BackupSnapshot> BackupStore::latest_backup() const {
    auto snapshots = list_backups();
    if (snapshots.empty()) {
        return std::nullopt;
    }
    return snapshots.front();
}

BackupStats BackupStore::stats() const {
    BackupStats stats;
    auto snapshots = list_backups();

    stats.count = snapshots.size();
    for (const auto& snapshot : snapshots) {
        stats.total_size_bytes += snapshot.size_bytes;
    }
    if (!snapshots.empty()) {
        stats.newest = snapshots.front();
        stats.oldest = snapshots.back();
    }
    return stats;
}

bool BackupStore::verify_backup(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return false;
    }

    std::array<char, sizeof(SQLITE_HEADER)> header{};
    if (!file.read(header.data(), header.size())) {
        return false;
    }
    return std::memcmp(header.data(), SQLITE_HEADER, header.size()) == 0;
}

} // namespace novelforge::db
