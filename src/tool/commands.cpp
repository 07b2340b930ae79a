#include "tool/commands.hpp"
#include "common/asio_utils.hpp"
#include "common/log.hpp"

#include <boost/json.hpp>
#include <algorithm>
#include <charconv>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace novelforge::tool {

namespace fs = std::filesystem;

namespace {
const log::Logger logger{log::CLI_LOGGER};
}

DbCLI::DbCLI(Config config) : config_(std::move(config)) {}

void DbCLI::print_help() {
    std::cout << "NovelForge database tool\n\n";
    std::cout << "Usage: novelforge-db [options] <command> [args]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  migrate                   Apply pending schema migrations\n";
    std::cout << "  status [--json]           Show schema version and pending migrations\n";
    std::cout << "  history [--json]          Show applied migrations\n";
    std::cout << "  verify-integrity          Check applied scripts for later edits\n";
    std::cout << "  rollback                  Roll back the last migration (unsupported)\n";
    std::cout << "  backup <action>           Manage backups\n";
    std::cout << "      create [reason]       Create an online backup\n";
    std::cout << "      list [--json]         List backups, newest first\n";
    std::cout << "      restore <path>        Restore the database from a backup\n";
    std::cout << "      verify <path>         Check a backup's SQLite header\n";
    std::cout << "      clean [keep]          Delete all but the newest backups\n";
    std::cout << "      stats                 Show backup statistics\n\n";
    std::cout << "Global Options:\n";
    std::cout << "  -c, --config <file>       Configuration file path\n";
    std::cout << "  --db <path>               Database file path\n";
    std::cout << "  -q, --quiet               Suppress log output\n";
    std::cout << "  -h, --help                Show help\n\n";
    std::cout << "Examples:\n";
    std::cout << "  novelforge-db migrate\n";
    std::cout << "  novelforge-db -c novelforge.json status --json\n";
    std::cout << "  novelforge-db backup create before-import\n";
}

int DbCLI::run(const std::vector<std::string>& args) {
    if (args.empty()) {
        print_help();
        return 1;
    }

    const std::string& cmd = args[0];

    try {
        if (cmd == "migrate") return cmd_migrate();
        if (cmd == "status") return cmd_status(args);
        if (cmd == "history") return cmd_history(args);
        if (cmd == "verify-integrity") return cmd_verify_integrity();
        if (cmd == "rollback") return cmd_rollback();
        if (cmd == "backup") return cmd_backup(args);
    } catch (const std::exception& e) {
        logger.error("Command '{}' failed: {}", cmd, e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cerr << "Unknown command: " << cmd << "\n";
    print_help();
    return 1;
}

bool DbCLI::open() {
    if (runner_) {
        return true;
    }

    std::error_code ec;
    auto parent = fs::path(config_.database_path).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            std::cerr << "Error: Cannot create " << parent.string() << ": " << ec.message() << "\n";
            return false;
        }
    }

    if (auto opened = db_.open(config_.database_path); !opened) {
        std::cerr << "Error: Failed to open database " << config_.database_path << ": "
                  << db::db_error_message(opened.error()) << "\n";
        return false;
    }

    auto catalog = db::MigrationCatalog::from_directory(config_.base_schema_path(),
                                                        config_.migrations_dir());
    if (!catalog) {
        std::cerr << "Error: " << db::catalog_error_message(catalog.error())
                  << " in " << config_.migrations_dir().string() << "\n";
        return false;
    }

    db::BackupConfig backup_config;
    backup_config.backup_dir = config_.backup_dir;
    backup_config.max_backups = config_.max_backups;
    backup_config.database_path = config_.database_path;

    registry_ = std::make_unique<db::MigrationRegistry>(db_);
    backups_ = std::make_unique<db::BackupStore>(db_, std::move(backup_config));
    runner_ = std::make_unique<db::MigrationRunner>(db_, *registry_, *backups_, std::move(*catalog));

    logger.debug("Database {} ready, catalog latest version {}",
                 config_.database_path, runner_->catalog().latest_version());
    return true;
}

// ============================================================================
// Migration Commands
// ============================================================================

int DbCLI::cmd_migrate() {
    if (!open()) return 1;

    auto report = runner_->run_migrations();
    if (!report) {
        std::cerr << "Error: " << db::migration_error_message(report.error()) << "\n";
        return 1;
    }

    if (report->applied.empty()) {
        std::cout << "Schema is up to date (version " << report->to_version << ").\n";
    } else {
        std::cout << "Migrated from version " << report->from_version
                  << " to " << report->to_version
                  << " (" << report->applied.size() << " migration(s) applied";
        if (report->statements_tolerated > 0) {
            std::cout << ", " << report->statements_tolerated << " statement(s) already applied";
        }
        std::cout << ").\n";
    }
    for (int version : report->skipped_missing) {
        std::cout << "Skipped migration " << version << ": script not found.\n";
    }
    if (report->backup_path) {
        std::cout << "Pre-migration backup: " << report->backup_path->string() << "\n";
    }
    return 0;
}

int DbCLI::cmd_status(const std::vector<std::string>& args) {
    if (!open()) return 1;

    auto status = runner_->get_migration_status();
    if (!status) {
        std::cerr << "Error: " << db::migration_error_message(status.error()) << "\n";
        return 1;
    }

    if (has_option(args, "--json")) {
        boost::json::array pending;
        for (const auto& name : status->pending_file_names) {
            pending.emplace_back(name);
        }
        boost::json::object obj;
        obj["current_version"] = status->current_version;
        obj["applied_count"] = status->applied_count;
        obj["latest_version"] = runner_->catalog().latest_version();
        obj["pending"] = std::move(pending);
        std::cout << boost::json::serialize(obj) << "\n";
        return 0;
    }

    std::cout << "Database:         " << config_.database_path << "\n";
    std::cout << "Schema version:   " << status->current_version << "\n";
    std::cout << "Latest version:   " << runner_->catalog().latest_version() << "\n";
    std::cout << "Applied:          " << status->applied_count << "\n";
    std::cout << "Pending:          " << status->pending_file_names.size() << "\n";
    for (const auto& name : status->pending_file_names) {
        std::cout << "  " << name << "\n";
    }
    return 0;
}

int DbCLI::cmd_history(const std::vector<std::string>& args) {
    if (!open()) return 1;

    auto records = registry_->applied_migrations();
    if (!records) {
        std::cerr << "Error: " << db::registry_error_message(records.error()) << "\n";
        return 1;
    }

    if (has_option(args, "--json")) {
        boost::json::array arr;
        for (const auto& r : *records) {
            boost::json::object obj;
            obj["version"] = r.version;
            obj["name"] = r.name;
            obj["applied_at"] = r.applied_at;
            obj["can_rollback"] = r.can_rollback;
            obj["checksum"] = r.checksum;
            obj["execution_time_ms"] = r.execution_time_ms;
            arr.push_back(std::move(obj));
        }
        std::cout << boost::json::serialize(arr) << "\n";
        return 0;
    }

    if (records->empty()) {
        std::cout << "No migrations applied.\n";
        return 0;
    }

    std::vector<std::vector<std::string>> rows;
    for (const auto& r : *records) {
        rows.push_back({
            std::to_string(r.version),
            r.name,
            r.applied_at,
            r.checksum.empty() ? "-" : r.checksum,
            std::to_string(r.execution_time_ms) + "ms"
        });
    }

    print_table(rows, {"Version", "Name", "Applied", "Checksum", "Time"});
    return 0;
}

int DbCLI::cmd_verify_integrity() {
    if (!open()) return 1;

    auto modified = runner_->verify_integrity();
    if (!modified) {
        std::cerr << "Error: " << db::migration_error_message(modified.error()) << "\n";
        return 1;
    }

    if (modified->empty()) {
        std::cout << "All applied migrations match their scripts.\n";
        return 0;
    }

    std::cout << "Modified after being applied:\n";
    for (int version : *modified) {
        std::cout << "  version " << version << "\n";
    }
    return 1;
}

int DbCLI::cmd_rollback() {
    if (!open()) return 1;

    auto result = runner_->rollback_last_migration();
    if (!result) {
        std::cerr << "Error: " << db::migration_error_message(result.error()) << "\n";
        std::cerr << "Use 'novelforge-db backup list' and 'backup restore <path>' instead.\n";
        return 1;
    }
    return 0;
}

// ============================================================================
// Backup Commands
// ============================================================================

int DbCLI::cmd_backup(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        std::cerr << "Usage: novelforge-db backup <create|list|restore|verify|clean|stats> [args]\n";
        return 1;
    }

    const std::string& action = args[1];

    if (action == "create") {
        return backup_create(args.size() > 2 ? args[2] : "manual");
    } else if (action == "list") {
        return backup_list(has_option(args, "--json"));
    } else if (action == "restore" && args.size() > 2) {
        return backup_restore(args[2]);
    } else if (action == "verify" && args.size() > 2) {
        return backup_verify(args[2]);
    } else if (action == "clean") {
        return backup_clean(args);
    } else if (action == "stats") {
        return backup_stats();
    }

    std::cerr << "Usage: novelforge-db backup <create|list|restore|verify|clean|stats> [args]\n";
    return 1;
}

int DbCLI::backup_create(const std::string& reason) {
    if (!open()) return 1;

    auto result = asio_utils::run_blocking(backups_->create_backup(reason));
    if (!result) {
        std::cerr << "Error: " << db::backup_error_message(result.error()) << "\n";
        return 1;
    }

    std::cout << "Backup created: " << result->string() << "\n";
    return 0;
}

int DbCLI::backup_list(bool json) {
    if (!open()) return 1;

    auto snapshots = backups_->list_backups();

    if (json) {
        boost::json::array arr;
        for (const auto& s : snapshots) {
            boost::json::object obj;
            obj["filename"] = s.filename;
            obj["path"] = s.path.string();
            obj["size_bytes"] = s.size_bytes;
            obj["created_at"] = format_time(s.created_at);
            obj["reason"] = s.reason;
            arr.push_back(std::move(obj));
        }
        std::cout << boost::json::serialize(arr) << "\n";
        return 0;
    }

    if (snapshots.empty()) {
        std::cout << "No backups found in " << config_.backup_dir << ".\n";
        return 0;
    }

    std::vector<std::vector<std::string>> rows;
    for (const auto& s : snapshots) {
        rows.push_back({s.filename, format_time(s.created_at), format_size(s.size_bytes), s.reason});
    }

    print_table(rows, {"File", "Created", "Size", "Reason"});
    return 0;
}

int DbCLI::backup_restore(const std::string& path) {
    if (!open()) return 1;

    auto result = asio_utils::run_blocking(backups_->restore_from_backup(path));
    if (!result) {
        std::cerr << "Error: " << db::backup_error_message(result.error()) << "\n";
        return 1;
    }

    std::cout << "Database restored from " << path << "\n";
    return 0;
}

int DbCLI::backup_verify(const std::string& path) {
    if (db::BackupStore::verify_backup(path)) {
        std::cout << path << ": valid SQLite database\n";
        return 0;
    }
    std::cout << path << ": not a valid SQLite database\n";
    return 1;
}

int DbCLI::backup_clean(const std::vector<std::string>& args) {
    size_t keep = config_.max_backups;
    if (args.size() > 2) {
        const std::string& value = args[2];
        auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), keep);
        if (ec != std::errc() || ptr != value.data() + value.size()) {
            std::cerr << "Error: invalid count '" << value << "'\n";
            return 1;
        }
    }

    if (!open()) return 1;

    size_t deleted = backups_->clean_old_backups(keep);
    std::cout << "Deleted " << deleted << " backup(s), keeping at most " << keep << ".\n";
    return 0;
}

int DbCLI::backup_stats() {
    if (!open()) return 1;

    auto stats = backups_->stats();
    std::cout << "Backups:      " << stats.count << "\n";
    std::cout << "Total size:   " << format_size(stats.total_size_bytes) << "\n";
    if (stats.newest) {
        std::cout << "Newest:       " << stats.newest->filename << "\n";
    }
    if (stats.oldest) {
        std::cout << "Oldest:       " << stats.oldest->filename << "\n";
    }
    return 0;
}

// ============================================================================
// Helpers
// ============================================================================

bool DbCLI::has_option(const std::vector<std::string>& args, const std::string& opt) {
    return std::find(args.begin(), args.end(), opt) != args.end();
}

void DbCLI::print_table(const std::vector<std::vector<std::string>>& rows,
                        const std::vector<std::string>& headers) {
    std::vector<size_t> widths(headers.size(), 0);
    for (size_t i = 0; i < headers.size(); ++i) {
        widths[i] = headers[i].length();
    }
    for (const auto& row : rows) {
        for (size_t i = 0; i < row.size() && i < widths.size(); ++i) {
            widths[i] = std::max(widths[i], row[i].length());
        }
    }

    for (size_t i = 0; i < headers.size(); ++i) {
        std::cout << std::left << std::setw(widths[i] + 2) << headers[i];
    }
    std::cout << "\n";

    for (size_t i = 0; i < headers.size(); ++i) {
        std::cout << std::string(widths[i], '-') << "  ";
    }
    std::cout << "\n";

    for (const auto& row : rows) {
        for (size_t i = 0; i < row.size() && i < widths.size(); ++i) {
            std::cout << std::left << std::setw(widths[i] + 2) << row[i];
        }
        std::cout << "\n";
    }
}

std::string DbCLI::format_time(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

std::string DbCLI::format_size(uintmax_t bytes) {
    std::ostringstream oss;
    if (bytes >= 1024 * 1024) {
        oss << std::fixed << std::setprecision(1) << bytes / (1024.0 * 1024.0) << " MB";
    } else if (bytes >= 1024) {
        oss << std::fixed << std::setprecision(1) << bytes / 1024.0 << " KB";
    } else {
        oss << bytes << " B";
    }
    return oss.str();
}

} // namespace novelforge::tool
