#pragma once

#include "common/config.hpp"
#include "db/backup_store.hpp"
#include "db/migration_registry.hpp"
#include "db/migration_runner.hpp"
#include "db/sqlite.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace novelforge::tool {

// ============================================================================
// novelforge-db commands
// ============================================================================
class DbCLI {
public:
    explicit DbCLI(Config config);

    // Run a command, returns exit code
    int run(const std::vector<std::string>& args);

    static void print_help();

private:
    Config config_;
    db::Connection db_;
    std::unique_ptr<db::MigrationRegistry> registry_;
    std::unique_ptr<db::BackupStore> backups_;
    std::unique_ptr<db::MigrationRunner> runner_;

    // Opens the database and wires the components; false after printing an error
    bool open();

    // Command handlers
    int cmd_migrate();
    int cmd_status(const std::vector<std::string>& args);
    int cmd_history(const std::vector<std::string>& args);
    int cmd_verify_integrity();
    int cmd_rollback();
    int cmd_backup(const std::vector<std::string>& args);

    // Backup subcommands
    int backup_create(const std::string& reason);
    int backup_list(bool json);
    int backup_restore(const std::string& path);
    int backup_verify(const std::string& path);
    int backup_clean(const std::vector<std::string>& args);
    int backup_stats();

    // Helpers
    static bool has_option(const std::vector<std::string>& args, const std::string& opt);
    static void print_table(const std::vector<std::vector<std::string>>& rows,
                            const std::vector<std::string>& headers);
    static std::string format_time(std::chrono::system_clock::time_point tp);
    static std::string format_size(uintmax_t bytes);
};

} // namespace novelforge::tool
