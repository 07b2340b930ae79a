#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

struct sqlite3;
struct sqlite3_stmt;

namespace novelforge::db {

// Error reported by the storage engine. `code` is the primary SQLite result
// code, `extended_code` the extended one (SQLITE_CONSTRAINT_PRIMARYKEY, ...).
struct DbError {
    int code = 0;
    int extended_code = 0;
    std::string message;
};

std::string db_error_message(const DbError& error);

// RAII wrapper for SQLite statement
class Statement {
public:
    Statement() = default;
    explicit Statement(sqlite3_stmt* stmt) : stmt_(stmt) {}
    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;
    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;

    sqlite3_stmt* get() const { return stmt_; }
    explicit operator bool() const { return stmt_ != nullptr; }

    // Binding helpers
    bool bind_int(int index, int value);
    bool bind_int64(int index, int64_t value);
    bool bind_text(int index, std::string_view text);

    // Step and reset
    int step();
    void reset();

    // Column getters
    int column_int(int index);
    int64_t column_int64(int index);
    std::string column_text(int index);
    bool column_is_null(int index);

private:
    sqlite3_stmt* stmt_ = nullptr;
};

// One open database handle. Components receive a reference to it; nothing
// in this library reaches for a process-wide connection.
class Connection {
public:
    Connection() = default;
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // Open (creating if needed) and switch to WAL journaling
    std::expected<void, DbError> open(const std::string& path);

    void close();

    bool is_open() const { return db_ != nullptr; }

    // Path given to the last open(), kept after close() so the handle can be
    // reopened on the same file.
    const std::string& path() const { return path_; }

    // True when the last open() created the database file
    bool created() const { return created_; }

    sqlite3* handle() const { return db_; }

    std::expected<Statement, DbError> prepare(std::string_view sql);

    // Run one or more SQL statements without result rows
    std::expected<void, DbError> execute(const std::string& sql);

    bool table_exists(std::string_view name);

    // True while an explicit BEGIN is open
    bool in_transaction() const;

    DbError last_error() const;

private:
    sqlite3* db_ = nullptr;
    std::string path_;
    bool created_ = false;
};

} // namespace novelforge::db
