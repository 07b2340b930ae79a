#include "db/sqlite.hpp"
#include "common/log.hpp"
#include <sqlite3.h>
#include <filesystem>
#include <system_error>

namespace novelforge::db {

namespace {
const log::Logger logger{log::MAIN_LOGGER};
}

std::string db_error_message(const DbError& error) {
    if (error.message.empty()) {
        return sqlite3_errstr(error.code);
    }
    return error.message + " (" + sqlite3_errstr(error.code) + ")";
}

// ============================================================================
// Statement implementation
// ============================================================================

Statement::~Statement() {
    if (stmt_) {
        sqlite3_finalize(stmt_);
    }
}

Statement::Statement(Statement&& other) noexcept : stmt_(other.stmt_) {
    other.stmt_ = nullptr;
}

Statement& Statement::operator=(Statement&& other) noexcept {
    if (this != &other) {
        if (stmt_) sqlite3_finalize(stmt_);
        stmt_ = other.stmt_;
        other.stmt_ = nullptr;
    }
    return *this;
}

bool Statement::bind_int(int index, int value) {
    return sqlite3_bind_int(stmt_, index, value) == SQLITE_OK;
}

bool Statement::bind_int64(int index, int64_t value) {
    return sqlite3_bind_int64(stmt_, index, value) == SQLITE_OK;
}

bool Statement::bind_text(int index, std::string_view text) {
    return sqlite3_bind_text(stmt_, index, text.data(),
                             static_cast<int>(text.size()), SQLITE_TRANSIENT) == SQLITE_OK;
}

int Statement::step() {
    return sqlite3_step(stmt_);
}

void Statement::reset() {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
}

int Statement::column_int(int index) {
    return sqlite3_column_int(stmt_, index);
}

int64_t Statement::column_int64(int index) {
    return sqlite3_column_int64(stmt_, index);
}

std::string Statement::column_text(int index) {
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, index));
    return text ? text : "";
}

bool Statement::column_is_null(int index) {
    return sqlite3_column_type(stmt_, index) == SQLITE_NULL;
}

// ============================================================================
// Connection implementation
// ============================================================================

Connection::~Connection() {
    close();
}

std::expected<void, DbError> Connection::open(const std::string& path) {
    close();

    std::error_code ec;
    bool existed = path != ":memory:" && std::filesystem::exists(path, ec);

    int rc = sqlite3_open_v2(path.c_str(), &db_,
        SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
        nullptr);
    if (rc != SQLITE_OK) {
        DbError error{rc, rc, db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc)};
        logger.error("Failed to open database {}: {}", path, error.message);
        sqlite3_close(db_);
        db_ = nullptr;
        return std::unexpected(error);
    }
    sqlite3_extended_result_codes(db_, 1);
    path_ = path;
    created_ = !existed;

    for (const char* pragma : {"PRAGMA journal_mode=WAL",
                               "PRAGMA synchronous=NORMAL",
                               "PRAGMA foreign_keys=ON",
                               "PRAGMA busy_timeout=5000"}) {
        if (auto result = execute(pragma); !result) {
            close();
            return std::unexpected(result.error());
        }
    }

    logger.debug("Database opened: {}", path);
    return {};
}

void Connection::close() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

DbError Connection::last_error() const {
    if (!db_) {
        return DbError{SQLITE_MISUSE, SQLITE_MISUSE, "database is not open"};
    }
    int extended = sqlite3_extended_errcode(db_);
    return DbError{extended & 0xff, extended, sqlite3_errmsg(db_)};
}

std::expected<Statement, DbError> Connection::prepare(std::string_view sql) {
    if (!db_) {
        return std::unexpected(last_error());
    }
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.data(), static_cast<int>(sql.size()), &stmt, nullptr);
    if (rc != SQLITE_OK) {
        auto error = last_error();
        logger.debug("Failed to prepare statement: {}", error.message);
        return std::unexpected(error);
    }
    return Statement(stmt);
}

std::expected<void, DbError> Connection::execute(const std::string& sql) {
    if (!db_) {
        return std::unexpected(last_error());
    }
    char* errmsg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errmsg);
    if (rc != SQLITE_OK) {
        DbError error{rc & 0xff, rc, errmsg ? errmsg : sqlite3_errmsg(db_)};
        sqlite3_free(errmsg);
        return std::unexpected(error);
    }
    return {};
}

bool Connection::table_exists(std::string_view name) {
    auto stmt = prepare("SELECT 1 FROM sqlite_master WHERE type='table' AND name=?");
    if (!stmt || !stmt->bind_text(1, name)) {
        return false;
    }
    return stmt->step() == SQLITE_ROW;
}

bool Connection::in_transaction() const {
    return db_ != nullptr && sqlite3_get_autocommit(db_) == 0;
}

} // namespace novelforge::db
