#pragma once

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace novelforge::db {

enum class CatalogError {
    DUPLICATE_VERSION,
    INVALID_VERSION,
    FILE_UNREADABLE,
    DIRECTORY_UNREADABLE,
};

std::string catalog_error_message(CatalogError error);

struct MigrationEntry {
    int version = 0;
    std::string name;
    std::string inline_sql;
    std::filesystem::path file;     // empty for inline entries

    bool is_file() const { return !file.empty(); }

    // File name for file-backed entries, otherwise the entry name
    std::string source_name() const;
};

// Ordered manifest of schema versions and where their scripts come from
class MigrationCatalog {
public:
    std::expected<void, CatalogError> add_inline(int version, std::string name, std::string sql);
    std::expected<void, CatalogError> add_file(int version, std::string name, std::filesystem::path file);

    // Version 1 is `base_schema`, followed by every NNN_description.sql in
    // `migrations_dir` under its numeric prefix (so numbering starts at 002).
    // A missing directory contributes no entries.
    static std::expected<MigrationCatalog, CatalogError> from_directory(
        const std::filesystem::path& base_schema,
        const std::filesystem::path& migrations_dir);

    // Ascending by version
    const std::vector<MigrationEntry>& entries() const { return entries_; }

    int latest_version() const { return entries_.empty() ? 0 : entries_.back().version; }

    // Script text; nullopt when a file-backed entry's file is absent
    static std::expected<std::optional<std::string>, CatalogError> load(const MigrationEntry& entry);

private:
    std::expected<void, CatalogError> insert(MigrationEntry entry);

    std::vector<MigrationEntry> entries_;
};

} // namespace novelforge::db
