#include "db/migration_catalog.hpp"
#include "common/log.hpp"
#include <algorithm>
#include <charconv>
#include <fstream>
#include <regex>
#include <sstream>
#include <system_error>

namespace novelforge::db {

namespace fs = std::filesystem;

namespace {
const log::Logger logger{log::MIGRATE_LOGGER};
}

std::string catalog_error_message(CatalogError error) {
    switch (error) {
        case CatalogError::DUPLICATE_VERSION: return "Duplicate migration version";
        case CatalogError::INVALID_VERSION: return "Invalid migration version";
        case CatalogError::FILE_UNREADABLE: return "Migration file unreadable";
        case CatalogError::DIRECTORY_UNREADABLE: return "Migration directory unreadable";
        default: return "Unknown catalog error";
    }
}

std::string MigrationEntry::source_name() const {
    return is_file() ? file.filename().string() : name;
}

std::expected<void, CatalogError> MigrationCatalog::add_inline(int version, std::string name, std::string sql) {
    MigrationEntry entry;
    entry.version = version;
    entry.name = std::move(name);
    entry.inline_sql = std::move(sql);
    return insert(std::move(entry));
}

std::expected<void, CatalogError> MigrationCatalog::add_file(int version, std::string name, fs::path file) {
    MigrationEntry entry;
    entry.version = version;
    entry.name = std::move(name);
    entry.file = std::move(file);
    return insert(std::move(entry));
}

std::expected<void, CatalogError> MigrationCatalog::insert(MigrationEntry entry) {
    if (entry.version <= 0) {
        logger.error("Migration version must be positive: {}", entry.version);
        return std::unexpected(CatalogError::INVALID_VERSION);
    }

    auto pos = std::lower_bound(entries_.begin(), entries_.end(), entry.version,
        [](const MigrationEntry& e, int version) { return e.version < version; });
    if (pos != entries_.end() && pos->version == entry.version) {
        logger.error("Migration version {} declared twice ({} and {})",
                     entry.version, pos->source_name(), entry.source_name());
        return std::unexpected(CatalogError::DUPLICATE_VERSION);
    }

    entries_.insert(pos, std::move(entry));
    return {};
}

std::expected<MigrationCatalog, CatalogError> MigrationCatalog::from_directory(
    const fs::path& base_schema, const fs::path& migrations_dir) {

    static const std::regex pattern(R"(^(\d+)_(.+)\.sql$)");

    MigrationCatalog catalog;
    if (auto result = catalog.add_file(1, "base_schema", base_schema); !result) {
        return std::unexpected(result.error());
    }

    std::error_code ec;
    if (!fs::exists(migrations_dir, ec)) {
        logger.debug("Migration directory {} does not exist", migrations_dir.string());
        return catalog;
    }

    fs::directory_iterator it(migrations_dir, ec);
    if (ec) {
        logger.error("Cannot read migration directory {}: {}", migrations_dir.string(), ec.message());
        return std::unexpected(CatalogError::DIRECTORY_UNREADABLE);
    }

    for (const auto& entry : it) {
        if (!entry.is_regular_file(ec)) {
            continue;
        }

        std::string filename = entry.path().filename().string();
        std::smatch match;
        if (!std::regex_match(filename, match, pattern)) {
            logger.debug("Ignoring {}: not a migration script", filename);
            continue;
        }

        int version = 0;
        std::string digits = match[1].str();
        auto [ptr, parse_ec] = std::from_chars(digits.data(), digits.data() + digits.size(), version);
        if (parse_ec != std::errc() || ptr != digits.data() + digits.size()) {
            logger.error("Migration {} has an out-of-range version", filename);
            return std::unexpected(CatalogError::INVALID_VERSION);
        }

        if (auto result = catalog.add_file(version, match[2].str(), entry.path()); !result) {
            return std::unexpected(result.error());
        }
    }

    logger.debug("Catalog loaded: {} migration(s), latest version {}",
                 catalog.entries().size(), catalog.latest_version());
    return catalog;
}

std::expected<std::optional<std::string>, CatalogError> MigrationCatalog::load(const MigrationEntry& entry) {
    if (!entry.is_file()) {
        return entry.inline_sql;
    }

    std::error_code ec;
    if (!fs::exists(entry.file, ec)) {
        return std::optional<std::string>{};
    }

    std::ifstream file(entry.file, std::ios::binary);
    if (!file) {
        logger.error("Cannot open migration file {}", entry.file.string());
        return std::unexpected(CatalogError::FILE_UNREADABLE);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        logger.error("Error reading migration file {}", entry.file.string());
        return std::unexpected(CatalogError::FILE_UNREADABLE);
    }
    return buffer.str();
}

} // namespace novelforge::db
