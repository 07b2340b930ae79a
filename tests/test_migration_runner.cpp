#include <gtest/gtest.h>
#include "db/backup_store.hpp"
#include "db/migration_catalog.hpp"
#include "db/migration_registry.hpp"
#include "db/migration_runner.hpp"
#include "db/sqlite.hpp"

#include <sqlite3.h>
#include <filesystem>
#include <fstream>
#include <memory>
#include <random>

using namespace novelforge::db;
namespace fs = std::filesystem;

class MigrationRunnerTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               ("novelforge_runner_" + std::to_string(std::random_device{}()));
        fs::create_directories(dir_);
        db_path_ = dir_ / "app.db";
        ASSERT_TRUE(db_.open(db_path_.string()).has_value());

        BackupConfig config;
        config.backup_dir = dir_ / "backups";
        config.database_path = db_path_;
        registry_ = std::make_unique<MigrationRegistry>(db_);
        backups_ = std::make_unique<BackupStore>(db_, config);
    }

    void TearDown() override {
        db_.close();
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    MigrationRunner make_runner(MigrationCatalog catalog) {
        return MigrationRunner(db_, *registry_, *backups_, std::move(catalog));
    }

    static MigrationCatalog basic_catalog() {
        MigrationCatalog catalog;
        catalog.add_inline(1, "base_schema",
            "CREATE TABLE projects(id TEXT PRIMARY KEY, title TEXT NOT NULL);\n"
            "CREATE INDEX idx_projects_title ON projects(title);\n");
        catalog.add_inline(2, "chapters",
            "-- chapters belong to projects\n"
            "CREATE TABLE chapters(id TEXT PRIMARY KEY, project_id TEXT, words INTEGER DEFAULT 0);\n"
            "CREATE TRIGGER trg_chapter_title AFTER INSERT ON chapters\n"
            "BEGIN\n"
            "    UPDATE projects SET title = title || '*' WHERE id = NEW.project_id;\n"
            "END;\n");
        catalog.add_inline(3, "genre", "ALTER TABLE projects ADD COLUMN genre TEXT;");
        return catalog;
    }

    int query_int(const std::string& sql) {
        auto stmt = db_.prepare(sql);
        if (!stmt || stmt->step() != SQLITE_ROW) return -1;
        return stmt->column_int(0);
    }

    fs::path dir_;
    fs::path db_path_;
    Connection db_;
    std::unique_ptr<MigrationRegistry> registry_;
    std::unique_ptr<BackupStore> backups_;
};

TEST_F(MigrationRunnerTest, AppliesAllPendingMigrations) {
    auto runner = make_runner(basic_catalog());

    auto report = runner.run_migrations();
    ASSERT_TRUE(report.has_value()) << migration_error_message(report.error());

    EXPECT_EQ(report->from_version, 0);
    EXPECT_EQ(report->to_version, 3);
    EXPECT_EQ(report->applied, (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(report->statements_executed, 5);
    EXPECT_EQ(report->statements_tolerated, 0);
    EXPECT_EQ(registry_->current_version().value(), 3);

    EXPECT_TRUE(db_.table_exists("chapters"));
    EXPECT_EQ(query_int("SELECT COUNT(*) FROM sqlite_master WHERE type='trigger'"), 1);
    EXPECT_EQ(query_int("SELECT COUNT(*) FROM pragma_table_info('projects') WHERE name='genre'"), 1);

    auto records = registry_->applied_migrations();
    ASSERT_EQ(records->size(), 3u);
    EXPECT_EQ((*records)[1].name, "chapters");
    EXPECT_EQ((*records)[1].checksum.size(), 16u);
}

TEST_F(MigrationRunnerTest, SecondRunExecutesNothing) {
    auto runner = make_runner(basic_catalog());
    ASSERT_TRUE(runner.run_migrations().has_value());

    auto backups_before = backups_->list_backups().size();

    auto second = runner.run_migrations();
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->statements_executed, 0);
    EXPECT_TRUE(second->applied.empty());
    EXPECT_FALSE(second->backup_path.has_value());
    EXPECT_EQ(second->from_version, 3);
    EXPECT_EQ(second->to_version, 3);
    EXPECT_EQ(backups_->list_backups().size(), backups_before);
}

TEST_F(MigrationRunnerTest, FreshDatabaseSkipsPreMigrationBackup) {
    ASSERT_TRUE(db_.created());

    MigrationCatalog catalog;
    catalog.add_inline(1, "base", "CREATE TABLE base(id INT);");
    auto runner = make_runner(std::move(catalog));

    auto report = runner.run_migrations();
    ASSERT_TRUE(report.has_value()) << migration_error_message(report.error());
    EXPECT_EQ(report->applied, std::vector<int>{1});
    EXPECT_FALSE(report->backup_path.has_value());
    EXPECT_TRUE(backups_->list_backups().empty());
}

TEST_F(MigrationRunnerTest, PreMigrationBackupTakenWhenPending) {
    ASSERT_TRUE(db_.execute("CREATE TABLE keep(x INT)").has_value());
    db_.close();
    ASSERT_TRUE(db_.open(db_path_.string()).has_value());
    ASSERT_FALSE(db_.created());

    auto runner = make_runner(basic_catalog());
    auto report = runner.run_migrations();
    ASSERT_TRUE(report.has_value());
    ASSERT_TRUE(report->backup_path.has_value());
    EXPECT_TRUE(fs::exists(*report->backup_path));
    EXPECT_NE(report->backup_path->filename().string().find("pre-migration"), std::string::npos);
}

TEST_F(MigrationRunnerTest, DuplicateColumnReplayIsTolerated) {
    ASSERT_TRUE(db_.execute("CREATE TABLE projects(id TEXT PRIMARY KEY, title TEXT, genre TEXT)").has_value());

    MigrationCatalog catalog;
    catalog.add_inline(1, "genre", "ALTER TABLE projects ADD COLUMN genre TEXT;");
    auto runner = make_runner(std::move(catalog));

    auto report = runner.run_migrations();
    ASSERT_TRUE(report.has_value()) << migration_error_message(report.error());
    EXPECT_EQ(report->statements_tolerated, 1);
    EXPECT_EQ(report->applied, std::vector<int>{1});
    EXPECT_TRUE(registry_->is_applied(1).value());
}

TEST_F(MigrationRunnerTest, AlreadyExistsReplayIsTolerated) {
    ASSERT_TRUE(db_.execute("CREATE TABLE projects(id TEXT PRIMARY KEY, title TEXT NOT NULL)").has_value());

    auto runner = make_runner(basic_catalog());
    auto report = runner.run_migrations();
    ASSERT_TRUE(report.has_value()) << migration_error_message(report.error());
    EXPECT_EQ(report->statements_tolerated, 1);
    EXPECT_EQ(report->to_version, 3);
}

TEST_F(MigrationRunnerTest, FailureRollsBackAndPropagates) {
    MigrationCatalog catalog;
    catalog.add_inline(1, "base", "CREATE TABLE a(id INT);");
    catalog.add_inline(2, "broken",
        "CREATE TABLE b(id INT);\n"
        "INSERT INTO missing_table VALUES (1);\n");
    catalog.add_inline(3, "never", "CREATE TABLE c(id INT);");
    auto runner = make_runner(std::move(catalog));

    auto report = runner.run_migrations();
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().kind, MigrationErrorKind::STATEMENT_FAILED);
    EXPECT_EQ(report.error().version, 2);

    EXPECT_EQ(registry_->current_version().value(), 1);
    EXPECT_TRUE(db_.table_exists("a"));
    EXPECT_FALSE(db_.table_exists("b"));
    EXPECT_FALSE(db_.table_exists("c"));
    EXPECT_FALSE(db_.in_transaction());
}

TEST_F(MigrationRunnerTest, ConstraintFailureIsNeverIgnored) {
    MigrationCatalog catalog;
    catalog.add_inline(1, "dupes",
        "CREATE TABLE u(id INTEGER PRIMARY KEY);\n"
        "INSERT INTO u VALUES (1);\n"
        "INSERT INTO u VALUES (1);\n");
    auto runner = make_runner(std::move(catalog));

    auto report = runner.run_migrations();
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().kind, MigrationErrorKind::STATEMENT_FAILED);
    EXPECT_EQ(registry_->current_version().value(), 0);
    EXPECT_FALSE(db_.table_exists("u"));
}

TEST_F(MigrationRunnerTest, MissingScriptIsSkipped) {
    fs::create_directories(dir_ / "schema");
    {
        std::ofstream(dir_ / "schema" / "schema.sql") << "CREATE TABLE base(id INT);";
    }

    MigrationCatalog catalog;
    catalog.add_file(1, "base_schema", dir_ / "schema" / "schema.sql");
    catalog.add_file(2, "gone", dir_ / "schema" / "002_gone.sql");
    catalog.add_inline(3, "extra", "CREATE TABLE extra(id INT);");
    auto runner = make_runner(std::move(catalog));

    auto report = runner.run_migrations();
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->applied, (std::vector<int>{1, 3}));
    EXPECT_EQ(report->skipped_missing, std::vector<int>{2});
    EXPECT_EQ(registry_->current_version().value(), 3);
    EXPECT_FALSE(registry_->is_applied(2).value());
}

TEST_F(MigrationRunnerTest, LegacyLedgerIsImported) {
    ASSERT_TRUE(db_.execute(
        "CREATE TABLE schema_migrations(version INTEGER PRIMARY KEY, applied_at TEXT);"
        "INSERT INTO schema_migrations(version) VALUES (1), (2);"
        "CREATE TABLE projects(id TEXT PRIMARY KEY, title TEXT NOT NULL);"
        "CREATE TABLE chapters(id TEXT PRIMARY KEY);").has_value());

    auto runner = make_runner(basic_catalog());
    auto report = runner.run_migrations();
    ASSERT_TRUE(report.has_value()) << migration_error_message(report.error());

    EXPECT_EQ(report->from_version, 2);
    EXPECT_EQ(report->applied, std::vector<int>{3});
    auto records = registry_->applied_migrations();
    ASSERT_EQ(records->size(), 3u);
    EXPECT_EQ((*records)[0].checksum, "legacy");
    EXPECT_EQ((*records)[1].name, "migration_002");
}

TEST_F(MigrationRunnerTest, StatusAndRunAgreeWhenLegacyLedgerIsAhead) {
    ASSERT_TRUE(db_.execute(
        "CREATE TABLE schema_migrations(version INTEGER PRIMARY KEY, applied_at TEXT);"
        "INSERT INTO schema_migrations(version) VALUES (1), (2), (3);"
        "CREATE TABLE projects(id TEXT PRIMARY KEY, title TEXT NOT NULL);").has_value());
    ASSERT_TRUE(registry_->ensure_registry_table().has_value());
    ASSERT_TRUE(registry_->record_migration(1, "base_schema", false, "", 0).has_value());
    db_.close();
    ASSERT_TRUE(db_.open(db_path_.string()).has_value());

    auto runner = make_runner(basic_catalog());

    auto status = runner.get_migration_status();
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status->current_version, 1);
    EXPECT_EQ(status->pending_file_names, (std::vector<std::string>{"chapters", "genre"}));

    auto report = runner.run_migrations();
    ASSERT_TRUE(report.has_value()) << migration_error_message(report.error());
    EXPECT_EQ(report->from_version, 1);
    EXPECT_EQ(report->applied, (std::vector<int>{2, 3}));
    EXPECT_TRUE(report->backup_path.has_value());
}

TEST_F(MigrationRunnerTest, StatusReportsPending) {
    MigrationCatalog catalog = basic_catalog();
    auto runner = make_runner(std::move(catalog));

    auto before = runner.get_migration_status();
    ASSERT_TRUE(before.has_value());
    EXPECT_EQ(before->current_version, 0);
    EXPECT_EQ(before->applied_count, 0u);
    EXPECT_EQ(before->pending_file_names,
              (std::vector<std::string>{"base_schema", "chapters", "genre"}));
    EXPECT_FALSE(db_.table_exists("migration_registry"));

    ASSERT_TRUE(runner.run_migrations().has_value());

    auto after = runner.get_migration_status();
    ASSERT_TRUE(after.has_value());
    EXPECT_EQ(after->current_version, 3);
    EXPECT_EQ(after->applied_count, 3u);
    EXPECT_TRUE(after->pending_file_names.empty());
}

TEST_F(MigrationRunnerTest, RollbackIsRefusedAfterSnapshot) {
    auto runner = make_runner(basic_catalog());
    ASSERT_TRUE(runner.run_migrations().has_value());
    auto backups_before = backups_->list_backups().size();

    auto result = runner.rollback_last_migration();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, MigrationErrorKind::ROLLBACK_UNSUPPORTED);
    EXPECT_EQ(result.error().version, 3);

    EXPECT_EQ(registry_->current_version().value(), 3);
    EXPECT_EQ(backups_->list_backups().size(), backups_before + 1);
}

TEST_F(MigrationRunnerTest, VerifyIntegrityDetectsEditedScript) {
    fs::path script = dir_ / "002_edit_me.sql";
    {
        std::ofstream(script) << "CREATE TABLE edited(id INT);";
    }

    MigrationCatalog catalog;
    catalog.add_inline(1, "base", "CREATE TABLE base(id INT);");
    catalog.add_file(2, "edit_me", script);
    auto runner = make_runner(std::move(catalog));
    ASSERT_TRUE(runner.run_migrations().has_value());

    auto clean = runner.verify_integrity();
    ASSERT_TRUE(clean.has_value());
    EXPECT_TRUE(clean->empty());

    {
        std::ofstream(script) << "CREATE TABLE edited(id INT, extra TEXT);";
    }
    auto modified = runner.verify_integrity();
    ASSERT_TRUE(modified.has_value());
    EXPECT_EQ(*modified, std::vector<int>{2});
}

TEST(IgnorableErrorTest, Classification) {
    DbError dup_column{SQLITE_ERROR, SQLITE_ERROR, "duplicate column name: genre"};
    DbError exists{SQLITE_ERROR, SQLITE_ERROR, "table projects already exists"};
    DbError constraint{SQLITE_CONSTRAINT, SQLITE_CONSTRAINT_UNIQUE, "UNIQUE constraint failed: already exists"};
    DbError other{SQLITE_ERROR, SQLITE_ERROR, "no such table: x"};

    EXPECT_TRUE(MigrationRunner::is_ignorable_error(dup_column, "ALTER TABLE projects ADD COLUMN genre TEXT"));
    EXPECT_TRUE(MigrationRunner::is_ignorable_error(dup_column, "alter table \"my projects\" add genre TEXT"));
    EXPECT_TRUE(MigrationRunner::is_ignorable_error(exists, "CREATE TABLE projects(id INT)"));
    EXPECT_TRUE(MigrationRunner::is_ignorable_error(exists, "  create index idx ON t(a)"));

    EXPECT_FALSE(MigrationRunner::is_ignorable_error(constraint, "CREATE TABLE projects(id INT)"));
    EXPECT_FALSE(MigrationRunner::is_ignorable_error(other, "CREATE TABLE projects(id INT)"));
    EXPECT_FALSE(MigrationRunner::is_ignorable_error(exists, "INSERT INTO projects VALUES (1)"));
    EXPECT_FALSE(MigrationRunner::is_ignorable_error(dup_column, "ALTER TABLE projects RENAME COLUMN a TO genre"));
}
