#include <gtest/gtest.h>
#include "db/statement_parser.hpp"

using namespace novelforge::db;

TEST(StatementParserTest, EmptyInput) {
    EXPECT_TRUE(StatementParser::parse("").empty());
    EXPECT_TRUE(StatementParser::parse("   \n\t  ").empty());
    EXPECT_TRUE(StatementParser::parse(";;;").empty());
}

TEST(StatementParserTest, SimpleStatements) {
    auto statements = StatementParser::parse(
        "CREATE TABLE a(id INTEGER);\n"
        "CREATE TABLE b(id INTEGER);\n"
        "INSERT INTO a VALUES (1);\n");

    ASSERT_EQ(statements.size(), 3u);
    EXPECT_EQ(statements[0], "CREATE TABLE a(id INTEGER)");
    EXPECT_EQ(statements[1], "CREATE TABLE b(id INTEGER)");
    EXPECT_EQ(statements[2], "INSERT INTO a VALUES (1)");
}

TEST(StatementParserTest, TrailingStatementWithoutTerminator) {
    auto statements = StatementParser::parse("SELECT 1; SELECT 2");
    ASSERT_EQ(statements.size(), 2u);
    EXPECT_EQ(statements[1], "SELECT 2");
}

TEST(StatementParserTest, TrailingCommentStripped) {
    auto statements = StatementParser::parse(
        "CREATE TABLE t(id INT); -- note\nINSERT INTO t VALUES (1);");

    ASSERT_EQ(statements.size(), 2u);
    EXPECT_EQ(statements[0], "CREATE TABLE t(id INT)");
    EXPECT_EQ(statements[1], "INSERT INTO t VALUES (1)");
    for (const auto& s : statements) {
        EXPECT_EQ(s.find("note"), std::string::npos);
    }
}

TEST(StatementParserTest, CommentOnlyLinesContributeNothing) {
    auto statements = StatementParser::parse(
        "-- header comment\n"
        "-- another line; with a semicolon\n"
        "CREATE TABLE t(\n"
        "    id INTEGER, -- key\n"
        "    name TEXT   -- label\n"
        ");\n"
        "-- footer\n");

    ASSERT_EQ(statements.size(), 1u);
    EXPECT_EQ(statements[0], "CREATE TABLE t(\n    id INTEGER, \n    name TEXT   \n)");
}

TEST(StatementParserTest, TriggerIsOneStatement) {
    const char* script =
        "CREATE TABLE log(msg TEXT);\n"
        "CREATE TRIGGER trg AFTER INSERT ON log\n"
        "BEGIN\n"
        "    INSERT INTO log VALUES ('a');\n"
        "    UPDATE log SET msg = 'b';\n"
        "END;\n"
        "INSERT INTO log VALUES ('c');\n";

    auto statements = StatementParser::parse(script);
    ASSERT_EQ(statements.size(), 3u);
    EXPECT_EQ(statements[0], "CREATE TABLE log(msg TEXT)");
    EXPECT_EQ(statements[1].rfind("CREATE TRIGGER trg", 0), 0u);
    EXPECT_EQ(statements[1].substr(statements[1].size() - 4), "END;");
    EXPECT_NE(statements[1].find("UPDATE log SET msg = 'b';"), std::string::npos);
    EXPECT_EQ(statements[2], "INSERT INTO log VALUES ('c')");
}

TEST(StatementParserTest, TriggerKeywordsAreCaseInsensitive) {
    auto statements = StatementParser::parse(
        "create temp trigger t after delete on x begin delete from y; end ;\n"
        "select 1;");

    ASSERT_EQ(statements.size(), 2u);
    EXPECT_EQ(statements[0], "create temp trigger t after delete on x begin delete from y; end ;");
    EXPECT_EQ(statements[1], "select 1");
}

TEST(StatementParserTest, CaseExpressionInsideTriggerBody) {
    const char* script =
        "CREATE TRIGGER t AFTER UPDATE ON c BEGIN\n"
        "  UPDATE c SET s = CASE WHEN NEW.v > 0 THEN 'pos' ELSE 'neg' END;\n"
        "  DELETE FROM d;\n"
        "END;\n"
        "SELECT 2;";

    auto statements = StatementParser::parse(script);
    ASSERT_EQ(statements.size(), 2u);
    EXPECT_NE(statements[0].find("DELETE FROM d;"), std::string::npos);
    EXPECT_EQ(statements[1], "SELECT 2");
}

TEST(StatementParserTest, CommentInsideTriggerBody) {
    auto statements = StatementParser::parse(
        "CREATE TRIGGER t AFTER INSERT ON a BEGIN\n"
        "  -- end; of nothing\n"
        "  DELETE FROM b;\n"
        "END;");

    ASSERT_EQ(statements.size(), 1u);
    EXPECT_EQ(statements[0].find("nothing"), std::string::npos);
    EXPECT_NE(statements[0].find("DELETE FROM b;"), std::string::npos);
}

TEST(StatementParserTest, BeginOutsideTriggerIsOrdinary) {
    auto statements = StatementParser::parse("BEGIN; CREATE TABLE x(a); COMMIT;");
    ASSERT_EQ(statements.size(), 3u);
    EXPECT_EQ(statements[0], "BEGIN");
    EXPECT_EQ(statements[2], "COMMIT");
}

TEST(StatementParserTest, IdentifiersContainingKeywordsDoNotOpenBody) {
    auto statements = StatementParser::parse(
        "CREATE TABLE trigger_log(begin_at TEXT, end_at TEXT);\n"
        "INSERT INTO trigger_log VALUES ('x', 'y');");
    EXPECT_EQ(statements.size(), 2u);
}

TEST(StatementParserTest, QuotedTextIsInert) {
    auto statements = StatementParser::parse(
        "INSERT INTO t VALUES ('a;b', 'it''s -- fine');\n"
        "INSERT INTO \"odd;name\" VALUES (`x--y`);");

    ASSERT_EQ(statements.size(), 2u);
    EXPECT_EQ(statements[0], "INSERT INTO t VALUES ('a;b', 'it''s -- fine')");
    EXPECT_EQ(statements[1], "INSERT INTO \"odd;name\" VALUES (`x--y`)");
}

TEST(StatementParserTest, StatementCountMatchesTerminators) {
    std::string script;
    for (int i = 0; i < 25; ++i) {
        script += "INSERT INTO t VALUES (" + std::to_string(i) + ");\n";
    }
    EXPECT_EQ(StatementParser::parse(script).size(), 25u);
}
