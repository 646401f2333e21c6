/**
 * @file test_statement_batch.cpp
 * @brief Unit tests for splitting SQL artifacts into ordered statements
 */

#include <gtest/gtest.h>
#include <query/statement_batch.hpp>
#include <filesystem>
#include <fstream>

using namespace Roster;

TEST(StatementBatchTest, SplitsOnSemicolonAndTrims) {
    auto stmts = split_statements("SELECT 1;\n  SELECT 2 ;\nSELECT 3");
    ASSERT_EQ(stmts.size(), 3u);
    EXPECT_EQ(stmts[0], "SELECT 1");
    EXPECT_EQ(stmts[1], "SELECT 2");
    EXPECT_EQ(stmts[2], "SELECT 3");
}

TEST(StatementBatchTest, DropsEmptyAndWhitespaceFragments) {
    auto stmts = split_statements(";;  \n\t;SELECT 1;;\n\n");
    ASSERT_EQ(stmts.size(), 1u);
    EXPECT_EQ(stmts[0], "SELECT 1");
}

TEST(StatementBatchTest, EmptyInput) {
    EXPECT_TRUE(split_statements("").empty());
    EXPECT_TRUE(split_statements("   \n").empty());
}

TEST(StatementBatchTest, PreservesOrder) {
    std::string sql;
    for (int i = 1; i <= 10; ++i) {
        sql += "SELECT " + std::to_string(i) + ";\n";
    }
    auto stmts = split_statements(sql);
    ASSERT_EQ(stmts.size(), 10u);
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(stmts[i], "SELECT " + std::to_string(i + 1));
    }
}

TEST(StatementBatchTest, SemicolonInsideLiteralDoesNotSplit) {
    auto stmts = split_statements("SELECT 'a;b', 'it''s; fine'; SELECT \"odd;name\" FROM t");
    ASSERT_EQ(stmts.size(), 2u);
    EXPECT_EQ(stmts[0], "SELECT 'a;b', 'it''s; fine'");
    EXPECT_EQ(stmts[1], "SELECT \"odd;name\" FROM t");
}

TEST(StatementBatchTest, EscapeStringBackslashQuoteDoesNotEndLiteral) {
    auto stmts = split_statements("SELECT E'it\\'s;x' AS a; SELECT 2");
    ASSERT_EQ(stmts.size(), 2u);
    EXPECT_EQ(stmts[0], "SELECT E'it\\'s;x' AS a");
    EXPECT_EQ(stmts[1], "SELECT 2");
}

TEST(StatementBatchTest, BackslashInPlainLiteralIsLiteral) {
    auto stmts = split_statements("SELECT 'C:\\'; SELECT 2");
    ASSERT_EQ(stmts.size(), 2u);
    EXPECT_EQ(stmts[0], "SELECT 'C:\\'");
}

TEST(StatementBatchTest, DollarQuotedBodyIsOneStatement) {
    auto stmts = split_statements("DO $$ BEGIN PERFORM 1; PERFORM 2; END $$; SELECT 2");
    ASSERT_EQ(stmts.size(), 2u);
    EXPECT_EQ(stmts[0], "DO $$ BEGIN PERFORM 1; PERFORM 2; END $$");
    EXPECT_EQ(stmts[1], "SELECT 2");
}

TEST(StatementBatchTest, TaggedDollarQuoteNeedsMatchingTag) {
    auto stmts = split_statements(
        "CREATE FUNCTION f() RETURNS text AS $fn$ SELECT $$a;b$$; $fn$ LANGUAGE sql; SELECT 3");
    ASSERT_EQ(stmts.size(), 2u);
    EXPECT_EQ(stmts[0], "CREATE FUNCTION f() RETURNS text AS $fn$ SELECT $$a;b$$; $fn$ LANGUAGE sql");
    EXPECT_EQ(stmts[1], "SELECT 3");
}

TEST(StatementBatchTest, PositionalParametersAreNotDollarQuotes) {
    auto stmts = split_statements("SELECT $1; SELECT $2");
    ASSERT_EQ(stmts.size(), 2u);
    EXPECT_EQ(stmts[0], "SELECT $1");
    EXPECT_EQ(stmts[1], "SELECT $2");
}

TEST(StatementBatchTest, CommentOnlyFragmentsAreDropped) {
    auto stmts = split_statements("-- header; still a comment\nSELECT 1;\n/* trailing; block */\n");
    ASSERT_EQ(stmts.size(), 1u);
    EXPECT_NE(stmts[0].find("SELECT 1"), std::string::npos);
}

TEST(StatementBatchTest, ReadsFile) {
    auto path = std::filesystem::temp_directory_path() / "roster_statement_batch_test.sql";
    {
        std::ofstream out(path);
        out << "CREATE INDEX a ON t (x);\n\nCREATE INDEX b ON t (y);\n";
    }

    auto stmts = read_statement_file(path.string());
    ASSERT_EQ(stmts.size(), 2u);
    EXPECT_EQ(stmts[0], "CREATE INDEX a ON t (x)");
    EXPECT_EQ(stmts[1], "CREATE INDEX b ON t (y)");

    std::filesystem::remove(path);
}

TEST(StatementBatchTest, MissingFileThrows) {
    EXPECT_THROW(read_statement_file("/nonexistent/roster/queries.sql"), std::runtime_error);
}
