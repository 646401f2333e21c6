/**
 * @file test_schema_provisioner.cpp
 * @brief Unit tests for database and table provisioning
 */

#include <gtest/gtest.h>
#include <schema/schema_provisioner.hpp>
#include <utils/logger.hpp>
#include "../mocks/fake_connection.hpp"
#include <filesystem>
#include <fstream>

using namespace Roster;
using Roster::test::FakeConnection;

namespace {

class SchemaProvisionerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::set_console(false);
        schema_path_ = std::filesystem::temp_directory_path() / "roster_schema_test.sql";
        std::ofstream out(schema_path_);
        out << "CREATE TABLE IF NOT EXISTS room (id INTEGER PRIMARY KEY, name VARCHAR(255) NOT NULL);\n";
    }

    void TearDown() override {
        std::filesystem::remove(schema_path_);
        Logger::set_console(true);
    }

    std::string schema_path() const { return schema_path_.string(); }

    std::filesystem::path schema_path_;
};

bool contains_prefix(const std::vector<std::string>& stmts, const std::string& prefix) {
    for (const auto& s : stmts) {
        if (s.rfind(prefix, 0) == 0) return true;
    }
    return false;
}

} // namespace

TEST_F(SchemaProvisionerTest, CreatesMissingDatabase) {
    FakeConnection admin;

    auto state = SchemaProvisioner::ensure_database(admin, "test_db");

    EXPECT_EQ(state, SchemaProvisioner::DatabaseState::Created);
    EXPECT_EQ(admin.count("CREATE DATABASE \"test_db\""), 1u);
    ASSERT_FALSE(admin.param_log.empty());
    EXPECT_EQ(admin.param_log[0][0], std::optional<std::string>("test_db"));
    EXPECT_FALSE(contains_prefix(admin.statements, "BEGIN"));  // CREATE DATABASE cannot run in a transaction
}

TEST_F(SchemaProvisionerTest, ExistingDatabaseIsNotRecreated) {
    FakeConnection admin;
    admin.respond_single("pg_database", std::string("1"));

    auto state = SchemaProvisioner::ensure_database(admin, "test_db");

    EXPECT_EQ(state, SchemaProvisioner::DatabaseState::AlreadyExists);
    EXPECT_FALSE(contains_prefix(admin.statements, "CREATE DATABASE"));
}

TEST_F(SchemaProvisionerTest, DuplicateDatabaseRaceIsBenign) {
    FakeConnection admin;
    admin.fail_on("CREATE DATABASE", SqlState::DuplicateDatabase);

    SchemaProvisioner::DatabaseState state{};
    EXPECT_NO_THROW(state = SchemaProvisioner::ensure_database(admin, "test_db"));
    EXPECT_EQ(state, SchemaProvisioner::DatabaseState::AlreadyExists);
}

TEST_F(SchemaProvisionerTest, OtherCreateFailuresPropagate) {
    FakeConnection admin;
    admin.fail_on("CREATE DATABASE", "42501");  // insufficient_privilege

    try {
        SchemaProvisioner::ensure_database(admin, "test_db");
        FAIL() << "expected DatabaseError";
    } catch (const DatabaseError& e) {
        EXPECT_EQ(e.sqlstate(), "42501");
    }
}

TEST_F(SchemaProvisionerTest, DatabaseNameIsQuoted) {
    EXPECT_EQ(SchemaProvisioner::quote_identifier("students"), "\"students\"");
    EXPECT_EQ(SchemaProvisioner::quote_identifier("we\"ird"), "\"we\"\"ird\"");
}

TEST_F(SchemaProvisionerTest, TablesAppliedInOneCommittedTransaction) {
    FakeConnection session;

    EXPECT_TRUE(SchemaProvisioner::ensure_tables(session, schema_path()));

    ASSERT_EQ(session.statements.size(), 3u);
    EXPECT_EQ(session.statements[0], "BEGIN");
    EXPECT_NE(session.statements[1].find("CREATE TABLE IF NOT EXISTS room"), std::string::npos);
    EXPECT_EQ(session.statements[2], "COMMIT");
}

TEST_F(SchemaProvisionerTest, UndefinedTableRollsBackAndReturnsFalse) {
    FakeConnection session;
    session.fail_on("CREATE TABLE", SqlState::UndefinedTable);

    bool ok = true;
    EXPECT_NO_THROW(ok = SchemaProvisioner::ensure_tables(session, schema_path()));
    EXPECT_FALSE(ok);
    EXPECT_EQ(session.count("ROLLBACK"), 1u);
    EXPECT_EQ(session.count("COMMIT"), 0u);
}

TEST_F(SchemaProvisionerTest, OtherTableFailuresRollBackAndPropagate) {
    FakeConnection session;
    session.fail_on("CREATE TABLE", "42601");  // syntax_error

    EXPECT_THROW(SchemaProvisioner::ensure_tables(session, schema_path()), DatabaseError);
    EXPECT_EQ(session.count("ROLLBACK"), 1u);
    EXPECT_EQ(session.count("COMMIT"), 0u);
}

TEST_F(SchemaProvisionerTest, MissingSchemaFileThrows) {
    FakeConnection session;
    EXPECT_THROW(SchemaProvisioner::ensure_tables(session, "/nonexistent/roster/schema.sql"),
                 std::runtime_error);
    EXPECT_TRUE(session.statements.empty());
}
