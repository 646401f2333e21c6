/**
 * @file test_query_exporter.cpp
 * @brief Unit tests for batch execution, index builds and file export
 */

#include <gtest/gtest.h>
#include <export/query_exporter.hpp>
#include <export/result_serializer.hpp>
#include <database/database_error.hpp>
#include <database/pg_types.hpp>
#include <utils/file_io.hpp>
#include <utils/logger.hpp>
#include "../mocks/fake_connection.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>

using namespace Roster;
using Roster::test::FakeConnection;

namespace fs = std::filesystem;

namespace {

class QueryExporterTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::set_console(false);
        dir_ = fs::temp_directory_path() / "roster_exporter_test";
        fs::remove_all(dir_);
        fs::create_directories(dir_);

        queries_ = write("queries.sql",
                         "-- occupancy\n"
                         "SELECT id, name FROM room;\n"
                         "\n"
                         "SELECT count(*) AS total FROM student;\n");

        QueryResult rooms;
        rooms.columns = {{"id", PgType::Int4}, {"name", PgType::Varchar}};
        rooms.rows = {{std::string("1"), std::string("Room #1")}};
        session_.respond("FROM room", rooms);

        QueryResult total;
        total.columns = {{"total", PgType::Int8}};
        total.rows = {{std::string("6")}};
        session_.respond("FROM student", total);
    }

    void TearDown() override {
        fs::remove_all(dir_);
        Logger::set_console(true);
    }

    std::string write(const std::string& name, const std::string& content) {
        auto path = dir_ / name;
        std::ofstream out(path);
        out << content;
        return path.string();
    }

    size_t files_in(const fs::path& dir) const {
        if (!fs::exists(dir)) return 0;
        return static_cast<size_t>(std::distance(fs::directory_iterator(dir), fs::directory_iterator{}));
    }

    fs::path dir_;
    std::string queries_;
    FakeConnection session_;
};

} // namespace

TEST(ExportFormatTest, ParsesKnownNames) {
    EXPECT_EQ(parse_export_format("json"), ExportFormat::Records);
    EXPECT_EQ(parse_export_format("Records"), ExportFormat::Records);
    EXPECT_EQ(parse_export_format("XML"), ExportFormat::Markup);
    EXPECT_EQ(parse_export_format("markup"), ExportFormat::Markup);
    EXPECT_FALSE(parse_export_format("csv").has_value());
    EXPECT_FALSE(parse_export_format("").has_value());
}

TEST(ExportFormatTest, Extensions) {
    EXPECT_STREQ(file_extension(ExportFormat::Records), ".json");
    EXPECT_STREQ(file_extension(ExportFormat::Markup), ".xml");
}

TEST_F(QueryExporterTest, BatchReturnsOneResultPerStatementInOrder) {
    QueryExporter exporter(dir_.string());
    auto results = exporter.execute_batch(&session_, queries_);

    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].columns[0].name, "id");
    EXPECT_EQ(results[1].columns[0].name, "total");
    ASSERT_EQ(session_.statements.size(), 2u);
    EXPECT_EQ(session_.statements[0], "-- occupancy\nSELECT id, name FROM room");
}

TEST_F(QueryExporterTest, FailingStatementStopsTheBatch) {
    auto path = write("bad.sql", "SELECT 1;\nSELECT broken FROM nowhere;\nSELECT 3;\n");
    session_.fail_on("nowhere", "42P01");

    QueryExporter exporter(dir_.string());
    try {
        exporter.execute_batch(&session_, path);
        FAIL() << "expected DatabaseError";
    } catch (const DatabaseError& e) {
        EXPECT_TRUE(e.is(SqlState::UndefinedTable));
    }
    EXPECT_EQ(session_.count("SELECT 3"), 0u);
}

TEST_F(QueryExporterTest, NullSessionYieldsNothing) {
    QueryExporter exporter((dir_ / "out").string());

    EXPECT_TRUE(exporter.execute_batch(nullptr, queries_).empty());
    EXPECT_EQ(exporter.build_indexes(nullptr, queries_), 0u);
    EXPECT_TRUE(exporter.export_result(nullptr, ExportFormat::Records, queries_).empty());
    EXPECT_EQ(files_in(dir_ / "out"), 0u);
}

TEST_F(QueryExporterTest, IndexesCommitOneStatementAtATime) {
    auto path = write("indexes.sql",
                      "CREATE INDEX IF NOT EXISTS a ON student (room);\n"
                      "CREATE INDEX IF NOT EXISTS b ON student (birthday);\n");

    QueryExporter exporter(dir_.string());
    EXPECT_EQ(exporter.build_indexes(&session_, path), 2u);

    std::vector<std::string> expected = {
        "BEGIN", "CREATE INDEX IF NOT EXISTS a ON student (room)", "COMMIT",
        "BEGIN", "CREATE INDEX IF NOT EXISTS b ON student (birthday)", "COMMIT",
    };
    EXPECT_EQ(session_.statements, expected);
}

TEST_F(QueryExporterTest, FailedIndexRollsBackAndKeepsEarlierOnes) {
    auto path = write("indexes.sql",
                      "CREATE INDEX a ON student (room);\n"
                      "CREATE INDEX b ON student (missing);\n");
    session_.fail_on("missing", "42703");

    QueryExporter exporter(dir_.string());
    EXPECT_THROW(exporter.build_indexes(&session_, path), DatabaseError);

    EXPECT_EQ(session_.count("COMMIT"), 1u);
    EXPECT_EQ(session_.count("ROLLBACK"), 1u);
    EXPECT_FALSE(session_.in_transaction());
}

TEST_F(QueryExporterTest, ExportWritesOneJsonFilePerStatement) {
    QueryExporter exporter((dir_ / "out").string());
    auto paths = exporter.export_result(&session_, ExportFormat::Records, queries_);

    ASSERT_EQ(paths.size(), 2u);
    EXPECT_EQ(fs::path(paths[0]).filename().string(), "output_1.json");
    EXPECT_EQ(fs::path(paths[1]).filename().string(), "output_2.json");
    EXPECT_EQ(files_in(dir_ / "out"), 2u);

    auto first = nlohmann::json::parse(read_file_content(paths[0]));
    EXPECT_EQ(first, nlohmann::json::parse(R"([{"id": 1, "name": "Room #1"}])"));

    auto second = nlohmann::json::parse(read_file_content(paths[1]));
    EXPECT_EQ(second[0]["total"], 6);
}

TEST_F(QueryExporterTest, ExportWritesOneXmlFilePerStatement) {
    QueryExporter exporter((dir_ / "out").string());
    auto paths = exporter.export_result(&session_, "xml", queries_);

    ASSERT_EQ(paths.size(), 2u);
    EXPECT_EQ(fs::path(paths[1]).filename().string(), "output_2.xml");

    std::string doc = read_file_content(paths[0]);
    EXPECT_NE(doc.find("<name>Room #1</name>"), std::string::npos);
}

TEST_F(QueryExporterTest, UnknownFormatExecutesNothing) {
    QueryExporter exporter((dir_ / "out").string());
    EXPECT_TRUE(exporter.export_result(&session_, "csv", queries_).empty());

    EXPECT_TRUE(session_.statements.empty());
    EXPECT_EQ(files_in(dir_ / "out"), 0u);
}

TEST_F(QueryExporterTest, UnsupportedTypeWritesNoFiles) {
    QueryResult stamped;
    stamped.columns = {{"birthday", PgType::Timestamp}};
    stamped.rows = {{std::string("1996-05-13 00:00:00")}};

    QueryResult fine;
    fine.columns = {{"id", PgType::Int4}};
    fine.rows = {{std::string("1")}};

    QueryExporter exporter((dir_ / "out").string());
    auto paths = exporter.output_paths(ExportFormat::Records, 2);

    EXPECT_THROW(exporter.export_as_records({fine, stamped}, paths), SerializationError);
    EXPECT_EQ(files_in(dir_ / "out"), 0u);
}

TEST_F(QueryExporterTest, CountMismatchIsRejected) {
    QueryExporter exporter(dir_.string());
    std::vector<QueryResult> results(2);
    std::vector<std::string> paths = {(dir_ / "only.json").string()};

    EXPECT_THROW(exporter.export_as_records(results, paths), std::invalid_argument);
    EXPECT_THROW(exporter.export_as_markup(results, paths), std::invalid_argument);
}
