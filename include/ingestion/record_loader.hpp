/**
 * @file record_loader.hpp
 * @brief Conflict-safe batch insert of JSON records
 */

#pragma once

#include <database/idatabase_connection.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace Roster {

enum class RecordKind {
    Container,  // room
    Member      // student, references a room
};

const char* to_string(RecordKind kind);

/**
 * @brief Destination table and the JSON keys copied into it.
 *
 * JSON keys and column names are identical; "id" is the conflict key.
 */
struct RecordProjection {
    std::string table;
    std::vector<std::string> columns;
};

const RecordProjection& projection_for(RecordKind kind);

struct LoadStats {
    size_t records_read = 0;
    size_t records_inserted = 0;  // excludes rows skipped as duplicates
};

/**
 * @brief Loads a JSON array of flat objects into the room or student table.
 *
 * Usage:
 *   RecordLoader loader;
 *   loader.load(session, "rooms.json", RecordKind::Container);
 *
 * Notes:
 * - Keys missing from an object are inserted as NULL.
 * - Rows whose id already exists are skipped (ON CONFLICT (id) DO NOTHING),
 *   so loading the same file twice is harmless.
 * - All rows go in one transaction, committed once.
 * - A null session, an unreadable file or a document that is not an array
 *   is logged and nothing is written.
 */
class RecordLoader {
public:
    explicit RecordLoader(size_t rows_per_statement = DEFAULT_ROWS_PER_STATEMENT);

    /**
     * @throws std::invalid_argument if a projected field holds an object or array
     * @throws DatabaseError if the insert fails (the transaction is rolled back)
     */
    LoadStats load(IDatabaseConnection* session, const std::string& json_path, RecordKind kind);

    /**
     * @brief Insert already-parsed records. Same contract as load().
     */
    LoadStats insert_records(IDatabaseConnection& session, const nlohmann::json& records, RecordKind kind);

    /**
     * @brief One parameter row per record, in projection column order.
     */
    static std::vector<std::vector<SqlParam>> project_records(const nlohmann::json& records,
                                                              const RecordProjection& projection);

    // INSERT INTO t (a, b) VALUES ($1, $2), ($3, $4) ON CONFLICT (id) DO NOTHING
    static std::string build_insert_sql(const RecordProjection& projection, size_t row_count);

    size_t rows_per_statement(const RecordProjection& projection) const;

private:
    static SqlParam to_param(const nlohmann::json& value, const std::string& field, size_t index);

    size_t rows_per_statement_;

    static constexpr size_t DEFAULT_ROWS_PER_STATEMENT = 1000;
    static constexpr size_t MAX_BIND_PARAMS = 65535;  // wire protocol limit per statement
};

} // namespace Roster
