/**
 * @file query_exporter.hpp
 * @brief Runs the reporting statements and writes one output file per statement
 */

#pragma once

#include <database/idatabase_connection.hpp>
#include <database/query_result.hpp>
#include <optional>
#include <string>
#include <vector>

namespace Roster {

enum class ExportFormat {
    Records,  // JSON array of objects
    Markup    // XML document
};

/**
 * @brief "json"/"records" or "xml"/"markup", case-insensitive.
 */
std::optional<ExportFormat> parse_export_format(const std::string& name);

const char* to_string(ExportFormat format);

// ".json" or ".xml"
const char* file_extension(ExportFormat format);

class QueryExporter {
public:
    explicit QueryExporter(std::string output_dir = ".");

    /**
     * @brief Run every statement of the file in order and fetch its rows.
     *
     * The first failing statement is logged and its DatabaseError rethrown;
     * later statements do not run. A null session is logged and yields an
     * empty batch.
     *
     * @throws std::runtime_error if the file cannot be read
     */
    std::vector<QueryResult> execute_batch(IDatabaseConnection* session, const std::string& statement_path);

    /**
     * @brief Run each statement of the index file in its own committed
     *        transaction.
     * @return Number of statements applied.
     * @throws DatabaseError from the first failing statement
     */
    size_t build_indexes(IDatabaseConnection* session, const std::string& index_path);

    /**
     * @brief Write result i to paths[i] as JSON records.
     *
     * Every result is serialized before any file is written, so a
     * SerializationError leaves no partial output behind.
     *
     * @throws std::invalid_argument if the counts differ
     * @throws SerializationError, std::runtime_error (unwritable path)
     */
    void export_as_records(const std::vector<QueryResult>& results, const std::vector<std::string>& paths);

    /**
     * @brief Write result i to paths[i] as an XML document.
     * @throws std::invalid_argument if the counts differ
     */
    void export_as_markup(const std::vector<QueryResult>& results, const std::vector<std::string>& paths);

    /**
     * @brief Execute the statement file and write output_1..output_N.
     * @return Paths written, in statement order; empty for a null session.
     */
    std::vector<std::string> export_result(IDatabaseConnection* session, ExportFormat format,
                                           const std::string& statement_path);

    /**
     * @brief As above with the format given by name. An unknown name is
     *        logged and nothing is executed or written.
     */
    std::vector<std::string> export_result(IDatabaseConnection* session, const std::string& format,
                                           const std::string& statement_path);

    /**
     * @brief <output_dir>/output_1.<ext> ... output_<count>.<ext>
     */
    std::vector<std::string> output_paths(ExportFormat format, size_t count) const;

private:
    void write_documents(const std::vector<std::string>& documents, const std::vector<std::string>& paths);

    std::string output_dir_;
};

} // namespace Roster
