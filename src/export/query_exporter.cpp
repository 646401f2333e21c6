#include <export/query_exporter.hpp>
#include <export/result_serializer.hpp>
#include <database/database_error.hpp>
#include <database/transaction.hpp>
#include <query/statement_batch.hpp>
#include <utils/file_io.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;

namespace Roster {

std::optional<ExportFormat> parse_export_format(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "json" || lower == "records") return ExportFormat::Records;
    if (lower == "xml" || lower == "markup") return ExportFormat::Markup;
    return std::nullopt;
}

const char* to_string(ExportFormat format) {
    switch (format) {
        case ExportFormat::Records: return "json";
        case ExportFormat::Markup:  return "xml";
    }
    return "unknown";
}

const char* file_extension(ExportFormat format) {
    switch (format) {
        case ExportFormat::Records: return ".json";
        case ExportFormat::Markup:  return ".xml";
    }
    return "";
}

QueryExporter::QueryExporter(std::string output_dir)
    : output_dir_(std::move(output_dir)) {}

std::vector<QueryResult> QueryExporter::execute_batch(IDatabaseConnection* session,
                                                      const std::string& statement_path) {
    if (session == nullptr) {
        Logger::error("Failed to execute " + statement_path + ": No connection to the DB.");
        return {};
    }

    const auto statements = read_statement_file(statement_path);

    std::vector<QueryResult> results;
    results.reserve(statements.size());

    for (const auto& statement : statements) {
        Timer timer;
        try {
            results.push_back(session->query(statement));
        } catch (const DatabaseError& e) {
            Logger::error("Error executing query: " + statement);
            Logger::error("Database error: " + std::string(e.what()));
            throw;
        }
        Logger::info("SQL query executed successfully (" + std::to_string(results.back().row_count()) +
                     " rows, " + timer.elapsed_str() + ")");
    }

    return results;
}

size_t QueryExporter::build_indexes(IDatabaseConnection* session, const std::string& index_path) {
    if (session == nullptr) {
        Logger::error("Failed to create indexes from " + index_path + ": No connection to the DB.");
        return 0;
    }

    const auto statements = read_statement_file(index_path);

    size_t applied = 0;
    for (const auto& statement : statements) {
        try {
            Transaction tx(*session);
            session->execute(statement);
            tx.commit();
        } catch (const DatabaseError& e) {
            Logger::error("Error creating index: " + statement);
            Logger::error("Database error: " + std::string(e.what()));
            throw;
        }
        ++applied;
        Logger::success("Executed: " + statement);
    }

    return applied;
}

void QueryExporter::write_documents(const std::vector<std::string>& documents,
                                    const std::vector<std::string>& paths) {
    for (size_t i = 0; i < documents.size(); ++i) {
        const fs::path parent = fs::path(paths[i]).parent_path();
        if (!parent.empty()) {
            fs::create_directories(parent);
        }
        write_file_content(paths[i], documents[i]);
    }
}

void QueryExporter::export_as_records(const std::vector<QueryResult>& results,
                                      const std::vector<std::string>& paths) {
    if (results.size() != paths.size()) {
        throw std::invalid_argument("export_as_records: " + std::to_string(results.size()) +
                                    " results for " + std::to_string(paths.size()) + " paths");
    }

    std::vector<std::string> documents;
    documents.reserve(results.size());
    for (const auto& result : results) {
        documents.push_back(to_records_document(result));
    }

    write_documents(documents, paths);
}

void QueryExporter::export_as_markup(const std::vector<QueryResult>& results,
                                     const std::vector<std::string>& paths) {
    if (results.size() != paths.size()) {
        throw std::invalid_argument("export_as_markup: " + std::to_string(results.size()) +
                                    " results for " + std::to_string(paths.size()) + " paths");
    }

    std::vector<std::string> documents;
    documents.reserve(results.size());
    for (const auto& result : results) {
        documents.push_back(to_markup_document(result));
    }

    write_documents(documents, paths);
}

std::vector<std::string> QueryExporter::output_paths(ExportFormat format, size_t count) const {
    std::vector<std::string> paths;
    paths.reserve(count);
    for (size_t i = 1; i <= count; ++i) {
        fs::path p = fs::path(output_dir_) / ("output_" + std::to_string(i) + file_extension(format));
        paths.push_back(p.string());
    }
    return paths;
}

std::vector<std::string> QueryExporter::export_result(IDatabaseConnection* session, ExportFormat format,
                                                      const std::string& statement_path) {
    if (session == nullptr) {
        Logger::error(std::string("Failed to export results to '") + to_string(format) +
                      "' format: No connection to the DB.");
        return {};
    }

    auto results = execute_batch(session, statement_path);
    auto paths = output_paths(format, results.size());

    switch (format) {
        case ExportFormat::Records:
            export_as_records(results, paths);
            break;
        case ExportFormat::Markup:
            export_as_markup(results, paths);
            break;
    }

    Logger::success(std::string("Data exported to '") + to_string(format) + "' format successfully");
    return paths;
}

std::vector<std::string> QueryExporter::export_result(IDatabaseConnection* session, const std::string& format,
                                                      const std::string& statement_path) {
    auto parsed = parse_export_format(format);
    if (!parsed) {
        Logger::error("Unknown file format: '" + format + "'");
        return {};
    }
    return export_result(session, *parsed, statement_path);
}

} // namespace Roster
