#include <ingestion/record_loader.hpp>
#include <database/database_error.hpp>
#include <database/transaction.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace Roster {

namespace {

std::string open_failure_reason(const std::string& path) {
    std::error_code ec;
    const auto st = std::filesystem::status(path, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) return ec.message();
    if (!std::filesystem::exists(st)) return "No such file or directory";
    if (std::filesystem::is_directory(st)) return "Is a directory";
    return "Cannot open file";
}

} // namespace

const char* to_string(RecordKind kind) {
    switch (kind) {
        case RecordKind::Container: return "room";
        case RecordKind::Member:    return "student";
    }
    return "unknown";
}

const RecordProjection& projection_for(RecordKind kind) {
    static const RecordProjection container{"room", {"id", "name"}};
    static const RecordProjection member{"student", {"birthday", "id", "name", "room", "sex"}};

    switch (kind) {
        case RecordKind::Container: return container;
        case RecordKind::Member:    return member;
    }
    throw std::invalid_argument("unknown record kind");
}

RecordLoader::RecordLoader(size_t rows_per_statement)
    : rows_per_statement_(std::max<size_t>(1, rows_per_statement)) {}

size_t RecordLoader::rows_per_statement(const RecordProjection& projection) const {
    size_t by_params = MAX_BIND_PARAMS / std::max<size_t>(1, projection.columns.size());
    return std::max<size_t>(1, std::min(rows_per_statement_, by_params));
}

std::string RecordLoader::build_insert_sql(const RecordProjection& projection, size_t row_count) {
    std::string sql = "INSERT INTO " + projection.table + " (";
    for (size_t c = 0; c < projection.columns.size(); ++c) {
        if (c > 0) sql += ", ";
        sql += projection.columns[c];
    }
    sql += ") VALUES ";

    size_t param = 1;
    for (size_t r = 0; r < row_count; ++r) {
        if (r > 0) sql += ", ";
        sql += "(";
        for (size_t c = 0; c < projection.columns.size(); ++c) {
            if (c > 0) sql += ", ";
            sql += "$" + std::to_string(param++);
        }
        sql += ")";
    }

    sql += " ON CONFLICT (id) DO NOTHING";
    return sql;
}

SqlParam RecordLoader::to_param(const nlohmann::json& value, const std::string& field, size_t index) {
    switch (value.type()) {
        case nlohmann::json::value_t::null:
            return std::nullopt;
        case nlohmann::json::value_t::string:
            return value.get<std::string>();
        case nlohmann::json::value_t::boolean:
            return std::string(value.get<bool>() ? "true" : "false");
        case nlohmann::json::value_t::number_integer:
        case nlohmann::json::value_t::number_unsigned:
        case nlohmann::json::value_t::number_float:
            return value.dump();
        default:
            throw std::invalid_argument("record " + std::to_string(index) + ": field '" + field +
                                        "' holds a " + value.type_name() + ", expected a scalar");
    }
}

std::vector<std::vector<SqlParam>> RecordLoader::project_records(const nlohmann::json& records,
                                                                 const RecordProjection& projection) {
    std::vector<std::vector<SqlParam>> rows;
    rows.reserve(records.size());

    size_t index = 0;
    for (const auto& record : records) {
        if (!record.is_object()) {
            throw std::invalid_argument("record " + std::to_string(index) + " is a " +
                                        record.type_name() + ", expected an object");
        }

        std::vector<SqlParam> row;
        row.reserve(projection.columns.size());
        for (const auto& column : projection.columns) {
            auto it = record.find(column);
            if (it == record.end()) {
                row.emplace_back(std::nullopt);
            } else {
                row.push_back(to_param(*it, column, index));
            }
        }
        rows.push_back(std::move(row));
        ++index;
    }

    return rows;
}

LoadStats RecordLoader::load(IDatabaseConnection* session, const std::string& json_path, RecordKind kind) {
    const char* table = to_string(kind);

    if (session == nullptr) {
        Logger::error(std::string("Failed to load data into ") + table + ": No connection to the DB.");
        return {};
    }

    nlohmann::json records;
    {
        std::ifstream file(json_path);
        if (!file.is_open()) {
            Logger::error("'" + open_failure_reason(json_path) + "' occurred during opening " + json_path);
            return {};
        }

        try {
            records = nlohmann::json::parse(file);
        } catch (const nlohmann::json::parse_error& e) {
            Logger::error("'" + std::string(e.what()) + "' occurred during reading " + json_path);
            return {};
        }
    }

    if (!records.is_array()) {
        Logger::error(json_path + " does not hold a JSON array of records, nothing loaded into " + table);
        return {};
    }

    return insert_records(*session, records, kind);
}

LoadStats RecordLoader::insert_records(IDatabaseConnection& session, const nlohmann::json& records,
                                       RecordKind kind) {
    const RecordProjection& projection = projection_for(kind);
    auto rows = project_records(records, projection);

    LoadStats stats;
    stats.records_read = rows.size();

    if (rows.empty()) {
        Logger::info("No records to load into " + projection.table);
        return stats;
    }

    Timer timer;
    const size_t chunk = rows_per_statement(projection);

    try {
        Transaction tx(session);

        for (size_t start = 0; start < rows.size(); start += chunk) {
            size_t end = std::min(start + chunk, rows.size());

            std::vector<SqlParam> params;
            params.reserve((end - start) * projection.columns.size());
            for (size_t r = start; r < end; ++r) {
                params.insert(params.end(), rows[r].begin(), rows[r].end());
            }

            stats.records_inserted += session.execute(build_insert_sql(projection, end - start), params);
        }

        tx.commit();
    } catch (const DatabaseError& e) {
        Logger::error("Error loading records into " + projection.table + ": " + e.what());
        throw;
    }

    Logger::success("Loaded " + std::to_string(stats.records_inserted) + " of " +
                    std::to_string(stats.records_read) + " records into " + projection.table +
                    " (" + timer.elapsed_str() + ")");
    return stats;
}

} // namespace Roster
