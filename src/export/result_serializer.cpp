#include <export/result_serializer.hpp>
#include <export/markup_writer.hpp>
#include <database/pg_types.hpp>
#include <cmath>

namespace Roster {

namespace {

nlohmann::ordered_json parse_integer(const std::string& text, const ColumnInfo& column) {
    try {
        size_t pos = 0;
        long long v = std::stoll(text, &pos);
        if (pos == text.size()) return v;
    } catch (const std::logic_error&) {
        // fall through to the error below
    }
    throw SerializationError("Value '" + text + "' of column '" + column.name +
                             "' is not a valid " + PgType::type_name(column.type_oid));
}

nlohmann::ordered_json parse_floating(const std::string& text, const ColumnInfo& column) {
    double v = 0.0;
    try {
        size_t pos = 0;
        v = std::stod(text, &pos);
        if (pos != text.size()) {
            throw SerializationError("Value '" + text + "' of column '" + column.name +
                                     "' is not a valid " + PgType::type_name(column.type_oid));
        }
    } catch (const std::out_of_range&) {
        throw SerializationError("Value of column '" + column.name + "' does not fit a double: " + text);
    } catch (const std::invalid_argument&) {
        throw SerializationError("Value '" + text + "' of column '" + column.name +
                                 "' is not a valid " + PgType::type_name(column.type_oid));
    }

    // JSON has no NaN or Infinity
    if (!std::isfinite(v)) return nullptr;
    return v;
}

std::string markup_text(const std::string& text, const ColumnInfo& column) {
    if (PgType::category(column.type_oid) == PgType::Category::Boolean) {
        return (text == "t" || text == "true") ? "true" : "false";
    }
    return text;
}

} // namespace

nlohmann::ordered_json cell_to_json(const Cell& cell, const ColumnInfo& column) {
    if (!cell) return nullptr;

    const std::string& text = *cell;

    switch (PgType::category(column.type_oid)) {
        case PgType::Category::Boolean:
            return text == "t" || text == "true";
        case PgType::Category::Integer:
            return parse_integer(text, column);
        case PgType::Category::Float:
        case PgType::Category::Decimal:
            return parse_floating(text, column);
        case PgType::Category::String:
            return text;
        case PgType::Category::Json:
            try {
                return nlohmann::ordered_json::parse(text);
            } catch (const nlohmann::json::parse_error& e) {
                throw SerializationError("Column '" + column.name + "' holds invalid JSON: " + e.what());
            }
        case PgType::Category::Other:
            break;
    }

    throw SerializationError("Object of type " + PgType::type_name(column.type_oid) +
                             " is not JSON serializable");
}

nlohmann::ordered_json to_records(const QueryResult& result) {
    nlohmann::ordered_json records = nlohmann::ordered_json::array();

    for (const auto& row : result.rows) {
        nlohmann::ordered_json record = nlohmann::ordered_json::object();
        for (size_t j = 0; j < result.columns.size() && j < row.size(); ++j) {
            record[result.columns[j].name] = cell_to_json(row[j], result.columns[j]);
        }
        records.push_back(std::move(record));
    }

    return records;
}

std::string to_records_document(const QueryResult& result) {
    // Invalid UTF-8 from the backend is replaced rather than aborting the export
    return to_records(result).dump(4, ' ', false, nlohmann::ordered_json::error_handler_t::replace) + "\n";
}

std::string to_markup_document(const QueryResult& result) {
    std::vector<std::string> names;
    names.reserve(result.columns.size());
    for (const auto& column : result.columns) {
        names.push_back(to_element_name(column.name));
    }

    MarkupWriter writer;
    writer.open("data");

    for (const auto& row : result.rows) {
        writer.open("row");
        for (size_t j = 0; j < names.size() && j < row.size(); ++j) {
            if (row[j]) {
                writer.text_element(names[j], markup_text(*row[j], result.columns[j]));
            } else {
                writer.empty_element(names[j]);
            }
        }
        writer.close();
    }

    return writer.finish();
}

} // namespace Roster
