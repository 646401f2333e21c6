/**
 * @file result_serializer.hpp
 * @brief Result set encodings: JSON records and XML markup
 */

#pragma once

#include <database/query_result.hpp>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace Roster {

/**
 * @brief A value whose backend type has no encoding in the output format.
 */
class SerializationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Convert one cell to JSON according to its column's backend type.
 *
 * integer types -> integer, numeric/real/double -> floating value,
 * boolean -> bool, text types -> string, json/jsonb -> parsed JSON,
 * NULL -> null. NaN and infinities become null.
 *
 * @throws SerializationError for any other type
 */
nlohmann::ordered_json cell_to_json(const Cell& cell, const ColumnInfo& column);

/**
 * @brief One object per row, keys in column order.
 *
 * A repeated column name keeps its first position and its last value.
 */
nlohmann::ordered_json to_records(const QueryResult& result);

/**
 * @brief to_records() dumped with 4-space indentation, UTF-8 kept as is.
 */
std::string to_records_document(const QueryResult& result);

/**
 * @brief <data><row><column>value</column>...</row>...</data>
 *
 * Values appear in the backend's text form (booleans as true/false);
 * NULL is an empty element.
 */
std::string to_markup_document(const QueryResult& result);

} // namespace Roster
