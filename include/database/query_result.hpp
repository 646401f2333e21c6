#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Roster {

struct ColumnInfo {
    std::string name;      // as reported by the backend (alias or derived name)
    uint32_t type_oid = 0;
};

// Text form of one value; std::nullopt is SQL NULL.
using Cell = std::optional<std::string>;
using Row = std::vector<Cell>;

/**
 * @brief Column-labelled rows produced by one statement.
 */
struct QueryResult {
    std::vector<ColumnInfo> columns;
    std::vector<Row> rows;

    size_t row_count() const { return rows.size(); }
};

} // namespace Roster
