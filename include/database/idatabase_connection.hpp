#pragma once

#include <database/query_result.hpp>
#include <optional>
#include <string>
#include <vector>

namespace Roster {

// Text-format statement parameter; std::nullopt binds SQL NULL.
using SqlParam = std::optional<std::string>;

/**
 * @brief One live session to the relational store.
 *
 * Components borrow a session from its owner and never close it.
 * Errors from execute/query are thrown as DatabaseError.
 */
class IDatabaseConnection {
public:
    virtual ~IDatabaseConnection() = default;

    virtual bool is_connected() const = 0;

    /**
     * @brief Liveness probe (SELECT 1). Never throws.
     */
    virtual bool ping() = 0;

    virtual void close() = 0;

    virtual void execute(const std::string& sql) = 0;

    /**
     * @brief Execute a parameterized statement ($1, $2, ...).
     * @return Number of rows affected.
     */
    virtual size_t execute(const std::string& sql, const std::vector<SqlParam>& params) = 0;

    /**
     * @brief Execute one statement and fetch all rows with column labels.
     */
    virtual QueryResult query(const std::string& sql) = 0;

    /**
     * @brief First column of the first row, if any.
     */
    virtual std::optional<std::string> query_single(const std::string& sql,
                                                    const std::vector<SqlParam>& params) = 0;

    virtual void begin() = 0;
    virtual void commit() = 0;
    virtual void rollback() = 0;
};

} // namespace Roster
