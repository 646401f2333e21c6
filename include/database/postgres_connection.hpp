/**
 * @file postgres_connection.hpp
 * @brief libpq session implementing IDatabaseConnection
 */

#pragma once

#include <database/idatabase_connection.hpp>
#include <database/database_error.hpp>
#include <memory>
#include <string>
#include <vector>
#include <libpq-fe.h>

namespace Roster {

/**
 * @brief PostgreSQL connection wrapper
 *
 * Statements run in auto-commit mode unless wrapped in begin()/commit().
 * Every PGresult is owned by a handle that clears it on all paths.
 */
class PostgresConnection : public IDatabaseConnection {
public:
    /**
     * @brief Connect with an explicit libpq connection string
     * @throws DatabaseError if the connection cannot be established
     */
    explicit PostgresConnection(const std::string& conninfo);

    ~PostgresConnection() override;

    // No copy
    PostgresConnection(const PostgresConnection&) = delete;
    PostgresConnection& operator=(const PostgresConnection&) = delete;

    // Move OK
    PostgresConnection(PostgresConnection&& other) noexcept;
    PostgresConnection& operator=(PostgresConnection&& other) noexcept;

    bool is_connected() const override;
    bool ping() override;
    void close() override;

    void execute(const std::string& sql) override;
    size_t execute(const std::string& sql, const std::vector<SqlParam>& params) override;

    QueryResult query(const std::string& sql) override;

    std::optional<std::string> query_single(const std::string& sql,
                                            const std::vector<SqlParam>& params) override;

    void begin() override;
    void commit() override;
    void rollback() override;

private:
    struct ResultDeleter {
        void operator()(PGresult* r) const { if (r) PQclear(r); }
    };
    using ResultHandle = std::unique_ptr<PGresult, ResultDeleter>;

    void connect(const std::string& conninfo);
    void disconnect();
    void ensure_connected() const;
    ResultHandle exec_params(const std::string& sql, const std::vector<SqlParam>& params);
    void check_result(const ResultHandle& result);

    static size_t affected_rows(const ResultHandle& result);

    PGconn* conn_ = nullptr;
    std::string last_error_;
};

} // namespace Roster
