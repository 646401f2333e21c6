/**
 * @file postgres_connection.cpp
 * @brief PostgreSQL connection implementation
 */

#include <database/postgres_connection.hpp>
#include <cstdlib>
#include <cstring>

namespace Roster {

PostgresConnection::PostgresConnection(const std::string& conninfo) {
    connect(conninfo);
}

PostgresConnection::~PostgresConnection() {
    disconnect();
}

PostgresConnection::PostgresConnection(PostgresConnection&& other) noexcept
    : conn_(other.conn_), last_error_(std::move(other.last_error_)) {
    other.conn_ = nullptr;
}

PostgresConnection& PostgresConnection::operator=(PostgresConnection&& other) noexcept {
    if (this != &other) {
        disconnect();
        conn_ = other.conn_;
        last_error_ = std::move(other.last_error_);
        other.conn_ = nullptr;
    }
    return *this;
}

void PostgresConnection::connect(const std::string& conninfo) {
    conn_ = PQconnectdb(conninfo.c_str());

    if (conn_ == nullptr) {
        last_error_ = "out of memory allocating connection";
        throw DatabaseError("PostgreSQL connection failed: " + last_error_);
    }

    if (PQstatus(conn_) != CONNECTION_OK) {
        last_error_ = PQerrorMessage(conn_);
        PQfinish(conn_);
        conn_ = nullptr;
        throw DatabaseError("PostgreSQL connection failed: " + last_error_);
    }
}

void PostgresConnection::disconnect() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

void PostgresConnection::close() {
    disconnect();
}

bool PostgresConnection::is_connected() const {
    return conn_ && PQstatus(conn_) == CONNECTION_OK;
}

bool PostgresConnection::ping() {
    if (!is_connected()) {
        return false;
    }

    ResultHandle result(PQexec(conn_, "SELECT 1"));
    if (!result || PQresultStatus(result.get()) != PGRES_TUPLES_OK) {
        last_error_ = PQerrorMessage(conn_);
        return false;
    }
    return true;
}

void PostgresConnection::ensure_connected() const {
    if (!is_connected()) {
        throw DatabaseError("Not connected to database");
    }
}

void PostgresConnection::check_result(const ResultHandle& result) {
    if (!result) {
        last_error_ = PQerrorMessage(conn_);
        throw DatabaseError("PostgreSQL query failed: " + last_error_);
    }

    ExecStatusType status = PQresultStatus(result.get());

    if (status != PGRES_COMMAND_OK && status != PGRES_TUPLES_OK) {
        const char* msg = PQresultErrorMessage(result.get());
        last_error_ = (msg && *msg) ? msg : PQerrorMessage(conn_);

        const char* sqlstate = PQresultErrorField(result.get(), PG_DIAG_SQLSTATE);
        throw DatabaseError("PostgreSQL query failed: " + last_error_,
                            sqlstate ? sqlstate : "");
    }
}

size_t PostgresConnection::affected_rows(const ResultHandle& result) {
    const char* affected = PQcmdTuples(result.get());
    if (affected && std::strlen(affected) > 0) {
        return static_cast<size_t>(std::strtoull(affected, nullptr, 10));
    }
    return 0;
}

PostgresConnection::ResultHandle PostgresConnection::exec_params(
    const std::string& sql, const std::vector<SqlParam>& params) {
    ensure_connected();

    std::vector<const char*> param_values;
    param_values.reserve(params.size());
    for (const auto& p : params) {
        param_values.push_back(p ? p->c_str() : nullptr);
    }

    ResultHandle result(PQexecParams(
        conn_,
        sql.c_str(),
        static_cast<int>(params.size()),
        nullptr,
        param_values.data(),
        nullptr,
        nullptr,
        0  // Text format
    ));

    check_result(result);
    return result;
}

void PostgresConnection::execute(const std::string& sql) {
    ensure_connected();

    ResultHandle result(PQexec(conn_, sql.c_str()));
    check_result(result);
}

size_t PostgresConnection::execute(const std::string& sql, const std::vector<SqlParam>& params) {
    ResultHandle result = exec_params(sql, params);
    return affected_rows(result);
}

QueryResult PostgresConnection::query(const std::string& sql) {
    ensure_connected();

    ResultHandle result(PQexec(conn_, sql.c_str()));
    check_result(result);

    QueryResult out;

    int nfields = PQnfields(result.get());
    int nrows = PQntuples(result.get());

    out.columns.reserve(nfields);
    for (int j = 0; j < nfields; ++j) {
        out.columns.push_back({PQfname(result.get(), j),
                               static_cast<uint32_t>(PQftype(result.get(), j))});
    }

    out.rows.reserve(nrows);
    for (int i = 0; i < nrows; ++i) {
        Row row;
        row.reserve(nfields);

        for (int j = 0; j < nfields; ++j) {
            if (PQgetisnull(result.get(), i, j)) {
                row.emplace_back(std::nullopt);
            } else {
                row.emplace_back(std::string(PQgetvalue(result.get(), i, j),
                                             PQgetlength(result.get(), i, j)));
            }
        }

        out.rows.push_back(std::move(row));
    }

    return out;
}

std::optional<std::string> PostgresConnection::query_single(const std::string& sql,
                                                            const std::vector<SqlParam>& params) {
    ResultHandle result = exec_params(sql, params);

    std::optional<std::string> value;

    if (PQntuples(result.get()) > 0 && PQnfields(result.get()) > 0 &&
        !PQgetisnull(result.get(), 0, 0)) {
        value = PQgetvalue(result.get(), 0, 0);
    }

    return value;
}

void PostgresConnection::begin() {
    execute("BEGIN");
}

void PostgresConnection::commit() {
    execute("COMMIT");
}

void PostgresConnection::rollback() {
    execute("ROLLBACK");
}

} // namespace Roster
