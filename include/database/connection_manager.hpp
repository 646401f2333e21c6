/**
 * @file connection_manager.hpp
 * @brief Owns the run's single session and recovers it when it dies
 */

#pragma once

#include <config/db_config.hpp>
#include <database/idatabase_connection.hpp>
#include <functional>
#include <memory>
#include <string>

namespace Roster {

class ConnectionManager {
public:
    /**
     * @brief Opens a session from a libpq connection string.
     *
     * Must throw DatabaseError when the connection cannot be made.
     */
    using Connector = std::function<std::unique_ptr<IDatabaseConnection>(const std::string& conninfo)>;

    /**
     * @param connector Defaults to opening a PostgresConnection.
     */
    explicit ConnectionManager(DbConfig config, Connector connector = {});
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    /**
     * @brief Return a live session, opening or replacing it as needed.
     *
     * A healthy current session (passes ping()) is returned as is. A dead
     * one is dropped and exactly one new connection is attempted. If that
     * fails the error is logged and nullptr is returned; callers must check.
     *
     * The pointer stays owned by the manager and is valid until the next
     * acquire() that replaces it, or close().
     */
    IDatabaseConnection* acquire();

    /**
     * @brief The current session without probing it; may be nullptr.
     */
    IDatabaseConnection* current() const { return session_.get(); }

    /**
     * @brief Open a separate connection to the bootstrap database.
     * @return nullptr (after logging) if the connection fails.
     */
    std::unique_ptr<IDatabaseConnection> open_admin();

    /**
     * @brief Close the current session. Safe to call repeatedly.
     */
    void close();

    /**
     * @brief Number of times a dead session was replaced.
     */
    size_t reconnect_count() const { return reconnects_; }

    const DbConfig& config() const { return config_; }

private:
    DbConfig config_;
    Connector connector_;
    std::unique_ptr<IDatabaseConnection> session_;
    size_t reconnects_ = 0;
};

} // namespace Roster
