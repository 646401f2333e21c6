/**
 * @file connection_manager.cpp
 * @brief Session acquisition with a single reconnect attempt
 */

#include <database/connection_manager.hpp>
#include <database/database_error.hpp>
#include <database/postgres_connection.hpp>
#include <utils/logger.hpp>

namespace Roster {

ConnectionManager::ConnectionManager(DbConfig config, Connector connector)
    : config_(std::move(config)), connector_(std::move(connector)) {
    if (!connector_) {
        connector_ = [](const std::string& conninfo) -> std::unique_ptr<IDatabaseConnection> {
            return std::make_unique<PostgresConnection>(conninfo);
        };
    }
}

ConnectionManager::~ConnectionManager() {
    close();
}

IDatabaseConnection* ConnectionManager::acquire() {
    bool replacing = false;

    if (session_) {
        if (session_->is_connected() && session_->ping()) {
            return session_.get();
        }
        Logger::warn("Connection to " + config_.dbname + " failed its liveness check, reconnecting");
        session_.reset();
        replacing = true;
    }

    try {
        session_ = connector_(config_.to_conninfo());
    } catch (const DatabaseError& e) {
        session_.reset();
        if (replacing) {
            Logger::error("The error '" + std::string(e.what()) + "' occurred during reconnecting to " + config_.dbname);
        } else {
            Logger::error("Error connecting to " + config_.dbname + ": '" + e.what() + "'");
        }
        return nullptr;
    }

    if (replacing) {
        ++reconnects_;
        Logger::info("Reconnection to PostgreSQL " + config_.dbname + " successful");
    } else {
        Logger::info("Connection to PostgreSQL " + config_.dbname + " successful");
    }
    return session_.get();
}

std::unique_ptr<IDatabaseConnection> ConnectionManager::open_admin() {
    try {
        auto admin = connector_(config_.admin_conninfo());
        Logger::info("Connection to PostgreSQL " + config_.admin_dbname + " successful");
        return admin;
    } catch (const DatabaseError& e) {
        Logger::error("Error connecting to " + config_.admin_dbname + ": '" + e.what() + "'");
        return nullptr;
    }
}

void ConnectionManager::close() {
    if (session_) {
        session_->close();
        session_.reset();
    }
}

} // namespace Roster
