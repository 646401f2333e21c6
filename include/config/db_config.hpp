// db_config.hpp
#pragma once

#include <string>

namespace Roster {

/**
 * @brief Connection settings for the target and bootstrap databases.
 *
 * Each setting is read from DB_* first, then the standard libpq PG*
 * variable, then a default.
 */
struct DbConfig {
    std::string host = "localhost";
    std::string port = "5432";
    std::string dbname;
    std::string user;
    std::string password;
    std::string admin_dbname = "postgres";  // database that exists before ours does
    int connect_timeout = 10;               // seconds, 0 waits forever

    /**
     * @throws std::runtime_error if no database name is configured or
     *         DB_CONNECT_TIMEOUT is not a non-negative integer
     */
    static DbConfig load_from_env();

    // libpq keyword/value string for the target database
    std::string to_conninfo() const;

    // Same credentials, bootstrap database
    std::string admin_conninfo() const;

    // Quote a value for a libpq connection string: it's -> 'it\'s'
    static std::string quote_conninfo_value(const std::string& value);

private:
    std::string conninfo_for(const std::string& database) const;
};

/**
 * @brief Locations of the SQL artifacts, log file and export directory.
 */
struct AppPaths {
    std::string schema_file = "sql/db_schema.sql";
    std::string query_file  = "sql/select_queries.sql";
    std::string index_file  = "sql/create_indexes.sql";
    std::string log_file    = "roster.log";
    std::string output_dir  = ".";

    static AppPaths load_from_env();
};

/**
 * @brief Load KEY=VALUE lines from a dotenv file into the environment.
 *
 * Variables already set in the environment win. Blank lines and lines
 * starting with '#' are skipped; an "export " prefix and matching quotes
 * around the value are stripped.
 *
 * @return Number of variables set, or -1 if the file could not be opened.
 */
int load_env_file(const std::string& path);

} // namespace Roster
