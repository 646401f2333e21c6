/**
 * @file schema_provisioner.hpp
 * @brief Creates the target database and its tables
 */

#pragma once

#include <database/idatabase_connection.hpp>
#include <string>

namespace Roster {

class SchemaProvisioner {
public:
    enum class DatabaseState {
        Created,
        AlreadyExists
    };

    /**
     * @brief Create the target database unless the catalog already lists it.
     *
     * Must run on a connection to another database (the target may not
     * exist yet), outside any transaction. Losing a creation race to
     * another client (duplicate_database) counts as AlreadyExists.
     *
     * @throws DatabaseError for any other failure
     */
    static DatabaseState ensure_database(IDatabaseConnection& admin, const std::string& target);

    static bool database_exists(IDatabaseConnection& admin, const std::string& name);

    /**
     * @brief Apply a schema file as a single unit.
     *
     * @return true once committed; false, after rollback, if the schema
     *         references an undefined table
     * @throws DatabaseError for any other backend failure (after rollback)
     * @throws std::runtime_error if the file cannot be read
     */
    static bool ensure_tables(IDatabaseConnection& session, const std::string& schema_path);

    // "my db" -> "\"my db\""
    static std::string quote_identifier(const std::string& id);
};

} // namespace Roster
