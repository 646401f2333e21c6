#include <schema/schema_provisioner.hpp>
#include <database/database_error.hpp>
#include <database/transaction.hpp>
#include <utils/file_io.hpp>
#include <utils/logger.hpp>

namespace Roster {

std::string SchemaProvisioner::quote_identifier(const std::string& id) {
    std::string out;
    out.reserve(id.size() + 2);
    out.push_back('"');
    for (char c : id) {
        if (c == '"') out.append("\"\"");
        else out.push_back(c);
    }
    out.push_back('"');
    return out;
}

bool SchemaProvisioner::database_exists(IDatabaseConnection& admin, const std::string& name) {
    auto found = admin.query_single("SELECT 1 FROM pg_database WHERE datname = $1", {name});
    return found.has_value();
}

SchemaProvisioner::DatabaseState SchemaProvisioner::ensure_database(IDatabaseConnection& admin,
                                                                    const std::string& target) {
    if (database_exists(admin, target)) {
        Logger::info("Database '" + target + "' already exists.");
        return DatabaseState::AlreadyExists;
    }

    try {
        admin.execute("CREATE DATABASE " + quote_identifier(target));
    } catch (const DatabaseError& e) {
        if (e.is(SqlState::DuplicateDatabase)) {
            Logger::info("Database '" + target + "' already exists.");
            return DatabaseState::AlreadyExists;
        }
        Logger::error("Error creating database '" + target + "': " + e.what());
        throw;
    }

    Logger::success("Database '" + target + "' created successfully.");
    return DatabaseState::Created;
}

bool SchemaProvisioner::ensure_tables(IDatabaseConnection& session, const std::string& schema_path) {
    const std::string sql = read_file_content(schema_path);

    try {
        // Rolled back by the guard if execute() throws
        Transaction tx(session);
        session.execute(sql);
        tx.commit();
    } catch (const DatabaseError& e) {
        if (e.is(SqlState::UndefinedTable)) {
            Logger::error("Error creating tables: " + std::string(e.what()));
            return false;
        }
        Logger::error("Error executing SQL file " + schema_path + ": " + e.what());
        throw;
    }

    Logger::success("Tables created successfully.");
    return true;
}

} // namespace Roster
