#include <pipeline/pipeline.hpp>
#include <schema/schema_provisioner.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>

namespace Roster {

Pipeline::Pipeline(ConnectionManager& connections)
    : connections_(connections) {}

void Pipeline::provision_database(RunSummary& summary) {
    auto admin = connections_.open_admin();
    if (!admin) {
        Logger::warn("Skipping database creation: bootstrap database unreachable");
        return;
    }

    SchemaProvisioner::ensure_database(*admin, connections_.config().dbname);
    admin->close();
    summary.database_checked = true;
}

IDatabaseConnection* Pipeline::session_for(const char* step, RunSummary& summary) {
    IDatabaseConnection* session = connections_.acquire();
    if (session == nullptr) {
        Logger::warn(std::string("No database session for step: ") + step);
        summary.session_available = false;
    }
    return session;
}

RunSummary Pipeline::run(const RunOptions& options) {
    RunSummary summary;
    Timer timer;

    Logger::step("Provisioning database " + connections_.config().dbname);
    provision_database(summary);

    summary.session_available = true;

    if (IDatabaseConnection* session = session_for("create tables", summary)) {
        summary.tables_ready = SchemaProvisioner::ensure_tables(*session, options.paths.schema_file);
        if (!summary.tables_ready) {
            Logger::warn("Schema was not applied; continuing with existing tables");
        }
    }

    RecordLoader loader;

    Logger::step("Loading rooms from " + options.rooms_path);
    summary.rooms = loader.load(session_for("load rooms", summary), options.rooms_path, RecordKind::Container);

    Logger::step("Loading students from " + options.students_path);
    summary.students = loader.load(session_for("load students", summary), options.students_path, RecordKind::Member);

    QueryExporter exporter(options.paths.output_dir);

    Logger::step("Creating indexes from " + options.paths.index_file);
    summary.indexes_built = exporter.build_indexes(session_for("create indexes", summary), options.paths.index_file);

    Logger::step(std::string("Exporting query results as ") + to_string(options.format));
    summary.outputs = exporter.export_result(session_for("export", summary), options.format, options.paths.query_file);

    Logger::info("Run finished in " + timer.elapsed_str() + ", " + std::to_string(summary.outputs.size()) +
                 " files written");
    return summary;
}

} // namespace Roster
