/**
 * @file pipeline.hpp
 * @brief One full run: provision, load, index, export
 */

#pragma once

#include <config/db_config.hpp>
#include <database/connection_manager.hpp>
#include <export/query_exporter.hpp>
#include <ingestion/record_loader.hpp>
#include <string>
#include <vector>

namespace Roster {

struct RunOptions {
    std::string students_path;
    std::string rooms_path;
    ExportFormat format = ExportFormat::Records;
    AppPaths paths;
};

struct RunSummary {
    bool database_checked = false;    // ensure_database ran
    bool session_available = false;   // a session was live for every step
    bool tables_ready = false;
    LoadStats rooms;
    LoadStats students;
    size_t indexes_built = 0;
    std::vector<std::string> outputs;
};

/**
 * @brief Drives the components in order over one borrowed ConnectionManager.
 *
 * Each step re-acquires the session, so a connection that drops between
 * steps is replaced once. A step that finds no session logs and is skipped;
 * the run carries on. Backend errors from index building or export, and
 * unreadable SQL artifacts, propagate to the caller.
 */
class Pipeline {
public:
    explicit Pipeline(ConnectionManager& connections);

    RunSummary run(const RunOptions& options);

private:
    void provision_database(RunSummary& summary);
    IDatabaseConnection* session_for(const char* step, RunSummary& summary);

    ConnectionManager& connections_;
};

} // namespace Roster
