#include <config/db_config.hpp>
#include <database/connection_manager.hpp>
#include <export/query_exporter.hpp>
#include <pipeline/pipeline.hpp>
#include <utils/logger.hpp>
#include <iostream>
#include <string>
#include <vector>

using namespace Roster;

static void usage(const char* prog) {
    std::cerr << "Usage: " << prog << " <students.json> <rooms.json> <json|xml> [options]\n";
    std::cerr << "\nOptions:\n";
    std::cerr << "  --output-dir DIR   where output_<n> files are written (default: $OUTPUT_DIR or .)\n";
    std::cerr << "  --env-file FILE    dotenv file to load first (default: ./.env)\n";
    std::cerr << "\nDatabase settings come from DB_NAME, DB_USER, DB_PASSWORD, DB_HOST, DB_PORT\n";
    std::cerr << "(or the PG* equivalents).\n";
    std::cerr << "\nExample:\n";
    std::cerr << "  " << prog << " data/students.json data/rooms.json json\n";
}

int main(int argc, char** argv) {
    std::vector<std::string> positional;
    std::string output_dir;
    std::string env_file = ".env";
    bool env_file_given = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            usage(argv[0]);
            return 0;
        } else if (arg == "--output-dir" && i + 1 < argc) {
            output_dir = argv[++i];
        } else if (arg == "--env-file" && i + 1 < argc) {
            env_file = argv[++i];
            env_file_given = true;
        } else if (arg.rfind("--", 0) == 0) {
            std::cerr << "Unknown option: " << arg << "\n";
            usage(argv[0]);
            return 2;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() != 3) {
        usage(argv[0]);
        return 2;
    }

    if (load_env_file(env_file) < 0 && env_file_given) {
        std::cerr << "Warning: cannot read env file " << env_file << "\n";
    }

    RunOptions options;
    options.students_path = positional[0];
    options.rooms_path = positional[1];
    options.paths = AppPaths::load_from_env();
    if (!output_dir.empty()) options.paths.output_dir = output_dir;

    if (!Logger::set_file(options.paths.log_file)) {
        std::cerr << "Warning: cannot open log file " << options.paths.log_file << "\n";
    }

    auto format = parse_export_format(positional[2]);
    if (!format) {
        Logger::error("Unknown file format: '" + positional[2] + "' (expected json or xml)");
        return 2;
    }
    options.format = *format;

    try {
        ConnectionManager connections(DbConfig::load_from_env());
        Pipeline pipeline(connections);

        RunSummary summary = pipeline.run(options);
        connections.close();

        if (!summary.session_available) {
            Logger::error("Run completed without a database session; results are incomplete");
            Logger::close_file();
            return 1;
        }
        Logger::close_file();

        std::cout << "\n=== Run Complete ===\n"
                  << "Rooms:    " << summary.rooms.records_inserted << " new / "
                  << summary.rooms.records_read << " read\n"
                  << "Students: " << summary.students.records_inserted << " new / "
                  << summary.students.records_read << " read\n"
                  << "Indexes:  " << summary.indexes_built << "\n"
                  << "Outputs:\n";
        for (const auto& path : summary.outputs) {
            std::cout << "  " << path << "\n";
        }
        return 0;
    } catch (const std::exception& e) {
        Logger::error(std::string("Fatal Error: ") + e.what());
        Logger::close_file();
        return 1;
    }
}
