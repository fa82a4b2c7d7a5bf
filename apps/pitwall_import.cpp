#include "pitwall/ingest/import_pipeline.hpp"
#include "pitwall/store/race_store.hpp"
#include "pitwall/support/config.hpp"
#include "pitwall/support/error.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <string>

namespace {

struct CliArgs {
    std::string data_dir;
    std::string db_path;
    bool verbose = false;
    bool help = false;
};

void print_usage() {
    std::cout << "pitwall_import <data-dir> [--db PATH] [-v|--verbose] [-h|--help]\n"
                 "  --db, --database PATH  store path (default: $DB_PATH or data/racing.db)\n"
                 "  -v, --verbose          per-file detail and error causes\n";
}

bool parse_args(int argc, char** argv, CliArgs* args) {
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        auto need = [&](const std::string& flag) -> const char* {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << flag << "\n";
                return nullptr;
            }
            return argv[++i];
        };
        if (a == "--db" || a == "--database") {
            const char* v = need(a);
            if (!v) return false;
            args->db_path = v;
        } else if (a == "-v" || a == "--verbose") {
            args->verbose = true;
        } else if (a == "-h" || a == "--help") {
            args->help = true;
        } else if (!a.empty() && a[0] == '-') {
            std::cerr << "Unknown argument: " << a << "\n";
            return false;
        } else if (args->data_dir.empty()) {
            args->data_dir = a;
        } else {
            std::cerr << "Unexpected argument: " << a << "\n";
            return false;
        }
    }
    return true;
}

void print_failure(const pitwall::support::Error& error, bool verbose) {
    std::cerr << "\nImport failed\n";
    std::cerr << "Error: " << error.describe(false) << "\n";
    if (verbose && !error.cause.empty()) std::cerr << "Cause: " << error.cause << "\n";
}

} // namespace

int main(int argc, char** argv) {
    CliArgs args;
    if (!parse_args(argc, argv, &args)) {
        print_usage();
        return 1;
    }
    if (args.help) {
        print_usage();
        return 0;
    }
    if (args.data_dir.empty()) {
        std::cerr << "Missing data directory\n";
        print_usage();
        return 1;
    }

    pitwall::support::AppConfig config;
    pitwall::support::Error error;
    if (!pitwall::support::apply_environment(&config, &error)) {
        print_failure(error, true);
        return 1;
    }
    if (!args.db_path.empty()) config.db_path = args.db_path;
    config.verbose = args.verbose;

    std::cout << "Data directory: " << args.data_dir << "\n";
    std::cout << "Database path:  " << config.db_path << "\n";

    const auto started = std::chrono::steady_clock::now();
    pitwall::store::RaceStore store;
    if (!store.open(config.db_path, pitwall::store::OpenMode::ReadWrite, &error)) {
        print_failure(error, config.verbose);
        return 1;
    }

    pitwall::ingest::ImportPipeline pipeline(store, config, std::cout);
    pitwall::ingest::ImportSummary summary;
    if (!pipeline.import_directory(args.data_dir, &summary, &error)) {
        print_failure(error, config.verbose);
        return 1;
    }
    const double seconds =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();

    std::cout << "\nImport summary\n";
    std::cout << "Vehicles:   " << summary.vehicles << "\n";
    std::cout << "Lap times:  " << summary.laps << "\n";
    std::cout << "Telemetry:  " << summary.telemetry << "\n";
    std::cout << "Results:    " << summary.results << "\n";
    std::cout << "Sections:   " << summary.sections << "\n";
    std::cout << "Weather:    " << summary.weather << "\n";
    if (summary.rows_skipped > 0) std::cout << "Skipped:    " << summary.rows_skipped << " malformed rows\n";
    std::cout << "Done in " << std::fixed << std::setprecision(2) << seconds << "s from " << summary.files
              << " files.\n";
    return 0;
}
