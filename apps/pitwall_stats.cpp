#include "pitwall/stats/aggregate_stats.hpp"
#include "pitwall/store/race_store.hpp"
#include "pitwall/support/config.hpp"
#include "pitwall/support/error.hpp"

#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace {

struct CliArgs {
    std::string db_path;
    std::string vehicle_id;
    std::optional<int> min_lap;
    std::optional<int> max_lap;
};

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
        int lap = 0;
        if (a == "--db" || a == "--database") {
            const char* v = need(a);
            if (!v) return false;
            args->db_path = v;
        } else if (a == "--vehicle") {
            const char* v = need(a);
            if (!v) return false;
            args->vehicle_id = v;
        } else if (a == "--min-lap") {
            const char* v = need(a);
            if (!v || !pitwall::support::parse_int(v, &lap)) return false;
            args->min_lap = lap;
        } else if (a == "--max-lap") {
            const char* v = need(a);
            if (!v || !pitwall::support::parse_int(v, &lap)) return false;
            args->max_lap = lap;
        } else if (a == "--help" || a == "-h") {
            std::cout << "pitwall_stats [--db PATH] [--vehicle ID] [--min-lap N] [--max-lap N]\n";
            return false;
        } else {
            std::cerr << "Unknown argument: " << a << "\n";
            return false;
        }
    }
    return true;
}

std::string fmt_ms(const std::optional<double>& ms) {
    if (!ms) return "-";
    std::ostringstream out;
    out << std::fixed << std::setprecision(3) << (*ms / 1000.0) << "s";
    return out.str();
}

void print_vehicle(const pitwall::stats::VehicleSummary& v, const pitwall::stats::LapStatistics& laps) {
    std::cout << std::setw(4) << (v.position ? std::to_string(*v.position) : "-") << " " << std::left
              << std::setw(16) << v.vehicle_id << std::right << " " << std::setw(8) << v.class_name.value_or("-")
              << " " << std::setw(5) << v.total_laps << " " << std::setw(10) << fmt_ms(v.fastest_lap) << " "
              << std::setw(10) << fmt_ms(v.average_lap) << " " << std::setw(8);
    if (v.max_speed) {
        std::cout << std::fixed << std::setprecision(1) << *v.max_speed;
    } else {
        std::cout << "-";
    }
    std::cout << " " << std::setw(8) << std::fixed << std::setprecision(3) << (laps.std_dev / 1000.0) << "s "
              << std::setw(7) << std::setprecision(2) << (laps.consistency * 100.0) << "%\n";
}

} // namespace

int main(int argc, char** argv) {
    CliArgs args;
    if (!parse_args(argc, argv, &args)) return 1;

    pitwall::support::AppConfig config;
    pitwall::support::Error error;
    if (!pitwall::support::apply_environment(&config, &error)) {
        std::cerr << error.describe(true) << "\n";
        return 1;
    }
    if (!args.db_path.empty()) config.db_path = args.db_path;

    pitwall::store::RaceStore store;
    if (!store.open(config.db_path, pitwall::store::OpenMode::ReadWrite, &error)) {
        std::cerr << error.describe(true) << "\n";
        return 1;
    }

    pitwall::stats::AggregateComputer aggregates(store, config);
    const bool refreshed = args.vehicle_id.empty() ? aggregates.refresh_all(&error)
                                                   : aggregates.refresh_vehicle(args.vehicle_id, &error);
    if (!refreshed) {
        std::cerr << "Refresh failed: " << error.describe(true) << "\n";
        return 1;
    }

    std::vector<pitwall::stats::VehicleSummary> vehicles;
    if (args.vehicle_id.empty()) {
        if (!aggregates.list_vehicles(&vehicles, &error)) {
            std::cerr << error.describe(true) << "\n";
            return 1;
        }
    } else {
        pitwall::stats::VehicleSummary v;
        if (!aggregates.stored(args.vehicle_id, &v, &error)) {
            std::cerr << error.describe(true) << "\n";
            return 1;
        }
        vehicles.push_back(v);
    }

    const pitwall::stats::LapRange range{args.min_lap, args.max_lap};
    std::cout << " pos vehicle          class     laps    fastest    average   vmax   stddev  consist\n";
    for (const auto& v : vehicles) {
        pitwall::stats::LapStatistics laps;
        if (!aggregates.lap_statistics(v.vehicle_id, range, &laps, &error)) {
            std::cerr << error.describe(true) << "\n";
            return 1;
        }
        print_vehicle(v, laps);
    }
    std::cout << vehicles.size() << " vehicles\n";
    return 0;
}
