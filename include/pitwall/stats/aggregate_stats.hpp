#pragma once

#include "pitwall/store/race_store.hpp"
#include "pitwall/support/config.hpp"
#include "pitwall/support/error.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace pitwall::stats {

// Lap times are milliseconds. std_dev is the population deviation (divide by
// N); consistency is std_dev / average and 0 when there are no laps.
struct LapStatistics {
    std::size_t count = 0;
    double fastest = 0.0;
    double slowest = 0.0;
    double average = 0.0;
    double std_dev = 0.0;
    double consistency = 0.0;
};

LapStatistics compute_lap_statistics(const std::vector<double>& lap_times_ms);

// The summary fields kept on a vehicle row.
struct VehicleSummary {
    std::string vehicle_id;
    int car_number = 0;
    std::optional<std::string> class_name;
    std::optional<double> fastest_lap;
    std::optional<double> average_lap;
    int total_laps = 0;
    std::optional<double> max_speed;
    std::optional<int> position;
};

// Summary fields from raw values. Identity fields are left for the caller.
VehicleSummary summarize_vehicle(const std::vector<double>& lap_times_ms, const std::vector<double>& speed_samples,
                                 std::optional<int> position);

struct LapRange {
    std::optional<int> min_lap;
    std::optional<int> max_lap;
};

class AggregateComputer {
public:
    AggregateComputer(store::RaceStore& store, const support::AppConfig& config);

    // Rewrites fastest_lap, average_lap, total_laps, max_speed and position
    // (and a missing class) from the raw tables in one transaction.
    bool refresh_all(support::Error* error);
    bool refresh_vehicle(const std::string& vehicle_id, support::Error* error);

    // Recomputes a vehicle's summary straight from its raw rows without
    // touching the stored fields.
    bool derive(const std::string& vehicle_id, VehicleSummary* out, support::Error* error);

    // The summary as currently stored on the vehicle row.
    bool stored(const std::string& vehicle_id, VehicleSummary* out, support::Error* error);
    bool list_vehicles(std::vector<VehicleSummary>* out, support::Error* error);

    bool lap_statistics(const std::string& vehicle_id, const LapRange& range, LapStatistics* out,
                        support::Error* error);

private:
    bool refresh(const std::string* vehicle_id, support::Error* error);
    std::string speed_channel_list() const;

    store::RaceStore& store_;
    const support::AppConfig& config_;
};

} // namespace pitwall::stats
