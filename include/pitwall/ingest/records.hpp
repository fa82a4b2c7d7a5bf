#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace pitwall::ingest {

enum class SourceType {
    LapTimes,
    Results,
    Telemetry,
    Sections,
    Weather,
};

std::string to_string(SourceType type);

// Lap and section times are milliseconds; timestamps are normalized ISO-8601
// UTC text (see support/time_codec.hpp).

struct LapRow {
    std::string vehicle_id;
    int car_number = 0;
    int lap = 0;
    double lap_time_ms = 0.0;
    std::optional<std::string> timestamp;
};

struct TelemetryRow {
    std::string vehicle_id;
    int car_number = 0;
    std::optional<int> lap;
    std::string timestamp;
    std::string telemetry_name;
    double telemetry_value = 0.0;
};

struct ResultRow {
    std::string vehicle_id;
    int car_number = 0;
    int position = 0;
    int laps = 0;
    std::string total_time;
    std::string gap_first;
    std::string gap_previous;
    std::string best_lap_time;
    std::string class_name;
};

struct SectionRow {
    std::string vehicle_id;
    int car_number = 0;
    int lap = 0;
    std::optional<double> s1_ms;
    std::optional<double> s2_ms;
    std::optional<double> s3_ms;
    std::optional<double> lap_time_ms;
    std::optional<double> top_speed;
};

struct WeatherRow {
    std::string timestamp;
    std::optional<double> air_temp;
    std::optional<double> track_temp;
    std::optional<double> humidity;
    std::optional<double> pressure;
    std::optional<double> wind_speed;
    std::optional<double> wind_direction;
    std::optional<double> rain;
};

using RecordBatch = std::variant<
    std::vector<LapRow>,
    std::vector<ResultRow>,
    std::vector<TelemetryRow>,
    std::vector<SectionRow>,
    std::vector<WeatherRow>>;

SourceType source_type_of(const RecordBatch& batch);
std::size_t batch_size(const RecordBatch& batch);

} // namespace pitwall::ingest
