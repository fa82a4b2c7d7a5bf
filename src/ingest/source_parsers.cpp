#include "pitwall/ingest/source_parsers.hpp"

#include "pitwall/ingest/csv_reader.hpp"
#include "pitwall/support/config.hpp"
#include "pitwall/support/text.hpp"
#include "pitwall/support/time_codec.hpp"

#include <cmath>
#include <cstdint>
#include <iterator>
#include <map>
#include <utility>

namespace pitwall::ingest {

using support::Error;
using support::ErrorKind;
using support::fail;

namespace {

bool require_columns(const CsvReader& reader, const std::vector<std::string>& names, std::vector<int>* out,
                     SourceType type, Error* error) {
    out->clear();
    for (const auto& name : names) {
        const int col = reader.column(name);
        if (col < 0) {
            return fail(error, ErrorKind::Parse, to_string(type) + " source is missing column '" + name + "'");
        }
        out->push_back(col);
    }
    return true;
}

std::optional<double> optional_double(const std::string& raw) {
    double v = 0.0;
    if (!support::parse_double(raw, &v)) return std::nullopt;
    return v;
}

std::optional<double> optional_duration(const std::string& raw) {
    double ms = 0.0;
    if (!support::parse_duration_ms(raw, &ms)) return std::nullopt;
    return ms;
}

bool open_reader(CsvReader& reader, SourceType type, Error* error) {
    if (reader.read_header(error)) return true;
    if (error) error->message = to_string(type) + " source: " + error->message;
    return false;
}

} // namespace

void ParseReport::skip(std::size_t line, const std::string& reason) {
    ++rows_skipped;
    if (skip_reasons.size() < kMaxSkipReasons) {
        skip_reasons.push_back("line " + std::to_string(line) + ": " + reason);
    }
}

char delimiter_for(SourceType type) {
    switch (type) {
        case SourceType::LapTimes:
        case SourceType::Telemetry:
            return ',';
        case SourceType::Results:
        case SourceType::Sections:
        case SourceType::Weather:
            return ';';
    }
    return ',';
}

std::optional<SourceType> classify_file(const std::string& filename) {
    if (!support::ends_with_ci(filename, ".csv")) return std::nullopt;
    if (support::contains_ci(filename, "lap_time")) return SourceType::LapTimes;
    if (support::contains_ci(filename, "telemetry")) return SourceType::Telemetry;
    if (support::contains_ci(filename, "results")) return SourceType::Results;
    if (support::contains_ci(filename, "endurance") || support::contains_ci(filename, "section")) {
        return SourceType::Sections;
    }
    if (support::contains_ci(filename, "weather")) return SourceType::Weather;
    return std::nullopt;
}

bool parse_lap_times(std::istream& in, VehicleIdentityResolver& identities, std::vector<LapRow>* out,
                     ParseReport* report, Error* error) {
    CsvReader reader(in, delimiter_for(SourceType::LapTimes));
    if (!open_reader(reader, SourceType::LapTimes, error)) return false;
    std::vector<int> cols;
    if (!require_columns(reader, {"vehicle_id", "lap", "value"}, &cols, SourceType::LapTimes, error)) return false;
    const int ts_col = reader.column("timestamp");

    std::vector<std::string> f;
    while (reader.next(&f)) {
        report->rows_read++;
        LapRow row;
        if (!support::parse_int(field_or_empty(f, cols[1]), &row.lap)) {
            report->skip(reader.line_number(), "lap is not an integer");
            continue;
        }
        const std::string& value = field_or_empty(f, cols[2]);
        if (!support::parse_double(value, &row.lap_time_ms) && !support::parse_duration_ms(value, &row.lap_time_ms)) {
            report->skip(reader.line_number(), "lap time '" + value + "' is not a number");
            continue;
        }
        Error id_error;
        if (!identities.resolve_id(field_or_empty(f, cols[0]), &row.vehicle_id, &row.car_number, &id_error)) {
            report->skip(reader.line_number(), id_error.message);
            continue;
        }
        std::string iso;
        if (support::normalize_timestamp(field_or_empty(f, ts_col), &iso)) row.timestamp = iso;

        out->push_back(std::move(row));
        report->rows_kept++;
    }
    return true;
}

bool parse_results(std::istream& in, VehicleIdentityResolver& identities, std::vector<ResultRow>* out,
                   ParseReport* report, Error* error) {
    CsvReader reader(in, delimiter_for(SourceType::Results));
    if (!open_reader(reader, SourceType::Results, error)) return false;
    std::vector<int> cols;
    if (!require_columns(reader, {"position", "number", "laps"}, &cols, SourceType::Results, error)) return false;
    const int total_col = reader.column("total_time");
    const int gap_first_col = reader.column("gap_first");
    const int gap_prev_col = reader.column("gap_previous");
    const int fl_col = reader.column("fl_time");
    const int class_col = reader.column("class");

    // vehicle_id -> (index in *out, line) of the row kept so far
    std::map<std::string, std::pair<std::size_t, std::size_t>> kept;
    std::vector<std::string> f;
    while (reader.next(&f)) {
        report->rows_read++;
        ResultRow row;
        if (!support::parse_int(field_or_empty(f, cols[0]), &row.position) || row.position <= 0) {
            report->skip(reader.line_number(), "position is missing");
            continue;
        }
        if (!support::parse_int(field_or_empty(f, cols[1]), &row.car_number)) {
            report->skip(reader.line_number(), "car number is missing");
            continue;
        }
        if (!support::parse_int(field_or_empty(f, cols[2]), &row.laps) || row.laps < 0) {
            report->skip(reader.line_number(), "lap count is missing");
            continue;
        }
        Error id_error;
        if (!identities.resolve(row.car_number, &row.vehicle_id, &id_error)) {
            report->skip(reader.line_number(), id_error.message);
            continue;
        }
        row.total_time = field_or_empty(f, total_col);
        row.gap_first = field_or_empty(f, gap_first_col);
        row.gap_previous = field_or_empty(f, gap_prev_col);
        row.best_lap_time = field_or_empty(f, fl_col);
        row.class_name = field_or_empty(f, class_col);
        identities.note_class(row.car_number, row.class_name);

        const auto previous = kept.find(row.vehicle_id);
        if (previous != kept.end()) {
            report->skip(previous->second.second,
                         "car " + std::to_string(row.car_number) + " listed again on line " +
                             std::to_string(reader.line_number()));
            (*out)[previous->second.first] = std::move(row);
            previous->second.second = reader.line_number();
            continue;
        }
        kept[row.vehicle_id] = {out->size(), reader.line_number()};
        out->push_back(std::move(row));
        report->rows_kept++;
    }
    return true;
}

bool parse_sections(std::istream& in, VehicleIdentityResolver& identities, std::vector<SectionRow>* out,
                    ParseReport* report, Error* error) {
    CsvReader reader(in, delimiter_for(SourceType::Sections));
    if (!open_reader(reader, SourceType::Sections, error)) return false;
    std::vector<int> cols;
    if (!require_columns(reader, {"number", "lap_number"}, &cols, SourceType::Sections, error)) return false;
    const int lap_time_col = reader.column("lap_time");
    const int s1_col = reader.column("s1");
    const int s2_col = reader.column("s2");
    const int s3_col = reader.column("s3");
    const int speed_col = reader.column("top_speed");

    std::vector<std::string> f;
    while (reader.next(&f)) {
        report->rows_read++;
        SectionRow row;
        if (!support::parse_int(field_or_empty(f, cols[0]), &row.car_number)) {
            report->skip(reader.line_number(), "car number is missing");
            continue;
        }
        if (!support::parse_int(field_or_empty(f, cols[1]), &row.lap)) {
            report->skip(reader.line_number(), "lap number is missing");
            continue;
        }
        Error id_error;
        if (!identities.resolve(row.car_number, &row.vehicle_id, &id_error)) {
            report->skip(reader.line_number(), id_error.message);
            continue;
        }
        row.s1_ms = optional_duration(field_or_empty(f, s1_col));
        row.s2_ms = optional_duration(field_or_empty(f, s2_col));
        row.s3_ms = optional_duration(field_or_empty(f, s3_col));
        row.lap_time_ms = optional_duration(field_or_empty(f, lap_time_col));
        row.top_speed = optional_double(field_or_empty(f, speed_col));

        out->push_back(std::move(row));
        report->rows_kept++;
    }
    return true;
}

bool parse_weather(std::istream& in, std::vector<WeatherRow>* out, ParseReport* report, Error* error) {
    CsvReader reader(in, delimiter_for(SourceType::Weather));
    if (!open_reader(reader, SourceType::Weather, error)) return false;
    std::vector<int> cols;
    if (!require_columns(reader, {"time_utc_seconds"}, &cols, SourceType::Weather, error)) return false;
    const int air_col = reader.column("air_temp");
    const int track_col = reader.column("track_temp");
    const int humidity_col = reader.column("humidity");
    const int pressure_col = reader.column("pressure");
    const int wind_speed_col = reader.column("wind_speed");
    const int wind_dir_col = reader.column("wind_direction");
    const int rain_col = reader.column("rain");

    std::vector<std::string> f;
    while (reader.next(&f)) {
        report->rows_read++;
        double seconds = 0.0;
        if (!support::parse_double(field_or_empty(f, cols[0]), &seconds)) {
            report->skip(reader.line_number(), "TIME_UTC_SECONDS is not a number");
            continue;
        }
        WeatherRow row;
        row.timestamp = support::format_iso8601_ms(static_cast<std::int64_t>(std::llround(seconds * 1000.0)));
        row.air_temp = optional_double(field_or_empty(f, air_col));
        row.track_temp = optional_double(field_or_empty(f, track_col));
        row.humidity = optional_double(field_or_empty(f, humidity_col));
        row.pressure = optional_double(field_or_empty(f, pressure_col));
        row.wind_speed = optional_double(field_or_empty(f, wind_speed_col));
        row.wind_direction = optional_double(field_or_empty(f, wind_dir_col));
        row.rain = optional_double(field_or_empty(f, rain_col));

        out->push_back(std::move(row));
        report->rows_kept++;
    }
    return true;
}

bool parse_telemetry_stream(std::istream& in, VehicleIdentityResolver& identities, std::size_t chunk_rows,
                            const TelemetryChunkFn& on_chunk, ParseReport* report, Error* error) {
    CsvReader reader(in, delimiter_for(SourceType::Telemetry));
    if (!open_reader(reader, SourceType::Telemetry, error)) return false;
    std::vector<int> cols;
    if (!require_columns(reader, {"vehicle_id", "timestamp", "telemetry_name", "telemetry_value"}, &cols,
                         SourceType::Telemetry, error)) {
        return false;
    }
    const int lap_col = reader.column("lap");
    if (chunk_rows == 0) chunk_rows = 1;

    std::vector<TelemetryRow> chunk;
    chunk.reserve(chunk_rows);
    std::vector<std::string> f;
    while (reader.next(&f)) {
        report->rows_read++;
        TelemetryRow row;
        if (!support::normalize_timestamp(field_or_empty(f, cols[1]), &row.timestamp)) {
            report->skip(reader.line_number(), "timestamp '" + field_or_empty(f, cols[1]) + "' is not ISO-8601");
            continue;
        }
        row.telemetry_name = field_or_empty(f, cols[2]);
        if (row.telemetry_name.empty()) {
            report->skip(reader.line_number(), "telemetry name is empty");
            continue;
        }
        if (!support::parse_double(field_or_empty(f, cols[3]), &row.telemetry_value)) {
            report->skip(reader.line_number(), "telemetry value is not a number");
            continue;
        }
        Error id_error;
        if (!identities.resolve_id(field_or_empty(f, cols[0]), &row.vehicle_id, &row.car_number, &id_error)) {
            report->skip(reader.line_number(), id_error.message);
            continue;
        }
        int lap = 0;
        if (support::parse_int(field_or_empty(f, lap_col), &lap)) row.lap = lap;

        chunk.push_back(std::move(row));
        report->rows_kept++;
        if (chunk.size() >= chunk_rows) {
            if (!on_chunk(chunk, error)) return false;
            chunk.clear();
        }
    }
    if (!chunk.empty() && !on_chunk(chunk, error)) return false;
    return true;
}

bool parse_telemetry(std::istream& in, VehicleIdentityResolver& identities, std::vector<TelemetryRow>* out,
                     ParseReport* report, Error* error) {
    return parse_telemetry_stream(
        in, identities, 10000,
        [out](std::vector<TelemetryRow>& chunk, Error*) {
            out->insert(out->end(), std::make_move_iterator(chunk.begin()), std::make_move_iterator(chunk.end()));
            return true;
        },
        report, error);
}

bool parse_source(std::istream& in, SourceType type, VehicleIdentityResolver& identities, RecordBatch* out,
                  ParseReport* report, Error* error) {
    switch (type) {
        case SourceType::LapTimes: {
            std::vector<LapRow> rows;
            if (!parse_lap_times(in, identities, &rows, report, error)) return false;
            *out = std::move(rows);
            return true;
        }
        case SourceType::Results: {
            std::vector<ResultRow> rows;
            if (!parse_results(in, identities, &rows, report, error)) return false;
            *out = std::move(rows);
            return true;
        }
        case SourceType::Telemetry: {
            std::vector<TelemetryRow> rows;
            if (!parse_telemetry(in, identities, &rows, report, error)) return false;
            *out = std::move(rows);
            return true;
        }
        case SourceType::Sections: {
            std::vector<SectionRow> rows;
            if (!parse_sections(in, identities, &rows, report, error)) return false;
            *out = std::move(rows);
            return true;
        }
        case SourceType::Weather: {
            std::vector<WeatherRow> rows;
            if (!parse_weather(in, &rows, report, error)) return false;
            *out = std::move(rows);
            return true;
        }
    }
    return fail(error, ErrorKind::Parse, "unknown source type");
}

} // namespace pitwall::ingest
