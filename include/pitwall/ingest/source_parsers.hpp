#pragma once

#include "pitwall/ingest/records.hpp"
#include "pitwall/ingest/vehicle_identity.hpp"
#include "pitwall/support/error.hpp"

#include <cstddef>
#include <functional>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace pitwall::ingest {

constexpr std::size_t kMaxSkipReasons = 20;

struct ParseReport {
    std::size_t rows_read = 0;
    std::size_t rows_kept = 0;
    std::size_t rows_skipped = 0;
    std::vector<std::string> skip_reasons;

    void skip(std::size_t line, const std::string& reason);
};

char delimiter_for(SourceType type);

// Lap times: `*lap_time*.csv`, telemetry: `*telemetry*.csv`, results:
// `*results*.csv`, sections: `*endurance*.csv` or `*section*.csv`, weather:
// `*weather*.csv`; case-insensitive.
std::optional<SourceType> classify_file(const std::string& filename);

// Each parser reads a header first; a missing required column fails the whole
// input with a Parse error. Individual malformed rows are skipped and counted.

bool parse_lap_times(std::istream& in, VehicleIdentityResolver& identities, std::vector<LapRow>* out,
                     ParseReport* report, support::Error* error);

bool parse_results(std::istream& in, VehicleIdentityResolver& identities, std::vector<ResultRow>* out,
                   ParseReport* report, support::Error* error);

bool parse_sections(std::istream& in, VehicleIdentityResolver& identities, std::vector<SectionRow>* out,
                    ParseReport* report, support::Error* error);

bool parse_weather(std::istream& in, std::vector<WeatherRow>* out, ParseReport* report, support::Error* error);

// Hands rows over in chunks of `chunk_rows`; returning false from the callback
// stops the parse and the callback's error is passed through.
using TelemetryChunkFn = std::function<bool(std::vector<TelemetryRow>& chunk, support::Error* error)>;

bool parse_telemetry_stream(std::istream& in, VehicleIdentityResolver& identities, std::size_t chunk_rows,
                            const TelemetryChunkFn& on_chunk, ParseReport* report, support::Error* error);

bool parse_telemetry(std::istream& in, VehicleIdentityResolver& identities, std::vector<TelemetryRow>* out,
                     ParseReport* report, support::Error* error);

// Dispatches on the source tag; the whole input lands in one batch.
bool parse_source(std::istream& in, SourceType type, VehicleIdentityResolver& identities, RecordBatch* out,
                  ParseReport* report, support::Error* error);

} // namespace pitwall::ingest
