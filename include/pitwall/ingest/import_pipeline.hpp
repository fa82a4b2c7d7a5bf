#pragma once

#include "pitwall/ingest/records.hpp"
#include "pitwall/ingest/referential_loader.hpp"
#include "pitwall/ingest/source_parsers.hpp"
#include "pitwall/ingest/vehicle_identity.hpp"
#include "pitwall/store/race_store.hpp"
#include "pitwall/support/config.hpp"
#include "pitwall/support/error.hpp"

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

namespace pitwall::ingest {

struct SourceFile {
    std::string path;
    SourceType type = SourceType::LapTimes;
};

// Rows written by one run, per entity type. `vehicles` is the number of
// distinct identities the run resolved.
struct ImportSummary {
    std::size_t vehicles = 0;
    std::size_t laps = 0;
    std::size_t telemetry = 0;
    std::size_t results = 0;
    std::size_t sections = 0;
    std::size_t weather = 0;
    std::size_t files = 0;
    std::size_t rows_skipped = 0;
};

// Lists the recognised CSV files of `dir` in load order: results, lap times,
// sections, telemetry, weather; by file name within a type.
bool discover_sources(const std::string& dir, std::vector<SourceFile>* out, support::Error* error);

class ImportPipeline {
public:
    ImportPipeline(store::RaceStore& store, const support::AppConfig& config, std::ostream& log);

    // Loads every source of `dir` and refreshes the vehicle summaries. Stops at
    // the first file that fails; files committed before it stay loaded.
    bool import_directory(const std::string& dir, ImportSummary* summary, support::Error* error);

    // One file, one transaction.
    bool import_file(const SourceFile& file, ImportSummary* summary, support::Error* error);

    const VehicleIdentityResolver& identities() const { return identities_; }

private:
    bool import_telemetry(const SourceFile& file, std::istream& in, std::size_t* inserted, ParseReport* report,
                          support::Error* error);
    void log_report(const SourceFile& file, const ParseReport& report, std::size_t inserted);

    store::RaceStore& store_;
    const support::AppConfig& config_;
    std::ostream& log_;
    VehicleIdentityResolver identities_;
    ReferentialLoader loader_;
};

} // namespace pitwall::ingest
