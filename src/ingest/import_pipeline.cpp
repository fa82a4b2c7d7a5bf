#include "pitwall/ingest/import_pipeline.hpp"

#include "pitwall/stats/aggregate_stats.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace pitwall::ingest {

using support::Error;
using support::ErrorKind;
using support::fail;

namespace fs = std::filesystem;

namespace {

int load_rank(SourceType type) {
    switch (type) {
        case SourceType::Results: return 0;
        case SourceType::LapTimes: return 1;
        case SourceType::Sections: return 2;
        case SourceType::Telemetry: return 3;
        case SourceType::Weather: return 4;
    }
    return 5;
}

std::size_t* counter_for(ImportSummary* summary, SourceType type) {
    switch (type) {
        case SourceType::LapTimes: return &summary->laps;
        case SourceType::Results: return &summary->results;
        case SourceType::Telemetry: return &summary->telemetry;
        case SourceType::Sections: return &summary->sections;
        case SourceType::Weather: return &summary->weather;
    }
    return &summary->laps;
}

} // namespace

bool discover_sources(const std::string& dir, std::vector<SourceFile>* out, Error* error) {
    out->clear();
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return fail(error, ErrorKind::Config, "data directory not found: " + dir, ec ? ec.message() : "");
    }

    fs::directory_iterator it(dir, ec);
    if (ec) return fail(error, ErrorKind::Config, "cannot list data directory " + dir, ec.message());
    for (const auto& entry : it) {
        if (!entry.is_regular_file(ec)) continue;
        const auto type = classify_file(entry.path().filename().string());
        if (!type) continue;
        out->push_back(SourceFile{entry.path().string(), *type});
    }

    std::sort(out->begin(), out->end(), [](const SourceFile& a, const SourceFile& b) {
        const int ra = load_rank(a.type);
        const int rb = load_rank(b.type);
        if (ra != rb) return ra < rb;
        return fs::path(a.path).filename().string() < fs::path(b.path).filename().string();
    });
    return true;
}

ImportPipeline::ImportPipeline(store::RaceStore& store, const support::AppConfig& config, std::ostream& log)
    : store_(store), config_(config), log_(log), identities_(config.vehicle_prefix), loader_(store, config, log) {}

bool ImportPipeline::import_directory(const std::string& dir, ImportSummary* summary, Error* error) {
    *summary = ImportSummary{};
    std::vector<SourceFile> files;
    if (!discover_sources(dir, &files, error)) return false;

    std::size_t per_type[5] = {0, 0, 0, 0, 0};
    for (const auto& f : files) per_type[static_cast<int>(f.type)]++;
    log_ << "[import] found " << files.size() << " source files (" << per_type[0] << " lap times, " << per_type[1]
         << " results, " << per_type[2] << " telemetry, " << per_type[3] << " sections, " << per_type[4]
         << " weather)\n";

    for (const auto& file : files) {
        if (!import_file(file, summary, error)) {
            if (error) error->message = fs::path(file.path).filename().string() + ": " + error->message;
            return false;
        }
    }

    stats::AggregateComputer aggregates(store_, config_);
    if (!aggregates.refresh_all(error)) {
        if (error) error->message = "vehicle summary refresh failed: " + error->message;
        return false;
    }
    summary->vehicles = identities_.seen().size();
    return true;
}

bool ImportPipeline::import_file(const SourceFile& file, ImportSummary* summary, Error* error) {
    std::ifstream in(file.path, std::ios::binary);
    if (!in) return fail(error, ErrorKind::Parse, "cannot open " + file.path);

    if (config_.verbose) log_ << "[import] " << to_string(file.type) << " <- " << file.path << "\n";

    ParseReport report;
    std::size_t inserted = 0;
    if (file.type == SourceType::Telemetry) {
        if (!import_telemetry(file, in, &inserted, &report, error)) return false;
    } else {
        RecordBatch batch;
        if (!parse_source(in, file.type, identities_, &batch, &report, error)) return false;
        if (!loader_.load(batch, identities_, &inserted, error)) return false;
    }

    *counter_for(summary, file.type) += inserted;
    summary->files++;
    summary->rows_skipped += report.rows_skipped;
    log_report(file, report, inserted);
    return true;
}

// Chunks are written as they are parsed, all inside the file's transaction.
bool ImportPipeline::import_telemetry(const SourceFile& file, std::istream& in, std::size_t* inserted,
                                      ParseReport* report, Error* error) {
    *inserted = 0;
    if (!loader_.begin(error)) return false;

    const auto on_chunk = [this, inserted](std::vector<TelemetryRow>& chunk, Error* chunk_error) {
        if (!loader_.write_vehicles(identities_, chunk_error)) return false;
        return loader_.write_batch(RecordBatch(std::move(chunk)), inserted, chunk_error);
    };
    if (!parse_telemetry_stream(in, identities_, config_.telemetry_chunk_rows, on_chunk, report, error) ||
        !loader_.commit(error)) {
        loader_.rollback();
        *inserted = 0;
        if (config_.verbose) log_ << "[import] rolled back " << file.path << "\n";
        return false;
    }
    return true;
}

void ImportPipeline::log_report(const SourceFile& file, const ParseReport& report, std::size_t inserted) {
    log_ << "[import] " << fs::path(file.path).filename().string() << ": " << inserted << " " << to_string(file.type)
         << " rows";
    if (report.rows_skipped > 0) log_ << ", " << report.rows_skipped << " skipped";
    log_ << "\n";
    if (!config_.verbose) return;
    for (const auto& reason : report.skip_reasons) log_ << "[import]   skipped " << reason << "\n";
    if (report.rows_skipped > report.skip_reasons.size()) {
        log_ << "[import]   ... " << (report.rows_skipped - report.skip_reasons.size()) << " more\n";
    }
}

} // namespace pitwall::ingest
