#include "pitwall/ingest/records.hpp"

namespace pitwall::ingest {

std::string to_string(SourceType type) {
    switch (type) {
        case SourceType::LapTimes: return "lap_times";
        case SourceType::Results: return "race_results";
        case SourceType::Telemetry: return "telemetry";
        case SourceType::Sections: return "section_times";
        case SourceType::Weather: return "weather";
    }
    return "unknown";
}

SourceType source_type_of(const RecordBatch& batch) {
    // Variant alternatives are declared in SourceType order.
    return static_cast<SourceType>(batch.index());
}

std::size_t batch_size(const RecordBatch& batch) {
    return std::visit([](const auto& rows) { return rows.size(); }, batch);
}

} // namespace pitwall::ingest
