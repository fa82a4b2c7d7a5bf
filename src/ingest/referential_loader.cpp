#include "pitwall/ingest/referential_loader.hpp"

#include <sqlite3.h>

#include <map>
#include <optional>
#include <string>
#include <variant>

namespace pitwall::ingest {

using support::Error;
using support::ErrorKind;
using support::fail;

namespace {

constexpr const char* kInsertVehicle = R"SQL(
    INSERT INTO vehicles (vehicle_id, car_number, class)
    VALUES (?, ?, ?)
    ON CONFLICT(vehicle_id) DO UPDATE SET class = COALESCE(vehicles.class, excluded.class);
)SQL";

constexpr const char* kInsertLap = R"SQL(
    INSERT INTO lap_times (vehicle_id, lap, lap_time, timestamp)
    VALUES (?, ?, ?, ?);
)SQL";

constexpr const char* kInsertTelemetry = R"SQL(
    INSERT INTO telemetry (vehicle_id, lap, timestamp, telemetry_name, telemetry_value)
    VALUES (?, ?, ?, ?, ?);
)SQL";

// One result row per vehicle; a re-import replaces it.
constexpr const char* kInsertResult = R"SQL(
    INSERT OR REPLACE INTO race_results
    (vehicle_id, position, car_number, laps, total_time, gap_first, gap_previous, best_lap_time, class)
    VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?);
)SQL";

constexpr const char* kInsertSection = R"SQL(
    INSERT INTO section_times (vehicle_id, lap, s1, s2, s3, lap_time, top_speed)
    VALUES (?, ?, ?, ?, ?, ?, ?);
)SQL";

constexpr const char* kInsertWeather = R"SQL(
    INSERT INTO weather (timestamp, air_temp, track_temp, humidity, pressure, wind_speed, wind_direction, rain)
    VALUES (?, ?, ?, ?, ?, ?, ?, ?);
)SQL";

void bind_text(sqlite3_stmt* stmt, int index, const std::string& value) {
    sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

// Empty text is stored as NULL.
void bind_text_or_null(sqlite3_stmt* stmt, int index, const std::string& value) {
    if (value.empty()) {
        sqlite3_bind_null(stmt, index);
    } else {
        bind_text(stmt, index, value);
    }
}

void bind_optional(sqlite3_stmt* stmt, int index, const std::optional<double>& value) {
    if (value) {
        sqlite3_bind_double(stmt, index, *value);
    } else {
        sqlite3_bind_null(stmt, index);
    }
}

void bind_optional(sqlite3_stmt* stmt, int index, const std::optional<int>& value) {
    if (value) {
        sqlite3_bind_int(stmt, index, *value);
    } else {
        sqlite3_bind_null(stmt, index);
    }
}

void bind_optional(sqlite3_stmt* stmt, int index, const std::optional<std::string>& value) {
    if (value) {
        bind_text(stmt, index, *value);
    } else {
        sqlite3_bind_null(stmt, index);
    }
}

} // namespace

ReferentialLoader::ReferentialLoader(store::RaceStore& store, const support::AppConfig& config, std::ostream& log)
    : store_(store), config_(config), log_(log) {}

ReferentialLoader::~ReferentialLoader() {
    rollback();
}

bool ReferentialLoader::begin(Error* error) {
    if (in_transaction_) return fail(error, ErrorKind::Import, "loader transaction already open");
    if (!store_.begin(error)) {
        if (error) error->message = "failed to begin import transaction";
        return false;
    }
    in_transaction_ = true;
    telemetry_in_transaction_ = 0;
    pending_vehicles_.clear();
    return true;
}

bool ReferentialLoader::commit(Error* error) {
    if (!in_transaction_) return fail(error, ErrorKind::Import, "no loader transaction to commit");
    finalize_all();
    if (!store_.commit(error)) {
        if (error) error->message = "failed to commit import transaction";
        rollback();
        return false;
    }
    in_transaction_ = false;
    for (const auto& [number, has_class] : pending_vehicles_) committed_vehicles_[number] = has_class;
    pending_vehicles_.clear();
    return true;
}

void ReferentialLoader::rollback() {
    finalize_all();
    if (in_transaction_) store_.rollback();
    in_transaction_ = false;
    pending_vehicles_.clear();
}

bool ReferentialLoader::load(const RecordBatch& batch, const VehicleIdentityResolver& identities,
                             std::size_t* inserted, Error* error) {
    *inserted = 0;
    if (!begin(error)) return false;
    if (!write_vehicles(identities, error) || !write_batch(batch, inserted, error) || !commit(error)) {
        rollback();
        *inserted = 0;
        return false;
    }
    return true;
}

sqlite3_stmt* ReferentialLoader::statement(Slot slot, Error* error) {
    if (statements_[slot]) return statements_[slot];

    static const char* const kSql[kSlotCount] = {
        kInsertVehicle, kInsertLap, kInsertTelemetry, kInsertResult, kInsertSection, kInsertWeather,
    };
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(store_.handle(), kSql[slot], -1, &stmt, nullptr) != SQLITE_OK) {
        fail(error, ErrorKind::Import, "failed to prepare insert statement", store_.last_error());
        return nullptr;
    }
    statements_[slot] = stmt;
    return stmt;
}

bool ReferentialLoader::step(sqlite3_stmt* stmt, const char* what, std::size_t* inserted, Error* error) {
    if (sqlite3_step(stmt) != SQLITE_DONE) {
        const std::string cause = store_.last_error();
        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);
        return fail(error, ErrorKind::Import, std::string("failed to insert ") + what, cause);
    }
    if (inserted) *inserted += static_cast<std::size_t>(sqlite3_changes(store_.handle()));
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
    return true;
}

void ReferentialLoader::finalize_all() {
    for (auto& stmt : statements_) {
        if (stmt) sqlite3_finalize(stmt);
        stmt = nullptr;
    }
}

bool ReferentialLoader::write_vehicles(const VehicleIdentityResolver& identities, Error* error) {
    if (!in_transaction_) return fail(error, ErrorKind::Import, "vehicle write outside a transaction");

    sqlite3_stmt* stmt = nullptr;
    for (const auto& [number, identity] : identities.seen()) {
        const bool has_class = identity.class_name.has_value();
        auto pending = pending_vehicles_.find(number);
        if (pending != pending_vehicles_.end() && (pending->second || !has_class)) continue;
        auto committed = committed_vehicles_.find(number);
        if (committed != committed_vehicles_.end() && (committed->second || !has_class)) continue;

        if (!stmt && !(stmt = statement(kVehicles, error))) return false;
        bind_text(stmt, 1, identity.vehicle_id);
        sqlite3_bind_int(stmt, 2, identity.car_number);
        bind_optional(stmt, 3, identity.class_name);
        if (!step(stmt, "vehicle", nullptr, error)) return false;
        pending_vehicles_[number] = has_class;
    }
    return true;
}

bool ReferentialLoader::write_batch(const RecordBatch& batch, std::size_t* inserted, Error* error) {
    if (!in_transaction_) return fail(error, ErrorKind::Import, "batch write outside a transaction");
    return std::visit([&](const auto& rows) { return write_rows(rows, inserted, error); }, batch);
}

bool ReferentialLoader::write_rows(const std::vector<LapRow>& rows, std::size_t* inserted, Error* error) {
    if (rows.empty()) return true;
    sqlite3_stmt* stmt = statement(kLaps, error);
    if (!stmt) return false;
    for (const auto& r : rows) {
        bind_text(stmt, 1, r.vehicle_id);
        sqlite3_bind_int(stmt, 2, r.lap);
        sqlite3_bind_double(stmt, 3, r.lap_time_ms);
        bind_optional(stmt, 4, r.timestamp);
        if (!step(stmt, "lap time", inserted, error)) return false;
    }
    return true;
}

bool ReferentialLoader::write_rows(const std::vector<ResultRow>& rows, std::size_t* inserted, Error* error) {
    if (rows.empty()) return true;
    sqlite3_stmt* stmt = statement(kResults, error);
    if (!stmt) return false;
    // A vehicle listed twice keeps its last row.
    std::map<std::string, std::size_t> last;
    for (std::size_t i = 0; i < rows.size(); ++i) last[rows[i].vehicle_id] = i;
    for (std::size_t i = 0; i < rows.size(); ++i) {
        if (last[rows[i].vehicle_id] != i) continue;
        const ResultRow& r = rows[i];
        bind_text(stmt, 1, r.vehicle_id);
        sqlite3_bind_int(stmt, 2, r.position);
        sqlite3_bind_int(stmt, 3, r.car_number);
        sqlite3_bind_int(stmt, 4, r.laps);
        bind_text_or_null(stmt, 5, r.total_time);
        bind_text_or_null(stmt, 6, r.gap_first);
        bind_text_or_null(stmt, 7, r.gap_previous);
        bind_text_or_null(stmt, 8, r.best_lap_time);
        bind_text_or_null(stmt, 9, r.class_name);
        if (!step(stmt, "race result", inserted, error)) return false;
    }
    return true;
}

bool ReferentialLoader::write_rows(const std::vector<TelemetryRow>& rows, std::size_t* inserted, Error* error) {
    if (rows.empty()) return true;
    sqlite3_stmt* stmt = statement(kTelemetry, error);
    if (!stmt) return false;
    for (const auto& r : rows) {
        bind_text(stmt, 1, r.vehicle_id);
        bind_optional(stmt, 2, r.lap);
        bind_text(stmt, 3, r.timestamp);
        bind_text(stmt, 4, r.telemetry_name);
        sqlite3_bind_double(stmt, 5, r.telemetry_value);
        if (!step(stmt, "telemetry", inserted, error)) return false;

        ++telemetry_in_transaction_;
        if (config_.verbose && config_.progress_every_rows > 0 &&
            telemetry_in_transaction_ % config_.progress_every_rows == 0) {
            log_ << "[loader] " << telemetry_in_transaction_ << " telemetry rows written\n";
        }
    }
    return true;
}

bool ReferentialLoader::write_rows(const std::vector<SectionRow>& rows, std::size_t* inserted, Error* error) {
    if (rows.empty()) return true;
    sqlite3_stmt* stmt = statement(kSections, error);
    if (!stmt) return false;
    for (const auto& r : rows) {
        bind_text(stmt, 1, r.vehicle_id);
        sqlite3_bind_int(stmt, 2, r.lap);
        bind_optional(stmt, 3, r.s1_ms);
        bind_optional(stmt, 4, r.s2_ms);
        bind_optional(stmt, 5, r.s3_ms);
        bind_optional(stmt, 6, r.lap_time_ms);
        bind_optional(stmt, 7, r.top_speed);
        if (!step(stmt, "section time", inserted, error)) return false;
    }
    return true;
}

bool ReferentialLoader::write_rows(const std::vector<WeatherRow>& rows, std::size_t* inserted, Error* error) {
    if (rows.empty()) return true;
    sqlite3_stmt* stmt = statement(kWeather, error);
    if (!stmt) return false;
    for (const auto& r : rows) {
        bind_text(stmt, 1, r.timestamp);
        bind_optional(stmt, 2, r.air_temp);
        bind_optional(stmt, 3, r.track_temp);
        bind_optional(stmt, 4, r.humidity);
        bind_optional(stmt, 5, r.pressure);
        bind_optional(stmt, 6, r.wind_speed);
        bind_optional(stmt, 7, r.wind_direction);
        bind_optional(stmt, 8, r.rain);
        if (!step(stmt, "weather", inserted, error)) return false;
    }
    return true;
}

} // namespace pitwall::ingest
