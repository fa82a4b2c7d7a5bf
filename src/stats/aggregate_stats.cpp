#include "pitwall/stats/aggregate_stats.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <cmath>
#include <numeric>

namespace pitwall::stats {

using support::Error;
using support::ErrorKind;
using support::fail;

namespace {

std::optional<double> column_optional_double(sqlite3_stmt* stmt, int col) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) return std::nullopt;
    return sqlite3_column_double(stmt, col);
}

std::optional<int> column_optional_int(sqlite3_stmt* stmt, int col) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) return std::nullopt;
    return sqlite3_column_int(stmt, col);
}

std::optional<std::string> column_optional_text(sqlite3_stmt* stmt, int col) {
    const unsigned char* raw = sqlite3_column_text(stmt, col);
    if (!raw) return std::nullopt;
    return std::string(reinterpret_cast<const char*>(raw));
}

void bind_vehicle(sqlite3_stmt* stmt, int index, const std::string* vehicle_id) {
    if (vehicle_id) {
        sqlite3_bind_text(stmt, index, vehicle_id->c_str(), -1, SQLITE_TRANSIENT);
    } else {
        sqlite3_bind_null(stmt, index);
    }
}

bool collect_doubles(sqlite3* db, const std::string& sql, const std::string& vehicle_id,
                     const std::vector<std::string>& channels, std::vector<double>* out, Error* error) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        return fail(error, ErrorKind::Import, "failed to prepare summary query", sqlite3_errmsg(db));
    }
    sqlite3_bind_text(stmt, 1, vehicle_id.c_str(), -1, SQLITE_TRANSIENT);
    for (std::size_t i = 0; i < channels.size(); ++i) {
        sqlite3_bind_text(stmt, static_cast<int>(i + 2), channels[i].c_str(), -1, SQLITE_TRANSIENT);
    }
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) out->push_back(sqlite3_column_double(stmt, 0));
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) return fail(error, ErrorKind::Import, "summary query failed", sqlite3_errmsg(db));
    return true;
}

constexpr const char* kSelectVehicle = R"SQL(
    SELECT vehicle_id, car_number, class, fastest_lap, average_lap, total_laps, max_speed, position
    FROM vehicles
)SQL";

void read_vehicle(sqlite3_stmt* stmt, VehicleSummary* out) {
    out->vehicle_id = column_optional_text(stmt, 0).value_or("");
    out->car_number = sqlite3_column_int(stmt, 1);
    out->class_name = column_optional_text(stmt, 2);
    out->fastest_lap = column_optional_double(stmt, 3);
    out->average_lap = column_optional_double(stmt, 4);
    out->total_laps = sqlite3_column_int(stmt, 5);
    out->max_speed = column_optional_double(stmt, 6);
    out->position = column_optional_int(stmt, 7);
}

} // namespace

LapStatistics compute_lap_statistics(const std::vector<double>& lap_times_ms) {
    LapStatistics s;
    if (lap_times_ms.empty()) return s;

    s.count = lap_times_ms.size();
    const auto [lo, hi] = std::minmax_element(lap_times_ms.begin(), lap_times_ms.end());
    s.fastest = *lo;
    s.slowest = *hi;
    s.average = std::accumulate(lap_times_ms.begin(), lap_times_ms.end(), 0.0) / static_cast<double>(s.count);

    double sum_sq = 0.0;
    for (double t : lap_times_ms) sum_sq += (t - s.average) * (t - s.average);
    s.std_dev = std::sqrt(sum_sq / static_cast<double>(s.count));
    s.consistency = s.average > 0.0 ? s.std_dev / s.average : 0.0;
    return s;
}

VehicleSummary summarize_vehicle(const std::vector<double>& lap_times_ms, const std::vector<double>& speed_samples,
                                 std::optional<int> position) {
    VehicleSummary v;
    v.total_laps = static_cast<int>(lap_times_ms.size());
    if (!lap_times_ms.empty()) {
        const LapStatistics s = compute_lap_statistics(lap_times_ms);
        v.fastest_lap = s.fastest;
        v.average_lap = s.average;
    }
    if (!speed_samples.empty()) v.max_speed = *std::max_element(speed_samples.begin(), speed_samples.end());
    v.position = position;
    return v;
}

AggregateComputer::AggregateComputer(store::RaceStore& store, const support::AppConfig& config)
    : store_(store), config_(config) {}

std::string AggregateComputer::speed_channel_list() const {
    if (config_.speed_channels.empty()) return "NULL";
    std::string list;
    for (std::size_t i = 0; i < config_.speed_channels.size(); ++i) {
        if (i) list += ", ";
        list += "?" + std::to_string(i + 2);
    }
    return list;
}

bool AggregateComputer::refresh_all(Error* error) {
    return refresh(nullptr, error);
}

bool AggregateComputer::refresh_vehicle(const std::string& vehicle_id, Error* error) {
    return refresh(&vehicle_id, error);
}

// ?1 is the vehicle filter (NULL for all), ?2.. are the speed channel names.
bool AggregateComputer::refresh(const std::string* vehicle_id, Error* error) {
    const std::string max_speed = R"SQL(
        SELECT MAX(t.telemetry_value) FROM telemetry t
        WHERE t.vehicle_id = vehicles.vehicle_id AND t.telemetry_name IN ()SQL" + speed_channel_list() + ")";
    const std::string sql = R"SQL(
        UPDATE vehicles SET
            fastest_lap = (SELECT MIN(l.lap_time) FROM lap_times l WHERE l.vehicle_id = vehicles.vehicle_id),
            average_lap = (SELECT AVG(l.lap_time) FROM lap_times l WHERE l.vehicle_id = vehicles.vehicle_id),
            total_laps = (SELECT COUNT(*) FROM lap_times l WHERE l.vehicle_id = vehicles.vehicle_id),
            max_speed = ()SQL" + max_speed + R"SQL(),
            position = (SELECT r.position FROM race_results r WHERE r.vehicle_id = vehicles.vehicle_id),
            class = COALESCE(class, (SELECT r.class FROM race_results r WHERE r.vehicle_id = vehicles.vehicle_id))
        WHERE ?1 IS NULL OR vehicle_id = ?1;
    )SQL";

    if (!store_.begin(error)) return false;

    sqlite3* db = store_.handle();
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        const std::string cause = sqlite3_errmsg(db);
        store_.rollback();
        return fail(error, ErrorKind::Import, "failed to prepare vehicle summary update", cause);
    }
    bind_vehicle(stmt, 1, vehicle_id);
    for (std::size_t i = 0; i < config_.speed_channels.size(); ++i) {
        sqlite3_bind_text(stmt, static_cast<int>(i + 2), config_.speed_channels[i].c_str(), -1, SQLITE_TRANSIENT);
    }
    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        const std::string cause = sqlite3_errmsg(db);
        store_.rollback();
        return fail(error, ErrorKind::Import, "failed to update vehicle summaries", cause);
    }
    if (!store_.commit(error)) {
        store_.rollback();
        return false;
    }
    return true;
}

bool AggregateComputer::derive(const std::string& vehicle_id, VehicleSummary* out, Error* error) {
    VehicleSummary identity;
    if (!stored(vehicle_id, &identity, error)) return false;

    std::vector<double> laps;
    if (!collect_doubles(store_.handle(), "SELECT lap_time FROM lap_times WHERE vehicle_id = ?1;", vehicle_id, {},
                         &laps, error)) {
        return false;
    }
    std::vector<double> speeds;
    if (!config_.speed_channels.empty()) {
        const std::string sql = "SELECT telemetry_value FROM telemetry WHERE vehicle_id = ?1 AND telemetry_name IN (" +
                                speed_channel_list() + ");";
        if (!collect_doubles(store_.handle(), sql, vehicle_id, config_.speed_channels, &speeds, error)) return false;
    }
    std::vector<double> positions;
    if (!collect_doubles(store_.handle(), "SELECT position FROM race_results WHERE vehicle_id = ?1;", vehicle_id, {},
                         &positions, error)) {
        return false;
    }
    std::optional<int> position;
    if (!positions.empty()) position = static_cast<int>(positions.front());

    *out = summarize_vehicle(laps, speeds, position);
    out->vehicle_id = identity.vehicle_id;
    out->car_number = identity.car_number;
    out->class_name = identity.class_name;
    return true;
}

bool AggregateComputer::stored(const std::string& vehicle_id, VehicleSummary* out, Error* error) {
    sqlite3* db = store_.handle();
    const std::string sql = std::string(kSelectVehicle) + " WHERE vehicle_id = ?;";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        return fail(error, ErrorKind::Import, "failed to prepare vehicle query", sqlite3_errmsg(db));
    }
    sqlite3_bind_text(stmt, 1, vehicle_id.c_str(), -1, SQLITE_TRANSIENT);
    const int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) read_vehicle(stmt, out);
    sqlite3_finalize(stmt);
    if (rc == SQLITE_DONE) return fail(error, ErrorKind::Import, "unknown vehicle " + vehicle_id);
    if (rc != SQLITE_ROW) return fail(error, ErrorKind::Import, "vehicle query failed", sqlite3_errmsg(db));
    return true;
}

bool AggregateComputer::list_vehicles(std::vector<VehicleSummary>* out, Error* error) {
    out->clear();
    sqlite3* db = store_.handle();
    const std::string sql = std::string(kSelectVehicle) + " ORDER BY position IS NULL, position, car_number;";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        return fail(error, ErrorKind::Import, "failed to prepare vehicle list", sqlite3_errmsg(db));
    }
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        VehicleSummary v;
        read_vehicle(stmt, &v);
        out->push_back(std::move(v));
    }
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) return fail(error, ErrorKind::Import, "vehicle list query failed", sqlite3_errmsg(db));
    return true;
}

bool AggregateComputer::lap_statistics(const std::string& vehicle_id, const LapRange& range, LapStatistics* out,
                                       Error* error) {
    const char* sql = R"SQL(
        SELECT
            COUNT(*),
            MIN(lap_time),
            MAX(lap_time),
            AVG(lap_time),
            AVG(lap_time * lap_time)
        FROM lap_times
        WHERE vehicle_id = ?1
          AND (?2 IS NULL OR lap >= ?2)
          AND (?3 IS NULL OR lap <= ?3);
    )SQL";
    sqlite3* db = store_.handle();
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return fail(error, ErrorKind::Import, "failed to prepare lap statistics query", sqlite3_errmsg(db));
    }
    sqlite3_bind_text(stmt, 1, vehicle_id.c_str(), -1, SQLITE_TRANSIENT);
    if (range.min_lap) {
        sqlite3_bind_int(stmt, 2, *range.min_lap);
    } else {
        sqlite3_bind_null(stmt, 2);
    }
    if (range.max_lap) {
        sqlite3_bind_int(stmt, 3, *range.max_lap);
    } else {
        sqlite3_bind_null(stmt, 3);
    }

    *out = LapStatistics{};
    const int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW && sqlite3_column_int64(stmt, 0) > 0) {
        out->count = static_cast<std::size_t>(sqlite3_column_int64(stmt, 0));
        out->fastest = sqlite3_column_double(stmt, 1);
        out->slowest = sqlite3_column_double(stmt, 2);
        out->average = sqlite3_column_double(stmt, 3);
        const double avg_sq = sqlite3_column_double(stmt, 4);
        const double variance = std::max(0.0, avg_sq - (out->average * out->average));
        out->std_dev = std::sqrt(variance);
        out->consistency = out->average > 0.0 ? out->std_dev / out->average : 0.0;
    }
    sqlite3_finalize(stmt);
    if (rc != SQLITE_ROW) return fail(error, ErrorKind::Import, "lap statistics query failed", sqlite3_errmsg(db));
    return true;
}

} // namespace pitwall::stats
