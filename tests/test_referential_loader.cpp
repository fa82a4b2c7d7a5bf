#include <catch2/catch_test_macros.hpp>

#include "pitwall/ingest/referential_loader.hpp"

#include "test_support.hpp"

#include <sqlite3.h>

#include <sstream>

using namespace pitwall::ingest;
using pitwall::store::OpenMode;
using pitwall::store::RaceStore;
using pitwall::support::AppConfig;
using pitwall::support::Error;
using pitwall::support::ErrorKind;
using pitwall::testing::TempDir;

namespace {

std::int64_t rows_in(RaceStore& store, const std::string& table) {
    std::int64_t count = -1;
    REQUIRE(store.count_rows(table, &count, nullptr));
    return count;
}

std::string class_of(RaceStore& store, const std::string& vehicle_id) {
    sqlite3_stmt* stmt = nullptr;
    REQUIRE(sqlite3_prepare_v2(store.handle(), "SELECT class FROM vehicles WHERE vehicle_id = ?;", -1, &stmt,
                               nullptr) == SQLITE_OK);
    sqlite3_bind_text(stmt, 1, vehicle_id.c_str(), -1, SQLITE_TRANSIENT);
    std::string out = "<missing>";
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        const unsigned char* raw = sqlite3_column_text(stmt, 0);
        out = raw ? reinterpret_cast<const char*>(raw) : "<null>";
    }
    sqlite3_finalize(stmt);
    return out;
}

LapRow lap(VehicleIdentityResolver& ids, int car, int number, double ms) {
    LapRow row;
    REQUIRE(ids.resolve(car, &row.vehicle_id, nullptr));
    row.car_number = car;
    row.lap = number;
    row.lap_time_ms = ms;
    return row;
}

} // namespace

TEST_CASE("load writes vehicles first and every dependent row") {
    TempDir dir;
    RaceStore store;
    REQUIRE(store.open(dir.db(), OpenMode::ReadWrite, nullptr));
    AppConfig config;
    std::ostringstream log;
    ReferentialLoader loader(store, config, log);

    VehicleIdentityResolver ids(config.vehicle_prefix);
    std::vector<LapRow> laps{lap(ids, 78, 1, 98000.0), lap(ids, 78, 2, 97500.0), lap(ids, 13, 1, 99000.0)};
    std::size_t inserted = 0;
    Error error;
    REQUIRE(loader.load(RecordBatch(laps), ids, &inserted, &error));

    REQUIRE(inserted == 3);
    REQUIRE(rows_in(store, "lap_times") == 3);
    REQUIRE(rows_in(store, "vehicles") == 2);
    REQUIRE_FALSE(loader.in_transaction());
}

TEST_CASE("a vehicle listed twice in a results batch counts once") {
    TempDir dir;
    RaceStore store;
    REQUIRE(store.open(dir.db(), OpenMode::ReadWrite, nullptr));
    AppConfig config;
    std::ostringstream log;
    ReferentialLoader loader(store, config, log);

    VehicleIdentityResolver ids(config.vehicle_prefix);
    std::vector<ResultRow> results(2);
    for (std::size_t i = 0; i < results.size(); ++i) {
        REQUIRE(ids.resolve(13, &results[i].vehicle_id, nullptr));
        results[i].car_number = 13;
        results[i].position = static_cast<int>(i) + 1;
        results[i].laps = 27;
    }
    std::size_t inserted = 0;
    REQUIRE(loader.load(RecordBatch(results), ids, &inserted, nullptr));

    REQUIRE(inserted == 1);
    REQUIRE(rows_in(store, "race_results") == 1);
}

TEST_CASE("an empty batch inserts nothing") {
    TempDir dir;
    RaceStore store;
    REQUIRE(store.open(dir.db(), OpenMode::ReadWrite, nullptr));
    AppConfig config;
    std::ostringstream log;
    ReferentialLoader loader(store, config, log);
    VehicleIdentityResolver ids(config.vehicle_prefix);

    std::size_t inserted = 99;
    REQUIRE(loader.load(RecordBatch(std::vector<WeatherRow>{}), ids, &inserted, nullptr));
    REQUIRE(inserted == 0);
    REQUIRE(rows_in(store, "weather") == 0);
}

TEST_CASE("a failing row rolls back the whole file") {
    TempDir dir;
    RaceStore store;
    REQUIRE(store.open(dir.db(), OpenMode::ReadWrite, nullptr));
    AppConfig config;
    std::ostringstream log;
    ReferentialLoader loader(store, config, log);

    VehicleIdentityResolver ids(config.vehicle_prefix);
    std::vector<LapRow> laps{lap(ids, 78, 1, 98000.0), lap(ids, 78, 2, 97500.0)};
    // A row for a vehicle the resolver never saw violates the foreign key.
    LapRow orphan;
    orphan.vehicle_id = "GR86-004-999";
    orphan.car_number = 999;
    orphan.lap = 1;
    orphan.lap_time_ms = 100000.0;
    laps.push_back(orphan);

    std::size_t inserted = 0;
    Error error;
    REQUIRE_FALSE(loader.load(RecordBatch(laps), ids, &inserted, &error));
    REQUIRE(error.kind == ErrorKind::Import);
    REQUIRE_FALSE(error.cause.empty());
    REQUIRE(inserted == 0);
    REQUIRE(rows_in(store, "lap_times") == 0);
    REQUIRE(rows_in(store, "vehicles") == 0);
    REQUIRE_FALSE(loader.in_transaction());

    // The loader is usable again after a rollback.
    laps.pop_back();
    REQUIRE(loader.load(RecordBatch(laps), ids, &inserted, &error));
    REQUIRE(inserted == 2);
    REQUIRE(rows_in(store, "vehicles") == 1);
}

TEST_CASE("results replace the earlier row of the same vehicle") {
    TempDir dir;
    RaceStore store;
    REQUIRE(store.open(dir.db(), OpenMode::ReadWrite, nullptr));
    AppConfig config;
    std::ostringstream log;
    ReferentialLoader loader(store, config, log);
    VehicleIdentityResolver ids(config.vehicle_prefix);

    ResultRow r;
    REQUIRE(ids.resolve(78, &r.vehicle_id, nullptr));
    r.car_number = 78;
    r.position = 4;
    r.laps = 27;
    r.class_name = "Am";
    ids.note_class(78, r.class_name);

    std::size_t inserted = 0;
    REQUIRE(loader.load(RecordBatch(std::vector<ResultRow>{r}), ids, &inserted, nullptr));
    r.position = 3;
    REQUIRE(loader.load(RecordBatch(std::vector<ResultRow>{r}), ids, &inserted, nullptr));
    REQUIRE(rows_in(store, "race_results") == 1);
    REQUIRE(class_of(store, "GR86-004-78") == "Am");
}

TEST_CASE("a vehicle written without a class picks one up later") {
    TempDir dir;
    RaceStore store;
    REQUIRE(store.open(dir.db(), OpenMode::ReadWrite, nullptr));
    AppConfig config;
    std::ostringstream log;
    ReferentialLoader loader(store, config, log);
    VehicleIdentityResolver ids(config.vehicle_prefix);

    std::size_t inserted = 0;
    REQUIRE(loader.load(RecordBatch(std::vector<LapRow>{lap(ids, 5, 1, 99000.0)}), ids, &inserted, nullptr));
    REQUIRE(class_of(store, "GR86-004-5") == "<null>");

    ids.note_class(5, "Pro");
    REQUIRE(loader.load(RecordBatch(std::vector<LapRow>{}), ids, &inserted, nullptr));
    REQUIRE(class_of(store, "GR86-004-5") == "Pro");

    ids.note_class(5, "Am");
    REQUIRE(loader.load(RecordBatch(std::vector<LapRow>{}), ids, &inserted, nullptr));
    REQUIRE(class_of(store, "GR86-004-5") == "Pro");
}

TEST_CASE("chunks written inside one transaction commit together") {
    TempDir dir;
    RaceStore store;
    REQUIRE(store.open(dir.db(), OpenMode::ReadWrite, nullptr));
    AppConfig config;
    config.verbose = true;
    config.progress_every_rows = 2;
    std::ostringstream log;
    ReferentialLoader loader(store, config, log);
    VehicleIdentityResolver ids(config.vehicle_prefix);

    auto point = [&ids](int car, const std::string& ts) {
        TelemetryRow row;
        REQUIRE(ids.resolve(car, &row.vehicle_id, nullptr));
        row.car_number = car;
        row.timestamp = ts;
        row.telemetry_name = "speed_can";
        row.telemetry_value = 120.0;
        return row;
    };

    Error error;
    std::size_t inserted = 0;
    REQUIRE(loader.begin(&error));
    std::vector<TelemetryRow> first{point(78, "2025-04-04T18:00:00.000Z"), point(78, "2025-04-04T18:00:01.000Z")};
    REQUIRE(loader.write_vehicles(ids, &error));
    REQUIRE(loader.write_batch(RecordBatch(first), &inserted, &error));
    std::vector<TelemetryRow> second{point(13, "2025-04-04T18:00:00.500Z")};
    REQUIRE(loader.write_vehicles(ids, &error));
    REQUIRE(loader.write_batch(RecordBatch(second), &inserted, &error));
    REQUIRE(loader.commit(&error));

    REQUIRE(inserted == 3);
    REQUIRE(rows_in(store, "telemetry") == 3);
    REQUIRE(rows_in(store, "vehicles") == 2);
    REQUIRE(log.str().find("[loader] 2 telemetry rows written") != std::string::npos);
}

TEST_CASE("writes outside a transaction are refused") {
    TempDir dir;
    RaceStore store;
    REQUIRE(store.open(dir.db(), OpenMode::ReadWrite, nullptr));
    AppConfig config;
    std::ostringstream log;
    ReferentialLoader loader(store, config, log);
    VehicleIdentityResolver ids(config.vehicle_prefix);

    std::size_t inserted = 0;
    Error error;
    REQUIRE_FALSE(loader.write_batch(RecordBatch(std::vector<LapRow>{}), &inserted, &error));
    REQUIRE(error.kind == ErrorKind::Import);
    REQUIRE_FALSE(loader.commit(nullptr));
}
