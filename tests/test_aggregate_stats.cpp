#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "pitwall/ingest/referential_loader.hpp"
#include "pitwall/stats/aggregate_stats.hpp"

#include "test_support.hpp"

#include <cmath>
#include <sstream>

using Catch::Approx;
using namespace pitwall::stats;
using pitwall::ingest::LapRow;
using pitwall::ingest::RecordBatch;
using pitwall::ingest::ReferentialLoader;
using pitwall::ingest::ResultRow;
using pitwall::ingest::TelemetryRow;
using pitwall::ingest::VehicleIdentityResolver;
using pitwall::store::OpenMode;
using pitwall::store::RaceStore;
using pitwall::support::AppConfig;
using pitwall::support::Error;
using pitwall::testing::TempDir;

namespace {

// Population deviation, written out the long way.
double textbook_std_dev(const std::vector<double>& xs) {
    double mean = 0.0;
    for (double x : xs) mean += x;
    mean /= static_cast<double>(xs.size());
    double acc = 0.0;
    for (double x : xs) acc += (x - mean) * (x - mean);
    return std::sqrt(acc / static_cast<double>(xs.size()));
}

struct Fixture {
    TempDir dir;
    RaceStore store;
    AppConfig config;
    std::ostringstream log;
    VehicleIdentityResolver ids{"GR86-004"};

    Fixture() { REQUIRE(store.open(dir.db(), OpenMode::ReadWrite, nullptr)); }

    void laps(int car, const std::vector<double>& times) {
        std::vector<LapRow> rows;
        for (std::size_t i = 0; i < times.size(); ++i) {
            LapRow r;
            REQUIRE(ids.resolve(car, &r.vehicle_id, nullptr));
            r.car_number = car;
            r.lap = static_cast<int>(i + 1);
            r.lap_time_ms = times[i];
            rows.push_back(r);
        }
        load(RecordBatch(rows));
    }

    void telemetry(int car, const std::string& name, double value) {
        TelemetryRow r;
        REQUIRE(ids.resolve(car, &r.vehicle_id, nullptr));
        r.car_number = car;
        r.timestamp = "2025-04-04T18:00:00.000Z";
        r.telemetry_name = name;
        r.telemetry_value = value;
        load(RecordBatch(std::vector<TelemetryRow>{r}));
    }

    void result(int car, int position, const std::string& cls) {
        ResultRow r;
        REQUIRE(ids.resolve(car, &r.vehicle_id, nullptr));
        r.car_number = car;
        r.position = position;
        r.laps = 10;
        r.class_name = cls;
        load(RecordBatch(std::vector<ResultRow>{r}));
    }

    void load(const RecordBatch& batch) {
        ReferentialLoader loader(store, config, log);
        std::size_t inserted = 0;
        Error error;
        REQUIRE(loader.load(batch, ids, &inserted, &error));
    }
};

} // namespace

TEST_CASE("compute_lap_statistics uses the population deviation") {
    const LapStatistics s = compute_lap_statistics({100.0, 200.0, 300.0});
    REQUIRE(s.count == 3);
    REQUIRE(s.fastest == Approx(100.0));
    REQUIRE(s.slowest == Approx(300.0));
    REQUIRE(s.average == Approx(200.0));
    REQUIRE(s.std_dev == Approx(81.6496580928));
    REQUIRE(s.consistency == Approx(81.6496580928 / 200.0));
}

TEST_CASE("compute_lap_statistics of no laps is all zero") {
    const LapStatistics s = compute_lap_statistics({});
    REQUIRE(s.count == 0);
    REQUIRE(s.std_dev == 0.0);
    REQUIRE(s.consistency == 0.0);
}

TEST_CASE("summarize_vehicle leaves lap fields empty without laps") {
    const VehicleSummary v = summarize_vehicle({}, {130.0, 171.5}, std::nullopt);
    REQUIRE(v.total_laps == 0);
    REQUIRE_FALSE(v.fastest_lap.has_value());
    REQUIRE_FALSE(v.average_lap.has_value());
    REQUIRE(*v.max_speed == Approx(171.5));
    REQUIRE_FALSE(v.position.has_value());
}

TEST_CASE("stored summaries equal an independent recomputation") {
    Fixture f;
    const std::vector<double> times{98100.0, 97428.0, 97900.0, 99012.5};
    f.laps(78, times);
    f.laps(13, {101000.0});
    f.telemetry(78, "speed_can", 151.2);
    f.telemetry(78, "vCar", 153.9);
    f.telemetry(78, "aps", 400.0);
    f.result(78, 2, "Am");
    f.telemetry(46, "ath", 12.0);

    AggregateComputer aggregates(f.store, f.config);
    Error error;
    REQUIRE(aggregates.refresh_all(&error));

    for (const std::string id : {"GR86-004-78", "GR86-004-13", "GR86-004-46"}) {
        VehicleSummary stored;
        VehicleSummary derived;
        REQUIRE(aggregates.stored(id, &stored, &error));
        REQUIRE(aggregates.derive(id, &derived, &error));
        REQUIRE(stored.total_laps == derived.total_laps);
        REQUIRE(stored.fastest_lap.has_value() == derived.fastest_lap.has_value());
        if (stored.fastest_lap) {
            REQUIRE(*stored.fastest_lap == Approx(*derived.fastest_lap).margin(0.01));
            REQUIRE(*stored.average_lap == Approx(*derived.average_lap).margin(0.01));
        }
        REQUIRE(stored.max_speed.has_value() == derived.max_speed.has_value());
        REQUIRE(stored.position == derived.position);
    }

    VehicleSummary car78;
    REQUIRE(aggregates.stored("GR86-004-78", &car78, &error));
    REQUIRE(*car78.fastest_lap == Approx(97428.0));
    REQUIRE(*car78.average_lap == Approx((98100.0 + 97428.0 + 97900.0 + 99012.5) / 4.0).margin(0.01));
    REQUIRE(car78.total_laps == 4);
    REQUIRE(*car78.max_speed == Approx(153.9));
    REQUIRE(car78.position == 2);
    REQUIRE(car78.class_name == std::string("Am"));

    VehicleSummary car46;
    REQUIRE(aggregates.stored("GR86-004-46", &car46, &error));
    REQUIRE(car46.total_laps == 0);
    REQUIRE_FALSE(car46.fastest_lap.has_value());
    REQUIRE_FALSE(car46.max_speed.has_value());
    REQUIRE_FALSE(car46.position.has_value());
}

TEST_CASE("lap_statistics matches the textbook deviation and honours lap ranges") {
    Fixture f;
    const std::vector<double> times{98100.0, 97428.0, 97900.0, 99012.5, 96800.25};
    f.laps(78, times);

    AggregateComputer aggregates(f.store, f.config);
    LapStatistics all;
    Error error;
    REQUIRE(aggregates.lap_statistics("GR86-004-78", LapRange{}, &all, &error));
    REQUIRE(all.count == 5);
    REQUIRE(all.fastest == Approx(96800.25));
    REQUIRE(all.slowest == Approx(99012.5));
    REQUIRE(all.std_dev == Approx(textbook_std_dev(times)).margin(0.01));

    LapStatistics middle;
    REQUIRE(aggregates.lap_statistics("GR86-004-78", LapRange{2, 4}, &middle, &error));
    REQUIRE(middle.count == 3);
    REQUIRE(middle.fastest == Approx(97428.0));
    REQUIRE(middle.std_dev == Approx(textbook_std_dev({97428.0, 97900.0, 99012.5})).margin(0.01));

    LapStatistics none;
    REQUIRE(aggregates.lap_statistics("GR86-004-78", LapRange{10, std::nullopt}, &none, &error));
    REQUIRE(none.count == 0);
}

TEST_CASE("refresh_vehicle only touches the named vehicle") {
    Fixture f;
    f.laps(78, {98000.0});
    f.laps(13, {99000.0});

    AggregateComputer aggregates(f.store, f.config);
    Error error;
    REQUIRE(aggregates.refresh_vehicle("GR86-004-78", &error));

    VehicleSummary car78;
    VehicleSummary car13;
    REQUIRE(aggregates.stored("GR86-004-78", &car78, &error));
    REQUIRE(aggregates.stored("GR86-004-13", &car13, &error));
    REQUIRE(car78.total_laps == 1);
    REQUIRE_FALSE(car13.fastest_lap.has_value());
}

TEST_CASE("speed channels come from configuration") {
    Fixture f;
    f.telemetry(78, "speed_can", 150.0);
    f.telemetry(78, "gps_speed", 160.0);
    f.config.speed_channels = {"gps_speed"};

    AggregateComputer aggregates(f.store, f.config);
    Error error;
    REQUIRE(aggregates.refresh_all(&error));
    VehicleSummary v;
    REQUIRE(aggregates.stored("GR86-004-78", &v, &error));
    REQUIRE(*v.max_speed == Approx(160.0));
}

TEST_CASE("an unknown vehicle is reported") {
    Fixture f;
    AggregateComputer aggregates(f.store, f.config);
    VehicleSummary v;
    Error error;
    REQUIRE_FALSE(aggregates.stored("GR86-004-1", &v, &error));
    REQUIRE_FALSE(error.ok());
}
