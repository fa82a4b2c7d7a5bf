#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "pitwall/support/config.hpp"

#include <cstdlib>

using Catch::Approx;
using namespace pitwall::support;

namespace {

const char* const kVars[] = {"DB_PATH", "PITWALL_VEHICLE_PREFIX", "PITWALL_REPLAY_PAGE_SIZE",
                             "PITWALL_PLAYBACK_SPEED", "PITWALL_SPEED_CHANNELS"};

// Clears the variables on entry and exit.
struct EnvGuard {
    EnvGuard() { clear(); }
    ~EnvGuard() { clear(); }
    static void clear() {
        for (const char* name : kVars) unsetenv(name);
    }
};

} // namespace

TEST_CASE("defaults apply when the environment is empty") {
    EnvGuard guard;
    AppConfig config;
    Error error;
    REQUIRE(apply_environment(&config, &error));
    REQUIRE(config.db_path == "data/racing.db");
    REQUIRE(config.vehicle_prefix == "GR86-004");
    REQUIRE(config.replay_page_size == 100);
    REQUIRE(config.playback_speed == Approx(1.0));
    REQUIRE(config.speed_channels == std::vector<std::string>{"vCar", "speed_can"});
}

TEST_CASE("environment variables override the defaults") {
    EnvGuard guard;
    setenv("DB_PATH", "/tmp/other.db", 1);
    setenv("PITWALL_VEHICLE_PREFIX", "GR86-010", 1);
    setenv("PITWALL_REPLAY_PAGE_SIZE", "250", 1);
    setenv("PITWALL_PLAYBACK_SPEED", "2.5", 1);
    setenv("PITWALL_SPEED_CHANNELS", " gps_speed , vCar ,", 1);

    AppConfig config;
    Error error;
    REQUIRE(apply_environment(&config, &error));
    REQUIRE(config.db_path == "/tmp/other.db");
    REQUIRE(config.vehicle_prefix == "GR86-010");
    REQUIRE(config.replay_page_size == 250);
    REQUIRE(config.playback_speed == Approx(2.5));
    REQUIRE(config.speed_channels == std::vector<std::string>{"gps_speed", "vCar"});
}

TEST_CASE("malformed environment values are configuration errors") {
    EnvGuard guard;
    AppConfig config;
    Error error;

    setenv("PITWALL_REPLAY_PAGE_SIZE", "lots", 1);
    REQUIRE_FALSE(apply_environment(&config, &error));
    REQUIRE(error.kind == ErrorKind::Config);

    EnvGuard::clear();
    setenv("PITWALL_REPLAY_PAGE_SIZE", "0", 1);
    error = Error{};
    REQUIRE_FALSE(apply_environment(&config, &error));
    REQUIRE(error.kind == ErrorKind::Config);

    EnvGuard::clear();
    AppConfig fresh;
    setenv("PITWALL_PLAYBACK_SPEED", "40", 1);
    error = Error{};
    REQUIRE_FALSE(apply_environment(&fresh, &error));
    REQUIRE(error.kind == ErrorKind::Config);
}

TEST_CASE("playback speed is clamped to the supported range") {
    REQUIRE(clamp_playback_speed(0.01) == Approx(kMinPlaybackSpeed));
    REQUIRE(clamp_playback_speed(50.0) == Approx(kMaxPlaybackSpeed));
    REQUIRE(clamp_playback_speed(3.0) == Approx(3.0));
}

TEST_CASE("numeric parsing is strict") {
    int i = 0;
    REQUIRE(parse_int(" 42 ", &i));
    REQUIRE(i == 42);
    REQUIRE_FALSE(parse_int("42abc", &i));
    REQUIRE_FALSE(parse_int("", &i));
    REQUIRE_FALSE(parse_int("99999999999999999999", &i));

    double d = 0.0;
    REQUIRE(parse_double("97.428", &d));
    REQUIRE(d == Approx(97.428));
    REQUIRE_FALSE(parse_double("1:37.428", &d));
    REQUIRE_FALSE(parse_double("nan", &d));

    std::size_t n = 0;
    REQUIRE_FALSE(parse_size("-3", &n));
}
