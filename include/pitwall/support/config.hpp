#pragma once

#include "pitwall/support/error.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace pitwall::support {

constexpr double kMinPlaybackSpeed = 0.1;
constexpr double kMaxPlaybackSpeed = 10.0;

struct AppConfig {
    std::string db_path = "data/racing.db";
    std::string vehicle_prefix = "GR86-004";
    std::vector<std::string> speed_channels = {"vCar", "speed_can"};
    std::size_t telemetry_chunk_rows = 10000;
    std::size_t progress_every_rows = 100000;
    std::size_t replay_page_size = 100;
    double playback_speed = 1.0;
    bool verbose = false;
};

// Overlays DB_PATH, PITWALL_VEHICLE_PREFIX, PITWALL_REPLAY_PAGE_SIZE,
// PITWALL_PLAYBACK_SPEED and PITWALL_SPEED_CHANNELS onto *config.
bool apply_environment(AppConfig* config, Error* error);

bool validate(const AppConfig& config, Error* error);

double clamp_playback_speed(double speed);

bool parse_int(const std::string& raw, int* out);
bool parse_double(const std::string& raw, double* out);
bool parse_size(const std::string& raw, std::size_t* out);
std::vector<std::string> split_list(const std::string& raw, char separator);

} // namespace pitwall::support
