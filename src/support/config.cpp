#include "pitwall/support/config.hpp"

#include "pitwall/support/text.hpp"

#include <algorithm>
#include <cerrno>
#include <climits>
#include <cmath>
#include <cstdlib>

namespace pitwall::support {

namespace {

const char* env_value(const char* name) {
    const char* v = std::getenv(name);
    if (!v || *v == '\0') return nullptr;
    return v;
}

} // namespace

bool parse_int(const std::string& raw, int* out) {
    const std::string s = trim(raw);
    if (s.empty()) return false;
    char* end = nullptr;
    errno = 0;
    const long v = std::strtol(s.c_str(), &end, 10);
    if (end == s.c_str() || *end != '\0' || errno == ERANGE) return false;
    if (v < INT_MIN || v > INT_MAX) return false;
    *out = static_cast<int>(v);
    return true;
}

bool parse_double(const std::string& raw, double* out) {
    const std::string s = trim(raw);
    if (s.empty()) return false;
    char* end = nullptr;
    const double v = std::strtod(s.c_str(), &end);
    if (end == s.c_str() || *end != '\0' || !std::isfinite(v)) return false;
    *out = v;
    return true;
}

bool parse_size(const std::string& raw, std::size_t* out) {
    int v = 0;
    if (!parse_int(raw, &v) || v < 0) return false;
    *out = static_cast<std::size_t>(v);
    return true;
}

std::vector<std::string> split_list(const std::string& raw, char separator) {
    std::vector<std::string> out;
    std::string cur;
    for (char c : raw) {
        if (c == separator) {
            if (!trim(cur).empty()) out.push_back(trim(cur));
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    if (!trim(cur).empty()) out.push_back(trim(cur));
    return out;
}

double clamp_playback_speed(double speed) {
    if (!std::isfinite(speed)) return 1.0;
    return std::max(kMinPlaybackSpeed, std::min(kMaxPlaybackSpeed, speed));
}

bool apply_environment(AppConfig* config, Error* error) {
    if (const char* v = env_value("DB_PATH")) config->db_path = v;
    if (const char* v = env_value("PITWALL_VEHICLE_PREFIX")) config->vehicle_prefix = v;
    if (const char* v = env_value("PITWALL_REPLAY_PAGE_SIZE")) {
        if (!parse_size(v, &config->replay_page_size)) {
            return fail(error, ErrorKind::Config, std::string("PITWALL_REPLAY_PAGE_SIZE is not a count: ") + v);
        }
    }
    if (const char* v = env_value("PITWALL_PLAYBACK_SPEED")) {
        if (!parse_double(v, &config->playback_speed)) {
            return fail(error, ErrorKind::Config, std::string("PITWALL_PLAYBACK_SPEED is not a number: ") + v);
        }
    }
    if (const char* v = env_value("PITWALL_SPEED_CHANNELS")) {
        config->speed_channels = split_list(v, ',');
    }
    return validate(*config, error);
}

bool validate(const AppConfig& config, Error* error) {
    if (config.db_path.empty()) return fail(error, ErrorKind::Config, "database path is empty");
    if (config.vehicle_prefix.empty()) return fail(error, ErrorKind::Config, "vehicle prefix is empty");
    if (config.speed_channels.empty()) return fail(error, ErrorKind::Config, "no speed channels configured");
    if (config.replay_page_size == 0) return fail(error, ErrorKind::Config, "replay page size must be at least 1");
    if (config.telemetry_chunk_rows == 0) return fail(error, ErrorKind::Config, "telemetry chunk size must be at least 1");
    if (config.playback_speed < kMinPlaybackSpeed || config.playback_speed > kMaxPlaybackSpeed) {
        return fail(error, ErrorKind::Config, "playback speed must be between 0.1 and 10");
    }
    return true;
}

} // namespace pitwall::support
