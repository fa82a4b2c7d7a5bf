#include "pitwall/support/time_codec.hpp"

#include "pitwall/support/text.hpp"

#include <cstdio>
#include <regex>

namespace pitwall::support {

namespace {

std::int64_t days_from_civil(std::int64_t y, unsigned m, unsigned d) {
    y -= m <= 2 ? 1 : 0;
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

void civil_from_days(std::int64_t z, std::int64_t* y, unsigned* m, unsigned* d) {
    z += 719468;
    const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    *d = doy - (153 * mp + 2) / 5 + 1;
    *m = mp < 10 ? mp + 3 : mp - 9;
    *y = static_cast<std::int64_t>(yoe) + era * 400 + (*m <= 2 ? 1 : 0);
}

int to_int(const std::ssub_match& m) {
    return std::stoi(m.str());
}

} // namespace

bool parse_iso8601_ms(const std::string& text, std::int64_t* epoch_ms) {
    static const std::regex iso_pattern(
        R"(^(\d{4})-(\d{2})-(\d{2})[T ](\d{2}):(\d{2}):(\d{2})(?:\.(\d{1,9}))?(Z|[+-]\d{2}:?\d{2})?$)");
    const std::string s = trim(text);
    std::smatch m;
    if (!std::regex_match(s, m, iso_pattern)) return false;

    const int year = to_int(m[1]);
    const int month = to_int(m[2]);
    const int day = to_int(m[3]);
    const int hour = to_int(m[4]);
    const int minute = to_int(m[5]);
    const int second = to_int(m[6]);
    if (month < 1 || month > 12 || day < 1 || day > 31) return false;
    if (hour > 23 || minute > 59 || second > 60) return false;

    int millis = 0;
    if (m[7].matched) {
        std::string frac = m[7].str();
        frac.resize(3, '0');
        millis = std::stoi(frac);
    }

    std::int64_t offset_minutes = 0;
    if (m[8].matched && m[8].str() != "Z") {
        const std::string tz = m[8].str();
        const int sign = tz[0] == '-' ? -1 : 1;
        const std::string digits = tz.size() == 6 ? tz.substr(1, 2) + tz.substr(4, 2) : tz.substr(1);
        offset_minutes = sign * (std::stoi(digits.substr(0, 2)) * 60 + std::stoi(digits.substr(2, 2)));
    }

    const std::int64_t days = days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    const std::int64_t seconds = days * 86400 + hour * 3600 + minute * 60 + second - offset_minutes * 60;
    *epoch_ms = seconds * 1000 + millis;
    return true;
}

std::string format_iso8601_ms(std::int64_t epoch_ms) {
    std::int64_t days = epoch_ms / 86400000;
    std::int64_t rem = epoch_ms % 86400000;
    if (rem < 0) {
        rem += 86400000;
        days -= 1;
    }
    std::int64_t y = 0;
    unsigned mo = 0;
    unsigned d = 0;
    civil_from_days(days, &y, &mo, &d);

    const int hour = static_cast<int>(rem / 3600000);
    const int minute = static_cast<int>((rem / 60000) % 60);
    const int second = static_cast<int>((rem / 1000) % 60);
    const int millis = static_cast<int>(rem % 1000);

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02uT%02d:%02d:%02d.%03dZ",
                  static_cast<long long>(y), mo, d, hour, minute, second, millis);
    return buf;
}

bool normalize_timestamp(const std::string& text, std::string* iso) {
    std::int64_t ms = 0;
    if (!parse_iso8601_ms(text, &ms)) return false;
    *iso = format_iso8601_ms(ms);
    return true;
}

bool parse_duration_ms(const std::string& text, double* ms) {
    static const std::regex duration_pattern(R"(^(?:(?:(\d{1,4}):)?(\d{1,4}):)?(\d{1,6})(?:\.(\d{1,9}))?$)");
    const std::string s = trim(text);
    std::smatch m;
    if (!std::regex_match(s, m, duration_pattern)) return false;

    const int hours = m[1].matched ? to_int(m[1]) : 0;
    const int minutes = m[2].matched ? to_int(m[2]) : 0;
    const int seconds = to_int(m[3]);
    if (m[2].matched && seconds > 59) return false;
    if (m[1].matched && minutes > 59) return false;

    double fraction = 0.0;
    if (m[4].matched) fraction = std::stod("0." + m[4].str());

    *ms = ((hours * 3600.0) + (minutes * 60.0) + seconds + fraction) * 1000.0;
    return true;
}

} // namespace pitwall::support
