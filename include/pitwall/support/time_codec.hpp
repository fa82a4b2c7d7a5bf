#pragma once

#include <cstdint>
#include <string>

namespace pitwall::support {

// Accepts `YYYY-MM-DD[T ]HH:MM:SS[.fff][Z|+HH:MM]`; no offset means UTC.
bool parse_iso8601_ms(const std::string& text, std::int64_t* epoch_ms);

// Always `YYYY-MM-DDTHH:MM:SS.mmmZ`, so stored timestamps sort chronologically.
std::string format_iso8601_ms(std::int64_t epoch_ms);

bool normalize_timestamp(const std::string& text, std::string* iso);

// Elapsed-time strings as they appear in timing sheets: `m:ss.mmm`,
// `h:mm:ss.mmm` or plain seconds `ss.mmm`. Result in milliseconds.
bool parse_duration_ms(const std::string& text, double* ms);

} // namespace pitwall::support
