#pragma once

#include <string>

namespace pitwall::support {

std::string trim(const std::string& s);
std::string to_lower(std::string s);
bool contains_ci(const std::string& haystack, const std::string& needle);
bool ends_with_ci(const std::string& s, const std::string& suffix);

} // namespace pitwall::support
