#pragma once
#include <chrono>
#include <string>

namespace rain {

using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::seconds>;

constexpr std::chrono::seconds kHour{3600};

void ensure_dir(const std::string& path);
bool is_http_url(const std::string& s);

// Accepts "YYYY-MM-DD HH:MM[:SS]" or the same with a 'T' separator.
// No timezone conversion is applied. Throws std::runtime_error on bad input.
Timestamp parse_timestamp(const std::string& s);
bool try_parse_timestamp(const std::string& s, Timestamp& out);
std::string format_timestamp(Timestamp t);
Timestamp floor_to_hour(Timestamp t);

} // namespace rain
