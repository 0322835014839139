#ifndef TIME_UTILS_HPP
#define TIME_UTILS_HPP

#include <string>
#include <chrono>
#include <ctime>

namespace TimeUtils {

// Time format constants
constexpr const char* ISO_8601_WITHOUT_Z = "%Y-%m-%dT%H:%M:%S";
constexpr const char* HUMAN_READABLE = "%Y-%m-%d %H:%M:%S";
constexpr const char* LOG_FILENAME = "%Y%m%d-%H%M%S";

// Local wall-clock time, second precision, no zone suffix (audit log timestamps)
std::string get_current_local_iso_time();
std::string get_current_human_readable_time();
std::string get_current_log_filename_stamp();

// Seconds since the Unix epoch (token issue/expiry claims)
long long get_current_unix_seconds();

std::string format_local_time(std::time_t time_value, const char* format_string);

} // namespace TimeUtils

#endif // TIME_UTILS_HPP
