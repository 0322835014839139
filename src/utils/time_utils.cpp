#include "time_utils.hpp"
#include <iomanip>
#include <sstream>

namespace TimeUtils {

std::string format_local_time(std::time_t time_value, const char* format_string) {
    std::stringstream ss;

    // Use thread-safe localtime_r instead of localtime
    struct tm timeinfo;
    localtime_r(&time_value, &timeinfo);
    ss << std::put_time(&timeinfo, format_string);
    return ss.str();
}

std::string get_current_local_iso_time() {
    auto now = std::chrono::system_clock::now();
    return format_local_time(std::chrono::system_clock::to_time_t(now), ISO_8601_WITHOUT_Z);
}

std::string get_current_human_readable_time() {
    auto now = std::chrono::system_clock::now();
    return format_local_time(std::chrono::system_clock::to_time_t(now), HUMAN_READABLE);
}

std::string get_current_log_filename_stamp() {
    auto now = std::chrono::system_clock::now();
    return format_local_time(std::chrono::system_clock::to_time_t(now), LOG_FILENAME);
}

long long get_current_unix_seconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace TimeUtils
