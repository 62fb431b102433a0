#include "time_utils.hpp"
#include <fmt/format.h>
#include <regex>

bool is_valid_walltime(const std::string& walltime) {
    static const std::regex pattern(R"(\d+:\d\d:\d\d)");
    return std::regex_match(walltime, pattern);
}

long long walltime_seconds(const std::string& walltime) {
    if (!is_valid_walltime(walltime)) return -1;

    auto first = walltime.find(':');
    auto second = walltime.find(':', first + 1);
    long long hours = std::stoll(walltime.substr(0, first));
    long long mins = std::stoll(walltime.substr(first + 1, second - first - 1));
    long long secs = std::stoll(walltime.substr(second + 1));
    return hours * 3600 + mins * 60 + secs;
}

std::string format_duration(long long seconds) {
    if (seconds < 0) return "-";

    long long hours = seconds / 3600;
    long long mins = (seconds % 3600) / 60;
    long long secs = seconds % 60;

    if (hours > 0) {
        return fmt::format("{}h{}m", hours, mins);
    } else if (mins > 0) {
        return fmt::format("{}m{}s", mins, secs);
    } else {
        return fmt::format("{}s", secs);
    }
}
