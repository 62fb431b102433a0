#pragma once

#include <string>
#include <ctime>

// Generate an ISO 8601 timestamp (YYYY-MM-DDTHH:MM:SS) for the current local time.
std::string now_iso();

// Ceiling division for positive operands; never overflows.
inline long long ceil_div(long long num, long long den) {
    return num / den + (num % den != 0 ? 1 : 0);
}
