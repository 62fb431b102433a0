#pragma once

#include <string>

// Check a scheduler walltime string of the form H+:MM:SS (e.g. "10:00:00", "4:00:00").
bool is_valid_walltime(const std::string& walltime);

// Convert a walltime string to seconds. Returns -1 if it is not a valid walltime.
long long walltime_seconds(const std::string& walltime);

// Format a duration in seconds as "2h35m", "14m22s", "8s", or "-" if negative.
std::string format_duration(long long seconds);
