#pragma once

#include <string>
#include <vector>

namespace StringUtils {
std::vector<std::string> split(const std::string& str, char delimiter);
std::string trim(const std::string& str);
std::string join(const std::vector<std::string>& parts, const std::string& sep);

// Replace every occurrence of `from` in `str` with `to`.
std::string replace_all(std::string str, const std::string& from, const std::string& to);
}
