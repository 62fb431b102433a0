#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME), or the temp directory if unset.
std::filesystem::path home_dir();

// Returns the system temporary directory.
std::filesystem::path temp_dir();

// Returns a sibling path for writing a file before renaming it into place.
std::filesystem::path staging_path(const std::filesystem::path& target);

} // namespace platform
