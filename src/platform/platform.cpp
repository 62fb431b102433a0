#include "platform.hpp"
#include <cstdlib>
#include <unistd.h>

namespace fs = std::filesystem;

namespace platform {

fs::path home_dir() {
    const char* home = std::getenv("HOME");
    if (!home) return temp_dir();
    return fs::path(home);
}

fs::path temp_dir() {
    return fs::temp_directory_path();
}

fs::path staging_path(const fs::path& target) {
    // pid suffix keeps concurrent writers in the same directory apart
    return target.parent_path() /
           ("." + target.filename().string() + ".tmp" + std::to_string(getpid()));
}

} // namespace platform
