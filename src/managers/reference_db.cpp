#include "reference_db.hpp"
#include <fmt/format.h>
#include <filesystem>
#include <algorithm>
#include <vector>

namespace fs = std::filesystem;

static bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

Result<ReferenceDatabase> discover_database(const std::string& prefix) {
    if (prefix.empty()) {
        return Result<ReferenceDatabase>::Err(ErrorKind::ConfigError, "No database configured");
    }

    fs::path p(prefix);
    fs::path dir = p.parent_path().empty() ? fs::path(".") : p.parent_path();
    std::string stem = p.filename().string();

    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return Result<ReferenceDatabase>::Err(ErrorKind::ConfigError,
            fmt::format("Database directory {} does not exist", dir.string()));
    }

    // Equivalent of globbing "<prefix>*", sorted for a stable pick
    std::vector<std::string> matches;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::string name = it->path().filename().string();
        if (name.rfind(stem, 0) == 0) {
            matches.push_back((dir / name).string());
        }
    }
    if (ec) {
        return Result<ReferenceDatabase>::Err(ErrorKind::ConfigError,
            fmt::format("Cannot list {}: {}", dir.string(), ec.message()));
    }
    std::sort(matches.begin(), matches.end());

    ReferenceDatabase db;
    db.prefix = prefix;
    for (const auto& m : matches) {
        if (db.taxonomy.empty() && ends_with(m, ".tax")) db.taxonomy = m;
        if (!db.coords && ends_with(m, ".coords")) db.coords = m;
    }

    if (db.taxonomy.empty()) {
        return Result<ReferenceDatabase>::Err(ErrorKind::ConfigError,
            fmt::format("No lineage (*.tax) file found for database {}", prefix));
    }
    return Result<ReferenceDatabase>::Ok(db);
}
