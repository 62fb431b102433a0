#include "manifest.hpp"
#include <core/constants.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <fstream>

std::string manifest_path(const std::string& output_dir, const std::string& name) {
    return fmt::format(MANIFEST_FILE, output_dir, name);
}

std::string format_manifest_line(const ManifestEntry& entry) {
    return entry.input_path + "\t" + entry.output_path;
}

Result<void> write_manifest(const fs::path& path, const std::vector<WorkItem>& items) {
    fs::path staging = platform::staging_path(path);
    {
        std::ofstream out(staging);
        if (!out) {
            return Result<void>::Err("Failed to open manifest for writing: " + staging.string());
        }
        for (const auto& item : items) {
            out << format_manifest_line({item.input_path, item.output_path}) << "\n";
        }
        out.close();
        if (!out) {
            return Result<void>::Err("Failed to write manifest: " + staging.string());
        }
    }

    std::error_code ec;
    fs::rename(staging, path, ec);
    if (ec) {
        fs::remove(staging, ec);
        return Result<void>::Err(fmt::format("Failed to move manifest into place at {}", path.string()));
    }
    return Result<void>::Ok();
}

Result<std::vector<ManifestEntry>> read_manifest(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Result<std::vector<ManifestEntry>>::Err("Manifest not found: " + path.string());
    }

    std::vector<ManifestEntry> entries;
    std::string line;
    int line_no = 0;
    while (std::getline(in, line)) {
        line_no++;
        auto tab = line.find('\t');
        if (tab == std::string::npos) {
            return Result<std::vector<ManifestEntry>>::Err(ErrorKind::InvalidInput,
                fmt::format("{}:{}: expected <input>\\t<output>", path.string(), line_no));
        }
        entries.push_back({line.substr(0, tab), line.substr(tab + 1)});
    }
    return Result<std::vector<ManifestEntry>>::Ok(std::move(entries));
}
