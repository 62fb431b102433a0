#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <core/types.hpp>

namespace fs = std::filesystem;

// Manifest file: one "<input>\t<output>\n" line per work item, in the
// caller's order. Slots address it by 1-based line number, so it must
// never be re-sorted after it is written.

std::string manifest_path(const std::string& output_dir, const std::string& name);

// "<input>\t<output>" without the trailing newline
std::string format_manifest_line(const ManifestEntry& entry);

Result<void> write_manifest(const fs::path& path, const std::vector<WorkItem>& items);

Result<std::vector<ManifestEntry>> read_manifest(const fs::path& path);
