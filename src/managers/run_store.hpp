#pragma once

#include <string>
#include <filesystem>
#include <core/types.hpp>

namespace fs = std::filesystem;

// What a successful `prepare` produced, kept beside the outputs so later
// commands can re-derive slot ownership without re-reading the metadata.
struct RunRecord {
    std::string name;
    std::string scheduler;
    std::string created;            // ISO timestamp
    JobPlan plan;
    std::string manifest_path;
    std::string array_script;
    std::string merge_script;
    bool has_secondary = false;
};

class RunStore {
public:
    RunStore(const std::string& output_dir, const std::string& name);

    Result<RunRecord> load() const;
    Result<void> save(const RunRecord& record) const;

    // <output>/<name>.report.yaml for the reporting client
    Result<void> save_report(const ValidationReport& report) const;

    const fs::path& plan_path() const { return plan_path_; }
    const fs::path& report_path() const { return report_path_; }

private:
    fs::path plan_path_;
    fs::path report_path_;
};
