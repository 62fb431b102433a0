#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>
#include <core/job_script.hpp>
#include <core/scheduler_dialect.hpp>

struct DispatchArtifacts {
    std::string manifest_path;
    std::string script_path;
};

// Check a dispatch config before anything is written: walltime shape,
// both command placeholders, positive resource counts. Fails with ConfigError.
Result<void> validate_dispatch_config(const DispatchConfig& config);

// Substitute the per-item placeholders with the shell variables of local offset i.
std::string expand_item_command(const std::string& command_template, int64_t offset);

// Renders the job-array script that lets each slot find and process its own
// items from the manifest, with no coordination between slots.
class DispatchScriptBuilder {
public:
    DispatchScriptBuilder(DispatchConfig config, const SchedulerDialect& dialect);

    Result<void> validate() const { return validate_dispatch_config(config_); }

    // Script IR for a plan; `manifest` is the path the slots read at run time.
    JobScript build(const JobPlan& plan, const std::string& manifest) const;

    // Validate, then write the manifest and the rendered script to the output directory.
    Result<DispatchArtifacts> write(const JobPlan& plan, const std::vector<WorkItem>& items) const;

    std::string manifest_file() const;
    std::string script_file() const;

private:
    DispatchConfig config_;
    const SchedulerDialect& dialect_;
};
