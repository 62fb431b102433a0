#pragma once

#include <string>
#include <vector>
#include <core/config.hpp>
#include "dispatch_builder.hpp"
#include "merge_scheduler.hpp"
#include "output_validator.hpp"
#include "reference_db.hpp"
#include "run_store.hpp"

// Per-item tool chain for one sample: concatenate reads, align, classify at
// every rank, optionally classify per gene, then compress the alignment.
// Placeholders {infile}/{outfile} are left for the dispatch builder.
std::string build_item_command(const ReferenceDatabase& db, int ppn,
                               const std::vector<std::string>& ranks);

// Headless facade over planning, script generation and validation for one
// configured run. Any frontend (CLI, tests) drives the run through this.
class RunPipeline {
public:
    explicit RunPipeline(const Config& config);

    // Load metadata, plan, build both scripts. Every check runs before the
    // first file is written, so a failure leaves the output directory untouched.
    Result<RunRecord> prepare(StatusCallback cb = nullptr) const;

    // Inspect the output directory after execution and persist the report.
    // Only structural problems (no prepared run, unreadable config) fail.
    Result<ValidationReport> validate(StatusCallback cb = nullptr) const;

    DispatchConfig dispatch_config(const std::string& command_template) const;
    MergeSettings merge_settings() const;
    MergeInputs merge_inputs(bool has_secondary) const;
    ValidationLayout validation_layout(bool has_secondary) const;

    RunStore store() const;

private:
    const Config& config_;
};
