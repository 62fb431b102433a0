#pragma once

#include <string>
#include <vector>
#include <optional>
#include <core/types.hpp>
#include <core/constants.hpp>
#include <core/job_script.hpp>
#include <core/scheduler_dialect.hpp>

struct MergeInputs {
    std::vector<std::string> partition_keys;     // e.g. taxonomic ranks
    std::optional<std::string> secondary_key;    // only set when a secondary source exists
    std::string key_glob = DEFAULT_RANK_GLOB;    // "{}" is replaced by the key
    std::string secondary_glob = DEFAULT_GENE_GLOB;
};

// One merge task per partition key, then the secondary key if present.
// Fails with ConfigError for an empty plan or one with MAX_MERGE_TASKS or more tasks.
Result<MergePlan> plan_merges(const MergeInputs& inputs);

// Marks exactly one task with rename_output. The secondary task gets it
// when a secondary source exists; otherwise the last ordinary key does.
void apply_rename_rule(MergePlan& plan, const std::optional<std::string>& secondary_key);

// Fills the merge command template for one task, appending the rename flag if set.
std::string merge_command(const MergeSettings& settings, const MergeTask& task);

// Second-phase script: every merge task runs in the background, a single
// wait joins them, then intermediates are archived and completion reported.
class MergeScheduler {
public:
    MergeScheduler(MergeSettings settings, const SchedulerDialect& dialect);

    Result<void> validate(const MergePlan& plan) const;

    JobScript build(const MergePlan& plan) const;

    // Validate, render and write <output>/<name>.merge.qsub. Returns its path.
    Result<std::string> write(const MergePlan& plan) const;

    std::string script_file() const;

private:
    MergeSettings settings_;
    const SchedulerDialect& dialect_;
};
