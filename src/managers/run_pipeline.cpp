#include "run_pipeline.hpp"
#include "partition_planner.hpp"
#include "work_items.hpp"
#include "run_log.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <core/scheduler_dialect.hpp>
#include <util/string_utils.hpp>
#include <fmt/format.h>

std::string build_item_command(const ReferenceDatabase& db, int ppn,
                               const std::vector<std::string>& ranks) {
    // cat is safe on gzip'd data; the classifier expects R1/R2 combined
    std::string concat = "cat {infile}*.fastq.gz > {outfile}.fastq.gz";

    std::string align = fmt::format(
        "bowtie2 -p {} -x {} -q {{outfile}}.fastq.gz -S {{outfile}}.sam --seed 42 "
        "--very-sensitive -k 16 --np 1 --mp \"1,1\" --rdg \"0,1\" --rfg \"0,1\" "
        "--score-min \"L,0,-0.05\" --no-head --no-unal",
        ppn, db.prefix);

    std::string classify = fmt::format(
        "woltka classify -i {{outfile}}.sam -o {{outfile}}.woltka-taxa --no-demux "
        "--lineage {} --rank {}",
        db.taxonomy, StringUtils::join(ranks, ","));

    std::string compress = fmt::format("xz -9 -T{} -c {{outfile}}.sam > {{outfile}}.xz", ppn);

    std::vector<std::string> steps = {concat, align, classify};
    if (db.coords) {
        steps.push_back(fmt::format(
            "woltka classify -i {{outfile}}.sam -c {} -o {{outfile}}.woltka-per-gene --no-demux",
            *db.coords));
    }
    steps.push_back(compress);
    return StringUtils::join(steps, "; ");
}

RunPipeline::RunPipeline(const Config& config) : config_(config) {}

RunStore RunPipeline::store() const {
    return RunStore(config_.project().output_dir, config_.project().name);
}

DispatchConfig RunPipeline::dispatch_config(const std::string& command_template) const {
    const auto& p = config_.project();
    const auto& a = config_.array();

    DispatchConfig d;
    d.resource_name = p.name;
    d.parallelism = a.ppn;
    d.memory_limit = a.memory;
    d.walltime_limit = a.walltime;
    d.max_concurrent_slots = a.max_running;
    d.environment_setup = p.environment;
    d.command_template = a.command.empty() ? command_template : a.command;
    d.output_extension = a.output_extension;
    d.output_dir = p.output_dir;
    d.contact = p.contact;
    return d;
}

MergeSettings RunPipeline::merge_settings() const {
    const auto& p = config_.project();
    const auto& m = config_.merge();

    MergeSettings s;
    s.resource_name = p.name;
    s.output_dir = p.output_dir;
    s.metadata_path = p.metadata;
    s.memory_limit = m.memory;
    s.walltime_limit = m.walltime;
    s.environment_setup = p.environment;
    s.contact = p.contact;
    s.command_template = m.command;
    s.archive_command = m.archive;
    s.notify_command = m.notify;
    s.notify_url = p.notify_url;
    return s;
}

MergeInputs RunPipeline::merge_inputs(bool has_secondary) const {
    MergeInputs inputs;
    inputs.partition_keys = config_.merge().ranks;
    if (has_secondary) inputs.secondary_key = std::string(SECONDARY_KEY);
    return inputs;
}

ValidationLayout RunPipeline::validation_layout(bool has_secondary) const {
    const auto& m = config_.merge();

    ValidationLayout layout;
    layout.output_dir = config_.project().output_dir;
    layout.partition_keys = m.ranks;
    layout.primary_key = m.primary;
    layout.ungrouped_key = m.ungrouped;
    if (has_secondary) layout.secondary_key = std::string(SECONDARY_KEY);
    layout.table_extension = m.table_extension;
    layout.contact = config_.project().contact;
    return layout;
}

Result<RunRecord> RunPipeline::prepare(StatusCallback cb) const {
    const auto& p = config_.project();

    if (p.output_dir.empty() || p.input_dir.empty() || p.metadata.empty()) {
        return Result<RunRecord>::Err(ErrorKind::ConfigError,
            "input_dir, output_dir and metadata must all be set");
    }

    auto kind = parse_scheduler_kind(p.scheduler);
    if (kind.is_err()) return forward_err<RunRecord>(kind);
    auto dialect = make_dialect(kind.value);

    auto db = discover_database(p.database);
    if (db.is_err()) return forward_err<RunRecord>(db);
    if (cb) cb(fmt::format("Database lineage: {}", db.value.taxonomy));
    if (cb && db.value.coords) cb(fmt::format("Gene coordinates: {}", *db.value.coords));

    auto items = load_work_items(p.metadata, p.key_column, p.input_dir, p.output_dir,
                                 config_.array().output_extension);
    if (items.is_err()) return forward_err<RunRecord>(items);

    auto plan = plan_partitions(static_cast<int64_t>(items.value.size()), config_.array().capacity);
    if (plan.is_err()) return forward_err<RunRecord>(plan);
    const JobPlan& jp = plan.value;
    if (cb) cb(fmt::format("{} items -> {} slots of {}", jp.total_items, jp.slot_count, jp.items_per_slot));

    std::string command = build_item_command(db.value, config_.array().ppn, config_.merge().ranks);
    DispatchScriptBuilder dispatch(dispatch_config(command), *dialect);
    auto dispatch_ok = dispatch.validate();
    if (dispatch_ok.is_err()) return forward_err<RunRecord>(dispatch_ok);

    bool has_secondary = db.value.coords.has_value();
    auto merges = plan_merges(merge_inputs(has_secondary));
    if (merges.is_err()) return forward_err<RunRecord>(merges);
    MergeScheduler merge(merge_settings(), *dialect);
    auto merge_ok = merge.validate(merges.value);
    if (merge_ok.is_err()) return forward_err<RunRecord>(merge_ok);

    // Everything checked; from here on files are written
    auto written = dispatch.write(jp, items.value);
    if (written.is_err()) return forward_err<RunRecord>(written);
    if (cb) cb("Wrote " + written.value.manifest_path);
    if (cb) cb("Wrote " + written.value.script_path);

    auto merge_path = merge.write(merges.value);
    if (merge_path.is_err()) return forward_err<RunRecord>(merge_path);
    if (cb) cb("Wrote " + merge_path.value);

    RunRecord record;
    record.name = p.name;
    record.scheduler = dialect->name();
    record.created = now_iso();
    record.plan = jp;
    record.manifest_path = written.value.manifest_path;
    record.array_script = written.value.script_path;
    record.merge_script = merge_path.value;
    record.has_secondary = has_secondary;

    auto saved = store().save(record);
    if (saved.is_err()) return forward_err<RunRecord>(saved);

    append_run_log(p.output_dir, p.name, fmt::format(
        "prepared {} items: {} slots x {} (capacity {}), {} merge tasks, scheduler {}",
        jp.total_items, jp.slot_count, jp.items_per_slot, jp.capacity,
        merges.value.size(), record.scheduler));
    return Result<RunRecord>::Ok(record);
}

Result<ValidationReport> RunPipeline::validate(StatusCallback cb) const {
    const auto& p = config_.project();
    if (p.output_dir.empty()) {
        return Result<ValidationReport>::Err(ErrorKind::ConfigError, "output_dir must be set");
    }

    // Prefer what prepare recorded; fall back to looking at the database again
    bool has_secondary = false;
    auto record = store().load();
    if (record.is_ok()) {
        has_secondary = record.value.has_secondary;
    } else {
        auto db = discover_database(p.database);
        if (db.is_err()) {
            return Result<ValidationReport>::Err(ErrorKind::ConfigError,
                fmt::format("{}; {}", record.error, db.error));
        }
        has_secondary = db.value.coords.has_value();
    }

    FormatDetectingNormalizer normalizer;
    OutputValidator validator(validation_layout(has_secondary), normalizer);
    ValidationReport report = validator.validate();

    for (const auto& a : report.artifacts) {
        if (cb) cb("Found " + a.label);
    }

    auto saved = store().save_report(report);
    if (saved.is_err()) {
        // The report itself is still the result; losing the file is logged only
        arrayprep_log("validate: " + saved.error);
    }

    append_run_log(p.output_dir, p.name, fmt::format(
        "validated: {} ({} artifacts, {} errors)",
        report.success() ? "success" : "failed", report.artifacts.size(), report.errors.size()));
    return Result<ValidationReport>::Ok(report);
}
