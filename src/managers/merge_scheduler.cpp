#include "merge_scheduler.hpp"
#include "run_log.hpp"
#include <core/time_utils.hpp>
#include <util/string_utils.hpp>
#include <fmt/format.h>
#include <fstream>
#include <set>

static Result<void> check_task_count(size_t n) {
    if (n == 0) {
        return Result<void>::Err(ErrorKind::ConfigError, "No partition keys to merge");
    }
    if (n >= static_cast<size_t>(MAX_MERGE_TASKS)) {
        return Result<void>::Err(ErrorKind::ConfigError,
            fmt::format("{} merge tasks requested; the merge stage allows fewer than {}",
                        n, MAX_MERGE_TASKS));
    }
    return Result<void>::Ok();
}

Result<MergePlan> plan_merges(const MergeInputs& inputs) {
    MergePlan plan;
    std::set<std::string> seen;

    for (const auto& key : inputs.partition_keys) {
        if (key.empty()) {
            return Result<MergePlan>::Err(ErrorKind::ConfigError, "Empty partition key");
        }
        if (!seen.insert(key).second) {
            return Result<MergePlan>::Err(ErrorKind::ConfigError,
                fmt::format("Partition key '{}' is listed twice", key));
        }
        plan.push_back({key, StringUtils::replace_all(inputs.key_glob, "{}", key), false});
    }

    if (inputs.secondary_key) {
        if (!seen.insert(*inputs.secondary_key).second) {
            return Result<MergePlan>::Err(ErrorKind::ConfigError,
                fmt::format("Secondary key '{}' collides with a partition key", *inputs.secondary_key));
        }
        plan.push_back({*inputs.secondary_key, inputs.secondary_glob, false});
    }

    auto count = check_task_count(plan.size());
    if (count.is_err()) return forward_err<MergePlan>(count);

    apply_rename_rule(plan, inputs.secondary_key);
    return Result<MergePlan>::Ok(std::move(plan));
}

void apply_rename_rule(MergePlan& plan, const std::optional<std::string>& secondary_key) {
    for (auto& task : plan) task.rename_output = false;
    if (plan.empty()) return;

    if (secondary_key) {
        for (auto& task : plan) {
            if (task.partition_key == *secondary_key) {
                task.rename_output = true;
                return;
            }
        }
    }

    // No secondary source: the last ordinary key carries the flag
    for (auto it = plan.rbegin(); it != plan.rend(); ++it) {
        if (!secondary_key || it->partition_key != *secondary_key) {
            it->rename_output = true;
            return;
        }
    }
}

std::string merge_command(const MergeSettings& settings, const MergeTask& task) {
    std::string cmd = settings.command_template;
    cmd = StringUtils::replace_all(cmd, "{prep}", settings.metadata_path);
    cmd = StringUtils::replace_all(cmd, "{base}", settings.output_dir);
    cmd = StringUtils::replace_all(cmd, "{name}", task.partition_key);
    cmd = StringUtils::replace_all(cmd, "{glob}", task.glob_pattern);
    if (task.rename_output) {
        cmd += " ";
        cmd += RENAME_FLAG;
    }
    return cmd;
}

MergeScheduler::MergeScheduler(MergeSettings settings, const SchedulerDialect& dialect)
    : settings_(std::move(settings)), dialect_(dialect) {}

std::string MergeScheduler::script_file() const {
    return fmt::format(MERGE_SCRIPT_FILE, settings_.output_dir, settings_.resource_name);
}

Result<void> MergeScheduler::validate(const MergePlan& plan) const {
    auto count = check_task_count(plan.size());
    if (count.is_err()) return count;

    if (!is_valid_walltime(settings_.walltime_limit)) {
        return Result<void>::Err(ErrorKind::ConfigError,
            fmt::format("Merge walltime '{}' is not of the form HH:MM:SS", settings_.walltime_limit));
    }
    if (settings_.command_template.find("{name}") == std::string::npos ||
        settings_.command_template.find("{glob}") == std::string::npos) {
        return Result<void>::Err(ErrorKind::ConfigError,
            "Merge command template needs both {name} and {glob}");
    }

    int flagged = 0;
    for (const auto& task : plan) {
        if (task.rename_output) flagged++;
    }
    if (flagged != 1) {
        return Result<void>::Err(ErrorKind::ConfigError,
            fmt::format("Exactly one merge task must rename its output ({} do)", flagged));
    }
    return Result<void>::Ok();
}

JobScript MergeScheduler::build(const MergePlan& plan) const {
    const auto& s = settings_;
    std::string job_name = "merge-" + s.resource_name;
    std::string log_stem = fmt::format("{}/{}", s.output_dir, job_name);

    JobScript script;
    script.shebang();
    if (!s.contact.empty()) {
        script.directive(Directive::text(DirectiveKind::MailUser, s.contact));
    }
    script.directive(Directive::text(DirectiveKind::JobName, job_name));
    script.directive(Directive::cores(static_cast<long long>(plan.size())));
    script.directive(Directive::text(DirectiveKind::WallTime, s.walltime_limit));
    script.directive(Directive::text(DirectiveKind::Memory, s.memory_limit));
    script.directive(Directive::log(DirectiveKind::StdoutLog, log_stem, ".log", false));
    script.directive(Directive::log(DirectiveKind::StderrLog, log_stem, ".err", false));

    script.change_dir(s.output_dir);
    script.setup(s.environment_setup);
    script.timestamp();
    script.hostname();
    script.fail_fast(true);

    for (const auto& task : plan) {
        script.background(merge_command(s, task));
    }
    script.wait_all();

    script.change_dir(s.output_dir);
    if (!s.archive_command.empty()) {
        script.command(s.archive_command);
    }
    if (!s.notify_command.empty()) {
        std::string notify = StringUtils::replace_all(s.notify_command, "{url}", s.notify_url);
        notify = StringUtils::replace_all(notify, "{name}", s.resource_name);
        notify = StringUtils::replace_all(notify, "{output}", s.output_dir);
        script.command(notify);
    }
    script.timestamp();
    return script;
}

Result<std::string> MergeScheduler::write(const MergePlan& plan) const {
    auto valid = validate(plan);
    if (valid.is_err()) return forward_err<std::string>(valid);

    std::string path = script_file();
    std::ofstream out(path);
    if (!out) {
        return Result<std::string>::Err("Failed to open " + path);
    }
    out << build(plan).render(dialect_);
    out.close();
    if (!out) {
        return Result<std::string>::Err("Failed to write " + path);
    }

    arrayprep_log(fmt::format("merge: wrote {} ({} tasks)", path, plan.size()));
    return Result<std::string>::Ok(path);
}
