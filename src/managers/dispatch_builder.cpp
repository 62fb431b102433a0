#include "dispatch_builder.hpp"
#include "manifest.hpp"
#include "run_log.hpp"
#include <core/constants.hpp>
#include <core/time_utils.hpp>
#include <util/string_utils.hpp>
#include <fmt/format.h>
#include <fstream>
#include <filesystem>

namespace fs = std::filesystem;

Result<void> validate_dispatch_config(const DispatchConfig& config) {
    if (config.resource_name.empty()) {
        return Result<void>::Err(ErrorKind::ConfigError, "Array job needs a name");
    }
    if (config.output_dir.empty()) {
        return Result<void>::Err(ErrorKind::ConfigError, "Array job needs an output directory");
    }
    if (config.parallelism <= 0) {
        return Result<void>::Err(ErrorKind::ConfigError,
            fmt::format("ppn must be positive (got {})", config.parallelism));
    }
    if (config.max_concurrent_slots <= 0) {
        return Result<void>::Err(ErrorKind::ConfigError,
            fmt::format("max_running must be positive (got {})", config.max_concurrent_slots));
    }
    if (!is_valid_walltime(config.walltime_limit)) {
        return Result<void>::Err(ErrorKind::ConfigError,
            fmt::format("Walltime '{}' is not of the form HH:MM:SS", config.walltime_limit));
    }
    if (config.command_template.find(INFILE_TOKEN) == std::string::npos) {
        return Result<void>::Err(ErrorKind::ConfigError,
            fmt::format("Command template is missing the {} placeholder", INFILE_TOKEN));
    }
    if (config.command_template.find(OUTFILE_TOKEN) == std::string::npos) {
        return Result<void>::Err(ErrorKind::ConfigError,
            fmt::format("Command template is missing the {} placeholder", OUTFILE_TOKEN));
    }
    return Result<void>::Ok();
}

std::string expand_item_command(const std::string& command_template, int64_t offset) {
    std::string cmd = StringUtils::replace_all(command_template, INFILE_TOKEN,
                                               fmt::format("${{infile{}}}", offset));
    return StringUtils::replace_all(cmd, OUTFILE_TOKEN, fmt::format("${{outfile{}}}", offset));
}

DispatchScriptBuilder::DispatchScriptBuilder(DispatchConfig config, const SchedulerDialect& dialect)
    : config_(std::move(config)), dialect_(dialect) {}

std::string DispatchScriptBuilder::manifest_file() const {
    return manifest_path(config_.output_dir, config_.resource_name);
}

std::string DispatchScriptBuilder::script_file() const {
    return fmt::format(ARRAY_SCRIPT_FILE, config_.output_dir, config_.resource_name);
}

JobScript DispatchScriptBuilder::build(const JobPlan& plan, const std::string& manifest) const {
    const auto& c = config_;
    std::string log_stem = fmt::format("{}/{}", c.output_dir, c.resource_name);

    JobScript script;
    script.shebang();
    if (!c.contact.empty()) {
        script.directive(Directive::text(DirectiveKind::MailUser, c.contact));
    }
    script.directive(Directive::text(DirectiveKind::JobName, c.resource_name));
    script.directive(Directive::cores(c.parallelism));
    script.directive(Directive::text(DirectiveKind::WallTime, c.walltime_limit));
    script.directive(Directive::text(DirectiveKind::Memory, c.memory_limit));
    script.directive(Directive::log(DirectiveKind::StdoutLog, log_stem, ".log", true));
    script.directive(Directive::log(DirectiveKind::StderrLog, log_stem, ".err", true));
    script.directive(Directive::array_range(plan.slot_count, c.max_concurrent_slots));

    script.change_dir(c.output_dir);
    script.setup(c.environment_setup);
    script.timestamp();
    script.hostname();
    script.slot_index("offset");

    // Slot k owns lines (k-1)*n+1 .. k*n of the manifest
    if (plan.items_per_slot > 1) {
        script.command(fmt::format("offset=$(( $offset * {} ))", plan.items_per_slot));
    }

    // Offsets descend so lines are visited in file order; the first line
    // past the end means the rest of this (final, partial) slot is padding.
    for (int64_t i = plan.items_per_slot - 1; i >= 0; i--) {
        script.command(fmt::format("step=$(( $offset - {} ))", i));
        script.command(fmt::format("if [[ $step -gt {} ]]; then exit 0; fi", plan.total_items));
        script.command(fmt::format("args{}=$(sed -n \"${{step}}p\" {})", i, manifest));
        script.command(fmt::format("infile{0}=$(printf '%s\\n' \"$args{0}\" | cut -f1)", i));
        script.command(fmt::format("outfile{0}=$(printf '%s\\n' \"$args{0}\" | cut -f2)", i));

        // Only the tool invocations run under -e; the guards above may
        // legitimately return nonzero.
        script.fail_fast(true);
        script.command(expand_item_command(c.command_template, i));
        script.fail_fast(false);
    }
    script.timestamp();
    return script;
}

Result<DispatchArtifacts> DispatchScriptBuilder::write(const JobPlan& plan,
                                                       const std::vector<WorkItem>& items) const {
    auto valid = validate();
    if (valid.is_err()) return forward_err<DispatchArtifacts>(valid);

    if (static_cast<int64_t>(items.size()) != plan.total_items) {
        return Result<DispatchArtifacts>::Err(ErrorKind::InvalidInput,
            fmt::format("Plan covers {} items but {} were supplied", plan.total_items, items.size()));
    }

    DispatchArtifacts artifacts;
    artifacts.manifest_path = manifest_file();
    artifacts.script_path = script_file();

    std::error_code ec;
    fs::create_directories(config_.output_dir, ec);
    if (ec) {
        return Result<DispatchArtifacts>::Err(
            fmt::format("Cannot create output directory {}: {}", config_.output_dir, ec.message()));
    }

    auto manifest = write_manifest(artifacts.manifest_path, items);
    if (manifest.is_err()) return forward_err<DispatchArtifacts>(manifest);

    std::string text = build(plan, artifacts.manifest_path).render(dialect_);
    std::ofstream out(artifacts.script_path);
    if (!out) {
        return Result<DispatchArtifacts>::Err("Failed to open " + artifacts.script_path);
    }
    out << text;
    out.close();
    if (!out) {
        return Result<DispatchArtifacts>::Err("Failed to write " + artifacts.script_path);
    }

    arrayprep_log(fmt::format("dispatch: wrote {} ({} slots x {} items) and {}",
                              artifacts.script_path, plan.slot_count, plan.items_per_slot,
                              artifacts.manifest_path));
    return Result<DispatchArtifacts>::Ok(artifacts);
}
