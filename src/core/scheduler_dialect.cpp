#include "scheduler_dialect.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <cctype>

Directive Directive::text(DirectiveKind kind, const std::string& value) {
    Directive d;
    d.kind = kind;
    d.value = value;
    return d;
}

Directive Directive::cores(long long count) {
    Directive d;
    d.kind = DirectiveKind::Cores;
    d.count = count;
    return d;
}

Directive Directive::log(DirectiveKind kind, const std::string& stem, const std::string& suffix,
                         bool per_slot) {
    Directive d;
    d.kind = kind;
    d.value = stem;
    d.suffix = suffix;
    d.per_slot = per_slot;
    return d;
}

Directive Directive::array_range(long long count, long long limit) {
    Directive d;
    d.kind = DirectiveKind::ArrayRange;
    d.count = count;
    d.limit = limit;
    return d;
}

std::string PbsDialect::render(const Directive& d) const {
    switch (d.kind) {
        case DirectiveKind::MailUser:
            return fmt::format("#PBS -M {}\n", d.value);
        case DirectiveKind::JobName:
            return fmt::format("#PBS -N {}\n", d.value);
        case DirectiveKind::Cores:
            return fmt::format("#PBS -l nodes=1:ppn={}\n", d.count);
        case DirectiveKind::WallTime:
            return fmt::format("#PBS -l walltime={}\n", d.value);
        case DirectiveKind::Memory:
            return fmt::format("#PBS -l mem={}\n", d.value);
        case DirectiveKind::StdoutLog:
        case DirectiveKind::StderrLog: {
            const char* flag = d.kind == DirectiveKind::StdoutLog ? "-o" : "-e";
            std::string slot = d.per_slot ? "_" + slot_variable() : "";
            return fmt::format("#PBS {} {}{}{}\n", flag, d.value, slot, d.suffix);
        }
        case DirectiveKind::ArrayRange:
            return fmt::format("#PBS -t 1-{}%{}\n", d.count, d.limit);
    }
    return "";
}

std::string SlurmDialect::render(const Directive& d) const {
    switch (d.kind) {
        case DirectiveKind::MailUser:
            return fmt::format("#SBATCH --mail-user={}\n", d.value);
        case DirectiveKind::JobName:
            return fmt::format("#SBATCH --job-name={}\n", d.value);
        case DirectiveKind::Cores:
            return fmt::format("#SBATCH --nodes=1\n#SBATCH --cpus-per-task={}\n", d.count);
        case DirectiveKind::WallTime:
            return fmt::format("#SBATCH --time={}\n", d.value);
        case DirectiveKind::Memory:
            return fmt::format("#SBATCH --mem={}\n", d.value);
        case DirectiveKind::StdoutLog:
        case DirectiveKind::StderrLog: {
            const char* flag = d.kind == DirectiveKind::StdoutLog ? "--output" : "--error";
            // sbatch expands %a to the array task id in file names
            std::string slot = d.per_slot ? "_%a" : "";
            return fmt::format("#SBATCH {}={}{}{}\n", flag, d.value, slot, d.suffix);
        }
        case DirectiveKind::ArrayRange:
            return fmt::format("#SBATCH --array=1-{}%{}\n", d.count, d.limit);
    }
    return "";
}

std::unique_ptr<SchedulerDialect> make_dialect(SchedulerKind kind) {
    if (kind == SchedulerKind::SLURM) {
        return std::make_unique<SlurmDialect>();
    }
    return std::make_unique<PbsDialect>();
}

Result<SchedulerKind> parse_scheduler_kind(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    if (lower == "pbs" || lower == "torque") {
        return Result<SchedulerKind>::Ok(SchedulerKind::PBS);
    }
    if (lower == "slurm") {
        return Result<SchedulerKind>::Ok(SchedulerKind::SLURM);
    }
    return Result<SchedulerKind>::Err(ErrorKind::ConfigError,
        fmt::format("Unknown scheduler '{}' (expected pbs or slurm)", name));
}
