#pragma once

#include <string>
#include <memory>
#include <core/types.hpp>

// Resource/identity directives carried in a job script header. Values are
// opaque to this tool and forwarded verbatim to the scheduler.
enum class DirectiveKind {
    MailUser,
    JobName,
    Cores,        // count = cores on a single node
    WallTime,
    Memory,
    StdoutLog,    // value = path stem, suffix = extension
    StderrLog,
    ArrayRange,   // count = slot count, limit = concurrency cap
};

struct Directive {
    DirectiveKind kind = DirectiveKind::JobName;
    std::string value;
    std::string suffix;
    long long count = 0;
    long long limit = 0;
    bool per_slot = false;   // log path is suffixed with the array slot id

    static Directive text(DirectiveKind kind, const std::string& value);
    static Directive cores(long long count);
    static Directive log(DirectiveKind kind, const std::string& stem, const std::string& suffix,
                         bool per_slot);
    static Directive array_range(long long count, long long limit);
};

// Renders directives in one scheduler's syntax.
class SchedulerDialect {
public:
    virtual ~SchedulerDialect() = default;

    virtual std::string name() const = 0;

    // Rendered header line(s) for one directive, each ending with '\n'.
    virtual std::string render(const Directive& d) const = 0;

    // Shell expression for the 1-based array slot id.
    virtual std::string slot_variable() const = 0;
};

class PbsDialect : public SchedulerDialect {
public:
    std::string name() const override { return "pbs"; }
    std::string render(const Directive& d) const override;
    std::string slot_variable() const override { return "${PBS_ARRAYID}"; }
};

class SlurmDialect : public SchedulerDialect {
public:
    std::string name() const override { return "slurm"; }
    std::string render(const Directive& d) const override;
    std::string slot_variable() const override { return "${SLURM_ARRAY_TASK_ID}"; }
};

std::unique_ptr<SchedulerDialect> make_dialect(SchedulerKind kind);

// Parse "pbs" / "torque" / "slurm" (case-insensitive).
Result<SchedulerKind> parse_scheduler_kind(const std::string& name);
