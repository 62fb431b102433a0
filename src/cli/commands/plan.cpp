#include "command_helpers.hpp"
#include "../theme.hpp"
#include <core/constants.hpp>
#include <core/time_utils.hpp>
#include <managers/partition_planner.hpp>
#include <managers/run_pipeline.hpp>
#include <iostream>
#include <fmt/format.h>

static int do_plan(BaseCLI&, const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cout << theme::fail("Usage: arrayprep plan <items> [capacity]");
        return 1;
    }

    auto items = parse_count(args[0]);
    auto capacity = args.size() > 1 ? parse_count(args[1])
                                    : std::optional<int64_t>(MAX_ARRAY_SLOTS);
    if (!items || !capacity) {
        std::cout << theme::fail("Counts must be integers");
        return 1;
    }

    auto plan = plan_partitions(*items, *capacity);
    if (plan.is_err()) {
        return report_failure(plan.kind, plan.error);
    }

    std::cout << theme::section("Array plan");
    print_plan(plan.value);
    return 0;
}

static int do_prepare(BaseCLI& cli, const std::vector<std::string>& args) {
    if (!cli.require_config(dir_arg(args, 0))) return 1;

    const auto& project = cli.config->project();
    std::cout << theme::section("Preparing " + project.name);

    RunPipeline pipeline(*cli.config);
    auto result = pipeline.prepare([](const std::string& msg) {
        std::cout << theme::info(msg);
    });
    if (result.is_err()) {
        return report_failure(result.kind, result.error);
    }

    std::cout << "\n";
    print_plan(result.value.plan);
    std::cout << theme::kv("scheduler", result.value.scheduler);

    const auto& array = cli.config->array();
    const auto& merge = cli.config->merge();
    std::cout << theme::kv("slot walltime", fmt::format("{} ({})", array.walltime,
                           format_duration(walltime_seconds(array.walltime))));
    std::cout << theme::kv("merge walltime", fmt::format("{} ({})", merge.walltime,
                           format_duration(walltime_seconds(merge.walltime))));
    std::cout << "\n" << theme::ok("Submit " + result.value.array_script);
    std::cout << theme::ok(fmt::format("Then, after it finishes, {}", result.value.merge_script));
    return 0;
}

void register_plan_commands(BaseCLI& cli) {
    cli.add_command("plan", do_plan, "<items> [capacity]", "Show how items pack into array slots");
    cli.add_command("prepare", do_prepare, "[dir]", "Write manifest, array and merge scripts");
}
