#include "command_helpers.hpp"
#include "../theme.hpp"
#include <managers/run_pipeline.hpp>
#include <iostream>
#include <fmt/format.h>

static int do_validate(BaseCLI& cli, const std::vector<std::string>& args) {
    if (!cli.require_config(dir_arg(args, 0))) return 1;

    RunPipeline pipeline(*cli.config);
    auto result = pipeline.validate();
    if (result.is_err()) {
        return report_failure(result.kind, result.error);
    }

    const auto& report = result.value;
    std::cout << theme::section("Artifacts");
    if (report.artifacts.empty()) {
        std::cout << theme::info("none");
    }
    for (const auto& a : report.artifacts) {
        std::cout << theme::ok(fmt::format("{} ({})", a.label, a.kind));
        for (const auto& f : a.files) {
            std::cout << theme::kv(f.type, f.path);
        }
    }

    if (!report.success()) {
        std::cout << theme::section("Errors");
        for (const auto& e : report.errors) {
            std::cout << theme::fail(e);
        }
    }

    std::cout << "\n" << theme::info("Report written to " + pipeline.store().report_path().string());
    return report.success() ? 0 : 1;
}

void register_results_commands(BaseCLI& cli) {
    cli.add_command("validate", do_validate, "[dir]", "Check merge outputs and write the report");
}
