#include "command_helpers.hpp"
#include "../theme.hpp"
#include <managers/index_resolver.hpp>
#include <managers/manifest.hpp>
#include <managers/run_pipeline.hpp>
#include <iostream>
#include <filesystem>
#include <fmt/format.h>

namespace fs = std::filesystem;

struct LoadedRun {
    RunRecord record;
    std::vector<ManifestEntry> manifest;
};

static Result<LoadedRun> load_run(BaseCLI& cli) {
    RunPipeline pipeline(*cli.config);
    auto record = pipeline.store().load();
    if (record.is_err()) return forward_err<LoadedRun>(record);

    auto manifest = read_manifest(record.value.manifest_path);
    if (manifest.is_err()) return forward_err<LoadedRun>(manifest);

    return Result<LoadedRun>::Ok({record.value, manifest.value});
}

static int do_resolve(BaseCLI& cli, const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cout << theme::fail("Usage: arrayprep resolve <slot> [dir]");
        return 1;
    }
    auto slot = parse_count(args[0]);
    if (!slot) {
        std::cout << theme::fail("Slot must be an integer");
        return 1;
    }
    if (!cli.require_config(dir_arg(args, 1))) return 1;

    auto run = load_run(cli);
    if (run.is_err()) return report_failure(run.kind, run.error);

    auto items = resolve_slot(run.value.manifest, run.value.record.plan, *slot);
    if (items.is_err()) return report_failure(items.kind, items.error);

    std::cout << theme::section(fmt::format("Slot {} of {}", *slot, run.value.record.plan.slot_count));
    for (const auto& item : items.value) {
        std::cout << theme::kv(fmt::format("line {}", item.line), item.entry.input_path);
        std::cout << theme::kv("", theme::dim("-> " + item.entry.output_path));
    }
    return 0;
}

static int do_locate(BaseCLI& cli, const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cout << theme::fail("Usage: arrayprep locate <key> [dir]");
        return 1;
    }
    if (!cli.require_config(dir_arg(args, 1))) return 1;

    auto run = load_run(cli);
    if (run.is_err()) return report_failure(run.kind, run.error);

    const auto& key = args[0];
    const auto& manifest = run.value.manifest;
    for (size_t i = 0; i < manifest.size(); i++) {
        if (fs::path(manifest[i].input_path).filename().string() != key) continue;

        int64_t line = static_cast<int64_t>(i) + 1;
        int64_t slot = slot_for_line(line, run.value.record.plan.items_per_slot);
        const auto& project = cli.config->project();

        std::cout << theme::section(key);
        std::cout << theme::kv("line", std::to_string(line));
        std::cout << theme::kv("slot", std::to_string(slot));
        std::cout << theme::kv("output", manifest[i].output_path);
        std::cout << theme::kv("log", fmt::format("{}/{}_{}.log", project.output_dir, project.name, slot));
        return 0;
    }

    std::cout << theme::fail(fmt::format("'{}' is not in {}", key, run.value.record.manifest_path));
    return 1;
}

void register_slot_commands(BaseCLI& cli) {
    cli.add_command("resolve", do_resolve, "<slot> [dir]", "List the items an array slot processes");
    cli.add_command("locate", do_locate, "<key> [dir]", "Find the slot and log for one item");
}
