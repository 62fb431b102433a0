#include "command_helpers.hpp"
#include "../theme.hpp"
#include <core/config.hpp>
#include <iostream>

static int do_init(BaseCLI&, const std::vector<std::string>& args) {
    fs::path dir = args.empty() ? fs::current_path() : fs::path(args[0]);
    fs::path path = get_project_config_path(dir);

    if (fs::exists(path)) {
        std::cout << theme::info("Config already exists: " + path.string());
        return 0;
    }

    auto result = create_default_project_config(dir);
    if (result.is_err()) {
        return report_failure(result.kind, result.error);
    }
    std::cout << theme::ok("Created " + path.string());
    std::cout << theme::step("Edit it, then run 'arrayprep prepare'.");
    return 0;
}

void register_setup_commands(BaseCLI& cli) {
    cli.add_command("init", do_init, "[dir]", "Write a starter arrayprep.yaml");
}
