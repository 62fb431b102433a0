#include "base_cli.hpp"
#include "theme.hpp"
#include <iostream>
#include <fmt/format.h>

void BaseCLI::add_command(const std::string& name,
                         CommandHandler handler,
                         const std::string& usage,
                         const std::string& help) {
    commands_[name] = {std::move(handler), usage, help};
}

bool BaseCLI::require_config(const std::string& dir) {
    fs::path project_dir = dir.empty() ? fs::current_path() : fs::path(dir);
    auto result = Config::load(project_dir);
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        std::cout << theme::step("Run 'arrayprep init' to create one.");
        return false;
    }
    config = result.value;
    return true;
}

int BaseCLI::execute_command(const std::string& command, const std::vector<std::string>& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        std::cout << theme::fail("Unknown command: " + command);
        std::cout << theme::step("Type 'arrayprep --help' for available commands.");
        return 1;
    }

    try {
        return it->second.handler(*this, args);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}

void BaseCLI::print_help() const {
    // Group commands by category
    std::vector<std::pair<std::string, std::vector<std::string>>> categories = {
        {"Setup",    {"init"}},
        {"Planning", {"plan", "prepare"}},
        {"Slots",    {"resolve", "locate"}},
        {"Results",  {"validate"}},
    };

    for (const auto& [cat_name, cmd_names] : categories) {
        std::cout << "\n" << theme::color::AMBER << theme::color::BOLD
                  << "  " << cat_name << theme::color::RESET << "\n";

        for (const auto& name : cmd_names) {
            auto it = commands_.find(name);
            if (it == commands_.end()) continue;
            std::cout << theme::color::BLUE
                      << fmt::format("    {:<24}", name + " " + it->second.usage)
                      << theme::color::RESET
                      << theme::color::DIM
                      << it->second.help
                      << theme::color::RESET << "\n";
        }
    }
    std::cout << "\n";
}
