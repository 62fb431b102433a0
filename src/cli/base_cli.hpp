#pragma once

#include <string>
#include <vector>
#include <map>
#include <functional>
#include <optional>
#include <core/config.hpp>

class BaseCLI {
public:
    BaseCLI() = default;
    virtual ~BaseCLI() = default;

    // Handlers return the process exit code.
    using CommandHandler = std::function<int(BaseCLI&, const std::vector<std::string>&)>;

    void add_command(const std::string& name,
                    CommandHandler handler,
                    const std::string& usage,
                    const std::string& help);

    // Load arrayprep.yaml from dir (current directory if empty) into `config`.
    bool require_config(const std::string& dir = "");

    int execute_command(const std::string& command, const std::vector<std::string>& args);
    void print_help() const;

    // Public state
    std::optional<Config> config;

protected:
    struct CommandEntry {
        CommandHandler handler;
        std::string usage;
        std::string help;
    };
    std::map<std::string, CommandEntry> commands_;
};
