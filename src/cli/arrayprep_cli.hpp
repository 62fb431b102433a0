#pragma once

#include "base_cli.hpp"
#include <string>
#include <vector>

// Forward declarations for command registration
void register_setup_commands(BaseCLI& cli);
void register_plan_commands(BaseCLI& cli);
void register_slot_commands(BaseCLI& cli);
void register_results_commands(BaseCLI& cli);

class ArrayPrepCLI : public BaseCLI {
public:
    ArrayPrepCLI();

private:
    void register_all_commands();
};
