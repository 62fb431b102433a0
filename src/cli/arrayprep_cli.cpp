#include "arrayprep_cli.hpp"

ArrayPrepCLI::ArrayPrepCLI() : BaseCLI() {
    register_all_commands();
}

void ArrayPrepCLI::register_all_commands() {
    register_setup_commands(*this);
    register_plan_commands(*this);
    register_slot_commands(*this);
    register_results_commands(*this);
}
