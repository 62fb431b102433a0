#pragma once

#include "../base_cli.hpp"
#include <core/types.hpp>
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

// Optional trailing [dir] argument at position i.
std::string dir_arg(const std::vector<std::string>& args, size_t i);

// Strict positive integer parse for command arguments.
std::optional<int64_t> parse_count(const std::string& s);

// Print a hard failure with its category, returning the exit code.
int report_failure(ErrorKind kind, const std::string& error);

// Print a JobPlan as a summary panel.
void print_plan(const JobPlan& plan);
