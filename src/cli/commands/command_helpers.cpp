#include "command_helpers.hpp"
#include "../theme.hpp"
#include <iostream>
#include <fmt/format.h>

std::string dir_arg(const std::vector<std::string>& args, size_t i) {
    return args.size() > i ? args[i] : "";
}

std::optional<int64_t> parse_count(const std::string& s) {
    try {
        size_t used = 0;
        long long v = std::stoll(s, &used);
        if (used != s.size()) return std::nullopt;
        return static_cast<int64_t>(v);
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
}

int report_failure(ErrorKind kind, const std::string& error) {
    std::cout << theme::fail(fmt::format("{}: {}", error_kind_name(kind), error));
    return 1;
}

void print_plan(const JobPlan& plan) {
    std::cout << theme::kv("items", std::to_string(plan.total_items));
    std::cout << theme::kv("capacity", std::to_string(plan.capacity));
    std::cout << theme::kv("items/slot", std::to_string(plan.items_per_slot));
    std::cout << theme::kv("slots", std::to_string(plan.slot_count));

    int64_t last = plan.total_items - (plan.slot_count - 1) * plan.items_per_slot;
    if (last != plan.items_per_slot) {
        std::cout << theme::kv("final slot", fmt::format("{} item(s)", last));
    }
}
