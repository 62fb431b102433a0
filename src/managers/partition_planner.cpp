#include "partition_planner.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>

Result<JobPlan> plan_partitions(int64_t total_items, int64_t capacity) {
    if (total_items <= 0) {
        return Result<JobPlan>::Err(ErrorKind::InvalidInput,
            fmt::format("Nothing to plan: item count must be positive (got {})", total_items));
    }
    if (capacity <= 0) {
        return Result<JobPlan>::Err(ErrorKind::InvalidInput,
            fmt::format("Array capacity must be positive (got {})", capacity));
    }

    JobPlan plan;
    plan.total_items = total_items;
    plan.capacity = capacity;

    if (total_items > capacity) {
        plan.items_per_slot = ceil_div(total_items, capacity);
        plan.slot_count = ceil_div(total_items, plan.items_per_slot);
    } else {
        plan.items_per_slot = 1;
        plan.slot_count = total_items;
    }

    return Result<JobPlan>::Ok(plan);
}
