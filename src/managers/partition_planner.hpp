#pragma once

#include <cstdint>
#include <core/types.hpp>

// Pack total_items work items into at most `capacity` array slots.
//
// If the items fit (total_items <= capacity) every slot gets one item.
// Otherwise items_per_slot = ceil(total_items / capacity) and
// slot_count = ceil(total_items / items_per_slot), so 2000 items under a
// 1024 cap become 1000 slots of 2 and 1500 items become 750 slots of 2.
// Fails with InvalidInput for non-positive counts.
Result<JobPlan> plan_partitions(int64_t total_items, int64_t capacity);
