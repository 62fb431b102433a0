#include <gtest/gtest.h>
#include <managers/partition_planner.hpp>
#include <managers/index_resolver.hpp>
#include <set>
#include <limits>

static JobPlan must_plan(int64_t items, int64_t capacity) {
    auto r = plan_partitions(items, capacity);
    EXPECT_TRUE(r.is_ok()) << r.error;
    return r.value;
}

TEST(PartitionPlanner, FitsWithinCapacity) {
    auto plan = must_plan(5, 1024);
    EXPECT_EQ(plan.items_per_slot, 1);
    EXPECT_EQ(plan.slot_count, 5);
}

TEST(PartitionPlanner, ExactlyAtCapacity) {
    auto plan = must_plan(1024, 1024);
    EXPECT_EQ(plan.items_per_slot, 1);
    EXPECT_EQ(plan.slot_count, 1024);
}

TEST(PartitionPlanner, PacksTwoPerSlot) {
    auto plan = must_plan(2000, 1024);
    EXPECT_EQ(plan.items_per_slot, 2);
    EXPECT_EQ(plan.slot_count, 1000);

    plan = must_plan(1500, 1024);
    EXPECT_EQ(plan.items_per_slot, 2);
    EXPECT_EQ(plan.slot_count, 750);
}

TEST(PartitionPlanner, FinalSlotIsPartial) {
    auto plan = must_plan(7, 3);
    EXPECT_EQ(plan.items_per_slot, 3);
    EXPECT_EQ(plan.slot_count, 3);
    EXPECT_EQ(plan.total_items, 7);
    EXPECT_EQ(plan.capacity, 3);
}

TEST(PartitionPlanner, RejectsNonPositiveCounts) {
    auto r = plan_partitions(0, 1024);
    EXPECT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::InvalidInput);

    r = plan_partitions(10, 0);
    EXPECT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::InvalidInput);

    r = plan_partitions(-3, 5);
    EXPECT_EQ(r.kind, ErrorKind::InvalidInput);
}

// Every item lands in exactly one slot and no slot exceeds the cap
TEST(PartitionPlanner, CoversEveryItemOnce) {
    for (int64_t capacity : {1, 2, 3, 7, 64, 1024}) {
        for (int64_t items = 1; items <= 300; items++) {
            auto plan = must_plan(items, capacity);
            ASSERT_LE(plan.slot_count, capacity) << items << "/" << capacity;

            std::set<int64_t> seen;
            int64_t assigned = 0;
            for (int64_t slot = 1; slot <= plan.slot_count; slot++) {
                auto lines = resolve_slot_lines(slot, plan.items_per_slot, plan.total_items);
                ASSERT_FALSE(lines.empty()) << "slot " << slot << " is empty";
                for (auto line : lines) {
                    ASSERT_TRUE(seen.insert(line).second) << "line " << line << " twice";
                }
                assigned += static_cast<int64_t>(lines.size());
            }
            ASSERT_EQ(assigned, items);
            ASSERT_EQ(*seen.begin(), 1);
            ASSERT_EQ(*seen.rbegin(), items);
        }
    }
}

TEST(PartitionPlanner, LargestItemCountStaysWithinCapacity) {
    const int64_t total = std::numeric_limits<int64_t>::max();
    auto plan = must_plan(total, 1024);

    EXPECT_GT(plan.items_per_slot, 0);
    EXPECT_GT(plan.slot_count, 0);
    EXPECT_LE(plan.slot_count, 1024);
    EXPECT_EQ(plan.items_per_slot, int64_t{1} << 53);
    EXPECT_EQ(plan.slot_count, 1024);

    // The final slot starts after the full ones and owns the last item
    int64_t final_first = (plan.slot_count - 1) * plan.items_per_slot + 1;
    EXPECT_EQ(slot_for_line(final_first, plan.items_per_slot), plan.slot_count);
    EXPECT_EQ(slot_for_line(final_first - 1, plan.items_per_slot), plan.slot_count - 1);
    EXPECT_EQ(slot_for_line(total, plan.items_per_slot), plan.slot_count);
    EXPECT_TRUE(resolve_slot_lines(plan.slot_count + 1, plan.items_per_slot, total).empty());
    EXPECT_TRUE(resolve_slot_lines(1024 * 1024, plan.items_per_slot, total).empty());
}
