#pragma once

#include <cstdint>
#include <vector>
#include <core/types.hpp>

// Manifest lines owned by a 1-based array slot.
//
// Slot k owns lines base - offset for base = k * items_per_slot and offset
// items_per_slot - 1 down to 0, i.e. (k-1)*n+1 .. k*n in file order. Lines
// past total_items belong to the padding of the final partial slot and are
// skipped. Returns an empty list for a non-positive slot id or
// items_per_slot. Never forms k * n for slots beyond the end.
std::vector<int64_t> resolve_slot_lines(int64_t slot_id, int64_t items_per_slot,
                                        int64_t total_items);

// Inverse of resolve_slot_lines: the slot that owns a 1-based manifest line.
int64_t slot_for_line(int64_t line, int64_t items_per_slot);

// Manifest pair for a 1-based line.
Result<ManifestEntry> lookup_line(const std::vector<ManifestEntry>& manifest, int64_t line);

struct SlotItem {
    int64_t line;
    ManifestEntry entry;
};

// Everything slot_id will process, read back through the manifest.
Result<std::vector<SlotItem>> resolve_slot(const std::vector<ManifestEntry>& manifest,
                                           const JobPlan& plan, int64_t slot_id);
