#include "index_resolver.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>

std::vector<int64_t> resolve_slot_lines(int64_t slot_id, int64_t items_per_slot,
                                        int64_t total_items) {
    std::vector<int64_t> lines;
    if (slot_id <= 0 || items_per_slot <= 0 || total_items <= 0) return lines;

    // Slots past the last item own nothing; checked before multiplying
    if (slot_id - 1 > (total_items - 1) / items_per_slot) return lines;

    int64_t first = (slot_id - 1) * items_per_slot + 1;
    int64_t owned = std::min(items_per_slot, total_items - first + 1);
    for (int64_t i = 0; i < owned; i++) {
        lines.push_back(first + i);
    }
    return lines;
}

int64_t slot_for_line(int64_t line, int64_t items_per_slot) {
    if (line <= 0 || items_per_slot <= 0) return 0;
    return ceil_div(line, items_per_slot);
}

Result<ManifestEntry> lookup_line(const std::vector<ManifestEntry>& manifest, int64_t line) {
    if (line <= 0 || line > static_cast<int64_t>(manifest.size())) {
        return Result<ManifestEntry>::Err(ErrorKind::InvalidInput,
            fmt::format("Line {} is outside the manifest (1-{})", line, manifest.size()));
    }
    return Result<ManifestEntry>::Ok(manifest[line - 1]);
}

Result<std::vector<SlotItem>> resolve_slot(const std::vector<ManifestEntry>& manifest,
                                           const JobPlan& plan, int64_t slot_id) {
    if (slot_id <= 0 || slot_id > plan.slot_count) {
        return Result<std::vector<SlotItem>>::Err(ErrorKind::InvalidInput,
            fmt::format("Slot {} is outside the array (1-{})", slot_id, plan.slot_count));
    }
    if (static_cast<int64_t>(manifest.size()) != plan.total_items) {
        return Result<std::vector<SlotItem>>::Err(ErrorKind::InvalidInput,
            fmt::format("Manifest has {} lines but the plan expects {}",
                        manifest.size(), plan.total_items));
    }

    std::vector<SlotItem> items;
    for (int64_t line : resolve_slot_lines(slot_id, plan.items_per_slot, plan.total_items)) {
        auto entry = lookup_line(manifest, line);
        if (entry.is_err()) return forward_err<std::vector<SlotItem>>(entry);
        items.push_back({line, entry.value});
    }
    return Result<std::vector<SlotItem>>::Ok(std::move(items));
}
