#include "core/positioning.hpp"

#include <algorithm>
#include <stdexcept>

namespace neetings::ordering {

using blocks::Block;

namespace {

bool ordered(const SortKey& lo, const SortKey& hi) {
    return lo.is_empty() || hi.is_empty() || lo < hi;
}

// Exhaustion fallback. Rewrites the smallest contiguous run of siblings next
// to the gap so that the run plus the placed item fit between the run's
// outer neighbours. For equal widths, runs reaching fewer siblings to the
// left of the gap are tried first.
KeyPlacement renumber_run(std::span<const Block> siblings, std::size_t gap, const KeyPolicy& policy) {
    const auto n = siblings.size();

    for (std::size_t width = 1; width <= n; ++width) {
        for (std::size_t left = 0; left <= width; ++left) {
            const auto right = width - left;
            if (left > gap || right > n - gap) continue;

            const auto first = gap - left;
            const auto last = gap + right;
            const SortKey lower = first > 0 ? siblings[first - 1].sort_key : SortKey{};
            const SortKey upper = last < n ? siblings[last].sort_key : SortKey{};
            if (!ordered(lower, upper)) continue;

            auto keys = SortKey::spread(lower, upper, width + 1, policy.max_length);
            if (!keys) continue;

            KeyPlacement placement;
            std::size_t k = 0;
            for (auto i = first; i < gap; ++i) {
                placement.renumbered.push_back({siblings[i].id, (*keys)[k++]});
            }
            placement.key = (*keys)[k++];
            for (auto i = gap; i < last; ++i) {
                placement.renumbered.push_back({siblings[i].id, (*keys)[k++]});
            }
            return placement;
        }
    }

    throw std::length_error("Sort key policy too tight: " + std::to_string(n + 1) +
                            " items do not fit in " + std::to_string(policy.max_length) +
                            " digits");
}

std::vector<Block> without_item(std::span<const Block> items, std::string_view id) {
    std::vector<Block> out;
    out.reserve(items.size());
    for (const auto& item : items) {
        if (item.id != id) out.push_back(item);
    }
    return out;
}

} // namespace

void sort_by_key(std::vector<Block>& items) {
    std::sort(items.begin(), items.end(), [](const Block& a, const Block& b) {
        if (a.sort_key != b.sort_key) return a.sort_key < b.sort_key;
        return a.id < b.id;
    });
}

std::vector<Block> blocks_for_group(std::span<const Block> all_blocks, const GroupId& group_id) {
    const auto wanted = normalize_group_id(group_id);
    std::vector<Block> out;
    for (const auto& block : all_blocks) {
        if (normalize_group_id(block.topic_group_id) == wanted) {
            out.push_back(block);
        }
    }
    sort_by_key(out);
    return out;
}

GroupedBlocks group_and_sort(std::span<const Block> all_blocks) {
    GroupedBlocks grouped;
    for (const auto& block : all_blocks) {
        grouped[normalize_group_id(block.topic_group_id)].push_back(block);
    }
    for (auto& [group, items] : grouped) {
        sort_by_key(items);
    }
    return grouped;
}

KeyPlacement place_at(std::span<const Block> siblings, std::size_t gap, const KeyPolicy& policy) {
    gap = std::min(gap, siblings.size());
    const SortKey lo = gap > 0 ? siblings[gap - 1].sort_key : SortKey{};
    const SortKey hi = gap < siblings.size() ? siblings[gap].sort_key : SortKey{};

    // Equal neighbour keys (possible in imported data) are treated like
    // exhausted ones.
    if (ordered(lo, hi)) {
        if (auto key = SortKey::between_bounded(lo, hi, policy.max_length)) {
            return KeyPlacement{std::move(*key), {}};
        }
    }
    return renumber_run(siblings, gap, policy);
}

KeyPlacement key_for_position(std::span<const Block> group_items,
                              std::size_t target_index,
                              std::string_view moving_id,
                              const KeyPolicy& policy) {
    const auto siblings = without_item(group_items, moving_id);
    return place_at(siblings, target_index, policy);
}

KeyPlacement intra_column_key(std::span<const Block> group_items,
                              std::size_t from_index,
                              std::size_t to_index,
                              const KeyPolicy& policy) {
    if (from_index >= group_items.size()) {
        throw std::out_of_range("intra_column_key: from_index " + std::to_string(from_index) +
                                " outside group of " + std::to_string(group_items.size()));
    }
    return key_for_position(group_items, to_index, group_items[from_index].id, policy);
}

KeyPlacement inter_column_key(std::span<const Block> target_items,
                              std::optional<std::size_t> target_index,
                              const KeyPolicy& policy) {
    const auto n = target_items.size();
    // Dropping onto the last card of a column means "end of column".
    if (n == 0 || !target_index || *target_index >= n - 1) {
        return place_at(target_items, n, policy);
    }
    return place_at(target_items, *target_index, policy);
}

KeyPlacement append_key(std::span<const Block> group_items, const KeyPolicy& policy) {
    return place_at(group_items, group_items.size(), policy);
}

KeyPlacement key_for_new_block(std::span<const Block> all_blocks,
                               const GroupId& group_id,
                               const KeyPolicy& policy) {
    return append_key(blocks_for_group(all_blocks, group_id), policy);
}

bool apply_placement(std::vector<Block>& all_blocks,
                     const std::string& item_id,
                     const KeyPlacement& placement,
                     const std::optional<GroupId>& new_group) {
    auto it = std::find_if(all_blocks.begin(), all_blocks.end(),
                           [&](const Block& b) { return b.id == item_id; });
    if (it == all_blocks.end()) {
        return false;
    }

    it->sort_key = placement.key;
    if (new_group) {
        it->topic_group_id = normalize_group_id(*new_group);
    }

    for (const auto& assignment : placement.renumbered) {
        for (auto& block : all_blocks) {
            if (block.id == assignment.item_id) {
                block.sort_key = assignment.sort_key;
                break;
            }
        }
    }
    return true;
}

} // namespace neetings::ordering
