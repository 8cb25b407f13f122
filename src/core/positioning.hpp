#pragma once

#include "core/block.hpp"
#include "core/sort_key.hpp"
#include "core/types.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace neetings::ordering {

/**
 * Bounds on generated keys. A key that would need more than max_length
 * digits counts as exhausted and triggers renumbering of the smallest
 * neighbouring run of siblings.
 */
struct KeyPolicy {
    std::size_t max_length = SortKey::DEFAULT_MAX_LENGTH;
};

struct KeyAssignment {
    std::string item_id;
    SortKey sort_key;

    bool operator==(const KeyAssignment&) const = default;
};

/**
 * The outcome of a key recompute: the key for the placed item and, only on
 * the exhaustion path, the sibling keys that had to be rewritten.
 */
struct KeyPlacement {
    SortKey key;
    std::vector<KeyAssignment> renumbered;

    [[nodiscard]] bool renumbers_siblings() const noexcept { return !renumbered.empty(); }
};

/**
 * Blocks per topic group, each group sorted by key. The default column is
 * the nullopt entry.
 */
using GroupedBlocks = std::map<GroupId, std::vector<blocks::Block>>;

/**
 * Sort by key; equal keys fall back to id so the order is deterministic.
 */
void sort_by_key(std::vector<blocks::Block>& items);

[[nodiscard]] std::vector<blocks::Block> blocks_for_group(
    std::span<const blocks::Block> all_blocks, const GroupId& group_id);

[[nodiscard]] GroupedBlocks group_and_sort(std::span<const blocks::Block> all_blocks);

/**
 * Key for an item inserted into gap `gap` of `siblings` (sorted, not
 * containing the item itself). Gap 0 is before the first sibling, gap n
 * after the last.
 */
[[nodiscard]] KeyPlacement place_at(std::span<const blocks::Block> siblings,
                                    std::size_t gap,
                                    const KeyPolicy& policy = {});

/**
 * Key that puts `moving_id` at `target_index` of its group. `group_items`
 * is the group sorted by key; the moving item may or may not be part of it.
 */
[[nodiscard]] KeyPlacement key_for_position(std::span<const blocks::Block> group_items,
                                            std::size_t target_index,
                                            std::string_view moving_id,
                                            const KeyPolicy& policy = {});

/**
 * Move within one group: the item at from_index ends up at to_index.
 * Throws std::out_of_range if from_index is not an index of group_items.
 */
[[nodiscard]] KeyPlacement intra_column_key(std::span<const blocks::Block> group_items,
                                            std::size_t from_index,
                                            std::size_t to_index,
                                            const KeyPolicy& policy = {});

/**
 * Move into another group, in front of the item at target_index. A missing
 * index, an index past the end, or the last item's index appends.
 */
[[nodiscard]] KeyPlacement inter_column_key(std::span<const blocks::Block> target_items,
                                            std::optional<std::size_t> target_index,
                                            const KeyPolicy& policy = {});

[[nodiscard]] KeyPlacement append_key(std::span<const blocks::Block> group_items,
                                      const KeyPolicy& policy = {});

/**
 * Key placing a new block last in its group.
 */
[[nodiscard]] KeyPlacement key_for_new_block(std::span<const blocks::Block> all_blocks,
                                             const GroupId& group_id,
                                             const KeyPolicy& policy = {});

/**
 * Write a placement into `all_blocks`: the item gets the new key (and group
 * if given), renumbered siblings get theirs. Returns false if the item is
 * not present.
 */
bool apply_placement(std::vector<blocks::Block>& all_blocks,
                     const std::string& item_id,
                     const KeyPlacement& placement,
                     const std::optional<GroupId>& new_group = std::nullopt);

} // namespace neetings::ordering
