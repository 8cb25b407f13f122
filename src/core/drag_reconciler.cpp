#include "core/drag_reconciler.hpp"

#include <utility>

namespace neetings::ordering {

namespace {

struct Location {
    GroupId group_id;
    std::size_t index;
};

std::optional<Location> locate(const GroupedBlocks& snapshot, const std::string& item_id) {
    for (const auto& [group_id, items] : snapshot) {
        for (std::size_t i = 0; i < items.size(); ++i) {
            if (items[i].id == item_id) {
                return Location{group_id, i};
            }
        }
    }
    return std::nullopt;
}

const std::vector<blocks::Block>& items_of(const GroupedBlocks& snapshot, const GroupId& group_id) {
    static const std::vector<blocks::Block> empty;
    auto it = snapshot.find(normalize_group_id(group_id));
    return it == snapshot.end() ? empty : it->second;
}

MoveIntent make_intent(const std::string& item_id, KeyPlacement placement,
                       bool changes_group, GroupId group_id) {
    return MoveIntent{
        .item_id = item_id,
        .sort_key = std::move(placement.key),
        .changes_group = changes_group,
        .group_id = std::move(group_id),
        .renumbered = std::move(placement.renumbered)
    };
}

} // namespace

void DragReconciler::drag_start(DragSource source) {
    source.group_id = normalize_group_id(source.group_id);
    active_ = std::move(source);
    hovered_.reset();
}

void DragReconciler::drag_over(std::optional<DropTarget> target) {
    if (!active_) return;
    hovered_ = std::move(target);
}

std::optional<MoveIntent> DragReconciler::drag_end(const std::optional<DropTarget>& target,
                                                   const GroupedBlocks& snapshot) {
    auto source = std::exchange(active_, std::nullopt);
    hovered_.reset();

    if (!source || !target) {
        return std::nullopt;
    }
    return reconcile(*source, *target, snapshot);
}

void DragReconciler::cancel() noexcept {
    active_.reset();
    hovered_.reset();
}

std::optional<MoveIntent> DragReconciler::reconcile(const DragSource& source,
                                                    const DropTarget& target,
                                                    const GroupedBlocks& snapshot) const {
    // The snapshot is authoritative for where the moving item sits now.
    const auto from = locate(snapshot, source.item_id);
    if (!from) {
        return std::nullopt;
    }

    if (target.kind == DropKind::Group) {
        const auto target_group = normalize_group_id(target.group_id);
        if (target_group == from->group_id) {
            return std::nullopt;
        }
        auto placement = append_key(items_of(snapshot, target_group), policy_);
        return make_intent(source.item_id, std::move(placement), true, target_group);
    }

    if (target.item_id == source.item_id) {
        return std::nullopt;
    }
    const auto over = locate(snapshot, target.item_id);
    if (!over) {
        return std::nullopt;
    }

    if (over->group_id == from->group_id) {
        const auto& items = items_of(snapshot, from->group_id);
        auto placement = intra_column_key(items, from->index, over->index, policy_);
        return make_intent(source.item_id, std::move(placement), false, from->group_id);
    }

    auto placement = inter_column_key(items_of(snapshot, over->group_id), over->index, policy_);
    return make_intent(source.item_id, std::move(placement), true, over->group_id);
}

bool apply_move(Meeting& meeting, const MoveIntent& intent) {
    const KeyPlacement placement{intent.sort_key, intent.renumbered};
    const auto new_group = intent.changes_group ? std::make_optional<GroupId>(intent.group_id)
                                                : std::optional<GroupId>{};
    return apply_placement(meeting.blocks, intent.item_id, placement, new_group);
}

} // namespace neetings::ordering
