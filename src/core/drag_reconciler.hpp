#pragma once

#include "core/meeting.hpp"
#include "core/positioning.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace neetings::ordering {

/**
 * Where a drag started. index is the rendering layer's view of the item's
 * position; reconciliation re-resolves it against the snapshot.
 */
struct DragSource {
    std::string item_id;
    GroupId group_id;
    std::size_t index{0};
};

enum class DropKind {
    Item,   // dropped onto another card
    Group   // dropped onto a column, not onto a card
};

struct DropTarget {
    DropKind kind{DropKind::Item};
    std::string item_id;
    GroupId group_id;
    std::optional<std::size_t> index;

    [[nodiscard]] static DropTarget on_item(std::string item_id,
                                            GroupId group_id,
                                            std::optional<std::size_t> index = std::nullopt) {
        return DropTarget{DropKind::Item, std::move(item_id), normalize_group_id(group_id), index};
    }

    [[nodiscard]] static DropTarget on_group(GroupId group_id) {
        return DropTarget{DropKind::Group, {}, normalize_group_id(group_id), std::nullopt};
    }

    bool operator==(const DropTarget&) const = default;
};

/**
 * The single mutation a completed drag produces: a new key for the moving
 * item, optionally a new group, and (on the exhaustion path only) rewritten
 * sibling keys.
 */
struct MoveIntent {
    std::string item_id;
    SortKey sort_key;
    bool changes_group{false};
    GroupId group_id;
    std::vector<KeyAssignment> renumbered;
};

/**
 * DragReconciler - turns a drag gesture into at most one MoveIntent.
 *
 * Idle --drag_start--> Dragging --drag_end/cancel--> Idle. drag_over only
 * remembers the hovered target for feedback. The reconciler never touches
 * storage; the caller hands the intent to the update queue.
 */
class DragReconciler {
public:
    enum class State { Idle, Dragging };

    explicit DragReconciler(KeyPolicy policy = {}) : policy_(policy) {}

    /**
     * Begin a drag. A drag already in progress is abandoned.
     */
    void drag_start(DragSource source);

    void drag_over(std::optional<DropTarget> target);

    /**
     * Finish the drag against the current grouped snapshot. Returns the
     * mutation to apply, or nullopt for every no-op case (no target, self,
     * own column, stale ids, no drag in progress).
     */
    [[nodiscard]] std::optional<MoveIntent> drag_end(const std::optional<DropTarget>& target,
                                                     const GroupedBlocks& snapshot);

    /**
     * Abort (escape key, drop outside any target). Emits nothing.
     */
    void cancel() noexcept;

    [[nodiscard]] State state() const noexcept {
        return active_ ? State::Dragging : State::Idle;
    }
    [[nodiscard]] const std::optional<DragSource>& active() const noexcept { return active_; }
    [[nodiscard]] const std::optional<DropTarget>& hovered() const noexcept { return hovered_; }

private:
    [[nodiscard]] std::optional<MoveIntent> reconcile(const DragSource& source,
                                                      const DropTarget& target,
                                                      const GroupedBlocks& snapshot) const;

    KeyPolicy policy_;
    std::optional<DragSource> active_;
    std::optional<DropTarget> hovered_;
};

/**
 * Apply an intent to a meeting. Returns false when the moving block is no
 * longer part of the meeting.
 */
bool apply_move(Meeting& meeting, const MoveIntent& intent);

} // namespace neetings::ordering
