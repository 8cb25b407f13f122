#pragma once

#include "core/drag_reconciler.hpp"
#include "core/meeting.hpp"
#include "core/result.hpp"
#include "session/update_queue.hpp"

#include <QObject>
#include <QString>

#include <optional>
#include <string>

namespace neetings::session {

/**
 * MeetingBoard - the board-level edits of a meeting.
 *
 * Every operation reads the meeting from the queue, changes a copy, and
 * hands the whole meeting back through exactly one queue_update, so a
 * rapid sequence of edits always builds on the previous one. Ordering
 * decisions are delegated to the positioning layer and the reconciler.
 */
class MeetingBoard : public QObject {
    Q_OBJECT

public:
    enum class Direction { Up, Down };
    enum class Side { Left, Right };

    explicit MeetingBoard(MeetingUpdateQueue& queue,
                          ordering::KeyPolicy policy = {},
                          QObject* parent = nullptr);

    /**
     * Grouped, key-sorted blocks of a meeting; empty for unknown meetings.
     */
    [[nodiscard]] ordering::GroupedBlocks board(const std::string& meeting_id) const;

    /**
     * Append a new block of the given kind to the end of a group. The group
     * must be the default column or one of the meeting's topic groups.
     */
    [[nodiscard]] Result<blocks::Block, Error> add_block(const std::string& meeting_id,
                                                         blocks::BlockKind kind,
                                                         const GroupId& group_id = std::nullopt);

    [[nodiscard]] Result<void, Error> set_block_field(const std::string& meeting_id,
                                                      const std::string& block_id,
                                                      const std::string& field,
                                                      std::string value);

    [[nodiscard]] Result<void, Error> toggle_block_completion(const std::string& meeting_id,
                                                              const std::string& block_id);

    /**
     * Remove a block. Siblings keep their keys.
     */
    [[nodiscard]] Result<void, Error> delete_block(const std::string& meeting_id,
                                                   const std::string& block_id);

    /**
     * Keyboard reorder: swap places with the neighbour above or below.
     * Returns ok(false) at the edge of the column.
     */
    [[nodiscard]] Result<bool, Error> move_block(const std::string& meeting_id,
                                                 const std::string& block_id,
                                                 Direction direction);

    [[nodiscard]] Result<TopicGroup, Error> add_topic_group(const std::string& meeting_id,
                                                            std::string name,
                                                            std::optional<std::string> color = std::nullopt);

    /**
     * Swap a column's `order` with its left or right neighbour.
     * Returns ok(false) at the edge of the board.
     */
    [[nodiscard]] Result<bool, Error> swap_topic_groups(const std::string& meeting_id,
                                                        const std::string& group_id,
                                                        Side side);

    /**
     * Remove a group. Its blocks move to the end of the default column,
     * keeping their relative order.
     */
    [[nodiscard]] Result<void, Error> delete_topic_group(const std::string& meeting_id,
                                                         const std::string& group_id);

    void drag_start(ordering::DragSource source);
    void drag_over(std::optional<ordering::DropTarget> target);

    /**
     * Reconcile the drop against the meeting's current board and apply the
     * resulting intent, if any.
     */
    std::optional<ordering::MoveIntent> drag_end(const std::string& meeting_id,
                                                 const std::optional<ordering::DropTarget>& target);

    void drag_cancel();

    [[nodiscard]] const ordering::DragReconciler& reconciler() const noexcept { return reconciler_; }

signals:
    void meetingChanged(const QString& meetingId);

private:
    [[nodiscard]] Result<Meeting, Error> fetch(const std::string& meeting_id) const;
    void commit(Meeting meeting);

    MeetingUpdateQueue& queue_;
    ordering::KeyPolicy policy_;
    ordering::DragReconciler reconciler_;
};

} // namespace neetings::session
