#include "session/meeting_board.hpp"

#include "core/positioning.hpp"
#include "session/logging.hpp"

#include <algorithm>

namespace neetings::session {

namespace {

Error block_not_found(const std::string& block_id) {
    return Error{"block not found: " + block_id, errc::not_found};
}

Error group_not_found(const std::string& group_id) {
    return Error{"topic group not found: " + group_id, errc::not_found};
}

} // namespace

MeetingBoard::MeetingBoard(MeetingUpdateQueue& queue, ordering::KeyPolicy policy, QObject* parent)
    : QObject(parent)
    , queue_(queue)
    , policy_(policy)
    , reconciler_(policy)
{}

Result<Meeting, Error> MeetingBoard::fetch(const std::string& meeting_id) const {
    auto meeting = queue_.get(meeting_id);
    if (!meeting) {
        return Result<Meeting, Error>::err(Error{"meeting not found: " + meeting_id, errc::not_found});
    }
    return Result<Meeting, Error>::ok(std::move(*meeting));
}

void MeetingBoard::commit(Meeting meeting) {
    touch(meeting);
    const auto id = meeting.id;
    queue_.queue_update(id, std::move(meeting));
    emit meetingChanged(QString::fromStdString(id));
}

ordering::GroupedBlocks MeetingBoard::board(const std::string& meeting_id) const {
    auto meeting = queue_.get(meeting_id);
    if (!meeting) return {};
    return ordering::group_and_sort(meeting->blocks);
}

Result<blocks::Block, Error> MeetingBoard::add_block(const std::string& meeting_id,
                                                     blocks::BlockKind kind,
                                                     const GroupId& group_id) {
    auto fetched = fetch(meeting_id);
    if (fetched.is_err()) {
        return Result<blocks::Block, Error>::err(fetched.unwrap_err());
    }
    auto meeting = std::move(fetched).unwrap();

    const auto group = normalize_group_id(group_id);
    if (group && !find_topic_group(meeting, *group)) {
        return Result<blocks::Block, Error>::err(group_not_found(*group));
    }
    auto placement = ordering::key_for_new_block(meeting.blocks, group, policy_);
    auto block = blocks::create_block(kind, group, placement.key);
    meeting.blocks.push_back(block);
    ordering::apply_placement(meeting.blocks, block.id, placement);

    qCDebug(neetingsBoardLog) << "added" << blocks::type_name(kind).data() << "block"
                              << QString::fromStdString(block.id) << "key"
                              << QString::fromStdString(block.sort_key.value());
    commit(std::move(meeting));
    return Result<blocks::Block, Error>::ok(std::move(block));
}

Result<void, Error> MeetingBoard::set_block_field(const std::string& meeting_id,
                                                  const std::string& block_id,
                                                  const std::string& field,
                                                  std::string value) {
    auto fetched = fetch(meeting_id);
    if (fetched.is_err()) {
        return Result<void, Error>::err(fetched.unwrap_err());
    }
    auto meeting = std::move(fetched).unwrap();

    auto* block = find_block(meeting, block_id);
    if (!block) {
        return Result<void, Error>::err(block_not_found(block_id));
    }
    *block = blocks::with_field(std::move(*block), field, std::move(value));
    commit(std::move(meeting));
    return Result<void, Error>::ok();
}

Result<void, Error> MeetingBoard::toggle_block_completion(const std::string& meeting_id,
                                                          const std::string& block_id) {
    auto fetched = fetch(meeting_id);
    if (fetched.is_err()) {
        return Result<void, Error>::err(fetched.unwrap_err());
    }
    auto meeting = std::move(fetched).unwrap();

    auto* block = find_block(meeting, block_id);
    if (!block) {
        return Result<void, Error>::err(block_not_found(block_id));
    }
    *block = blocks::toggle_completion(std::move(*block));
    commit(std::move(meeting));
    return Result<void, Error>::ok();
}

Result<void, Error> MeetingBoard::delete_block(const std::string& meeting_id,
                                               const std::string& block_id) {
    auto fetched = fetch(meeting_id);
    if (fetched.is_err()) {
        return Result<void, Error>::err(fetched.unwrap_err());
    }
    auto meeting = std::move(fetched).unwrap();

    const auto before = meeting.blocks.size();
    std::erase_if(meeting.blocks, [&](const blocks::Block& b) { return b.id == block_id; });
    if (meeting.blocks.size() == before) {
        return Result<void, Error>::err(block_not_found(block_id));
    }
    commit(std::move(meeting));
    return Result<void, Error>::ok();
}

Result<bool, Error> MeetingBoard::move_block(const std::string& meeting_id,
                                             const std::string& block_id,
                                             Direction direction) {
    auto fetched = fetch(meeting_id);
    if (fetched.is_err()) {
        return Result<bool, Error>::err(fetched.unwrap_err());
    }
    auto meeting = std::move(fetched).unwrap();

    const auto* block = find_block(meeting, block_id);
    if (!block) {
        return Result<bool, Error>::err(block_not_found(block_id));
    }

    const auto column = ordering::blocks_for_group(meeting.blocks, block->topic_group_id);
    const auto it = std::find_if(column.begin(), column.end(),
                                 [&](const blocks::Block& b) { return b.id == block_id; });
    const auto index = static_cast<std::size_t>(it - column.begin());

    if ((direction == Direction::Up && index == 0) ||
        (direction == Direction::Down && index + 1 >= column.size())) {
        return Result<bool, Error>::ok(false);
    }

    const auto target = direction == Direction::Up ? index - 1 : index + 1;
    auto placement = ordering::intra_column_key(column, index, target, policy_);
    ordering::apply_placement(meeting.blocks, block_id, placement);
    commit(std::move(meeting));
    return Result<bool, Error>::ok(true);
}

Result<TopicGroup, Error> MeetingBoard::add_topic_group(const std::string& meeting_id,
                                                        std::string name,
                                                        std::optional<std::string> color) {
    auto fetched = fetch(meeting_id);
    if (fetched.is_err()) {
        return Result<TopicGroup, Error>::err(fetched.unwrap_err());
    }
    auto meeting = std::move(fetched).unwrap();

    auto group = create_topic_group(meeting_id, std::move(name), std::move(color));
    // New columns go to the right, even when created within one clock tick.
    for (const auto& existing : meeting.topic_groups) {
        group.order = std::max(group.order, existing.order + 1);
    }
    meeting.topic_groups.push_back(group);
    commit(std::move(meeting));
    return Result<TopicGroup, Error>::ok(std::move(group));
}

Result<bool, Error> MeetingBoard::swap_topic_groups(const std::string& meeting_id,
                                                    const std::string& group_id,
                                                    Side side) {
    auto fetched = fetch(meeting_id);
    if (fetched.is_err()) {
        return Result<bool, Error>::err(fetched.unwrap_err());
    }
    auto meeting = std::move(fetched).unwrap();

    auto sorted = sorted_topic_groups(meeting);
    const auto it = std::find_if(sorted.begin(), sorted.end(),
                                 [&](const TopicGroup& g) { return g.id == group_id; });
    if (it == sorted.end()) {
        return Result<bool, Error>::err(group_not_found(group_id));
    }
    const auto index = static_cast<std::size_t>(it - sorted.begin());
    if ((side == Side::Left && index == 0) ||
        (side == Side::Right && index + 1 >= sorted.size())) {
        return Result<bool, Error>::ok(false);
    }
    const auto other = side == Side::Left ? index - 1 : index + 1;

    std::vector<int64_t> orders;
    for (const auto& g : sorted) orders.push_back(g.order);
    // Swapping two equal values would leave the board as it was.
    const bool distinct = std::adjacent_find(orders.begin(), orders.end()) == orders.end();

    std::swap(sorted[index], sorted[other]);
    const auto stamp = now_iso8601();
    for (std::size_t i = 0; i < sorted.size(); ++i) {
        const auto order = distinct ? orders[i] : static_cast<int64_t>(i);
        for (auto& group : meeting.topic_groups) {
            if (group.id != sorted[i].id || group.order == order) continue;
            group.order = order;
            group.updated_at = stamp;
        }
    }

    commit(std::move(meeting));
    return Result<bool, Error>::ok(true);
}

Result<void, Error> MeetingBoard::delete_topic_group(const std::string& meeting_id,
                                                     const std::string& group_id) {
    auto fetched = fetch(meeting_id);
    if (fetched.is_err()) {
        return Result<void, Error>::err(fetched.unwrap_err());
    }
    auto meeting = std::move(fetched).unwrap();

    if (!find_topic_group(meeting, group_id)) {
        return Result<void, Error>::err(group_not_found(group_id));
    }
    std::erase_if(meeting.topic_groups, [&](const TopicGroup& g) { return g.id == group_id; });

    // Orphans join the default column one by one, each after the last.
    const auto orphans = ordering::blocks_for_group(meeting.blocks, group_id);
    for (const auto& orphan : orphans) {
        auto placement = ordering::key_for_new_block(meeting.blocks, std::nullopt, policy_);
        ordering::apply_placement(meeting.blocks, orphan.id, placement,
                                  std::make_optional<GroupId>(std::nullopt));
    }

    qCInfo(neetingsBoardLog) << "deleted topic group" << QString::fromStdString(group_id)
                             << "-" << orphans.size() << "blocks moved to the default column";
    commit(std::move(meeting));
    return Result<void, Error>::ok();
}

void MeetingBoard::drag_start(ordering::DragSource source) {
    reconciler_.drag_start(std::move(source));
}

void MeetingBoard::drag_over(std::optional<ordering::DropTarget> target) {
    reconciler_.drag_over(std::move(target));
}

std::optional<ordering::MoveIntent> MeetingBoard::drag_end(
    const std::string& meeting_id, const std::optional<ordering::DropTarget>& target) {
    auto meeting = queue_.get(meeting_id);
    if (!meeting) {
        reconciler_.cancel();
        qCWarning(neetingsBoardLog) << "drop on unknown meeting" << QString::fromStdString(meeting_id);
        return std::nullopt;
    }

    auto intent = reconciler_.drag_end(target, ordering::group_and_sort(meeting->blocks));
    if (!intent) {
        return std::nullopt;
    }

    if (!ordering::apply_move(*meeting, *intent)) {
        return std::nullopt;
    }
    if (!intent->renumbered.empty()) {
        qCInfo(neetingsBoardLog) << "key space exhausted, renumbered"
                                 << intent->renumbered.size() << "siblings";
    }
    commit(std::move(*meeting));
    return intent;
}

void MeetingBoard::drag_cancel() {
    reconciler_.cancel();
}

} // namespace neetings::session
