#include "core/meeting.hpp"

#include <algorithm>
#include <chrono>

namespace neetings {

Meeting create_empty_meeting(std::string id, std::string title) {
    const auto now = now_iso8601();
    return Meeting{
        .id = std::move(id),
        .title = title.empty() ? std::string(DEFAULT_MEETING_TITLE) : std::move(title),
        .date = now.substr(0, 10),
        .start_time = {},
        .end_time = {},
        .blocks = {},
        .topic_groups = {},
        .attendee_ids = {},
        .created_at = now,
        .updated_at = now
    };
}

TopicGroup create_topic_group(const std::string& meeting_id,
                              std::string name,
                              std::optional<std::string> color) {
    const auto now = std::chrono::system_clock::now();
    const auto stamp = to_iso8601(now);
    return TopicGroup{
        .id = generate_id(),
        .name = std::move(name),
        .color = std::move(color),
        // Columns are laid out by creation time.
        .order = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()).count(),
        .meeting_id = meeting_id,
        .created_at = stamp,
        .updated_at = stamp
    };
}

void touch(Meeting& meeting) {
    meeting.updated_at = now_iso8601();
}

blocks::Block* find_block(Meeting& meeting, const std::string& block_id) {
    auto it = std::find_if(meeting.blocks.begin(), meeting.blocks.end(),
                           [&](const blocks::Block& b) { return b.id == block_id; });
    return it == meeting.blocks.end() ? nullptr : &*it;
}

const blocks::Block* find_block(const Meeting& meeting, const std::string& block_id) {
    auto it = std::find_if(meeting.blocks.begin(), meeting.blocks.end(),
                           [&](const blocks::Block& b) { return b.id == block_id; });
    return it == meeting.blocks.end() ? nullptr : &*it;
}

const TopicGroup* find_topic_group(const Meeting& meeting, const std::string& group_id) {
    auto it = std::find_if(meeting.topic_groups.begin(), meeting.topic_groups.end(),
                           [&](const TopicGroup& g) { return g.id == group_id; });
    return it == meeting.topic_groups.end() ? nullptr : &*it;
}

std::vector<TopicGroup> sorted_topic_groups(const Meeting& meeting) {
    auto groups = meeting.topic_groups;
    std::sort(groups.begin(), groups.end(), [](const TopicGroup& a, const TopicGroup& b) {
        return a.order != b.order ? a.order < b.order : a.id < b.id;
    });
    return groups;
}

} // namespace neetings
