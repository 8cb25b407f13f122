#pragma once

#include "core/block.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace neetings {

/**
 * TopicGroup - a named column on a meeting's board.
 */
struct TopicGroup {
    std::string id;
    std::string name;
    std::optional<std::string> color;
    int64_t order{0};
    std::string meeting_id;
    std::string created_at;
    std::string updated_at;

    bool operator==(const TopicGroup&) const = default;
};

/**
 * Meeting - one set of notes. Blocks are stored unordered; their display
 * order comes from topic_group_id + sort_key.
 */
struct Meeting {
    std::string id;
    std::string title;
    std::string date;
    std::string start_time;
    std::string end_time;
    std::vector<blocks::Block> blocks;
    std::vector<TopicGroup> topic_groups;
    std::vector<std::string> attendee_ids;
    std::string created_at;
    std::string updated_at;

    bool operator==(const Meeting&) const = default;
};

/**
 * Attendee - a person that can be referenced from meetings.
 */
struct Attendee {
    std::string id;
    std::string name;
    std::string email;

    bool operator==(const Attendee&) const = default;
};

inline constexpr const char* DEFAULT_MEETING_TITLE = "Untitled Meeting";

[[nodiscard]] Meeting create_empty_meeting(std::string id, std::string title = DEFAULT_MEETING_TITLE);

[[nodiscard]] TopicGroup create_topic_group(const std::string& meeting_id,
                                            std::string name,
                                            std::optional<std::string> color = std::nullopt);

/**
 * Stamp updated_at with the current time.
 */
void touch(Meeting& meeting);

[[nodiscard]] blocks::Block* find_block(Meeting& meeting, const std::string& block_id);
[[nodiscard]] const blocks::Block* find_block(const Meeting& meeting, const std::string& block_id);

[[nodiscard]] const TopicGroup* find_topic_group(const Meeting& meeting, const std::string& group_id);

/**
 * Topic groups in board order: ascending `order`, ties broken by id.
 */
[[nodiscard]] std::vector<TopicGroup> sorted_topic_groups(const Meeting& meeting);

} // namespace neetings
