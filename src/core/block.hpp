#pragma once

#include "core/sort_key.hpp"
#include "core/types.hpp"

#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace neetings::blocks {

/**
 * BlockKind - the kinds of discussion items a meeting board holds.
 */
enum class BlockKind {
    Text,
    QAndA,
    Research,
    Fact,
    Decision,
    Issue,
    Todo,
    Goal,
    FollowUp,
    Idea,
    Reference
};

inline constexpr BlockKind ALL_KINDS[] = {
    BlockKind::Text, BlockKind::QAndA, BlockKind::Research, BlockKind::Fact,
    BlockKind::Decision, BlockKind::Issue, BlockKind::Todo, BlockKind::Goal,
    BlockKind::FollowUp, BlockKind::Idea, BlockKind::Reference,
};

/**
 * Persisted type name ("textblock", "todoblock", ...).
 */
[[nodiscard]] constexpr std::string_view type_name(BlockKind kind) {
    switch (kind) {
        case BlockKind::Text: return "textblock";
        case BlockKind::QAndA: return "qandablock";
        case BlockKind::Research: return "researchblock";
        case BlockKind::Fact: return "factblock";
        case BlockKind::Decision: return "decisionblock";
        case BlockKind::Issue: return "issueblock";
        case BlockKind::Todo: return "todoblock";
        case BlockKind::Goal: return "goalblock";
        case BlockKind::FollowUp: return "followupblock";
        case BlockKind::Idea: return "ideablock";
        case BlockKind::Reference: return "referenceblock";
    }
    return "unknown";
}

[[nodiscard]] std::optional<BlockKind> parse_kind(std::string_view name);

/**
 * Display label ("Note", "Q&A", ...).
 */
[[nodiscard]] std::string_view label(BlockKind kind);

/**
 * The text fields a block of this kind carries, in display order.
 */
[[nodiscard]] std::span<const std::string_view> fields_for(BlockKind kind);

/**
 * Block - one discussion item on a meeting board.
 *
 * Blocks are ordered within their topic group by sort_key; the group is
 * topic_group_id, with nullopt meaning the default column.
 */
struct Block {
    std::string id;
    BlockKind kind{BlockKind::Text};
    std::map<std::string, std::string> fields;
    bool completed{false};
    std::string created_at;
    GroupId topic_group_id;
    SortKey sort_key;

    bool operator==(const Block&) const = default;
};

/**
 * Create a block with every field of its kind initialised to "". When no
 * sort key is given the block gets SortKey::first().
 */
[[nodiscard]] Block create_block(BlockKind kind,
                                 GroupId topic_group_id = std::nullopt,
                                 std::optional<SortKey> sort_key = std::nullopt);

[[nodiscard]] std::string field_value(const Block& block, std::string_view field);

[[nodiscard]] Block with_field(Block block, std::string_view field, std::string value);

/**
 * Flip completion of a todo block. Other kinds are returned unchanged.
 */
[[nodiscard]] Block toggle_completion(Block block);

/**
 * A block is valid when it has an id, a creation time and a sort key.
 */
[[nodiscard]] bool validate_block(const Block& block);

} // namespace neetings::blocks
