#include "core/block.hpp"

#include <array>

namespace neetings::blocks {

namespace {

using namespace std::string_view_literals;

constexpr std::array TEXT_FIELDS{"text"sv};
constexpr std::array QANDA_FIELDS{"question"sv, "answer"sv};
constexpr std::array RESEARCH_FIELDS{"topic"sv, "result"sv};
constexpr std::array FACT_FIELDS{"fact"sv};
constexpr std::array DECISION_FIELDS{"decision"sv};
constexpr std::array ISSUE_FIELDS{"issue"sv};
constexpr std::array TODO_FIELDS{"todo"sv};
constexpr std::array GOAL_FIELDS{"goal"sv};
constexpr std::array FOLLOWUP_FIELDS{"followup"sv};
constexpr std::array IDEA_FIELDS{"idea"sv};
constexpr std::array REFERENCE_FIELDS{"reference"sv};

} // namespace

std::optional<BlockKind> parse_kind(std::string_view name) {
    for (auto kind : ALL_KINDS) {
        if (type_name(kind) == name) return kind;
    }
    return std::nullopt;
}

std::string_view label(BlockKind kind) {
    switch (kind) {
        case BlockKind::Text: return "Note";
        case BlockKind::QAndA: return "Q&A";
        case BlockKind::Research: return "Research";
        case BlockKind::Fact: return "Fact";
        case BlockKind::Decision: return "Decision";
        case BlockKind::Issue: return "Issue";
        case BlockKind::Todo: return "TODO";
        case BlockKind::Goal: return "Goal";
        case BlockKind::FollowUp: return "Follow-up";
        case BlockKind::Idea: return "Idea";
        case BlockKind::Reference: return "Reference";
    }
    return "Unknown";
}

std::span<const std::string_view> fields_for(BlockKind kind) {
    switch (kind) {
        case BlockKind::Text: return TEXT_FIELDS;
        case BlockKind::QAndA: return QANDA_FIELDS;
        case BlockKind::Research: return RESEARCH_FIELDS;
        case BlockKind::Fact: return FACT_FIELDS;
        case BlockKind::Decision: return DECISION_FIELDS;
        case BlockKind::Issue: return ISSUE_FIELDS;
        case BlockKind::Todo: return TODO_FIELDS;
        case BlockKind::Goal: return GOAL_FIELDS;
        case BlockKind::FollowUp: return FOLLOWUP_FIELDS;
        case BlockKind::Idea: return IDEA_FIELDS;
        case BlockKind::Reference: return REFERENCE_FIELDS;
    }
    return {};
}

Block create_block(BlockKind kind, GroupId topic_group_id, std::optional<SortKey> sort_key) {
    Block block{
        .id = generate_id(),
        .kind = kind,
        .fields = {},
        .completed = false,
        .created_at = now_iso8601(),
        .topic_group_id = normalize_group_id(topic_group_id),
        .sort_key = sort_key ? std::move(*sort_key) : SortKey::first()
    };
    for (auto field : fields_for(kind)) {
        block.fields.emplace(std::string(field), std::string{});
    }
    return block;
}

std::string field_value(const Block& block, std::string_view field) {
    auto it = block.fields.find(std::string(field));
    return it == block.fields.end() ? std::string{} : it->second;
}

Block with_field(Block block, std::string_view field, std::string value) {
    block.fields[std::string(field)] = std::move(value);
    return block;
}

Block toggle_completion(Block block) {
    if (block.kind == BlockKind::Todo) {
        block.completed = !block.completed;
    }
    return block;
}

bool validate_block(const Block& block) {
    return !block.id.empty() && !block.created_at.empty() && !block.sort_key.is_empty();
}

} // namespace neetings::blocks
