#include <catch2/catch_test_macros.hpp>
#include "core/block.hpp"
#include "core/meeting.hpp"

#include <chrono>
#include <set>

using namespace neetings;
using namespace neetings::blocks;

TEST_CASE("Block creation", "[blocks]") {
    auto block = create_block(BlockKind::QAndA, std::string("group-1"), SortKey("a2"));

    REQUIRE(block.id.size() == 36);
    REQUIRE(block.kind == BlockKind::QAndA);
    REQUIRE(block.topic_group_id == GroupId("group-1"));
    REQUIRE(block.sort_key == SortKey("a2"));
    REQUIRE_FALSE(block.created_at.empty());
    REQUIRE_FALSE(block.completed);

    // Every field of the kind starts out empty.
    REQUIRE(block.fields.size() == 2);
    REQUIRE(block.fields.at("question").empty());
    REQUIRE(block.fields.at("answer").empty());
    REQUIRE(validate_block(block));
}

TEST_CASE("Block creation defaults", "[blocks]") {
    auto block = create_block(BlockKind::Text);

    REQUIRE_FALSE(block.topic_group_id.has_value());
    REQUIRE(block.sort_key == SortKey::first());

    SECTION("Empty group id means the default column") {
        auto other = create_block(BlockKind::Text, std::string(""));
        REQUIRE_FALSE(other.topic_group_id.has_value());
    }
}

TEST_CASE("Block kinds round-trip through their type names", "[blocks]") {
    std::set<std::string_view> names;
    for (auto kind : ALL_KINDS) {
        const auto name = type_name(kind);
        REQUIRE(parse_kind(name) == kind);
        REQUIRE_FALSE(fields_for(kind).empty());
        names.insert(name);
    }
    REQUIRE(names.size() == 11);

    REQUIRE(type_name(BlockKind::FollowUp) == "followupblock");
    REQUIRE(label(BlockKind::QAndA) == "Q&A");
    REQUIRE_FALSE(parse_kind("paragraph").has_value());
}

TEST_CASE("Block field access", "[blocks]") {
    auto block = create_block(BlockKind::Research);

    REQUIRE(field_value(block, "topic") == "");
    REQUIRE(field_value(block, "missing") == "");

    block = with_field(block, "topic", "Latency");
    block = with_field(block, "result", "p99 under 20ms");
    REQUIRE(field_value(block, "topic") == "Latency");
    REQUIRE(field_value(block, "result") == "p99 under 20ms");
}

TEST_CASE("Completion toggles only todo blocks", "[blocks]") {
    auto todo = create_block(BlockKind::Todo);
    todo = toggle_completion(todo);
    REQUIRE(todo.completed);
    todo = toggle_completion(todo);
    REQUIRE_FALSE(todo.completed);

    auto idea = create_block(BlockKind::Idea);
    REQUIRE_FALSE(toggle_completion(idea).completed);
}

TEST_CASE("Block validation", "[blocks]") {
    auto block = create_block(BlockKind::Fact);
    REQUIRE(validate_block(block));

    SECTION("Missing id") {
        block.id.clear();
        REQUIRE_FALSE(validate_block(block));
    }
    SECTION("Missing creation time") {
        block.created_at.clear();
        REQUIRE_FALSE(validate_block(block));
    }
    SECTION("Missing sort key") {
        block.sort_key = SortKey{};
        REQUIRE_FALSE(validate_block(block));
    }
}

TEST_CASE("Ids are random v4 UUIDs", "[types]") {
    const auto a = generate_id();
    const auto b = generate_id();

    REQUIRE(a != b);
    REQUIRE(a.size() == 36);
    REQUIRE(a[8] == '-');
    REQUIRE(a[14] == '4');
}

TEST_CASE("Timestamps are ISO 8601 UTC", "[types]") {
    const auto epoch = std::chrono::system_clock::time_point{} + std::chrono::milliseconds(1500);
    REQUIRE(to_iso8601(epoch) == "1970-01-01T00:00:01.500Z");
    REQUIRE(today_date().size() == 10);
}

TEST_CASE("Meeting helpers", "[meeting]") {
    auto meeting = create_empty_meeting("m-1");
    REQUIRE(meeting.title == DEFAULT_MEETING_TITLE);
    REQUIRE(meeting.date.size() == 10);
    REQUIRE(meeting.blocks.empty());
    REQUIRE(meeting.created_at == meeting.updated_at);

    auto group = create_topic_group(meeting.id, "Risks", std::string("red"));
    REQUIRE(group.meeting_id == "m-1");
    REQUIRE(group.color == std::optional<std::string>("red"));
    REQUIRE(group.order > 0);
    meeting.topic_groups.push_back(group);

    auto block = create_block(BlockKind::Issue, group.id);
    meeting.blocks.push_back(block);

    REQUIRE(find_block(meeting, block.id) != nullptr);
    REQUIRE(find_block(meeting, "nope") == nullptr);
    REQUIRE(find_topic_group(meeting, group.id)->name == "Risks");
    REQUIRE(find_topic_group(meeting, "nope") == nullptr);
}
