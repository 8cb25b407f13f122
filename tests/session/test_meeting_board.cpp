#include <catch2/catch_test_macros.hpp>
#include "session/document_codec.hpp"
#include "session/meeting_board.hpp"
#include "storage/durable_store.hpp"
#include "manual_scheduler.hpp"

#include <QSignalSpy>

#include <chrono>

using namespace neetings;
using namespace neetings::session;
using namespace std::chrono_literals;
using neetings::blocks::Block;
using neetings::blocks::BlockKind;
using neetings::ordering::DropTarget;

namespace {

struct Fixture {
    storage::MemoryStore store;
    testing::ManualScheduler scheduler;
    MeetingUpdateQueue queue{store, scheduler,
                             [](const std::vector<Meeting>& all) { return encode_meetings(all); },
                             {.storage_key = "meetings", .delay = 500ms}};
    MeetingBoard board{queue};

    Fixture() {
        REQUIRE(queue.set_all({create_empty_meeting("m1", "Board")}).is_ok());
    }

    std::vector<std::string> column(const GroupId& group) const {
        std::vector<std::string> ids;
        for (const auto& block : ordering::blocks_for_group(queue.get("m1")->blocks, group)) {
            ids.push_back(block.id);
        }
        return ids;
    }

    std::string add(BlockKind kind, const GroupId& group = std::nullopt) {
        return board.add_block("m1", kind, group).unwrap().id;
    }
};

} // namespace

TEST_CASE("Added blocks go to the end of their column", "[board]") {
    Fixture f;

    const auto a = f.add(BlockKind::Text);
    const auto b = f.add(BlockKind::Todo);
    const auto c = f.add(BlockKind::Idea);

    REQUIRE(f.column(std::nullopt) == std::vector<std::string>{a, b, c});

    const auto& blocks = f.queue.get("m1")->blocks;
    REQUIRE(blocks.size() == 3);
    REQUIRE(blocks[0].sort_key < blocks[1].sort_key);
    REQUIRE(blocks[1].sort_key < blocks[2].sort_key);
    REQUIRE(blocks[0].sort_key == SortKey::first());
}

TEST_CASE("Block edits go through the queue", "[board]") {
    Fixture f;
    const auto id = f.add(BlockKind::Todo);

    REQUIRE(f.board.set_block_field("m1", id, "todo", "Book the room").is_ok());
    REQUIRE(f.board.toggle_block_completion("m1", id).is_ok());

    const auto* block = find_block(*f.queue.get("m1"), id);
    REQUIRE(blocks::field_value(*block, "todo") == "Book the room");
    REQUIRE(block->completed);

    REQUIRE(f.store.write_count() == 1);
    f.scheduler.advance(500ms);
    REQUIRE(f.store.write_count() == 2);

    REQUIRE(f.board.delete_block("m1", id).is_ok());
    REQUIRE(f.queue.get("m1")->blocks.empty());
}

TEST_CASE("Unknown meetings and blocks are not found", "[board]") {
    Fixture f;

    auto added = f.board.add_block("nope", BlockKind::Text);
    REQUIRE(added.is_err());
    REQUIRE(added.unwrap_err().code == errc::not_found);

    REQUIRE(f.board.set_block_field("m1", "nope", "text", "x").unwrap_err().code == errc::not_found);
    REQUIRE(f.board.toggle_block_completion("m1", "nope").is_err());
    REQUIRE(f.board.delete_block("m1", "nope").is_err());
    REQUIRE(f.board.move_block("m1", "nope", MeetingBoard::Direction::Up).is_err());
    REQUIRE(f.board.delete_topic_group("m1", "nope").is_err());
    REQUIRE(f.board.add_topic_group("nope", "Risks").is_err());
    REQUIRE(f.board.swap_topic_groups("m1", "nope", MeetingBoard::Side::Left).is_err());
    REQUIRE(f.board.board("nope").empty());
    REQUIRE_FALSE(f.queue.write_scheduled());
}

TEST_CASE("Keyboard moves swap with the neighbour", "[board]") {
    Fixture f;
    const auto a = f.add(BlockKind::Text);
    const auto b = f.add(BlockKind::Text);
    const auto c = f.add(BlockKind::Text);

    REQUIRE(f.board.move_block("m1", a, MeetingBoard::Direction::Down).unwrap());
    REQUIRE(f.column(std::nullopt) == std::vector<std::string>{b, a, c});

    REQUIRE(f.board.move_block("m1", c, MeetingBoard::Direction::Up).unwrap());
    REQUIRE(f.column(std::nullopt) == std::vector<std::string>{b, c, a});

    SECTION("Edges are a no-op") {
        REQUIRE_FALSE(f.board.move_block("m1", b, MeetingBoard::Direction::Up).unwrap());
        REQUIRE_FALSE(f.board.move_block("m1", a, MeetingBoard::Direction::Down).unwrap());
        REQUIRE(f.column(std::nullopt) == std::vector<std::string>{b, c, a});
    }
}

TEST_CASE("Blocks can only be added to columns the meeting has", "[board]") {
    Fixture f;

    auto added = f.board.add_block("m1", BlockKind::Text, std::string("nosuch"));
    REQUIRE(added.is_err());
    REQUIRE(added.unwrap_err().code == errc::not_found);
    REQUIRE(f.queue.get("m1")->blocks.empty());
    REQUIRE_FALSE(f.queue.write_scheduled());

    SECTION("An empty group id is the default column") {
        const auto id = f.add(BlockKind::Text, std::string(""));
        REQUIRE(f.column(std::nullopt) == std::vector<std::string>{id});
    }
}

TEST_CASE("Topic group columns swap places", "[board]") {
    Fixture f;
    const auto a = f.board.add_topic_group("m1", "Group A").unwrap();
    const auto b = f.board.add_topic_group("m1", "Group B").unwrap();
    const auto c = f.board.add_topic_group("m1", "Group C").unwrap();
    REQUIRE(a.order < b.order);
    REQUIRE(b.order < c.order);

    const auto names = [&f]() {
        std::vector<std::string> out;
        for (const auto& group : sorted_topic_groups(*f.queue.get("m1"))) {
            out.push_back(group.name);
        }
        return out;
    };
    QSignalSpy changed(&f.board, &MeetingBoard::meetingChanged);

    SECTION("Left") {
        REQUIRE(f.board.swap_topic_groups("m1", b.id, MeetingBoard::Side::Left).unwrap());
        REQUIRE(names() == std::vector<std::string>{"Group B", "Group A", "Group C"});
        REQUIRE(changed.count() == 1);
    }

    SECTION("Right") {
        REQUIRE(f.board.swap_topic_groups("m1", b.id, MeetingBoard::Side::Right).unwrap());
        REQUIRE(names() == std::vector<std::string>{"Group A", "Group C", "Group B"});
    }

    SECTION("Edges are a no-op") {
        REQUIRE_FALSE(f.board.swap_topic_groups("m1", a.id, MeetingBoard::Side::Left).unwrap());
        REQUIRE_FALSE(f.board.swap_topic_groups("m1", c.id, MeetingBoard::Side::Right).unwrap());
        REQUIRE(names() == std::vector<std::string>{"Group A", "Group B", "Group C"});
        REQUIRE(changed.isEmpty());
    }

    SECTION("Imported groups with equal order still swap") {
        auto meeting = *f.queue.get("m1");
        for (auto& group : meeting.topic_groups) group.order = 7;
        REQUIRE(f.queue.queue_update("m1", meeting));
        const auto before = names();

        REQUIRE(f.board.swap_topic_groups("m1", sorted_topic_groups(meeting)[1].id,
                                          MeetingBoard::Side::Left).unwrap());
        const auto after = names();
        REQUIRE(after[0] == before[1]);
        REQUIRE(after[1] == before[0]);
        REQUIRE(after[2] == before[2]);
    }
}

TEST_CASE("Deleting a topic group moves its blocks to the default column", "[board]") {
    Fixture f;
    const auto group = f.board.add_topic_group("m1", "Risks", std::string("red")).unwrap();
    REQUIRE(f.queue.get("m1")->topic_groups.size() == 1);

    const auto d = f.add(BlockKind::Text);
    const auto x = f.add(BlockKind::Issue, group.id);
    const auto y = f.add(BlockKind::Issue, group.id);

    REQUIRE(f.board.delete_topic_group("m1", group.id).is_ok());

    const auto meeting = *f.queue.get("m1");
    REQUIRE(meeting.topic_groups.empty());
    REQUIRE(f.column(std::nullopt) == std::vector<std::string>{d, x, y});
    REQUIRE(f.column(group.id).empty());
}

TEST_CASE("A drop is applied and queued once", "[board]") {
    Fixture f;
    const auto group = f.board.add_topic_group("m1", "Later").unwrap();
    const auto m = f.add(BlockKind::Text);
    const auto x = f.add(BlockKind::Text, group.id);
    const auto y = f.add(BlockKind::Text, group.id);
    f.scheduler.advance(500ms);
    REQUIRE(f.store.write_count() == 2);

    QSignalSpy changed(&f.board, &MeetingBoard::meetingChanged);

    f.board.drag_start({.item_id = m, .group_id = std::nullopt, .index = 0});
    f.board.drag_over(DropTarget::on_group(group.id));
    REQUIRE(f.board.reconciler().hovered().has_value());

    const auto intent = f.board.drag_end("m1", DropTarget::on_group(group.id));
    REQUIRE(intent.has_value());
    REQUIRE(intent->group_id == GroupId(group.id));
    REQUIRE(f.column(group.id) == std::vector<std::string>{x, y, m});
    REQUIRE(f.column(std::nullopt).empty());

    REQUIRE(changed.count() == 1);
    REQUIRE(changed.takeFirst().at(0).toString() == QStringLiteral("m1"));

    f.scheduler.advance(500ms);
    REQUIRE(f.store.write_count() == 3);
    const auto stored = decode_meetings(*f.store.get("meetings").unwrap()).unwrap();
    REQUIRE(find_block(stored.front(), m)->topic_group_id == GroupId(group.id));

    SECTION("No-op drops change nothing") {
        f.board.drag_start({.item_id = x, .group_id = group.id, .index = 0});
        REQUIRE_FALSE(f.board.drag_end("m1", DropTarget::on_item(x, group.id)).has_value());

        f.board.drag_start({.item_id = x, .group_id = group.id, .index = 0});
        f.board.drag_cancel();
        REQUIRE_FALSE(f.board.drag_end("m1", DropTarget::on_group(std::nullopt)).has_value());

        f.board.drag_start({.item_id = x, .group_id = group.id, .index = 0});
        REQUIRE_FALSE(f.board.drag_end("other", DropTarget::on_group(std::nullopt)).has_value());

        REQUIRE(changed.isEmpty());
        REQUIRE_FALSE(f.queue.write_scheduled());
    }
}

TEST_CASE("Rapid edits build on each other", "[board]") {
    Fixture f;
    QSignalSpy changed(&f.board, &MeetingBoard::meetingChanged);

    const auto a = f.add(BlockKind::Text);
    REQUIRE(f.board.set_block_field("m1", a, "text", "one").is_ok());
    const auto b = f.add(BlockKind::Text);
    REQUIRE(f.board.set_block_field("m1", b, "text", "two").is_ok());

    REQUIRE(changed.count() == 4);
    f.scheduler.advance(500ms);
    REQUIRE(f.store.write_count() == 2);

    const auto stored = decode_meetings(*f.store.get("meetings").unwrap()).unwrap();
    REQUIRE(stored.front().blocks.size() == 2);
    REQUIRE(blocks::field_value(*find_block(stored.front(), a), "text") == "one");
    REQUIRE(blocks::field_value(*find_block(stored.front(), b), "text") == "two");
}
