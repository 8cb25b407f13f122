#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFile>
#include <QSettings>
#include <QTextStream>

#include "cli/board_format.hpp"
#include "core/block.hpp"
#include "core/meeting.hpp"
#include "session/document_codec.hpp"
#include "session/logging.hpp"
#include "session/meeting_board.hpp"
#include "session/qt_scheduler.hpp"
#include "session/settings.hpp"
#include "session/update_queue.hpp"
#include "storage/durable_store.hpp"
#include "storage/sqlite_store.hpp"

#include <memory>
#include <optional>

using namespace neetings;

namespace {

int fail(const QString& message) {
    QTextStream(stderr) << message << QLatin1Char('\n');
    return 1;
}

int fail(const Error& error) {
    return fail(QString::fromStdString(error.message));
}

QString usage() {
    return QStringLiteral(
        "Commands:\n"
        "  list                                   show every meeting board\n"
        "  new-meeting <title>                    create an empty meeting\n"
        "  add-block <meeting> <kind> [group] [text]\n"
        "  move <meeting> <block> <target>        target: block id, group:<id> or group:default\n"
        "  move-up <meeting> <block>              swap with the block above\n"
        "  move-down <meeting> <block>            swap with the block below\n"
        "  add-group <meeting> <name> [color]     add a topic group column\n"
        "  delete-group <meeting> <group>         remove a column, keeping its blocks\n"
        "  move-group <meeting> <group> left|right\n"
        "  attendees                              list attendees\n"
        "  add-attendee <name> [email]\n"
        "  export                                 print the meetings document\n"
        "  import <file>                          replace all meetings with a document\n"
        "  clear                                  delete all meetings and attendees\n");
}

} // namespace

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("Neetings");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("Neetings");
    app.setOrganizationDomain("neetings.local");

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Neetings meeting boards\n\n") + usage());
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption dbPathOption(
        QStringList{QStringLiteral("db")},
        QStringLiteral("Override database path (takes precedence over NEETINGS_DB_PATH)."),
        QStringLiteral("path"));
    parser.addOption(dbPathOption);

    const QCommandLineOption memoryOption(
        QStringList{QStringLiteral("memory")},
        QStringLiteral("Keep everything in memory for this run; nothing is written to disk."));
    parser.addOption(memoryOption);

    const QCommandLineOption jsonOption(
        QStringList{QStringLiteral("json")},
        QStringLiteral("Output JSON (for commands that support it)."));
    parser.addOption(jsonOption);

    const QCommandLineOption includeIdsOption(
        QStringList{QStringLiteral("ids")},
        QStringLiteral("Include IDs and sort keys in list output."));
    parser.addOption(includeIdsOption);

    const QCommandLineOption debugOption(
        QStringList{QStringLiteral("debug")},
        QStringLiteral("Enable debug logging for all neetings.* categories."));
    parser.addOption(debugOption);

    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("Command to run (e.g. 'list')."));
    parser.process(app);

    session::install_file_logging();
    if (parser.isSet(debugOption)) {
        session::enable_debug_logging();
        qInfo() << "Neetings: logging to" << session::active_log_file_path();
    }

    const auto positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        QTextStream(stdout) << parser.helpText();
        return 1;
    }
    const auto command = positional.first();

    QSettings qsettings;
    const auto settings = session::load_settings(qsettings);

    std::unique_ptr<storage::DurableStore> store;
    if (parser.isSet(memoryOption)) {
        store = std::make_unique<storage::MemoryStore>();
    } else {
        const auto path = session::resolve_database_path(parser.value(dbPathOption));
        auto opened = storage::SqliteStore::open(path.toStdString());
        if (opened.is_err()) {
            return fail(QStringLiteral("Cannot open database %1: %2")
                            .arg(path, QString::fromStdString(opened.unwrap_err().message)));
        }
        store = std::make_unique<storage::SqliteStore>(std::move(opened).unwrap());
    }

    session::QtScheduler scheduler;
    session::MeetingUpdateQueue meetings(
        *store, scheduler,
        [](const std::vector<Meeting>& all) { return session::encode_meetings(all); },
        {.storage_key = settings.meetings_key, .delay = settings.autosave_delay});

    session::AttendeeUpdateQueue attendees(
        *store, scheduler,
        [](const std::vector<Attendee>& all) { return session::encode_attendees(all); },
        {.storage_key = settings.attendees_key, .delay = settings.autosave_delay});

    auto loaded = meetings.load(session::decode_meetings)
        .and_then([&] { return attendees.load(session::decode_attendees); });
    if (loaded.is_err()) {
        return fail(loaded.unwrap_err());
    }

    session::MeetingBoard board(meetings, settings.key_policy);

    // Every command ends with a flush: the process exits before any
    // debounce timer could fire.
    const auto flush_both = [&]() {
        return meetings.flush_all().and_then([&] { return attendees.flush_all(); });
    };
    const auto finish = [&]() -> int {
        auto flushed = flush_both();
        if (flushed.is_err()) {
            return fail(flushed.unwrap_err());
        }
        return 0;
    };
    const auto finish_with = [&](const Result<void, Error>& result) -> int {
        if (result.is_err()) {
            return fail(result.unwrap_err());
        }
        return finish();
    };

    if (command == QStringLiteral("list")) {
        const auto opts = cli::ListOptions{.include_ids = parser.isSet(includeIdsOption),
                                           .include_keys = parser.isSet(includeIdsOption)};
        const auto output = parser.isSet(jsonOption)
            ? cli::format_meetings_json(meetings.get_all(), opts)
            : cli::format_meetings(meetings.get_all(), opts);
        QTextStream(stdout) << output;
        return 0;
    }

    if (command == QStringLiteral("new-meeting")) {
        const auto title = positional.mid(1).join(QLatin1Char(' ')).trimmed();
        auto meeting = create_empty_meeting(generate_id(), title.toStdString());
        const auto id = QString::fromStdString(meeting.id);
        meetings.queue_add(std::move(meeting));
        QTextStream(stdout) << id << QLatin1Char('\n');
        return finish();
    }

    if (command == QStringLiteral("add-block")) {
        if (positional.size() < 3) {
            return fail(QStringLiteral("usage: add-block <meeting> <kind> [group] [text]"));
        }
        const auto meeting_id = positional.at(1).toStdString();
        const auto kind = blocks::parse_kind(positional.at(2).toStdString());
        if (!kind) {
            return fail(QStringLiteral("Unknown block kind: ") + positional.at(2));
        }
        GroupId group;
        if (positional.size() > 3 && positional.at(3) != QStringLiteral("default")) {
            group = positional.at(3).toStdString();
        }

        auto added = board.add_block(meeting_id, *kind, group);
        if (added.is_err()) {
            return fail(added.unwrap_err());
        }
        const auto& block = added.unwrap();
        if (positional.size() > 4) {
            const auto fields = blocks::fields_for(*kind);
            auto set = board.set_block_field(meeting_id, block.id, std::string(fields.front()),
                                             positional.mid(4).join(QLatin1Char(' ')).toStdString());
            if (set.is_err()) {
                return fail(set.unwrap_err());
            }
        }
        QTextStream(stdout) << QString::fromStdString(block.id) << QLatin1Char('\n');
        return finish();
    }

    if (command == QStringLiteral("move")) {
        if (positional.size() < 4) {
            return fail(QStringLiteral("usage: move <meeting> <block> <target>"));
        }
        const auto meeting_id = positional.at(1).toStdString();
        const auto block_id = positional.at(2).toStdString();
        const auto meeting = meetings.get(meeting_id);
        if (!meeting) {
            return fail(QStringLiteral("Meeting not found: ") + positional.at(1));
        }
        const auto* block = find_block(*meeting, block_id);
        if (!block) {
            return fail(QStringLiteral("Block not found: ") + positional.at(2));
        }

        auto target = cli::parse_drop_target(positional.at(3), *meeting);
        if (target.is_err()) {
            return fail(target.unwrap_err());
        }

        board.drag_start({.item_id = block_id, .group_id = block->topic_group_id, .index = 0});
        const auto intent = board.drag_end(meeting_id, target.unwrap());
        if (!intent) {
            QTextStream(stdout) << "unchanged\n";
            return 0;
        }
        QTextStream(stdout) << QString::fromStdString(intent->sort_key.value()) << QLatin1Char('\n');
        return finish();
    }

    if (command == QStringLiteral("move-up") || command == QStringLiteral("move-down")) {
        if (positional.size() < 3) {
            return fail(QStringLiteral("usage: %1 <meeting> <block>").arg(command));
        }
        const auto direction = command == QStringLiteral("move-up")
            ? session::MeetingBoard::Direction::Up
            : session::MeetingBoard::Direction::Down;
        auto moved = board.move_block(positional.at(1).toStdString(),
                                      positional.at(2).toStdString(), direction);
        if (moved.is_err()) {
            return fail(moved.unwrap_err());
        }
        if (!moved.unwrap()) {
            QTextStream(stdout) << "unchanged\n";
            return 0;
        }
        return finish();
    }

    if (command == QStringLiteral("add-group")) {
        if (positional.size() < 3) {
            return fail(QStringLiteral("usage: add-group <meeting> <name> [color]"));
        }
        std::optional<std::string> color;
        if (positional.size() > 3) {
            color = positional.at(3).toStdString();
        }
        auto added = board.add_topic_group(positional.at(1).toStdString(),
                                           positional.at(2).toStdString(), std::move(color));
        if (added.is_err()) {
            return fail(added.unwrap_err());
        }
        QTextStream(stdout) << QString::fromStdString(added.unwrap().id) << QLatin1Char('\n');
        return finish();
    }

    if (command == QStringLiteral("delete-group")) {
        if (positional.size() < 3) {
            return fail(QStringLiteral("usage: delete-group <meeting> <group>"));
        }
        return finish_with(board.delete_topic_group(positional.at(1).toStdString(),
                                                    positional.at(2).toStdString()));
    }

    if (command == QStringLiteral("move-group")) {
        if (positional.size() < 4 ||
            (positional.at(3) != QStringLiteral("left") && positional.at(3) != QStringLiteral("right"))) {
            return fail(QStringLiteral("usage: move-group <meeting> <group> left|right"));
        }
        const auto side = positional.at(3) == QStringLiteral("left")
            ? session::MeetingBoard::Side::Left
            : session::MeetingBoard::Side::Right;
        auto swapped = board.swap_topic_groups(positional.at(1).toStdString(),
                                               positional.at(2).toStdString(), side);
        if (swapped.is_err()) {
            return fail(swapped.unwrap_err());
        }
        if (!swapped.unwrap()) {
            QTextStream(stdout) << "unchanged\n";
            return 0;
        }
        return finish();
    }

    if (command == QStringLiteral("attendees")) {
        if (parser.isSet(jsonOption)) {
            QTextStream(stdout) << QString::fromStdString(
                session::encode_attendees(attendees.get_all(), QJsonDocument::Indented));
            return 0;
        }
        QTextStream out(stdout);
        for (const auto& attendee : attendees.get_all()) {
            out << QString::fromStdString(attendee.name);
            if (!attendee.email.empty()) {
                out << " <" << QString::fromStdString(attendee.email) << '>';
            }
            if (parser.isSet(includeIdsOption)) {
                out << " (" << QString::fromStdString(attendee.id) << ')';
            }
            out << '\n';
        }
        return 0;
    }

    if (command == QStringLiteral("add-attendee")) {
        if (positional.size() < 2 || positional.at(1).trimmed().isEmpty()) {
            return fail(QStringLiteral("usage: add-attendee <name> [email]"));
        }
        Attendee attendee{
            .id = generate_id(),
            .name = positional.at(1).trimmed().toStdString(),
            .email = positional.size() > 2 ? positional.at(2).trimmed().toStdString() : std::string{}
        };
        const auto id = QString::fromStdString(attendee.id);
        attendees.queue_add(std::move(attendee));
        QTextStream(stdout) << id << QLatin1Char('\n');
        return finish();
    }

    if (command == QStringLiteral("export")) {
        auto flushed = flush_both();
        if (flushed.is_err()) {
            return fail(QStringLiteral("Refusing to export unsaved state: ") +
                        QString::fromStdString(flushed.unwrap_err().message));
        }
        QTextStream(stdout) << QString::fromStdString(
            session::encode_meetings(meetings.get_all(), QJsonDocument::Indented));
        return 0;
    }

    if (command == QStringLiteral("import")) {
        if (positional.size() < 2) {
            return fail(QStringLiteral("usage: import <file>"));
        }
        QFile file(positional.at(1));
        if (!file.open(QIODevice::ReadOnly)) {
            return fail(QStringLiteral("Cannot read %1: %2").arg(positional.at(1), file.errorString()));
        }
        auto decoded = session::decode_meetings(file.readAll().toStdString());
        if (decoded.is_err()) {
            return fail(decoded.unwrap_err());
        }
        const auto count = decoded.unwrap().size();
        auto written = meetings.set_all(std::move(decoded).unwrap());
        if (written.is_err()) {
            return fail(written.unwrap_err());
        }
        QTextStream(stdout) << "imported " << count << " meetings\n";
        return 0;
    }

    if (command == QStringLiteral("clear")) {
        auto cleared = meetings.clear_all().and_then([&] { return attendees.clear_all(); });
        if (cleared.is_err()) {
            return fail(cleared.unwrap_err());
        }
        return 0;
    }

    return fail(QStringLiteral("Unknown command: ") + command + QLatin1Char('\n') + usage());
}
