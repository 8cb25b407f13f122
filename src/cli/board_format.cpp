#include "cli/board_format.hpp"

#include "core/positioning.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QStringList>

#include <algorithm>

namespace neetings::cli {

namespace {

struct Column {
    GroupId group_id;
    QString name;
};

[[nodiscard]] QString qs(const std::string& s) {
    return QString::fromStdString(s);
}

[[nodiscard]] QString qs(std::string_view s) {
    return QString::fromUtf8(s.data(), static_cast<qsizetype>(s.size()));
}

// Default column first, then topic groups in board order, then any group
// that blocks still reference but the meeting no longer lists.
[[nodiscard]] std::vector<Column> columns_of(const Meeting& meeting, const ordering::GroupedBlocks& board) {
    std::vector<Column> out;
    out.push_back({std::nullopt, QStringLiteral("Default")});

    for (const auto& group : sorted_topic_groups(meeting)) {
        out.push_back({group.id, qs(group.name)});
    }

    for (const auto& [group_id, items] : board) {
        const bool known = std::any_of(out.begin(), out.end(),
                                       [&](const Column& c) { return c.group_id == group_id; });
        if (!known) {
            out.push_back({group_id, qs(*group_id)});
        }
    }
    return out;
}

[[nodiscard]] QString summary(const blocks::Block& block) {
    for (auto field : blocks::fields_for(block.kind)) {
        const auto value = blocks::field_value(block, field);
        if (!value.empty()) return qs(value);
    }
    return QString{};
}

[[nodiscard]] QString render_block_line(const blocks::Block& block, const ListOptions& options) {
    QString line = QStringLiteral("    - ") + qs(blocks::label(block.kind));
    if (block.kind == blocks::BlockKind::Todo) {
        line += block.completed ? QStringLiteral(" [x]") : QStringLiteral(" [ ]");
    }
    line += QStringLiteral(": ") + summary(block);
    if (options.include_keys) {
        line += QStringLiteral(" {") + qs(block.sort_key.value()) + QStringLiteral("}");
    }
    if (options.include_ids) {
        line += QStringLiteral(" (") + qs(block.id) + QStringLiteral(")");
    }
    return line;
}

[[nodiscard]] QJsonObject block_to_json(const blocks::Block& block, const ListOptions& options) {
    QJsonObject obj;
    if (options.include_ids) {
        obj.insert(QStringLiteral("id"), qs(block.id));
    }
    obj.insert(QStringLiteral("type"), qs(blocks::type_name(block.kind)));
    obj.insert(QStringLiteral("text"), summary(block));
    if (block.kind == blocks::BlockKind::Todo) {
        obj.insert(QStringLiteral("completed"), block.completed);
    }
    if (options.include_keys) {
        obj.insert(QStringLiteral("sortKey"), qs(block.sort_key.value()));
    }
    return obj;
}

} // namespace

QString format_meetings(const std::vector<Meeting>& meetings, const ListOptions& options) {
    QStringList out;
    for (const auto& meeting : meetings) {
        QString heading = qs(meeting.title) + QStringLiteral(" (") + qs(meeting.date) + QStringLiteral(")");
        if (options.include_ids) {
            heading += QStringLiteral(" (") + qs(meeting.id) + QStringLiteral(")");
        }
        out.append(heading);

        const auto board = ordering::group_and_sort(meeting.blocks);
        for (const auto& column : columns_of(meeting, board)) {
            out.append(QStringLiteral("  ") + column.name);
            auto it = board.find(column.group_id);
            if (it == board.end()) continue;
            for (const auto& block : it->second) {
                out.append(render_block_line(block, options));
            }
        }
    }
    if (out.isEmpty()) {
        return QString{};
    }
    return out.join(QLatin1Char('\n')) + QLatin1Char('\n');
}

QString format_meetings_json(const std::vector<Meeting>& meetings, const ListOptions& options) {
    QJsonArray list;
    for (const auto& meeting : meetings) {
        const auto board = ordering::group_and_sort(meeting.blocks);

        QJsonArray columns;
        for (const auto& column : columns_of(meeting, board)) {
            QJsonArray items;
            auto it = board.find(column.group_id);
            if (it != board.end()) {
                for (const auto& block : it->second) {
                    items.append(block_to_json(block, options));
                }
            }
            QJsonObject col;
            col.insert(QStringLiteral("groupId"),
                       column.group_id ? QJsonValue(qs(*column.group_id)) : QJsonValue(QJsonValue::Null));
            col.insert(QStringLiteral("name"), column.name);
            col.insert(QStringLiteral("blocks"), items);
            columns.append(col);
        }

        QJsonObject obj;
        if (options.include_ids) {
            obj.insert(QStringLiteral("id"), qs(meeting.id));
        }
        obj.insert(QStringLiteral("title"), qs(meeting.title));
        obj.insert(QStringLiteral("date"), qs(meeting.date));
        obj.insert(QStringLiteral("columns"), columns);
        list.append(obj);
    }

    QJsonObject root;
    root.insert(QStringLiteral("meetings"), list);
    return QString::fromUtf8(QJsonDocument(root).toJson(QJsonDocument::Indented));
}

Result<ordering::DropTarget> parse_drop_target(const QString& text, const Meeting& meeting) {
    const auto trimmed = text.trimmed();
    if (trimmed.isEmpty()) {
        return Result<ordering::DropTarget>::err(Error{"Drop target is required"});
    }

    const auto group_prefix = QStringLiteral("group:");
    if (trimmed.startsWith(group_prefix)) {
        const auto group = trimmed.mid(group_prefix.size());
        if (group.isEmpty() || group == QStringLiteral("default")) {
            return Result<ordering::DropTarget>::ok(ordering::DropTarget::on_group(std::nullopt));
        }
        const auto group_id = group.toStdString();
        if (!find_topic_group(meeting, group_id)) {
            return Result<ordering::DropTarget>::err(
                Error{"Topic group not found: " + group_id, errc::not_found});
        }
        return Result<ordering::DropTarget>::ok(ordering::DropTarget::on_group(group_id));
    }

    const auto block_id = trimmed.toStdString();
    const auto board = ordering::group_and_sort(meeting.blocks);
    for (const auto& [group_id, items] : board) {
        for (std::size_t i = 0; i < items.size(); ++i) {
            if (items[i].id == block_id) {
                return Result<ordering::DropTarget>::ok(
                    ordering::DropTarget::on_item(block_id, group_id, i));
            }
        }
    }
    return Result<ordering::DropTarget>::err(Error{"Block not found: " + block_id, errc::not_found});
}

} // namespace neetings::cli
