#include "session/document_codec.hpp"

#include "core/positioning.hpp"
#include "session/logging.hpp"

#include <QJsonArray>
#include <QJsonParseError>
#include <QJsonValue>
#include <QString>

namespace neetings::session {

namespace {

QString qs(const std::string& s) {
    return QString::fromStdString(s);
}

std::string str(const QJsonValue& v) {
    return v.toString().toStdString();
}

Result<QJsonDocument, Error> parse_document(const std::string& text) {
    QJsonParseError parse_error{};
    auto doc = QJsonDocument::fromJson(QByteArray::fromStdString(text), &parse_error);
    if (parse_error.error != QJsonParseError::NoError) {
        return Result<QJsonDocument, Error>::err(
            Error{"invalid JSON: " + parse_error.errorString().toStdString(), errc::decode_failed});
    }
    return Result<QJsonDocument, Error>::ok(std::move(doc));
}

// The array under `field` of a version-stamped document, or the document
// itself when it is a bare array (documents written before versioning).
Result<QJsonArray, Error> records(const QJsonDocument& doc, const char* field) {
    if (doc.isArray()) {
        qCInfo(neetingsCodecLog) << "reading legacy unversioned" << field << "document";
        return Result<QJsonArray, Error>::ok(doc.array());
    }
    if (!doc.isObject()) {
        return Result<QJsonArray, Error>::err(Error{"document is neither object nor array",
                                                    errc::decode_failed});
    }

    const auto root = doc.object();
    const auto list = root.value(QLatin1String(field));
    if (!list.isArray()) {
        return Result<QJsonArray, Error>::err(
            Error{std::string("document has no \"") + field + "\" array", errc::decode_failed});
    }

    const auto version = root.value(QStringLiteral("version")).toString();
    if (!version.isEmpty() && version != QLatin1String(DOCUMENT_VERSION)) {
        qCWarning(neetingsCodecLog) << "document version" << version << "differs from"
                                    << DOCUMENT_VERSION << "- reading anyway";
    }
    return Result<QJsonArray, Error>::ok(list.toArray());
}

QJsonArray string_array(const std::vector<std::string>& values) {
    QJsonArray out;
    for (const auto& v : values) out.append(qs(v));
    return out;
}

std::vector<std::string> strings_from(const QJsonValue& value) {
    std::vector<std::string> out;
    for (const auto& v : value.toArray()) {
        if (v.isString()) out.push_back(str(v));
    }
    return out;
}

// Gives every block that came without a usable key an append key in its
// group, in document order, after the blocks whose keys were kept.
void repair_sort_keys(Meeting& meeting) {
    std::vector<blocks::Block> kept;
    std::vector<blocks::Block> broken;
    for (auto& block : meeting.blocks) {
        (blocks::validate_block(block) ? kept : broken).push_back(std::move(block));
    }
    if (broken.empty()) {
        meeting.blocks = std::move(kept);
        return;
    }

    for (auto& block : broken) {
        auto placement = ordering::key_for_new_block(kept, block.topic_group_id);
        qCInfo(neetingsCodecLog) << "repaired sort key of block" << qs(block.id)
                                 << "in meeting" << qs(meeting.id) << "->"
                                 << qs(placement.key.value());
        const auto id = block.id;
        kept.push_back(std::move(block));
        ordering::apply_placement(kept, id, placement);
    }
    meeting.blocks = std::move(kept);
}

} // namespace

QJsonObject block_to_json(const blocks::Block& block) {
    QJsonObject obj;
    obj.insert(QStringLiteral("id"), qs(block.id));
    obj.insert(QStringLiteral("type"), QString::fromLatin1(blocks::type_name(block.kind).data(),
                                                           static_cast<int>(blocks::type_name(block.kind).size())));
    for (const auto& [field, value] : block.fields) {
        obj.insert(qs(field), qs(value));
    }
    obj.insert(QStringLiteral("created_at"), qs(block.created_at));
    if (block.kind == blocks::BlockKind::Todo || block.completed) {
        obj.insert(QStringLiteral("completed"), block.completed);
    }
    obj.insert(QStringLiteral("topicGroupId"),
               block.topic_group_id ? QJsonValue(qs(*block.topic_group_id)) : QJsonValue(QJsonValue::Null));
    obj.insert(QStringLiteral("sortKey"), qs(block.sort_key.value()));
    return obj;
}

std::optional<blocks::Block> block_from_json(const QJsonObject& obj) {
    const auto id = str(obj.value(QStringLiteral("id")));
    const auto created_at = str(obj.value(QStringLiteral("created_at")));
    const auto kind = blocks::parse_kind(str(obj.value(QStringLiteral("type"))));
    if (id.empty() || created_at.empty() || !kind) {
        return std::nullopt;
    }

    blocks::Block block{
        .id = id,
        .kind = *kind,
        .fields = {},
        .completed = obj.value(QStringLiteral("completed")).toBool(false),
        .created_at = created_at,
        .topic_group_id = std::nullopt,
        .sort_key = {}
    };

    const auto group = obj.value(QStringLiteral("topicGroupId"));
    if (group.isString()) {
        block.topic_group_id = normalize_group_id(str(group));
    }

    // Older documents keep field text in a nested "content" object.
    const auto content = obj.value(QStringLiteral("content")).toObject();
    for (auto field : blocks::fields_for(*kind)) {
        const auto key = QString::fromLatin1(field.data(), static_cast<int>(field.size()));
        const auto value = content.contains(key) ? content.value(key) : obj.value(key);
        block.fields.emplace(std::string(field), str(value));
    }

    auto key = SortKey::parse(str(obj.value(QStringLiteral("sortKey"))));
    if (key.is_ok()) {
        block.sort_key = std::move(key).unwrap();
    }
    return block;
}

QJsonObject topic_group_to_json(const TopicGroup& group) {
    QJsonObject obj;
    obj.insert(QStringLiteral("id"), qs(group.id));
    obj.insert(QStringLiteral("name"), qs(group.name));
    if (group.color) {
        obj.insert(QStringLiteral("color"), qs(*group.color));
    }
    obj.insert(QStringLiteral("order"), static_cast<qint64>(group.order));
    obj.insert(QStringLiteral("meetingId"), qs(group.meeting_id));
    obj.insert(QStringLiteral("createdAt"), qs(group.created_at));
    obj.insert(QStringLiteral("updatedAt"), qs(group.updated_at));
    return obj;
}

TopicGroup topic_group_from_json(const QJsonObject& obj) {
    TopicGroup group{
        .id = str(obj.value(QStringLiteral("id"))),
        .name = str(obj.value(QStringLiteral("name"))),
        .color = std::nullopt,
        .order = obj.value(QStringLiteral("order")).toInteger(0),
        .meeting_id = str(obj.value(QStringLiteral("meetingId"))),
        .created_at = str(obj.value(QStringLiteral("createdAt"))),
        .updated_at = str(obj.value(QStringLiteral("updatedAt")))
    };
    const auto color = obj.value(QStringLiteral("color"));
    if (color.isString()) {
        group.color = str(color);
    }
    return group;
}

QJsonObject meeting_to_json(const Meeting& meeting) {
    QJsonArray blocks;
    for (const auto& block : meeting.blocks) {
        blocks.append(block_to_json(block));
    }
    QJsonArray groups;
    for (const auto& group : meeting.topic_groups) {
        groups.append(topic_group_to_json(group));
    }

    QJsonObject obj;
    obj.insert(QStringLiteral("id"), qs(meeting.id));
    obj.insert(QStringLiteral("title"), qs(meeting.title));
    obj.insert(QStringLiteral("date"), qs(meeting.date));
    obj.insert(QStringLiteral("startTime"), qs(meeting.start_time));
    obj.insert(QStringLiteral("endTime"), qs(meeting.end_time));
    obj.insert(QStringLiteral("blocks"), blocks);
    obj.insert(QStringLiteral("topicGroups"), groups);
    obj.insert(QStringLiteral("attendeeIds"), string_array(meeting.attendee_ids));
    obj.insert(QStringLiteral("created_at"), qs(meeting.created_at));
    obj.insert(QStringLiteral("updated_at"), qs(meeting.updated_at));
    return obj;
}

Result<Meeting, Error> meeting_from_json(const QJsonObject& obj) {
    Meeting meeting{
        .id = str(obj.value(QStringLiteral("id"))),
        .title = str(obj.value(QStringLiteral("title"))),
        .date = str(obj.value(QStringLiteral("date"))),
        .start_time = str(obj.value(QStringLiteral("startTime"))),
        .end_time = str(obj.value(QStringLiteral("endTime"))),
        .blocks = {},
        .topic_groups = {},
        .attendee_ids = strings_from(obj.value(QStringLiteral("attendeeIds"))),
        .created_at = str(obj.value(QStringLiteral("created_at"))),
        .updated_at = str(obj.value(QStringLiteral("updated_at")))
    };
    if (meeting.id.empty()) {
        return Result<Meeting, Error>::err(Error{"meeting without id", errc::decode_failed});
    }

    for (const auto& value : obj.value(QStringLiteral("blocks")).toArray()) {
        auto block = block_from_json(value.toObject());
        if (!block) {
            qCWarning(neetingsCodecLog) << "dropping invalid block in meeting" << qs(meeting.id);
            continue;
        }
        meeting.blocks.push_back(std::move(*block));
    }

    for (const auto& value : obj.value(QStringLiteral("topicGroups")).toArray()) {
        meeting.topic_groups.push_back(topic_group_from_json(value.toObject()));
    }

    repair_sort_keys(meeting);
    return Result<Meeting, Error>::ok(std::move(meeting));
}

std::string encode_meetings(const std::vector<Meeting>& meetings, QJsonDocument::JsonFormat format) {
    QJsonArray list;
    for (const auto& meeting : meetings) {
        list.append(meeting_to_json(meeting));
    }

    QJsonObject root;
    root.insert(QStringLiteral("version"), QString::fromLatin1(DOCUMENT_VERSION));
    root.insert(QStringLiteral("meetings"), list);
    return QJsonDocument(root).toJson(format).toStdString();
}

Result<std::vector<Meeting>, Error> decode_meetings(const std::string& text) {
    using R = Result<std::vector<Meeting>, Error>;

    auto doc = parse_document(text);
    if (doc.is_err()) {
        return R::err(doc.unwrap_err());
    }
    auto list = records(doc.unwrap(), "meetings");
    if (list.is_err()) {
        return R::err(list.unwrap_err());
    }

    std::vector<Meeting> meetings;
    for (const auto& value : list.unwrap()) {
        auto meeting = meeting_from_json(value.toObject());
        if (meeting.is_err()) {
            qCWarning(neetingsCodecLog) << "skipping meeting:" << meeting.unwrap_err().message.c_str();
            continue;
        }
        meetings.push_back(std::move(meeting).unwrap());
    }
    return R::ok(std::move(meetings));
}

std::string encode_attendees(const std::vector<Attendee>& attendees, QJsonDocument::JsonFormat format) {
    QJsonArray list;
    for (const auto& attendee : attendees) {
        QJsonObject obj;
        obj.insert(QStringLiteral("id"), qs(attendee.id));
        obj.insert(QStringLiteral("name"), qs(attendee.name));
        if (!attendee.email.empty()) {
            obj.insert(QStringLiteral("email"), qs(attendee.email));
        }
        list.append(obj);
    }

    QJsonObject root;
    root.insert(QStringLiteral("version"), QString::fromLatin1(DOCUMENT_VERSION));
    root.insert(QStringLiteral("attendees"), list);
    return QJsonDocument(root).toJson(format).toStdString();
}

Result<std::vector<Attendee>, Error> decode_attendees(const std::string& text) {
    using R = Result<std::vector<Attendee>, Error>;

    auto doc = parse_document(text);
    if (doc.is_err()) {
        return R::err(doc.unwrap_err());
    }
    auto list = records(doc.unwrap(), "attendees");
    if (list.is_err()) {
        return R::err(list.unwrap_err());
    }

    std::vector<Attendee> attendees;
    for (const auto& value : list.unwrap()) {
        const auto obj = value.toObject();
        Attendee attendee{
            .id = str(obj.value(QStringLiteral("id"))),
            .name = str(obj.value(QStringLiteral("name"))),
            .email = str(obj.value(QStringLiteral("email")))
        };
        if (attendee.id.empty()) {
            qCWarning(neetingsCodecLog) << "dropping attendee without id";
            continue;
        }
        attendees.push_back(std::move(attendee));
    }
    return R::ok(std::move(attendees));
}

} // namespace neetings::session
