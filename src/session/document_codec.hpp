#pragma once

#include "core/meeting.hpp"
#include "core/result.hpp"

#include <QJsonDocument>
#include <QJsonObject>

#include <optional>
#include <string>
#include <vector>

namespace neetings::session {

inline constexpr const char* DOCUMENT_VERSION = "1.0.0";

/**
 * JSON (de)serialization of the persisted documents.
 *
 * Meetings document:  {"version": "1.0.0", "meetings": [ ... ]}
 * Attendees document: {"version": "1.0.0", "attendees": [ ... ]}
 *
 * Decoding is forgiving about individual records and strict about the
 * document shape: a block without id, type or created_at is dropped, a
 * block with a missing or malformed sortKey is appended to its group, but
 * text that is not a JSON document of the expected shape is an error.
 */

[[nodiscard]] QJsonObject block_to_json(const blocks::Block& block);

/**
 * nullopt if the record lacks an id, a known type or created_at. A sort key
 * that fails validation decodes as an empty SortKey.
 */
[[nodiscard]] std::optional<blocks::Block> block_from_json(const QJsonObject& obj);

[[nodiscard]] QJsonObject topic_group_to_json(const TopicGroup& group);
[[nodiscard]] TopicGroup topic_group_from_json(const QJsonObject& obj);

[[nodiscard]] QJsonObject meeting_to_json(const Meeting& meeting);

/**
 * Decode one meeting, dropping invalid blocks and repairing sort keys.
 */
[[nodiscard]] Result<Meeting, Error> meeting_from_json(const QJsonObject& obj);

[[nodiscard]] std::string encode_meetings(const std::vector<Meeting>& meetings,
                                          QJsonDocument::JsonFormat format = QJsonDocument::Compact);

/**
 * Accepts the version-stamped object and the legacy bare array of meetings.
 */
[[nodiscard]] Result<std::vector<Meeting>, Error> decode_meetings(const std::string& text);

[[nodiscard]] std::string encode_attendees(const std::vector<Attendee>& attendees,
                                           QJsonDocument::JsonFormat format = QJsonDocument::Compact);

[[nodiscard]] Result<std::vector<Attendee>, Error> decode_attendees(const std::string& text);

} // namespace neetings::session
