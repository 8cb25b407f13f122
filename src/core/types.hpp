#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace neetings {

/**
 * Group identity of an orderable item. nullopt is the default (ungrouped)
 * column.
 */
using GroupId = std::optional<std::string>;

/**
 * Collapse the spellings of "no group" (absent, empty string) into nullopt.
 */
[[nodiscard]] inline GroupId normalize_group_id(const GroupId& group_id) {
    if (!group_id || group_id->empty()) return std::nullopt;
    return group_id;
}

/**
 * A fresh random (version 4) UUID in its hyphenated lowercase form.
 */
[[nodiscard]] std::string generate_id();

/**
 * Current UTC time as ISO 8601 with milliseconds, e.g.
 * "2024-03-01T09:30:00.000Z".
 */
[[nodiscard]] std::string now_iso8601();

/**
 * Format a time point the same way as now_iso8601().
 */
[[nodiscard]] std::string to_iso8601(std::chrono::system_clock::time_point tp);

/**
 * Current UTC calendar date, "YYYY-MM-DD".
 */
[[nodiscard]] std::string today_date();

} // namespace neetings
