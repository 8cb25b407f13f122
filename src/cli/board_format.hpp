#pragma once

#include "core/drag_reconciler.hpp"
#include "core/meeting.hpp"
#include "core/result.hpp"

#include <QString>

#include <vector>

namespace neetings::cli {

struct ListOptions {
    bool include_ids = false;
    bool include_keys = false;
};

// Plain-text board listing, one meeting after another:
//
// Weekly sync (2024-03-01)
//   Default
//     - Note: agenda
//   Risks
//     - TODO [x]: ship it
[[nodiscard]] QString format_meetings(const std::vector<Meeting>& meetings,
                                      const ListOptions& options = {});

// JSON output:
// { "meetings": [{ "id", "title", "date", "columns": [{ "groupId", "name", "blocks": [...] }] }] }
[[nodiscard]] QString format_meetings_json(const std::vector<Meeting>& meetings,
                                           const ListOptions& options = {});

// Drop target syntax for the `move` command: "group:default", "group:<id>"
// or the id of the block to drop onto.
[[nodiscard]] Result<ordering::DropTarget> parse_drop_target(const QString& text,
                                                             const Meeting& meeting);

} // namespace neetings::cli
