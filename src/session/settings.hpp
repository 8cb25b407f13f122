#pragma once

#include "core/positioning.hpp"
#include "session/update_queue.hpp"

#include <QString>

#include <chrono>
#include <string>

class QSettings;

namespace neetings::session {

inline constexpr const char* kSettingsAutosaveDelay = "storage/autosave_delay_ms";
inline constexpr const char* kSettingsMeetingsKey = "storage/meetings_key";
inline constexpr const char* kSettingsAttendeesKey = "storage/attendees_key";
inline constexpr const char* kSettingsMaxKeyLength = "ordering/max_key_length";

inline constexpr int kMaxAutosaveDelayMs = 10000;
inline constexpr int kMinKeyLength = 4;
inline constexpr int kMaxKeyLength = 1024;

/**
 * SessionSettings - the tunables of a session, read from QSettings.
 * Out-of-range values are clamped, not rejected.
 */
struct SessionSettings {
    std::chrono::milliseconds autosave_delay{DEFAULT_AUTOSAVE_DELAY};
    std::string meetings_key{"meetings"};
    std::string attendees_key{"attendees"};
    ordering::KeyPolicy key_policy{};
};

[[nodiscard]] SessionSettings load_settings(const QSettings& settings);

void save_settings(QSettings& settings, const SessionSettings& values);

/**
 * Database file path: cli_override if given, else $NEETINGS_DB_PATH, else
 * AppDataLocation/neetings.db. The containing directory is created.
 */
[[nodiscard]] QString resolve_database_path(const QString& cli_override = {});

} // namespace neetings::session
