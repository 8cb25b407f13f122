#include "session/settings.hpp"

#include <QDir>
#include <QFileInfo>
#include <QSettings>
#include <QStandardPaths>

#include <algorithm>

namespace neetings::session {

namespace {

int read_clamped(const QSettings& settings, const char* key, int fallback, int lo, int hi) {
    bool ok = false;
    const int value = settings.value(QString::fromLatin1(key), fallback).toInt(&ok);
    if (!ok) {
        qCWarning(neetingsQueueLog) << "setting" << key << "is not a number, using" << fallback;
        return fallback;
    }
    const int clamped = std::clamp(value, lo, hi);
    if (clamped != value) {
        qCWarning(neetingsQueueLog) << "setting" << key << "=" << value << "clamped to" << clamped;
    }
    return clamped;
}

std::string read_key(const QSettings& settings, const char* key, const std::string& fallback) {
    const auto value = settings.value(QString::fromLatin1(key)).toString().trimmed();
    return value.isEmpty() ? fallback : value.toStdString();
}

QString ensure_parent_dir(const QString& path) {
    QFileInfo info(path);
    QDir dir(info.absolutePath());
    if (!dir.exists() && !dir.mkpath(".")) {
        qCWarning(neetingsQueueLog) << "cannot create directory" << dir.absolutePath();
    }
    return info.absoluteFilePath();
}

} // namespace

SessionSettings load_settings(const QSettings& settings) {
    SessionSettings defaults;
    SessionSettings out;

    out.autosave_delay = std::chrono::milliseconds(
        read_clamped(settings, kSettingsAutosaveDelay,
                     static_cast<int>(defaults.autosave_delay.count()), 0, kMaxAutosaveDelayMs));
    out.meetings_key = read_key(settings, kSettingsMeetingsKey, defaults.meetings_key);
    out.attendees_key = read_key(settings, kSettingsAttendeesKey, defaults.attendees_key);
    out.key_policy.max_length = static_cast<std::size_t>(
        read_clamped(settings, kSettingsMaxKeyLength,
                     static_cast<int>(defaults.key_policy.max_length), kMinKeyLength, kMaxKeyLength));
    return out;
}

void save_settings(QSettings& settings, const SessionSettings& values) {
    settings.setValue(QString::fromLatin1(kSettingsAutosaveDelay),
                      static_cast<int>(values.autosave_delay.count()));
    settings.setValue(QString::fromLatin1(kSettingsMeetingsKey),
                      QString::fromStdString(values.meetings_key));
    settings.setValue(QString::fromLatin1(kSettingsAttendeesKey),
                      QString::fromStdString(values.attendees_key));
    settings.setValue(QString::fromLatin1(kSettingsMaxKeyLength),
                      static_cast<int>(values.key_policy.max_length));
}

QString resolve_database_path(const QString& cli_override) {
    if (!cli_override.isEmpty()) {
        return ensure_parent_dir(cli_override);
    }

    const auto env_path = qEnvironmentVariable("NEETINGS_DB_PATH");
    if (!env_path.isEmpty()) {
        return ensure_parent_dir(env_path);
    }

    const QString data_path = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    return ensure_parent_dir(data_path + "/neetings.db");
}

} // namespace neetings::session
