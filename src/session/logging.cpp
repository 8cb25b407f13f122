#include "session/logging.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QStandardPaths>
#include <QtGlobal>

#include <cstdio>

Q_LOGGING_CATEGORY(neetingsQueueLog, "neetings.queue")
Q_LOGGING_CATEGORY(neetingsBoardLog, "neetings.board")
Q_LOGGING_CATEGORY(neetingsCodecLog, "neetings.codec")

namespace neetings::session {
namespace {

QString compute_log_file_path() {
    const auto base = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    if (base.isEmpty()) {
        return QString{};
    }
    return QDir(base).filePath(QStringLiteral("logs/neetings.log"));
}

const char* level_tag(QtMsgType type) {
    switch (type) {
        case QtDebugMsg: return "D";
        case QtInfoMsg: return "I";
        case QtWarningMsg: return "W";
        case QtCriticalMsg: return "C";
        case QtFatalMsg: return "F";
    }
    return "?";
}

// QtMsgType is not ordered by severity (QtInfoMsg sorts last).
int severity(QtMsgType type) {
    switch (type) {
        case QtDebugMsg: return 0;
        case QtInfoMsg: return 1;
        case QtWarningMsg: return 2;
        case QtCriticalMsg: return 3;
        case QtFatalMsg: return 4;
    }
    return 4;
}

struct LoggerState {
    QMutex mu;
    QFile file;
    QString path;
    int echo_threshold = severity(QtWarningMsg);
    QtMessageHandler previous = nullptr;
    bool installed = false;
};

LoggerState& state() {
    static LoggerState s{};
    return s;
}

// Called with the mutex held.
void open_log_file(LoggerState& s) {
    s.file.close();
    if (s.path.isEmpty()) {
        return;
    }

    QDir dir(QFileInfo(s.path).absolutePath());
    if (!dir.mkpath(QStringLiteral("."))) {
        std::fprintf(stderr, "neetings: cannot create log directory %s\n",
                     qPrintable(dir.absolutePath()));
        return;
    }

    s.file.setFileName(s.path);
    if (!s.file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        std::fprintf(stderr, "neetings: cannot open log file %s: %s\n",
                     qPrintable(s.path), qPrintable(s.file.errorString()));
    }
}

void message_handler(QtMsgType type,
                     const QMessageLogContext& ctx,
                     const QString& msg) {
    auto& s = state();
    QMutexLocker lock(&s.mu);

    const auto ts = QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs);
    const auto cat = ctx.category ? QString::fromLatin1(ctx.category) : QStringLiteral("");

    const auto line = QStringLiteral("%1 %2 %3 %4\n")
                          .arg(ts, QString::fromLatin1(level_tag(type)), cat, msg);

    if (s.file.isOpen()) {
        s.file.write(line.toUtf8());
        s.file.flush();
    }

    if (severity(type) >= s.echo_threshold) {
        std::fputs(line.toLocal8Bit().constData(), stderr);
    }
}

} // namespace

void install_file_logging(const QString& path) {
    auto& s = state();
    {
        QMutexLocker lock(&s.mu);
        s.path = path.isEmpty() ? compute_log_file_path() : path;
        open_log_file(s);
    }
    if (!s.installed) {
        s.previous = qInstallMessageHandler(message_handler);
        s.installed = true;
    }
}

void uninstall_file_logging() {
    auto& s = state();
    if (s.installed) {
        qInstallMessageHandler(s.previous);
        s.installed = false;
    }
    QMutexLocker lock(&s.mu);
    s.file.close();
    s.path.clear();
}

QString active_log_file_path() {
    auto& s = state();
    QMutexLocker lock(&s.mu);
    return s.file.isOpen() ? s.path : QString{};
}

void enable_debug_logging() {
    QLoggingCategory::setFilterRules(QStringLiteral("neetings.*.debug=true"));
    auto& s = state();
    QMutexLocker lock(&s.mu);
    s.echo_threshold = severity(QtDebugMsg);
}

} // namespace neetings::session
