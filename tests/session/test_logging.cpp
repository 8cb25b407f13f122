#include <catch2/catch_test_macros.hpp>
#include "session/logging.hpp"

#include <QFile>
#include <QTemporaryDir>

using namespace neetings::session;

namespace {

QString read_all(const QString& path) {
    QFile file(path);
    REQUIRE(file.open(QIODevice::ReadOnly | QIODevice::Text));
    return QString::fromUtf8(file.readAll());
}

} // namespace

TEST_CASE("Log lines land in the log file", "[logging]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const auto path = dir.filePath(QStringLiteral("logs/run.log"));

    install_file_logging(path);
    REQUIRE(active_log_file_path() == path);

    qCWarning(neetingsQueueLog) << "write of meetings failed";
    qCInfo(neetingsBoardLog) << "deleted topic group";
    uninstall_file_logging();
    REQUIRE(active_log_file_path().isEmpty());

    const auto text = read_all(path);
    REQUIRE(text.contains(QStringLiteral(" W neetings.queue write of meetings failed\n")));
    REQUIRE(text.contains(QStringLiteral(" I neetings.board deleted topic group\n")));

    SECTION("Nothing is written after uninstalling") {
        qCWarning(neetingsQueueLog) << "after";
        REQUIRE_FALSE(read_all(path).contains(QStringLiteral("after")));
    }

    SECTION("Reinstalling appends") {
        install_file_logging(path);
        qCWarning(neetingsCodecLog) << "second run";
        uninstall_file_logging();

        const auto again = read_all(path);
        REQUIRE(again.startsWith(text));
        REQUIRE(again.contains(QStringLiteral(" W neetings.codec second run\n")));
    }
}

TEST_CASE("An unwritable log path is reported, not fatal", "[logging]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    QFile blocker(dir.filePath(QStringLiteral("blocker")));
    REQUIRE(blocker.open(QIODevice::WriteOnly));
    blocker.close();

    install_file_logging(dir.filePath(QStringLiteral("blocker/run.log")));
    REQUIRE(active_log_file_path().isEmpty());
    qCWarning(neetingsQueueLog) << "still delivered";
    uninstall_file_logging();
}
