#include "storage/migrations.hpp"

#include <chrono>

namespace neetings::storage {

Result<int, Error> MigrationRunner::current_version() {
    auto created = db_.execute(R"SQL(
        CREATE TABLE IF NOT EXISTS schema_migrations (
            version INTEGER PRIMARY KEY,
            name TEXT NOT NULL,
            applied_at INTEGER NOT NULL
        );
    )SQL");
    if (created.is_err()) {
        return Result<int, Error>::err(created.unwrap_err());
    }

    return db_.prepare("SELECT COALESCE(MAX(version), 0) FROM schema_migrations;")
        .and_then([](Statement stmt) -> Result<int, Error> {
            auto stepped = stmt.step();
            if (stepped.is_err()) {
                return Result<int, Error>::err(stepped.unwrap_err());
            }
            return Result<int, Error>::ok(stmt.column_int(0));
        });
}

Result<void, Error> MigrationRunner::apply(const Migration& m) {
    auto executed = db_.execute(m.sql);
    if (executed.is_err()) {
        return Result<void, Error>::err(Error{
            "schema step " + std::to_string(m.version) + " (" + m.name + ") failed: " +
            executed.unwrap_err().message
        });
    }

    const auto applied_at = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    auto prepared = db_.prepare(
        "INSERT INTO schema_migrations (version, name, applied_at) VALUES (?, ?, ?);");
    if (prepared.is_err()) {
        return Result<void, Error>::err(prepared.unwrap_err());
    }
    auto stmt = std::move(prepared).unwrap();
    return stmt.bind_int(1, m.version)
        .and_then([&] { return stmt.bind_text(2, m.name); })
        .and_then([&] { return stmt.bind_int64(3, applied_at); })
        .and_then([&]() -> Result<void, Error> {
            auto stepped = stmt.step();
            if (stepped.is_err()) {
                return Result<void, Error>::err(stepped.unwrap_err());
            }
            return Result<void, Error>::ok();
        });
}

Result<void, Error> MigrationRunner::migrate() {
    auto version = current_version();
    if (version.is_err()) {
        return Result<void, Error>::err(version.unwrap_err());
    }

    const int current = version.unwrap();
    if (current > latest_version()) {
        return Result<void, Error>::err(Error{
            "database schema version " + std::to_string(current) +
            " is newer than this build supports (" + std::to_string(latest_version()) + ")"
        });
    }
    if (current == latest_version()) {
        return Result<void, Error>::ok();
    }

    return db_.transaction([&]() -> Result<void, Error> {
        for (const auto& m : ALL_MIGRATIONS) {
            if (m.version <= current) continue;
            auto applied = apply(m);
            if (applied.is_err()) {
                return applied;
            }
        }
        return Result<void, Error>::ok();
    });
}

} // namespace neetings::storage
