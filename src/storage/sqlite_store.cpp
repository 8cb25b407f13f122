#include "storage/sqlite_store.hpp"
#include "storage/migrations.hpp"

#include <QLoggingCategory>

#include <chrono>

Q_LOGGING_CATEGORY(neetingsStorageLog, "neetings.storage")

namespace neetings::storage {

Result<SqliteStore, Error> SqliteStore::from_database(Result<Database, Error> opened) {
    if (opened.is_err()) {
        qCWarning(neetingsStorageLog) << "open failed:" << opened.unwrap_err().message.c_str();
        return Result<SqliteStore, Error>::err(opened.unwrap_err());
    }

    auto db = std::move(opened).unwrap();
    auto migrated = initialize_database(db);
    if (migrated.is_err()) {
        qCWarning(neetingsStorageLog) << "migration failed:" << migrated.unwrap_err().message.c_str();
        return Result<SqliteStore, Error>::err(migrated.unwrap_err());
    }

    return Result<SqliteStore, Error>::ok(SqliteStore(std::move(db)));
}

Result<SqliteStore, Error> SqliteStore::open(const std::string& path) {
    qCDebug(neetingsStorageLog) << "opening" << path.c_str();
    return from_database(Database::open(path));
}

Result<SqliteStore, Error> SqliteStore::open_memory() {
    return from_database(Database::open_memory());
}

Result<std::optional<std::string>, Error> SqliteStore::get(const std::string& key) {
    using R = Result<std::optional<std::string>, Error>;

    auto stmt_result = db_.prepare("SELECT value FROM documents WHERE key = ?;");
    if (stmt_result.is_err()) {
        return R::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto bound = stmt.bind_text(1, key);
    if (bound.is_err()) {
        return R::err(bound.unwrap_err());
    }

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return R::err(step_result.unwrap_err());
    }
    if (!step_result.unwrap()) {
        return R::ok(std::nullopt);
    }

    return R::ok(stmt.column_text(0));
}

Result<void, Error> SqliteStore::set(const std::string& key, const std::string& value) {
    const auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    // Single statement: the replace is atomic without an explicit transaction.
    auto stmt_result = db_.prepare(R"SQL(
        INSERT INTO documents (key, value, updated_at) VALUES (?, ?, ?)
        ON CONFLICT(key) DO UPDATE SET value = excluded.value,
                                       updated_at = excluded.updated_at;
    )SQL");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto bound = stmt.bind_text(1, key)
        .and_then([&] { return stmt.bind_text(2, value); })
        .and_then([&] { return stmt.bind_int64(3, now); });
    if (bound.is_err()) {
        return bound;
    }

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        qCWarning(neetingsStorageLog) << "write of" << key.c_str() << "failed:"
                                      << step_result.unwrap_err().message.c_str();
        return Result<void, Error>::err(step_result.unwrap_err());
    }

    qCDebug(neetingsStorageLog) << "stored" << key.c_str() << value.size() << "bytes";
    return Result<void, Error>::ok();
}

Result<void, Error> SqliteStore::remove(const std::string& key) {
    auto stmt_result = db_.prepare("DELETE FROM documents WHERE key = ?;");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto bound = stmt.bind_text(1, key);
    if (bound.is_err()) {
        return bound;
    }

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<void, Error>::err(step_result.unwrap_err());
    }
    return Result<void, Error>::ok();
}

} // namespace neetings::storage
