#pragma once

#include "storage/database.hpp"
#include "core/result.hpp"

#include <string>
#include <vector>

namespace neetings::storage {

struct Migration {
    int version;
    std::string name;
    std::string sql;
};

/**
 * Forward-only schema steps, ascending by version.
 */
inline const std::vector<Migration> ALL_MIGRATIONS = {
    {
        .version = 1,
        .name = "documents",
        .sql = R"SQL(
            -- One row per persisted document (the meetings collection, the
            -- attendees collection). Values are whole serialized documents.
            CREATE TABLE IF NOT EXISTS documents (
                key TEXT PRIMARY KEY,
                value TEXT NOT NULL,
                updated_at INTEGER NOT NULL
            );
        )SQL"
    }
};

/**
 * MigrationRunner - brings a database's schema up to the latest version.
 *
 * Applied steps are recorded in schema_migrations. A database stamped with
 * a version this build does not know is refused rather than written to.
 */
class MigrationRunner {
public:
    explicit MigrationRunner(Database& db) : db_(db) {}

    [[nodiscard]] Result<void, Error> migrate();

    [[nodiscard]] Result<int, Error> current_version();

    [[nodiscard]] static int latest_version() {
        return ALL_MIGRATIONS.empty() ? 0 : ALL_MIGRATIONS.back().version;
    }

private:
    Database& db_;

    [[nodiscard]] Result<void, Error> apply(const Migration& m);
};

[[nodiscard]] inline Result<void, Error> initialize_database(Database& db) {
    MigrationRunner runner(db);
    return runner.migrate();
}

} // namespace neetings::storage
