#pragma once

#include "storage/database.hpp"
#include "storage/durable_store.hpp"

#include <optional>
#include <string>

namespace neetings::storage {

/**
 * SqliteStore - DurableStore over the documents table.
 *
 * Use open() / open_memory(); both run the schema migrations before the
 * store is handed out.
 */
class SqliteStore final : public DurableStore {
public:
    [[nodiscard]] static Result<SqliteStore, Error> open(const std::string& path);
    [[nodiscard]] static Result<SqliteStore, Error> open_memory();

    [[nodiscard]] Result<std::optional<std::string>, Error> get(const std::string& key) override;
    [[nodiscard]] Result<void, Error> set(const std::string& key, const std::string& value) override;
    [[nodiscard]] Result<void, Error> remove(const std::string& key) override;

private:
    explicit SqliteStore(Database db) : db_(std::move(db)) {}

    [[nodiscard]] static Result<SqliteStore, Error> from_database(Result<Database, Error> opened);

    Database db_;
};

} // namespace neetings::storage
