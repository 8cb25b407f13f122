#include <catch2/catch_test_macros.hpp>
#include "storage/database.hpp"
#include "storage/durable_store.hpp"
#include "storage/migrations.hpp"
#include "storage/sqlite_store.hpp"
#include "core/types.hpp"

#include <filesystem>

using namespace neetings;
using namespace neetings::storage;

TEST_CASE("Database basic operations", "[storage]") {
    auto db_result = Database::open_memory();
    REQUIRE(db_result.is_ok());
    auto db = std::move(db_result).unwrap();
    REQUIRE(db.is_open());

    SECTION("Execute creates table") {
        auto result = db.execute("CREATE TABLE test (id INTEGER PRIMARY KEY);");
        REQUIRE(result.is_ok());
    }

    SECTION("Invalid SQL reports an error") {
        auto result = db.execute("CREATE TABLE (;");
        REQUIRE(result.is_err());
        REQUIRE_FALSE(result.unwrap_err().message.empty());
        REQUIRE(db.prepare("SELECT * FROM missing;").is_err());
    }

    SECTION("Prepare, bind and step") {
        REQUIRE(db.execute("CREATE TABLE test (id INTEGER, name TEXT);").is_ok());

        auto insert = db.prepare("INSERT INTO test VALUES (?, ?);").unwrap();
        REQUIRE(insert.bind_int(1, 1).is_ok());
        REQUIRE(insert.bind_text(2, "Alice").is_ok());
        REQUIRE(insert.step().unwrap() == false);
        REQUIRE(db.changes() == 1);

        REQUIRE(insert.reset().is_ok());
        REQUIRE(insert.bind_int64(1, 2).is_ok());
        REQUIRE(insert.bind_text(2, "Bob").is_ok());
        REQUIRE(insert.step().is_ok());

        REQUIRE(db.execute("INSERT INTO test VALUES (3, NULL);").is_ok());

        auto stmt = db.prepare("SELECT * FROM test ORDER BY id;").unwrap();

        REQUIRE(stmt.step().unwrap() == true);
        REQUIRE(stmt.column_int(0) == 1);
        REQUIRE(stmt.column_text(1) == "Alice");

        REQUIRE(stmt.step().unwrap() == true);
        REQUIRE(stmt.column_int64(0) == 2);
        REQUIRE(stmt.column_text(1) == "Bob");

        REQUIRE(stmt.step().unwrap() == true);
        REQUIRE(stmt.column_is_null(1));
        REQUIRE(stmt.column_text(1).empty());

        REQUIRE(stmt.step().unwrap() == false);
    }

    SECTION("Transaction commit") {
        REQUIRE(db.execute("CREATE TABLE test (id INTEGER);").is_ok());

        auto result = db.transaction([&]() -> Result<void, Error> {
            return db.execute("INSERT INTO test VALUES (1);")
                .and_then([&] { return db.execute("INSERT INTO test VALUES (2);"); });
        });

        REQUIRE(result.is_ok());

        auto stmt = db.prepare("SELECT COUNT(*) FROM test;").unwrap();
        REQUIRE(stmt.step().unwrap());
        REQUIRE(stmt.column_int(0) == 2);
    }

    SECTION("Transaction rollback on error") {
        REQUIRE(db.execute("CREATE TABLE test (id INTEGER);").is_ok());
        REQUIRE(db.execute("INSERT INTO test VALUES (1);").is_ok());

        auto result = db.transaction([&]() -> Result<void, Error> {
            auto inserted = db.execute("INSERT INTO test VALUES (2);");
            if (inserted.is_err()) return inserted;
            return Result<void, Error>::err(Error{"forced error"});
        });

        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().message == "forced error");

        auto stmt = db.prepare("SELECT COUNT(*) FROM test;").unwrap();
        REQUIRE(stmt.step().unwrap());
        REQUIRE(stmt.column_int(0) == 1);  // Rollback happened
    }

    SECTION("Closed database refuses work") {
        db.close();
        REQUIRE_FALSE(db.is_open());
        REQUIRE(db.execute("SELECT 1;").is_err());
        REQUIRE(db.prepare("SELECT 1;").is_err());
    }
}

TEST_CASE("Migrations", "[storage]") {
    auto db = Database::open_memory().unwrap();
    MigrationRunner runner(db);

    SECTION("Initial version is 0") {
        auto version = runner.current_version();
        REQUIRE(version.is_ok());
        REQUIRE(version.unwrap() == 0);
    }

    SECTION("Migrate to latest creates the documents table") {
        REQUIRE(runner.migrate().is_ok());
        REQUIRE(runner.current_version().unwrap() == MigrationRunner::latest_version());
        REQUIRE(db.execute("INSERT INTO documents VALUES ('k', 'v', 0);").is_ok());
    }

    SECTION("Migrate is idempotent") {
        REQUIRE(runner.migrate().is_ok());
        REQUIRE(runner.migrate().is_ok());
        REQUIRE(runner.current_version().unwrap() == MigrationRunner::latest_version());
    }

    SECTION("A schema from a newer build is refused") {
        REQUIRE(runner.current_version().is_ok());
        REQUIRE(db.execute("INSERT INTO schema_migrations VALUES (99, 'future', 0);").is_ok());

        auto result = runner.migrate();
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().message.find("newer") != std::string::npos);
        REQUIRE(db.prepare("SELECT * FROM documents;").is_err());
    }
}

TEST_CASE("SqliteStore", "[storage]") {
    auto store = SqliteStore::open_memory().unwrap();

    SECTION("Missing key reads as nullopt") {
        auto value = store.get("meetings");
        REQUIRE(value.is_ok());
        REQUIRE_FALSE(value.unwrap().has_value());
    }

    SECTION("Set then get") {
        REQUIRE(store.set("meetings", R"({"version":"1.0.0","meetings":[]})").is_ok());
        REQUIRE(store.get("meetings").unwrap() == std::optional<std::string>(
            R"({"version":"1.0.0","meetings":[]})"));
    }

    SECTION("Set replaces the previous value") {
        REQUIRE(store.set("meetings", "first").is_ok());
        REQUIRE(store.set("meetings", "second").is_ok());
        REQUIRE(store.get("meetings").unwrap() == std::optional<std::string>("second"));
    }

    SECTION("Values keep embedded unicode") {
        const std::string text = "Agenda \xE2\x9C\x93 caf\xC3\xA9";
        REQUIRE(store.set("attendees", text).is_ok());
        REQUIRE(*store.get("attendees").unwrap() == text);
    }

    SECTION("Remove") {
        REQUIRE(store.set("meetings", "x").is_ok());
        REQUIRE(store.set("attendees", "y").is_ok());

        REQUIRE(store.remove("meetings").is_ok());
        REQUIRE_FALSE(store.get("meetings").unwrap().has_value());
        REQUIRE(store.remove("meetings").is_ok());
        REQUIRE(store.get("attendees").unwrap() == std::optional<std::string>("y"));
    }
}

TEST_CASE("SqliteStore persists across reopen", "[storage]") {
    const auto path = std::filesystem::temp_directory_path() /
                      ("neetings-store-" + generate_id() + ".db");

    {
        auto store = SqliteStore::open(path.string()).unwrap();
        REQUIRE(store.set("meetings", "payload").is_ok());
    }
    {
        auto store = SqliteStore::open(path.string()).unwrap();
        REQUIRE(store.get("meetings").unwrap() == std::optional<std::string>("payload"));
    }

    std::error_code ec;
    for (const auto* suffix : {"", "-wal", "-shm"}) {
        std::filesystem::remove(path.string() + suffix, ec);
    }
}

TEST_CASE("MemoryStore", "[storage]") {
    MemoryStore store;

    REQUIRE_FALSE(store.get("k").unwrap().has_value());
    REQUIRE(store.set("k", "v").is_ok());
    REQUIRE(store.contains("k"));
    REQUIRE(store.get("k").unwrap() == std::optional<std::string>("v"));
    REQUIRE(store.write_count() == 1);

    SECTION("Rejected writes leave the value alone") {
        store.set_fail_writes(true);
        auto result = store.set("k", "w");
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().code == errc::write_failed);
        REQUIRE(store.remove("k").is_err());
        REQUIRE(store.get("k").unwrap() == std::optional<std::string>("v"));
        REQUIRE(store.write_count() == 1);
    }

    SECTION("Remove") {
        REQUIRE(store.remove("k").is_ok());
        REQUIRE(store.remove("missing").is_ok());
        REQUIRE_FALSE(store.contains("k"));
        REQUIRE(store.remove_count() == 2);
    }
}
