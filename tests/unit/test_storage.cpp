#include <catch2/catch_test_macros.hpp>
#include "storage/database.hpp"
#include "storage/migrations.hpp"
#include "storage/id_mapping_repository.hpp"
#include "storage/page_state_repository.hpp"

#include <algorithm>

using namespace trellis;
using namespace trellis::storage;

TEST_CASE("Database basic operations", "[storage]") {
    auto db_result = Database::open_memory();
    REQUIRE(db_result.is_ok());
    auto db = std::move(db_result).unwrap();

    SECTION("Execute creates table") {
        auto result = db.execute("CREATE TABLE test (id INTEGER PRIMARY KEY);");
        REQUIRE(result.is_ok());
    }

    SECTION("Prepare, bind and step") {
        REQUIRE(db.execute("CREATE TABLE test (id INTEGER, name TEXT);").is_ok());

        auto insert = db.prepare("INSERT INTO test VALUES (?, ?);").unwrap();
        REQUIRE(all_bound(insert.bind_int(1, 1), insert.bind_text(2, "Alice")).is_ok());
        REQUIRE(insert.step().unwrap() == false);
        REQUIRE(insert.reset().is_ok());
        REQUIRE(all_bound(insert.bind_int(1, 2), insert.bind_null(2)).is_ok());
        REQUIRE(insert.step().is_ok());

        auto stmt = db.prepare("SELECT * FROM test ORDER BY id;").unwrap();

        REQUIRE(stmt.step().unwrap() == true);
        REQUIRE(stmt.column_int(0) == 1);
        REQUIRE(stmt.column_text(1) == "Alice");

        REQUIRE(stmt.step().unwrap() == true);
        REQUIRE(stmt.column_int64(0) == 2);
        REQUIRE(stmt.column_is_null(1));

        REQUIRE(stmt.step().unwrap() == false);
    }

    SECTION("Text keeps embedded bytes") {
        REQUIRE(db.execute("CREATE TABLE test (body TEXT);").is_ok());
        const std::string body("caf\xC3\xA9\nline", 10);

        auto insert = db.prepare("INSERT INTO test VALUES (?);").unwrap();
        REQUIRE(insert.bind_text(1, body).is_ok());
        REQUIRE(insert.step().is_ok());

        auto stmt = db.prepare("SELECT body FROM test;").unwrap();
        REQUIRE(stmt.step().unwrap());
        REQUIRE(stmt.column_text(0) == body);
    }

    SECTION("Bind out of range fails") {
        REQUIRE(db.execute("CREATE TABLE test (id INTEGER);").is_ok());
        auto insert = db.prepare("INSERT INTO test VALUES (?);").unwrap();

        auto bound = all_bound(insert.bind_int(1, 1), insert.bind_int(2, 2));
        REQUIRE(bound.is_err());
        REQUIRE(bound.unwrap_err().code == ErrorCode::Storage);
    }

    SECTION("Bad SQL reports a storage error") {
        auto result = db.prepare("SELEKT nothing;");
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().code == ErrorCode::Storage);
        REQUIRE(result.unwrap_err().native_code != 0);
    }

    SECTION("Transaction commit") {
        REQUIRE(db.execute("CREATE TABLE test (id INTEGER);").is_ok());

        auto result = db.transaction([&]() -> Result<void, Error> {
            auto first = db.execute("INSERT INTO test VALUES (1);");
            if (first.is_err()) return first;
            return db.execute("INSERT INTO test VALUES (2);");
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

    SECTION("Migrate to latest") {
        auto result = runner.migrate();
        REQUIRE(result.is_ok());

        auto version = runner.current_version();
        REQUIRE(version.unwrap() == MigrationRunner::latest_version());
        REQUIRE(db.execute("SELECT local_id, global_id FROM id_map;").is_ok());
        REQUIRE(db.execute("SELECT state_key, document_json FROM page_states;").is_ok());
    }

    SECTION("Migrate is idempotent") {
        REQUIRE(runner.migrate().is_ok());
        REQUIRE(runner.migrate().is_ok());

        auto version = runner.current_version();
        REQUIRE(version.unwrap() == MigrationRunner::latest_version());
    }

    SECTION("Step by step and back") {
        REQUIRE(runner.migrate_to(1).is_ok());
        REQUIRE(runner.current_version().unwrap() == 1);
        REQUIRE(db.execute("SELECT * FROM page_states;").is_err());

        REQUIRE(runner.migrate().is_ok());
        REQUIRE(runner.rollback().is_ok());
        REQUIRE(runner.current_version().unwrap() == 1);

        REQUIRE(runner.rollback_to(0).is_ok());
        REQUIRE(runner.current_version().unwrap() == 0);
        REQUIRE(db.execute("SELECT * FROM id_map;").is_err());
    }
}

TEST_CASE("IdMappingRepository", "[storage]") {
    auto db = Database::open_memory().unwrap();
    REQUIRE(initialize_database(db).is_ok());

    IdMappingRepository repo(db);

    SECTION("Unknown ids map to nothing") {
        REQUIRE_FALSE(repo.local_to_global("block-1").unwrap().has_value());
        REQUIRE_FALSE(repo.global_to_local("g-1").unwrap().has_value());
    }

    SECTION("Put maps both ways") {
        REQUIRE(repo.put("block-1", "g-1").is_ok());

        REQUIRE(repo.local_to_global("block-1").unwrap() == "g-1");
        REQUIRE(repo.global_to_local("g-1").unwrap() == "block-1");
        REQUIRE(repo.count().unwrap() == 1);
    }

    SECTION("Put replaces rows sharing either id") {
        REQUIRE(repo.put("block-1", "g-1").is_ok());
        REQUIRE(repo.put("block-2", "g-2").is_ok());

        // g-1 now belongs to block-2; block-2's old pairing disappears
        REQUIRE(repo.put("block-2", "g-1").is_ok());

        REQUIRE(repo.global_to_local("g-1").unwrap() == "block-2");
        REQUIRE_FALSE(repo.local_to_global("block-1").unwrap().has_value());
        REQUIRE_FALSE(repo.global_to_local("g-2").unwrap().has_value());
        REQUIRE(repo.count().unwrap() == 1);
    }

    SECTION("Remove needs both ids to match") {
        REQUIRE(repo.put("block-1", "g-1").is_ok());

        REQUIRE(repo.remove("block-1", "g-other").is_ok());
        REQUIRE(repo.count().unwrap() == 1);

        REQUIRE(repo.remove("block-1", "g-1").is_ok());
        REQUIRE(repo.count().unwrap() == 0);
    }
}

TEST_CASE("PageStateRepository", "[storage]") {
    auto db = Database::open_memory().unwrap();
    REQUIRE(initialize_database(db).is_ok());

    PageStateRepository repo(db, "work");

    SECTION("Keys are namespaced by graph") {
        REQUIRE(repo.key_for("p1") == "work/p1");
    }

    SECTION("Save and get") {
        REQUIRE(repo.save("p1", R"({"content":"a"})").is_ok());

        auto state = repo.get("p1").unwrap();
        REQUIRE(state.has_value());
        REQUIRE(state->state_key == "work/p1");
        REQUIRE(state->document_json == R"({"content":"a"})");
        REQUIRE(state->updated_at > 0);
    }

    SECTION("Save overwrites") {
        REQUIRE(repo.save("p1", "{}").is_ok());
        REQUIRE(repo.save("p1", R"({"content":"b"})").is_ok());

        REQUIRE(repo.get("p1").unwrap()->document_json == R"({"content":"b"})");
        REQUIRE(repo.page_ids().unwrap().size() == 1);
    }

    SECTION("Remove") {
        REQUIRE(repo.save("p1", "{}").is_ok());
        REQUIRE(repo.remove("p1").is_ok());

        REQUIRE_FALSE(repo.get("p1").unwrap().has_value());
    }

    SECTION("Graphs do not see each other") {
        PageStateRepository other(db, "home");
        REQUIRE(repo.save("p1", "{}").is_ok());
        REQUIRE(repo.save("p2", "{}").is_ok());
        REQUIRE(other.save("p3", "{}").is_ok());

        auto ids = repo.page_ids().unwrap();
        std::sort(ids.begin(), ids.end());
        REQUIRE(ids == std::vector<PageId>{"p1", "p2"});
        REQUIRE(other.page_ids().unwrap() == std::vector<PageId>{"p3"});
        REQUIRE_FALSE(other.get("p1").unwrap().has_value());
    }
}
