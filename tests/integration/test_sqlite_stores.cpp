#include <catch2/catch_test_macros.hpp>

#include <QTemporaryDir>

#include "core/document_encoder.hpp"
#include "sync/document_json.hpp"
#include "sync/sqlite_stores.hpp"
#include "support/sync_fixture.hpp"

using namespace trellis;
using namespace trellis::sync;
using trellis::testing::DocBuilder;

TEST_CASE("SqliteStores: state and ids survive reopening", "[integration][storage]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const auto path = dir.filePath("trellis.db").toStdString();
    const auto page_id = new_global_id();
    const auto doc = DocBuilder("Todo").block(new_global_id(), "milk").build();

    {
        auto stores = SqliteStores::open(path, "work").unwrap();
        REQUIRE(stores->states().save(page_id, doc).is_ok());
        REQUIRE(stores->ids().put("block-1", "g-1").is_ok());
    }

    auto reopened = SqliteStores::open(path, "work").unwrap();
    auto loaded = reopened->states().load(page_id).unwrap();
    REQUIRE(loaded.has_value());
    REQUIRE(*loaded == doc);
    REQUIRE(reopened->ids().global_to_local("g-1").unwrap() == "block-1");
    REQUIRE(reopened->state_repository().page_ids().unwrap() == std::vector<PageId>{page_id});

    auto other_graph = SqliteStores::open(path, "home").unwrap();
    REQUIRE_FALSE(other_graph->states().load(page_id).unwrap().has_value());
    // The id mapping is shared by every graph in the file.
    REQUIRE(other_graph->ids().local_to_global("block-1").unwrap() == "g-1");
}

TEST_CASE("SqliteStores: removing state", "[integration][storage]") {
    auto stores = SqliteStores::open_memory("work").unwrap();
    const auto doc = DocBuilder("Todo").build();

    REQUIRE(stores->states().save("p", doc).is_ok());
    REQUIRE(stores->states().remove("p").is_ok());
    REQUIRE_FALSE(stores->states().load("p").unwrap().has_value());
}

TEST_CASE("SqliteStores: corrupt stored JSON is reported", "[integration][storage]") {
    auto stores = SqliteStores::open_memory("work").unwrap();
    REQUIRE(stores->state_repository().save("p", "{not json").is_ok());

    auto loaded = stores->states().load("p");
    REQUIRE(loaded.is_err());
    REQUIRE(loaded.unwrap_err().code == ErrorCode::Decode);
}

TEST_CASE("SqliteStores: unopenable path", "[integration][storage]") {
    QTemporaryDir dir;
    const auto path = dir.filePath("missing/dir/trellis.db").toStdString();

    auto stores = SqliteStores::open(path, "work");
    REQUIRE(stores.is_err());
    REQUIRE(stores.unwrap_err().code == ErrorCode::Storage);
}

TEST_CASE("SqliteStores: encoder ids persist across sessions", "[integration][storage]") {
    QTemporaryDir dir;
    const auto path = dir.filePath("trellis.db").toStdString();
    sync::MemoryNotebook notebook;
    doc::MarkdownInlineCodec codec;
    const auto page_id = new_global_id();
    const auto page = notebook.add_page("Todo", page_id);
    notebook.add_block(page, "milk");

    doc::FlatDocument first;
    {
        auto stores = SqliteStores::open(path, "work").unwrap();
        SyncContext ctx(notebook, stores->ids(), stores->states(), codec);
        ctx.open();
        first = doc::encode(ctx, page_id).unwrap();
    }

    auto stores = SqliteStores::open(path, "work").unwrap();
    SyncContext ctx(notebook, stores->ids(), stores->states(), codec);
    ctx.open();
    REQUIRE(doc::encode(ctx, page_id).unwrap() == first);
}
