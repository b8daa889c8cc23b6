#include "sync/sqlite_stores.hpp"

#include "storage/migrations.hpp"
#include "sync/document_json.hpp"

namespace trellis::sync {

Result<std::optional<doc::FlatDocument>> SqliteStateStore::load(const PageId& page_id) {
    using Out = Result<std::optional<doc::FlatDocument>>;

    auto row = repo_.get(page_id);
    if (row.is_err()) {
        return Out::err(row.unwrap_err().with_context("Loading state of " + page_id));
    }
    if (!row.unwrap().has_value()) {
        return Out::ok(std::nullopt);
    }

    const auto& json = row.unwrap()->document_json;
    auto parsed = from_json(QByteArray::fromStdString(json));
    if (parsed.is_err()) {
        return Out::err(parsed.unwrap_err().with_context("Stored state of " + page_id));
    }
    return Out::ok(std::move(parsed).unwrap());
}

Result<void> SqliteStateStore::save(const PageId& page_id, const doc::FlatDocument& doc) {
    return repo_.save(page_id, to_json(doc).toStdString());
}

Result<void> SqliteStateStore::remove(const PageId& page_id) {
    return repo_.remove(page_id);
}

SqliteStores::SqliteStores(storage::Database db, const std::string& graph)
    : db_(std::move(db)),
      ids_(db_),
      state_repo_(db_, graph),
      states_(state_repo_) {}

Result<std::unique_ptr<SqliteStores>> SqliteStores::finish(Result<storage::Database> opened,
                                                           const std::string& graph) {
    using Out = Result<std::unique_ptr<SqliteStores>>;
    if (opened.is_err()) {
        return Out::err(opened.unwrap_err());
    }

    std::unique_ptr<SqliteStores> stores(new SqliteStores(std::move(opened).unwrap(), graph));
    auto migrated = storage::initialize_database(stores->db_);
    if (migrated.is_err()) {
        return Out::err(migrated.unwrap_err());
    }
    return Out::ok(std::move(stores));
}

Result<std::unique_ptr<SqliteStores>> SqliteStores::open(const std::string& path,
                                                         const std::string& graph) {
    return finish(storage::Database::open(path), graph);
}

Result<std::unique_ptr<SqliteStores>> SqliteStores::open_memory(const std::string& graph) {
    return finish(storage::Database::open_memory(), graph);
}

} // namespace trellis::sync
