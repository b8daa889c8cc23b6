#pragma once

#include "core/host.hpp"
#include "core/result.hpp"
#include "storage/database.hpp"
#include "storage/id_mapping_repository.hpp"
#include "storage/page_state_repository.hpp"

#include <memory>
#include <string>
#include <vector>

namespace trellis::sync {

/**
 * SqliteStateStore - StateStore writing documents as JSON rows.
 */
class SqliteStateStore final : public StateStore {
public:
    explicit SqliteStateStore(storage::PageStateRepository& repo) : repo_(repo) {}

    [[nodiscard]] Result<std::optional<doc::FlatDocument>> load(const PageId& page_id) override;
    [[nodiscard]] Result<void> save(const PageId& page_id, const doc::FlatDocument& doc) override;
    [[nodiscard]] Result<void> remove(const PageId& page_id) override;

private:
    storage::PageStateRepository& repo_;
};

/**
 * SqliteStores - one migrated database plus the stores built on it.
 *
 * Repositories keep a reference to the database, so the bundle is pinned in
 * memory and handed out as a unique_ptr.
 */
class SqliteStores {
public:
    SqliteStores(const SqliteStores&) = delete;
    SqliteStores& operator=(const SqliteStores&) = delete;

    [[nodiscard]] static Result<std::unique_ptr<SqliteStores>> open(const std::string& path,
                                                                    const std::string& graph);

    [[nodiscard]] static Result<std::unique_ptr<SqliteStores>> open_memory(const std::string& graph);

    [[nodiscard]] IdentifierMappingStore& ids() { return ids_; }
    [[nodiscard]] StateStore& states() { return states_; }
    [[nodiscard]] storage::IdMappingRepository& id_repository() { return ids_; }
    [[nodiscard]] storage::PageStateRepository& state_repository() { return state_repo_; }
    [[nodiscard]] storage::Database& database() { return db_; }

private:
    SqliteStores(storage::Database db, const std::string& graph);

    [[nodiscard]] static Result<std::unique_ptr<SqliteStores>> finish(
        Result<storage::Database> opened, const std::string& graph);

    storage::Database db_;
    storage::IdMappingRepository ids_;
    storage::PageStateRepository state_repo_;
    SqliteStateStore states_;
};

} // namespace trellis::sync
