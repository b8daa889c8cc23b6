#pragma once

#include "storage/database.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace trellis::storage {

/**
 * PageState - A stored flat document, serialized.
 */
struct PageState {
    std::string state_key;      // "<graph>/<page id>"
    std::string document_json;
    int64_t updated_at{0};
};

/**
 * PageStateRepository - Data access layer for saved page documents.
 *
 * Keys are namespaced by graph so several notebooks can share one database.
 */
class PageStateRepository {
public:
    PageStateRepository(Database& db, std::string graph)
        : db_(db), graph_(std::move(graph)) {}

    [[nodiscard]] const std::string& graph() const { return graph_; }

    [[nodiscard]] std::string key_for(const PageId& page_id) const {
        return graph_ + "/" + page_id;
    }

    [[nodiscard]] Result<std::optional<PageState>, Error> get(const PageId& page_id);

    [[nodiscard]] Result<void, Error> save(const PageId& page_id, const std::string& document_json);

    [[nodiscard]] Result<void, Error> remove(const PageId& page_id);

    /**
     * Page ids with a saved state in this graph.
     */
    [[nodiscard]] Result<std::vector<PageId>, Error> page_ids();

private:
    Database& db_;
    std::string graph_;

    static PageState row_to_state(Statement& stmt);
};

} // namespace trellis::storage
