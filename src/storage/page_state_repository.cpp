#include "storage/page_state_repository.hpp"

namespace trellis::storage {

PageState PageStateRepository::row_to_state(Statement& stmt) {
    return PageState{
        .state_key = stmt.column_text(0),
        .document_json = stmt.column_text(1),
        .updated_at = stmt.column_int64(2)
    };
}

Result<std::optional<PageState>, Error> PageStateRepository::get(const PageId& page_id) {
    auto stmt_result = db_.prepare(R"SQL(
        SELECT state_key, document_json, updated_at
        FROM page_states WHERE state_key = ?;
    )SQL");

    if (stmt_result.is_err()) {
        return Result<std::optional<PageState>, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto bound = stmt.bind_text(1, key_for(page_id));
    if (bound.is_err()) {
        return Result<std::optional<PageState>, Error>::err(bound.unwrap_err());
    }

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<std::optional<PageState>, Error>::err(step_result.unwrap_err());
    }

    if (!step_result.unwrap()) {
        return Result<std::optional<PageState>, Error>::ok(std::nullopt);
    }

    return Result<std::optional<PageState>, Error>::ok(row_to_state(stmt));
}

Result<void, Error> PageStateRepository::save(const PageId& page_id,
                                              const std::string& document_json) {
    auto stmt_result = db_.prepare(R"SQL(
        INSERT INTO page_states (state_key, document_json, updated_at)
        VALUES (?, ?, ?)
        ON CONFLICT(state_key) DO UPDATE SET
            document_json = excluded.document_json,
            updated_at = excluded.updated_at;
    )SQL");

    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto bound = all_bound(stmt.bind_text(1, key_for(page_id)),
                           stmt.bind_text(2, document_json),
                           stmt.bind_int64(3, now_millis()));
    if (bound.is_err()) {
        return bound;
    }

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<void, Error>::err(step_result.unwrap_err());
    }

    return Result<void, Error>::ok();
}

Result<void, Error> PageStateRepository::remove(const PageId& page_id) {
    auto stmt_result = db_.prepare("DELETE FROM page_states WHERE state_key = ?;");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto bound = stmt.bind_text(1, key_for(page_id));
    if (bound.is_err()) {
        return bound;
    }

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<void, Error>::err(step_result.unwrap_err());
    }

    return Result<void, Error>::ok();
}

Result<std::vector<PageId>, Error> PageStateRepository::page_ids() {
    auto stmt_result = db_.prepare(R"SQL(
        SELECT state_key FROM page_states
        WHERE instr(state_key, ?) = 1
        ORDER BY state_key;
    )SQL");

    if (stmt_result.is_err()) {
        return Result<std::vector<PageId>, Error>::err(stmt_result.unwrap_err());
    }

    const auto prefix = graph_ + "/";
    auto stmt = std::move(stmt_result).unwrap();
    auto bound = stmt.bind_text(1, prefix);
    if (bound.is_err()) {
        return Result<std::vector<PageId>, Error>::err(bound.unwrap_err());
    }

    std::vector<PageId> ids;
    while (true) {
        auto step_result = stmt.step();
        if (step_result.is_err()) {
            return Result<std::vector<PageId>, Error>::err(step_result.unwrap_err());
        }
        if (!step_result.unwrap()) break;
        ids.push_back(stmt.column_text(0).substr(prefix.size()));
    }

    return Result<std::vector<PageId>, Error>::ok(std::move(ids));
}

} // namespace trellis::storage
