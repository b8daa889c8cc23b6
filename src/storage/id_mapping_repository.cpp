#include "storage/id_mapping_repository.hpp"

namespace trellis::storage {

Result<std::optional<std::string>, Error> IdMappingRepository::lookup(const std::string& sql,
                                                                      const std::string& key) {
    auto stmt_result = db_.prepare(sql);
    if (stmt_result.is_err()) {
        return Result<std::optional<std::string>, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto bound = stmt.bind_text(1, key);
    if (bound.is_err()) {
        return Result<std::optional<std::string>, Error>::err(bound.unwrap_err());
    }

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<std::optional<std::string>, Error>::err(step_result.unwrap_err());
    }

    if (!step_result.unwrap()) {
        return Result<std::optional<std::string>, Error>::ok(std::nullopt);
    }

    return Result<std::optional<std::string>, Error>::ok(stmt.column_text(0));
}

Result<std::optional<GlobalId>, Error> IdMappingRepository::local_to_global(const LocalId& id) {
    return lookup("SELECT global_id FROM id_map WHERE local_id = ?;", id);
}

Result<std::optional<LocalId>, Error> IdMappingRepository::global_to_local(const GlobalId& id) {
    return lookup("SELECT local_id FROM id_map WHERE global_id = ?;", id);
}

Result<void, Error> IdMappingRepository::put(const LocalId& local, const GlobalId& global) {
    return db_.transaction([&]() -> Result<void, Error> {
        auto clear_result = db_.prepare(
            "DELETE FROM id_map WHERE local_id = ? OR global_id = ?;");
        if (clear_result.is_err()) {
            return Result<void, Error>::err(clear_result.unwrap_err());
        }
        auto clear = std::move(clear_result).unwrap();
        auto bound = all_bound(clear.bind_text(1, local), clear.bind_text(2, global));
        if (bound.is_err()) {
            return bound;
        }
        auto cleared = clear.step();
        if (cleared.is_err()) {
            return Result<void, Error>::err(cleared.unwrap_err());
        }

        auto stmt_result = db_.prepare(R"SQL(
            INSERT INTO id_map (local_id, global_id, created_at) VALUES (?, ?, ?);
        )SQL");
        if (stmt_result.is_err()) {
            return Result<void, Error>::err(stmt_result.unwrap_err());
        }
        auto stmt = std::move(stmt_result).unwrap();
        bound = all_bound(stmt.bind_text(1, local),
                          stmt.bind_text(2, global),
                          stmt.bind_int64(3, now_millis()));
        if (bound.is_err()) {
            return bound;
        }
        auto step_result = stmt.step();
        if (step_result.is_err()) {
            return Result<void, Error>::err(step_result.unwrap_err().with_context(
                "Saving id " + local + " -> " + global));
        }
        return Result<void, Error>::ok();
    });
}

Result<void, Error> IdMappingRepository::remove(const LocalId& local, const GlobalId& global) {
    auto stmt_result = db_.prepare("DELETE FROM id_map WHERE local_id = ? AND global_id = ?;");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto bound = all_bound(stmt.bind_text(1, local), stmt.bind_text(2, global));
    if (bound.is_err()) {
        return bound;
    }

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<void, Error>::err(step_result.unwrap_err());
    }

    return Result<void, Error>::ok();
}

Result<int64_t, Error> IdMappingRepository::count() {
    auto stmt_result = db_.prepare("SELECT COUNT(*) FROM id_map;");
    if (stmt_result.is_err()) {
        return Result<int64_t, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<int64_t, Error>::err(step_result.unwrap_err());
    }

    return Result<int64_t, Error>::ok(stmt.column_int64(0));
}

} // namespace trellis::storage
