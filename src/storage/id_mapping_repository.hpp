#pragma once

#include "storage/database.hpp"
#include "core/host.hpp"
#include "core/result.hpp"
#include <optional>
#include <string>

namespace trellis::storage {

/**
 * IdMappingRepository - IdentifierMappingStore on the `id_map` table.
 *
 * Both columns are unique, so `put` replaces any row that already uses the
 * local id or the global id.
 */
class IdMappingRepository final : public IdentifierMappingStore {
public:
    explicit IdMappingRepository(Database& db) : db_(db) {}

    [[nodiscard]] Result<std::optional<GlobalId>, Error> local_to_global(const LocalId& id) override;
    [[nodiscard]] Result<std::optional<LocalId>, Error> global_to_local(const GlobalId& id) override;
    [[nodiscard]] Result<void, Error> put(const LocalId& local, const GlobalId& global) override;
    [[nodiscard]] Result<void, Error> remove(const LocalId& local, const GlobalId& global) override;

    [[nodiscard]] Result<int64_t, Error> count();

private:
    Database& db_;

    [[nodiscard]] Result<std::optional<std::string>, Error> lookup(const std::string& sql,
                                                                   const std::string& key);
};

} // namespace trellis::storage
