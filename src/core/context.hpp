#pragma once

#include "core/host.hpp"
#include "core/result.hpp"

namespace trellis {

/**
 * SyncContext - the handles one page-sync session works with.
 *
 * Replaces ambient globals: encoder and reconciler get everything they touch
 * from here. The context does not own the handles; it is opened when a page
 * starts syncing and closed on teardown, after which every operation that
 * receives it fails instead of touching a stale store.
 */
class SyncContext {
public:
    SyncContext(NotebookAdapter& notebook,
                IdentifierMappingStore& ids,
                StateStore& states,
                const InlineMarkupCodec& codec)
        : notebook_(&notebook), ids_(&ids), states_(&states), codec_(&codec) {}

    SyncContext(const SyncContext&) = delete;
    SyncContext& operator=(const SyncContext&) = delete;

    void open() { open_ = true; }
    void close() { open_ = false; }
    [[nodiscard]] bool is_open() const { return open_; }

    /**
     * Ok while open, otherwise an error naming `operation`.
     */
    [[nodiscard]] Result<void> require_open(std::string_view operation) const;

    [[nodiscard]] NotebookAdapter& notebook() const { return *notebook_; }
    [[nodiscard]] IdentifierMappingStore& ids() const { return *ids_; }
    [[nodiscard]] StateStore& states() const { return *states_; }
    [[nodiscard]] const InlineMarkupCodec& codec() const { return *codec_; }

    /**
     * Global id for a local block, allocating and persisting a new one on
     * first sight. The mapping is written before the id is returned.
     */
    [[nodiscard]] Result<GlobalId> global_id_for(const LocalId& local);

private:
    NotebookAdapter* notebook_;
    IdentifierMappingStore* ids_;
    StateStore* states_;
    const InlineMarkupCodec* codec_;
    bool open_ = false;
};

} // namespace trellis
