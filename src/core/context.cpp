#include "core/context.hpp"

namespace trellis {

Result<void> SyncContext::require_open(std::string_view operation) const {
    if (open_) {
        return Result<void>::ok();
    }
    return Result<void>::err(Error{
        std::string(operation) + " called on a closed sync context", ErrorCode::Storage});
}

Result<GlobalId> SyncContext::global_id_for(const LocalId& local) {
    auto existing = ids_->local_to_global(local);
    if (existing.is_err()) {
        return Result<GlobalId>::err(existing.unwrap_err().with_context("Lookup of " + local));
    }
    if (existing.unwrap().has_value()) {
        return Result<GlobalId>::ok(*existing.unwrap());
    }

    auto global = new_global_id();
    auto saved = ids_->put(local, global);
    if (saved.is_err()) {
        return Result<GlobalId>::err(saved.unwrap_err().with_context("Saving id for " + local));
    }
    return Result<GlobalId>::ok(std::move(global));
}

} // namespace trellis
