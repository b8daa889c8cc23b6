#pragma once

#include "core/annotation.hpp"
#include "core/block_tree.hpp"
#include "core/context.hpp"
#include "core/result.hpp"

#include <string>
#include <vector>

namespace trellis::doc {

/**
 * Encode a block tree under a title into a flat document.
 *
 * Depth-first, left to right: each block contributes its plain text, one
 * `block` annotation (global id, depth, inherited view type) and its inline
 * annotations shifted to document offsets. Global ids come from
 * `ctx.global_id_for`, so unseen blocks get a mapping persisted before
 * encoding moves on.
 */
[[nodiscard]] Result<FlatDocument> encode_tree(SyncContext& ctx,
                                               const std::string& title,
                                               const GlobalId& parent,
                                               const std::vector<tree::BlockNode>& blocks);

/**
 * Encode the current state of a shared page (or shared block subtree).
 * MissingPage if `page_id` resolves to nothing.
 */
[[nodiscard]] Result<FlatDocument> encode(SyncContext& ctx, const PageId& page_id);

} // namespace trellis::doc
