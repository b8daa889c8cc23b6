#pragma once

#include "core/annotation.hpp"
#include "core/block_tree.hpp"
#include "core/context.hpp"
#include "core/mutation.hpp"
#include "core/result.hpp"

#include <cstddef>
#include <vector>

namespace trellis::tree {

/**
 * Rebuild the block tree shape described by a flat document.
 *
 * Blocks are inserted in document order at the depth given by their `level`:
 * level 0 appends a root, level L appends under the last block inserted at
 * level L-1 (or as deep as the tree goes if the document skips a level).
 * Node ids are global ids and node content is the plain text slice; no
 * inline markup is applied. This is the inverse of the encoder's traversal.
 */
[[nodiscard]] std::vector<BlockNode> build_desired_tree(const doc::FlatDocument& doc);

/**
 * Same shape as build_desired_tree, with each block's content serialized back
 * to raw markup from the inline annotations it contains.
 */
[[nodiscard]] Result<std::vector<BlockNode>> desired_tree(const doc::FlatDocument& doc);

/**
 * ReconcilePlan - ordered ops converging one page to a flat document.
 *
 * Order: metadata ops, deletes, creates (parents first), then moves and
 * updates. The list must be executed as is.
 */
struct ReconcilePlan {
    PageId page_id;
    LocalId root_id;  // where top-level blocks are created
    std::vector<MutationOp> ops;

    [[nodiscard]] bool empty() const { return ops.empty(); }
};

/**
 * Diff the document against the page's current local tree.
 * Reads the notebook and the id mapping; writes nothing.
 */
[[nodiscard]] Result<ReconcilePlan> plan(SyncContext& ctx,
                                         const PageId& page_id,
                                         const doc::FlatDocument& doc);

/**
 * Run a plan's ops one after another. The first failure stops the run and is
 * returned naming the op; ops already applied stay applied. Returns the
 * number of ops applied.
 */
[[nodiscard]] Result<std::size_t> execute(SyncContext& ctx, const ReconcilePlan& plan);

/**
 * plan + execute.
 */
[[nodiscard]] Result<std::size_t> reconcile(SyncContext& ctx,
                                            const PageId& page_id,
                                            const doc::FlatDocument& doc);

} // namespace trellis::tree
