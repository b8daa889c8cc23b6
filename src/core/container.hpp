#pragma once

#include "core/block_tree.hpp"
#include "core/context.hpp"
#include "core/result.hpp"

#include <optional>
#include <string>
#include <vector>

namespace trellis {

/**
 * Container - what a shared page id points at in the notebook.
 *
 * A shared page is either a whole page (found through its `samepage::`
 * property) or a single block whose subtree is shared; in that case the
 * page id is the block's local id and the block's text is the title.
 */
struct Container {
    enum class Kind {
        Page,
        Block
    };

    Kind kind{Kind::Page};
    LocalId root_id;                  // page entity id, or the shared block's id
    std::string title;
    std::optional<LocalId> parent_id; // parent page/block of the container
    std::vector<tree::BlockNode> blocks; // content blocks, references expanded
};

/**
 * Replace BlockRef children with the blocks they point at, recursively.
 * References the host no longer knows are dropped.
 */
[[nodiscard]] Result<std::vector<tree::BlockNode>> expand_references(
    NotebookAdapter& notebook, std::vector<tree::BlockNode> nodes);

/**
 * Resolve `page_id` to its container and read its current tree.
 * Returns nullopt when neither a page nor a block matches.
 */
[[nodiscard]] Result<std::optional<Container>> load_container(SyncContext& ctx,
                                                              const PageId& page_id);

} // namespace trellis
