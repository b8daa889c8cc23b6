#pragma once

#include "core/annotation.hpp"
#include "core/types.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace trellis::tree {

struct BlockNode;

/**
 * BlockRef - a child the host reported by id only (collapsed subtree).
 */
struct BlockRef {
    LocalId id;

    bool operator==(const BlockRef&) const = default;
};

/**
 * BlockChild - a child entry as the host reports it: either an expanded node
 * or a reference that still has to be fetched.
 */
using BlockChild = std::variant<BlockNode, BlockRef>;

/**
 * BlockNode - one block of a notebook page.
 *
 * `id` is the host's local id for blocks read from the notebook. Trees built
 * from a flat document carry global ids here instead; the flattener does not
 * care which.
 */
struct BlockNode {
    LocalId id;
    std::string content;                       // raw markup, may hold `key:: value` lines
    std::optional<ViewType> view_type;         // unset inherits from the parent
    std::map<std::string, std::string> properties;
    std::vector<BlockChild> children;

    bool operator==(const BlockNode&) const = default;
};

/**
 * FlatEntry - a block without its children, plus its position.
 */
struct FlatEntry {
    LocalId id;
    std::string content;
    std::optional<ViewType> view_type;
    std::size_t order{0};  // zero-based index among the parent's expanded children
    LocalId parent_id;

    bool operator==(const FlatEntry&) const = default;
};

/**
 * Depth-first, parent-before-children flattening. Top-level entries get
 * `root_parent_id` as their parent. References are skipped and do not take
 * an order slot; normalize the tree first when they matter.
 */
[[nodiscard]] std::vector<FlatEntry> flatten(const std::vector<BlockNode>& roots,
                                             const LocalId& root_parent_id);

/**
 * Expanded children of a node, references skipped.
 */
[[nodiscard]] std::vector<const BlockNode*> expanded_children(const BlockNode& node);

/**
 * Remove every `key:: value` property line (anywhere in the text).
 */
[[nodiscard]] std::string strip_property_lines(std::string_view content);

/**
 * `key:: value` lines of a block's text, keyed by property name.
 */
[[nodiscard]] std::map<std::string, std::string> parse_properties(std::string_view content);

/**
 * Replace the first `key:: ...` line, or append `\nkey:: value` when the
 * block has none.
 */
[[nodiscard]] std::string with_property(std::string_view content,
                                        const std::string& key,
                                        const std::string& value);

/**
 * A block carries content if it is empty or if anything is left once its
 * property lines are removed. Pure property holders (the page's `samepage::`
 * block) are not content.
 */
[[nodiscard]] bool is_content_block(const BlockNode& node);

[[nodiscard]] std::vector<BlockNode> content_blocks(std::vector<BlockNode> nodes);

/**
 * Remove the properties the sync layer itself writes (`id:: <own id>`,
 * `title:: ...`, `samepage:: <uuid>`) and a trailing newline.
 */
[[nodiscard]] std::string strip_sync_properties(std::string_view content, const LocalId& own_id);

} // namespace trellis::tree
