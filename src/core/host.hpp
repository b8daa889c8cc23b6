#pragma once

#include "core/annotation.hpp"
#include "core/block_tree.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <cstddef>
#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace trellis {

/// `order` value meaning "after the last child".
inline constexpr std::size_t kAppend = std::numeric_limits<std::size_t>::max();

/**
 * PageInfo - a notebook page that claims a shared page id.
 */
struct PageInfo {
    LocalId id;                // host id of the page entity
    std::string original_name; // display title, also the host's page key
    std::optional<LocalId> parent_id;

    bool operator==(const PageInfo&) const = default;
};

/**
 * NotebookAdapter - the host notebook's block tree API.
 *
 * Parents passed to create/move are either a block's local id or the `id` of
 * the page the tree lives in. `order` counts content blocks only (see
 * tree::is_content_block); property-only blocks never shift it.
 */
class NotebookAdapter {
public:
    virtual ~NotebookAdapter() = default;

    /// Page whose `samepage::` property equals `page_id`.
    [[nodiscard]] virtual Result<std::optional<PageInfo>> find_page(const PageId& page_id) = 0;

    /// Top-level blocks of a page by its name (empty if there is no such page).
    [[nodiscard]] virtual Result<std::vector<tree::BlockNode>> get_block_tree(
        const std::string& page_name) = 0;

    /// A block with its children, or nullopt.
    [[nodiscard]] virtual Result<std::optional<tree::BlockNode>> get_block(const LocalId& id) = 0;

    /// Parent block or page id of a block, or nullopt if the block is unknown.
    [[nodiscard]] virtual Result<std::optional<LocalId>> parent_of(const LocalId& id) = 0;

    [[nodiscard]] virtual Result<LocalId> create_block(const LocalId& parent_id,
                                                       std::size_t order,
                                                       const std::string& content) = 0;

    [[nodiscard]] virtual Result<void> update_block(const LocalId& id, const std::string& content) = 0;

    [[nodiscard]] virtual Result<void> move_block(const LocalId& id,
                                                  const LocalId& new_parent_id,
                                                  std::size_t order) = 0;

    [[nodiscard]] virtual Result<void> remove_block(const LocalId& id) = 0;

    [[nodiscard]] virtual Result<void> rename_page(const std::string& old_title,
                                                   const std::string& new_title) = 0;

    [[nodiscard]] virtual Result<void> set_block_property(const LocalId& id,
                                                          const std::string& key,
                                                          const std::string& value) = 0;
};

/**
 * IdentifierMappingStore - persistent bijection between local and global ids.
 * Lookups of unknown ids return an empty optional, not an error.
 */
class IdentifierMappingStore {
public:
    virtual ~IdentifierMappingStore() = default;

    [[nodiscard]] virtual Result<std::optional<GlobalId>> local_to_global(const LocalId& id) = 0;
    [[nodiscard]] virtual Result<std::optional<LocalId>> global_to_local(const GlobalId& id) = 0;
    [[nodiscard]] virtual Result<void> put(const LocalId& local, const GlobalId& global) = 0;
    [[nodiscard]] virtual Result<void> remove(const LocalId& local, const GlobalId& global) = 0;
};

/**
 * StateStore - last known flat document per shared page.
 */
class StateStore {
public:
    virtual ~StateStore() = default;

    [[nodiscard]] virtual Result<std::optional<doc::FlatDocument>> load(const PageId& page_id) = 0;
    [[nodiscard]] virtual Result<void> save(const PageId& page_id, const doc::FlatDocument& doc) = 0;
    [[nodiscard]] virtual Result<void> remove(const PageId& page_id) = 0;
};

/**
 * DecodedText - plain text plus inline annotations relative to it.
 */
struct DecodedText {
    std::string text;
    std::vector<doc::Annotation> annotations;

    bool operator==(const DecodedText&) const = default;
};

/**
 * InlineMarkupCodec - raw block markup to plain text plus inline marks.
 * The reverse direction is doc::serialize_block.
 */
class InlineMarkupCodec {
public:
    virtual ~InlineMarkupCodec() = default;

    [[nodiscard]] virtual DecodedText decode(std::string_view raw) const = 0;
};

} // namespace trellis
