#pragma once

#include "core/host.hpp"
#include "core/result.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace trellis::sync {

/**
 * MemoryNotebook - NotebookAdapter over an in-process outline.
 *
 * Behaves like an outliner host: block properties live in the block text as
 * `key:: value` lines, a page claims a shared page id through a
 * `samepage::` property block, collapsed blocks report their children as
 * references, and renaming onto an existing page merges the two.
 * Used by the inspection tool and the tests.
 */
class MemoryNotebook final : public NotebookAdapter {
public:
    MemoryNotebook() = default;

    // Outline building ------------------------------------------------------

    /**
     * Create a page. With `samepage` set, a property block claiming that
     * shared page id is added as its first block.
     */
    LocalId add_page(const std::string& name, const std::optional<PageId>& samepage = std::nullopt);

    /**
     * Append a block under a page or block. Unknown parents throw
     * std::invalid_argument (outline building is test/tool setup, not sync).
     */
    LocalId add_block(const LocalId& parent_id,
                      const std::string& content,
                      std::optional<ViewType> view_type = std::nullopt);

    void set_collapsed(const LocalId& id, bool collapsed);

    // Inspection ------------------------------------------------------------

    [[nodiscard]] std::optional<LocalId> page_id_by_name(const std::string& name) const;
    [[nodiscard]] std::optional<std::string> content_of(const LocalId& id) const;
    [[nodiscard]] std::vector<LocalId> children_of(const LocalId& id) const;
    [[nodiscard]] std::size_t block_count() const;

    /**
     * Indented outline of a page's blocks, one `- content` line each,
     * property lines removed. Handy for assertions.
     */
    [[nodiscard]] std::string outline(const std::string& page_name) const;

    /**
     * Let `n` more mutations succeed, then fail every following one.
     */
    void fail_mutations_after(std::size_t n);
    void clear_failures();
    [[nodiscard]] std::size_t mutation_count() const { return mutations_; }

    // NotebookAdapter -------------------------------------------------------

    [[nodiscard]] Result<std::optional<PageInfo>> find_page(const PageId& page_id) override;
    [[nodiscard]] Result<std::vector<tree::BlockNode>> get_block_tree(
        const std::string& page_name) override;
    [[nodiscard]] Result<std::optional<tree::BlockNode>> get_block(const LocalId& id) override;
    [[nodiscard]] Result<std::optional<LocalId>> parent_of(const LocalId& id) override;
    [[nodiscard]] Result<LocalId> create_block(const LocalId& parent_id,
                                               std::size_t order,
                                               const std::string& content) override;
    [[nodiscard]] Result<void> update_block(const LocalId& id, const std::string& content) override;
    [[nodiscard]] Result<void> move_block(const LocalId& id,
                                          const LocalId& new_parent_id,
                                          std::size_t order) override;
    [[nodiscard]] Result<void> remove_block(const LocalId& id) override;
    [[nodiscard]] Result<void> rename_page(const std::string& old_title,
                                           const std::string& new_title) override;
    [[nodiscard]] Result<void> set_block_property(const LocalId& id,
                                                  const std::string& key,
                                                  const std::string& value) override;

private:
    struct Entity {
        LocalId id;
        bool is_page = false;
        std::string content;  // page name for pages
        std::optional<ViewType> view_type;
        LocalId parent;
        std::vector<LocalId> children;
        bool collapsed = false;
    };

    std::unordered_map<LocalId, Entity> entities_;
    std::map<std::string, LocalId> pages_by_name_;
    std::size_t next_id_ = 1;
    std::size_t mutations_ = 0;
    std::optional<std::size_t> fail_after_;

    LocalId allocate(const char* prefix);
    [[nodiscard]] Result<void> admit_mutation(const std::string& what);
    [[nodiscard]] tree::BlockNode snapshot(const Entity& e, bool expand) const;
    [[nodiscard]] std::size_t insert_index(const Entity& parent, std::size_t order) const;
    [[nodiscard]] bool is_within(const LocalId& id, const LocalId& ancestor) const;
    void erase_subtree(const LocalId& id);
    void detach(Entity& e);
};

} // namespace trellis::sync
