#include "sync/memory_notebook.hpp"

#include "core/block_tree.hpp"

#include <algorithm>
#include <stdexcept>

namespace trellis::sync {
namespace {

Error host_error(const std::string& message) {
    return Error{message, ErrorCode::HostMutationFailed};
}

void append_outline(const MemoryNotebook& notebook,
                    const LocalId& id,
                    int depth,
                    std::string& out) {
    for (const auto& child : notebook.children_of(id)) {
        const auto content = notebook.content_of(child).value_or("");
        tree::BlockNode probe;
        probe.content = content;
        if (!tree::is_content_block(probe)) {
            continue;
        }
        out += std::string(static_cast<std::size_t>(depth) * 2, ' ') + "- " +
               tree::strip_sync_properties(content, child) + "\n";
        append_outline(notebook, child, depth + 1, out);
    }
}

} // namespace

LocalId MemoryNotebook::allocate(const char* prefix) {
    return std::string(prefix) + "-" + std::to_string(next_id_++);
}

LocalId MemoryNotebook::add_page(const std::string& name, const std::optional<PageId>& samepage) {
    auto id = allocate("page");
    Entity page;
    page.id = id;
    page.is_page = true;
    page.content = name;
    entities_.emplace(id, std::move(page));
    pages_by_name_[name] = id;

    if (samepage.has_value()) {
        add_block(id, "samepage:: " + *samepage);
    }
    return id;
}

LocalId MemoryNotebook::add_block(const LocalId& parent_id,
                                  const std::string& content,
                                  std::optional<ViewType> view_type) {
    auto parent = entities_.find(parent_id);
    if (parent == entities_.end()) {
        throw std::invalid_argument("add_block: unknown parent " + parent_id);
    }

    auto id = allocate("block");
    Entity block;
    block.id = id;
    block.content = content;
    block.view_type = view_type;
    block.parent = parent_id;
    parent->second.children.push_back(id);
    entities_.emplace(id, std::move(block));
    return id;
}

void MemoryNotebook::set_collapsed(const LocalId& id, bool collapsed) {
    auto it = entities_.find(id);
    if (it == entities_.end()) {
        throw std::invalid_argument("set_collapsed: unknown block " + id);
    }
    it->second.collapsed = collapsed;
}

std::optional<LocalId> MemoryNotebook::page_id_by_name(const std::string& name) const {
    auto it = pages_by_name_.find(name);
    if (it == pages_by_name_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::string> MemoryNotebook::content_of(const LocalId& id) const {
    auto it = entities_.find(id);
    if (it == entities_.end()) {
        return std::nullopt;
    }
    return it->second.content;
}

std::vector<LocalId> MemoryNotebook::children_of(const LocalId& id) const {
    auto it = entities_.find(id);
    if (it == entities_.end()) {
        return {};
    }
    return it->second.children;
}

std::size_t MemoryNotebook::block_count() const {
    return static_cast<std::size_t>(std::count_if(
        entities_.begin(), entities_.end(), [](const auto& kv) { return !kv.second.is_page; }));
}

std::string MemoryNotebook::outline(const std::string& page_name) const {
    std::string out;
    if (auto page = page_id_by_name(page_name)) {
        append_outline(*this, *page, 0, out);
    }
    return out;
}

void MemoryNotebook::fail_mutations_after(std::size_t n) {
    fail_after_ = mutations_ + n;
}

void MemoryNotebook::clear_failures() {
    fail_after_.reset();
}

Result<void> MemoryNotebook::admit_mutation(const std::string& what) {
    if (fail_after_.has_value() && mutations_ >= *fail_after_) {
        return Result<void>::err(host_error("Injected failure: " + what));
    }
    ++mutations_;
    return Result<void>::ok();
}

tree::BlockNode MemoryNotebook::snapshot(const Entity& e, bool expand) const {
    tree::BlockNode node;
    node.id = e.id;
    node.content = e.content;
    node.view_type = e.view_type;
    node.properties = tree::parse_properties(e.content);
    for (const auto& child_id : e.children) {
        const auto& child = entities_.at(child_id);
        if (expand) {
            node.children.emplace_back(snapshot(child, !child.collapsed));
        } else {
            node.children.emplace_back(tree::BlockRef{child_id});
        }
    }
    return node;
}

std::size_t MemoryNotebook::insert_index(const Entity& parent, std::size_t order) const {
    std::size_t seen = 0;
    for (std::size_t i = 0; i < parent.children.size(); ++i) {
        tree::BlockNode probe;
        probe.content = entities_.at(parent.children[i]).content;
        if (!tree::is_content_block(probe)) {
            continue;
        }
        if (seen == order) {
            return i;
        }
        ++seen;
    }
    return parent.children.size();
}

bool MemoryNotebook::is_within(const LocalId& id, const LocalId& ancestor) const {
    for (auto cur = entities_.find(id); cur != entities_.end();
         cur = entities_.find(cur->second.parent)) {
        if (cur->second.id == ancestor) {
            return true;
        }
        if (cur->second.is_page) {
            break;
        }
    }
    return false;
}

void MemoryNotebook::detach(Entity& e) {
    auto parent = entities_.find(e.parent);
    if (parent == entities_.end()) {
        return;
    }
    auto& siblings = parent->second.children;
    siblings.erase(std::remove(siblings.begin(), siblings.end(), e.id), siblings.end());
}

void MemoryNotebook::erase_subtree(const LocalId& id) {
    auto it = entities_.find(id);
    if (it == entities_.end()) {
        return;
    }
    const auto children = it->second.children;
    for (const auto& child : children) {
        erase_subtree(child);
    }
    entities_.erase(id);
}

Result<std::optional<PageInfo>> MemoryNotebook::find_page(const PageId& page_id) {
    for (const auto& [name, id] : pages_by_name_) {
        const auto& page = entities_.at(id);
        for (const auto& child_id : page.children) {
            const auto props = tree::parse_properties(entities_.at(child_id).content);
            auto claim = props.find("samepage");
            if (claim != props.end() && claim->second == page_id) {
                return Result<std::optional<PageInfo>>::ok(PageInfo{id, name, std::nullopt});
            }
        }
    }
    return Result<std::optional<PageInfo>>::ok(std::nullopt);
}

Result<std::vector<tree::BlockNode>> MemoryNotebook::get_block_tree(const std::string& page_name) {
    std::vector<tree::BlockNode> roots;
    auto page = page_id_by_name(page_name);
    if (!page.has_value()) {
        return Result<std::vector<tree::BlockNode>>::ok(std::move(roots));
    }
    for (const auto& child_id : entities_.at(*page).children) {
        const auto& child = entities_.at(child_id);
        roots.push_back(snapshot(child, !child.collapsed));
    }
    return Result<std::vector<tree::BlockNode>>::ok(std::move(roots));
}

Result<std::optional<tree::BlockNode>> MemoryNotebook::get_block(const LocalId& id) {
    auto it = entities_.find(id);
    if (it == entities_.end() || it->second.is_page) {
        return Result<std::optional<tree::BlockNode>>::ok(std::nullopt);
    }
    return Result<std::optional<tree::BlockNode>>::ok(snapshot(it->second, true));
}

Result<std::optional<LocalId>> MemoryNotebook::parent_of(const LocalId& id) {
    auto it = entities_.find(id);
    if (it == entities_.end() || it->second.is_page) {
        return Result<std::optional<LocalId>>::ok(std::nullopt);
    }
    return Result<std::optional<LocalId>>::ok(it->second.parent);
}

Result<LocalId> MemoryNotebook::create_block(const LocalId& parent_id,
                                             std::size_t order,
                                             const std::string& content) {
    auto admitted = admit_mutation("create under " + parent_id);
    if (admitted.is_err()) {
        return Result<LocalId>::err(admitted.unwrap_err());
    }
    auto parent = entities_.find(parent_id);
    if (parent == entities_.end()) {
        return Result<LocalId>::err(host_error("No block or page " + parent_id));
    }

    auto id = allocate("block");
    Entity block;
    block.id = id;
    block.content = content;
    block.parent = parent_id;

    auto& siblings = parent->second.children;
    const auto at = insert_index(parent->second, order);
    siblings.insert(siblings.begin() + static_cast<std::ptrdiff_t>(at), id);
    entities_.emplace(id, std::move(block));
    return Result<LocalId>::ok(std::move(id));
}

Result<void> MemoryNotebook::update_block(const LocalId& id, const std::string& content) {
    auto admitted = admit_mutation("update " + id);
    if (admitted.is_err()) {
        return admitted;
    }
    auto it = entities_.find(id);
    if (it == entities_.end() || it->second.is_page) {
        return Result<void>::err(host_error("No block " + id));
    }
    it->second.content = content;
    return Result<void>::ok();
}

Result<void> MemoryNotebook::move_block(const LocalId& id,
                                        const LocalId& new_parent_id,
                                        std::size_t order) {
    auto admitted = admit_mutation("move " + id);
    if (admitted.is_err()) {
        return admitted;
    }
    auto it = entities_.find(id);
    if (it == entities_.end() || it->second.is_page) {
        return Result<void>::err(host_error("No block " + id));
    }
    auto parent = entities_.find(new_parent_id);
    if (parent == entities_.end()) {
        return Result<void>::err(host_error("No block or page " + new_parent_id));
    }
    if (is_within(new_parent_id, id)) {
        return Result<void>::err(host_error("Cannot move " + id + " into its own subtree"));
    }

    detach(it->second);
    it->second.parent = new_parent_id;
    auto& siblings = parent->second.children;
    const auto at = insert_index(parent->second, order);
    siblings.insert(siblings.begin() + static_cast<std::ptrdiff_t>(at), id);
    return Result<void>::ok();
}

Result<void> MemoryNotebook::remove_block(const LocalId& id) {
    auto admitted = admit_mutation("remove " + id);
    if (admitted.is_err()) {
        return admitted;
    }
    auto it = entities_.find(id);
    if (it == entities_.end() || it->second.is_page) {
        return Result<void>::err(host_error("No block " + id));
    }
    detach(it->second);
    erase_subtree(id);
    return Result<void>::ok();
}

Result<void> MemoryNotebook::rename_page(const std::string& old_title, const std::string& new_title) {
    auto admitted = admit_mutation("rename " + old_title);
    if (admitted.is_err()) {
        return admitted;
    }
    auto source = pages_by_name_.find(old_title);
    if (source == pages_by_name_.end()) {
        return Result<void>::err(host_error("No page named " + old_title));
    }
    if (old_title == new_title) {
        return Result<void>::ok();
    }

    const auto source_id = source->second;
    pages_by_name_.erase(source);

    auto target = pages_by_name_.find(new_title);
    if (target == pages_by_name_.end()) {
        entities_.at(source_id).content = new_title;
        pages_by_name_[new_title] = source_id;
        return Result<void>::ok();
    }

    // Merge with the existing page: its blocks first, then ours. The renamed
    // page keeps its id.
    const auto target_id = target->second;
    auto& into = entities_.at(source_id);
    auto merged = entities_.at(target_id).children;
    for (const auto& child : merged) {
        entities_.at(child).parent = source_id;
    }
    merged.insert(merged.end(), into.children.begin(), into.children.end());
    into.children = std::move(merged);
    into.content = new_title;
    entities_.erase(target_id);
    target->second = source_id;
    return Result<void>::ok();
}

Result<void> MemoryNotebook::set_block_property(const LocalId& id,
                                                const std::string& key,
                                                const std::string& value) {
    auto admitted = admit_mutation("set " + key + " on " + id);
    if (admitted.is_err()) {
        return admitted;
    }
    auto it = entities_.find(id);
    if (it == entities_.end() || it->second.is_page) {
        return Result<void>::err(host_error("No block " + id));
    }
    it->second.content = tree::with_property(it->second.content, key, value);
    return Result<void>::ok();
}

} // namespace trellis::sync
