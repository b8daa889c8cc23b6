#include "core/container.hpp"

namespace trellis {
namespace {

Result<void> expand_node(NotebookAdapter& notebook, tree::BlockNode& node) {
    std::vector<tree::BlockChild> expanded;
    expanded.reserve(node.children.size());

    for (auto& child : node.children) {
        if (auto* ref = std::get_if<tree::BlockRef>(&child)) {
            auto fetched = notebook.get_block(ref->id);
            if (fetched.is_err()) {
                return Result<void>::err(fetched.unwrap_err().with_context(
                    "Expanding child " + ref->id + " of " + node.id));
            }
            if (!fetched.unwrap().has_value()) {
                continue;
            }
            expanded.emplace_back(std::move(*fetched.unwrap()));
        } else {
            expanded.push_back(std::move(child));
        }

        auto& inner = std::get<tree::BlockNode>(expanded.back());
        auto nested = expand_node(notebook, inner);
        if (nested.is_err()) {
            return nested;
        }
    }

    node.children = std::move(expanded);
    return Result<void>::ok();
}

} // namespace

Result<std::vector<tree::BlockNode>> expand_references(NotebookAdapter& notebook,
                                                       std::vector<tree::BlockNode> nodes) {
    for (auto& node : nodes) {
        auto r = expand_node(notebook, node);
        if (r.is_err()) {
            return Result<std::vector<tree::BlockNode>>::err(r.unwrap_err());
        }
    }
    return Result<std::vector<tree::BlockNode>>::ok(std::move(nodes));
}

Result<std::optional<Container>> load_container(SyncContext& ctx, const PageId& page_id) {
    using Out = Result<std::optional<Container>>;
    auto& notebook = ctx.notebook();

    auto page = notebook.find_page(page_id);
    if (page.is_err()) {
        return Out::err(page.unwrap_err().with_context("Looking up page " + page_id));
    }

    Container container;

    if (page.unwrap().has_value()) {
        const auto& info = *page.unwrap();
        container.kind = Container::Kind::Page;
        container.root_id = info.id;
        container.title = info.original_name;
        container.parent_id = info.parent_id;

        auto blocks = notebook.get_block_tree(info.original_name);
        if (blocks.is_err()) {
            return Out::err(blocks.unwrap_err().with_context("Reading tree of " + info.original_name));
        }
        auto expanded = expand_references(notebook, tree::content_blocks(std::move(blocks).unwrap()));
        if (expanded.is_err()) {
            return Out::err(expanded.unwrap_err());
        }
        container.blocks = std::move(expanded).unwrap();
    } else {
        auto block = notebook.get_block(page_id);
        if (block.is_err()) {
            return Out::err(block.unwrap_err().with_context("Looking up block " + page_id));
        }
        if (!block.unwrap().has_value()) {
            return Out::ok(std::nullopt);
        }

        auto parent = notebook.parent_of(page_id);
        if (parent.is_err()) {
            return Out::err(parent.unwrap_err().with_context("Looking up parent of " + page_id));
        }

        auto& root = *block.unwrap();
        container.kind = Container::Kind::Block;
        container.root_id = root.id;
        container.title = tree::strip_sync_properties(root.content, root.id);
        container.parent_id = parent.unwrap();

        auto expanded_root = expand_node(notebook, root);
        if (expanded_root.is_err()) {
            return Out::err(expanded_root.unwrap_err());
        }
        for (auto& child : root.children) {
            container.blocks.push_back(std::move(std::get<tree::BlockNode>(child)));
        }
    }

    return Out::ok(std::move(container));
}

} // namespace trellis
