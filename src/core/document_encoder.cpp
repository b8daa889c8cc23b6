#include "core/document_encoder.hpp"

#include "core/container.hpp"

namespace trellis::doc {
namespace {

Result<void> encode_level(SyncContext& ctx,
                          const std::vector<const tree::BlockNode*>& nodes,
                          int level,
                          ViewType inherited,
                          FlatDocument& out) {
    for (const auto* node : nodes) {
        auto identifier = ctx.global_id_for(node->id);
        if (identifier.is_err()) {
            return Result<void>::err(identifier.unwrap_err());
        }

        const auto markup = tree::strip_sync_properties(node->content, node->id);
        auto decoded = ctx.codec().decode(markup);

        const auto offset = out.content.size();
        out.content += decoded.text;
        out.annotations.push_back(make_block(
            offset, out.content.size(),
            BlockAttributes{std::move(identifier).unwrap(), level, inherited}));
        for (auto& inline_annotation : decoded.annotations) {
            out.annotations.push_back(
                rebased(std::move(inline_annotation), static_cast<std::ptrdiff_t>(offset)));
        }

        auto children = encode_level(ctx, tree::expanded_children(*node), level + 1,
                                     node->view_type.value_or(inherited), out);
        if (children.is_err()) {
            return children;
        }
    }
    return Result<void>::ok();
}

} // namespace

Result<FlatDocument> encode_tree(SyncContext& ctx,
                                 const std::string& title,
                                 const GlobalId& parent,
                                 const std::vector<tree::BlockNode>& blocks) {
    FlatDocument doc;
    doc.content = title;
    doc.annotations.push_back(make_metadata(title, parent));

    std::vector<const tree::BlockNode*> roots;
    roots.reserve(blocks.size());
    for (const auto& b : blocks) {
        roots.push_back(&b);
    }

    auto r = encode_level(ctx, roots, 0, ViewType::Bullet, doc);
    if (r.is_err()) {
        return Result<FlatDocument>::err(r.unwrap_err());
    }

    // A codec range escaping its block fails the whole encode.
    auto valid = validate(doc);
    if (valid.is_err()) {
        return Result<FlatDocument>::err(valid.unwrap_err().with_context("Encoded document"));
    }
    return Result<FlatDocument>::ok(std::move(doc));
}

Result<FlatDocument> encode(SyncContext& ctx, const PageId& page_id) {
    auto open = ctx.require_open("encode");
    if (open.is_err()) {
        return Result<FlatDocument>::err(open.unwrap_err());
    }

    auto loaded = load_container(ctx, page_id);
    if (loaded.is_err()) {
        return Result<FlatDocument>::err(loaded.unwrap_err());
    }
    if (!loaded.unwrap().has_value()) {
        return Result<FlatDocument>::err(
            Error{"Missing page with id: " + page_id, ErrorCode::MissingPage});
    }
    const auto& container = *loaded.unwrap();

    GlobalId parent;
    if (container.parent_id.has_value() && !container.parent_id->empty()) {
        auto mapped = ctx.global_id_for(*container.parent_id);
        if (mapped.is_err()) {
            return Result<FlatDocument>::err(mapped.unwrap_err());
        }
        parent = std::move(mapped).unwrap();
    }

    return encode_tree(ctx, container.title, parent, container.blocks);
}

} // namespace trellis::doc
