#include "core/tree_reconciler.hpp"

#include "core/annotation_serializer.hpp"
#include "core/container.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <unordered_map>
#include <unordered_set>

namespace trellis::tree {
namespace {

using doc::Annotation;
using doc::AnnotationType;
using doc::FlatDocument;

void insert_under(BlockNode& parent, int depth, BlockNode node) {
    if (depth <= 0 || parent.children.empty()) {
        parent.children.emplace_back(std::move(node));
        return;
    }
    insert_under(std::get<BlockNode>(parent.children.back()), depth - 1, std::move(node));
}

void insert_at_level(std::vector<BlockNode>& roots, int level, BlockNode node) {
    if (level <= 0 || roots.empty()) {
        roots.push_back(std::move(node));
        return;
    }
    insert_under(roots.back(), level - 1, std::move(node));
}

// A block annotation with the inline marks that fall inside it.
struct BlockSpan {
    const Annotation* block = nullptr;
    std::vector<Annotation> marks;
};

std::vector<BlockSpan> collect_spans(const FlatDocument& doc) {
    std::vector<BlockSpan> spans;
    for (const auto& a : doc.annotations) {
        if (a.type == AnnotationType::Block) {
            spans.push_back(BlockSpan{&a, {}});
        }
    }

    for (const auto& a : doc.annotations) {
        if (a.type == AnnotationType::Block || a.type == AnnotationType::Metadata) {
            continue;
        }
        auto owner = std::find_if(spans.begin(), spans.end(), [&a](const BlockSpan& span) {
            return span.block->contains(a);
        });
        if (owner == spans.end()) {
            continue;
        }
        owner->marks.push_back(
            doc::rebased(a, -static_cast<std::ptrdiff_t>(owner->block->start)));
    }
    return spans;
}

BlockNode span_node(const Annotation& block, std::string content) {
    BlockNode node;
    node.id = block.block()->identifier;
    node.view_type = block.block()->view_type;
    node.content = std::move(content);
    return node;
}

std::string slice(const FlatDocument& doc, const Annotation& a) {
    return doc.content.substr(a.start, a.end - a.start);
}

Error op_error(const ReconcilePlan& plan, std::size_t index, const MutationOp& op, const Error& cause) {
    Error out = cause;
    out.message = "Reconcile of " + plan.page_id + " stopped at op " + std::to_string(index + 1) +
                  "/" + std::to_string(plan.ops.size()) + " (" + std::string(op_name(op)) + " " +
                  op_target(op) + "): " + cause.message;
    return out;
}

Result<LocalId> resolve_parent(SyncContext& ctx,
                               const ReconcilePlan& plan,
                               const std::optional<GlobalId>& parent) {
    if (!parent.has_value()) {
        return Result<LocalId>::ok(plan.root_id);
    }
    auto local = ctx.ids().global_to_local(*parent);
    if (local.is_err()) {
        return Result<LocalId>::err(local.unwrap_err());
    }
    if (!local.unwrap().has_value()) {
        return Result<LocalId>::err(Error{
            "Referencing parent " + *parent + " but none exists", ErrorCode::MissingParent});
    }
    return Result<LocalId>::ok(*local.unwrap());
}

Result<void> host_failed(Result<void> r, const std::string& what) {
    if (r.is_ok()) {
        return r;
    }
    return Result<void>::err(r.unwrap_err().with_context(what, ErrorCode::HostMutationFailed));
}

Result<void> apply(SyncContext& ctx, const ReconcilePlan& plan, const MutationOp& op) {
    auto& notebook = ctx.notebook();

    if (const auto* o = std::get_if<ReassignPageClaim>(&op)) {
        return host_failed(notebook.set_block_property(o->block_id, "samepage", o->page_id),
                           "Failed to reassign page claim of " + o->block_id);
    }
    if (const auto* o = std::get_if<RenamePage>(&op)) {
        return host_failed(notebook.rename_page(o->old_title, o->new_title),
                           "Failed to rename page " + o->old_title);
    }
    if (const auto* o = std::get_if<RetitleBlock>(&op)) {
        return host_failed(notebook.update_block(o->block_id, o->title),
                           "Failed to update title of block " + o->block_id);
    }
    if (const auto* o = std::get_if<ReparentRoot>(&op)) {
        return host_failed(notebook.move_block(o->block_id, o->new_parent_id, kAppend),
                           "Failed to move block " + o->block_id);
    }
    if (const auto* o = std::get_if<CreateBlock>(&op)) {
        auto parent = resolve_parent(ctx, plan, o->parent);
        if (parent.is_err()) {
            return Result<void>::err(parent.unwrap_err());
        }
        auto created = notebook.create_block(parent.unwrap(), o->order, o->content);
        if (created.is_err()) {
            return Result<void>::err(created.unwrap_err().with_context(
                "Failed to insert block " + o->global_id, ErrorCode::HostMutationFailed));
        }
        const auto& local = created.unwrap();
        auto tagged = host_failed(notebook.set_block_property(local, "id", local),
                                  "Failed to tag block " + local);
        if (tagged.is_err()) {
            return tagged;
        }
        auto saved = ctx.ids().put(local, o->global_id);
        if (saved.is_err()) {
            return Result<void>::err(saved.unwrap_err().with_context("Saving id for " + local));
        }
        return Result<void>::ok();
    }
    if (const auto* o = std::get_if<UpdateBlock>(&op)) {
        return host_failed(notebook.update_block(o->local_id, o->content),
                           "Failed to update block " + o->global_id);
    }
    if (const auto* o = std::get_if<MoveBlock>(&op)) {
        auto parent = resolve_parent(ctx, plan, o->parent);
        if (parent.is_err()) {
            return Result<void>::err(parent.unwrap_err());
        }
        return host_failed(notebook.move_block(o->local_id, parent.unwrap(), o->order),
                           "Failed to move block " + o->global_id);
    }
    if (const auto* o = std::get_if<DeleteBlock>(&op)) {
        auto global = ctx.ids().local_to_global(o->local_id);
        if (global.is_err()) {
            return Result<void>::err(global.unwrap_err());
        }
        auto removed = host_failed(notebook.remove_block(o->local_id),
                                   "Failed to remove block " + o->local_id);
        if (removed.is_err()) {
            return removed;
        }
        if (global.unwrap().has_value()) {
            return ctx.ids().remove(o->local_id, *global.unwrap());
        }
        return Result<void>::ok();
    }
    return Result<void>::ok();
}

// Metadata ops: bring the container's title (and for blocks, its parent) in
// line with the document's metadata annotation.
Result<void> plan_metadata(SyncContext& ctx,
                           const PageId& page_id,
                           const Container& container,
                           const doc::MetadataAttributes& metadata,
                           std::vector<MutationOp>& ops) {
    if (container.kind == Container::Kind::Block) {
        if (container.title != metadata.title) {
            ops.emplace_back(RetitleBlock{container.root_id, metadata.title});
        }
        if (!metadata.parent.empty()) {
            auto parent = ctx.ids().global_to_local(metadata.parent);
            if (parent.is_err()) {
                return Result<void>::err(parent.unwrap_err());
            }
            const auto& local = parent.unwrap();
            if (local.has_value() && container.parent_id != local) {
                ops.emplace_back(ReparentRoot{container.root_id, *local});
            }
        }
        return Result<void>::ok();
    }

    if (container.title == metadata.title) {
        return Result<void>::ok();
    }

    // A page already named like the target may claim another shared page.
    auto target = ctx.notebook().get_block_tree(metadata.title);
    if (target.is_err()) {
        return Result<void>::err(target.unwrap_err().with_context(
            "Reading tree of " + metadata.title));
    }
    for (const auto& block : target.unwrap()) {
        auto claim = block.properties.find("samepage");
        if (claim != block.properties.end() && claim->second != page_id) {
            ops.emplace_back(ReassignPageClaim{block.id, page_id});
        }
    }
    ops.emplace_back(RenamePage{container.title, metadata.title});
    return Result<void>::ok();
}

} // namespace

std::vector<BlockNode> build_desired_tree(const FlatDocument& doc) {
    std::vector<BlockNode> roots;
    for (const auto& a : doc.annotations) {
        if (a.type != AnnotationType::Block || !a.block()) {
            continue;
        }
        insert_at_level(roots, a.block()->level, span_node(a, slice(doc, a)));
    }
    return roots;
}

Result<std::vector<BlockNode>> desired_tree(const FlatDocument& doc) {
    using Out = Result<std::vector<BlockNode>>;

    std::vector<BlockNode> roots;
    for (auto& span : collect_spans(doc)) {
        const auto& block = *span.block;
        auto content = doc::serialize_block(slice(doc, block), std::move(span.marks));
        if (content.is_err()) {
            return Out::err(content.unwrap_err().with_context(
                "Serializing block " + block.block()->identifier));
        }
        insert_at_level(roots, block.block()->level,
                        span_node(block, std::move(content).unwrap()));
    }
    return Out::ok(std::move(roots));
}

Result<ReconcilePlan> plan(SyncContext& ctx, const PageId& page_id, const FlatDocument& doc) {
    using Out = Result<ReconcilePlan>;

    auto open = ctx.require_open("reconcile");
    if (open.is_err()) {
        return Out::err(open.unwrap_err());
    }
    auto valid = doc::validate(doc);
    if (valid.is_err()) {
        return Out::err(valid.unwrap_err().with_context("Remote document for " + page_id));
    }

    auto loaded = load_container(ctx, page_id);
    if (loaded.is_err()) {
        return Out::err(loaded.unwrap_err());
    }
    if (!loaded.unwrap().has_value()) {
        return Out::err(Error{"Missing page with id: " + page_id, ErrorCode::MissingPage});
    }
    const auto& container = *loaded.unwrap();

    ReconcilePlan result;
    result.page_id = page_id;
    result.root_id = container.root_id;

    if (const auto* metadata = doc::find_metadata(doc)) {
        auto meta = plan_metadata(ctx, page_id, container, *metadata->metadata(), result.ops);
        if (meta.is_err()) {
            return Out::err(meta.unwrap_err());
        }
    }

    auto desired_roots = desired_tree(doc);
    if (desired_roots.is_err()) {
        return Out::err(desired_roots.unwrap_err());
    }
    const auto desired = flatten(desired_roots.unwrap(), LocalId{});
    const auto actual = flatten(container.blocks, LocalId{});

    std::unordered_map<LocalId, const FlatEntry*> actual_by_id;
    for (const auto& entry : actual) {
        actual_by_id.emplace(entry.id, &entry);
    }

    // global id -> local id, for desired blocks the mapping knows
    std::unordered_map<GlobalId, LocalId> local_of;
    std::unordered_set<LocalId> expected;
    for (const auto& entry : desired) {
        auto local = ctx.ids().global_to_local(entry.id);
        if (local.is_err()) {
            return Out::err(local.unwrap_err().with_context("Lookup of " + entry.id));
        }
        if (local.unwrap().has_value()) {
            local_of.emplace(entry.id, *local.unwrap());
            expected.insert(*local.unwrap());
        }
    }

    // Blocks removed locally along with a deleted ancestor.
    std::vector<const FlatEntry*> to_delete;
    std::unordered_set<LocalId> doomed;
    for (const auto& entry : actual) {
        const bool deleted = expected.count(entry.id) == 0;
        if (deleted) {
            to_delete.push_back(&entry);
        }
        if (deleted || doomed.count(entry.parent_id) != 0) {
            doomed.insert(entry.id);
        }
    }

    const auto kept = [&](const FlatEntry& entry) -> const FlatEntry* {
        auto local = local_of.find(entry.id);
        if (local == local_of.end() || doomed.count(local->second) != 0) {
            return nullptr;
        }
        auto found = actual_by_id.find(local->second);
        return found == actual_by_id.end() ? nullptr : found->second;
    };

    std::set<GlobalId> created;
    for (const auto& entry : desired) {
        if (!kept(entry)) {
            created.insert(entry.id);
        }
    }

    // Desired parent as a local id; empty optional while the parent does not
    // exist locally yet.
    const auto desired_parent = [&](const FlatEntry& entry) -> std::optional<LocalId> {
        if (entry.parent_id.empty()) {
            return LocalId{};
        }
        if (created.count(entry.parent_id) != 0) {
            return std::nullopt;
        }
        return local_of.at(entry.parent_id);
    };

    // Sibling rank among blocks that stay under the same parent. Blocks whose
    // rank is unchanged keep their relative order and need no move.
    std::unordered_map<LocalId, std::size_t> actual_rank;
    std::unordered_map<LocalId, std::size_t> desired_rank;
    {
        std::unordered_set<LocalId> stays;
        for (const auto& entry : desired) {
            const auto* current = kept(entry);
            if (current && desired_parent(entry) == current->parent_id) {
                stays.insert(current->id);
            }
        }
        std::map<LocalId, std::size_t> next;
        for (const auto& entry : actual) {
            if (stays.count(entry.id) != 0) {
                actual_rank[entry.id] = next[entry.parent_id]++;
            }
        }
        next.clear();
        for (const auto& entry : desired) {
            const auto* current = kept(entry);
            if (current && stays.count(current->id) != 0) {
                desired_rank[current->id] = next[current->parent_id]++;
            }
        }
    }

    // Children before parents, so every delete targets a block that still exists.
    for (auto it = to_delete.rbegin(); it != to_delete.rend(); ++it) {
        result.ops.emplace_back(DeleteBlock{(*it)->id});
    }

    const auto parent_ref = [](const FlatEntry& entry) -> std::optional<GlobalId> {
        if (entry.parent_id.empty()) {
            return std::nullopt;
        }
        return entry.parent_id;
    };

    for (const auto& entry : desired) {
        if (created.count(entry.id) != 0) {
            result.ops.emplace_back(
                CreateBlock{entry.id, parent_ref(entry), entry.order, entry.content});
        }
    }

    for (const auto& entry : desired) {
        const auto* current = kept(entry);
        if (!current) {
            continue;
        }
        const bool in_place = actual_rank.count(current->id) != 0 &&
                              actual_rank.at(current->id) == desired_rank.at(current->id);
        if (!in_place) {
            result.ops.emplace_back(
                MoveBlock{current->id, entry.id, parent_ref(entry), entry.order});
        } else if (strip_sync_properties(current->content, current->id) != entry.content) {
            result.ops.emplace_back(UpdateBlock{current->id, entry.id, entry.content});
        }
    }

    return Out::ok(std::move(result));
}

Result<std::size_t> execute(SyncContext& ctx, const ReconcilePlan& plan) {
    auto open = ctx.require_open("execute");
    if (open.is_err()) {
        return Result<std::size_t>::err(open.unwrap_err());
    }

    for (std::size_t i = 0; i < plan.ops.size(); ++i) {
        const auto& op = plan.ops[i];
        auto applied = apply(ctx, plan, op);
        if (applied.is_err()) {
            return Result<std::size_t>::err(op_error(plan, i, op, applied.unwrap_err()));
        }
    }
    return Result<std::size_t>::ok(plan.ops.size());
}

Result<std::size_t> reconcile(SyncContext& ctx, const PageId& page_id, const FlatDocument& doc) {
    auto planned = plan(ctx, page_id, doc);
    if (planned.is_err()) {
        return Result<std::size_t>::err(planned.unwrap_err());
    }
    return execute(ctx, planned.unwrap());
}

} // namespace trellis::tree
