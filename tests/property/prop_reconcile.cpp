#include <catch2/catch_test_macros.hpp>
#include <rapidcheck.h>
#include "core/document_encoder.hpp"
#include "core/tree_reconciler.hpp"
#include "property/markup_gen.hpp"
#include "support/sync_fixture.hpp"
#include "sync/page_sync.hpp"

#include <algorithm>
#include <numeric>
#include <optional>
#include <string>
#include <vector>

using namespace trellis;
using trellis::testing::SyncFixture;

namespace {

// Random subtree under `parent`; view types only when `with_view_types`.
void grow(sync::MemoryNotebook& notebook, const LocalId& parent, int depth, bool with_view_types) {
    const auto count = *rc::gen::inRange(0, depth == 0 ? 5 : 3);
    for (int i = 0; i < count; ++i) {
        std::optional<ViewType> view;
        if (with_view_types) {
            view = *rc::gen::elementOf(std::vector<std::optional<ViewType>>{
                std::nullopt, ViewType::Bullet, ViewType::Numbered, ViewType::Document});
        }
        const auto id = notebook.add_block(parent, *trellis::testing::inline_markup(), view);
        if (depth < 2) {
            grow(notebook, id, depth + 1, with_view_types);
        }
    }
}

struct Line {
    GlobalId id;
    std::string markup;
};

// Reconciles until a pass applies nothing, at most as often as the scheduler would.
void converge(SyncFixture& f, const GlobalId& page_id, const doc::FlatDocument& doc) {
    for (int pass = 0; pass < sync::PageSyncScheduler::kMaxReconcilePasses; ++pass) {
        auto applied = tree::reconcile(f.ctx, page_id, doc);
        RC_ASSERT(applied.is_ok());
        if (applied.unwrap() == 0) {
            break;
        }
    }
}

} // namespace

TEST_CASE("Property: an encoded page reconciles to no ops", "[property][reconciler]") {
    rc::check("plan(encode(page)) is empty",
        []() {
            SyncFixture f;
            const auto page_id = new_global_id();
            const auto page = f.notebook.add_page("Page", page_id);
            grow(f.notebook, page, 0, true);

            auto doc = doc::encode(f.ctx, page_id);
            RC_ASSERT(doc.is_ok());

            auto plan = tree::plan(f.ctx, page_id, doc.unwrap());
            RC_ASSERT(plan.is_ok());
            RC_ASSERT(plan.unwrap().empty());
        }
    );
}

TEST_CASE("Property: an empty page converges to a remote document", "[property][reconciler]") {
    rc::check("encode(reconcile(empty, doc)) == doc",
        []() {
            SyncFixture source;
            const auto page_id = new_global_id();
            const auto page = source.notebook.add_page("Page", page_id);
            grow(source.notebook, page, 0, false);
            const auto doc = doc::encode(source.ctx, page_id).unwrap();

            SyncFixture target;
            target.notebook.add_page("Page", page_id);
            converge(target, page_id, doc);

            RC_ASSERT(doc::encode(target.ctx, page_id).unwrap() == doc);
            RC_ASSERT(tree::plan(target.ctx, page_id, doc).unwrap().empty());
        }
    );
}

TEST_CASE("Property: a populated page converges to a rearranged document", "[property][reconciler]") {
    rc::check("encode(reconcile(page, doc)) == doc",
        []() {
            SyncFixture f;
            const auto page_id = new_global_id();
            const auto page = f.notebook.add_page("Page", page_id);
            grow(f.notebook, page, 0, false);
            const auto before = doc::encode(f.ctx, page_id);
            RC_ASSERT(before.is_ok());

            std::vector<Line> lines;
            for (const auto& a : before.unwrap().annotations) {
                if (a.type != doc::AnnotationType::Block) {
                    continue;
                }
                const auto& id = a.block()->identifier;
                const auto markup = f.notebook.content_of(f.local_of(id));
                RC_ASSERT(markup.has_value());
                if (*rc::gen::inRange(0, 4) != 0) {
                    lines.push_back({id, *markup});
                }
            }
            for (auto& line : lines) {
                if (*rc::gen::inRange(0, 4) == 0) {
                    line.markup = *trellis::testing::inline_markup();
                }
            }
            const auto added = *rc::gen::inRange(0, 4);
            for (int i = 0; i < added; ++i) {
                lines.push_back({new_global_id(), *trellis::testing::inline_markup()});
            }

            std::vector<int> keys = *rc::gen::container<std::vector<int>>(
                lines.size(), rc::gen::inRange(0, 100));
            std::vector<std::size_t> order(lines.size());
            std::iota(order.begin(), order.end(), std::size_t{0});
            std::stable_sort(order.begin(), order.end(),
                [&keys](std::size_t l, std::size_t r) { return keys[l] < keys[r]; });

            trellis::testing::DocBuilder builder("Page");
            int level = -1;
            for (const auto index : order) {
                level = *rc::gen::inRange(0, level + 2);
                auto decoded = f.codec.decode(lines[index].markup);
                builder.block(lines[index].id, decoded.text, level, ViewType::Bullet,
                              std::move(decoded.annotations));
            }
            const auto doc = builder.build();

            converge(f, page_id, doc);

            RC_ASSERT(doc::encode(f.ctx, page_id).unwrap() == doc);
            RC_ASSERT(tree::plan(f.ctx, page_id, doc).unwrap().empty());
        }
    );
}
