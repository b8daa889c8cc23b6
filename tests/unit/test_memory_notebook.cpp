#include <catch2/catch_test_macros.hpp>
#include "sync/memory_notebook.hpp"
#include "sync/outline_json.hpp"

#include <QJsonDocument>

using namespace trellis;
using namespace trellis::sync;

TEST_CASE("Pages are found through their samepage claim", "[memory_notebook]") {
    MemoryNotebook nb;
    const auto page = nb.add_page("Todo", "0b9f3c1e-8d2a-4c5b-9e7f-1a2b3c4d5e6f");
    nb.add_page("Other");

    auto found = nb.find_page("0b9f3c1e-8d2a-4c5b-9e7f-1a2b3c4d5e6f").unwrap();
    REQUIRE(found.has_value());
    REQUIRE(found->id == page);
    REQUIRE(found->original_name == "Todo");
    REQUIRE_FALSE(nb.find_page("missing").unwrap().has_value());
}

TEST_CASE("Block trees report properties and collapsed children", "[memory_notebook]") {
    MemoryNotebook nb;
    const auto page = nb.add_page("Todo", "pid");
    const auto a = nb.add_block(page, "a\nid:: x", ViewType::Document);
    const auto a1 = nb.add_block(a, "a1");
    nb.set_collapsed(a, true);

    auto roots = nb.get_block_tree("Todo").unwrap();
    REQUIRE(roots.size() == 2);
    REQUIRE(roots[0].properties.at("samepage") == "pid");
    REQUIRE(roots[1].properties.at("id") == "x");
    REQUIRE(roots[1].view_type == ViewType::Document);
    REQUIRE(roots[1].children.at(0) == tree::BlockChild{tree::BlockRef{a1}});

    auto fetched = nb.get_block(a).unwrap();
    REQUIRE(fetched.has_value());
    REQUIRE(std::get<tree::BlockNode>(fetched->children.at(0)).content == "a1");

    REQUIRE(nb.get_block_tree("Nope").unwrap().empty());
    REQUIRE(nb.parent_of(a1).unwrap() == a);
    REQUIRE(nb.parent_of(page).unwrap() == std::nullopt);
}

TEST_CASE("Order counts content blocks only", "[memory_notebook]") {
    MemoryNotebook nb;
    const auto page = nb.add_page("Todo", "pid");
    const auto b = nb.add_block(page, "b");

    const auto a = nb.create_block(page, 0, "a").unwrap();
    const auto c = nb.create_block(page, kAppend, "c").unwrap();

    const auto children = nb.children_of(page);
    REQUIRE(children.size() == 4);
    REQUIRE(children[1] == a);
    REQUIRE(children[2] == b);
    REQUIRE(children[3] == c);
    REQUIRE(nb.outline("Todo") == "- a\n- b\n- c\n");
}

TEST_CASE("Moves, updates and removals", "[memory_notebook]") {
    MemoryNotebook nb;
    const auto page = nb.add_page("Todo");
    const auto a = nb.add_block(page, "a");
    const auto b = nb.add_block(page, "b");
    const auto b1 = nb.add_block(b, "b1");

    REQUIRE(nb.move_block(a, b, 0).is_ok());
    REQUIRE(nb.outline("Todo") == "- b\n  - a\n  - b1\n");

    auto into_self = nb.move_block(b, b1, 0);
    REQUIRE(into_self.is_err());
    REQUIRE(into_self.unwrap_err().code == ErrorCode::HostMutationFailed);

    REQUIRE(nb.update_block(a, "**a**").is_ok());
    REQUIRE(nb.content_of(a) == "**a**");

    REQUIRE(nb.remove_block(b).is_ok());
    REQUIRE(nb.block_count() == 0);
    REQUIRE_FALSE(nb.content_of(b1).has_value());
    REQUIRE(nb.remove_block(b).is_err());
}

TEST_CASE("Properties are written into the block text", "[memory_notebook]") {
    MemoryNotebook nb;
    const auto page = nb.add_page("Todo");
    const auto a = nb.add_block(page, "a");

    REQUIRE(nb.set_block_property(a, "id", a).is_ok());
    REQUIRE(nb.content_of(a) == "a\nid:: " + a);
    REQUIRE(nb.set_block_property(a, "id", "other").is_ok());
    REQUIRE(nb.content_of(a) == "a\nid:: other");
    REQUIRE(nb.outline("Todo") == "- a\nid:: other\n");
}

TEST_CASE("Renaming onto an existing page merges and keeps the page id", "[memory_notebook]") {
    MemoryNotebook nb;
    const auto draft = nb.add_page("Draft");
    nb.add_block(draft, "mine");
    const auto final_page = nb.add_page("Final");
    nb.add_block(final_page, "theirs");

    REQUIRE(nb.rename_page("Draft", "Final").is_ok());

    REQUIRE(nb.page_id_by_name("Final") == draft);
    REQUIRE_FALSE(nb.page_id_by_name("Draft").has_value());
    REQUIRE(nb.outline("Final") == "- theirs\n- mine\n");
    REQUIRE(nb.rename_page("Draft", "X").is_err());
}

TEST_CASE("Injected failures hit every later mutation", "[memory_notebook]") {
    MemoryNotebook nb;
    const auto page = nb.add_page("Todo");

    nb.fail_mutations_after(1);
    REQUIRE(nb.create_block(page, 0, "one").is_ok());
    REQUIRE(nb.create_block(page, 1, "two").is_err());
    REQUIRE(nb.rename_page("Todo", "Done").is_err());
    REQUIRE(nb.mutation_count() == 1);

    nb.clear_failures();
    REQUIRE(nb.create_block(page, 1, "two").is_ok());
}

TEST_CASE("Outlines load from JSON", "[memory_notebook]") {
    MemoryNotebook nb;
    auto page_id = load_outline(nb, QByteArray(R"({
        "title": "Groceries",
        "pageId": "0b9f3c1e-8d2a-4c5b-9e7f-1a2b3c4d5e6f",
        "blocks": [
            {"content": "milk", "viewType": "numbered",
             "children": [{"content": "whole"}]},
            {"content": "eggs", "collapsed": true, "children": [{"content": "six"}]}
        ]})"));

    REQUIRE(page_id.is_ok());
    REQUIRE(page_id.unwrap() == "0b9f3c1e-8d2a-4c5b-9e7f-1a2b3c4d5e6f");
    REQUIRE(nb.outline("Groceries") == "- milk\n  - whole\n- eggs\n  - six\n");

    auto roots = nb.get_block_tree("Groceries").unwrap();
    REQUIRE(roots[1].view_type == ViewType::Numbered);
    REQUIRE(std::holds_alternative<tree::BlockRef>(roots[2].children.at(0)));
}

TEST_CASE("Outline JSON errors", "[memory_notebook]") {
    MemoryNotebook nb;

    REQUIRE(load_outline(nb, QByteArray("not json")).is_err());
    REQUIRE(load_outline(nb, QByteArray(R"({"blocks": []})")).is_err());
    REQUIRE(load_outline(nb, QByteArray(R"({"title": "T", "pageId": "nope"})")).is_err());
    auto bad_view = load_outline(nb, QByteArray(
        R"({"title": "T", "blocks": [{"content": "x", "viewType": "grid"}]})"));
    REQUIRE(bad_view.is_err());
    REQUIRE(bad_view.unwrap_err().code == ErrorCode::Decode);

    auto generated = load_outline(nb, QByteArray(R"({"title": "Fresh"})"));
    REQUIRE(generated.is_ok());
    REQUIRE(Uuid::parse(generated.unwrap()).has_value());
}
