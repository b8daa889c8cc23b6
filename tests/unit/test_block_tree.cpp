#include <catch2/catch_test_macros.hpp>
#include "core/block_tree.hpp"

using namespace trellis;
using namespace trellis::tree;

namespace {

BlockNode node(const std::string& id, const std::string& content, std::vector<BlockChild> children = {}) {
    BlockNode n;
    n.id = id;
    n.content = content;
    n.children = std::move(children);
    return n;
}

} // namespace

TEST_CASE("flatten is depth first with per-parent order", "[block_tree]") {
    std::vector<BlockNode> roots{
        node("a", "A", {node("a1", "A1"), node("a2", "A2", {node("a21", "A21")})}),
        node("b", "B"),
    };

    auto flat = flatten(roots, "page");

    REQUIRE(flat.size() == 5);
    REQUIRE(flat[0].id == "a");
    REQUIRE(flat[0].parent_id == "page");
    REQUIRE(flat[0].order == 0);
    REQUIRE(flat[1].id == "a1");
    REQUIRE(flat[1].parent_id == "a");
    REQUIRE(flat[2].id == "a2");
    REQUIRE(flat[2].order == 1);
    REQUIRE(flat[3].id == "a21");
    REQUIRE(flat[3].parent_id == "a2");
    REQUIRE(flat[4].id == "b");
    REQUIRE(flat[4].order == 1);
    REQUIRE(flat[4].parent_id == "page");
}

TEST_CASE("flatten skips references without taking an order slot", "[block_tree]") {
    std::vector<BlockNode> roots{node("a", "A", {BlockRef{"hidden"}, node("a1", "A1")})};

    auto flat = flatten(roots, "");

    REQUIRE(flat.size() == 2);
    REQUIRE(flat[1].id == "a1");
    REQUIRE(flat[1].order == 0);
    REQUIRE(expanded_children(roots[0]).size() == 1);
}

TEST_CASE("content_blocks drops property-only blocks", "[block_tree]") {
    std::vector<BlockNode> nodes{
        node("p", "samepage:: 0b9f3c1e-8d2a-4c5b-9e7f-1a2b3c4d5e6f"),
        node("e", ""),
        node("t", "milk\nid:: t"),
    };

    auto kept = content_blocks(nodes);

    REQUIRE(kept.size() == 2);
    REQUIRE(kept[0].id == "e");
    REQUIRE(kept[1].id == "t");
}

TEST_CASE("strip_sync_properties removes what sync writes", "[block_tree]") {
    REQUIRE(strip_sync_properties("milk\nid:: block-3", "block-3") == "milk");
    REQUIRE(strip_sync_properties("milk\nid:: block-9", "block-3") == "milk\nid:: block-9");
    REQUIRE(strip_sync_properties("Shared\ntitle:: Shared", "") == "Shared");
    REQUIRE(strip_sync_properties(
                "x\nsamepage:: 0b9f3c1e-8d2a-4c5b-9e7f-1a2b3c4d5e6f", "") == "x");
    REQUIRE(strip_sync_properties("plain\n", "") == "plain");
    REQUIRE(strip_sync_properties("", "b") == "");
}

TEST_CASE("strip_property_lines removes every property line", "[block_tree]") {
    REQUIRE(strip_property_lines("a:: 1\nb:: 2") == "");
    REQUIRE(strip_property_lines("text\nkey:: value") == "text\n");
}

TEST_CASE("parse_properties reads key:: value lines", "[block_tree]") {
    auto props = parse_properties("milk\nid:: block-4\nsamepage:: abc");

    REQUIRE(props.size() == 2);
    REQUIRE(props.at("id") == "block-4");
    REQUIRE(props.at("samepage") == "abc");
    REQUIRE(parse_properties("no properties here").empty());
    REQUIRE(parse_properties("Key:: upper case is not a property").empty());
}

TEST_CASE("with_property replaces or appends", "[block_tree]") {
    REQUIRE(with_property("milk", "id", "block-1") == "milk\nid:: block-1");
    REQUIRE(with_property("samepage:: old", "samepage", "new") == "samepage:: new");
    REQUIRE(with_property("x\nid:: a\ny", "id", "b") == "x\nid:: b\ny");
}
