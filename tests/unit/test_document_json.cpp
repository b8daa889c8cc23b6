#include <catch2/catch_test_macros.hpp>
#include "sync/document_json.hpp"

#include <QJsonArray>
#include <QJsonDocument>

using namespace trellis;
using namespace trellis::doc;
using namespace trellis::sync;

namespace {

FlatDocument sample_document() {
    FlatDocument doc;
    doc.content = "Caf\xC3\xA9" "buy milk";
    doc.annotations.push_back(make_metadata("Caf\xC3\xA9", ""));
    doc.annotations.push_back(make_block(5, 13, BlockAttributes{"g-1", 0, ViewType::Numbered}));
    doc.annotations.push_back(make_mark(AnnotationType::Bold, 5, 8));
    doc.annotations.push_back(make_link(9, 13, "https://example.org"));
    return doc;
}

} // namespace

TEST_CASE("Document JSON layout", "[document_json]") {
    const auto obj = to_json_object(sample_document());

    REQUIRE(obj.value("content").toString() == QString::fromUtf8("Caf\xC3\xA9" "buy milk"));
    const auto annotations = obj.value("annotations").toArray();
    REQUIRE(annotations.size() == 4);

    const auto block = annotations.at(1).toObject();
    REQUIRE(block.value("type").toString() == "block");
    REQUIRE(block.value("start").toInt() == 5);
    REQUIRE(block.value("end").toInt() == 13);
    const auto attrs = block.value("attributes").toObject();
    REQUIRE(attrs.value("identifier").toString() == "g-1");
    REQUIRE(attrs.value("level").toInt() == 0);
    REQUIRE(attrs.value("viewType").toString() == "numbered");

    REQUIRE(annotations.at(0).toObject().value("attributes").toObject()
                .value("parent").toString().isEmpty());
    REQUIRE_FALSE(annotations.at(2).toObject().contains("attributes"));
    REQUIRE(annotations.at(3).toObject().value("attributes").toObject()
                .value("href").toString() == "https://example.org");
}

TEST_CASE("Document JSON reads back what it writes", "[document_json]") {
    const auto doc = sample_document();

    auto parsed = from_json(to_json(doc));

    REQUIRE(parsed.is_ok());
    REQUIRE(parsed.unwrap() == doc);
}

TEST_CASE("Unknown annotation types survive", "[document_json]") {
    auto parsed = from_json(R"({"content":"Tabc","annotations":[
        {"type":"metadata","start":0,"end":1,"attributes":{"title":"T","parent":""}},
        {"type":"reference","start":1,"end":4}]})");

    REQUIRE(parsed.is_ok());
    const auto& a = parsed.unwrap().annotations.at(1);
    REQUIRE(a.type == AnnotationType::Unknown);
    REQUIRE(a.raw_type == "reference");

    const auto written = to_json_object(parsed.unwrap());
    REQUIRE(written.value("annotations").toArray().at(1).toObject()
                .value("type").toString() == "reference");
}

TEST_CASE("Block view type defaults to bullet", "[document_json]") {
    auto parsed = from_json(R"({"content":"Tab","annotations":[
        {"type":"metadata","start":0,"end":1,"attributes":{"title":"T"}},
        {"type":"block","start":1,"end":3,"attributes":{"identifier":"g","level":1}}]})");

    REQUIRE(parsed.is_ok());
    REQUIRE(parsed.unwrap().annotations[0].metadata()->parent.empty());
    REQUIRE(parsed.unwrap().annotations[1].block()->view_type == ViewType::Bullet);
    REQUIRE(parsed.unwrap().annotations[1].block()->level == 1);
}

TEST_CASE("Bad input is a decode error", "[document_json]") {
    QByteArray input;

    SECTION("not JSON") { input = "{content"; }
    SECTION("not an object") { input = "[1, 2]"; }
    SECTION("missing content") { input = R"({"annotations":[]})"; }
    SECTION("annotations not an array") { input = R"({"content":"","annotations":{}})"; }
    SECTION("missing type") { input = R"({"content":"a","annotations":[{"start":0,"end":1}]})"; }
    SECTION("negative offset") {
        input = R"({"content":"a","annotations":[{"type":"bold","start":-1,"end":1}]})";
    }
    SECTION("offset beyond any integer") {
        input = R"({"content":"a","annotations":[{"type":"bold","start":0,"end":1e300}]})";
    }
    SECTION("fractional offset") {
        input = R"({"content":"a","annotations":[{"type":"bold","start":0.5,"end":1}]})";
    }
    SECTION("unknown view type") {
        input = R"({"content":"a","annotations":[{"type":"block","start":0,"end":1,
                  "attributes":{"identifier":"g","level":0,"viewType":"table"}}]})";
    }
    SECTION("block without level") {
        input = R"({"content":"a","annotations":[{"type":"block","start":0,"end":1,
                  "attributes":{"identifier":"g"}}]})";
    }

    auto parsed = from_json(input);
    REQUIRE(parsed.is_err());
    REQUIRE(parsed.unwrap_err().code == ErrorCode::Decode);
}

TEST_CASE("Structurally broken documents are malformed", "[document_json]") {
    QByteArray input;

    SECTION("range past the content") {
        input = R"({"content":"Tab","annotations":[
            {"type":"metadata","start":0,"end":1,"attributes":{"title":"T"}},
            {"type":"bold","start":1,"end":5}]})";
    }
    SECTION("no annotations") {
        input = R"({"content":"plain"})";
    }
    SECTION("metadata title differs from the content") {
        input = R"({"content":"Tab","annotations":[
            {"type":"metadata","start":0,"end":1,"attributes":{"title":"X"}}]})";
    }
    SECTION("offset inside a character") {
        input = QByteArray(R"({"content":"T)") + "\xC3\xA9" + R"(","annotations":[
            {"type":"metadata","start":0,"end":1,"attributes":{"title":"T"}},
            {"type":"bold","start":2,"end":3}]})";
    }

    auto parsed = from_json(input);
    REQUIRE(parsed.is_err());
    REQUIRE(parsed.unwrap_err().code == ErrorCode::MalformedDocument);
}
