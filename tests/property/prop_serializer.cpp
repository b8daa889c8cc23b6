#include <catch2/catch_test_macros.hpp>
#include <rapidcheck.h>
#include "core/annotation_serializer.hpp"
#include "core/inline_markup.hpp"
#include "property/markup_gen.hpp"

using namespace trellis;
using namespace trellis::doc;

TEST_CASE("Property: serializing decoded markup restores it", "[property][serializer]") {
    rc::check("serialize_block(decode(raw)) == raw",
        []() {
            const auto raw = *trellis::testing::inline_markup();
            MarkdownInlineCodec codec;
            const auto decoded = codec.decode(raw);

            auto out = serialize_block(decoded.text, decoded.annotations);
            RC_ASSERT(out.is_ok());
            RC_ASSERT(out.unwrap() == raw);
        }
    );
}

TEST_CASE("Property: decoded ranges stay inside the text", "[property][serializer]") {
    rc::check("every decoded annotation lies within the plain text",
        []() {
            const auto raw = *trellis::testing::inline_markup();
            MarkdownInlineCodec codec;
            const auto decoded = codec.decode(raw);

            RC_ASSERT(decoded.text.size() <= raw.size());
            for (const auto& a : decoded.annotations) {
                RC_ASSERT(a.start <= a.end);
                RC_ASSERT(a.end <= decoded.text.size());
            }
        }
    );
}

TEST_CASE("Property: plain text is left alone", "[property][serializer]") {
    rc::check("text without annotations serializes to itself",
        []() {
            const auto text = *trellis::testing::word();
            auto out = serialize_block(text, {});
            RC_ASSERT(out.unwrap() == text);
        }
    );
}
