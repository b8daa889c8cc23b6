#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace trellis {

/**
 * ViewType - How a block renders its children (inherited down the tree).
 */
enum class ViewType {
    Bullet,
    Numbered,
    Document
};

[[nodiscard]] constexpr std::string_view view_type_name(ViewType type) {
    switch (type) {
        case ViewType::Bullet: return "bullet";
        case ViewType::Numbered: return "numbered";
        case ViewType::Document: return "document";
    }
    return "bullet";
}

[[nodiscard]] inline std::optional<ViewType> parse_view_type(std::string_view name) {
    if (name == "bullet") return ViewType::Bullet;
    if (name == "numbered") return ViewType::Numbered;
    if (name == "document") return ViewType::Document;
    return std::nullopt;
}

} // namespace trellis

namespace trellis::doc {

/**
 * AnnotationType - Kinds of spans in a flat document.
 *
 * `Block` and `Metadata` are structural; the rest are inline marks produced
 * by the inline markup codec. Types this build does not know are carried as
 * `Unknown` with their wire name preserved.
 */
enum class AnnotationType {
    Block,
    Metadata,
    Bold,
    Italics,
    Highlighting,
    Strikethrough,
    Link,
    Unknown
};

[[nodiscard]] constexpr std::string_view type_name(AnnotationType type) {
    switch (type) {
        case AnnotationType::Block: return "block";
        case AnnotationType::Metadata: return "metadata";
        case AnnotationType::Bold: return "bold";
        case AnnotationType::Italics: return "italics";
        case AnnotationType::Highlighting: return "highlighting";
        case AnnotationType::Strikethrough: return "strikethrough";
        case AnnotationType::Link: return "link";
        case AnnotationType::Unknown: return "unknown";
    }
    return "unknown";
}

[[nodiscard]] AnnotationType parse_type(std::string_view name);

struct BlockAttributes {
    GlobalId identifier;
    int level{0};
    ViewType view_type{ViewType::Bullet};

    bool operator==(const BlockAttributes&) const = default;
};

struct MetadataAttributes {
    std::string title;
    GlobalId parent;  // empty for a top-level page

    bool operator==(const MetadataAttributes&) const = default;
};

struct LinkAttributes {
    std::string href;

    bool operator==(const LinkAttributes&) const = default;
};

using Attributes = std::variant<
    std::monostate,
    BlockAttributes,
    MetadataAttributes,
    LinkAttributes
>;

/**
 * Annotation - a typed span `[start, end)` over the document content.
 * Offsets are byte offsets into the UTF-8 content.
 */
struct Annotation {
    AnnotationType type{AnnotationType::Unknown};
    std::size_t start{0};
    std::size_t end{0};
    Attributes attributes;
    std::string raw_type;  // wire name, only set for Unknown

    [[nodiscard]] std::string_view wire_type() const {
        return type == AnnotationType::Unknown ? std::string_view(raw_type) : type_name(type);
    }

    [[nodiscard]] const BlockAttributes* block() const {
        return std::get_if<BlockAttributes>(&attributes);
    }

    [[nodiscard]] const MetadataAttributes* metadata() const {
        return std::get_if<MetadataAttributes>(&attributes);
    }

    [[nodiscard]] const LinkAttributes* link() const {
        return std::get_if<LinkAttributes>(&attributes);
    }

    [[nodiscard]] bool contains(const Annotation& other) const {
        return start <= other.start && other.end <= end;
    }

    bool operator==(const Annotation&) const = default;
};

/**
 * FlatDocument - the shared, CRDT-friendly form of a page: one text buffer
 * plus ordered annotations. The first annotation is the `metadata` span over
 * the title; `block` annotations follow in document order.
 */
struct FlatDocument {
    std::string content;
    std::vector<Annotation> annotations;

    bool operator==(const FlatDocument&) const = default;
};

// ============================================================================
// Constructors
// ============================================================================

[[nodiscard]] inline Annotation make_block(std::size_t start, std::size_t end,
                                           BlockAttributes attrs) {
    return Annotation{AnnotationType::Block, start, end, std::move(attrs), {}};
}

[[nodiscard]] inline Annotation make_metadata(std::string title, GlobalId parent) {
    const auto len = title.size();
    return Annotation{AnnotationType::Metadata, 0, len,
                      MetadataAttributes{std::move(title), std::move(parent)}, {}};
}

[[nodiscard]] inline Annotation make_mark(AnnotationType type, std::size_t start, std::size_t end) {
    return Annotation{type, start, end, std::monostate{}, {}};
}

[[nodiscard]] inline Annotation make_link(std::size_t start, std::size_t end, std::string href) {
    return Annotation{AnnotationType::Link, start, end, LinkAttributes{std::move(href)}, {}};
}

// ============================================================================
// Queries
// ============================================================================

/**
 * The leading metadata annotation, if any.
 */
[[nodiscard]] const Annotation* find_metadata(const FlatDocument& doc);

/**
 * Check the document invariants:
 * - exactly one metadata annotation, first, spanning the title at the
 *   start of the content
 * - every range lies within the content, has end >= start and starts and
 *   ends on UTF-8 character boundaries
 * - structural annotations carry their attributes, levels are non-negative
 * - block annotations follow document order after the title; identifiers
 *   are unique
 */
[[nodiscard]] Result<void> validate(const FlatDocument& doc);

/**
 * Shift an annotation by `delta` bytes.
 */
[[nodiscard]] inline Annotation rebased(Annotation a, std::ptrdiff_t delta) {
    a.start = static_cast<std::size_t>(static_cast<std::ptrdiff_t>(a.start) + delta);
    a.end = static_cast<std::size_t>(static_cast<std::ptrdiff_t>(a.end) + delta);
    return a;
}

} // namespace trellis::doc
