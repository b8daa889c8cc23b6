#include "core/annotation.hpp"

#include <set>

namespace trellis::doc {

AnnotationType parse_type(std::string_view name) {
    if (name == "block") return AnnotationType::Block;
    if (name == "metadata") return AnnotationType::Metadata;
    if (name == "bold") return AnnotationType::Bold;
    if (name == "italics") return AnnotationType::Italics;
    if (name == "highlighting") return AnnotationType::Highlighting;
    if (name == "strikethrough") return AnnotationType::Strikethrough;
    if (name == "link") return AnnotationType::Link;
    return AnnotationType::Unknown;
}

const Annotation* find_metadata(const FlatDocument& doc) {
    for (const auto& a : doc.annotations) {
        if (a.type == AnnotationType::Metadata) {
            return &a;
        }
    }
    return nullptr;
}

namespace {

// Offsets may not split a multi-byte UTF-8 sequence.
bool on_char_boundary(const std::string& content, size_t offset) {
    return offset >= content.size() ||
           (static_cast<unsigned char>(content[offset]) & 0xC0) != 0x80;
}

} // namespace

Result<void> validate(const FlatDocument& doc) {
    const auto fail = [](size_t index, const Annotation& a, const std::string& why) {
        return Result<void>::err(Error{
            "Annotation " + std::to_string(index) + " (" + std::string(a.wire_type()) +
                " [" + std::to_string(a.start) + ", " + std::to_string(a.end) + ")): " + why,
            ErrorCode::MalformedDocument});
    };

    if (doc.annotations.empty() || doc.annotations.front().type != AnnotationType::Metadata) {
        return Result<void>::err(
            Error{"Document does not start with a metadata annotation", ErrorCode::MalformedDocument});
    }

    const auto size = doc.content.size();
    std::set<std::string> identifiers;
    size_t block_floor = 0;
    for (size_t i = 0; i < doc.annotations.size(); ++i) {
        const auto& a = doc.annotations[i];
        if (a.end < a.start) {
            return fail(i, a, "end precedes start");
        }
        if (a.end > size) {
            return fail(i, a, "range exceeds content length " + std::to_string(size));
        }
        if (!on_char_boundary(doc.content, a.start) || !on_char_boundary(doc.content, a.end)) {
            return fail(i, a, "offset inside a UTF-8 character");
        }

        switch (a.type) {
            case AnnotationType::Block:
                if (!a.block()) return fail(i, a, "missing block attributes");
                if (a.block()->identifier.empty()) return fail(i, a, "empty block identifier");
                if (a.block()->level < 0) return fail(i, a, "negative level");
                if (a.start < block_floor) return fail(i, a, "block out of document order");
                if (!identifiers.insert(a.block()->identifier).second) {
                    return fail(i, a, "duplicate block identifier " + a.block()->identifier);
                }
                block_floor = a.end;
                break;
            case AnnotationType::Metadata: {
                if (i != 0) return fail(i, a, "metadata annotation is not first");
                if (!a.metadata()) return fail(i, a, "missing metadata attributes");
                const auto& title = a.metadata()->title;
                if (a.start != 0 || a.end != title.size()) {
                    return fail(i, a, "metadata does not span the title");
                }
                if (doc.content.compare(0, title.size(), title) != 0) {
                    return fail(i, a, "content does not start with the title");
                }
                block_floor = a.end;
                break;
            }
            case AnnotationType::Link:
                if (!a.link()) return fail(i, a, "missing href");
                break;
            default:
                break;
        }
    }
    return Result<void>::ok();
}

} // namespace trellis::doc
