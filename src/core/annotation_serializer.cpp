#include "core/annotation_serializer.hpp"

namespace trellis::doc {
namespace {

bool splits_character(const std::string& text, std::size_t offset) {
    return offset < text.size() && (static_cast<unsigned char>(text[offset]) & 0xC0) == 0x80;
}

} // namespace

Delimiters delimiters_for(const Annotation& annotation) {
    switch (annotation.type) {
        case AnnotationType::Bold:
            return {"**", "**"};
        case AnnotationType::Highlighting:
            return {"^^", "^^"};
        case AnnotationType::Italics:
            return {"_", "_"};
        case AnnotationType::Strikethrough:
            return {"~~", "~~"};
        case AnnotationType::Link: {
            const auto* link = annotation.link();
            return {"[", "](" + (link ? link->href : std::string{}) + ")"};
        }
        case AnnotationType::Block:
        case AnnotationType::Metadata:
        case AnnotationType::Unknown:
            break;
    }
    return {};
}

Result<std::string> serialize_block(std::string_view text, std::vector<Annotation> annotations) {
    std::string out(text);

    for (std::size_t i = 0; i < annotations.size(); ++i) {
        const auto& current = annotations[i];
        if (current.start > current.end || current.end > out.size()) {
            return Result<std::string>::err(Error{
                "Annotation " + std::string(current.wire_type()) + " [" +
                    std::to_string(current.start) + ", " + std::to_string(current.end) +
                    ") outside block text of length " + std::to_string(out.size()),
                ErrorCode::MalformedDocument});
        }
        if (splits_character(out, current.start) || splits_character(out, current.end)) {
            return Result<std::string>::err(Error{
                "Annotation " + std::string(current.wire_type()) + " [" +
                    std::to_string(current.start) + ", " + std::to_string(current.end) +
                    ") splits a UTF-8 character",
                ErrorCode::MalformedDocument});
        }

        const auto d = delimiters_for(current);
        const auto prefix_len = d.prefix.size();
        const auto suffix_len = d.suffix.size();

        for (std::size_t j = i + 1; j < annotations.size(); ++j) {
            auto& later = annotations[j];
            const auto start = later.start;
            const auto end = later.end;
            later.start += (start >= current.start ? prefix_len : 0) +
                           (start >= current.end ? suffix_len : 0);
            later.end += (end >= current.start ? prefix_len : 0) +
                         (end > current.end ? suffix_len : 0);
        }

        out.insert(current.end, d.suffix);
        out.insert(current.start, d.prefix);
    }
    return Result<std::string>::ok(std::move(out));
}

} // namespace trellis::doc
