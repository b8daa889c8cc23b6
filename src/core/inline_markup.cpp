#include "core/inline_markup.hpp"

#include <array>

namespace trellis::doc {
namespace {

struct Delimiter {
    std::string_view marker;
    AnnotationType type;
};

// Longer markers first so "**" is not read as two italics openers.
constexpr std::array<Delimiter, 4> kSymmetric = {{
    {"**", AnnotationType::Bold},
    {"^^", AnnotationType::Highlighting},
    {"~~", AnnotationType::Strikethrough},
    {"_", AnnotationType::Italics},
}};

struct LinkSpan {
    std::string_view label;
    std::string_view href;
    std::size_t end;  // index just past ')'
};

std::optional<LinkSpan> match_link(std::string_view raw, std::size_t open) {
    const auto label_end = raw.find("](", open + 1);
    if (label_end == std::string_view::npos || label_end == open + 1) {
        return std::nullopt;
    }
    const auto href_end = raw.find(')', label_end + 2);
    if (href_end == std::string_view::npos) {
        return std::nullopt;
    }
    const auto href = raw.substr(label_end + 2, href_end - label_end - 2);
    if (href.find('\n') != std::string_view::npos) {
        return std::nullopt;
    }
    return LinkSpan{raw.substr(open + 1, label_end - open - 1), href, href_end + 1};
}

void decode_into(std::string_view raw, DecodedText& out) {
    std::size_t i = 0;
    while (i < raw.size()) {
        if (raw[i] == '[') {
            if (auto link = match_link(raw, i)) {
                const auto slot = out.annotations.size();
                const auto start = out.text.size();
                out.annotations.push_back(make_link(start, start, std::string(link->href)));
                decode_into(link->label, out);
                out.annotations[slot].end = out.text.size();
                i = link->end;
                continue;
            }
        }

        bool matched = false;
        for (const auto& d : kSymmetric) {
            if (raw.compare(i, d.marker.size(), d.marker) != 0) {
                continue;
            }
            const auto inner_begin = i + d.marker.size();
            const auto close = raw.find(d.marker, inner_begin);
            if (close == std::string_view::npos || close == inner_begin) {
                continue;
            }
            const auto slot = out.annotations.size();
            const auto start = out.text.size();
            out.annotations.push_back(make_mark(d.type, start, start));
            decode_into(raw.substr(inner_begin, close - inner_begin), out);
            out.annotations[slot].end = out.text.size();
            i = close + d.marker.size();
            matched = true;
            break;
        }

        if (!matched) {
            out.text.push_back(raw[i]);
            ++i;
        }
    }
}

} // namespace

DecodedText MarkdownInlineCodec::decode(std::string_view raw) const {
    DecodedText out;
    out.text.reserve(raw.size());
    decode_into(raw, out);
    return out;
}

} // namespace trellis::doc
