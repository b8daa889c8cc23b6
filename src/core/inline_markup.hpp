#pragma once

#include "core/host.hpp"

#include <string_view>

namespace trellis::doc {

/**
 * MarkdownInlineCodec - decodes the outliner's inline syntax:
 *
 *   **bold**   _italics_   ^^highlight^^   ~~strike~~   [label](href)
 *
 * Marks nest. An opening delimiter without a matching close, or with nothing
 * between open and close, stays literal text. Annotations come out in the
 * order their opening delimiters appear, outer before inner, which is the
 * order serialize_block needs to reproduce the same markup.
 */
class MarkdownInlineCodec final : public InlineMarkupCodec {
public:
    [[nodiscard]] DecodedText decode(std::string_view raw) const override;
};

} // namespace trellis::doc
