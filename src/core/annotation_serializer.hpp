#pragma once

#include "core/annotation.hpp"
#include "core/result.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace trellis::doc {

/**
 * Delimiters - the markup written around an annotated range.
 */
struct Delimiters {
    std::string prefix;
    std::string suffix;
};

/**
 * Markup for an inline annotation. Types without a markup form (including
 * structural ones) get an empty pair.
 */
[[nodiscard]] Delimiters delimiters_for(const Annotation& annotation);

/**
 * Rebuild a block's raw markup from its plain text and inline annotations.
 *
 * `annotations` use offsets relative to `text` and are applied strictly in the
 * given order. After wrapping annotation i, every later annotation j is moved
 * to account for the inserted delimiters:
 *
 *   j.start += prefix if j.start >= i.start;  += suffix if j.start >= i.end
 *   j.end   += prefix if j.end   >= i.start;  += suffix if j.end   >  i.end
 *
 * so a range ending exactly where another begins is only shifted once.
 * Returns MalformedDocument if a range falls outside the text.
 */
[[nodiscard]] Result<std::string> serialize_block(std::string_view text,
                                                  std::vector<Annotation> annotations);

} // namespace trellis::doc
