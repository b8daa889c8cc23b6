#pragma once

#include <rapidcheck.h>

#include <string>

namespace trellis::testing {

// Words never contain markup delimiters.
inline rc::Gen<std::string> word() {
    return rc::gen::nonEmpty(
        rc::gen::container<std::string>(rc::gen::elementOf(std::string("abcxyz019 "))));
}

/**
 * Inline markup the codec understands: plain runs, each symmetric mark,
 * links and one level of nesting, concatenated.
 */
inline rc::Gen<std::string> inline_markup() {
    return rc::gen::exec([] {
        std::string raw;
        const auto segments = *rc::gen::inRange(0, 6);
        for (int i = 0; i < segments; ++i) {
            const auto text = *word();
            switch (*rc::gen::inRange(0, 7)) {
                case 0: raw += text; break;
                case 1: raw += "**" + text + "**"; break;
                case 2: raw += "_" + text + "_"; break;
                case 3: raw += "^^" + text + "^^"; break;
                case 4: raw += "~~" + text + "~~"; break;
                case 5: raw += "[" + text + "](" + *word() + ")"; break;
                default: raw += "**_" + text + "_**"; break;
            }
        }
        return raw;
    });
}

} // namespace trellis::testing
