/**
 * @file HtmlTextExtractor.hpp
 * @brief Flattens HTML into text lines using gumbo.
 */

#pragma once

#include <string>

namespace lextable::infrastructure {

class HtmlTextExtractor {
public:
    /**
     * @brief Converts HTML to text.
     *
     * script, style, noscript and head content is dropped. Block elements
     * end a line and table cells are separated by a space. Entities come
     * back decoded as UTF-8.
     */
    static std::string ToText(const std::string& html);

    /** @brief Removes self-closed script/style/noscript tags, which HTML5 would treat as unterminated. */
    static std::string StripSelfClosedRawTextTags(const std::string& html);
};

} // namespace lextable::infrastructure
