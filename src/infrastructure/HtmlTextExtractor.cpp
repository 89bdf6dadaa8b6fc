/**
 * @file HtmlTextExtractor.cpp
 * @brief Implementation of HtmlTextExtractor.
 */

#include "infrastructure/HtmlTextExtractor.hpp"

#include <gumbo.h>
#include <regex>

namespace lextable::infrastructure {

namespace {

bool IsSkipped(GumboTag tag) {
    switch (tag) {
        case GUMBO_TAG_SCRIPT:
        case GUMBO_TAG_STYLE:
        case GUMBO_TAG_NOSCRIPT:
        case GUMBO_TAG_HEAD:
        case GUMBO_TAG_TEMPLATE:
            return true;
        default:
            return false;
    }
}

bool IsBlock(GumboTag tag) {
    switch (tag) {
        case GUMBO_TAG_ADDRESS: case GUMBO_TAG_ARTICLE: case GUMBO_TAG_ASIDE:
        case GUMBO_TAG_BLOCKQUOTE: case GUMBO_TAG_BODY: case GUMBO_TAG_BR:
        case GUMBO_TAG_DD: case GUMBO_TAG_DIV: case GUMBO_TAG_DL: case GUMBO_TAG_DT:
        case GUMBO_TAG_FOOTER: case GUMBO_TAG_FORM:
        case GUMBO_TAG_H1: case GUMBO_TAG_H2: case GUMBO_TAG_H3:
        case GUMBO_TAG_H4: case GUMBO_TAG_H5: case GUMBO_TAG_H6:
        case GUMBO_TAG_HEADER: case GUMBO_TAG_HR: case GUMBO_TAG_HTML: case GUMBO_TAG_LI:
        case GUMBO_TAG_MAIN: case GUMBO_TAG_NAV: case GUMBO_TAG_OL: case GUMBO_TAG_P:
        case GUMBO_TAG_PRE: case GUMBO_TAG_SECTION: case GUMBO_TAG_TABLE:
        case GUMBO_TAG_TBODY: case GUMBO_TAG_THEAD: case GUMBO_TAG_TFOOT:
        case GUMBO_TAG_TR: case GUMBO_TAG_UL:
            return true;
        default:
            return false;
    }
}

void EndLine(std::string& out) {
    if (!out.empty() && out.back() != '\n') out.push_back('\n');
}

void CollectText(const GumboNode* node, std::string& out) {
    switch (node->type) {
        case GUMBO_NODE_TEXT:
        case GUMBO_NODE_CDATA:
            out += node->v.text.text;
            return;
        case GUMBO_NODE_WHITESPACE:
            out.push_back(' ');
            return;
        case GUMBO_NODE_ELEMENT:
        case GUMBO_NODE_TEMPLATE:
            break;
        default:
            return;
    }

    const GumboTag tag = node->v.element.tag;
    if (IsSkipped(tag)) return;

    const bool block = IsBlock(tag);
    if (block) EndLine(out);

    const GumboVector& children = node->v.element.children;
    for (unsigned int i = 0; i < children.length; ++i) {
        CollectText(static_cast<const GumboNode*>(children.data[i]), out);
    }

    if (block) {
        EndLine(out);
    } else if (tag == GUMBO_TAG_TD || tag == GUMBO_TAG_TH) {
        out.push_back(' ');
    }
}

} // namespace

std::string HtmlTextExtractor::StripSelfClosedRawTextTags(const std::string& html) {
    static const std::regex selfClosed("<(script|style|noscript)\\b[^>]*/\\s*>",
                                       std::regex::ECMAScript | std::regex::icase);
    return std::regex_replace(html, selfClosed, "");
}

std::string HtmlTextExtractor::ToText(const std::string& html) {
    const std::string input = StripSelfClosedRawTextTags(html);
    GumboOutput* output = gumbo_parse_with_options(&kGumboDefaultOptions, input.c_str(), input.size());
    if (!output) {
        return std::string();
    }

    std::string text;
    CollectText(output->root, text);
    gumbo_destroy_output(&kGumboDefaultOptions, output);
    return text;
}

} // namespace lextable::infrastructure
