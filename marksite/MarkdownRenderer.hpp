#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "LineClassifier.hpp"

namespace marksite
{

struct RenderedDocument
{
    // HTML body fragment
    std::string body;
    // Text of the first level 1 header, HTML escaped. Empty if there is none
    std::string title;
    // Whether the document has a $$ block, or a header or paragraph with TeX math delimiters
    bool has_math = false;
};

/**
 * @brief Render Markdown to an HTML body fragment.
 * @param markdown The Markdown source.
 * @return The rendered HTML. Never throws on any input text.
 *
 * Supported constructs, one per line:
 * - front matter between two "---" lines at the very top (dropped)
 * - ``` fenced code blocks with an optional language, each paired with a copy button
 * - $$ display math blocks, kept as TeX for MathJax
 * - # to ###### headers
 * - ![[name.ext]] images, resolved against ../graphics/
 * - anything else is its own <p> paragraph, blank lines are dropped
 */
std::string renderMarkdown(const std::string_view markdown);
RenderedDocument renderDocument(const std::string_view markdown);

/**
 * @brief Render a homepage: the Markdown body followed by links to the child
 * homepages and then to the singleton articles. See embedLinks().
 */
std::string renderHomepage(const std::string_view markdown,
    const std::vector<std::string>& homepage_dirs,
    const std::vector<std::string>& singleton_articles);

}
