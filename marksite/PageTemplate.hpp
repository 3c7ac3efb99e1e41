#pragma once

#include <string>

#include "MarkdownRenderer.hpp"

namespace marksite
{

/**
 * @brief Static HTML page wrapping a rendered body.
 *
 * A template is HTML text with these markers:
 * - <div id="placement"></div>: receives the body (required)
 * - __MARKSITE_TITLE__: the page title
 * - __MARKSITE_MATH_SCRIPTS__: the polyfill and MathJax script tags, only when
 *   the document has math. Without this marker the scripts go before </head>
 */
class PageTemplate
{
public:
    // The built-in template, with styling and the copy button script
    PageTemplate();
    explicit PageTemplate(std::string source);

    static PageTemplate fromFile(const std::string& path);

    std::string render(const RenderedDocument& doc, const std::string& fallback_title) const;
    // title is inserted as is and must already be HTML escaped
    std::string render(const std::string& body, const std::string& title, bool has_math) const;

    const std::string& source() const { return source_; }

protected:
    std::string source_;
};

}
