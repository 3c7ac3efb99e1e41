#include "MarkdownRenderer.hpp"
#include "InlineRenderer.hpp"
#include "LinkEmbedder.hpp"
#include <drogon/HttpViewData.h>
#include <trantor/utils/Logger.h>

#include <string_view>

using namespace drogon;
using namespace marksite;

static const std::string_view imageBasePath = "../graphics/";

static bool hasMathDelimiters(const std::string_view text)
{
    if(text.find("\\(") != std::string_view::npos || text.find("\\[") != std::string_view::npos)
        return true;
    auto first = text.find('$');
    return first != std::string_view::npos && text.find('$', first + 1) != std::string_view::npos;
}

static std::string codeBlockId(size_t index)
{
    return "code-block-" + std::to_string(index);
}

static std::string openCodeBlock(const ParseState& state)
{
    const std::string id = codeBlockId(state.code_block_count);
    std::string res = "<div class=\"code-block\"><button class=\"copy\" data-target=\"" + id
        + "\" onclick=\"copyCode(this)\">Copy</button><pre><code id=\"" + id + "\"";
    if(!state.fence_language.empty())
        res += " class=\"language-" + state.fence_language + "\"";
    return res + ">";
}

static const std::string_view closeCodeBlock = "</code></pre></div>\n";
static const std::string_view openMathBlock = "<p>$$\n";
static const std::string_view closeMathBlock = "\n$$</p>\n";

// Block content lines are joined with '\n', with no newline after the last one
static std::string blockLine(const std::string& text, const ParseState& state)
{
    std::string escaped = HttpViewData::htmlTranslate(text);
    return state.block_lines > 1 ? "\n" + escaped : escaped;
}

RenderedDocument marksite::renderDocument(const std::string_view markdown)
{
    RenderedDocument doc;
    std::string& res = doc.body;
    ParseState state;

    for(const auto line : splitLines(markdown)) {
        auto [node, next] = classifyLine(line, state);

        switch(node.type) {
            case LineType::FrontMatterDelimiter:
                LOG_TRACE << (next.inFrontMatter() ? "Front matter opened" : "Front matter closed");
                break;
            case LineType::FrontMatterContent:
            case LineType::Blank:
                break;
            case LineType::FenceOpen:
                res += openCodeBlock(next);
                break;
            case LineType::CodeContent:
                res += blockLine(node.text, next);
                break;
            case LineType::FenceClose:
                res += closeCodeBlock;
                break;
            case LineType::MathOpen:
                doc.has_math = true;
                res += openMathBlock;
                break;
            case LineType::MathContent:
                res += blockLine(node.text, next);
                break;
            case LineType::MathClose:
                res += closeMathBlock;
                break;
            case LineType::Header: {
                const std::string tag = "h" + std::to_string(node.level);
                std::string text = HttpViewData::htmlTranslate(node.text);
                if(node.level == 1 && doc.title.empty())
                    doc.title = text;
                doc.has_math = doc.has_math || hasMathDelimiters(node.text);
                res += "<" + tag + ">" + renderInline(text) + "</" + tag + ">\n";
                break;
            }
            case LineType::ImageDirective: {
                std::string name = HttpViewData::htmlTranslate(node.text);
                res += "<img src=\"" + std::string(imageBasePath) + name + "\" alt=\"" + name + "\">\n";
                break;
            }
            case LineType::PlainText:
                doc.has_math = doc.has_math || hasMathDelimiters(node.text);
                res += "<p>" + renderInline(HttpViewData::htmlTranslate(node.text)) + "</p>\n";
                break;
        }
        state = std::move(next);
    }

    if(state.inCodeBlock()) {
        LOG_DEBUG << "Code block " << state.code_block_count << " is not terminated. Closing it at end of document";
        res += closeCodeBlock;
    }
    if(state.inMathBlock()) {
        LOG_DEBUG << "$$ block is not terminated. Closing it at end of document";
        res += closeMathBlock;
    }
    if(state.inFrontMatter())
        LOG_DEBUG << "Front matter is not terminated. The whole document was treated as metadata";
    return doc;
}

std::string marksite::renderMarkdown(const std::string_view markdown)
{
    return renderDocument(markdown).body;
}

std::string marksite::renderHomepage(const std::string_view markdown,
    const std::vector<std::string>& homepage_dirs,
    const std::vector<std::string>& singleton_articles)
{
    return embedLinks(renderMarkdown(markdown), homepage_dirs, singleton_articles);
}
