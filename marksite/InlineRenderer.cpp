#include "InlineRenderer.hpp"

using namespace marksite;

/**
 * Find the first delim + content + delim span at or after pos, where the
 * content is not empty and holds no delimiter character. start is where the
 * opening delimiter begins and close where the closing one begins.
 */
static bool findSpan(const std::string_view input, const std::string_view delim, size_t pos,
    size_t& start, size_t& close)
{
    const char ch = delim[0];
    while(true) {
        start = input.find(delim, pos);
        if(start == std::string_view::npos)
            return false;
        const size_t content = start + delim.size();
        close = input.find(ch, content);
        if(close == std::string_view::npos)
            return false;
        if(close == content) {
            // Empty content. A span may still open one character later ("***a**")
            pos = start + 1;
            continue;
        }
        if(input.substr(close, delim.size()) == delim)
            return true;
        // No opening delimiter can start inside the content
        pos = close;
    }
}

static std::string replaceSpans(const std::string_view input, const std::string_view delim,
    const std::string_view tag)
{
    std::string res;
    size_t pos = 0;
    size_t start = 0;
    size_t close = 0;
    while(findSpan(input, delim, pos, start, close)) {
        res += input.substr(pos, start - pos);
        res += "<";
        res += tag;
        res += ">";
        res += input.substr(start + delim.size(), close - start - delim.size());
        res += "</";
        res += tag;
        res += ">";
        pos = close + delim.size();
    }
    res += input.substr(pos);
    return res;
}

// Strong and underline run before emphasis so **a** is not read as two empty <em>
static std::string renderStyles(const std::string_view input)
{
    if(input.find_first_of("*_") == std::string_view::npos)
        return std::string(input);

    std::string res = replaceSpans(input, "**", "strong");
    res = replaceSpans(res, "__", "u");
    res = replaceSpans(res, "*", "em");
    return replaceSpans(res, "_", "em");
}

std::string marksite::renderInline(const std::string_view text)
{
    // No special character -> No need to parse
    if(text.find_first_of("*_`") == std::string_view::npos)
        return std::string(text);

    std::string res;
    size_t pos = 0;
    size_t start = 0;
    size_t close = 0;
    while(findSpan(text, "`", pos, start, close)) {
        res += renderStyles(text.substr(pos, start - pos));
        res += "<code>";
        res += text.substr(start + 1, close - start - 1);
        res += "</code>";
        pos = close + 1;
    }
    res += renderStyles(text.substr(pos));
    return res;
}
