#include "LineClassifier.hpp"
#include <cctype>

using namespace marksite;

static constexpr std::string_view whitespace = " \t\r\n\f\v";

static std::string_view trim(const std::string_view str)
{
    auto start = str.find_first_not_of(whitespace);
    auto end = str.find_last_not_of(whitespace);
    return start == std::string_view::npos ? "" : str.substr(start, end - start + 1);
}

static bool isWordChar(const char ch)
{
    return std::isalnum(static_cast<unsigned char>(ch)) || ch == '_';
}

// ``` followed by an optional one word language and trailing whitespace
static bool matchFence(const std::string_view line, std::string* language = nullptr)
{
    if(line.substr(0, 3) != "```")
        return false;
    size_t word_end = 3;
    while(word_end < line.size() && isWordChar(line[word_end]))
        word_end++;
    if(!trim(line.substr(word_end)).empty())
        return false;
    if(language != nullptr)
        *language = line.substr(3, word_end - 3);
    return true;
}

// $$ alone at the start of the line
static bool matchMathDelimiter(const std::string_view line)
{
    return line.size() >= 2 && line.substr(0, 2) == "$$" && trim(line.substr(2)).empty();
}

static bool matchHeader(const std::string_view line, MarkdownLine& node)
{
    size_t hashes = line.find_first_not_of('#');
    if(hashes == std::string_view::npos)
        hashes = line.size();
    if(hashes == 0)
        return false;

    if(hashes <= 6) {
        // "#tag" is a paragraph, "# tag" and a lone "#" are headers
        if(hashes < line.size() && whitespace.find(line[hashes]) == std::string_view::npos)
            return false;
        node.level = static_cast<int>(hashes);
        node.text = trim(line.substr(hashes));
    }
    else {
        // Deeper than h6: clamp and keep the extra '#' as text
        node.level = 6;
        node.text = trim(line.substr(6));
    }
    node.type = LineType::Header;
    return true;
}

static bool matchImage(const std::string_view line, MarkdownLine& node)
{
    // ![[name.ext]] or ![[name.ext|options]], alone on the line
    const std::string_view sv = trim(line);
    if(sv.size() < 5 || sv.substr(0, 3) != "![[" || sv.substr(sv.size() - 2) != "]]")
        return false;
    const std::string_view inner = sv.substr(3, sv.size() - 5);
    if(inner.find(']') != std::string_view::npos)
        return false;
    auto name = trim(inner.substr(0, inner.find('|')));
    if(name.empty())
        return false;
    node.type = LineType::ImageDirective;
    node.text = name;
    return true;
}

namespace marksite
{

ClassifiedLine classifyLine(const std::string_view line, const ParseState& state)
{
    ClassifiedLine res{{}, state};
    MarkdownLine& node = res.line;
    ParseState& next = res.state;

    if(next.front_matter == FrontMatterState::Pending) {
        next.front_matter = FrontMatterState::Done;
        if(trim(line) == "---") {
            next.front_matter = FrontMatterState::Inside;
            node.type = LineType::FrontMatterDelimiter;
            return res;
        }
    }
    else if(next.front_matter == FrontMatterState::Inside) {
        if(trim(line) == "---") {
            next.front_matter = FrontMatterState::Done;
            node.type = LineType::FrontMatterDelimiter;
        }
        else
            node.type = LineType::FrontMatterContent;
        return res;
    }

    if(next.inCodeBlock()) {
        if(matchFence(line)) {
            next.fence = FenceState::Outside;
            next.fence_language.clear();
            node.type = LineType::FenceClose;
        }
        else {
            next.block_lines++;
            node.type = LineType::CodeContent;
            node.text = line;
        }
        return res;
    }

    if(next.inMathBlock()) {
        if(matchMathDelimiter(line)) {
            next.math = MathBlockState::Outside;
            node.type = LineType::MathClose;
        }
        else {
            next.block_lines++;
            node.type = LineType::MathContent;
            node.text = line;
        }
        return res;
    }

    if(trim(line).empty()) {
        node.type = LineType::Blank;
        return res;
    }

    std::string language;
    if(matchFence(line, &language)) {
        next.fence = FenceState::Inside;
        next.fence_language = language;
        next.code_block_count++;
        next.block_lines = 0;
        node.type = LineType::FenceOpen;
        node.text = std::move(language);
        return res;
    }

    if(matchMathDelimiter(line)) {
        next.math = MathBlockState::Inside;
        next.block_lines = 0;
        node.type = LineType::MathOpen;
        return res;
    }

    if(matchHeader(line, node) || matchImage(line, node))
        return res;

    node.type = LineType::PlainText;
    node.text = line;
    return res;
}

std::vector<std::string_view> splitLines(const std::string_view text)
{
    std::vector<std::string_view> lines;
    size_t last_pos = 0;
    while(last_pos < text.size()) {
        size_t end = text.find('\n', last_pos);
        if(end == std::string_view::npos)
            end = text.size();
        std::string_view line = text.substr(last_pos, end - last_pos);
        if(!line.empty() && line.back() == '\r')
            line.remove_suffix(1);
        lines.push_back(line);
        last_pos = end + 1;
    }
    return lines;
}

}
