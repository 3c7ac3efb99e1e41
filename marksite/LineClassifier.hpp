#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace marksite
{

enum class LineType
{
    FrontMatterDelimiter,
    FrontMatterContent,
    Blank,
    FenceOpen,
    FenceClose,
    CodeContent,
    MathOpen,
    MathClose,
    MathContent,
    Header,
    ImageDirective,
    PlainText
};

enum class FrontMatterState
{
    Pending,
    Inside,
    Done
};

enum class FenceState
{
    Outside,
    Inside
};

enum class MathBlockState
{
    Outside,
    Inside
};

struct ParseState
{
    FrontMatterState front_matter = FrontMatterState::Pending;
    FenceState fence = FenceState::Outside;
    std::string fence_language;
    size_t code_block_count = 0;
    MathBlockState math = MathBlockState::Outside;
    // Content lines seen so far in the open code or math block
    size_t block_lines = 0;

    bool inFrontMatter() const { return front_matter == FrontMatterState::Inside; }
    bool inCodeBlock() const { return fence == FenceState::Inside; }
    bool inMathBlock() const { return math == MathBlockState::Inside; }
};

struct MarkdownLine
{
    LineType type = LineType::PlainText;
    // Header level, 1..6. Zero for everything else
    int level = 0;
    // Header text, image filename, fence language, code, TeX or paragraph text
    std::string text;
};

struct ClassifiedLine
{
    MarkdownLine line;
    ParseState state;
};

/**
 * @brief Classify one line of Markdown.
 * @param line The raw line, without its line terminator.
 * @param state The parse state before this line.
 * @return The line's construct and the parse state after it.
 *
 * Rules are checked in order and the first match wins:
 * front matter, code fence content, $$ math block content, blank, fence open,
 * $$ math block open, ATX header, image directive (![[name.ext]] alone on the
 * line), plain text.
 */
ClassifiedLine classifyLine(const std::string_view line, const ParseState& state);

/**
 * @brief Split text into lines. A trailing '\r' is removed from every line and
 * a final line terminator does not produce an extra empty line.
 */
std::vector<std::string_view> splitLines(const std::string_view text);

}
