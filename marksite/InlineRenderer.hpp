#pragma once

#include <string>
#include <string_view>

namespace marksite
{

/**
 * @brief Render inline Markdown markup of a header or paragraph to HTML.
 * @param text HTML escaped text of one line.
 * @return The text with markup replaced. Text is not escaped again.
 *
 * Passes are applied in this order and never nest:
 * - `code` => <code>code</code>, the content is left untouched by later passes
 * - **text** => <strong>text</strong>
 * - __text__ => <u>text</u>
 * - *text* and _text_ => <em>text</em>
 * Unterminated markers are kept as literal text.
 */
std::string renderInline(const std::string_view text);

}
