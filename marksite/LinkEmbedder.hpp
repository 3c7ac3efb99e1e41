#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace marksite
{

/**
 * @brief Append navigation links to a rendered homepage body.
 * @param body The rendered HTML body.
 * @param homepage_dirs Child homepage directory names. Linked to DIR/index.html
 * @param singleton_articles Article names, with or without the .md extension. Linked to NAME.html
 * @return body, then a <hr> and one list per non-empty group. Homepages come
 * first and each group keeps the given order. Without any identifier body is
 * returned as is.
 * @throws std::invalid_argument if an identifier is empty, "." or "..", or
 * contains a path separator.
 */
std::string embedLinks(const std::string_view body,
    const std::vector<std::string>& homepage_dirs,
    const std::vector<std::string>& singleton_articles);

}
