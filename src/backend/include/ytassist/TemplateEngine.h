#pragma once

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace ytassist {

/*! Bracketed placeholder substitution for title and description templates.
 *
 *  A placeholder is `[name]` where name is one or more of `A-Z a-z 0-9 _ -`.
 *  Anything else in brackets is plain text.
 */
class TemplateEngine {
public:
    using values_t = std::map<std::string, std::string, std::less<>>;

    /*! Replace each placeholder that has a value in `values`.
     *
     *  Placeholders without a value are kept verbatim. The content is
     *  scanned once, so inserted values are never expanded.
     */
    static std::string apply(std::string_view content, const values_t& values);

    /*! Distinct placeholder names, in order of first appearance */
    static std::vector<std::string> placeholders(std::string_view content);

    static bool isPlaceholderChar(char ch) noexcept;
};

} // ns
