#pragma once

#include <cctype>
#include <string>
#include <vector>

namespace RTE {

/**
 * @brief Turn an arbitrary string into a name usable in suite names and file paths
 *
 * Leading and trailing '/' are stripped, then every character that is not
 * alphanumeric, '-' or '_' is replaced by '-'.
 *
 * @param text Input, typically a route such as "/products/list"
 * @param emptyPlaceholder Returned when nothing remains (e.g. for "/")
 */
inline std::string slugify(const std::string &text, const std::string &emptyPlaceholder) {
    size_t begin = text.find_first_not_of('/');
    if (begin == std::string::npos) {
        return emptyPlaceholder;
    }
    size_t end = text.find_last_not_of('/');

    std::string slug;
    slug.reserve(end - begin + 1);
    for (size_t i = begin; i <= end; ++i) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if (std::isalnum(c) || c == '-' || c == '_') {
            slug += static_cast<char>(c);
        } else {
            slug += '-';
        }
    }

    return slug.empty() ? emptyPlaceholder : slug;
}

inline std::string join(const std::vector<std::string> &parts, const std::string &separator) {
    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            result += separator;
        }
        result += parts[i];
    }
    return result;
}

}  // namespace RTE
