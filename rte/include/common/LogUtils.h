#pragma once

#include <string>

namespace RTE {
namespace Log {

/**
 * @brief Make untrusted text safe for a single log line
 *
 * Selector values and runner output come from generated code and the page
 * under test. Newlines, carriage returns and tabs become visible escapes,
 * any other byte outside printable ASCII becomes '?'.
 */
inline std::string sanitize(const std::string &input) {
    std::string sanitized;
    sanitized.reserve(input.length());

    for (char c : input) {
        switch (c) {
        case '\n':
            sanitized += "\\n";
            break;
        case '\r':
            sanitized += "\\r";
            break;
        case '\t':
            sanitized += "\\t";
            break;
        default:
            sanitized += (c >= 32 && c < 127) ? c : '?';
            break;
        }
    }

    return sanitized;
}

/**
 * @brief Sanitized excerpt of the last maxLength characters
 *
 * Runner output carries its failure summary at the end.
 */
inline std::string tail(const std::string &input, size_t maxLength = 512) {
    if (input.length() <= maxLength) {
        return sanitize(input);
    }
    return "..." + sanitize(input.substr(input.length() - maxLength));
}

}  // namespace Log
}  // namespace RTE
