#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace RTE {

/**
 * @brief Read-only element queries a browser automation binding must provide
 *
 * One query per locator family. Each returns the number of elements that
 * currently match. Implementations may throw std::exception subclasses for
 * stale or detached references; the resolver treats such a failure as zero
 * matches for that candidate.
 */
class IPageCapability {
public:
    virtual ~IPageCapability() = default;

    virtual size_t countByTestId(const std::string &testId) = 0;

    /**
     * @param role ARIA role (button, link, ...)
     * @param accessibleName Required accessible name, or nullopt to match any
     */
    virtual size_t countByRole(const std::string &role, const std::optional<std::string> &accessibleName) = 0;

    virtual size_t countByText(const std::string &text) = 0;

    /**
     * @brief Raw selector lookup (CSS or structural path)
     */
    virtual size_t countBySelector(const std::string &selector) = 0;
};

}  // namespace RTE
