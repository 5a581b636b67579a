#pragma once

#include "model/SelectorCandidate.h"
#include "selector/IPageCapability.h"
#include <optional>
#include <string>
#include <variant>

namespace RTE {

struct TestIdQuery {
    std::string testId;
};

struct RoleQuery {
    std::string role;
    std::optional<std::string> accessibleName;
};

struct TextQuery {
    std::string text;
};

// Semantic, Structural and Css candidates all end up as a raw selector
struct RawSelectorQuery {
    std::string selector;
};

/**
 * @brief Concrete page lookup, one alternative per query family
 */
using LocatorQuery = std::variant<TestIdQuery, RoleQuery, TextQuery, RawSelectorQuery>;

/**
 * @brief Translate a candidate into the lookup it stands for
 *
 * Semantic values of the form "tag[Label]" query only the tag part.
 */
LocatorQuery toLocatorQuery(const SelectorCandidate &candidate);

/**
 * @brief Run a lookup against the page and return the match count
 *
 * Exceptions from the page propagate to the caller.
 */
size_t countMatches(const LocatorQuery &query, IPageCapability &page);

}  // namespace RTE
