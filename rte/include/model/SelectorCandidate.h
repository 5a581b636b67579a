#pragma once

#include "RTETypes.h"
#include <optional>
#include <string>
#include <vector>

namespace RTE {

/**
 * @brief One concrete way to locate a UI element
 *
 * Immutable value: strategy, strategy-specific value and, for Role
 * candidates, the accessible name the element must carry.
 */
class SelectorCandidate {
public:
    SelectorCandidate(SelectorStrategy strategy, std::string value,
                      std::optional<std::string> accessibleName = std::nullopt)
        : strategy_(strategy), value_(std::move(value)), accessibleName_(std::move(accessibleName)) {}

    SelectorStrategy getStrategy() const {
        return strategy_;
    }

    const std::string &getValue() const {
        return value_;
    }

    const std::optional<std::string> &getAccessibleName() const {
        return accessibleName_;
    }

    /**
     * @brief Human-readable form "strategy(value)", as used in heal warnings
     */
    std::string describe() const;

    bool operator==(const SelectorCandidate &other) const = default;

private:
    SelectorStrategy strategy_;
    std::string value_;
    std::optional<std::string> accessibleName_;
};

/**
 * @brief Ordered fallback chain, unique by (strategy, value); index 0 is preferred
 */
using SelectorChain = std::vector<SelectorCandidate>;

/**
 * @brief Render a chain as "a(x) -> b(y) -> ..." for diagnostics
 */
std::string describeChain(const SelectorChain &chain);

/**
 * @brief Observed metadata of a page component, source of inferred candidates
 */
struct ComponentMetadata {
    std::string name;
    std::optional<std::string> testId;
    std::optional<std::string> ariaRole;
    std::optional<std::string> textContent;
};

}  // namespace RTE
