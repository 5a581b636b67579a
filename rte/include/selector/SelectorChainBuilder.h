#pragma once

#include "model/SelectorCandidate.h"
#include <vector>

namespace RTE {

/**
 * @brief Builds deduplicated, priority-ordered selector chains for components
 *
 * Steps:
 * 1. Explicit candidates, in the given order
 * 2. Candidates inferred from metadata for strategies not yet present
 *    (TestId from testId, Role from ariaRole, Text from textContent)
 * 3. Deduplication on (strategy, value), first occurrence wins
 * 4. Stable sort by strategy priority: TestId, Role, Text, Semantic, Structural, Css
 *
 * Pure and deterministic: the same input always yields the same chain.
 * An empty result is valid and means the component cannot be located.
 */
class SelectorChainBuilder {
public:
    SelectorChain build(const std::vector<SelectorCandidate> &candidates, const ComponentMetadata &metadata) const;

    /**
     * @brief Position of a strategy in the resolution priority (0 = most preferred)
     */
    static int priorityOf(SelectorStrategy strategy);

private:
    std::vector<SelectorCandidate> inferFromMetadata(const std::vector<SelectorCandidate> &existing,
                                                     const ComponentMetadata &metadata) const;
};

}  // namespace RTE
