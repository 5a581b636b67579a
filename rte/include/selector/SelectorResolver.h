#pragma once

#include "model/SelectorCandidate.h"
#include "selector/IPageCapability.h"
#include <optional>
#include <string>

namespace RTE {

/**
 * @brief Record of a resolution that fell back past the preferred candidate
 */
struct HealEvent {
    SelectorCandidate originalCandidate;
    SelectorCandidate usedCandidate;

    /**
     * @brief Warning line consumed by the reporting layer
     *
     * "Selector healed: preferred <a>(<x>) failed, fell back to <b>(<y>)"
     */
    std::string warningMessage() const;
};

/**
 * @brief Outcome of resolving one selector chain against a page
 *
 * found=false means every candidate was tried without a match (or the chain
 * was empty). healed=true means the winner was not chain[0]; in that case
 * originalCandidate holds chain[0].
 */
struct ResolveResult {
    bool found = false;
    bool healed = false;
    std::optional<SelectorCandidate> usedCandidate;
    std::optional<SelectorCandidate> originalCandidate;
    // Index of usedCandidate in the chain (valid when found)
    size_t usedIndex = 0;
    // Candidates that raised while being queried
    size_t failedQueries = 0;

    std::optional<HealEvent> healEvent() const;

    /**
     * @return Heal warning, or nullopt when no healing happened
     */
    std::optional<std::string> warningMessage() const;
};

/**
 * @brief Finds an element by trying a selector chain in order
 *
 * The first candidate with at least one match wins. A candidate whose query
 * throws counts as zero matches and resolution moves on. Nothing is thrown
 * for a missing element; retries belong to the caller.
 */
class SelectorResolver {
public:
    ResolveResult resolve(const SelectorChain &chain, IPageCapability &page) const;
};

}  // namespace RTE
