#include "selector/SelectorResolver.h"
#include "common/LogUtils.h"
#include "common/Logger.h"
#include "selector/LocatorQuery.h"

#include <exception>

namespace RTE {

std::string HealEvent::warningMessage() const {
    return "Selector healed: preferred " + originalCandidate.describe() + " failed, fell back to " +
           usedCandidate.describe();
}

std::optional<HealEvent> ResolveResult::healEvent() const {
    if (!found || !healed || !usedCandidate || !originalCandidate) {
        return std::nullopt;
    }
    return HealEvent{*originalCandidate, *usedCandidate};
}

std::optional<std::string> ResolveResult::warningMessage() const {
    auto event = healEvent();
    if (!event) {
        return std::nullopt;
    }
    return event->warningMessage();
}

ResolveResult SelectorResolver::resolve(const SelectorChain &chain, IPageCapability &page) const {
    ResolveResult result;

    if (chain.empty()) {
        LOG_DEBUG("SelectorResolver: Empty chain, nothing to resolve");
        return result;
    }

    for (size_t i = 0; i < chain.size(); ++i) {
        const auto &candidate = chain[i];

        size_t matches = 0;
        try {
            matches = countMatches(toLocatorQuery(candidate), page);
        } catch (const std::exception &e) {
            // Stale or detached references are expected while the page mutates
            result.failedQueries++;
            LOG_DEBUG("SelectorResolver: Query for {} failed: {}", Log::sanitize(candidate.describe()),
                      Log::sanitize(e.what()));
            continue;
        }

        if (matches == 0) {
            continue;
        }

        result.found = true;
        result.usedCandidate = candidate;
        result.usedIndex = i;
        result.healed = i > 0;
        if (result.healed) {
            result.originalCandidate = chain.front();
            LOG_WARN("SelectorResolver: Healed {} -> {}", Log::sanitize(chain.front().describe()),
                     Log::sanitize(candidate.describe()));
        }
        return result;
    }

    LOG_WARN("SelectorResolver: All {} candidates failed: {}", chain.size(), Log::sanitize(describeChain(chain)));
    return result;
}

}  // namespace RTE
