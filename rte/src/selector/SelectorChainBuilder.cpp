#include "selector/SelectorChainBuilder.h"
#include "common/Logger.h"
#include "common/LogUtils.h"

#include <algorithm>
#include <set>
#include <utility>

namespace RTE {

namespace {

bool hasStrategy(const std::vector<SelectorCandidate> &candidates, SelectorStrategy strategy) {
    return std::any_of(candidates.begin(), candidates.end(),
                       [strategy](const SelectorCandidate &c) { return c.getStrategy() == strategy; });
}

}  // namespace

int SelectorChainBuilder::priorityOf(SelectorStrategy strategy) {
    switch (strategy) {
    case SelectorStrategy::TestId:
        return 0;
    case SelectorStrategy::Role:
        return 1;
    case SelectorStrategy::Text:
        return 2;
    case SelectorStrategy::Semantic:
        return 3;
    case SelectorStrategy::Structural:
        return 4;
    case SelectorStrategy::Css:
        return 5;
    }
    // Unranked strategies sort after every ranked one
    return 6;
}

SelectorChain SelectorChainBuilder::build(const std::vector<SelectorCandidate> &candidates,
                                          const ComponentMetadata &metadata) const {
    std::vector<SelectorCandidate> all(candidates);
    auto inferred = inferFromMetadata(candidates, metadata);
    all.insert(all.end(), inferred.begin(), inferred.end());

    SelectorChain chain;
    chain.reserve(all.size());
    std::set<std::pair<int, std::string>> seen;
    for (auto &candidate : all) {
        if (seen.emplace(static_cast<int>(candidate.getStrategy()), candidate.getValue()).second) {
            chain.push_back(std::move(candidate));
        }
    }

    std::stable_sort(chain.begin(), chain.end(), [](const SelectorCandidate &a, const SelectorCandidate &b) {
        return priorityOf(a.getStrategy()) < priorityOf(b.getStrategy());
    });

    if (chain.empty()) {
        LOG_DEBUG("SelectorChainBuilder: No locator for component '{}'", Log::sanitize(metadata.name));
    } else {
        LOG_TRACE("SelectorChainBuilder: Component '{}' -> {} ({} inferred)", Log::sanitize(metadata.name),
                  Log::sanitize(describeChain(chain)), inferred.size());
    }

    return chain;
}

std::vector<SelectorCandidate> SelectorChainBuilder::inferFromMetadata(const std::vector<SelectorCandidate> &existing,
                                                                       const ComponentMetadata &metadata) const {
    std::vector<SelectorCandidate> inferred;

    if (metadata.testId && !metadata.testId->empty() && !hasStrategy(existing, SelectorStrategy::TestId)) {
        inferred.emplace_back(SelectorStrategy::TestId, *metadata.testId);
    }

    if (metadata.ariaRole && !metadata.ariaRole->empty() && !hasStrategy(existing, SelectorStrategy::Role)) {
        std::optional<std::string> accessibleName;
        if (metadata.textContent && !metadata.textContent->empty()) {
            accessibleName = metadata.textContent;
        } else if (!metadata.name.empty()) {
            accessibleName = metadata.name;
        }
        inferred.emplace_back(SelectorStrategy::Role, *metadata.ariaRole, std::move(accessibleName));
    }

    if (metadata.textContent && !metadata.textContent->empty() && !hasStrategy(existing, SelectorStrategy::Text)) {
        inferred.emplace_back(SelectorStrategy::Text, *metadata.textContent);
    }

    return inferred;
}

}  // namespace RTE
