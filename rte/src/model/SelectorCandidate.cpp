#include "model/SelectorCandidate.h"

namespace RTE {

std::string SelectorCandidate::describe() const {
    return std::string(toString(strategy_)) + "(" + value_ + ")";
}

std::string describeChain(const SelectorChain &chain) {
    if (chain.empty()) {
        return "<empty chain>";
    }

    std::string result;
    for (size_t i = 0; i < chain.size(); ++i) {
        if (i > 0) {
            result += " -> ";
        }
        result += chain[i].describe();
    }
    return result;
}

}  // namespace RTE
