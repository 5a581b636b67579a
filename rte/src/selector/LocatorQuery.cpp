#include "selector/LocatorQuery.h"

namespace RTE {

namespace {

template <class... Ts> struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

}  // namespace

LocatorQuery toLocatorQuery(const SelectorCandidate &candidate) {
    const std::string &value = candidate.getValue();

    switch (candidate.getStrategy()) {
    case SelectorStrategy::TestId:
        return TestIdQuery{value};
    case SelectorStrategy::Role:
        return RoleQuery{value, candidate.getAccessibleName()};
    case SelectorStrategy::Text:
        return TextQuery{value};
    case SelectorStrategy::Semantic: {
        // "nav[Main Navigation]" -> "nav"
        auto bracket = value.find('[');
        return RawSelectorQuery{bracket == std::string::npos ? value : value.substr(0, bracket)};
    }
    case SelectorStrategy::Structural:
    case SelectorStrategy::Css:
        return RawSelectorQuery{value};
    }
    return RawSelectorQuery{value};
}

size_t countMatches(const LocatorQuery &query, IPageCapability &page) {
    return std::visit(Overloaded{
                          [&page](const TestIdQuery &q) { return page.countByTestId(q.testId); },
                          [&page](const RoleQuery &q) { return page.countByRole(q.role, q.accessibleName); },
                          [&page](const TextQuery &q) { return page.countByText(q.text); },
                          [&page](const RawSelectorQuery &q) { return page.countBySelector(q.selector); },
                      },
                      query);
}

}  // namespace RTE
