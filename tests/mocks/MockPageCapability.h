#pragma once

#include "selector/IPageCapability.h"
#include <gmock/gmock.h>

namespace RTE {
namespace Test {

class MockPageCapability : public IPageCapability {
public:
    MOCK_METHOD(size_t, countByTestId, (const std::string &testId), (override));
    MOCK_METHOD(size_t, countByRole, (const std::string &role, const std::optional<std::string> &accessibleName),
                (override));
    MOCK_METHOD(size_t, countByText, (const std::string &text), (override));
    MOCK_METHOD(size_t, countBySelector, (const std::string &selector), (override));
};

}  // namespace Test
}  // namespace RTE
