#pragma once

#include "engine/ITraversalSource.h"
#include <gmock/gmock.h>
#include <memory>
#include <string>
#include <vector>

namespace TRV {
namespace Test {

class MockTraversalSource : public ITraversalSource {
public:
    MOCK_CONST_METHOD2(configure, EngineResult<std::shared_ptr<ITraversalSource>>(const std::string &,
                                                                                  const std::vector<StepArgument> &));
    MOCK_CONST_METHOD2(spawn,
                       EngineResult<std::shared_ptr<ITraversal>>(const std::string &, const std::vector<StepArgument> &));
    MOCK_CONST_METHOD0(start, std::shared_ptr<ITraversal>());
    MOCK_CONST_METHOD0(createAnonymousTraversal, std::shared_ptr<ITraversal>());
};

/**
 * @brief Matches a StepArgument vector deeply equal to the expected one
 */
MATCHER_P(StepArgumentsEq, expected, "") {
    if (arg.size() != expected.size()) {
        return false;
    }
    for (size_t i = 0; i < arg.size(); ++i) {
        if (!StepArguments::equals(arg[i], expected[i])) {
            return false;
        }
    }
    return true;
}

}  // namespace Test
}  // namespace TRV
