#pragma once

#include "engine/EngineResult.h"
#include "engine/StepArgument.h"
#include <string>
#include <vector>

namespace TRV {

/**
 * @brief Traversal under construction in the target engine
 */
class ITraversal {
public:
    virtual ~ITraversal() = default;

    /**
     * @brief Append a step
     * @param name Step name, e.g. "out"
     * @param arguments Adapted step arguments
     * @return Error when the engine rejects the step; the traversal is unchanged then
     */
    virtual EngineResult<void> applyStep(const std::string &name, const std::vector<StepArgument> &arguments) = 0;

    /**
     * @brief Steps applied so far, in application order
     */
    virtual std::vector<Step> getSteps() const = 0;

    /**
     * @brief True for child traversals created by createAnonymousTraversal()
     */
    virtual bool isAnonymous() const = 0;
};

}  // namespace TRV
