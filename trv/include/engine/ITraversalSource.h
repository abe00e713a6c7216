#pragma once

#include "engine/EngineResult.h"
#include "engine/ITraversal.h"
#include "engine/StepArgument.h"
#include <memory>
#include <string>
#include <vector>

namespace TRV {

/**
 * @brief Entry point of the target engine that traversals are spawned from
 *
 * Sources are immutable: configuration returns a new source and leaves
 * this one untouched.
 */
class ITraversalSource {
public:
    virtual ~ITraversalSource() = default;

    /**
     * @brief Apply a source operation such as withSack
     * @return Reconfigured source or error
     */
    virtual EngineResult<std::shared_ptr<ITraversalSource>>
    configure(const std::string &name, const std::vector<StepArgument> &arguments) const = 0;

    /**
     * @brief Spawn a traversal whose first step is the given start step
     * @return New traversal or error
     */
    virtual EngineResult<std::shared_ptr<ITraversal>> spawn(const std::string &name,
                                                            const std::vector<StepArgument> &arguments) const = 0;

    /**
     * @brief Empty traversal carrying this source's configuration
     */
    virtual std::shared_ptr<ITraversal> start() const = 0;

    /**
     * @brief Empty child traversal used as a step argument
     */
    virtual std::shared_ptr<ITraversal> createAnonymousTraversal() const = 0;
};

}  // namespace TRV
