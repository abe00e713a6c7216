#pragma once

#include "engine/DefaultTraversal.h"
#include "engine/ITraversalSource.h"
#include "engine/StepRegistry.h"
#include <memory>
#include <string>
#include <vector>

namespace TRV {

/**
 * @brief Reference traversal source
 *
 * Immutable; configure() returns a new source carrying the applied source
 * operation. Spawned traversals remember the configuration they were
 * spawned with.
 */
class DefaultTraversalSource : public ITraversalSource {
public:
    explicit DefaultTraversalSource(std::vector<Step> configuration = {},
                                    const StepRegistry &registry = StepRegistry::instance());

    static std::shared_ptr<DefaultTraversalSource> create() {
        return std::make_shared<DefaultTraversalSource>();
    }

    EngineResult<std::shared_ptr<ITraversalSource>>
    configure(const std::string &name, const std::vector<StepArgument> &arguments) const override;

    EngineResult<std::shared_ptr<ITraversal>> spawn(const std::string &name,
                                                    const std::vector<StepArgument> &arguments) const override;

    std::shared_ptr<ITraversal> start() const override;

    std::shared_ptr<ITraversal> createAnonymousTraversal() const override;

    const std::vector<Step> &getConfiguration() const {
        return configuration_;
    }

    /**
     * @brief Configure by hand
     * @throws std::invalid_argument if the source operation is rejected
     */
    std::shared_ptr<DefaultTraversalSource> with(const std::string &name, std::vector<StepArgument> arguments) const;

    /**
     * @brief Empty traversal with this configuration, as a DefaultTraversal for fluent use
     */
    std::shared_ptr<DefaultTraversal> traversal() const;

    std::shared_ptr<DefaultTraversal> V(std::vector<StepArgument> ids = {}) const;
    std::shared_ptr<DefaultTraversal> E(std::vector<StepArgument> ids = {}) const;
    std::shared_ptr<DefaultTraversal> addV(const std::string &label) const;

private:
    std::vector<Step> configuration_;
    const StepRegistry &registry_;
};

}  // namespace TRV
