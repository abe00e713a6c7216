#include "engine/DefaultTraversalSource.h"
#include "common/Logger.h"
#include <stdexcept>
#include <utility>

namespace TRV {

DefaultTraversalSource::DefaultTraversalSource(std::vector<Step> configuration, const StepRegistry &registry)
    : configuration_(std::move(configuration)), registry_(registry) {}

EngineResult<std::shared_ptr<ITraversalSource>>
DefaultTraversalSource::configure(const std::string &name, const std::vector<StepArgument> &arguments) const {
    using Result = EngineResult<std::shared_ptr<ITraversalSource>>;

    auto validation = registry_.validate(OperationPhase::SOURCE, name, arguments);
    if (!validation) {
        LOG_DEBUG("Rejected source operation {}: {}", name, validation.errorMessage);
        return Result::propagateError(validation);
    }

    std::vector<Step> configuration = configuration_;
    configuration.push_back(Step{name, arguments});
    return Result::createSuccess(std::make_shared<DefaultTraversalSource>(std::move(configuration), registry_));
}

EngineResult<std::shared_ptr<ITraversal>> DefaultTraversalSource::spawn(const std::string &name,
                                                                         const std::vector<StepArgument> &arguments) const {
    using Result = EngineResult<std::shared_ptr<ITraversal>>;

    auto traversal = std::make_shared<DefaultTraversal>(configuration_, false, registry_);
    auto applied = traversal->applyStep(name, arguments);
    if (!applied) {
        return Result::propagateError(applied);
    }
    return Result::createSuccess(std::move(traversal));
}

std::shared_ptr<ITraversal> DefaultTraversalSource::start() const {
    return traversal();
}

std::shared_ptr<ITraversal> DefaultTraversalSource::createAnonymousTraversal() const {
    return std::make_shared<DefaultTraversal>(std::vector<Step>{}, true, registry_);
}

std::shared_ptr<DefaultTraversalSource> DefaultTraversalSource::with(const std::string &name,
                                                                     std::vector<StepArgument> arguments) const {
    auto validation = registry_.validate(OperationPhase::SOURCE, name, arguments);
    if (!validation) {
        throw std::invalid_argument(fmt::format("{}: {}", toString(validation.errorKind), validation.errorMessage));
    }
    std::vector<Step> configuration = configuration_;
    configuration.push_back(Step{name, std::move(arguments)});
    return std::make_shared<DefaultTraversalSource>(std::move(configuration), registry_);
}

std::shared_ptr<DefaultTraversal> DefaultTraversalSource::traversal() const {
    return std::make_shared<DefaultTraversal>(configuration_, false, registry_);
}

std::shared_ptr<DefaultTraversal> DefaultTraversalSource::V(std::vector<StepArgument> ids) const {
    auto result = traversal();
    result->V(std::move(ids));
    return result;
}

std::shared_ptr<DefaultTraversal> DefaultTraversalSource::E(std::vector<StepArgument> ids) const {
    auto result = traversal();
    result->E(std::move(ids));
    return result;
}

std::shared_ptr<DefaultTraversal> DefaultTraversalSource::addV(const std::string &label) const {
    auto result = traversal();
    result->addV(label);
    return result;
}

}  // namespace TRV
