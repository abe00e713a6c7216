#pragma once

#include "engine/ITraversal.h"
#include "engine/StepRegistry.h"
#include <memory>
#include <string>
#include <vector>

namespace TRV {

/**
 * @brief Reference traversal: an ordered, validated list of steps
 *
 * Fluent helpers build traversals by hand, mainly to compare against
 * translated ones with isEquivalentTo(). The helpers throw
 * std::invalid_argument when the registry rejects a step; applyStep()
 * reports the same rejection through EngineResult instead.
 */
class DefaultTraversal : public ITraversal {
public:
    explicit DefaultTraversal(std::vector<Step> sourceConfiguration = {}, bool anonymous = false,
                              const StepRegistry &registry = StepRegistry::instance());

    /**
     * @brief Empty anonymous traversal for use as a step argument
     */
    static std::shared_ptr<DefaultTraversal> anonymous();

    EngineResult<void> applyStep(const std::string &name, const std::vector<StepArgument> &arguments) override;

    std::vector<Step> getSteps() const override {
        return steps_;
    }

    bool isAnonymous() const override {
        return anonymous_;
    }

    /**
     * @brief Source operations applied to the source this traversal was spawned from
     */
    const std::vector<Step> &getSourceConfiguration() const {
        return sourceConfiguration_;
    }

    /**
     * @brief Same steps, same anonymity and, for DefaultTraversals, same source configuration
     */
    bool isEquivalentTo(const ITraversal &other) const;

    std::string toString() const;

    DefaultTraversal &V(std::vector<StepArgument> ids = {});
    DefaultTraversal &E(std::vector<StepArgument> ids = {});
    DefaultTraversal &addV();
    DefaultTraversal &addV(const std::string &label);
    DefaultTraversal &has(const std::string &key);
    DefaultTraversal &has(const std::string &key, const char *value);
    DefaultTraversal &has(const std::string &key, StepArgument value);
    DefaultTraversal &hasLabel(const std::string &label);
    DefaultTraversal &out(std::vector<std::string> labels = {});
    DefaultTraversal &in(std::vector<std::string> labels = {});
    DefaultTraversal &both(std::vector<std::string> labels = {});
    DefaultTraversal &values(std::vector<std::string> keys = {});
    DefaultTraversal &count();
    DefaultTraversal &limit(StepArgument count);
    DefaultTraversal &as(const std::string &label);
    DefaultTraversal &select(std::vector<std::string> labels);
    DefaultTraversal &where(StepArgument condition);
    DefaultTraversal &order();
    DefaultTraversal &by(std::vector<StepArgument> modulators = {});
    DefaultTraversal &repeat(std::shared_ptr<const ITraversal> body);
    DefaultTraversal &times(int32_t count);
    // union and not are reserved in C++
    DefaultTraversal &union_(std::vector<std::shared_ptr<const ITraversal>> branches);
    DefaultTraversal &not_(std::shared_ptr<const ITraversal> condition);

private:
    DefaultTraversal &append(const std::string &name, std::vector<StepArgument> arguments);

    static std::vector<StepArgument> toArguments(const std::vector<std::string> &strings);

    std::vector<Step> sourceConfiguration_;
    std::vector<Step> steps_;
    bool anonymous_;
    const StepRegistry &registry_;
};

}  // namespace TRV
