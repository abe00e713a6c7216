#include "engine/DefaultTraversal.h"
#include "common/Logger.h"
#include <stdexcept>
#include <utility>

namespace TRV {

DefaultTraversal::DefaultTraversal(std::vector<Step> sourceConfiguration, bool anonymous,
                                   const StepRegistry &registry)
    : sourceConfiguration_(std::move(sourceConfiguration)), anonymous_(anonymous), registry_(registry) {}

std::shared_ptr<DefaultTraversal> DefaultTraversal::anonymous() {
    return std::make_shared<DefaultTraversal>(std::vector<Step>{}, true);
}

EngineResult<void> DefaultTraversal::applyStep(const std::string &name, const std::vector<StepArgument> &arguments) {
    auto result = registry_.validate(OperationPhase::STEP, name, arguments);
    if (!result) {
        LOG_DEBUG("Rejected step {}: {}", name, result.errorMessage);
        return result;
    }
    steps_.push_back(Step{name, arguments});
    return result;
}

bool DefaultTraversal::isEquivalentTo(const ITraversal &other) const {
    if (anonymous_ != other.isAnonymous() || steps_ != other.getSteps()) {
        return false;
    }
    const auto *otherDefault = dynamic_cast<const DefaultTraversal *>(&other);
    return !otherDefault || sourceConfiguration_ == otherDefault->sourceConfiguration_;
}

std::string DefaultTraversal::toString() const {
    std::string result = anonymous_ ? "__" : "g";
    for (const auto &step : sourceConfiguration_) {
        result += "." + step.toString();
    }
    for (const auto &step : steps_) {
        result += "." + step.toString();
    }
    return result;
}

DefaultTraversal &DefaultTraversal::append(const std::string &name, std::vector<StepArgument> arguments) {
    auto result = applyStep(name, arguments);
    if (!result) {
        throw std::invalid_argument(fmt::format("{}: {}", TRV::toString(result.errorKind), result.errorMessage));
    }
    return *this;
}

std::vector<StepArgument> DefaultTraversal::toArguments(const std::vector<std::string> &strings) {
    return std::vector<StepArgument>(strings.begin(), strings.end());
}

DefaultTraversal &DefaultTraversal::V(std::vector<StepArgument> ids) {
    return append("V", std::move(ids));
}

DefaultTraversal &DefaultTraversal::E(std::vector<StepArgument> ids) {
    return append("E", std::move(ids));
}

DefaultTraversal &DefaultTraversal::addV() {
    return append("addV", {});
}

DefaultTraversal &DefaultTraversal::addV(const std::string &label) {
    return append("addV", {label});
}

DefaultTraversal &DefaultTraversal::has(const std::string &key) {
    return append("has", {key});
}

DefaultTraversal &DefaultTraversal::has(const std::string &key, const char *value) {
    return append("has", {key, std::string(value)});
}

DefaultTraversal &DefaultTraversal::has(const std::string &key, StepArgument value) {
    return append("has", {key, std::move(value)});
}

DefaultTraversal &DefaultTraversal::hasLabel(const std::string &label) {
    return append("hasLabel", {label});
}

DefaultTraversal &DefaultTraversal::out(std::vector<std::string> labels) {
    return append("out", toArguments(labels));
}

DefaultTraversal &DefaultTraversal::in(std::vector<std::string> labels) {
    return append("in", toArguments(labels));
}

DefaultTraversal &DefaultTraversal::both(std::vector<std::string> labels) {
    return append("both", toArguments(labels));
}

DefaultTraversal &DefaultTraversal::values(std::vector<std::string> keys) {
    return append("values", toArguments(keys));
}

DefaultTraversal &DefaultTraversal::count() {
    return append("count", {});
}

DefaultTraversal &DefaultTraversal::limit(StepArgument count) {
    return append("limit", {std::move(count)});
}

DefaultTraversal &DefaultTraversal::as(const std::string &label) {
    return append("as", {label});
}

DefaultTraversal &DefaultTraversal::select(std::vector<std::string> labels) {
    return append("select", toArguments(labels));
}

DefaultTraversal &DefaultTraversal::where(StepArgument condition) {
    return append("where", {std::move(condition)});
}

DefaultTraversal &DefaultTraversal::order() {
    return append("order", {});
}

DefaultTraversal &DefaultTraversal::by(std::vector<StepArgument> modulators) {
    return append("by", std::move(modulators));
}

DefaultTraversal &DefaultTraversal::repeat(std::shared_ptr<const ITraversal> body) {
    return append("repeat", {std::move(body)});
}

DefaultTraversal &DefaultTraversal::times(int32_t count) {
    return append("times", {count});
}

DefaultTraversal &DefaultTraversal::union_(std::vector<std::shared_ptr<const ITraversal>> branches) {
    return append("union", std::vector<StepArgument>(branches.begin(), branches.end()));
}

DefaultTraversal &DefaultTraversal::not_(std::shared_ptr<const ITraversal> condition) {
    return append("not", {std::move(condition)});
}

}  // namespace TRV
