#include "engine/StepRegistry.h"
#include "common/Overloaded.h"
#include "engine/ITraversal.h"
#include <spdlog/fmt/fmt.h>

namespace TRV {

StepRegistry::StepRegistry(const OperationCatalog &catalog) : catalog_(catalog) {}

const StepRegistry &StepRegistry::instance() {
    static const StepRegistry registry;
    return registry;
}

EngineResult<void> StepRegistry::validate(OperationPhase phase, const std::string &name,
                                          const std::vector<StepArgument> &arguments) const {
    const char *phaseName = phase == OperationPhase::SOURCE ? "source operation" : "step";

    const OperationSignature *signature = catalog_.find(phase, name);
    if (!signature) {
        return EngineResult<void>::createError(EngineErrorKind::UNKNOWN_OPERATION,
                                               fmt::format("unknown {} '{}'", phaseName, name));
    }

    if (!signature->acceptsArgumentCount(arguments.size())) {
        return EngineResult<void>::createError(
            EngineErrorKind::ARITY_MISMATCH,
            fmt::format("{} '{}' takes {} argument(s), got {}", phaseName, name, signature->describeArity(),
                        arguments.size()));
    }

    for (size_t i = 0; i < arguments.size(); ++i) {
        ArgumentKinds accepted = signature->acceptedKindsAt(i).value_or(ArgumentKind::NONE);
        ArgumentKinds actual = StepArguments::kindOf(arguments[i]);
        if ((accepted & actual) == 0) {
            return EngineResult<void>::createError(
                EngineErrorKind::INCOMPATIBLE_ARGUMENT,
                fmt::format("argument {} of '{}' is {}, expected {}", i, name, ArgumentKind::describe(actual),
                            ArgumentKind::describe(accepted)));
        }

        if (auto problem = checkNested(arguments[i])) {
            return EngineResult<void>::createError(EngineErrorKind::INCOMPATIBLE_ARGUMENT,
                                                   fmt::format("argument {} of '{}': {}", i, name, *problem));
        }
    }

    return EngineResult<void>::createSuccess();
}

std::optional<std::string> StepRegistry::checkNested(const StepArgument &argument) const {
    using Problem = std::optional<std::string>;

    return std::visit(
        Overloaded{
            [](std::monostate) -> Problem { return std::nullopt; },
            [](bool) -> Problem { return std::nullopt; },
            [](int32_t) -> Problem { return std::nullopt; },
            [](int64_t) -> Problem { return std::nullopt; },
            [](double) -> Problem { return std::nullopt; },
            [](const std::string &) -> Problem { return std::nullopt; },
            [this](const EnumSymbol &symbol) -> Problem {
                if (!catalog_.isKnownEnumType(symbol.type)) {
                    return fmt::format("unknown enum type '{}'", symbol.type);
                }
                return std::nullopt;
            },
            [this](const std::shared_ptr<const StepPredicate> &predicate) -> Problem {
                if (!predicate) {
                    return std::string("null predicate");
                }
                if (!catalog_.isKnownPredicate(predicate->type, predicate->operatorName)) {
                    return fmt::format("unknown predicate {}.{}", predicate->type, predicate->operatorName);
                }
                if (predicate->isConnective()) {
                    if (predicate->arguments.size() != 2 ||
                        StepArguments::kindOf(predicate->arguments[0]) != ArgumentKind::PREDICATE ||
                        StepArguments::kindOf(predicate->arguments[1]) != ArgumentKind::PREDICATE) {
                        return fmt::format("connective '{}' needs two predicate operands", predicate->operatorName);
                    }
                }
                for (const auto &nested : predicate->arguments) {
                    if (auto problem = checkNested(nested)) {
                        return problem;
                    }
                }
                return std::nullopt;
            },
            [](const std::shared_ptr<const ITraversal> &traversal) -> Problem {
                if (!traversal) {
                    return std::string("null traversal");
                }
                if (!traversal->isAnonymous()) {
                    return std::string("child traversal must be anonymous");
                }
                return std::nullopt;
            },
            [this](const std::shared_ptr<const StepCollection> &collection) -> Problem {
                if (!collection) {
                    return std::string("null collection");
                }
                for (const auto &element : collection->elements) {
                    if (auto problem = checkNested(element)) {
                        return problem;
                    }
                }
                return std::nullopt;
            },
            [this](const std::shared_ptr<const StepMap> &map) -> Problem {
                if (!map) {
                    return std::string("null map");
                }
                for (const auto &[key, value] : map->entries) {
                    if (auto problem = checkNested(key)) {
                        return problem;
                    }
                    if (auto problem = checkNested(value)) {
                        return problem;
                    }
                }
                return std::nullopt;
            },
            [](const std::shared_ptr<const OpaqueObject> &object) -> Problem {
                if (!object) {
                    return std::string("null object");
                }
                return std::nullopt;
            }},
        argument);
}

}  // namespace TRV
