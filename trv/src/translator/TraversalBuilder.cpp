#include "translator/TraversalBuilder.h"
#include "common/Overloaded.h"
#include <utility>
#include <vector>

namespace TRV {

namespace {

const char *phaseName(OperationPhase phase) {
    return phase == OperationPhase::SOURCE ? "source" : "step";
}

// Per-call state; tracks the current instruction for error locations
class BuildContext {
public:
    BuildContext(const ITraversalSource &root, const std::string &targetLanguage)
        : root_(root), targetLanguage_(targetLanguage) {}

    std::shared_ptr<ITraversal> buildRoot(const Bytecode &bytecode) {
        std::shared_ptr<ITraversalSource> configured;
        const auto &sources = bytecode.getSourceInstructions();
        for (size_t i = 0; i < sources.size(); ++i) {
            const ITraversalSource &current = configured ? *configured : root_;
            enter(OperationPhase::SOURCE, i, sources[i], 0);
            auto result = current.configure(sources[i].getOperator(), adaptArguments(sources[i], 0));
            if (!result) {
                failEngine(result.errorKind, result.errorMessage);
            }
            if (!result.value) {
                fail(TranslationErrorKind::UNSUPPORTED_OPERATION, "engine returned no traversal source");
            }
            configured = std::move(result.value);
        }

        const ITraversalSource &source = configured ? *configured : root_;
        const auto &steps = bytecode.getStepInstructions();
        if (steps.empty()) {
            auto started = source.start();
            if (!started) {
                fail(TranslationErrorKind::UNSUPPORTED_OPERATION, "engine started no traversal");
            }
            return started;
        }

        std::shared_ptr<ITraversal> traversal;
        for (size_t i = 0; i < steps.size(); ++i) {
            enter(OperationPhase::STEP, i, steps[i], 0);
            auto arguments = adaptArguments(steps[i], 0);
            if (i == 0) {
                auto spawned = source.spawn(steps[i].getOperator(), arguments);
                if (!spawned) {
                    failEngine(spawned.errorKind, spawned.errorMessage);
                }
                traversal = std::move(spawned.value);
                if (!traversal) {
                    fail(TranslationErrorKind::UNSUPPORTED_OPERATION, "engine spawned no traversal");
                }
            } else {
                apply(*traversal, steps[i], arguments);
            }
        }
        return traversal;
    }

private:
    std::shared_ptr<ITraversal> buildAnonymous(const Bytecode &bytecode, size_t depth) {
        if (!bytecode.getSourceInstructions().empty()) {
            fail(TranslationErrorKind::MALFORMED_BYTECODE, "nested traversal carries source instructions");
        }
        auto traversal = root_.createAnonymousTraversal();
        if (!traversal) {
            fail(TranslationErrorKind::UNSUPPORTED_OPERATION, "engine created no anonymous traversal");
        }
        const auto &steps = bytecode.getStepInstructions();
        for (size_t i = 0; i < steps.size(); ++i) {
            enter(OperationPhase::STEP, i, steps[i], depth);
            auto arguments = adaptArguments(steps[i], depth);
            apply(*traversal, steps[i], arguments);
        }
        return traversal;
    }

    void apply(ITraversal &traversal, const Instruction &instruction, const std::vector<StepArgument> &arguments) {
        auto result = traversal.applyStep(instruction.getOperator(), arguments);
        if (!result) {
            failEngine(result.errorKind, result.errorMessage);
        }
    }

    void enter(OperationPhase phase, size_t index, const Instruction &instruction, size_t depth) {
        location_ = TranslationLocation{phaseName(phase), index, instruction.getOperator(), std::nullopt, depth};
        if (instruction.getOperator().empty()) {
            fail(TranslationErrorKind::MALFORMED_BYTECODE, "instruction without operator name");
        }
    }

    std::vector<StepArgument> adaptArguments(const Instruction &instruction, size_t depth) {
        const auto &arguments = instruction.getArguments();
        std::vector<StepArgument> adapted;
        adapted.reserve(arguments.size());
        for (size_t a = 0; a < arguments.size(); ++a) {
            location_.argumentIndex = a;
            adapted.push_back(adapt(arguments[a], depth));
        }
        location_.argumentIndex.reset();
        return adapted;
    }

    std::vector<StepArgument> adaptAll(const std::vector<Value> &values, size_t depth) {
        std::vector<StepArgument> adapted;
        adapted.reserve(values.size());
        for (const auto &value : values) {
            adapted.push_back(adapt(value, depth));
        }
        return adapted;
    }

    StepArgument adapt(const Value &value, size_t depth) {
        return std::visit(
            Overloaded{[](std::monostate) -> StepArgument { return std::monostate{}; },
                       [](bool v) -> StepArgument { return v; },
                       [](int32_t v) -> StepArgument { return v; },
                       [](int64_t v) -> StepArgument { return v; },
                       [](double v) -> StepArgument { return v; },
                       [](const std::string &v) -> StepArgument { return v; },
                       [](const EnumSymbol &v) -> StepArgument { return v; },
                       [&](const std::shared_ptr<const Binding> &v) -> StepArgument {
                           if (!v) {
                               fail(TranslationErrorKind::MALFORMED_BYTECODE, "null binding");
                           }
                           return adapt(v->value, depth);
                       },
                       [&](const std::shared_ptr<const Predicate> &v) -> StepArgument {
                           if (!v) {
                               fail(TranslationErrorKind::MALFORMED_BYTECODE, "null predicate");
                           }
                           if (v->operatorName.empty()) {
                               fail(TranslationErrorKind::MALFORMED_BYTECODE, "predicate without operator name");
                           }
                           return StepArguments::predicate(v->type, v->operatorName, adaptAll(v->arguments, depth));
                       },
                       [&](const std::shared_ptr<const Bytecode> &v) -> StepArgument {
                           if (!v) {
                               fail(TranslationErrorKind::MALFORMED_BYTECODE, "null nested traversal");
                           }
                           TranslationLocation enclosing = location_;
                           std::shared_ptr<const ITraversal> child = buildAnonymous(*v, depth + 1);
                           location_ = std::move(enclosing);
                           return child;
                       },
                       [&](const std::shared_ptr<const Collection> &v) -> StepArgument {
                           if (!v) {
                               fail(TranslationErrorKind::MALFORMED_BYTECODE, "null collection");
                           }
                           auto elements = adaptAll(v->elements, depth);
                           return v->kind == Collection::Kind::SET ? StepArguments::set(std::move(elements))
                                                                   : StepArguments::list(std::move(elements));
                       },
                       [&](const std::shared_ptr<const MapValue> &v) -> StepArgument {
                           if (!v) {
                               fail(TranslationErrorKind::MALFORMED_BYTECODE, "null map");
                           }
                           std::vector<std::pair<StepArgument, StepArgument>> entries;
                           entries.reserve(v->entries.size());
                           for (const auto &[key, entryValue] : v->entries) {
                               entries.emplace_back(adapt(key, depth), adapt(entryValue, depth));
                           }
                           return StepArguments::map(std::move(entries));
                       },
                       [&](const std::shared_ptr<const OpaqueObject> &v) -> StepArgument {
                           if (!v) {
                               fail(TranslationErrorKind::MALFORMED_BYTECODE, "null object");
                           }
                           return v;
                       }},
            value);
    }

    [[noreturn]] void failEngine(EngineErrorKind kind, const std::string &message) const {
        fail(TraversalBuilder::toTranslationErrorKind(kind), message);
    }

    [[noreturn]] void fail(TranslationErrorKind kind, const std::string &detail) const {
        throw TranslationException(kind, detail, targetLanguage_, location_);
    }

    const ITraversalSource &root_;
    const std::string &targetLanguage_;
    TranslationLocation location_;
};

}  // namespace

TraversalBuilder::TraversalBuilder(const ITraversalSource &source, std::string targetLanguage)
    : source_(source), targetLanguage_(std::move(targetLanguage)) {}

std::shared_ptr<ITraversal> TraversalBuilder::build(const Bytecode &bytecode) const {
    BuildContext context(source_, targetLanguage_);
    return context.buildRoot(bytecode);
}

TranslationErrorKind TraversalBuilder::toTranslationErrorKind(EngineErrorKind kind) {
    switch (kind) {
    case EngineErrorKind::UNKNOWN_OPERATION:
        return TranslationErrorKind::UNSUPPORTED_OPERATION;
    case EngineErrorKind::INCOMPATIBLE_ARGUMENT:
        return TranslationErrorKind::UNSUPPORTED_ARGUMENT_TYPE;
    case EngineErrorKind::ARITY_MISMATCH:
        return TranslationErrorKind::MALFORMED_BYTECODE;
    }
    return TranslationErrorKind::MALFORMED_BYTECODE;
}

}  // namespace TRV
