#pragma once

#include "catalog/OperationCatalog.h"
#include "engine/EngineResult.h"
#include "engine/StepArgument.h"
#include <optional>
#include <string>
#include <vector>

namespace TRV {

/**
 * @brief Argument validation of the reference engine
 *
 * Checks operation names, arity and argument kinds against the operation
 * catalog. Nested values are checked too: enum types and predicate
 * operators must be known, connectives need two predicate operands and
 * traversal arguments must be anonymous.
 */
class StepRegistry {
public:
    explicit StepRegistry(const OperationCatalog &catalog = OperationCatalog::instance());

    static const StepRegistry &instance();

    EngineResult<void> validate(OperationPhase phase, const std::string &name,
                                const std::vector<StepArgument> &arguments) const;

    bool isRegistered(OperationPhase phase, const std::string &name) const {
        return catalog_.contains(phase, name);
    }

private:
    /**
     * @return Error message for an unacceptable nested value, nullopt if valid
     */
    std::optional<std::string> checkNested(const StepArgument &argument) const;

    const OperationCatalog &catalog_;
};

}  // namespace TRV
