#pragma once

#include "bytecode/Value.h"
#include "catalog/OperationCatalog.h"
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace TRV {

class ITraversal;
struct StepPredicate;
struct StepCollection;
struct StepMap;

/**
 * @brief Engine-native step argument
 *
 * Mirrors Value without bindings (resolved to their value) and with nested
 * bytecode replaced by anonymous traversals.
 */
using StepArgument = std::variant<std::monostate, bool, int32_t, int64_t, double, std::string, EnumSymbol,
                                  std::shared_ptr<const StepPredicate>, std::shared_ptr<const ITraversal>,
                                  std::shared_ptr<const StepCollection>, std::shared_ptr<const StepMap>,
                                  std::shared_ptr<const OpaqueObject>>;

struct StepPredicate {
    std::string type;
    std::string operatorName;
    std::vector<StepArgument> arguments;

    bool isConnective() const {
        return operatorName == "and" || operatorName == "or";
    }
};

struct StepCollection {
    Collection::Kind kind = Collection::Kind::LIST;
    std::vector<StepArgument> elements;
};

struct StepMap {
    std::vector<std::pair<StepArgument, StepArgument>> entries;
};

/**
 * @brief One applied step or source operation
 */
struct Step {
    std::string name;
    std::vector<StepArgument> arguments;

    bool operator==(const Step &other) const;

    std::string toString() const;
};

namespace StepArguments {

StepArgument enumSymbol(std::string type, std::string name);
StepArgument p(std::string operatorName, std::vector<StepArgument> arguments);
StepArgument textP(std::string operatorName, std::vector<StepArgument> arguments);
StepArgument predicate(std::string type, std::string operatorName, std::vector<StepArgument> arguments);
StepArgument list(std::vector<StepArgument> elements);
StepArgument set(std::vector<StepArgument> elements);
StepArgument map(std::vector<std::pair<StepArgument, StepArgument>> entries);

/**
 * @brief Deep equality; traversals compare by steps and anonymity
 */
bool equals(const StepArgument &lhs, const StepArgument &rhs);

/**
 * @brief Catalog argument kind of the held alternative
 */
ArgumentKinds kindOf(const StepArgument &argument);

std::string toString(const StepArgument &argument);

}  // namespace StepArguments

}  // namespace TRV
