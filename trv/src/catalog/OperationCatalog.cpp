#include "catalog/OperationCatalog.h"
#include <algorithm>
#include <utility>

namespace TRV {

namespace ArgumentKind {

std::string describe(ArgumentKinds kinds) {
    static const std::vector<std::pair<ArgumentKinds, const char *>> names = {
        {NULL_VALUE, "null"},
        {BOOLEAN, "boolean"},
        {NUMBER, "number"},
        {STRING, "string"},
        {ENUM, "enum"},
        {PREDICATE, "predicate"},
        {TRAVERSAL, "traversal"},
        {COLLECTION, "collection"},
        {MAP, "map"},
        {OBJECT, "object"},
    };

    if (kinds == NONE) {
        return "nothing";
    }
    if (kinds == ANY) {
        return "any";
    }

    std::string result;
    for (const auto &[flag, name] : names) {
        if (kinds & flag) {
            if (!result.empty()) {
                result += "|";
            }
            result += name;
        }
    }
    return result;
}

}  // namespace ArgumentKind

bool OperationSignature::acceptsArgumentCount(size_t count) const {
    if (count < minArgs) {
        return false;
    }
    return variadic != ArgumentKind::NONE || count <= positional.size();
}

std::optional<ArgumentKinds> OperationSignature::acceptedKindsAt(size_t index) const {
    if (index < positional.size()) {
        return positional[index];
    }
    if (variadic != ArgumentKind::NONE) {
        return variadic;
    }
    return std::nullopt;
}

std::string OperationSignature::describeArity() const {
    if (variadic != ArgumentKind::NONE) {
        return "at least " + std::to_string(minArgs);
    }
    if (minArgs == positional.size()) {
        return "exactly " + std::to_string(minArgs);
    }
    return "between " + std::to_string(minArgs) + " and " + std::to_string(positional.size());
}

const OperationCatalog &OperationCatalog::instance() {
    static const OperationCatalog catalog;
    return catalog;
}

const OperationSignature *OperationCatalog::find(OperationPhase phase, const std::string &name) const {
    const auto &table = phase == OperationPhase::SOURCE ? sourceOperations_ : steps_;
    auto it = table.find(name);
    return it != table.end() ? &it->second : nullptr;
}

std::vector<std::string> OperationCatalog::getOperationNames(OperationPhase phase) const {
    const auto &table = phase == OperationPhase::SOURCE ? sourceOperations_ : steps_;
    std::vector<std::string> names;
    names.reserve(table.size());
    for (const auto &[name, signature] : table) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

bool OperationCatalog::isKnownPredicate(const std::string &type, const std::string &operatorName) const {
    if (operatorName == "and" || operatorName == "or") {
        return type == "P" || type == "TextP";
    }
    if (type == "P") {
        return predicates_.count(operatorName) > 0;
    }
    if (type == "TextP") {
        return textPredicates_.count(operatorName) > 0;
    }
    return false;
}

void OperationCatalog::add(OperationPhase phase, const std::string &name, size_t minArgs,
                           std::vector<ArgumentKinds> positional, ArgumentKinds variadic) {
    auto &table = phase == OperationPhase::SOURCE ? sourceOperations_ : steps_;
    table[name] = OperationSignature{name, phase, minArgs, std::move(positional), variadic};
}

OperationCatalog::OperationCatalog() {
    using namespace ArgumentKind;
    constexpr auto SRC = OperationPhase::SOURCE;
    constexpr auto STP = OperationPhase::STEP;

    enumTypes_ = {"T",           "Order",    "Scope", "Column",  "Direction", "Pop",
                  "Cardinality", "Operator", "Pick",  "Barrier", "Merge"};
    predicates_ = {"eq",     "neq",     "lt",     "lte",    "gt",      "gte", "inside",
                   "outside", "between", "within", "without", "not"};
    textPredicates_ = {"containing",  "notContaining", "startingWith", "notStartingWith",
                       "endingWith",  "notEndingWith", "regex",        "notRegex"};

    // Source configuration
    add(SRC, "withBulk", 1, {BOOLEAN});
    add(SRC, "withPath", 0, {});
    add(SRC, "withSack", 1, {ANY, OBJECT | ENUM, OBJECT | ENUM});
    add(SRC, "withSideEffect", 2, {STRING, ANY, OBJECT | ENUM});
    add(SRC, "withStrategies", 1, {}, OBJECT);
    add(SRC, "withoutStrategies", 1, {}, STRING | OBJECT);
    add(SRC, "withComputer", 0, {STRING | OBJECT});
    add(SRC, "with", 1, {STRING, ANY});

    // Start steps
    add(STP, "V", 0, {}, ANY);
    add(STP, "E", 0, {}, ANY);
    add(STP, "addV", 0, {STRING | TRAVERSAL});
    add(STP, "addE", 1, {STRING | TRAVERSAL});
    add(STP, "inject", 0, {}, ANY);
    add(STP, "mergeV", 0, {MAP | TRAVERSAL | NULL_VALUE});
    add(STP, "mergeE", 0, {MAP | TRAVERSAL | NULL_VALUE});

    // Navigation
    for (const char *name : {"out", "in", "both", "outE", "inE", "bothE"}) {
        add(STP, name, 0, {}, STRING);
    }
    for (const char *name : {"outV", "inV", "bothV", "otherV"}) {
        add(STP, name, 0, {});
    }

    // Filters
    add(STP, "has", 1, {STRING | ENUM, ANY, LITERAL | PREDICATE | TRAVERSAL | OBJECT});
    add(STP, "hasLabel", 1, {STRING | PREDICATE}, STRING);
    add(STP, "hasId", 1, {ANY}, ANY);
    add(STP, "hasKey", 1, {STRING | PREDICATE}, STRING);
    add(STP, "hasValue", 1, {LITERAL | PREDICATE | OBJECT}, LITERAL | OBJECT);
    add(STP, "hasNot", 1, {STRING});
    add(STP, "is", 1, {LITERAL | PREDICATE | OBJECT});
    add(STP, "where", 1, {STRING | PREDICATE | TRAVERSAL, PREDICATE});
    add(STP, "not", 1, {TRAVERSAL});
    add(STP, "and", 0, {}, TRAVERSAL);
    add(STP, "or", 0, {}, TRAVERSAL);
    add(STP, "filter", 1, {TRAVERSAL | OBJECT});
    add(STP, "dedup", 0, {STRING | ENUM}, STRING);
    add(STP, "limit", 1, {ENUM | NUMBER, NUMBER});
    add(STP, "range", 2, {ENUM | NUMBER, NUMBER, NUMBER});
    add(STP, "skip", 1, {ENUM | NUMBER, NUMBER});
    add(STP, "tail", 0, {ENUM | NUMBER, NUMBER});
    add(STP, "coin", 1, {NUMBER});
    add(STP, "sample", 1, {ENUM | NUMBER, NUMBER});
    add(STP, "timeLimit", 1, {NUMBER});
    add(STP, "simplePath", 0, {});
    add(STP, "cyclicPath", 0, {});
    add(STP, "all", 1, {PREDICATE});

    // Maps
    add(STP, "values", 0, {}, STRING);
    add(STP, "valueMap", 0, {BOOLEAN | STRING}, STRING);
    add(STP, "elementMap", 0, {}, STRING);
    add(STP, "properties", 0, {}, STRING);
    add(STP, "propertyMap", 0, {}, STRING);
    for (const char *name : {"id", "label", "key", "value", "path", "identity", "unfold"}) {
        add(STP, name, 0, {});
    }
    add(STP, "loops", 0, {STRING});
    for (const char *name : {"count", "sum", "max", "min", "mean"}) {
        add(STP, name, 0, {ENUM});
    }
    add(STP, "fold", 0, {ANY, OBJECT | ENUM});
    add(STP, "order", 0, {ENUM});
    add(STP, "select", 1, {ENUM | STRING | TRAVERSAL, STRING}, STRING);
    add(STP, "project", 1, {STRING}, STRING);
    add(STP, "constant", 1, {ANY});
    add(STP, "math", 1, {STRING});
    add(STP, "map", 1, {TRAVERSAL | OBJECT});
    add(STP, "flatMap", 1, {TRAVERSAL | OBJECT});
    add(STP, "group", 0, {STRING});
    add(STP, "groupCount", 0, {STRING});
    add(STP, "tree", 0, {STRING});
    add(STP, "index", 0, {});

    // Branching
    add(STP, "repeat", 1, {STRING | TRAVERSAL, TRAVERSAL});
    add(STP, "times", 1, {NUMBER});
    add(STP, "until", 1, {TRAVERSAL | PREDICATE});
    add(STP, "emit", 0, {TRAVERSAL | PREDICATE});
    add(STP, "union", 0, {}, TRAVERSAL);
    add(STP, "coalesce", 0, {}, TRAVERSAL);
    add(STP, "choose", 1, {TRAVERSAL | PREDICATE | OBJECT, TRAVERSAL, TRAVERSAL});
    add(STP, "option", 1, {ANY, TRAVERSAL});
    add(STP, "optional", 1, {TRAVERSAL});
    add(STP, "local", 1, {TRAVERSAL});
    add(STP, "match", 0, {}, TRAVERSAL);

    // Side effects
    add(STP, "sideEffect", 1, {TRAVERSAL | OBJECT});
    add(STP, "aggregate", 1, {ENUM | STRING, STRING});
    add(STP, "store", 1, {STRING});
    add(STP, "cap", 1, {STRING}, STRING);
    add(STP, "subgraph", 1, {STRING});
    add(STP, "sack", 0, {OBJECT | ENUM});
    add(STP, "barrier", 0, {NUMBER | OBJECT | ENUM});
    add(STP, "drop", 0, {});
    add(STP, "none", 0, {});
    add(STP, "profile", 0, {STRING});

    // Mutations and modulators
    add(STP, "property", 1, {STRING | ENUM | MAP | OBJECT | TRAVERSAL, ANY, ANY}, ANY);
    add(STP, "from", 1, {STRING | TRAVERSAL | OBJECT});
    add(STP, "to", 1, {STRING | TRAVERSAL | OBJECT | ENUM}, STRING);
    add(STP, "by", 0, {STRING | ENUM | TRAVERSAL | OBJECT, ENUM | OBJECT});
    add(STP, "as", 1, {STRING}, STRING);
    add(STP, "with", 1, {STRING, ANY});
}

}  // namespace TRV
