#include "engine/StepArgument.h"
#include "common/Overloaded.h"
#include "engine/ITraversal.h"
#include <cmath>
#include <spdlog/fmt/fmt.h>

namespace TRV {

namespace {

template <typename T> bool pointeeEquals(const std::shared_ptr<const T> &lhs, const std::shared_ptr<const T> &rhs,
                                         bool (*compare)(const T &, const T &)) {
    if (lhs == rhs) {
        return true;
    }
    if (!lhs || !rhs) {
        return false;
    }
    return compare(*lhs, *rhs);
}

bool argumentsEqual(const std::vector<StepArgument> &lhs, const std::vector<StepArgument> &rhs) {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (size_t i = 0; i < lhs.size(); ++i) {
        if (!StepArguments::equals(lhs[i], rhs[i])) {
            return false;
        }
    }
    return true;
}

bool predicatesEqual(const StepPredicate &lhs, const StepPredicate &rhs) {
    return lhs.type == rhs.type && lhs.operatorName == rhs.operatorName && argumentsEqual(lhs.arguments, rhs.arguments);
}

bool traversalsEqual(const ITraversal &lhs, const ITraversal &rhs) {
    return lhs.isAnonymous() == rhs.isAnonymous() && lhs.getSteps() == rhs.getSteps();
}

bool collectionsEqual(const StepCollection &lhs, const StepCollection &rhs) {
    return lhs.kind == rhs.kind && argumentsEqual(lhs.elements, rhs.elements);
}

bool mapsEqual(const StepMap &lhs, const StepMap &rhs) {
    if (lhs.entries.size() != rhs.entries.size()) {
        return false;
    }
    for (size_t i = 0; i < lhs.entries.size(); ++i) {
        if (!StepArguments::equals(lhs.entries[i].first, rhs.entries[i].first) ||
            !StepArguments::equals(lhs.entries[i].second, rhs.entries[i].second)) {
            return false;
        }
    }
    return true;
}

bool objectsEqual(const OpaqueObject &lhs, const OpaqueObject &rhs) {
    return lhs.getTypeName() == rhs.getTypeName() && lhs.equals(rhs);
}

std::string joinArguments(const std::vector<StepArgument> &arguments) {
    std::string result;
    for (size_t i = 0; i < arguments.size(); ++i) {
        if (i > 0) {
            result += ", ";
        }
        result += StepArguments::toString(arguments[i]);
    }
    return result;
}

}  // namespace

bool Step::operator==(const Step &other) const {
    return name == other.name && argumentsEqual(arguments, other.arguments);
}

std::string Step::toString() const {
    return name + "(" + joinArguments(arguments) + ")";
}

namespace StepArguments {

StepArgument enumSymbol(std::string type, std::string name) {
    return EnumSymbol{std::move(type), std::move(name)};
}

StepArgument predicate(std::string type, std::string operatorName, std::vector<StepArgument> arguments) {
    return std::make_shared<const StepPredicate>(
        StepPredicate{std::move(type), std::move(operatorName), std::move(arguments)});
}

StepArgument p(std::string operatorName, std::vector<StepArgument> arguments) {
    return predicate("P", std::move(operatorName), std::move(arguments));
}

StepArgument textP(std::string operatorName, std::vector<StepArgument> arguments) {
    return predicate("TextP", std::move(operatorName), std::move(arguments));
}

StepArgument list(std::vector<StepArgument> elements) {
    return std::make_shared<const StepCollection>(StepCollection{Collection::Kind::LIST, std::move(elements)});
}

StepArgument set(std::vector<StepArgument> elements) {
    return std::make_shared<const StepCollection>(StepCollection{Collection::Kind::SET, std::move(elements)});
}

StepArgument map(std::vector<std::pair<StepArgument, StepArgument>> entries) {
    return std::make_shared<const StepMap>(StepMap{std::move(entries)});
}

bool equals(const StepArgument &lhs, const StepArgument &rhs) {
    if (lhs.index() != rhs.index()) {
        return false;
    }

    return std::visit(
        Overloaded{[&](std::monostate) { return true; },
                   [&](bool v) { return v == std::get<bool>(rhs); },
                   [&](int32_t v) { return v == std::get<int32_t>(rhs); },
                   [&](int64_t v) { return v == std::get<int64_t>(rhs); },
                   [&](double v) {
                       double other = std::get<double>(rhs);
                       return v == other || (std::isnan(v) && std::isnan(other));
                   },
                   [&](const std::string &v) { return v == std::get<std::string>(rhs); },
                   [&](const EnumSymbol &v) { return v == std::get<EnumSymbol>(rhs); },
                   [&](const std::shared_ptr<const StepPredicate> &v) {
                       return pointeeEquals(v, std::get<std::shared_ptr<const StepPredicate>>(rhs), predicatesEqual);
                   },
                   [&](const std::shared_ptr<const ITraversal> &v) {
                       return pointeeEquals(v, std::get<std::shared_ptr<const ITraversal>>(rhs), traversalsEqual);
                   },
                   [&](const std::shared_ptr<const StepCollection> &v) {
                       return pointeeEquals(v, std::get<std::shared_ptr<const StepCollection>>(rhs),
                                            collectionsEqual);
                   },
                   [&](const std::shared_ptr<const StepMap> &v) {
                       return pointeeEquals(v, std::get<std::shared_ptr<const StepMap>>(rhs), mapsEqual);
                   },
                   [&](const std::shared_ptr<const OpaqueObject> &v) {
                       return pointeeEquals(v, std::get<std::shared_ptr<const OpaqueObject>>(rhs), objectsEqual);
                   }},
        lhs);
}

ArgumentKinds kindOf(const StepArgument &argument) {
    return std::visit(Overloaded{[](std::monostate) { return ArgumentKind::NULL_VALUE; },
                                 [](bool) { return ArgumentKind::BOOLEAN; },
                                 [](int32_t) { return ArgumentKind::NUMBER; },
                                 [](int64_t) { return ArgumentKind::NUMBER; },
                                 [](double) { return ArgumentKind::NUMBER; },
                                 [](const std::string &) { return ArgumentKind::STRING; },
                                 [](const EnumSymbol &) { return ArgumentKind::ENUM; },
                                 [](const std::shared_ptr<const StepPredicate> &) { return ArgumentKind::PREDICATE; },
                                 [](const std::shared_ptr<const ITraversal> &) { return ArgumentKind::TRAVERSAL; },
                                 [](const std::shared_ptr<const StepCollection> &) {
                                     return ArgumentKind::COLLECTION;
                                 },
                                 [](const std::shared_ptr<const StepMap> &) { return ArgumentKind::MAP; },
                                 [](const std::shared_ptr<const OpaqueObject> &) { return ArgumentKind::OBJECT; }},
                      argument);
}

std::string toString(const StepArgument &argument) {
    return std::visit(
        Overloaded{[](std::monostate) -> std::string { return "null"; },
                   [](bool v) -> std::string { return v ? "true" : "false"; },
                   [](int32_t v) { return std::to_string(v); },
                   [](int64_t v) { return std::to_string(v) + "L"; },
                   [](double v) { return fmt::format("{}", v); },
                   [](const std::string &v) { return v; },
                   [](const EnumSymbol &v) { return v.type + "." + v.name; },
                   [](const std::shared_ptr<const StepPredicate> &v) -> std::string {
                       if (!v) {
                           return "<null predicate>";
                       }
                       return v->type + "." + v->operatorName + "(" + joinArguments(v->arguments) + ")";
                   },
                   [](const std::shared_ptr<const ITraversal> &v) -> std::string {
                       if (!v) {
                           return "<null traversal>";
                       }
                       std::string result = v->isAnonymous() ? "__" : "traversal";
                       for (const auto &step : v->getSteps()) {
                           result += "." + step.toString();
                       }
                       return result;
                   },
                   [](const std::shared_ptr<const StepCollection> &v) -> std::string {
                       if (!v) {
                           return "<null collection>";
                       }
                       std::string body = joinArguments(v->elements);
                       return v->kind == Collection::Kind::SET ? "{" + body + "}" : "[" + body + "]";
                   },
                   [](const std::shared_ptr<const StepMap> &v) -> std::string {
                       if (!v) {
                           return "<null map>";
                       }
                       std::string result = "{";
                       for (size_t i = 0; i < v->entries.size(); ++i) {
                           if (i > 0) {
                               result += ", ";
                           }
                           result += toString(v->entries[i].first) + "=" + toString(v->entries[i].second);
                       }
                       return result + "}";
                   },
                   [](const std::shared_ptr<const OpaqueObject> &v) -> std::string {
                       return v ? v->describe() : "<null object>";
                   }},
        argument);
}

}  // namespace StepArguments

}  // namespace TRV
