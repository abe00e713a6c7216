#include "bytecode/Value.h"
#include "bytecode/Bytecode.h"
#include "common/Overloaded.h"
#include <cmath>
#include <spdlog/fmt/fmt.h>

namespace TRV {

namespace Values {

Value null() {
    return std::monostate{};
}

Value boolean(bool value) {
    return value;
}

Value integer(int32_t value) {
    return value;
}

Value longValue(int64_t value) {
    return value;
}

Value real(double value) {
    return value;
}

Value string(std::string value) {
    return Value(std::in_place_type<std::string>, std::move(value));
}

Value enumSymbol(std::string type, std::string name) {
    return EnumSymbol{std::move(type), std::move(name)};
}

Value binding(std::string variable, Value value) {
    return std::make_shared<const Binding>(Binding{std::move(variable), std::move(value)});
}

Value predicate(std::string type, std::string operatorName, std::vector<Value> arguments) {
    return std::make_shared<const Predicate>(Predicate{std::move(type), std::move(operatorName), std::move(arguments)});
}

Value p(std::string operatorName, std::vector<Value> arguments) {
    return predicate("P", std::move(operatorName), std::move(arguments));
}

Value textP(std::string operatorName, std::vector<Value> arguments) {
    return predicate("TextP", std::move(operatorName), std::move(arguments));
}

Value connective(std::string operatorName, Value left, Value right) {
    // The connective takes the type of its left operand
    std::string type = "P";
    if (auto leftPredicate = std::get_if<std::shared_ptr<const Predicate>>(&left); leftPredicate && *leftPredicate) {
        type = (*leftPredicate)->type;
    }
    return predicate(std::move(type), std::move(operatorName), {std::move(left), std::move(right)});
}

Value bytecode(Bytecode traversal) {
    return std::make_shared<const Bytecode>(std::move(traversal));
}

Value bytecode(std::shared_ptr<const Bytecode> traversal) {
    return traversal;
}

Value list(std::vector<Value> elements) {
    return std::make_shared<const Collection>(Collection{Collection::Kind::LIST, std::move(elements)});
}

Value set(std::vector<Value> elements) {
    return std::make_shared<const Collection>(Collection{Collection::Kind::SET, std::move(elements)});
}

Value map(std::vector<std::pair<Value, Value>> entries) {
    return std::make_shared<const MapValue>(MapValue{std::move(entries)});
}

Value object(std::shared_ptr<const OpaqueObject> object) {
    return object;
}

namespace {

bool sequenceEquals(const std::vector<Value> &lhs, const std::vector<Value> &rhs) {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (size_t i = 0; i < lhs.size(); ++i) {
        if (!equals(lhs[i], rhs[i])) {
            return false;
        }
    }
    return true;
}

// Both null, or both set and pointing to equal values
template <typename T, typename Compare>
bool pointeeEquals(const std::shared_ptr<const T> &lhs, const std::shared_ptr<const T> &rhs, Compare compare) {
    if (!lhs || !rhs) {
        return !lhs && !rhs;
    }
    return lhs == rhs || compare(*lhs, *rhs);
}

std::string joinValues(const std::vector<Value> &values) {
    std::string result;
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            result += ", ";
        }
        result += toString(values[i]);
    }
    return result;
}

}  // namespace

bool equals(const Value &lhs, const Value &rhs) {
    if (lhs.index() != rhs.index()) {
        return false;
    }

    return std::visit(
        Overloaded{
            [](std::monostate) { return true; },
            [&rhs](bool value) { return value == std::get<bool>(rhs); },
            [&rhs](int32_t value) { return value == std::get<int32_t>(rhs); },
            [&rhs](int64_t value) { return value == std::get<int64_t>(rhs); },
            [&rhs](double value) {
                double other = std::get<double>(rhs);
                return value == other || (std::isnan(value) && std::isnan(other));
            },
            [&rhs](const std::string &value) { return value == std::get<std::string>(rhs); },
            [&rhs](const EnumSymbol &value) { return value == std::get<EnumSymbol>(rhs); },
            [&rhs](const std::shared_ptr<const Binding> &value) {
                return pointeeEquals(value, std::get<std::shared_ptr<const Binding>>(rhs),
                                     [](const Binding &a, const Binding &b) {
                                         return a.variable == b.variable && equals(a.value, b.value);
                                     });
            },
            [&rhs](const std::shared_ptr<const Predicate> &value) {
                return pointeeEquals(value, std::get<std::shared_ptr<const Predicate>>(rhs),
                                     [](const Predicate &a, const Predicate &b) {
                                         return a.type == b.type && a.operatorName == b.operatorName &&
                                                sequenceEquals(a.arguments, b.arguments);
                                     });
            },
            [&rhs](const std::shared_ptr<const Bytecode> &value) {
                return pointeeEquals(value, std::get<std::shared_ptr<const Bytecode>>(rhs),
                                     [](const Bytecode &a, const Bytecode &b) { return a == b; });
            },
            [&rhs](const std::shared_ptr<const Collection> &value) {
                return pointeeEquals(value, std::get<std::shared_ptr<const Collection>>(rhs),
                                     [](const Collection &a, const Collection &b) {
                                         return a.kind == b.kind && sequenceEquals(a.elements, b.elements);
                                     });
            },
            [&rhs](const std::shared_ptr<const MapValue> &value) {
                return pointeeEquals(value, std::get<std::shared_ptr<const MapValue>>(rhs),
                                     [](const MapValue &a, const MapValue &b) {
                                         if (a.entries.size() != b.entries.size()) {
                                             return false;
                                         }
                                         for (size_t i = 0; i < a.entries.size(); ++i) {
                                             if (!equals(a.entries[i].first, b.entries[i].first) ||
                                                 !equals(a.entries[i].second, b.entries[i].second)) {
                                                 return false;
                                             }
                                         }
                                         return true;
                                     });
            },
            [&rhs](const std::shared_ptr<const OpaqueObject> &value) {
                return pointeeEquals(value, std::get<std::shared_ptr<const OpaqueObject>>(rhs),
                                     [](const OpaqueObject &a, const OpaqueObject &b) { return a.equals(b); });
            },
        },
        lhs);
}

std::string kindName(const Value &value) {
    return std::visit(Overloaded{
                          [](std::monostate) -> std::string { return "null"; },
                          [](bool) -> std::string { return "boolean"; },
                          [](int32_t) -> std::string { return "integer"; },
                          [](int64_t) -> std::string { return "long"; },
                          [](double) -> std::string { return "double"; },
                          [](const std::string &) -> std::string { return "string"; },
                          [](const EnumSymbol &) -> std::string { return "enum"; },
                          [](const std::shared_ptr<const Binding> &) -> std::string { return "binding"; },
                          [](const std::shared_ptr<const Predicate> &) -> std::string { return "predicate"; },
                          [](const std::shared_ptr<const Bytecode> &) -> std::string { return "bytecode"; },
                          [](const std::shared_ptr<const Collection> &collection) -> std::string {
                              return collection && collection->kind == Collection::Kind::SET ? "set" : "list";
                          },
                          [](const std::shared_ptr<const MapValue> &) -> std::string { return "map"; },
                          [](const std::shared_ptr<const OpaqueObject> &object) -> std::string {
                              return object ? object->getTypeName() : "object";
                          },
                      },
                      value);
}

std::string toString(const Value &value) {
    return std::visit(
        Overloaded{
            [](std::monostate) -> std::string { return "null"; },
            [](bool v) -> std::string { return v ? "true" : "false"; },
            [](int32_t v) -> std::string { return std::to_string(v); },
            [](int64_t v) -> std::string { return std::to_string(v); },
            [](double v) -> std::string { return fmt::format("{}", v); },
            [](const std::string &v) -> std::string { return v; },
            [](const EnumSymbol &v) -> std::string { return v.type + "." + v.name; },
            [](const std::shared_ptr<const Binding> &v) -> std::string {
                return v ? "binding[" + v->variable + "=" + toString(v->value) + "]" : "binding[]";
            },
            [](const std::shared_ptr<const Predicate> &v) -> std::string {
                return v ? v->operatorName + "(" + joinValues(v->arguments) + ")" : "predicate()";
            },
            [](const std::shared_ptr<const Bytecode> &v) -> std::string { return v ? v->toString() : "[]"; },
            [](const std::shared_ptr<const Collection> &v) -> std::string {
                if (!v) {
                    return "[]";
                }
                bool isSet = v->kind == Collection::Kind::SET;
                return (isSet ? "{" : "[") + joinValues(v->elements) + (isSet ? "}" : "]");
            },
            [](const std::shared_ptr<const MapValue> &v) -> std::string {
                std::string result = "{";
                if (v) {
                    for (size_t i = 0; i < v->entries.size(); ++i) {
                        if (i > 0) {
                            result += ", ";
                        }
                        result += toString(v->entries[i].first) + "=" + toString(v->entries[i].second);
                    }
                }
                return result + "}";
            },
            [](const std::shared_ptr<const OpaqueObject> &v) -> std::string { return v ? v->describe() : "null"; },
        },
        value);
}

}  // namespace Values

}  // namespace TRV
