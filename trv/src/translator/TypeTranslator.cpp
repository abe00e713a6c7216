#include "translator/TypeTranslator.h"
#include <stdexcept>

namespace TRV {

TypeTranslator::TypeTranslator() : function_([](const Value &) -> TypeTranslation { return Continue{}; }) {}

TypeTranslator::TypeTranslator(Function function) : function_(std::move(function)) {
    if (!function_) {
        throw std::invalid_argument("TypeTranslator requires a callable function");
    }
}

TypeTranslation TypeTranslator::operator()(const Value &value) const {
    return function_(value);
}

TypeTranslator TypeTranslator::orElse(TypeTranslator fallback) const {
    return TypeTranslator([first = function_, second = std::move(fallback)](const Value &value) -> TypeTranslation {
        TypeTranslation result = first(value);
        if (std::holds_alternative<Continue>(result)) {
            return second(value);
        }
        return result;
    });
}

TypeTranslator TypeTranslator::forObjectType(const std::string &typeName,
                                             std::function<TypeTranslation(const OpaqueObject &)> rule) {
    if (!rule) {
        throw std::invalid_argument("TypeTranslator rule for '" + typeName + "' is not callable");
    }
    return TypeTranslator([typeName, rule = std::move(rule)](const Value &value) -> TypeTranslation {
        const auto *object = std::get_if<std::shared_ptr<const OpaqueObject>>(&value);
        if (object && *object && (*object)->getTypeName() == typeName) {
            return rule(**object);
        }
        return Continue{};
    });
}

}  // namespace TRV
