#pragma once

#include "bytecode/Value.h"
#include <functional>
#include <string>
#include <utility>
#include <variant>

namespace TRV {

/**
 * @brief Completed translation of one value
 *
 * Returned by a TypeTranslator to make the script translator use the text
 * verbatim instead of rendering the value.
 */
class Handled {
public:
    explicit Handled(std::string translation) : translation_(std::move(translation)) {}

    const std::string &getTranslation() const {
        return translation_;
    }

private:
    std::string translation_;
};

/**
 * @brief Render the value normally
 */
struct Continue {};

/**
 * @brief Render this replacement value instead of the original
 */
struct Substitute {
    Value value;
};

using TypeTranslation = std::variant<Continue, Substitute, Handled>;

/**
 * @brief Per-value customization hook of script translation
 *
 * Applied to every value the script walk reaches before it is rendered. The
 * wrapped function must be free of side effects and must not keep state
 * between invocations.
 */
class TypeTranslator {
public:
    using Function = std::function<TypeTranslation(const Value &)>;

    /**
     * @brief Identity translator: every value continues to normal rendering
     */
    TypeTranslator();

    explicit TypeTranslator(Function function);

    static TypeTranslator identity() {
        return TypeTranslator();
    }

    TypeTranslation operator()(const Value &value) const;

    /**
     * @brief Compose with a fallback rule
     *
     * The fallback is consulted only when this translator answers Continue.
     */
    TypeTranslator orElse(TypeTranslator fallback) const;

    /**
     * @brief Rule applied to opaque objects with the given type name only
     */
    static TypeTranslator forObjectType(const std::string &typeName,
                                        std::function<TypeTranslation(const OpaqueObject &)> rule);

private:
    Function function_;
};

}  // namespace TRV
