#pragma once

#include "bytecode/Value.h"
#include "catalog/OperationCatalog.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace TRV {

/**
 * @brief Map entry whose key and value are already rendered
 */
struct RenderedEntry {
    std::string key;
    std::string value;
    bool stringKey = false;  // key was a plain string literal
};

/**
 * @brief Syntax of one target scripting language
 *
 * A dialect only turns already-validated pieces into text. Walking the
 * bytecode, applying the TypeTranslator and reporting failures belong to
 * ScriptTranslator.
 */
class IScriptDialect {
public:
    virtual ~IScriptDialect() = default;

    /**
     * @brief Language identifier reported by translators using this dialect
     */
    virtual std::string getTargetLanguage() const = 0;

    /**
     * @brief Method name for an operation
     * @return nullopt if the dialect has no mapping for the operation
     */
    virtual std::optional<std::string> mapOperation(OperationPhase phase, const std::string &operatorName) const = 0;

    virtual std::string renderNull() const = 0;
    virtual std::string renderBoolean(bool value) const = 0;
    virtual std::string renderInteger(int32_t value) const = 0;
    virtual std::string renderLong(int64_t value) const = 0;
    virtual std::string renderDouble(double value) const = 0;
    virtual std::string renderString(const std::string &value) const = 0;

    /**
     * @return nullopt if the enum type has no qualified form in this dialect
     */
    virtual std::optional<std::string> renderEnum(const EnumSymbol &symbol) const = 0;

    virtual std::string renderBinding(const std::string &variable) const = 0;
    virtual std::string renderList(const std::vector<std::string> &elements) const = 0;
    virtual std::string renderSet(const std::vector<std::string> &elements) const = 0;
    virtual std::string renderMap(const std::vector<RenderedEntry> &entries) const = 0;

    /**
     * @return nullopt if the predicate operator is not known to the dialect
     */
    virtual std::optional<std::string> renderPredicate(const std::string &type, const std::string &operatorName,
                                                       const std::vector<std::string> &arguments) const = 0;

    virtual std::string renderConnective(const std::string &operatorName, const std::string &left,
                                         const std::string &right) const = 0;

    /**
     * @brief Chain a method application onto an expression
     */
    virtual std::string renderInvocation(const std::string &receiver, const std::string &method,
                                         const std::vector<std::string> &arguments) const = 0;

    /**
     * @brief Receiver of anonymous child traversals (e.g. "__")
     */
    virtual std::string getAnonymousTraversalSymbol() const = 0;

    /**
     * @brief Anonymous traversal without any step
     */
    virtual std::string renderEmptyAnonymousTraversal() const = 0;
};

}  // namespace TRV
