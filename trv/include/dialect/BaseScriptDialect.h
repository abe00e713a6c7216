#pragma once

#include "dialect/IScriptDialect.h"
#include <string>
#include <vector>

namespace TRV {

/**
 * @brief Method-chaining dialect skeleton
 *
 * Renders invocations as receiver.method(a,b), qualifies enums and
 * predicates by their type name and resolves operations through the
 * OperationCatalog. Subclasses supply literal syntax and may rename
 * identifiers through translateIdentifier().
 */
class BaseScriptDialect : public IScriptDialect {
public:
    std::optional<std::string> mapOperation(OperationPhase phase, const std::string &operatorName) const override;

    std::optional<std::string> renderEnum(const EnumSymbol &symbol) const override;

    std::string renderBinding(const std::string &variable) const override;

    std::optional<std::string> renderPredicate(const std::string &type, const std::string &operatorName,
                                               const std::vector<std::string> &arguments) const override;

    std::string renderConnective(const std::string &operatorName, const std::string &left,
                                 const std::string &right) const override;

    std::string renderInvocation(const std::string &receiver, const std::string &method,
                                 const std::vector<std::string> &arguments) const override;

    std::string getAnonymousTraversalSymbol() const override;

    std::string renderEmptyAnonymousTraversal() const override;

protected:
    explicit BaseScriptDialect(const OperationCatalog &catalog = OperationCatalog::instance());

    /**
     * @brief Rename a method, predicate or enum constant for the target language
     */
    virtual std::string translateIdentifier(const std::string &name) const;

    static std::string join(const std::vector<std::string> &parts, const std::string &separator = ",");

    /**
     * @brief Shortest round-trip decimal form that always carries a fraction or exponent
     */
    static std::string formatDecimal(double value);

    const OperationCatalog &catalog_;
};

}  // namespace TRV
