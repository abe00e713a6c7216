#pragma once

#include "dialect/BaseScriptDialect.h"
#include <set>

namespace TRV {

/**
 * @brief gremlin-python syntax
 *
 * Identifiers are converted from camelCase to snake_case and names that
 * clash with Python keywords or builtins get a trailing underscore
 * (as_, in_, not_, T.id_).
 */
class PythonDialect : public BaseScriptDialect {
public:
    explicit PythonDialect(const OperationCatalog &catalog = OperationCatalog::instance());

    std::string getTargetLanguage() const override;

    std::string renderNull() const override;
    std::string renderBoolean(bool value) const override;
    std::string renderInteger(int32_t value) const override;
    std::string renderLong(int64_t value) const override;
    std::string renderDouble(double value) const override;
    std::string renderString(const std::string &value) const override;
    std::string renderList(const std::vector<std::string> &elements) const override;
    std::string renderSet(const std::vector<std::string> &elements) const override;
    std::string renderMap(const std::vector<RenderedEntry> &entries) const override;

    /**
     * @brief camelCase to snake_case; names without a lower-to-upper boundary (V, OUT) are kept
     */
    static std::string toSnakeCase(const std::string &name);

protected:
    std::string translateIdentifier(const std::string &name) const override;

private:
    static const std::set<std::string> &reservedNames();
};

}  // namespace TRV
