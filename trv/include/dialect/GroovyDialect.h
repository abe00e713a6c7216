#pragma once

#include "dialect/BaseScriptDialect.h"

namespace TRV {

/**
 * @brief gremlin-groovy syntax
 *
 * Operation and enum names are used unchanged. Strings are double-quoted
 * with Java escapes and '$' escaped against GString interpolation.
 */
class GroovyDialect : public BaseScriptDialect {
public:
    explicit GroovyDialect(const OperationCatalog &catalog = OperationCatalog::instance());

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
};

}  // namespace TRV
