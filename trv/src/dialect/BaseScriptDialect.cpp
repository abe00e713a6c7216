#include "dialect/BaseScriptDialect.h"
#include <spdlog/fmt/fmt.h>

namespace TRV {

BaseScriptDialect::BaseScriptDialect(const OperationCatalog &catalog) : catalog_(catalog) {}

std::optional<std::string> BaseScriptDialect::mapOperation(OperationPhase phase,
                                                           const std::string &operatorName) const {
    if (!catalog_.contains(phase, operatorName)) {
        return std::nullopt;
    }
    return translateIdentifier(operatorName);
}

std::optional<std::string> BaseScriptDialect::renderEnum(const EnumSymbol &symbol) const {
    if (!catalog_.isKnownEnumType(symbol.type) || symbol.name.empty()) {
        return std::nullopt;
    }
    return symbol.type + "." + translateIdentifier(symbol.name);
}

std::string BaseScriptDialect::renderBinding(const std::string &variable) const {
    return variable;
}

std::optional<std::string> BaseScriptDialect::renderPredicate(const std::string &type,
                                                              const std::string &operatorName,
                                                              const std::vector<std::string> &arguments) const {
    if (!catalog_.isKnownPredicate(type, operatorName)) {
        return std::nullopt;
    }
    return type + "." + translateIdentifier(operatorName) + "(" + join(arguments) + ")";
}

std::string BaseScriptDialect::renderConnective(const std::string &operatorName, const std::string &left,
                                                const std::string &right) const {
    return left + "." + translateIdentifier(operatorName) + "(" + right + ")";
}

std::string BaseScriptDialect::renderInvocation(const std::string &receiver, const std::string &method,
                                                const std::vector<std::string> &arguments) const {
    return receiver + "." + method + "(" + join(arguments) + ")";
}

std::string BaseScriptDialect::getAnonymousTraversalSymbol() const {
    return "__";
}

std::string BaseScriptDialect::renderEmptyAnonymousTraversal() const {
    return renderInvocation(getAnonymousTraversalSymbol(), translateIdentifier("start"), {});
}

std::string BaseScriptDialect::translateIdentifier(const std::string &name) const {
    return name;
}

std::string BaseScriptDialect::join(const std::vector<std::string> &parts, const std::string &separator) {
    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            result += separator;
        }
        result += parts[i];
    }
    return result;
}

std::string BaseScriptDialect::formatDecimal(double value) {
    std::string text = fmt::format("{}", value);
    if (text.find_first_of(".eEn") == std::string::npos) {
        text += ".0";
    }
    return text;
}

}  // namespace TRV
