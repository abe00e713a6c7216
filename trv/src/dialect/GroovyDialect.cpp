#include "dialect/GroovyDialect.h"
#include <cmath>
#include <spdlog/fmt/fmt.h>

namespace TRV {

GroovyDialect::GroovyDialect(const OperationCatalog &catalog) : BaseScriptDialect(catalog) {}

std::string GroovyDialect::getTargetLanguage() const {
    return "gremlin-groovy";
}

std::string GroovyDialect::renderNull() const {
    return "null";
}

std::string GroovyDialect::renderBoolean(bool value) const {
    return value ? "true" : "false";
}

std::string GroovyDialect::renderInteger(int32_t value) const {
    return std::to_string(value);
}

std::string GroovyDialect::renderLong(int64_t value) const {
    return std::to_string(value) + "L";
}

std::string GroovyDialect::renderDouble(double value) const {
    if (std::isnan(value)) {
        return "Double.NaN";
    }
    if (std::isinf(value)) {
        return value > 0 ? "Double.POSITIVE_INFINITY" : "Double.NEGATIVE_INFINITY";
    }
    return formatDecimal(value) + "d";
}

std::string GroovyDialect::renderString(const std::string &value) const {
    std::string result = "\"";
    for (char c : value) {
        switch (c) {
        case '"':
            result += "\\\"";
            break;
        case '\\':
            result += "\\\\";
            break;
        case '$':
            result += "\\$";
            break;
        case '\n':
            result += "\\n";
            break;
        case '\r':
            result += "\\r";
            break;
        case '\t':
            result += "\\t";
            break;
        case '\b':
            result += "\\b";
            break;
        case '\f':
            result += "\\f";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                result += fmt::format("\\u{:04x}", static_cast<unsigned int>(static_cast<unsigned char>(c)));
            } else {
                result += c;
            }
            break;
        }
    }
    result += "\"";
    return result;
}

std::string GroovyDialect::renderList(const std::vector<std::string> &elements) const {
    return "[" + join(elements) + "]";
}

std::string GroovyDialect::renderSet(const std::vector<std::string> &elements) const {
    return renderList(elements) + " as Set";
}

std::string GroovyDialect::renderMap(const std::vector<RenderedEntry> &entries) const {
    if (entries.empty()) {
        return "[:]";
    }

    std::vector<std::string> parts;
    parts.reserve(entries.size());
    for (const auto &entry : entries) {
        // Groovy reads a bare key as a string, so computed keys need parentheses
        std::string key = entry.stringKey ? entry.key : "(" + entry.key + ")";
        parts.push_back(key + ":" + entry.value);
    }
    return "[" + join(parts) + "]";
}

}  // namespace TRV
