#include "dialect/PythonDialect.h"
#include <cctype>
#include <cmath>
#include <spdlog/fmt/fmt.h>

namespace TRV {

PythonDialect::PythonDialect(const OperationCatalog &catalog) : BaseScriptDialect(catalog) {}

std::string PythonDialect::getTargetLanguage() const {
    return "gremlin-python";
}

std::string PythonDialect::renderNull() const {
    return "None";
}

std::string PythonDialect::renderBoolean(bool value) const {
    return value ? "True" : "False";
}

std::string PythonDialect::renderInteger(int32_t value) const {
    return std::to_string(value);
}

std::string PythonDialect::renderLong(int64_t value) const {
    return "long(" + std::to_string(value) + ")";
}

std::string PythonDialect::renderDouble(double value) const {
    if (std::isnan(value)) {
        return "float('nan')";
    }
    if (std::isinf(value)) {
        return value > 0 ? "float('inf')" : "float('-inf')";
    }
    return formatDecimal(value);
}

std::string PythonDialect::renderString(const std::string &value) const {
    std::string result = "'";
    for (char c : value) {
        switch (c) {
        case '\'':
            result += "\\'";
            break;
        case '\\':
            result += "\\\\";
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
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                result += fmt::format("\\x{:02x}", static_cast<unsigned int>(static_cast<unsigned char>(c)));
            } else {
                result += c;
            }
            break;
        }
    }
    result += "'";
    return result;
}

std::string PythonDialect::renderList(const std::vector<std::string> &elements) const {
    return "[" + join(elements) + "]";
}

std::string PythonDialect::renderSet(const std::vector<std::string> &elements) const {
    // {} is an empty dict in Python
    if (elements.empty()) {
        return "set()";
    }
    return "{" + join(elements) + "}";
}

std::string PythonDialect::renderMap(const std::vector<RenderedEntry> &entries) const {
    std::vector<std::string> parts;
    parts.reserve(entries.size());
    for (const auto &entry : entries) {
        parts.push_back(entry.key + ":" + entry.value);
    }
    return "{" + join(parts) + "}";
}

std::string PythonDialect::toSnakeCase(const std::string &name) {
    std::string result;
    result.reserve(name.size() + 4);
    for (size_t i = 0; i < name.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(name[i]);
        // Only a lower-to-upper boundary starts a new word; OUT and V stay as they are
        bool boundary = i > 0 && std::isupper(c) &&
                        (std::islower(static_cast<unsigned char>(name[i - 1])) ||
                         std::isdigit(static_cast<unsigned char>(name[i - 1])));
        if (boundary) {
            result += '_';
            result += static_cast<char>(std::tolower(c));
        } else {
            result += static_cast<char>(c);
        }
    }
    return result;
}

std::string PythonDialect::translateIdentifier(const std::string &name) const {
    std::string snake = toSnakeCase(name);
    if (reservedNames().count(snake) > 0) {
        snake += "_";
    }
    return snake;
}

const std::set<std::string> &PythonDialect::reservedNames() {
    static const std::set<std::string> names = {"all", "and", "as", "filter", "from", "global", "id",
                                                "in", "is", "list", "map", "max", "min", "not",
                                                "or", "range", "set", "sum", "with"};
    return names;
}

}  // namespace TRV
