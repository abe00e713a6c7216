#pragma once

#include <json/json.h>
#include <optional>
#include <string>

namespace TRV {

/**
 * @brief Settings for building a ScriptTranslator
 *
 * JSON form:
 * @code
 * { "language": "gremlin-python", "traversalSource": "g", "logLevel": "debug" }
 * @endcode
 * Every key is optional.
 */
struct TranslatorConfig {
    std::string language = "gremlin-groovy";
    std::string traversalSource = "g";
    std::string logLevel;  // empty keeps the current level

    /**
     * @brief Load configuration from JSON text
     * @param jsonText JSON object
     * @param errorOut Optional error message output
     * @return Configuration or nullopt on malformed JSON or mistyped keys
     */
    static std::optional<TranslatorConfig> fromJson(const std::string &jsonText, std::string *errorOut = nullptr);

    /**
     * @brief Load configuration from a JSON file
     */
    static std::optional<TranslatorConfig> fromFile(const std::string &path, std::string *errorOut = nullptr);

    static std::optional<TranslatorConfig> fromJsonValue(const Json::Value &root, std::string *errorOut = nullptr);

    Json::Value toJson() const;

    bool operator==(const TranslatorConfig &other) const = default;
};

}  // namespace TRV
