#pragma once

#include <json/json.h>
#include <optional>
#include <string>

namespace TRV {

/**
 * @brief JSON helpers used by configuration loading
 *
 * Parse failures and type mismatches are reported through an optional
 * error string instead of exceptions.
 */
class JsonUtils {
public:
    /**
     * @brief Parse JSON text
     * @param jsonString Input JSON text
     * @param errorOut Optional error message output
     * @return Parsed value or nullopt on failure
     */
    static std::optional<Json::Value> parseJson(const std::string &jsonString, std::string *errorOut = nullptr);

    /**
     * @brief Read and parse a JSON file
     * @param path File path
     * @param errorOut Optional error message output
     * @return Parsed value or nullopt if the file is unreadable or invalid
     */
    static std::optional<Json::Value> parseFile(const std::string &path, std::string *errorOut = nullptr);

    /**
     * @brief Serialize to single-line JSON
     */
    static std::string toCompactString(const Json::Value &value);

    /**
     * @brief Read an optional string member
     *
     * A missing or null member leaves @p out untouched and succeeds. A member
     * of any other type fails with a message naming the key.
     *
     * @return false on type mismatch
     */
    static bool readOptionalString(const Json::Value &object, const std::string &key, std::string &out,
                                   std::string *errorOut = nullptr);

    /**
     * @brief Check if JSON object has key and it's not null
     */
    static bool hasKey(const Json::Value &object, const std::string &key);

private:
    static Json::StreamWriterBuilder createCompactWriterBuilder();
    static Json::CharReaderBuilder createReaderBuilder();
};

}  // namespace TRV
