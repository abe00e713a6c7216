#include "factory/TranslatorConfig.h"
#include "common/JsonUtils.h"
#include "common/Logger.h"
#include <set>

namespace TRV {

namespace {

const std::set<std::string> &knownKeys() {
    static const std::set<std::string> keys = {"language", "traversalSource", "logLevel"};
    return keys;
}

std::optional<TranslatorConfig> reportError(const std::string &message, std::string *errorOut) {
    LOG_WARN("Invalid translator configuration: {}", message);
    if (errorOut) {
        *errorOut = message;
    }
    return std::nullopt;
}

}  // namespace

std::optional<TranslatorConfig> TranslatorConfig::fromJson(const std::string &jsonText, std::string *errorOut) {
    std::string parseError;
    auto root = JsonUtils::parseJson(jsonText, &parseError);
    if (!root) {
        return reportError("JSON parse error: " + parseError, errorOut);
    }
    return fromJsonValue(*root, errorOut);
}

std::optional<TranslatorConfig> TranslatorConfig::fromFile(const std::string &path, std::string *errorOut) {
    std::string parseError;
    auto root = JsonUtils::parseFile(path, &parseError);
    if (!root) {
        return reportError(parseError, errorOut);
    }
    LOG_DEBUG("Loaded translator configuration from {}", path);
    return fromJsonValue(*root, errorOut);
}

std::optional<TranslatorConfig> TranslatorConfig::fromJsonValue(const Json::Value &root, std::string *errorOut) {
    if (!root.isObject()) {
        return reportError("configuration must be a JSON object", errorOut);
    }

    for (const auto &name : root.getMemberNames()) {
        if (knownKeys().count(name) == 0) {
            LOG_WARN("Ignoring unknown configuration key '{}'", name);
        }
    }

    TranslatorConfig config;
    std::string error;
    if (!JsonUtils::readOptionalString(root, "language", config.language, &error) ||
        !JsonUtils::readOptionalString(root, "traversalSource", config.traversalSource, &error) ||
        !JsonUtils::readOptionalString(root, "logLevel", config.logLevel, &error)) {
        return reportError(error, errorOut);
    }

    if (config.language.empty()) {
        return reportError("'language' must not be empty", errorOut);
    }
    if (config.traversalSource.empty()) {
        return reportError("'traversalSource' must not be empty", errorOut);
    }
    return config;
}

Json::Value TranslatorConfig::toJson() const {
    Json::Value root(Json::objectValue);
    root["language"] = language;
    root["traversalSource"] = traversalSource;
    if (!logLevel.empty()) {
        root["logLevel"] = logLevel;
    }
    return root;
}

}  // namespace TRV
