#include "common/JsonUtils.h"
#include "common/Logger.h"
#include <fstream>
#include <sstream>

namespace TRV {

std::optional<Json::Value> JsonUtils::parseJson(const std::string &jsonString, std::string *errorOut) {
    if (jsonString.empty()) {
        if (errorOut) {
            *errorOut = "Empty JSON string";
        }
        return std::nullopt;
    }

    Json::Value root;
    Json::CharReaderBuilder readerBuilder = createReaderBuilder();
    std::string parseErrors;
    std::istringstream jsonStream(jsonString);

    if (!Json::parseFromStream(readerBuilder, jsonStream, &root, &parseErrors)) {
        if (errorOut) {
            *errorOut = parseErrors;
        }
        LOG_DEBUG("JsonUtils: Failed to parse JSON: {}", parseErrors);
        return std::nullopt;
    }

    return root;
}

std::optional<Json::Value> JsonUtils::parseFile(const std::string &path, std::string *errorOut) {
    std::ifstream file(path);
    if (!file) {
        if (errorOut) {
            *errorOut = "Cannot open file: " + path;
        }
        LOG_DEBUG("JsonUtils: Cannot open {}", path);
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parseJson(buffer.str(), errorOut);
}

std::string JsonUtils::toCompactString(const Json::Value &value) {
    Json::StreamWriterBuilder writerBuilder = createCompactWriterBuilder();
    return Json::writeString(writerBuilder, value);
}

bool JsonUtils::readOptionalString(const Json::Value &object, const std::string &key, std::string &out,
                                   std::string *errorOut) {
    if (!hasKey(object, key)) {
        return true;
    }

    const Json::Value &value = object[key];
    if (!value.isString()) {
        if (errorOut) {
            *errorOut = "Expected string for key '" + key + "'";
        }
        return false;
    }

    out = value.asString();
    return true;
}

bool JsonUtils::hasKey(const Json::Value &object, const std::string &key) {
    return object.isObject() && object.isMember(key) && !object[key].isNull();
}

Json::StreamWriterBuilder JsonUtils::createCompactWriterBuilder() {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return builder;
}

Json::CharReaderBuilder JsonUtils::createReaderBuilder() {
    Json::CharReaderBuilder builder;
    builder["rejectDupKeys"] = true;
    return builder;
}

}  // namespace TRV
