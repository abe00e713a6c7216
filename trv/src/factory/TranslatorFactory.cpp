#include "factory/TranslatorFactory.h"
#include "common/Logger.h"
#include "dialect/GroovyDialect.h"
#include "dialect/PythonDialect.h"
#include <algorithm>
#include <stdexcept>

namespace TRV {

TranslatorFactory::CreationResult TranslatorFactory::createScriptTranslator(const TranslatorConfig &config,
                                                                            TypeTranslator typeTranslator) {
    auto result = createScriptTranslator(config.language, config.traversalSource, std::move(typeTranslator));
    if (!result) {
        return result;
    }
    // A rejected configuration leaves the process-wide level untouched
    if (!config.logLevel.empty() && !Logger::setLevel(config.logLevel)) {
        return CreationResult("Unknown log level: " + config.logLevel);
    }
    return result;
}

TranslatorFactory::CreationResult TranslatorFactory::createScriptTranslator(const std::string &language,
                                                                            const std::string &traversalSource,
                                                                            TypeTranslator typeTranslator) {
    auto dialect = createDialect(language);
    if (!dialect) {
        return CreationResult("Unsupported target language: " + language);
    }
    if (traversalSource.empty()) {
        return CreationResult("Traversal source name cannot be empty");
    }

    try {
        auto translator =
            std::make_unique<ScriptTranslator>(traversalSource, std::move(dialect), std::move(typeTranslator));
        LOG_DEBUG("Created {} translator rooted at '{}'", language, traversalSource);
        return CreationResult(std::move(translator));
    } catch (const std::invalid_argument &e) {
        return CreationResult("Translator creation failed: " + std::string(e.what()));
    }
}

TranslatorFactory::CreationResult TranslatorFactory::createFromJson(const std::string &jsonText,
                                                                    TypeTranslator typeTranslator) {
    std::string error;
    auto config = TranslatorConfig::fromJson(jsonText, &error);
    if (!config) {
        return CreationResult("Invalid configuration: " + error);
    }
    return createScriptTranslator(*config, std::move(typeTranslator));
}

std::shared_ptr<const IScriptDialect> TranslatorFactory::createDialect(const std::string &language) {
    if (language == "gremlin-groovy") {
        return std::make_shared<GroovyDialect>();
    }
    if (language == "gremlin-python") {
        return std::make_shared<PythonDialect>();
    }
    return nullptr;
}

std::vector<std::string> TranslatorFactory::availableLanguages() {
    return {"gremlin-groovy", "gremlin-python"};
}

bool TranslatorFactory::isSupported(const std::string &language) {
    auto languages = availableLanguages();
    return std::find(languages.begin(), languages.end(), language) != languages.end();
}

}  // namespace TRV
