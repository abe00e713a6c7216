#pragma once

#include "dialect/IScriptDialect.h"
#include "factory/TranslatorConfig.h"
#include "translator/ScriptTranslator.h"
#include "translator/TypeTranslator.h"
#include <memory>
#include <string>
#include <vector>

namespace TRV {

/**
 * @brief Creates script translators by target language name
 *
 * Failures are reported through CreationResult; nothing here throws.
 */
class TranslatorFactory {
public:
    /**
     * @brief Result type for factory operations
     */
    struct CreationResult {
        std::unique_ptr<ScriptTranslator> value;
        std::string error;
        bool success;

        CreationResult(std::unique_ptr<ScriptTranslator> translator) : value(std::move(translator)), success(true) {}

        CreationResult(const std::string &err) : error(err), success(false) {}

        bool has_value() const {
            return success;
        }

        explicit operator bool() const {
            return success;
        }
    };

    /**
     * @brief Create a translator from configuration
     *
     * Applies config.logLevel to the logger when it is set.
     */
    static CreationResult createScriptTranslator(const TranslatorConfig &config,
                                                 TypeTranslator typeTranslator = TypeTranslator::identity());

    static CreationResult createScriptTranslator(const std::string &language, const std::string &traversalSource,
                                                 TypeTranslator typeTranslator = TypeTranslator::identity());

    /**
     * @brief Create a translator from JSON configuration text
     */
    static CreationResult createFromJson(const std::string &jsonText,
                                         TypeTranslator typeTranslator = TypeTranslator::identity());

    /**
     * @brief Dialect for a language name
     * @return nullptr for unsupported languages
     */
    static std::shared_ptr<const IScriptDialect> createDialect(const std::string &language);

    static std::vector<std::string> availableLanguages();

    static bool isSupported(const std::string &language);

    /**
     * @brief Builder pattern for step-by-step configuration
     */
    class Builder {
    private:
        TranslatorConfig config_;
        TypeTranslator typeTranslator_;

    public:
        Builder &withLanguage(const std::string &language) {
            config_.language = language;
            return *this;
        }

        Builder &withTraversalSource(const std::string &traversalSource) {
            config_.traversalSource = traversalSource;
            return *this;
        }

        Builder &withLogLevel(const std::string &logLevel) {
            config_.logLevel = logLevel;
            return *this;
        }

        Builder &withTypeTranslator(TypeTranslator typeTranslator) {
            typeTranslator_ = std::move(typeTranslator);
            return *this;
        }

        CreationResult build() {
            return createScriptTranslator(config_, typeTranslator_);
        }
    };

    static Builder builder() {
        return Builder{};
    }
};

}  // namespace TRV
