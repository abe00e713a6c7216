#pragma once

#include "common/Logger.h"
#include "engine/ITraversal.h"
#include "engine/ITraversalSource.h"
#include "translator/TranslationException.h"
#include "translator/Translator.h"
#include "translator/TraversalBuilder.h"
#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

namespace TRV {

/**
 * @brief Turns bytecode into an executable traversal of a target engine
 *
 * @tparam S Traversal source type, derived from ITraversalSource
 * @tparam T Traversal type the engine spawns, derived from ITraversal
 */
template <typename S, typename T> class StepTranslator : public Translator<std::shared_ptr<S>, std::shared_ptr<T>> {
    static_assert(std::is_base_of_v<ITraversalSource, S>, "StepTranslator source must derive from ITraversalSource");
    static_assert(std::is_base_of_v<ITraversal, T>, "StepTranslator traversal must derive from ITraversal");

public:
    /**
     * @param traversalSource Source the translated traversals are built from
     * @param targetLanguage Name reported by getTargetLanguage()
     * @throws std::invalid_argument if the source is null or the language is empty
     */
    explicit StepTranslator(std::shared_ptr<S> traversalSource, std::string targetLanguage = "gremlin-cpp")
        : traversalSource_(std::move(traversalSource)), targetLanguage_(std::move(targetLanguage)) {
        if (!traversalSource_) {
            throw std::invalid_argument("StepTranslator: traversal source must not be null");
        }
        if (targetLanguage_.empty()) {
            throw std::invalid_argument("StepTranslator: target language must not be empty");
        }
    }

    std::shared_ptr<S> getTraversalSource() const override {
        return traversalSource_;
    }

    /**
     * @brief Build a traversal equivalent to the bytecode
     * @throws TranslationException if the engine rejects an instruction
     */
    std::shared_ptr<T> translate(const Bytecode &bytecode) const override {
        LOG_DEBUG("Building traversal from {} source and {} step instructions",
                  bytecode.getSourceInstructions().size(), bytecode.getStepInstructions().size());

        try {
            std::shared_ptr<ITraversal> traversal = TraversalBuilder(*traversalSource_, targetLanguage_).build(bytecode);
            auto typed = std::dynamic_pointer_cast<T>(traversal);
            if (!typed) {
                throw TranslationException(TranslationErrorKind::UNSUPPORTED_OPERATION,
                                           "engine produced a traversal of an unexpected type", targetLanguage_);
            }
            return typed;
        } catch (const TranslationException &e) {
            LOG_ERROR("{}", e.what());
            throw;
        }
    }

    std::string getTargetLanguage() const override {
        return targetLanguage_;
    }

private:
    std::shared_ptr<S> traversalSource_;
    std::string targetLanguage_;
};

}  // namespace TRV
