#pragma once

#include "bytecode/Bytecode.h"
#include <string>

namespace TRV {

/**
 * @brief Translates Bytecode into another representation
 *
 * The representation is either a script in some dialect (ScriptTranslator)
 * or an executable traversal built against a traversal source
 * (StepTranslator).
 *
 * @tparam S Traversal source representation the translation is rooted at
 * @tparam T Translation result
 */
template <typename S, typename T> class Translator {
public:
    virtual ~Translator() = default;

    /**
     * @brief Traversal source representation rooting this translator
     *
     * For script translators this is the source variable name (typically "g").
     * For step translators it is the traversal source instance traversals are
     * built from.
     */
    virtual S getTraversalSource() const = 0;

    /**
     * @brief Translate bytecode into the target representation
     * @param bytecode Source and step instructions; never modified
     * @return Translated representation
     * @throws TranslationException if an operation or argument cannot be translated
     */
    virtual T translate(const Bytecode &bytecode) const = 0;

    /**
     * @brief Identifier of the language the translation targets (e.g. "gremlin-groovy")
     */
    virtual std::string getTargetLanguage() const = 0;
};

}  // namespace TRV
