#pragma once

#include "catalog/OperationCatalog.h"
#include "dialect/IScriptDialect.h"
#include "translator/TranslationException.h"
#include "translator/Translator.h"
#include "translator/TypeTranslator.h"
#include <memory>
#include <string>

namespace TRV {

/**
 * @brief Renders bytecode as a script in a target dialect
 *
 * The script is rooted at the traversal source variable: source
 * instructions become invocations on it and step instructions are chained
 * onto the running expression. Every argument value is offered to the
 * TypeTranslator before it is rendered, so callers can override the
 * rendering of any value (opaque objects included) without subclassing.
 *
 * Instances are immutable; translate() may be called concurrently as long
 * as the TypeTranslator function is safe to call concurrently.
 */
class ScriptTranslator : public Translator<std::string, std::string> {
public:
    /**
     * @brief Construct a script translator
     * @param traversalSource Variable name the script is rooted at (e.g. "g")
     * @param dialect Target language syntax
     * @param typeTranslator Per-value customization hook, identity by default
     * @param catalog Operation signatures used for arity checks
     * @throws std::invalid_argument if traversalSource is empty or dialect is null
     */
    ScriptTranslator(std::string traversalSource, std::shared_ptr<const IScriptDialect> dialect,
                     TypeTranslator typeTranslator = TypeTranslator::identity(),
                     const OperationCatalog &catalog = OperationCatalog::instance());

    std::string getTraversalSource() const override;

    /**
     * @brief Render bytecode as a single script expression
     * @throws TranslationException on unknown operations, arguments without a
     *         rendering or structurally invalid bytecode
     */
    std::string translate(const Bytecode &bytecode) const override;

    std::string getTargetLanguage() const override;

    const TypeTranslator &getTypeTranslator() const {
        return typeTranslator_;
    }

    const std::shared_ptr<const IScriptDialect> &getDialect() const {
        return dialect_;
    }

private:
    std::string traversalSource_;
    std::shared_ptr<const IScriptDialect> dialect_;
    TypeTranslator typeTranslator_;
    const OperationCatalog &catalog_;
};

}  // namespace TRV
