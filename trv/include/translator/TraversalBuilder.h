#pragma once

#include "bytecode/Bytecode.h"
#include "engine/ITraversalSource.h"
#include "translator/TranslationException.h"
#include <memory>
#include <string>

namespace TRV {

/**
 * @brief Replays bytecode against a traversal source
 *
 * Source instructions reconfigure the source, the first step instruction
 * spawns the traversal and later ones are applied to it. Arguments are
 * adapted to StepArguments: bindings resolve to their value and nested
 * bytecode becomes an anonymous traversal built the same way. Engine
 * rejections are rethrown as TranslationException.
 */
class TraversalBuilder {
public:
    TraversalBuilder(const ITraversalSource &source, std::string targetLanguage);

    /**
     * @throws TranslationException on engine rejection or malformed bytecode
     */
    std::shared_ptr<ITraversal> build(const Bytecode &bytecode) const;

    /**
     * @brief Translation error kind reported for an engine error kind
     */
    static TranslationErrorKind toTranslationErrorKind(EngineErrorKind kind);

private:
    const ITraversalSource &source_;
    std::string targetLanguage_;
};

}  // namespace TRV
