#include "translator/ScriptTranslator.h"
#include "common/Logger.h"
#include "common/Overloaded.h"
#include <cctype>
#include <stdexcept>
#include <utility>
#include <vector>

namespace TRV {

namespace {

const char *phaseName(OperationPhase phase) {
    return phase == OperationPhase::SOURCE ? "source" : "step";
}

bool isValidVariable(const std::string &variable) {
    if (variable.empty()) {
        return false;
    }
    unsigned char first = static_cast<unsigned char>(variable.front());
    if (!std::isalpha(first) && first != '_') {
        return false;
    }
    for (char c : variable) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && uc != '_') {
            return false;
        }
    }
    return true;
}

/**
 * @brief State of one translate() call
 *
 * Tracks the instruction currently being rendered so failures can name
 * their location. Created per call and never shared between threads.
 */
class ScriptWalker {
public:
    ScriptWalker(const std::string &traversalSource, const IScriptDialect &dialect,
                 const TypeTranslator &typeTranslator, const OperationCatalog &catalog)
        : traversalSource_(traversalSource), dialect_(dialect), typeTranslator_(typeTranslator), catalog_(catalog) {}

    std::string renderTraversal(const Bytecode &bytecode, size_t depth) {
        if (depth == 0) {
            std::string expression = traversalSource_;
            appendInstructions(expression, bytecode.getSourceInstructions(), OperationPhase::SOURCE, depth);
            appendInstructions(expression, bytecode.getStepInstructions(), OperationPhase::STEP, depth);
            return expression;
        }

        if (!bytecode.getSourceInstructions().empty()) {
            fail(TranslationErrorKind::MALFORMED_BYTECODE, "nested traversal carries source instructions");
        }
        if (bytecode.getStepInstructions().empty()) {
            return dialect_.renderEmptyAnonymousTraversal();
        }
        std::string expression = dialect_.getAnonymousTraversalSymbol();
        appendInstructions(expression, bytecode.getStepInstructions(), OperationPhase::STEP, depth);
        return expression;
    }

private:
    void appendInstructions(std::string &expression, const std::vector<Instruction> &instructions,
                            OperationPhase phase, size_t depth) {
        for (size_t i = 0; i < instructions.size(); ++i) {
            const Instruction &instruction = instructions[i];
            const std::string &op = instruction.getOperator();
            const auto &arguments = instruction.getArguments();
            location_ = TranslationLocation{phaseName(phase), i, op, std::nullopt, depth};

            if (op.empty()) {
                fail(TranslationErrorKind::MALFORMED_BYTECODE, "instruction without operator name");
            }

            auto method = dialect_.mapOperation(phase, op);
            if (!method) {
                fail(TranslationErrorKind::UNSUPPORTED_OPERATION,
                     fmt::format("'{}' is not a known {} operation", op, phaseName(phase)));
            }

            const OperationSignature *signature = catalog_.find(phase, op);
            if (signature && !signature->acceptsArgumentCount(arguments.size())) {
                fail(TranslationErrorKind::MALFORMED_BYTECODE,
                     fmt::format("'{}' takes {} argument(s), got {}", op, signature->describeArity(),
                                 arguments.size()));
            }

            std::vector<std::string> rendered;
            rendered.reserve(arguments.size());
            for (size_t a = 0; a < arguments.size(); ++a) {
                location_.argumentIndex = a;
                rendered.push_back(renderValue(arguments[a], depth));
            }
            location_.argumentIndex.reset();

            expression = dialect_.renderInvocation(expression, *method, rendered);
        }
    }

    // Offers the value to the TypeTranslator, then renders whatever it answered
    std::string renderValue(const Value &value, size_t depth, bool *renderedString = nullptr) {
        TypeTranslation translation = typeTranslator_(value);
        return std::visit(Overloaded{[&](const Continue &) { return renderStructure(value, depth, renderedString); },
                                     [&](const Substitute &substitute) {
                                         return renderStructure(substitute.value, depth, renderedString);
                                     },
                                     [&](const Handled &handled) { return handled.getTranslation(); }},
                          translation);
    }

    std::string renderStructure(const Value &value, size_t depth, bool *renderedString) {
        if (renderedString) {
            *renderedString = std::holds_alternative<std::string>(value);
        }

        return std::visit(
            Overloaded{
                [&](std::monostate) { return dialect_.renderNull(); },
                [&](bool v) { return dialect_.renderBoolean(v); },
                [&](int32_t v) { return dialect_.renderInteger(v); },
                [&](int64_t v) { return dialect_.renderLong(v); },
                [&](double v) { return dialect_.renderDouble(v); },
                [&](const std::string &v) { return dialect_.renderString(v); },
                [&](const EnumSymbol &v) { return renderEnum(v); },
                [&](const std::shared_ptr<const Binding> &v) { return renderBinding(v.get()); },
                [&](const std::shared_ptr<const Predicate> &v) { return renderPredicate(v.get(), depth); },
                [&](const std::shared_ptr<const Bytecode> &v) { return renderNested(v.get(), depth); },
                [&](const std::shared_ptr<const Collection> &v) { return renderCollection(v.get(), depth); },
                [&](const std::shared_ptr<const MapValue> &v) { return renderMap(v.get(), depth); },
                [&](const std::shared_ptr<const OpaqueObject> &v) { return renderObject(v.get()); }},
            value);
    }

    std::string renderEnum(const EnumSymbol &symbol) {
        auto text = dialect_.renderEnum(symbol);
        if (!text) {
            fail(TranslationErrorKind::UNSUPPORTED_ARGUMENT_TYPE,
                 fmt::format("enum {}.{} has no rendering", symbol.type, symbol.name));
        }
        return *text;
    }

    std::string renderBinding(const Binding *binding) {
        if (!binding) {
            fail(TranslationErrorKind::MALFORMED_BYTECODE, "null binding");
        }
        if (!isValidVariable(binding->variable)) {
            fail(TranslationErrorKind::MALFORMED_BYTECODE,
                 fmt::format("invalid binding variable '{}'", binding->variable));
        }
        return dialect_.renderBinding(binding->variable);
    }

    std::string renderPredicate(const Predicate *predicate, size_t depth) {
        if (!predicate) {
            fail(TranslationErrorKind::MALFORMED_BYTECODE, "null predicate");
        }
        if (predicate->operatorName.empty()) {
            fail(TranslationErrorKind::MALFORMED_BYTECODE, "predicate without operator name");
        }

        if (predicate->isConnective()) {
            const auto &operands = predicate->arguments;
            if (operands.size() != 2 || !isPredicate(operands[0]) || !isPredicate(operands[1])) {
                fail(TranslationErrorKind::MALFORMED_BYTECODE,
                     fmt::format("connective '{}' needs exactly two predicate operands", predicate->operatorName));
            }
            std::string left = renderValue(operands[0], depth);
            std::string right = renderValue(operands[1], depth);
            return dialect_.renderConnective(predicate->operatorName, left, right);
        }

        std::vector<std::string> arguments;
        arguments.reserve(predicate->arguments.size());
        for (const auto &argument : predicate->arguments) {
            arguments.push_back(renderValue(argument, depth));
        }

        auto text = dialect_.renderPredicate(predicate->type, predicate->operatorName, arguments);
        if (!text) {
            fail(TranslationErrorKind::UNSUPPORTED_ARGUMENT_TYPE,
                 fmt::format("predicate {}.{} has no rendering", predicate->type, predicate->operatorName));
        }
        return *text;
    }

    std::string renderNested(const Bytecode *bytecode, size_t depth) {
        if (!bytecode) {
            fail(TranslationErrorKind::MALFORMED_BYTECODE, "null nested traversal");
        }
        TranslationLocation enclosing = location_;
        std::string expression = renderTraversal(*bytecode, depth + 1);
        location_ = std::move(enclosing);
        return expression;
    }

    std::string renderCollection(const Collection *collection, size_t depth) {
        if (!collection) {
            fail(TranslationErrorKind::MALFORMED_BYTECODE, "null collection");
        }
        std::vector<std::string> elements;
        elements.reserve(collection->elements.size());
        for (const auto &element : collection->elements) {
            elements.push_back(renderValue(element, depth));
        }
        return collection->kind == Collection::Kind::SET ? dialect_.renderSet(elements)
                                                         : dialect_.renderList(elements);
    }

    std::string renderMap(const MapValue *map, size_t depth) {
        if (!map) {
            fail(TranslationErrorKind::MALFORMED_BYTECODE, "null map");
        }
        std::vector<RenderedEntry> entries;
        entries.reserve(map->entries.size());
        for (const auto &[key, value] : map->entries) {
            RenderedEntry entry;
            entry.key = renderValue(key, depth, &entry.stringKey);
            entry.value = renderValue(value, depth);
            entries.push_back(std::move(entry));
        }
        return dialect_.renderMap(entries);
    }

    std::string renderObject(const OpaqueObject *object) {
        if (!object) {
            fail(TranslationErrorKind::MALFORMED_BYTECODE, "null object");
        }
        fail(TranslationErrorKind::UNSUPPORTED_ARGUMENT_TYPE,
             fmt::format("no rendering for object of type '{}' ({})", object->getTypeName(), object->describe()));
    }

    static bool isPredicate(const Value &value) {
        const auto *predicate = std::get_if<std::shared_ptr<const Predicate>>(&value);
        return predicate && *predicate;
    }

    [[noreturn]] void fail(TranslationErrorKind kind, const std::string &detail) const {
        throw TranslationException(kind, detail, dialect_.getTargetLanguage(), location_);
    }

    const std::string &traversalSource_;
    const IScriptDialect &dialect_;
    const TypeTranslator &typeTranslator_;
    const OperationCatalog &catalog_;
    TranslationLocation location_;
};

}  // namespace

ScriptTranslator::ScriptTranslator(std::string traversalSource, std::shared_ptr<const IScriptDialect> dialect,
                                   TypeTranslator typeTranslator, const OperationCatalog &catalog)
    : traversalSource_(std::move(traversalSource)), dialect_(std::move(dialect)),
      typeTranslator_(std::move(typeTranslator)), catalog_(catalog) {
    if (traversalSource_.empty()) {
        throw std::invalid_argument("ScriptTranslator: traversal source name must not be empty");
    }
    if (!dialect_) {
        throw std::invalid_argument("ScriptTranslator: dialect must not be null");
    }
}

std::string ScriptTranslator::getTraversalSource() const {
    return traversalSource_;
}

std::string ScriptTranslator::getTargetLanguage() const {
    return dialect_->getTargetLanguage();
}

std::string ScriptTranslator::translate(const Bytecode &bytecode) const {
    LOG_DEBUG("Translating {} source and {} step instructions to {}", bytecode.getSourceInstructions().size(),
              bytecode.getStepInstructions().size(), getTargetLanguage());

    try {
        ScriptWalker walker(traversalSource_, *dialect_, typeTranslator_, catalog_);
        std::string script = walker.renderTraversal(bytecode, 0);
        LOG_TRACE("Translated script: {}", script);
        return script;
    } catch (const TranslationException &e) {
        LOG_ERROR("{}", e.what());
        throw;
    }
}

}  // namespace TRV
