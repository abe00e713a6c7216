#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace TRV {

enum class OperationPhase {
    SOURCE,  // traversal source configuration (withSack, withSideEffect, ...)
    STEP     // traversal step (V, out, has, ...)
};

// Bit flags describing which argument kinds a parameter position accepts
using ArgumentKinds = uint32_t;

namespace ArgumentKind {
constexpr ArgumentKinds NONE = 0;
constexpr ArgumentKinds NULL_VALUE = 1u << 0;
constexpr ArgumentKinds BOOLEAN = 1u << 1;
constexpr ArgumentKinds NUMBER = 1u << 2;
constexpr ArgumentKinds STRING = 1u << 3;
constexpr ArgumentKinds ENUM = 1u << 4;
constexpr ArgumentKinds PREDICATE = 1u << 5;
constexpr ArgumentKinds TRAVERSAL = 1u << 6;
constexpr ArgumentKinds COLLECTION = 1u << 7;
constexpr ArgumentKinds MAP = 1u << 8;
constexpr ArgumentKinds OBJECT = 1u << 9;

constexpr ArgumentKinds LITERAL = NULL_VALUE | BOOLEAN | NUMBER | STRING;
constexpr ArgumentKinds ANY = LITERAL | ENUM | PREDICATE | TRAVERSAL | COLLECTION | MAP | OBJECT;

std::string describe(ArgumentKinds kinds);
}  // namespace ArgumentKind

/**
 * @brief Arity and parameter kinds of one operation
 *
 * Positions past the positional list take the variadic kinds; a NONE
 * variadic means the operation accepts at most positional.size() arguments.
 */
struct OperationSignature {
    std::string name;
    OperationPhase phase = OperationPhase::STEP;
    size_t minArgs = 0;
    std::vector<ArgumentKinds> positional;
    ArgumentKinds variadic = ArgumentKind::NONE;

    bool acceptsArgumentCount(size_t count) const;

    /**
     * @brief Accepted kinds at an argument position, nullopt past the last accepted position
     */
    std::optional<ArgumentKinds> acceptedKindsAt(size_t index) const;

    std::string describeArity() const;
};

/**
 * @brief Known source operations, traversal steps and enum types of the traversal language
 */
class OperationCatalog {
public:
    static const OperationCatalog &instance();

    /**
     * @return Signature or nullptr for an unknown operation
     */
    const OperationSignature *find(OperationPhase phase, const std::string &name) const;

    bool contains(OperationPhase phase, const std::string &name) const {
        return find(phase, name) != nullptr;
    }

    std::vector<std::string> getOperationNames(OperationPhase phase) const;

    bool isKnownEnumType(const std::string &type) const {
        return enumTypes_.count(type) > 0;
    }

    const std::set<std::string> &getEnumTypes() const {
        return enumTypes_;
    }

    /**
     * @brief Check a P / TextP operator name (connectives "and" and "or" included)
     */
    bool isKnownPredicate(const std::string &type, const std::string &operatorName) const;

private:
    OperationCatalog();

    void add(OperationPhase phase, const std::string &name, size_t minArgs, std::vector<ArgumentKinds> positional,
             ArgumentKinds variadic = ArgumentKind::NONE);

    std::unordered_map<std::string, OperationSignature> sourceOperations_;
    std::unordered_map<std::string, OperationSignature> steps_;
    std::set<std::string> enumTypes_;
    std::set<std::string> predicates_;
    std::set<std::string> textPredicates_;
};

}  // namespace TRV
