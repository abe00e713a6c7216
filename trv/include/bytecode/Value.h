#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace TRV {

class Bytecode;

/**
 * @brief Caller-defined typed argument with no built-in rendering
 *
 * Script translation fails on an OpaqueObject unless a TypeTranslator
 * handles or substitutes it. Step translation passes it to the engine as is.
 */
class OpaqueObject {
public:
    virtual ~OpaqueObject() = default;

    /**
     * @brief Stable type name used by TypeTranslators and error messages
     */
    virtual std::string getTypeName() const = 0;

    /**
     * @brief Human readable form for diagnostics
     */
    virtual std::string describe() const = 0;

    virtual bool equals(const OpaqueObject &other) const = 0;
};

/**
 * @brief Symbolic constant such as T.id or Order.desc
 */
struct EnumSymbol {
    std::string type;
    std::string name;

    bool operator==(const EnumSymbol &other) const = default;
};

struct Binding;
struct Predicate;
struct Collection;
struct MapValue;

/**
 * @brief Instruction argument
 *
 * Alternatives, in index order: null, boolean, integer (32 bit), long
 * (64 bit), double, string, enum symbol, binding, predicate, nested
 * bytecode, list/set, map, opaque object.
 */
using Value = std::variant<std::monostate, bool, int32_t, int64_t, double, std::string, EnumSymbol,
                           std::shared_ptr<const Binding>, std::shared_ptr<const Predicate>,
                           std::shared_ptr<const Bytecode>, std::shared_ptr<const Collection>,
                           std::shared_ptr<const MapValue>, std::shared_ptr<const OpaqueObject>>;

/**
 * @brief Named parameter; scripts reference the variable, steps use the value
 */
struct Binding {
    std::string variable;
    Value value;
};

/**
 * @brief P / TextP predicate, e.g. P.gt(30) or TextP.containing("ark")
 *
 * "and" and "or" are connectives whose two arguments are predicates.
 */
struct Predicate {
    std::string type;
    std::string operatorName;
    std::vector<Value> arguments;

    bool isConnective() const {
        return operatorName == "and" || operatorName == "or";
    }
};

struct Collection {
    enum class Kind { LIST, SET };

    Kind kind = Kind::LIST;
    std::vector<Value> elements;
};

// Entries keep insertion order
struct MapValue {
    std::vector<std::pair<Value, Value>> entries;
};

namespace Values {

Value null();
Value boolean(bool value);
Value integer(int32_t value);
Value longValue(int64_t value);
Value real(double value);
Value string(std::string value);
Value enumSymbol(std::string type, std::string name);
Value binding(std::string variable, Value value);
Value predicate(std::string type, std::string operatorName, std::vector<Value> arguments);
Value p(std::string operatorName, std::vector<Value> arguments);
Value textP(std::string operatorName, std::vector<Value> arguments);
Value connective(std::string operatorName, Value left, Value right);
Value bytecode(Bytecode traversal);
Value bytecode(std::shared_ptr<const Bytecode> traversal);
Value list(std::vector<Value> elements);
Value set(std::vector<Value> elements);
Value map(std::vector<std::pair<Value, Value>> entries);
Value object(std::shared_ptr<const OpaqueObject> object);

/**
 * @brief Deep structural equality (nested bytecode, collections, opaque objects)
 */
bool equals(const Value &lhs, const Value &rhs);

/**
 * @brief Name of the held alternative ("string", "bytecode", or the opaque type name)
 */
std::string kindName(const Value &value);

std::string toString(const Value &value);

}  // namespace Values

}  // namespace TRV
