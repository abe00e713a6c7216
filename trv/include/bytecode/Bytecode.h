#pragma once

#include "bytecode/Value.h"
#include <string>
#include <utility>
#include <vector>

namespace TRV {

/**
 * @brief One operation invocation: operator name plus ordered arguments
 */
class Instruction {
public:
    Instruction(std::string operatorName, std::vector<Value> arguments = {});

    const std::string &getOperator() const {
        return operator_;
    }

    const std::vector<Value> &getArguments() const {
        return arguments_;
    }

    bool operator==(const Instruction &other) const;

    std::string toString() const;

private:
    std::string operator_;
    std::vector<Value> arguments_;
};

/**
 * @brief Language-neutral recording of a traversal
 *
 * Source instructions configure the traversal source; step instructions are
 * the traversal steps. Both lists keep insertion order. Translators only
 * read bytecode.
 */
class Bytecode {
public:
    Bytecode() = default;

    Bytecode &addSource(const std::string &operatorName, std::vector<Value> arguments = {});
    Bytecode &addStep(const std::string &operatorName, std::vector<Value> arguments = {});

    const std::vector<Instruction> &getSourceInstructions() const {
        return sourceInstructions_;
    }

    const std::vector<Instruction> &getStepInstructions() const {
        return stepInstructions_;
    }

    bool isEmpty() const {
        return sourceInstructions_.empty() && stepInstructions_.empty();
    }

    /**
     * @brief All bindings reachable from this bytecode, nested bytecode included
     *
     * Ordered by first occurrence; a variable bound twice is reported once.
     */
    std::vector<std::pair<std::string, Value>> getBindings() const;

    bool operator==(const Bytecode &other) const;

    std::string toString() const;

private:
    std::vector<Instruction> sourceInstructions_;
    std::vector<Instruction> stepInstructions_;
};

}  // namespace TRV
