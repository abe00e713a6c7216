#include "bytecode/Bytecode.h"
#include "common/Overloaded.h"
#include <algorithm>

namespace TRV {

Instruction::Instruction(std::string operatorName, std::vector<Value> arguments)
    : operator_(std::move(operatorName)), arguments_(std::move(arguments)) {}

bool Instruction::operator==(const Instruction &other) const {
    if (operator_ != other.operator_ || arguments_.size() != other.arguments_.size()) {
        return false;
    }
    for (size_t i = 0; i < arguments_.size(); ++i) {
        if (!Values::equals(arguments_[i], other.arguments_[i])) {
            return false;
        }
    }
    return true;
}

std::string Instruction::toString() const {
    std::string result = operator_ + "(";
    for (size_t i = 0; i < arguments_.size(); ++i) {
        if (i > 0) {
            result += ", ";
        }
        result += Values::toString(arguments_[i]);
    }
    return result + ")";
}

Bytecode &Bytecode::addSource(const std::string &operatorName, std::vector<Value> arguments) {
    sourceInstructions_.emplace_back(operatorName, std::move(arguments));
    return *this;
}

Bytecode &Bytecode::addStep(const std::string &operatorName, std::vector<Value> arguments) {
    stepInstructions_.emplace_back(operatorName, std::move(arguments));
    return *this;
}

namespace {

using BindingList = std::vector<std::pair<std::string, Value>>;

void collectBindings(const Bytecode &bytecode, BindingList &bindings);

void collectBindings(const Value &value, BindingList &bindings) {
    std::visit(Overloaded{
                   [](std::monostate) {},
                   [](bool) {},
                   [](int32_t) {},
                   [](int64_t) {},
                   [](double) {},
                   [](const std::string &) {},
                   [](const EnumSymbol &) {},
                   [&bindings](const std::shared_ptr<const Binding> &binding) {
                       if (!binding) {
                           return;
                       }
                       bool known = std::any_of(bindings.begin(), bindings.end(),
                                                [&binding](const auto &entry) { return entry.first == binding->variable; });
                       if (!known) {
                           bindings.emplace_back(binding->variable, binding->value);
                       }
                       collectBindings(binding->value, bindings);
                   },
                   [&bindings](const std::shared_ptr<const Predicate> &predicate) {
                       if (predicate) {
                           for (const auto &argument : predicate->arguments) {
                               collectBindings(argument, bindings);
                           }
                       }
                   },
                   [&bindings](const std::shared_ptr<const Bytecode> &nested) {
                       if (nested) {
                           collectBindings(*nested, bindings);
                       }
                   },
                   [&bindings](const std::shared_ptr<const Collection> &collection) {
                       if (collection) {
                           for (const auto &element : collection->elements) {
                               collectBindings(element, bindings);
                           }
                       }
                   },
                   [&bindings](const std::shared_ptr<const MapValue> &map) {
                       if (map) {
                           for (const auto &[key, entryValue] : map->entries) {
                               collectBindings(key, bindings);
                               collectBindings(entryValue, bindings);
                           }
                       }
                   },
                   [](const std::shared_ptr<const OpaqueObject> &) {},
               },
               value);
}

void collectBindings(const std::vector<Instruction> &instructions, BindingList &bindings) {
    for (const auto &instruction : instructions) {
        for (const auto &argument : instruction.getArguments()) {
            collectBindings(argument, bindings);
        }
    }
}

void collectBindings(const Bytecode &bytecode, BindingList &bindings) {
    collectBindings(bytecode.getSourceInstructions(), bindings);
    collectBindings(bytecode.getStepInstructions(), bindings);
}

std::string joinInstructions(const std::vector<Instruction> &instructions) {
    std::string result = "[";
    for (size_t i = 0; i < instructions.size(); ++i) {
        if (i > 0) {
            result += ", ";
        }
        result += instructions[i].toString();
    }
    return result + "]";
}

}  // namespace

std::vector<std::pair<std::string, Value>> Bytecode::getBindings() const {
    BindingList bindings;
    collectBindings(*this, bindings);
    return bindings;
}

bool Bytecode::operator==(const Bytecode &other) const {
    return sourceInstructions_ == other.sourceInstructions_ && stepInstructions_ == other.stepInstructions_;
}

std::string Bytecode::toString() const {
    if (sourceInstructions_.empty()) {
        return "[" + joinInstructions(stepInstructions_) + "]";
    }
    return "[" + joinInstructions(sourceInstructions_) + ", " + joinInstructions(stepInstructions_) + "]";
}

}  // namespace TRV
