#include "operand_stack.hpp"

namespace weft {

void OperandStack::push(valtype type, ValueId value) {
    operands.push_back(Operand{type, value});
}

Operand OperandStack::pop() {
    if (height() == floor_) {
        if (polymorphized)
            return Operand{valtype::any, no_value};
        error<type_mismatch_error>("type mismatch: operand stack underflow");
    }
    auto operand = operands.back();
    operands.pop_back();
    return operand;
}

Operand OperandStack::pop(valtype expected) {
    if (height() == floor_ && polymorphized)
        return Operand{expected, no_value};
    if (height() == floor_)
        error<type_mismatch_error>("type mismatch: operand stack underflow",
                                   valtype_vector{expected}, valtype_vector{});

    auto actual = operands.back().type;
    if (actual != expected && actual != valtype::any)
        error<type_mismatch_error>("type mismatch", valtype_vector{expected},
                                   valtype_vector{actual});
    auto operand = pop();
    operand.type = expected;
    return operand;
}

valtype OperandStack::back() const {
    if (height() == floor_)
        return polymorphized ? valtype::any : valtype::null;
    return operands.back().type;
}

StackMark OperandStack::enter(const valtype_vector &params) {
    auto args = pop(params);
    auto saved = mark();
    floor_ = height();
    polymorphized = false;
    for (auto &arg : args)
        operands.push_back(arg);
    return saved;
}

void OperandStack::leave(const StackMark &mark) {
    operands.resize(mark.height);
    floor_ = mark.floor;
    polymorphized = mark.polymorphized;
}

void OperandStack::reset(const valtype_vector &types,
                         const std::vector<ValueId> &values) {
    operands.resize(floor_);
    polymorphized = false;
    for (size_t i = 0; i < types.size(); ++i)
        push(types[i], i < values.size() ? values[i] : no_value);
}

void OperandStack::polymorphize() {
    operands.resize(floor_);
    polymorphized = true;
}

valtype_vector OperandStack::values_above(uint32_t height) const {
    valtype_vector types;
    for (auto i = height; i < operands.size(); ++i)
        types.push_back(operands[i].type);
    return types;
}

std::vector<Operand> OperandStack::operands_above(uint32_t height) const {
    return std::vector<Operand>(operands.begin() + height, operands.end());
}

} // namespace weft
