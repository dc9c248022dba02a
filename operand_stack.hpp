#pragma once

#include "errors.hpp"
#include "wasm.hpp"
#include <algorithm>
#include <cstdint>
#include <vector>

namespace weft {

struct Operand {
    valtype type;
    ValueId value = no_value;
};

// stack state saved when a control frame is entered
struct StackMark {
    uint32_t height;
    uint32_t floor;
    bool polymorphized;
};

class OperandStack {
    std::vector<Operand> operands;
    uint32_t floor_ = 0;
    bool polymorphized = false;

  public:
    uint32_t height() const { return operands.size(); }
    uint32_t floor() const { return floor_; }
    bool polymorphism() const { return polymorphized; }

    // true if the top of the stack can be typed as expected
    template <typename T> bool check(const T &expected) const;
    // true if the values above the floor are exactly expected
    template <typename T> bool exactly(const T &expected) const;

    void push(valtype type, ValueId value = no_value);
    Operand pop();
    Operand pop(valtype expected);
    template <typename T> std::vector<Operand> pop(const T &expected);

    valtype back() const;

    StackMark mark() const {
        return StackMark{height(), floor_, polymorphized};
    }

    // pops params, records a mark and pushes them back above a new floor
    StackMark enter(const valtype_vector &params);
    void leave(const StackMark &mark);

    // discards everything above the floor and pushes a fresh frame entry
    void reset(const valtype_vector &types, const std::vector<ValueId> &values);
    void polymorphize();

    valtype_vector values_above(uint32_t height) const;
    std::vector<Operand> operands_above(uint32_t height) const;
};

template <typename T> bool OperandStack::check(const T &expected) const {
    auto available = height() - floor_;
    auto n = static_cast<uint32_t>(expected.size());
    for (uint32_t i = 0; i < n; ++i) {
        if (i >= available)
            return polymorphized;
        auto actual = operands[height() - 1 - i].type;
        if (actual != expected[n - 1 - i] && actual != valtype::any)
            return false;
    }
    return true;
}

template <typename T> bool OperandStack::exactly(const T &expected) const {
    if (height() - floor_ > expected.size())
        return false;
    return check(expected);
}

template <typename T>
std::vector<Operand> OperandStack::pop(const T &expected) {
    if (!check(expected)) {
        auto available = height() - floor_;
        auto shown = std::min<uint32_t>(available, expected.size());
        error<type_mismatch_error>(
            "type mismatch", valtype_vector(expected.begin(), expected.end()),
            values_above(height() - shown));
    }

    std::vector<Operand> popped(expected.size());
    for (size_t i = expected.size(); i-- > 0;) {
        popped[i] = pop();
        if (popped[i].type == valtype::any)
            popped[i].type = expected[i];
    }
    return popped;
}

} // namespace weft
