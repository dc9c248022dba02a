#include "../operand_stack.hpp"
#include <gtest/gtest.h>

using namespace weft;

TEST(OperandStack, PushPopKeepsValues) {
    OperandStack stack;
    stack.push(valtype::i32, 3);
    stack.push(valtype::f64, 7);

    auto popped = stack.pop(valtype_vector{valtype::i32, valtype::f64});
    ASSERT_EQ(popped.size(), 2u);
    EXPECT_EQ(popped[0].type, valtype::i32);
    EXPECT_EQ(popped[0].value, 3u);
    EXPECT_EQ(popped[1].value, 7u);
    EXPECT_EQ(stack.height(), 0u);
}

TEST(OperandStack, MismatchReportsBothSides) {
    OperandStack stack;
    stack.push(valtype::f32);

    try {
        stack.pop(valtype_vector{valtype::i32});
        FAIL() << "expected a type mismatch";
    } catch (type_mismatch_error &e) {
        EXPECT_EQ(e.info.kind, ErrorKind::type_mismatch);
        ASSERT_TRUE(e.info.expected.has_value());
        ASSERT_TRUE(e.info.actual.has_value());
        EXPECT_EQ(*e.info.expected, valtype_vector{valtype::i32});
        EXPECT_EQ(*e.info.actual, valtype_vector{valtype::f32});
    }
}

TEST(OperandStack, UnderflowBelowFloor) {
    OperandStack stack;
    stack.push(valtype::i32);
    stack.enter({});

    EXPECT_THROW(stack.pop(), type_mismatch_error);
    EXPECT_THROW(stack.pop(valtype::i32), type_mismatch_error);
}

TEST(OperandStack, PolymorphicStackConjuresOperands) {
    OperandStack stack;
    stack.polymorphize();

    auto any = stack.pop();
    EXPECT_EQ(any.type, valtype::any);
    EXPECT_EQ(any.value, no_value);

    auto typed = stack.pop(valtype_vector{valtype::i64, valtype::f32});
    EXPECT_EQ(typed[0].type, valtype::i64);
    EXPECT_EQ(typed[1].type, valtype::f32);
    EXPECT_EQ(stack.back(), valtype::any);
}

TEST(OperandStack, EnterAndLeaveRestoreTheFrame) {
    OperandStack stack;
    stack.push(valtype::i64, 1);
    stack.push(valtype::i32, 2);

    auto mark = stack.enter({valtype::i32});
    EXPECT_EQ(stack.floor(), 1u);
    EXPECT_EQ(stack.height(), 2u);
    EXPECT_EQ(stack.back(), valtype::i32);

    stack.polymorphize();
    EXPECT_EQ(stack.height(), 1u);
    EXPECT_TRUE(stack.polymorphism());

    stack.leave(mark);
    EXPECT_EQ(stack.mark().height, 1u);
    EXPECT_EQ(stack.floor(), 0u);
    EXPECT_EQ(stack.height(), 1u);
    EXPECT_FALSE(stack.polymorphism());
    EXPECT_EQ(stack.back(), valtype::i64);
}

TEST(OperandStack, ExactlyLooksOnlyAboveTheFloor) {
    OperandStack stack;
    stack.push(valtype::f32);
    stack.enter({});
    stack.push(valtype::i32);

    EXPECT_TRUE(stack.exactly(valtype_vector{valtype::i32}));
    EXPECT_FALSE(stack.exactly(valtype_vector{}));
    EXPECT_FALSE(stack.exactly(valtype_vector{valtype::f32, valtype::i32}));

    stack.polymorphize();
    EXPECT_TRUE(stack.exactly(valtype_vector{valtype::f32, valtype::i32}));
}

TEST(OperandStack, ResetDropsEverythingAboveTheFloor) {
    OperandStack stack;
    stack.push(valtype::i32, 0);
    stack.enter({});
    stack.push(valtype::i64, 1);
    stack.polymorphize();

    stack.reset({valtype::f32, valtype::f64}, {4, 5});
    EXPECT_FALSE(stack.polymorphism());
    EXPECT_EQ(stack.values_above(stack.floor()),
              (valtype_vector{valtype::f32, valtype::f64}));

    auto operands = stack.operands_above(stack.floor());
    ASSERT_EQ(operands.size(), 2u);
    EXPECT_EQ(operands[0].value, 4u);
    EXPECT_EQ(operands[1].value, 5u);
}
