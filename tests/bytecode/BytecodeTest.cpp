#include "bytecode/Bytecode.h"
#include <gtest/gtest.h>

using namespace TRV;

class BytecodeTest : public ::testing::Test {
protected:
    Bytecode createModernQuery() {
        Bytecode bytecode;
        bytecode.addSource("withSack", {Values::integer(1)})
            .addStep("V")
            .addStep("has", {Values::string("name"), Values::string("marko")})
            .addStep("values", {Values::string("age")});
        return bytecode;
    }
};

TEST_F(BytecodeTest, KeepsInstructionOrder) {
    Bytecode bytecode = createModernQuery();

    ASSERT_EQ(1u, bytecode.getSourceInstructions().size());
    ASSERT_EQ(3u, bytecode.getStepInstructions().size());
    EXPECT_EQ("withSack", bytecode.getSourceInstructions()[0].getOperator());
    EXPECT_EQ("V", bytecode.getStepInstructions()[0].getOperator());
    EXPECT_EQ("has", bytecode.getStepInstructions()[1].getOperator());
    EXPECT_EQ("values", bytecode.getStepInstructions()[2].getOperator());
}

TEST_F(BytecodeTest, EmptyBytecode) {
    Bytecode bytecode;
    EXPECT_TRUE(bytecode.isEmpty());

    bytecode.addStep("V");
    EXPECT_FALSE(bytecode.isEmpty());
}

TEST_F(BytecodeTest, StructuralEquality) {
    EXPECT_EQ(createModernQuery(), createModernQuery());

    Bytecode other = createModernQuery();
    other.addStep("count");
    EXPECT_FALSE(createModernQuery() == other);
}

TEST_F(BytecodeTest, ToStringListsSourcesAndSteps) {
    EXPECT_EQ("[[withSack(1)], [V(), has(name, marko), values(age)]]", createModernQuery().toString());

    Bytecode stepsOnly;
    stepsOnly.addStep("V").addStep("count");
    EXPECT_EQ("[[V(), count()]]", stepsOnly.toString());
}

TEST_F(BytecodeTest, CollectsBindingsInFirstOccurrenceOrder) {
    Bytecode nested;
    nested.addStep("has", {Values::string("age"), Values::p("gt", {Values::binding("minAge", Values::integer(30))})});

    Bytecode bytecode;
    bytecode.addStep("V", {Values::binding("id", Values::integer(1))})
        .addStep("where", {Values::bytecode(nested)})
        .addStep("has", {Values::string("name"), Values::binding("id", Values::integer(1))});

    auto bindings = bytecode.getBindings();
    ASSERT_EQ(2u, bindings.size());
    EXPECT_EQ("id", bindings[0].first);
    EXPECT_TRUE(Values::equals(Values::integer(1), bindings[0].second));
    EXPECT_EQ("minAge", bindings[1].first);
    EXPECT_TRUE(Values::equals(Values::integer(30), bindings[1].second));
}
