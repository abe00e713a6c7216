#include "bytecode/Bytecode.h"
#include "bytecode/Value.h"
#include "common/TestUtils.h"
#include <cmath>
#include <gtest/gtest.h>
#include <limits>

using namespace TRV;
using TRV::Test::Utils::geoPoint;

TEST(ValueTest, KindNamesIdentifyAlternatives) {
    EXPECT_EQ("null", Values::kindName(Values::null()));
    EXPECT_EQ("boolean", Values::kindName(Values::boolean(true)));
    EXPECT_EQ("integer", Values::kindName(Values::integer(29)));
    EXPECT_EQ("long", Values::kindName(Values::longValue(29)));
    EXPECT_EQ("double", Values::kindName(Values::real(1.5)));
    EXPECT_EQ("string", Values::kindName(Values::string("marko")));
    EXPECT_EQ("enum", Values::kindName(Values::enumSymbol("T", "id")));
    EXPECT_EQ("binding", Values::kindName(Values::binding("x", Values::integer(1))));
    EXPECT_EQ("predicate", Values::kindName(Values::p("gt", {Values::integer(30)})));
    EXPECT_EQ("bytecode", Values::kindName(Values::bytecode(Bytecode().addStep("out"))));
    EXPECT_EQ("list", Values::kindName(Values::list({})));
    EXPECT_EQ("set", Values::kindName(Values::set({})));
    EXPECT_EQ("map", Values::kindName(Values::map({})));
    EXPECT_EQ("GeoPoint", Values::kindName(geoPoint(1.0, 2.0)));
}

TEST(ValueTest, IntegerAndLongAreDistinct) {
    EXPECT_FALSE(Values::equals(Values::integer(29), Values::longValue(29)));
    EXPECT_TRUE(Values::equals(Values::longValue(29), Values::longValue(29)));
}

TEST(ValueTest, NaNEqualsNaN) {
    double nan = std::numeric_limits<double>::quiet_NaN();
    EXPECT_TRUE(Values::equals(Values::real(nan), Values::real(nan)));
    EXPECT_FALSE(Values::equals(Values::real(nan), Values::real(1.0)));
}

TEST(ValueTest, DeepEqualityOfNestedStructures) {
    auto build = [] {
        return Values::map({{Values::string("friends"),
                             Values::list({Values::string("josh"), Values::bytecode(Bytecode().addStep(
                                                                       "out", {Values::string("knows")}))})},
                            {Values::enumSymbol("T", "label"), Values::p("within", {Values::string("person")})}});
    };

    EXPECT_TRUE(Values::equals(build(), build()));

    auto different = Values::map({{Values::string("friends"), Values::list({Values::string("josh")})}});
    EXPECT_FALSE(Values::equals(build(), different));
}

TEST(ValueTest, ListAndSetWithSameElementsDiffer) {
    EXPECT_FALSE(Values::equals(Values::list({Values::integer(1)}), Values::set({Values::integer(1)})));
}

TEST(ValueTest, OpaqueObjectsCompareThroughEquals) {
    EXPECT_TRUE(Values::equals(geoPoint(1.0, 2.0), geoPoint(1.0, 2.0)));
    EXPECT_FALSE(Values::equals(geoPoint(1.0, 2.0), geoPoint(2.0, 1.0)));
}

TEST(ValueTest, ConnectiveTakesTypeFromLeftOperand) {
    auto value = Values::connective("and", Values::textP("containing", {Values::string("a")}),
                                    Values::textP("endingWith", {Values::string("o")}));

    const auto &predicate = std::get<std::shared_ptr<const Predicate>>(value);
    EXPECT_EQ("TextP", predicate->type);
    EXPECT_EQ("and", predicate->operatorName);
    EXPECT_TRUE(predicate->isConnective());
    ASSERT_EQ(2u, predicate->arguments.size());
}

TEST(ValueTest, ToStringDescribesValues) {
    EXPECT_EQ("T.id", Values::toString(Values::enumSymbol("T", "id")));
    EXPECT_EQ("[1, 2]", Values::toString(Values::list({Values::integer(1), Values::integer(2)})));
    EXPECT_EQ("gt(30)", Values::toString(Values::p("gt", {Values::integer(30)})));
}
