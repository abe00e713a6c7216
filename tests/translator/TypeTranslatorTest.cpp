#include "common/TestUtils.h"
#include "translator/TypeTranslator.h"
#include <gtest/gtest.h>
#include <stdexcept>

using namespace TRV;
using TRV::Test::Utils::GeoPoint;
using TRV::Test::Utils::geoPoint;

TEST(TypeTranslatorTest, IdentityContinuesForEveryValue) {
    TypeTranslator identity = TypeTranslator::identity();
    EXPECT_TRUE(std::holds_alternative<Continue>(identity(Values::string("marko"))));
    EXPECT_TRUE(std::holds_alternative<Continue>(identity(geoPoint(1.0, 2.0))));
}

TEST(TypeTranslatorTest, EmptyFunctionIsRejected) {
    EXPECT_THROW(TypeTranslator{TypeTranslator::Function{}}, std::invalid_argument);
}

TEST(TypeTranslatorTest, HandledKeepsTextUnchanged) {
    Handled handled("new Date(0)");
    EXPECT_EQ("new Date(0)", handled.getTranslation());
}

TEST(TypeTranslatorTest, OrElseConsultsFallbackOnlyOnContinue) {
    int fallbackCalls = 0;
    TypeTranslator strings([](const Value &value) -> TypeTranslation {
        if (std::holds_alternative<std::string>(value)) {
            return Handled("S");
        }
        return Continue{};
    });
    TypeTranslator fallback([&fallbackCalls](const Value &) -> TypeTranslation {
        ++fallbackCalls;
        return Handled("F");
    });

    TypeTranslator composed = strings.orElse(fallback);

    auto first = composed(Values::string("a"));
    ASSERT_TRUE(std::holds_alternative<Handled>(first));
    EXPECT_EQ("S", std::get<Handled>(first).getTranslation());
    EXPECT_EQ(0, fallbackCalls);

    auto second = composed(Values::integer(1));
    ASSERT_TRUE(std::holds_alternative<Handled>(second));
    EXPECT_EQ("F", std::get<Handled>(second).getTranslation());
    EXPECT_EQ(1, fallbackCalls);
}

TEST(TypeTranslatorTest, ForObjectTypeMatchesTypeName) {
    TypeTranslator points = TypeTranslator::forObjectType("GeoPoint", [](const OpaqueObject &object) -> TypeTranslation {
        const auto &point = dynamic_cast<const GeoPoint &>(object);
        return Substitute{Values::list({Values::real(point.getLatitude()), Values::real(point.getLongitude())})};
    });

    auto translated = points(geoPoint(1.5, 2.5));
    ASSERT_TRUE(std::holds_alternative<Substitute>(translated));
    EXPECT_TRUE(Values::equals(Values::list({Values::real(1.5), Values::real(2.5)}),
                               std::get<Substitute>(translated).value));

    EXPECT_TRUE(std::holds_alternative<Continue>(points(Values::string("GeoPoint"))));
}
