#include "factory/TranslatorFactory.h"
#include "common/Logger.h"
#include <gtest/gtest.h>

using namespace TRV;

class TranslatorFactoryTest : public ::testing::Test {
protected:
    static Bytecode createMarkoAgeQuery() {
        Bytecode bytecode;
        bytecode.addStep("V")
            .addStep("has", {Values::string("name"), Values::string("marko")})
            .addStep("values", {Values::string("age")});
        return bytecode;
    }
};

TEST_F(TranslatorFactoryTest, AvailableLanguages) {
    auto languages = TranslatorFactory::availableLanguages();
    ASSERT_EQ(2u, languages.size());
    EXPECT_TRUE(TranslatorFactory::isSupported("gremlin-groovy"));
    EXPECT_TRUE(TranslatorFactory::isSupported("gremlin-python"));
    EXPECT_FALSE(TranslatorFactory::isSupported("gremlin-cobol"));
}

TEST_F(TranslatorFactoryTest, CreatesTranslatorByLanguage) {
    auto result = TranslatorFactory::createScriptTranslator("gremlin-python", "g");
    ASSERT_TRUE(result.has_value());
    ASSERT_NE(nullptr, result.value);
    EXPECT_EQ("gremlin-python", result.value->getTargetLanguage());
    EXPECT_EQ("g.V().has('name','marko').values('age')", result.value->translate(createMarkoAgeQuery()));
}

TEST_F(TranslatorFactoryTest, UnsupportedLanguageIsReported) {
    auto result = TranslatorFactory::createScriptTranslator("gremlin-cobol", "g");
    EXPECT_FALSE(result);
    EXPECT_NE(std::string::npos, result.error.find("gremlin-cobol"));
    EXPECT_EQ(nullptr, TranslatorFactory::createDialect("gremlin-cobol"));
}

TEST_F(TranslatorFactoryTest, EmptyTraversalSourceIsReported) {
    auto result = TranslatorFactory::createScriptTranslator("gremlin-groovy", "");
    EXPECT_FALSE(result);
    EXPECT_FALSE(result.error.empty());
}

TEST_F(TranslatorFactoryTest, CreatesFromJson) {
    auto result = TranslatorFactory::createFromJson(R"({"traversalSource": "x"})");
    ASSERT_TRUE(result);
    EXPECT_EQ("x.V().has(\"name\",\"marko\").values(\"age\")", result.value->translate(createMarkoAgeQuery()));
}

TEST_F(TranslatorFactoryTest, InvalidJsonIsReported) {
    auto result = TranslatorFactory::createFromJson(R"({"language": 1})");
    EXPECT_FALSE(result);
    EXPECT_NE(std::string::npos, result.error.find("language"));
}

TEST_F(TranslatorFactoryTest, UnknownLogLevelIsReported) {
    TranslatorConfig config;
    config.logLevel = "chatty";
    auto result = TranslatorFactory::createScriptTranslator(config);
    EXPECT_FALSE(result);
    EXPECT_NE(std::string::npos, result.error.find("chatty"));
}

TEST_F(TranslatorFactoryTest, RejectedConfigurationKeepsLogLevel) {
    ASSERT_TRUE(Logger::setLevel("info"));

    TranslatorConfig config;
    config.language = "gremlin-cobol";
    config.logLevel = "trace";
    EXPECT_FALSE(TranslatorFactory::createScriptTranslator(config));
    EXPECT_EQ("info", Logger::getLevel());

    config.language = "gremlin-groovy";
    config.logLevel = "warn";
    EXPECT_TRUE(TranslatorFactory::createScriptTranslator(config));
    EXPECT_EQ("warning", Logger::getLevel());

    Logger::setLevel("info");
}

TEST_F(TranslatorFactoryTest, BuilderPassesTypeTranslator) {
    auto result = TranslatorFactory::builder()
                      .withLanguage("gremlin-groovy")
                      .withTraversalSource("g")
                      .withLogLevel("info")
                      .withTypeTranslator(TypeTranslator([](const Value &value) -> TypeTranslation {
                          if (std::holds_alternative<std::string>(value)) {
                              return Handled("s");
                          }
                          return Continue{};
                      }))
                      .build();

    ASSERT_TRUE(result);
    EXPECT_EQ("g.V().has(s,s).values(s)", result.value->translate(createMarkoAgeQuery()));
}
