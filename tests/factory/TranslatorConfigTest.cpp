#include "common/JsonUtils.h"
#include "factory/TranslatorConfig.h"
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

using namespace TRV;

TEST(TranslatorConfigTest, MissingKeysFallBackToDefaults) {
    auto config = TranslatorConfig::fromJson("{}");
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ("gremlin-groovy", config->language);
    EXPECT_EQ("g", config->traversalSource);
    EXPECT_TRUE(config->logLevel.empty());
}

TEST(TranslatorConfigTest, ReadsAllKeys) {
    auto config =
        TranslatorConfig::fromJson(R"({"language": "gremlin-python", "traversalSource": "x", "logLevel": "debug"})");
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ("gremlin-python", config->language);
    EXPECT_EQ("x", config->traversalSource);
    EXPECT_EQ("debug", config->logLevel);
}

TEST(TranslatorConfigTest, NullKeysKeepDefaults) {
    auto config = TranslatorConfig::fromJson(R"({"language": null})");
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ("gremlin-groovy", config->language);
}

TEST(TranslatorConfigTest, WrongTypeIsAnError) {
    std::string error;
    auto config = TranslatorConfig::fromJson(R"({"traversalSource": 42})", &error);
    EXPECT_FALSE(config.has_value());
    EXPECT_NE(std::string::npos, error.find("traversalSource"));
}

TEST(TranslatorConfigTest, MalformedJsonIsAnError) {
    std::string error;
    EXPECT_FALSE(TranslatorConfig::fromJson("{\"language\": ", &error).has_value());
    EXPECT_FALSE(error.empty());

    EXPECT_FALSE(TranslatorConfig::fromJson("[1, 2]", &error).has_value());
    EXPECT_NE(std::string::npos, error.find("object"));
}

TEST(TranslatorConfigTest, EmptyValuesAreRejected) {
    std::string error;
    EXPECT_FALSE(TranslatorConfig::fromJson(R"({"traversalSource": ""})", &error).has_value());
    EXPECT_NE(std::string::npos, error.find("traversalSource"));
}

TEST(TranslatorConfigTest, LoadsFromFile) {
    auto path = std::filesystem::temp_directory_path() / "trv_translator_config_test.json";
    {
        std::ofstream file(path);
        file << R"({"language": "gremlin-python", "traversalSource": "graph"})";
    }

    auto config = TranslatorConfig::fromFile(path.string());
    std::filesystem::remove(path);

    ASSERT_TRUE(config.has_value());
    EXPECT_EQ("gremlin-python", config->language);
    EXPECT_EQ("graph", config->traversalSource);
}

TEST(TranslatorConfigTest, MissingFileIsAnError) {
    std::string error;
    EXPECT_FALSE(TranslatorConfig::fromFile("/nonexistent/trv/config.json", &error).has_value());
    EXPECT_NE(std::string::npos, error.find("Cannot open"));
}

TEST(TranslatorConfigTest, JsonRoundTripKeepsSettings) {
    TranslatorConfig original;
    original.language = "gremlin-python";
    original.traversalSource = "x";
    original.logLevel = "warn";

    auto restored = TranslatorConfig::fromJson(JsonUtils::toCompactString(original.toJson()));
    ASSERT_TRUE(restored.has_value());
    EXPECT_EQ(original, *restored);
}
