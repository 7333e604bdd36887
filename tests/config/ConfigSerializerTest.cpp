#include <gtest/gtest.h>
#include <roadnet/config/ConfigSerializer.h>
#include <roadnet/core/Errors.h>

#include <filesystem>
#include <fstream>

using namespace roadnet;

TEST(ConfigSerializerTest, RoundTrip) {
    NetworkConfig config;
    config.identification.allowLengths({4, 5}).allowCharacters("-");
    config.defaultSpeedLimit = 27.5f;

    NetworkConfig restored = ConfigSerializer::fromJson(ConfigSerializer::toJson(config));
    EXPECT_EQ(restored, config);
}

TEST(ConfigSerializerTest, MissingKeysUseDefaults) {
    NetworkConfig config = ConfigSerializer::fromJson("{}");
    EXPECT_EQ(config, NetworkConfig::createDefault());

    config = ConfigSerializer::fromJson(R"({"identification": {"extraCharacters": "x"}})");
    EXPECT_TRUE(config.identification.extraLengths.empty());
    EXPECT_EQ(config.identification.extraCharacters, "x");
    EXPECT_FLOAT_EQ(config.defaultSpeedLimit, NetworkConfig::DEFAULT_SPEED_LIMIT);
}

TEST(ConfigSerializerTest, ParsesDocument) {
    const char* json = R"({
        "version": 1,
        "identification": { "extraLengths": [4], "extraCharacters": "-" },
        "defaultSpeedLimit": 30.0
    })";

    NetworkConfig config = ConfigSerializer::fromJson(json);
    EXPECT_EQ(config.identification.extraLengths, std::vector<int>{4});
    EXPECT_TRUE(config.identification.isValid("E4-1"));
    EXPECT_FLOAT_EQ(config.defaultSpeedLimit, 30.0f);
}

TEST(ConfigSerializerTest, MalformedJson) {
    EXPECT_THROW(ConfigSerializer::fromJson("{ not json"), std::runtime_error);
    EXPECT_THROW(ConfigSerializer::fromJson(R"({"defaultSpeedLimit": "fast"})"),
                 std::runtime_error);
    EXPECT_THROW(ConfigSerializer::fromJson(R"({"version": 2})"), std::runtime_error);
}

TEST(ConfigSerializerTest, InvalidValues) {
    EXPECT_THROW(ConfigSerializer::fromJson(R"({"identification": {"extraLengths": [0]}})"),
                 InvalidLengthError);
    EXPECT_THROW(ConfigSerializer::fromJson(R"({"defaultSpeedLimit": -1.0})"),
                 InvalidSpeedLimitError);
}

TEST(ConfigSerializerTest, SaveAndLoadFile) {
    auto path = std::filesystem::temp_directory_path() / "roadnet_config_test.json";

    NetworkConfig config;
    config.identification.allowLengths({4});
    config.defaultSpeedLimit = 22.0f;

    ASSERT_TRUE(ConfigSerializer::saveToFile(config, path.string()));
    EXPECT_EQ(ConfigSerializer::loadFromFile(path.string()), config);

    std::filesystem::remove(path);
}

TEST(ConfigSerializerTest, LoadMissingFile) {
    auto path = std::filesystem::temp_directory_path() / "roadnet_config_missing.json";
    std::filesystem::remove(path);

    EXPECT_THROW(ConfigSerializer::loadFromFile(path.string()), std::runtime_error);
}
