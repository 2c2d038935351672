#include "BaseTestFixture.h"
#include "utils/ConfigFile.h"

using json = nlohmann::json;

class ConfigFileTest : public BaseTestFixture {};

TEST_F(ConfigFileTest, OverridesOnlyGivenKeys) {
    ConversionConfig config;
    ConfigFile::apply(json{{"quality", 42}, {"mime_types", json::array({"png"})}, {"delete", true}}, config);

    EXPECT_EQ(config.quality, 42);
    EXPECT_EQ(config.mimeTypes, (std::vector<std::string>{"png"}));
    EXPECT_TRUE(config.deleteOriginal);
    EXPECT_EQ(config.inputPath, ".");
    EXPECT_EQ(config.targetFormat, "webp");
    EXPECT_EQ(config.skipTypes, (std::vector<std::string>{"image/webp"}));
}

TEST_F(ConfigFileTest, LoadsEveryKeyFromFile) {
    fs::path path = tempDir / "all.json";
    writeBytes(path, R"({
        "path": "in", "output": "out", "quality": 10,
        "mime_types": ["jpeg"], "skip_types": [],
        "delete": true, "target": "png", "jobs": 6, "verbose": true,
        "unrelated": "ignored"
    })");

    ConversionConfig config;
    ConfigFile::load(path, config);

    EXPECT_EQ(config.inputPath, "in");
    EXPECT_EQ(config.outputPath, "out");
    EXPECT_EQ(config.quality, 10);
    EXPECT_EQ(config.mimeTypes, (std::vector<std::string>{"jpeg"}));
    EXPECT_TRUE(config.skipTypes.empty());
    EXPECT_TRUE(config.deleteOriginal);
    EXPECT_EQ(config.targetFormat, "png");
    EXPECT_EQ(config.jobs, 6u);
    EXPECT_TRUE(config.verbose);
}

TEST_F(ConfigFileTest, WrongTypeIsConfigError) {
    ConversionConfig config;
    EXPECT_THROW(ConfigFile::apply(json{{"quality", "high"}}, config), ConfigError);
    EXPECT_THROW(ConfigFile::apply(json{{"mime_types", "png"}}, config), ConfigError);
}

TEST_F(ConfigFileTest, NegativeJobsIsConfigError) {
    ConversionConfig config;
    EXPECT_THROW(ConfigFile::apply(json{{"jobs", -2}}, config), ConfigError);
    EXPECT_THROW(ConfigFile::apply(json{{"jobs", 1.5}}, config), ConfigError);
}

TEST_F(ConfigFileTest, TopLevelMustBeObject) {
    ConversionConfig config;
    EXPECT_THROW(ConfigFile::apply(json::array({1, 2}), config), ConfigError);
}

TEST_F(ConfigFileTest, MalformedJsonIsConfigError) {
    fs::path path = tempDir / "broken.json";
    writeBytes(path, "{ \"quality\": ");

    ConversionConfig config;
    EXPECT_THROW(ConfigFile::load(path, config), ConfigError);
}

TEST_F(ConfigFileTest, MissingFileIsConfigError) {
    ConversionConfig config;
    EXPECT_THROW(ConfigFile::load(tempDir / "absent.json", config), ConfigError);
}

TEST(ConversionConfigTest, ValidateRejectsOutOfRangeQuality) {
    ConversionConfig config;
    EXPECT_NO_THROW(config.validate());

    config.quality = 101;
    EXPECT_THROW(config.validate(), ConfigError);
    config.quality = -1;
    EXPECT_THROW(config.validate(), ConfigError);
    config.quality = 0;
    EXPECT_NO_THROW(config.validate());
}

TEST(ConversionConfigTest, FormatNamesResolveToTags) {
    ConversionConfig config;
    config.mimeTypes = {"JPG", "png", "image/gif"};
    config.targetFormat = "WEBP";

    EXPECT_EQ(config.resolvedMimeTypes(), (std::set<FormatTag>{"image/jpeg", "image/png", "image/gif"}));
    EXPECT_EQ(config.resolvedTarget(), "image/webp");
}

TEST(ConversionConfigTest, UnknownFormatNameIsConfigError) {
    ConversionConfig config;
    config.skipTypes = {"image/xyz"};
    EXPECT_THROW(config.validate(), ConfigError);

    config.skipTypes = {};
    config.targetFormat = "pdf";
    EXPECT_THROW(config.resolvedTarget(), ConfigError);
}
