#include <gtest/gtest.h>
#include "config/config.hpp"
#include "common/errors.hpp"

#include <filesystem>
#include <fstream>

using namespace attrtools;

TEST(ConfigTest, EmptyDocumentKeepsDefaults) {
    AttributionConfig c = parseConfig("");
    EXPECT_EQ(c.log_level, "info");
    EXPECT_EQ(c.training.samples_per_label, 100);
    EXPECT_DOUBLE_EQ(c.training.test_size, 0.2);
    EXPECT_EQ(c.training.random_seed, 27u);
    EXPECT_DOUBLE_EQ(c.training.nb_alpha, 1.0);
    EXPECT_EQ(c.training.averaging, Averaging::Weighted);
    EXPECT_EQ(c.training.generator.size_min, 10);
    EXPECT_EQ(c.training.generator.size_max, 50);
    EXPECT_EQ(c.version_part, VersionPart::Patch);
    EXPECT_EQ(c.top_n, 3u);
}

TEST(ConfigTest, FullDocument) {
    AttributionConfig c = parseConfig(R"(
logging:
  level: debug
training:
  samples_per_label: 250
  test_size: 0.25
  random_seed: 99
  nb_alpha: 0.5
  averaging: macro
  version_part: minor
generator:
  size_min: 5
  size_max: 20
prediction:
  top_n: 5
)");
    EXPECT_EQ(c.log_level, "debug");
    EXPECT_EQ(c.training.samples_per_label, 250);
    EXPECT_DOUBLE_EQ(c.training.test_size, 0.25);
    EXPECT_EQ(c.training.random_seed, 99u);
    EXPECT_DOUBLE_EQ(c.training.nb_alpha, 0.5);
    EXPECT_EQ(c.training.averaging, Averaging::Macro);
    EXPECT_EQ(c.version_part, VersionPart::Minor);
    EXPECT_EQ(c.training.generator.size_min, 5);
    EXPECT_EQ(c.training.generator.size_max, 20);
    EXPECT_EQ(c.top_n, 5u);
}

TEST(ConfigTest, PartialSectionsKeepOtherDefaults) {
    AttributionConfig c = parseConfig("training:\n  nb_alpha: 2.0\n");
    EXPECT_DOUBLE_EQ(c.training.nb_alpha, 2.0);
    EXPECT_EQ(c.training.samples_per_label, 100);
    EXPECT_EQ(c.top_n, 3u);
}

TEST(ConfigTest, RejectsInvalidValues) {
    EXPECT_THROW(parseConfig("logging:\n  level: chatty\n"), InputFormatError);
    EXPECT_THROW(parseConfig("training:\n  samples_per_label: 0\n"), InputFormatError);
    EXPECT_THROW(parseConfig("training:\n  samples_per_label: many\n"), InputFormatError);
    EXPECT_THROW(parseConfig("training:\n  test_size: 1.0\n"), InputFormatError);
    EXPECT_THROW(parseConfig("training:\n  nb_alpha: 0\n"), InputFormatError);
    EXPECT_THROW(parseConfig("training:\n  averaging: micro\n"), InputFormatError);
    EXPECT_THROW(parseConfig("training:\n  version_part: build\n"), InputFormatError);
    EXPECT_THROW(parseConfig("generator:\n  size_min: 30\n  size_max: 30\n"), InputFormatError);
    EXPECT_THROW(parseConfig("prediction:\n  top_n: 0\n"), InputFormatError);
}

TEST(ConfigTest, RejectsMalformedDocuments) {
    EXPECT_THROW(parseConfig("training: [unclosed"), InputFormatError);
    EXPECT_THROW(parseConfig("- just\n- a list\n"), InputFormatError);
}

TEST(ConfigTest, LoadFromFile) {
    auto path = std::filesystem::temp_directory_path() / "attrtools_config_test.yaml";
    {
        std::ofstream out(path);
        out << "prediction:\n  top_n: 7\n";
    }
    AttributionConfig c = loadConfig(path.string());
    EXPECT_EQ(c.top_n, 7u);
    std::filesystem::remove(path);
}

TEST(ConfigTest, LoadMissingFileThrows) {
    EXPECT_THROW(loadConfig("/nonexistent/attrtools/config.yaml"), InputFormatError);
}
