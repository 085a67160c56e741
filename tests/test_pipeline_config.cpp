#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "../src/core/NeuroParcelExceptions.h"
#include "../src/mask/PipelineConfig.h"

using namespace neuroparcel;
using namespace neuroparcel::mask;

class PipelineConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir = std::filesystem::temp_directory_path() / "neuroparcel_config_test";
        std::filesystem::create_directories(test_dir);
    }

    void TearDown() override {
        if (std::filesystem::exists(test_dir)) {
            std::filesystem::remove_all(test_dir);
        }
    }

    std::string WriteConfig(const std::string& content) {
        std::string filename = (test_dir / "neuroparcel.conf").string();
        std::ofstream file(filename);
        file << content;
        file.close();
        return filename;
    }

    std::filesystem::path test_dir;
};

TEST_F(PipelineConfigTest, DefaultsMatchMouseAtlasCleanup) {
    PipelineConfig config;

    EXPECT_EQ(config.input_mask, "registered_atlas_original_orientation.tiff");
    EXPECT_EQ(config.output_mask, "adjusted_mask.tiff");
    EXPECT_EQ(config.whole_brain_mask, "whole_brain_mask.tiff");
    EXPECT_EQ(config.label_csv, "used_region_ids.csv");
    EXPECT_EQ(config.fragment_csv, "region_fragments_with_sizes.csv");
    EXPECT_EQ(config.min_fragment_size, 50u);
    EXPECT_EQ(config.max_label_value, 65535u);
    EXPECT_EQ(config.connectivity, 6);
    EXPECT_FALSE(config.verbose);

    ASSERT_EQ(config.rules.flatten.size(), 10u);
    EXPECT_EQ(config.rules.flatten.front(), "fiber tracts");
    EXPECT_EQ(config.rules.flatten.back(), "CTXsp");
    ASSERT_EQ(config.rules.flatten_to_depth.size(), 2u);
    EXPECT_EQ(config.rules.flatten_to_depth[0].acronym, "Isocortex");
    EXPECT_EQ(config.rules.flatten_to_depth[0].depth, 1);
    EXPECT_EQ(config.rules.exclude, (std::vector<std::string>{"fiber tracts", "root"}));

    EXPECT_NO_THROW(ValidatePipelineConfig(config));
}

TEST_F(PipelineConfigTest, LoadsKeyValueFile) {
    std::string filename = WriteConfig(
        "# cleanup for a coarse atlas\n"
        "\n"
        "input_mask = annotation.nii.gz\n"
        "flatten = fiber tracts, CB ,HB\n"
        "flatten_to_depth = Isocortex:2, OLF:1   # keep layers\n"
        "exclude = root\n"
        "min_fragment_size = 10\n"
        "max_label_value = 255\n"
        "connectivity = 26\n"
        "verbose = true\n");

    PipelineConfig config = LoadPipelineConfig(filename);

    EXPECT_EQ(config.input_mask, "annotation.nii.gz");
    EXPECT_EQ(config.output_mask, "adjusted_mask.tiff");
    EXPECT_EQ(config.rules.flatten, (std::vector<std::string>{"fiber tracts", "CB", "HB"}));
    ASSERT_EQ(config.rules.flatten_to_depth.size(), 2u);
    EXPECT_EQ(config.rules.flatten_to_depth[0].acronym, "Isocortex");
    EXPECT_EQ(config.rules.flatten_to_depth[0].depth, 2);
    EXPECT_EQ(config.rules.flatten_to_depth[1].acronym, "OLF");
    EXPECT_EQ(config.rules.exclude, (std::vector<std::string>{"root"}));
    EXPECT_EQ(config.min_fragment_size, 10u);
    EXPECT_EQ(config.max_label_value, 255u);
    EXPECT_EQ(config.connectivity, 26);
    EXPECT_TRUE(config.verbose);
}

TEST_F(PipelineConfigTest, EmptyListsDisableRules) {
    PipelineConfig config = LoadPipelineConfig(WriteConfig("flatten =\nexclude =\n"));

    EXPECT_TRUE(config.rules.flatten.empty());
    EXPECT_TRUE(config.rules.exclude.empty());
    EXPECT_EQ(config.rules.flatten_to_depth.size(), 2u);
}

TEST_F(PipelineConfigTest, MalformedEntriesThrow) {
    EXPECT_THROW(LoadPipelineConfig(WriteConfig("colour = blue\n")), ConfigurationException);
    EXPECT_THROW(LoadPipelineConfig(WriteConfig("min_fragment_size\n")), ConfigurationException);
    EXPECT_THROW(LoadPipelineConfig(WriteConfig("min_fragment_size = -4\n")),
                 ConfigurationException);
    EXPECT_THROW(LoadPipelineConfig(WriteConfig("min_fragment_size = 12abc\n")),
                 ConfigurationException);
    EXPECT_THROW(LoadPipelineConfig(WriteConfig("flatten_to_depth = Isocortex\n")),
                 ConfigurationException);
    EXPECT_THROW(LoadPipelineConfig(WriteConfig("flatten_to_depth = Isocortex:one\n")),
                 ConfigurationException);
    EXPECT_THROW(LoadPipelineConfig(WriteConfig("verbose = maybe\n")), ConfigurationException);
    EXPECT_THROW(LoadPipelineConfig((test_dir / "missing.conf").string()),
                 ConfigurationException);
}

TEST_F(PipelineConfigTest, ValidationRejectsUnusableSettings) {
    PipelineConfig config;
    config.max_label_value = 70000;
    EXPECT_THROW(ValidatePipelineConfig(config), ConfigurationException);

    config = PipelineConfig();
    config.max_label_value = 0;
    EXPECT_THROW(ValidatePipelineConfig(config), ConfigurationException);

    config = PipelineConfig();
    config.connectivity = 8;
    EXPECT_THROW(ValidatePipelineConfig(config), ConfigurationException);

    config = PipelineConfig();
    config.output_mask.clear();
    EXPECT_THROW(ValidatePipelineConfig(config), ConfigurationException);

    config = PipelineConfig();
    config.rules.flatten_to_depth = {{"Isocortex", 0}};
    EXPECT_THROW(ValidatePipelineConfig(config), ConfigurationException);
}

TEST_F(PipelineConfigTest, SetConfigValueOverridesSingleKeys) {
    PipelineConfig config;
    SetConfigValue(config, "structures", " atlas/structures.csv ");
    SetConfigValue(config, "min_fragment_size", "0");

    EXPECT_EQ(config.structures, "atlas/structures.csv");
    EXPECT_EQ(config.min_fragment_size, 0u);
    EXPECT_THROW(SetConfigValue(config, "connectivity", "27"), ConfigurationException);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
