#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include "../src/atlas/RegionHierarchy.h"
#include "../src/io/ImageIO.h"
#include "../src/mask/MaskPipeline.h"

using namespace neuroparcel;
using namespace neuroparcel::mask;
using neuroparcel::io::LabelImage;

class MaskPipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir = std::filesystem::temp_directory_path() / "neuroparcel_pipeline_test";
        std::filesystem::create_directories(test_dir);

        std::ofstream structures(test_dir / "structures.csv");
        structures << "acronym,id,name,structure_id_path,rgb_triplet,parent_structure_id\n"
                   << "root,997,root,/997/,\"[255, 255, 255]\",\n"
                   << "grey,8,Basic cell groups and regions,/997/8/,\"[191, 218, 227]\",997\n"
                   << "A,10,Region A,/997/8/10/,\"[1, 2, 3]\",8\n"
                   << "A1,11,Region A1,/997/8/10/11/,\"[1, 2, 3]\",10\n"
                   << "B,20,Region B,/997/8/20/,\"[1, 2, 3]\",8\n"
                   << "SUP,614454277,Supplemental area,/997/8/614454277/,\"[1, 2, 3]\",8\n"
                   << "fiber tracts,1009,fiber tracts,/997/1009/,\"[1, 2, 3]\",997\n"
                   << "tr1,1010,tract one,/997/1009/1010/,\"[1, 2, 3]\",1009\n";
        structures.close();

        // y = 0: A1 A . B B . SUP SUP
        // y = 1: tr1 fiber . . . B . root
        input = LabelImage(8, 2, 1);
        const uint32_t row0[] = {11, 10, 0, 20, 20, 0, 614454277, 614454277};
        const uint32_t row1[] = {1010, 1009, 0, 0, 0, 20, 0, 997};
        for (size_t x = 0; x < 8; ++x) {
            input(x, 0, 0) = row0[x];
            input(x, 1, 0) = row1[x];
        }
        io::ImageUtils::WriteImage(input, (test_dir / "annotation.nii").string());

        config.input_mask = "annotation.nii";
        config.output_mask = "adjusted_mask.nii.gz";
        config.whole_brain_mask = "whole_brain_mask.nii";
        config.rules.flatten = {"fiber tracts", "A"};
        config.rules.flatten_to_depth.clear();
        config.rules.exclude = {"fiber tracts", "root"};
        config.min_fragment_size = 2;
    }

    void TearDown() override {
        if (std::filesystem::exists(test_dir)) {
            std::filesystem::remove_all(test_dir);
        }
    }

    std::string ReadText(const std::string& name) const {
        std::ifstream file(test_dir / name);
        std::stringstream content;
        content << file.rdbuf();
        return content.str();
    }

    bool AnyOutputExists() const {
        for (const char* name : {"adjusted_mask.nii.gz", "whole_brain_mask.nii",
                                 "used_region_ids.csv", "region_fragments_with_sizes.csv"}) {
            if (std::filesystem::exists(test_dir / name)) {
                return true;
            }
        }
        return false;
    }

    std::filesystem::path test_dir;
    LabelImage input;
    PipelineConfig config;
};

TEST_F(MaskPipelineTest, ProcessDatasetWritesAllOutputs) {
    MaskPipeline pipeline(config);
    auto report = pipeline.ProcessDataset(test_dir.string());

    ASSERT_TRUE(report.success) << report.message << "\n" << report.error_report;
    EXPECT_EQ(report.written_files.size(), 4u);
    EXPECT_EQ(report.region_count, 3u);
    EXPECT_EQ(report.fragment_count, 4u);
    EXPECT_EQ(report.removed_fragments, 1u);
    EXPECT_EQ(report.remapped_ids, 1u);

    auto adjusted = io::ImageUtils::ReadLabelImage((test_dir / "adjusted_mask.nii.gz").string());
    ASSERT_NE(adjusted, nullptr);
    EXPECT_EQ(adjusted->GetDataVector(),
              (std::vector<uint32_t>{10, 10, 0, 20, 20, 0, 1, 1,
                                     0, 0, 0, 0, 0, 0, 0, 0}));

    // Brain outline comes from the raw labels, before any exclusion
    auto brain = io::ImageUtils::ReadLabelImage((test_dir / "whole_brain_mask.nii").string());
    ASSERT_NE(brain, nullptr);
    EXPECT_EQ(brain->CountNonZero(), 10u);
    EXPECT_EQ(brain->GetMaxValue(), 1u);

    EXPECT_EQ(ReadText("used_region_ids.csv"),
              "region_id,region_name,region_acronym\n"
              "1,Supplemental area,SUP\n"
              "10,Region A,A\n"
              "20,Region B,B\n");

    EXPECT_EQ(ReadText("region_fragments_with_sizes.csv"),
              "region_id,region_name,fragment_index,fragment_size_voxels,removed\n"
              "10,Region A,1,2,False\n"
              "20,Region B,1,2,False\n"
              "20,Region B,2,1,True\n"
              "614454277,Supplemental area,1,2,False\n");
}

TEST_F(MaskPipelineTest, RunReportsStagesInOrder) {
    auto hierarchy = atlas::RegionHierarchy::LoadStructuresCsv((test_dir / "structures.csv").string());

    std::vector<std::string> stages;
    double last_progress = -1.0;
    bool monotonic = true;

    MaskPipeline pipeline(config);
    pipeline.SetProgressCallback([&](double progress, const std::string& stage) {
        monotonic = monotonic && progress >= last_progress;
        last_progress = progress;
        stages.push_back(stage);
    });

    auto result = pipeline.Run(input, hierarchy);

    EXPECT_TRUE(monotonic);
    EXPECT_DOUBLE_EQ(last_progress, 1.0);
    ASSERT_FALSE(stages.empty());
    EXPECT_EQ(stages.front(), "configuration");
    EXPECT_EQ(stages.back(), "complete");
    EXPECT_EQ(pipeline.GetCurrentStage(), PipelineStage::COMPLETE);

    EXPECT_EQ(result.adjusted_mask(6, 0, 0), 1);
    EXPECT_EQ(result.new_to_old.at(1), 614454277u);
    EXPECT_EQ(result.merge_statistics.voxels_flattened, 2u);
    EXPECT_EQ(result.merge_statistics.voxels_excluded, 3u);
    EXPECT_EQ(result.removed_voxels, 1u);
    ASSERT_EQ(result.label_mapping.size(), 3u);
    EXPECT_EQ(result.label_mapping[0].region_acronym, "SUP");

    // The input mask is not modified
    EXPECT_EQ(input(0, 0, 0), 11u);
}

TEST_F(MaskPipelineTest, UnknownRegionFailsWithoutOutputs) {
    config.rules.exclude.push_back("NotARegion");

    MaskPipeline pipeline(config);
    auto report = pipeline.ProcessDataset(test_dir.string());

    EXPECT_FALSE(report.success);
    EXPECT_EQ(report.failed_stage, PipelineStage::MERGE_REGIONS);
    EXPECT_NE(report.error_report.find("NotARegion"), std::string::npos);
    EXPECT_TRUE(report.written_files.empty());
    EXPECT_FALSE(AnyOutputExists());
}

TEST_F(MaskPipelineTest, RemapExhaustionFailsWithoutOutputs) {
    // 10, 20 and 614454277 all exceed 2, with only two slots available
    config.max_label_value = 2;

    MaskPipeline pipeline(config);
    auto report = pipeline.ProcessDataset(test_dir.string());

    EXPECT_FALSE(report.success);
    EXPECT_EQ(report.failed_stage, PipelineStage::REMAP_IDS);
    EXPECT_FALSE(report.error_report.empty());
    EXPECT_FALSE(AnyOutputExists());
}

TEST_F(MaskPipelineTest, MissingInputFailsAtLoad) {
    config.input_mask = "no_such_mask.tiff";

    MaskPipeline pipeline(config);
    auto report = pipeline.ProcessDataset(test_dir.string());

    EXPECT_FALSE(report.success);
    EXPECT_EQ(report.failed_stage, PipelineStage::LOAD_MASK);
    EXPECT_NE(report.message.find("no_such_mask.tiff"), std::string::npos);
    EXPECT_FALSE(AnyOutputExists());
}

TEST_F(MaskPipelineTest, PartialWritesAreRemoved) {
    config.fragment_csv = "missing_dir/fragments.csv";

    MaskPipeline pipeline(config);
    auto report = pipeline.ProcessDataset(test_dir.string());

    EXPECT_FALSE(report.success);
    EXPECT_EQ(report.failed_stage, PipelineStage::WRITE_OUTPUTS);
    EXPECT_TRUE(report.written_files.empty());
    EXPECT_FALSE(AnyOutputExists());
}

TEST_F(MaskPipelineTest, FailedImageWriteRemovesEarlierOutputs) {
    // The adjusted mask is written first, then the brain mask write fails
    config.whole_brain_mask = "missing_dir/whole_brain_mask.nii";

    MaskPipeline pipeline(config);
    auto report = pipeline.ProcessDataset(test_dir.string());

    EXPECT_FALSE(report.success);
    EXPECT_EQ(report.failed_stage, PipelineStage::WRITE_OUTPUTS);
    EXPECT_TRUE(report.written_files.empty());
    EXPECT_FALSE(AnyOutputExists());
    EXPECT_FALSE(std::filesystem::exists(test_dir / "missing_dir"));
}

TEST_F(MaskPipelineTest, FailedTiffWriteLeavesNothingBehind) {
    config.output_mask = "missing_dir/adjusted_mask.tiff";

    MaskPipeline pipeline(config);
    auto report = pipeline.ProcessDataset(test_dir.string());

    EXPECT_FALSE(report.success);
    EXPECT_EQ(report.failed_stage, PipelineStage::WRITE_OUTPUTS);
    EXPECT_NE(report.message.find("adjusted_mask.tiff"), std::string::npos);
    EXPECT_TRUE(report.written_files.empty());
    EXPECT_FALSE(AnyOutputExists());
}

TEST_F(MaskPipelineTest, InvalidConfigurationFailsFirst) {
    config.connectivity = 7;

    MaskPipeline pipeline(config);
    auto report = pipeline.ProcessDataset(test_dir.string());

    EXPECT_FALSE(report.success);
    EXPECT_EQ(report.failed_stage, PipelineStage::CONFIGURATION);
    EXPECT_FALSE(AnyOutputExists());
}

TEST_F(MaskPipelineTest, ResolvePathKeepsAbsolutePaths) {
    EXPECT_EQ(MaskPipeline::ResolvePath("/data/sample", "/atlas/structures.csv"),
              "/atlas/structures.csv");
    EXPECT_EQ(MaskPipeline::ResolvePath("/data/sample", "adjusted_mask.tiff"),
              (std::filesystem::path("/data/sample") / "adjusted_mask.tiff").string());
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
