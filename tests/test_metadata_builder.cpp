#include <gtest/gtest.h>
#include <map>
#include <memory>
#include <set>
#include "../src/atlas/RegionHierarchy.h"
#include "../src/mask/MetadataBuilder.h"

using namespace neuroparcel;
using namespace neuroparcel::atlas;
using namespace neuroparcel::mask;
using neuroparcel::io::LabelImage;

class MetadataBuilderTest : public ::testing::Test {
protected:
    void SetUp() override {
        hierarchy = std::make_unique<RegionHierarchy>(std::vector<RegionRecord>{
            {997, "root", "root", std::nullopt},
            {5, "Region five", "R5", 997},
            {614454277, "Supplemental area", "SUP", 997},
        });
    }

    static LabelImage MakeRow(const std::vector<uint32_t>& values) {
        LabelImage image(values.size(), 1, 1);
        for (size_t i = 0; i < values.size(); ++i) {
            image[i] = values[i];
        }
        return image;
    }

    std::unique_ptr<RegionHierarchy> hierarchy;
};

TEST_F(MetadataBuilderTest, EveryFinalIdHasExactlyOneRow) {
    MetadataBuilder builder(*hierarchy);
    LabelImage mask = MakeRow({0, 5, 5, 1, 0, 5, 3});
    std::map<uint32_t, uint32_t> new_to_old = {{1, 614454277}};

    auto rows = builder.BuildLabelMapping(mask, new_to_old);

    ASSERT_EQ(rows.size(), 3u);
    std::set<uint32_t> ids;
    for (const auto& row : rows) {
        EXPECT_TRUE(ids.insert(row.region_id).second);
    }
    EXPECT_EQ(ids, (std::set<uint32_t>{1, 3, 5}));

    // Ascending ID order
    EXPECT_EQ(rows[0].region_id, 1u);
    EXPECT_EQ(rows[1].region_id, 3u);
    EXPECT_EQ(rows[2].region_id, 5u);
}

TEST_F(MetadataBuilderTest, RemappedIdsResolveThroughOriginalId) {
    MetadataBuilder builder(*hierarchy);
    LabelImage mask = MakeRow({1, 5});

    auto rows = builder.BuildLabelMapping(mask, {{1, 614454277}});

    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].region_name, "Supplemental area");
    EXPECT_EQ(rows[0].region_acronym, "SUP");
    EXPECT_EQ(rows[1].region_name, "Region five");
    EXPECT_EQ(rows[1].region_acronym, "R5");
}

TEST_F(MetadataBuilderTest, PlaceholdersDistinguishRemappedFromUnknown) {
    MetadataBuilder builder(*hierarchy);
    LabelImage mask = MakeRow({2, 42});

    auto rows = builder.BuildLabelMapping(mask, {{2, 70000}});

    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].region_name, "Remapped_70000");
    EXPECT_EQ(rows[0].region_acronym, "Remapped_70000");
    EXPECT_EQ(rows[1].region_name, "Unknown_42");
    EXPECT_EQ(rows[1].region_acronym, "Unknown_42");
}

TEST_F(MetadataBuilderTest, RemapTableTakesPrecedenceOverDirectLookup) {
    // New ID 5 collides with a hierarchy ID but stands for the remapped region
    MetadataBuilder builder(*hierarchy);
    LabelImage mask = MakeRow({5});

    auto rows = builder.BuildLabelMapping(mask, {{5, 614454277}});

    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].region_acronym, "SUP");
}

TEST_F(MetadataBuilderTest, LabelMappingTableColumns) {
    std::vector<LabelMappingRow> rows = {{5, "Region five", "R5"}};
    auto table = MetadataBuilder::LabelMappingTable(rows);

    EXPECT_EQ(table.columns,
              (std::vector<std::string>{"region_id", "region_name", "region_acronym"}));
    ASSERT_EQ(table.rows.size(), 1u);
    EXPECT_EQ(table.rows[0], (std::vector<std::string>{"5", "Region five", "R5"}));
}

TEST_F(MetadataBuilderTest, FragmentTableWritesBooleansAsWords) {
    std::vector<FragmentRecord> records(2);
    records[0].region_id = 5;
    records[0].region_name = "Region five";
    records[0].fragment_index = 1;
    records[0].voxel_count = 120;
    records[0].removed = false;
    records[1] = records[0];
    records[1].fragment_index = 2;
    records[1].voxel_count = 3;
    records[1].removed = true;

    auto table = MetadataBuilder::FragmentTable(records);

    EXPECT_EQ(table.columns,
              (std::vector<std::string>{"region_id", "region_name", "fragment_index",
                                        "fragment_size_voxels", "removed"}));
    ASSERT_EQ(table.rows.size(), 2u);
    EXPECT_EQ(table.rows[0],
              (std::vector<std::string>{"5", "Region five", "1", "120", "False"}));
    EXPECT_EQ(table.rows[1],
              (std::vector<std::string>{"5", "Region five", "2", "3", "True"}));
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
