#include <gtest/gtest.h>
#include <set>
#include "../src/core/NeuroParcelExceptions.h"
#include "../src/mask/IdRemapper.h"

using namespace neuroparcel;
using namespace neuroparcel::mask;
using neuroparcel::io::LabelImage;

class IdRemapperTest : public ::testing::Test {
protected:
    static LabelImage MakeRow(const std::vector<uint32_t>& values) {
        LabelImage image(values.size(), 1, 1);
        for (size_t i = 0; i < values.size(); ++i) {
            image[i] = values[i];
        }
        return image;
    }
};

TEST_F(IdRemapperTest, OverRangeIdTakesLowestFreeSlot) {
    IdRemapper remapper(100);
    auto result = remapper.Apply(MakeRow({150, 0, 150, 2, 3}));

    EXPECT_EQ(result.mask.GetDataVector(), (std::vector<uint32_t>{1, 0, 1, 2, 3}));
    ASSERT_EQ(result.old_to_new.size(), 1u);
    EXPECT_EQ(result.old_to_new.at(150), 1u);
    EXPECT_EQ(result.new_to_old.at(1), 150u);
}

TEST_F(IdRemapperTest, InRangeMaskIsUnchanged) {
    IdRemapper remapper;
    LabelImage mask = MakeRow({0, 7, 65535, 12});

    auto result = remapper.Apply(mask);
    EXPECT_EQ(result.mask.GetDataVector(), mask.GetDataVector());
    EXPECT_TRUE(result.old_to_new.empty());
    EXPECT_TRUE(result.new_to_old.empty());
}

TEST_F(IdRemapperTest, ExhaustionFailsBeforeRewriting) {
    IdRemapper remapper(2);
    LabelImage mask = MakeRow({1, 2, 500});

    try {
        remapper.Apply(mask);
        FAIL() << "Expected RemapExhaustedException";
    } catch (const RemapExhaustedException& e) {
        EXPECT_EQ(e.GetOverRangeCount(), 1u);
        EXPECT_EQ(e.GetAvailableCount(), 0u);
        EXPECT_EQ(e.GetMaxValue(), 2u);
    }

    EXPECT_EQ(mask.GetDataVector(), (std::vector<uint32_t>{1, 2, 500}));
}

TEST_F(IdRemapperTest, AssignmentIsInjectiveAndAvoidsUsedIds) {
    IdRemapper remapper(10);
    LabelImage mask = MakeRow({1, 3, 4, 8, 500, 20, 1000, 20, 11, 500});

    auto result = remapper.Apply(mask);

    // Ascending over-range IDs take ascending free slots
    EXPECT_EQ(result.old_to_new.at(11), 2u);
    EXPECT_EQ(result.old_to_new.at(20), 5u);
    EXPECT_EQ(result.old_to_new.at(500), 6u);
    EXPECT_EQ(result.old_to_new.at(1000), 7u);

    std::set<uint32_t> assigned;
    for (const auto& entry : result.old_to_new) {
        EXPECT_TRUE(assigned.insert(entry.second).second);
        EXPECT_EQ(mask.CountValue(entry.second), 0u);
        EXPECT_EQ(result.new_to_old.at(entry.second), entry.first);
    }

    for (uint32_t value : result.mask.GetDataVector()) {
        EXPECT_LE(value, 10u);
    }
    EXPECT_EQ(result.mask.CountNonZero(), mask.CountNonZero());
}

TEST_F(IdRemapperTest, ExactlyEnoughSlotsSucceeds) {
    IdRemapper remapper(3);
    auto result = remapper.Apply(MakeRow({2, 70, 80}));

    EXPECT_EQ(result.mask.GetDataVector(), (std::vector<uint32_t>{2, 1, 3}));
}

TEST_F(IdRemapperTest, ZeroMaximumIsRejected) {
    EXPECT_THROW(IdRemapper(0), ConfigurationException);
}

TEST_F(IdRemapperTest, ToOutputImageNarrowsOrThrows) {
    LabelImage mask = MakeRow({0, 1, 65535});
    auto info = mask.GetImageInfo();
    info.voxel_size = {{0.025, 0.025, 0.025}};
    mask.SetImageInfo(info);

    auto output = ToOutputImage<uint16_t>(mask);
    EXPECT_EQ(output[2], 65535);
    EXPECT_DOUBLE_EQ(output.GetSpacing()[0], 0.025);

    mask[1] = 65536;
    EXPECT_THROW(ToOutputImage<uint16_t>(mask), ImageProcessingException);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
