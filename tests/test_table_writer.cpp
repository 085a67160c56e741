#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include "../src/io/ImageIO.h"
#include "../src/io/TableWriter.h"

using namespace neuroparcel::io;

class TableWriterTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir = std::filesystem::temp_directory_path() / "neuroparcel_table_test";
        std::filesystem::create_directories(test_dir);
    }

    void TearDown() override {
        if (std::filesystem::exists(test_dir)) {
            std::filesystem::remove_all(test_dir);
        }
    }

    std::filesystem::path test_dir;
};

TEST_F(TableWriterTest, QuotesOnlyWhenNeeded) {
    TableWriter writer;

    EXPECT_EQ(writer.EscapeField("Cerebellum"), "Cerebellum");
    EXPECT_EQ(writer.EscapeField("fiber tracts"), "fiber tracts");
    EXPECT_EQ(writer.EscapeField("Somatomotor areas, Layer 1"), "\"Somatomotor areas, Layer 1\"");
    EXPECT_EQ(writer.EscapeField("the \"core\""), "\"the \"\"core\"\"\"");
    EXPECT_EQ(writer.EscapeField("two\nlines"), "\"two\nlines\"");
    EXPECT_EQ(writer.EscapeField(""), "");

    TableWriter tabs('\t');
    EXPECT_EQ(tabs.EscapeField("a, b"), "a, b");
    EXPECT_EQ(tabs.EscapeField("a\tb"), "\"a\tb\"");
}

TEST_F(TableWriterTest, WritesHeaderThenRows) {
    Table table;
    table.columns = {"region_id", "region_name", "region_acronym"};
    table.rows = {{"8", "Basic cell groups and regions", "grey"},
                  {"500", "Somatomotor areas, all layers", "MO"}};

    std::ostringstream out;
    TableWriter().Write(table, out);

    EXPECT_EQ(out.str(),
              "region_id,region_name,region_acronym\n"
              "8,Basic cell groups and regions,grey\n"
              "500,\"Somatomotor areas, all layers\",MO\n");
}

TEST_F(TableWriterTest, WriteFileCreatesCsv) {
    Table table;
    table.columns = {"a", "b"};
    table.rows = {{"1", "True"}};

    std::string filename = (test_dir / "table.csv").string();
    TableWriter().WriteFile(table, filename);

    std::ifstream file(filename);
    std::stringstream content;
    content << file.rdbuf();
    EXPECT_EQ(content.str(), "a,b\n1,True\n");
}

TEST_F(TableWriterTest, UnwritablePathThrows) {
    Table table;
    table.columns = {"a"};

    std::string filename = (test_dir / "no_such_dir" / "table.csv").string();
    EXPECT_THROW(TableWriter().WriteFile(table, filename), ImageIOException);
    EXPECT_FALSE(std::filesystem::exists(filename));
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
