#include <gtest/gtest.h>
#include <managers/work_items.hpp>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

class WorkItemsTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "arrayprep_work_items_test";
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    std::string write_metadata(const std::string& content) {
        fs::path p = test_dir / "prep.tsv";
        std::ofstream out(p);
        out << content;
        return p.string();
    }
};

TEST_F(WorkItemsTest, PathsFromKeys) {
    auto r = make_work_items({"S1_L001", "S2_L001"}, "/reads", "/out", "sam");
    ASSERT_TRUE(r.is_ok());
    ASSERT_EQ(r.value.size(), 2u);
    EXPECT_EQ(r.value[0].key, "S1_L001");
    EXPECT_EQ(r.value[0].input_path, "/reads/S1_L001");
    EXPECT_EQ(r.value[0].output_path, "/out/S1_L001.sam");
}

TEST_F(WorkItemsTest, DuplicateKeyIsInvalid) {
    auto r = make_work_items({"a", "b", "a"}, "/in", "/out", "sam");
    EXPECT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::InvalidInput);
    EXPECT_NE(r.error.find("not unique"), std::string::npos);
}

TEST_F(WorkItemsTest, EmptyKeyIsInvalid) {
    EXPECT_EQ(make_work_items({"a", ""}, "/in", "/out", "sam").kind, ErrorKind::InvalidInput);
}

TEST_F(WorkItemsTest, LoadsKeyColumnInRowOrder) {
    auto path = write_metadata(
        "sample_name\trun_prefix\tplatform\n"
        "s.1\tS9_L001\tIllumina\n"
        "s.2\tS1_L001\tIllumina\r\n"
        "\n"
        "s.3\tS5_L001\tIllumina\n");

    auto r = load_work_items(path, "run_prefix", "/reads", "/out", "sam");
    ASSERT_TRUE(r.is_ok()) << r.error;
    ASSERT_EQ(r.value.size(), 3u);
    EXPECT_EQ(r.value[0].key, "S9_L001");
    EXPECT_EQ(r.value[1].key, "S1_L001");
    EXPECT_EQ(r.value[2].input_path, "/reads/S5_L001");
}

TEST_F(WorkItemsTest, MissingColumn) {
    auto path = write_metadata("sample_name\tplatform\ns.1\tIllumina\n");
    auto r = load_work_items(path, "run_prefix", "/reads", "/out", "sam");
    EXPECT_EQ(r.kind, ErrorKind::InvalidInput);
    EXPECT_EQ(r.error, "Metadata is missing the required run_prefix column");
}

TEST_F(WorkItemsTest, DuplicateValuesInColumn) {
    auto path = write_metadata("run_prefix\nA\nB\nA\n");
    EXPECT_EQ(load_work_items(path, "run_prefix", "/in", "/out", "sam").kind,
              ErrorKind::InvalidInput);
}

TEST_F(WorkItemsTest, ShortRow) {
    auto path = write_metadata("sample_name\trun_prefix\ns.1\n");
    auto r = load_work_items(path, "run_prefix", "/in", "/out", "sam");
    EXPECT_EQ(r.kind, ErrorKind::InvalidInput);
    EXPECT_NE(r.error.find(":2:"), std::string::npos);
}

TEST_F(WorkItemsTest, UnreadableMetadata) {
    auto r = load_work_items((test_dir / "absent.tsv").string(), "run_prefix", "/in", "/out", "sam");
    EXPECT_EQ(r.kind, ErrorKind::InvalidInput);
}
