#include <gtest/gtest.h>
#include <managers/manifest.hpp>
#include <managers/work_items.hpp>
#include <fstream>

class ManifestTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "arrayprep_manifest_test";
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }
};

TEST_F(ManifestTest, PathFromNameAndDir) {
    EXPECT_EQ(manifest_path("/out", "run1"), "/out/run1.array-details");
}

TEST_F(ManifestTest, LineIsTabSeparated) {
    EXPECT_EQ(format_manifest_line({"/in/a", "/out/a.sam"}), "/in/a\t/out/a.sam");
}

TEST_F(ManifestTest, WriteThenReadKeepsOrder) {
    auto items = make_work_items({"s3", "s1", "s2"}, "/in", "/out", "sam").value;
    fs::path path = test_dir / "m.array-details";

    ASSERT_TRUE(write_manifest(path, items).is_ok());
    auto r = read_manifest(path);
    ASSERT_TRUE(r.is_ok()) << r.error;
    ASSERT_EQ(r.value.size(), 3u);
    EXPECT_EQ(r.value[0].input_path, "/in/s3");
    EXPECT_EQ(r.value[0].output_path, "/out/s3.sam");
    EXPECT_EQ(r.value[2].input_path, "/in/s2");
}

TEST_F(ManifestTest, WriteLeavesNoStagingFile) {
    auto items = make_work_items({"a"}, "/in", "/out", "sam").value;
    ASSERT_TRUE(write_manifest(test_dir / "m", items).is_ok());

    int files = 0;
    for (const auto& e : fs::directory_iterator(test_dir)) {
        (void)e;
        files++;
    }
    EXPECT_EQ(files, 1);
}

TEST_F(ManifestTest, ReadMissingFile) {
    auto r = read_manifest(test_dir / "absent");
    EXPECT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::IoError);
}

TEST_F(ManifestTest, ReadRejectsLineWithoutTab) {
    fs::path path = test_dir / "bad";
    {
        std::ofstream out(path);
        out << "/in/a\t/out/a.sam\n/in/b /out/b.sam\n";
    }
    auto r = read_manifest(path);
    EXPECT_EQ(r.kind, ErrorKind::InvalidInput);
    EXPECT_NE(r.error.find(":2:"), std::string::npos);
}
