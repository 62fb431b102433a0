#include <gtest/gtest.h>
#include <managers/output_validator.hpp>
#include <fstream>

// Records which tables were normalized; can be told to fail.
class RecordingNormalizer : public TableNormalizer {
public:
    mutable std::vector<std::string> seen;
    bool fail = false;

    Result<void> normalize(const fs::path& table) const override {
        seen.push_back(table.filename().string());
        if (fail) return Result<void>::Err(ErrorKind::InvalidInput, "bad table");
        return Result<void>::Ok();
    }
};

class OutputValidatorTest : public ::testing::Test {
protected:
    fs::path test_dir;
    RecordingNormalizer normalizer;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "arrayprep_validator_test";
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    void touch(const std::string& name) {
        std::ofstream out(test_dir / name);
        out << "#OTU ID\tS1\n";
    }

    ValidationLayout make_layout() const {
        ValidationLayout layout;
        layout.output_dir = test_dir.string();
        layout.partition_keys = {"phylum", "genus", "species", "free", "none"};
        layout.primary_key = "free";
        layout.ungrouped_key = "none";
        layout.contact = "help@example.org";
        return layout;
    }

    static size_t count_label(const ValidationReport& r, const std::string& prefix) {
        size_t n = 0;
        for (const auto& a : r.artifacts) {
            if (a.label.rfind(prefix, 0) == 0) n++;
        }
        return n;
    }
};

TEST_F(OutputValidatorTest, AllOutputsPresent) {
    for (auto name : {"free.biom", "alignment.tar", "phylum.biom", "genus.biom",
                      "species.biom", "none.biom"}) {
        touch(name);
    }

    auto report = OutputValidator(make_layout(), normalizer).validate();
    EXPECT_TRUE(report.success()) << report.error_text();
    ASSERT_EQ(report.artifacts.size(), 5u);
    EXPECT_EQ(report.artifacts[0].label, "Alignment Profile");
    EXPECT_EQ(report.artifacts[0].files.size(), 2u);
    EXPECT_EQ(count_label(report, "Taxonomic Predictions - "), 3u);
    EXPECT_EQ(report.artifacts.back().label, "Per genome Predictions");
    EXPECT_EQ(report.artifacts.back().kind, "BIOM");

    // Only the ordinary ranks are normalized
    EXPECT_EQ(normalizer.seen,
              (std::vector<std::string>{"phylum.biom", "genus.biom", "species.biom"}));
}

TEST_F(OutputValidatorTest, OneMissingRankDoesNotStopTheOthers) {
    for (auto name : {"free.biom", "alignment.tar", "phylum.biom", "genus.biom", "none.biom"}) {
        touch(name);
    }

    auto report = OutputValidator(make_layout(), normalizer).validate();
    EXPECT_FALSE(report.success());
    EXPECT_EQ(count_label(report, "Taxonomic Predictions - "), 2u);
    ASSERT_EQ(report.errors.size(), 1u);
    EXPECT_NE(report.errors[0].find("species"), std::string::npos);
    EXPECT_NE(report.errors[0].find("help@example.org"), std::string::npos);
}

TEST_F(OutputValidatorTest, PrimaryNeedsArchive) {
    for (auto name : {"free.biom", "phylum.biom", "genus.biom", "species.biom", "none.biom"}) {
        touch(name);
    }

    auto report = OutputValidator(make_layout(), normalizer).validate();
    ASSERT_EQ(report.errors.size(), 1u);
    EXPECT_NE(report.errors[0].find("Alignment Profile"), std::string::npos);
    EXPECT_EQ(count_label(report, "Alignment Profile"), 0u);
    EXPECT_EQ(count_label(report, "Taxonomic Predictions - "), 3u);
}

TEST_F(OutputValidatorTest, EmptyDirectoryCollectsEveryError) {
    auto report = OutputValidator(make_layout(), normalizer).validate();
    EXPECT_TRUE(report.artifacts.empty());
    // primary, three ranks, ungrouped
    EXPECT_EQ(report.errors.size(), 5u);
    EXPECT_NE(report.errors.back().find("none/per-genome"), std::string::npos);
    EXPECT_TRUE(normalizer.seen.empty());
}

TEST_F(OutputValidatorTest, SecondaryCheckedOnlyWhenConfigured) {
    for (auto name : {"free.biom", "alignment.tar", "phylum.biom", "genus.biom",
                      "species.biom", "none.biom"}) {
        touch(name);
    }

    auto layout = make_layout();
    EXPECT_TRUE(OutputValidator(layout, normalizer).validate().success());

    layout.secondary_key = "per-gene";
    auto missing = OutputValidator(layout, normalizer).validate();
    ASSERT_EQ(missing.errors.size(), 1u);
    EXPECT_NE(missing.errors[0].find("per-gene"), std::string::npos);

    touch("per-gene.biom");
    auto found = OutputValidator(layout, normalizer).validate();
    EXPECT_TRUE(found.success());
    EXPECT_EQ(found.artifacts.back().label, "Per gene Predictions");
}

TEST_F(OutputValidatorTest, NormalizationFailureIsReported) {
    for (auto name : {"free.biom", "alignment.tar", "phylum.biom", "genus.biom",
                      "species.biom", "none.biom"}) {
        touch(name);
    }
    normalizer.fail = true;

    auto report = OutputValidator(make_layout(), normalizer).validate();
    EXPECT_EQ(report.errors.size(), 3u);
    EXPECT_EQ(count_label(report, "Taxonomic Predictions - "), 0u);
    EXPECT_EQ(count_label(report, "Per genome Predictions"), 1u);
}

TEST_F(OutputValidatorTest, ErrorTextJoinsLines) {
    ValidationReport r;
    r.errors = {"first", "second"};
    EXPECT_EQ(r.error_text(), "first\nsecond");
}
