#include <gtest/gtest.h>
#include <managers/merge_scheduler.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <cstdlib>
#include <sys/wait.h>

namespace fs = std::filesystem;

static MergeInputs rank_inputs(int n) {
    MergeInputs inputs;
    for (int i = 0; i < n; i++) inputs.partition_keys.push_back("rank" + std::to_string(i));
    return inputs;
}

static int flagged_count(const MergePlan& plan) {
    int n = 0;
    for (const auto& t : plan) if (t.rename_output) n++;
    return n;
}

TEST(MergePlan, OneTaskPerKeyInOrder) {
    MergeInputs inputs;
    inputs.partition_keys = {"phylum", "genus", "species", "free", "none"};
    inputs.secondary_key = "per-gene";

    auto r = plan_merges(inputs);
    ASSERT_TRUE(r.is_ok()) << r.error;
    ASSERT_EQ(r.value.size(), 6u);
    EXPECT_EQ(r.value[0].partition_key, "phylum");
    EXPECT_EQ(r.value[0].glob_pattern, "*.woltka-taxa/phylum.biom");
    EXPECT_EQ(r.value[4].partition_key, "none");
    EXPECT_EQ(r.value[5].partition_key, "per-gene");
    EXPECT_EQ(r.value[5].glob_pattern, "*.woltka-per-gene");
}

TEST(MergePlan, SecondaryTaskGetsRename) {
    MergeInputs inputs;
    inputs.partition_keys = {"phylum", "genus", "species", "free", "none"};
    inputs.secondary_key = "per-gene";

    auto plan = plan_merges(inputs).value;
    EXPECT_EQ(flagged_count(plan), 1);
    EXPECT_TRUE(plan.back().rename_output);
}

TEST(MergePlan, LastKeyGetsRenameWithoutSecondary) {
    MergeInputs inputs;
    inputs.partition_keys = {"phylum", "genus", "none"};

    auto plan = plan_merges(inputs).value;
    ASSERT_EQ(plan.size(), 3u);
    EXPECT_EQ(flagged_count(plan), 1);
    EXPECT_TRUE(plan[2].rename_output);
}

TEST(MergePlan, RenameRuleResetsEarlierFlags) {
    MergePlan plan = {{"a", "a.biom", true}, {"b", "b.biom", true}, {"c", "c.biom", false}};
    apply_rename_rule(plan, std::nullopt);
    EXPECT_FALSE(plan[0].rename_output);
    EXPECT_FALSE(plan[1].rename_output);
    EXPECT_TRUE(plan[2].rename_output);

    plan.push_back({"extra", "extra-glob", false});
    apply_rename_rule(plan, std::string("extra"));
    EXPECT_EQ(flagged_count(plan), 1);
    EXPECT_TRUE(plan[3].rename_output);
}

TEST(MergePlan, FanOutLimit) {
    EXPECT_TRUE(plan_merges(rank_inputs(31)).is_ok());

    auto r = plan_merges(rank_inputs(32));
    EXPECT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::ConfigError);

    // The secondary task counts toward the limit
    auto inputs = rank_inputs(31);
    inputs.secondary_key = "per-gene";
    EXPECT_EQ(plan_merges(inputs).kind, ErrorKind::ConfigError);
}

TEST(MergePlan, RejectsEmptyAndDuplicateKeys) {
    EXPECT_EQ(plan_merges(rank_inputs(0)).kind, ErrorKind::ConfigError);

    MergeInputs dup;
    dup.partition_keys = {"genus", "genus"};
    EXPECT_EQ(plan_merges(dup).kind, ErrorKind::ConfigError);

    MergeInputs clash;
    clash.partition_keys = {"genus", "per-gene"};
    clash.secondary_key = "per-gene";
    EXPECT_EQ(plan_merges(clash).kind, ErrorKind::ConfigError);
}

TEST(MergePlan, CommandFillsTemplate) {
    MergeSettings s;
    s.command_template = DEFAULT_MERGE_COMMAND;
    s.metadata_path = "/data/prep.tsv";
    s.output_dir = "/out";

    EXPECT_EQ(merge_command(s, {"genus", "*.woltka-taxa/genus.biom", false}),
              "woltka_merge --prep /data/prep.tsv --base /out --name genus "
              "--glob \"*.woltka-taxa/genus.biom\"");
    EXPECT_EQ(merge_command(s, {"per-gene", "*.woltka-per-gene", true}),
              "woltka_merge --prep /data/prep.tsv --base /out --name per-gene "
              "--glob \"*.woltka-per-gene\" --rename");
}

class MergeSchedulerTest : public ::testing::Test {
protected:
    fs::path test_dir;
    PbsDialect pbs;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "arrayprep_merge_test";
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    MergeSettings make_settings() const {
        MergeSettings s;
        s.resource_name = "run1";
        s.output_dir = test_dir.string();
        s.metadata_path = "/data/prep.tsv";
        s.memory_limit = "48g";
        s.walltime_limit = "4:00:00";
        s.contact = "help@example.org";
        s.command_template = DEFAULT_MERGE_COMMAND;
        s.archive_command = DEFAULT_ARCHIVE;
        s.notify_command = DEFAULT_NOTIFY;
        s.notify_url = "https://example.org/api";
        return s;
    }

    MergePlan six_tasks() const {
        MergeInputs inputs;
        inputs.partition_keys = {"phylum", "genus", "species", "free", "none"};
        inputs.secondary_key = "per-gene";
        return plan_merges(inputs).value;
    }
};

TEST_F(MergeSchedulerTest, BackgroundTasksJoinedBySingleWait) {
    MergeScheduler scheduler(make_settings(), pbs);
    auto script = scheduler.build(six_tasks());

    EXPECT_EQ(script.count(StatementKind::Background), 6u);
    EXPECT_EQ(script.count(StatementKind::Wait), 1u);

    const auto& stmts = script.statements();
    size_t last_bg = 0, wait_at = 0;
    for (size_t i = 0; i < stmts.size(); i++) {
        if (stmts[i].kind == StatementKind::Background) last_bg = i;
        if (stmts[i].kind == StatementKind::Wait) wait_at = i;
    }
    EXPECT_GT(wait_at, last_bg);

    // Archive and notification only run after the barrier
    for (size_t i = 0; i < wait_at; i++) {
        EXPECT_NE(stmts[i].kind, StatementKind::Command);
    }

    const Directive* cores = script.find_directive(DirectiveKind::Cores);
    ASSERT_NE(cores, nullptr);
    EXPECT_EQ(cores->count, 6);
    EXPECT_EQ(script.find_directive(DirectiveKind::ArrayRange), nullptr);
}

TEST_F(MergeSchedulerTest, RendersScript) {
    MergeScheduler scheduler(make_settings(), pbs);
    std::string text = scheduler.build(six_tasks()).render(pbs);

    EXPECT_NE(text.find("#PBS -N merge-run1\n"), std::string::npos);
    EXPECT_NE(text.find("#PBS -l nodes=1:ppn=6\n"), std::string::npos);
    EXPECT_NE(text.find("--name phylum --glob \"*.woltka-taxa/phylum.biom\" &\n"),
              std::string::npos);
    EXPECT_NE(text.find("--glob \"*.woltka-per-gene\" --rename &\n"), std::string::npos);
    EXPECT_NE(text.find("wait\n"), std::string::npos);
    EXPECT_NE(text.find("tar -cvf alignment.tar *.sam.xz\n"), std::string::npos);
    EXPECT_NE(text.find("finish_woltka https://example.org/api run1 " + test_dir.string() + "\n"),
              std::string::npos);
    EXPECT_LT(text.find("wait\n"), text.find("tar -cvf"));
}

TEST_F(MergeSchedulerTest, ValidateRequiresSingleRename) {
    MergeScheduler scheduler(make_settings(), pbs);
    auto plan = six_tasks();
    EXPECT_TRUE(scheduler.validate(plan).is_ok());

    plan[0].rename_output = true;
    EXPECT_EQ(scheduler.validate(plan).kind, ErrorKind::ConfigError);

    for (auto& t : plan) t.rename_output = false;
    EXPECT_EQ(scheduler.validate(plan).kind, ErrorKind::ConfigError);
}

TEST_F(MergeSchedulerTest, ValidateRejectsBadSettings) {
    auto s = make_settings();
    s.walltime_limit = "four hours";
    EXPECT_EQ(MergeScheduler(s, pbs).validate(six_tasks()).kind, ErrorKind::ConfigError);

    s = make_settings();
    s.command_template = "woltka_merge --name {name}";
    EXPECT_EQ(MergeScheduler(s, pbs).validate(six_tasks()).kind, ErrorKind::ConfigError);
}

TEST_F(MergeSchedulerTest, WritesScriptFile) {
    MergeScheduler scheduler(make_settings(), pbs);
    auto r = scheduler.write(six_tasks());
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value, (test_dir / "run1.merge.qsub").string());

    std::ifstream in(r.value);
    std::stringstream ss;
    ss << in.rdbuf();
    EXPECT_EQ(ss.str().rfind("#!/bin/bash\n", 0), 0u);
}

TEST_F(MergeSchedulerTest, OversizedPlanWritesNothing) {
    MergePlan plan;
    for (int i = 0; i < 32; i++) plan.push_back({"k" + std::to_string(i), "g", i == 0});

    MergeScheduler scheduler(make_settings(), pbs);
    auto r = scheduler.write(plan);
    EXPECT_EQ(r.kind, ErrorKind::ConfigError);
    EXPECT_TRUE(fs::is_empty(test_dir));
}

TEST_F(MergeSchedulerTest, ScriptJoinsTasksBeforeArchiving) {
    if (std::system("command -v bash >/dev/null 2>&1") != 0) GTEST_SKIP() << "bash not available";

    fs::path log = test_dir / "merged.txt";
    auto s = make_settings();
    s.command_template = fmt::format("echo {{name}} \"{{glob}}\" >> {}", log.string());
    s.archive_command = fmt::format("echo archived >> {}", log.string());
    s.notify_command = "";

    MergeScheduler scheduler(s, pbs);
    auto written = scheduler.write(six_tasks());
    ASSERT_TRUE(written.is_ok()) << written.error;

    int status = std::system(fmt::format("bash '{}' >/dev/null 2>&1", written.value).c_str());
    ASSERT_TRUE(WIFEXITED(status));
    EXPECT_EQ(WEXITSTATUS(status), 0);

    std::vector<std::string> lines;
    std::ifstream in(log);
    for (std::string line; std::getline(in, line);) lines.push_back(line);

    // Every task finished before the archive step ran
    ASSERT_EQ(lines.size(), 7u);
    EXPECT_EQ(lines.back(), "archived");

    std::vector<std::string> tasks(lines.begin(), lines.end() - 1);
    std::sort(tasks.begin(), tasks.end());
    EXPECT_EQ(tasks, (std::vector<std::string>{
        "free *.woltka-taxa/free.biom",
        "genus *.woltka-taxa/genus.biom",
        "none *.woltka-taxa/none.biom",
        "per-gene *.woltka-per-gene --rename",
        "phylum *.woltka-taxa/phylum.biom",
        "species *.woltka-taxa/species.biom",
    }));
}
