#include <gtest/gtest.h>
#include <core/config.hpp>
#include <core/utils.hpp>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

TEST(Config, DefaultsAreValid) {
    Config c = Config::defaults();
    EXPECT_TRUE(c.validate().is_ok());
    EXPECT_EQ(c.defaults_section().jobs, 3);
    EXPECT_EQ(c.defaults_section().timeout, Millis(60 * 60 * 1000));
    EXPECT_EQ(c.agent().binary_path, "claude");
    EXPECT_FALSE(c.strict_validation());
    EXPECT_FALSE(c.worktrees().search_paths.empty());
}

TEST(Config, EmptyTextYieldsDefaults) {
    auto r = Config::parse("");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.defaults_section().jobs, 3);
}

TEST(Config, ParsesEverySection) {
    auto r = Config::parse(R"(
defaults:
  jobs: 8
  timeout: 1h30m
  output_dir: /tmp/par-out
agent:
  binary_path: /usr/local/bin/agent
  print_flag: ""
  default_args: [--fast, --quiet]
worktrees:
  search_paths: [/srv/a, /srv/b]
  exclude_patterns: ["*/vendor/*"]
validation:
  strict: true
prompts:
  storage_dir: /tmp/par-prompts
)");
    ASSERT_TRUE(r.is_ok()) << r.error;
    const Config& c = r.value;
    EXPECT_EQ(c.defaults_section().jobs, 8);
    EXPECT_EQ(c.defaults_section().timeout, Millis(5400000));
    EXPECT_EQ(c.defaults_section().output_dir, fs::path("/tmp/par-out"));
    EXPECT_EQ(c.agent().binary_path, "/usr/local/bin/agent");
    EXPECT_EQ(c.agent().print_flag, "");
    EXPECT_EQ(c.agent().default_args, (std::vector<std::string>{"--fast", "--quiet"}));
    ASSERT_EQ(c.worktrees().search_paths.size(), 2u);
    EXPECT_EQ(c.worktrees().search_paths[1], fs::path("/srv/b"));
    EXPECT_EQ(c.worktrees().exclude_patterns, (std::vector<std::string>{"*/vendor/*"}));
    EXPECT_TRUE(c.strict_validation());
    EXPECT_EQ(c.prompts_dir(), fs::path("/tmp/par-prompts"));
}

TEST(Config, PartialSectionKeepsOtherDefaults) {
    auto r = Config::parse("defaults:\n  jobs: 5\n");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.defaults_section().jobs, 5);
    EXPECT_EQ(r.value.defaults_section().timeout, Config::defaults().defaults_section().timeout);
    EXPECT_EQ(r.value.agent().binary_path, "claude");
}

TEST(Config, LegacyClaudeSection) {
    auto r = Config::parse("claude:\n  binary_path: /opt/claude\n");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.agent().binary_path, "/opt/claude");
}

TEST(Config, TildeExpandsToHome) {
    auto r = Config::parse("defaults:\n  output_dir: ~/results\n");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.defaults_section().output_dir, expand_home("~/results"));
    EXPECT_NE(r.value.defaults_section().output_dir.string().front(), '~');
}

TEST(Config, RejectsNonPositiveJobs) {
    auto r = Config::parse("defaults:\n  jobs: 0\n");
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("jobs"), std::string::npos);
}

TEST(Config, RejectsBadTimeout) {
    EXPECT_TRUE(Config::parse("defaults:\n  timeout: soon\n").is_err());
    EXPECT_TRUE(Config::parse("defaults:\n  timeout: 0\n").is_err());
}

TEST(Config, RejectsEmptyBinary) {
    EXPECT_TRUE(Config::parse("agent:\n  binary_path: \"\"\n").is_err());
}

TEST(Config, RejectsEmptySearchPaths) {
    EXPECT_TRUE(Config::parse("worktrees:\n  search_paths: []\n").is_err());
}

TEST(Config, RejectsMalformedYaml) {
    EXPECT_TRUE(Config::parse("defaults: [unclosed").is_err());
    EXPECT_TRUE(Config::parse("- just\n- a list\n").is_err());
}

TEST(Config, OverridesApply) {
    Config c = Config::defaults();
    c.set_jobs(12);
    c.set_timeout(Millis(1000));
    c.set_strict(true);
    EXPECT_EQ(c.defaults_section().jobs, 12);
    EXPECT_EQ(c.defaults_section().timeout, Millis(1000));
    EXPECT_TRUE(c.strict_validation());
}

class ConfigFileTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / ("par_config_test_" + generate_id());
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }
};

TEST_F(ConfigFileTest, LoadRecordsSourcePath) {
    auto path = test_dir / "config.yaml";
    std::ofstream(path) << "defaults:\n  jobs: 2\n";

    auto r = Config::load(path);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.defaults_section().jobs, 2);
    EXPECT_EQ(r.value.source_path(), path);
}

TEST_F(ConfigFileTest, LoadMissingFileIsError) {
    auto r = Config::load(test_dir / "nope.yaml");
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("not found"), std::string::npos);
}

TEST_F(ConfigFileTest, LoadErrorNamesFile) {
    auto path = test_dir / "bad.yaml";
    std::ofstream(path) << "defaults:\n  jobs: -1\n";

    auto r = Config::load(path);
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find(path.string()), std::string::npos);
}
