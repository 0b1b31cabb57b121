// NODEREWARD - Configuration File Parser Tests
// Copyright (c) 2024 NODEREWARD Developers
// MIT License

#include <gtest/gtest.h>

#include "nodereward/util/config.h"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <unistd.h>

namespace nodereward {
namespace util {
namespace test {

// ============================================================================
// Test Fixtures
// ============================================================================

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.Clear();
    }

    void TearDown() override {
        for (const auto& file : tempFiles_) {
            std::remove(file.c_str());
        }
        tempFiles_.clear();
    }

    std::string CreateTempFile(const std::string& content) {
        char filename[] = "/tmp/nodereward_config_test_XXXXXX";
        int fd = mkstemp(filename);
        if (fd < 0) {
            throw std::runtime_error("Failed to create temp file");
        }
        close(fd);

        std::ofstream file(filename);
        file << content;
        file.close();

        tempFiles_.push_back(filename);
        return filename;
    }

    ConfigManager config_;
    std::vector<std::string> tempFiles_;
};

// ============================================================================
// Parsing
// ============================================================================

TEST_F(ConfigTest, ParseEmptyString) {
    auto result = config_.ParseString("");
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.Size(), 0u);
}

TEST_F(ConfigTest, SectionsAndComments) {
    auto result = config_.ParseString(
        "# global comment\n"
        "name = engine\n"
        "[rewards]\n"
        "; another comment\n"
        "max_daily = 500\n"
        "[slashing]\n"
        "threshold=60\n");
    ASSERT_TRUE(result.success) << result.ToString();

    EXPECT_EQ(config_.GetString("name", ""), "engine");
    EXPECT_EQ(config_.GetInt("max_daily", 0, "rewards"), 500);
    EXPECT_EQ(config_.GetInt("threshold", 0, "slashing"), 60);
    EXPECT_FALSE(config_.HasKey("threshold", "rewards"));

    auto sections = config_.GetSections();
    ASSERT_EQ(sections.size(), 2u);
    EXPECT_EQ(sections[0], "rewards");
    EXPECT_EQ(sections[1], "slashing");
}

TEST_F(ConfigTest, QuotedValuesAndContinuation) {
    auto result = config_.ParseString(
        "reason = \"scheduled maintenance\"\n"
        "list = a, \\\n"
        "b, c\n");
    ASSERT_TRUE(result.success);
    EXPECT_EQ(config_.GetString("reason", ""), "scheduled maintenance");

    auto list = config_.GetList("list");
    ASSERT_EQ(list.size(), 3u);
    EXPECT_EQ(list[2], "c");
}

TEST_F(ConfigTest, MissingBracketReportsLine) {
    auto result = config_.ParseString("a = 1\n[broken\n");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorLine, 2);
}

TEST_F(ConfigTest, MissingEqualsFails) {
    EXPECT_FALSE(config_.ParseString("just a line\n").success);
}

TEST_F(ConfigTest, EnvironmentExpansion) {
    setenv("NODEREWARD_TEST_DIR", "/var/lib/rewards", 1);
    ASSERT_TRUE(config_.ParseString("[storage]\npath = ${NODEREWARD_TEST_DIR}/db\n").success);
    EXPECT_EQ(config_.GetString("path", "", "storage"), "/var/lib/rewards/db");
    unsetenv("NODEREWARD_TEST_DIR");
}

TEST_F(ConfigTest, ParseFile) {
    std::string path = CreateTempFile("[timelock]\nmin_delay = 7200\n");
    ASSERT_TRUE(config_.ParseFile(path).success);
    EXPECT_EQ(config_.GetInt("min_delay", 0, "timelock"), 7200);
}

TEST_F(ConfigTest, MissingFileFails) {
    EXPECT_FALSE(config_.ParseFile("/nonexistent/nodereward.conf").success);
}

// ============================================================================
// Typed Getters
// ============================================================================

TEST_F(ConfigTest, IntegerSuffixes) {
    ASSERT_TRUE(config_.ParseString("a = 4k\nb = 2m\nc = 12x\nd = abc\n").success);
    EXPECT_EQ(config_.GetInt("a", 0), 4096);
    EXPECT_EQ(config_.GetInt("b", 0), 2 * 1024 * 1024);
    EXPECT_FALSE(config_.TryGetInt("c").has_value());
    EXPECT_EQ(config_.GetInt("d", 99), 99);
}

TEST_F(ConfigTest, Booleans) {
    ASSERT_TRUE(config_.ParseString("a = yes\nb = off\nc = maybe\n").success);
    EXPECT_TRUE(config_.GetBool("a", false));
    EXPECT_FALSE(config_.GetBool("b", true));
    EXPECT_TRUE(config_.GetBool("c", true));
}

TEST_F(ConfigTest, SetDefaultDoesNotOverride) {
    config_.Set("mode", "mint", "rewards");
    config_.SetDefault("mode", "transfer", "rewards");
    config_.SetDefault("treasury", "none", "rewards");
    EXPECT_EQ(config_.GetString("mode", "", "rewards"), "mint");
    EXPECT_EQ(config_.GetString("treasury", "", "rewards"), "none");
}

// ============================================================================
// Validation
// ============================================================================

TEST_F(ConfigTest, RequiredKeyMissing) {
    config_.RequireKey("path", "storage");
    auto errors = config_.Validate();
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_NE(errors[0].find("storage:path"), std::string::npos);
}

TEST_F(ConfigTest, UnknownKeyRejectedOnceAllowListIsSet) {
    ASSERT_TRUE(config_.ParseString("[anomaly]\nbaseline.x = 5\ntypo = 1\n").success);
    config_.AllowKeyPrefix("baseline.", "anomaly");

    auto errors = config_.Validate();
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_NE(errors[0].find("anomaly:typo"), std::string::npos);
}

TEST_F(ConfigTest, SampleConfigParses) {
    std::string sample = ConfigManager::GenerateSampleConfig();
    EXPECT_NE(sample.find("[rewards]"), std::string::npos);
    EXPECT_TRUE(config_.ParseString(sample).success);
}

} // namespace test
} // namespace util
} // namespace nodereward
