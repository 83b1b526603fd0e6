// QUORUMFEED - Configuration File Parser Tests
// Copyright (c) 2024 QUORUMFEED Developers
// MIT License

#include <gtest/gtest.h>

#include "quorumfeed/util/config.h"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <unistd.h>

namespace quorumfeed {
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
        char filename[] = "/tmp/quorumfeed_config_test_XXXXXX";
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
// Basic Parsing Tests
// ============================================================================

TEST_F(ConfigTest, ParseEmptyString) {
    auto result = config_.ParseString("");
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.Size(), 0u);
}

TEST_F(ConfigTest, ParseComments) {
    std::string content = R"(
# This is a comment
; This is also a comment
# paymentamount=5
)";
    auto result = config_.ParseString(content);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.Size(), 0u);
}

TEST_F(ConfigTest, ParseKeyValuePairs) {
    auto result = config_.ParseString("paymentamount = 25\ndescription=ETH / USD\n");
    ASSERT_TRUE(result.success);
    EXPECT_EQ(config_.GetInt(ConfigKeys::PAYMENT_AMOUNT, 0), 25);
    EXPECT_EQ(config_.GetString(ConfigKeys::DESCRIPTION, ""), "ETH / USD");
}

TEST_F(ConfigTest, ParseQuotedValues) {
    std::string content = R"(
a="hello world"
b='single quoted'
c="tab\there"
)";
    ASSERT_TRUE(config_.ParseString(content).success);
    EXPECT_EQ(config_.GetString("a", ""), "hello world");
    EXPECT_EQ(config_.GetString("b", ""), "single quoted");
    EXPECT_EQ(config_.GetString("c", ""), "tab\there");
}

TEST_F(ConfigTest, BareKeyIsFlag) {
    ASSERT_TRUE(config_.ParseString("verbose\n").success);
    EXPECT_TRUE(config_.GetBool("verbose", false));
}

TEST_F(ConfigTest, Sections) {
    std::string content = R"(
paymentamount=10

[sim]
oracles=5
rounds=12
)";
    ASSERT_TRUE(config_.ParseString(content).success);
    EXPECT_EQ(config_.GetInt(ConfigKeys::SIM_ORACLES, 0, ConfigKeys::SIM_SECTION), 5);
    EXPECT_EQ(config_.GetInt(ConfigKeys::SIM_ROUNDS, 0, ConfigKeys::SIM_SECTION), 12);
    EXPECT_FALSE(config_.HasKey(ConfigKeys::SIM_ORACLES));

    auto sections = config_.GetSections();
    ASSERT_EQ(sections.size(), 1u);
    EXPECT_EQ(sections[0], "sim");
}

TEST_F(ConfigTest, MissingBracketIsError) {
    auto result = config_.ParseString("ok=1\n[sim\n");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorLine, 2);
}

TEST_F(ConfigTest, InvalidKeyCharacterIsError) {
    auto result = config_.ParseString("bad key=1\n");
    EXPECT_FALSE(result.success);
}

TEST_F(ConfigTest, EmptyKeyIsError) {
    auto result = config_.ParseString("=1\n");
    EXPECT_FALSE(result.success);
}

// ============================================================================
// Typed Getters
// ============================================================================

TEST_F(ConfigTest, IntegersAreStrict) {
    ASSERT_TRUE(config_.ParseString("a=42\nb=-7\nc=12abc\nd=\n").success);
    EXPECT_EQ(config_.TryGetInt("a"), 42);
    EXPECT_EQ(config_.TryGetInt("b"), -7);
    EXPECT_FALSE(config_.TryGetInt("c").has_value());
    EXPECT_FALSE(config_.TryGetInt("d").has_value());
    EXPECT_FALSE(config_.TryGetInt("missing").has_value());
    EXPECT_EQ(config_.GetInt("c", 99), 99);
}

TEST_F(ConfigTest, Booleans) {
    ASSERT_TRUE(config_.ParseString("a=yes\nb=off\nc=maybe\n").success);
    EXPECT_EQ(config_.TryGetBool("a"), true);
    EXPECT_EQ(config_.TryGetBool("b"), false);
    EXPECT_FALSE(config_.TryGetBool("c").has_value());
    EXPECT_TRUE(config_.GetBool("c", true));
}

TEST_F(ConfigTest, Lists) {
    ASSERT_TRUE(config_.ParseString("oracles = a, b ,,c\n").success);
    auto list = config_.GetList("oracles");
    ASSERT_EQ(list.size(), 3u);
    EXPECT_EQ(list[0], "a");
    EXPECT_EQ(list[1], "b");
    EXPECT_EQ(list[2], "c");
}

// ============================================================================
// Environment Expansion
// ============================================================================

TEST_F(ConfigTest, ExpandEnvVars) {
    setenv("QUORUMFEED_TEST_VAR", "feed", 1);
    EXPECT_EQ(ConfigManager::ExpandEnvVars("${QUORUMFEED_TEST_VAR}/x"), "feed/x");
    EXPECT_EQ(ConfigManager::ExpandEnvVars("$QUORUMFEED_TEST_VAR-y"), "feed-y");
    EXPECT_EQ(ConfigManager::ExpandEnvVars("${QUORUMFEED_UNSET_VAR_XYZ}z"), "z");
    EXPECT_EQ(ConfigManager::ExpandEnvVars("cost $"), "cost $");
    unsetenv("QUORUMFEED_TEST_VAR");
}

// ============================================================================
// Files and Command Line
// ============================================================================

TEST_F(ConfigTest, ParseFile) {
    std::string path = CreateTempFile("rewardratex10=250\n[sim]\nfunding=5000\n");
    auto result = config_.ParseFile(path);
    ASSERT_TRUE(result.success) << result.errorMessage;
    EXPECT_EQ(config_.GetInt(ConfigKeys::REWARD_RATE_X10, 0), 250);
    EXPECT_EQ(config_.GetInt(ConfigKeys::SIM_FUNDING, 0, ConfigKeys::SIM_SECTION), 5000);
}

TEST_F(ConfigTest, ParseMissingFile) {
    auto result = config_.ParseFile("/nonexistent/quorumfeed.conf");
    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.errorMessage.empty());
}

TEST_F(ConfigTest, CommandLineForms) {
    const char* argv[] = {"quorumfeed-sim", "-paymentamount=7", "--description", "BTC / USD",
                          "-sim.rounds=3", "extra", "-help"};
    auto result = config_.ParseCommandLine(7, argv);
    ASSERT_TRUE(result.success);

    EXPECT_EQ(config_.GetInt(ConfigKeys::PAYMENT_AMOUNT, 0), 7);
    EXPECT_EQ(config_.GetString(ConfigKeys::DESCRIPTION, ""), "BTC / USD");
    EXPECT_EQ(config_.GetInt(ConfigKeys::SIM_ROUNDS, 0, ConfigKeys::SIM_SECTION), 3);
    EXPECT_TRUE(config_.GetBool("help", false));

    ASSERT_EQ(config_.GetPositionalArgs().size(), 1u);
    EXPECT_EQ(config_.GetPositionalArgs()[0], "extra");
}

TEST_F(ConfigTest, CommandLineOverridesFile) {
    const char* argv[] = {"quorumfeed-sim", "-paymentamount=7"};
    ASSERT_TRUE(config_.ParseCommandLine(2, argv).success);

    std::string path = CreateTempFile("paymentamount=100\nrewardratex10=5\n");
    ASSERT_TRUE(config_.ParseFile(path).success);

    EXPECT_EQ(config_.GetInt(ConfigKeys::PAYMENT_AMOUNT, 0), 7);
    EXPECT_EQ(config_.GetInt(ConfigKeys::REWARD_RATE_X10, 0), 5);
}

TEST_F(ConfigTest, SetAndDump) {
    config_.Set("paymentamount", "3");
    config_.Set("oracles", "4", "sim");

    std::string dump = config_.Dump();
    EXPECT_NE(dump.find("paymentamount=3"), std::string::npos);
    EXPECT_NE(dump.find("[sim]"), std::string::npos);
    EXPECT_NE(dump.find("oracles=4"), std::string::npos);
}

} // namespace test
} // namespace util
} // namespace quorumfeed
