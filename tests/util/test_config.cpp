// ECSIG - Configuration File Parser Tests
// Copyright (c) 2024 ECSIG Developers
// MIT License

#include <gtest/gtest.h>

#include "ecsig/util/config.h"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

#include <unistd.h>

namespace ecsig {
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
        char filename[] = "/tmp/ecsig_config_test_XXXXXX";
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
# curve=p256
)";
    auto result = config_.ParseString(content);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.Size(), 0u);
}

TEST_F(ConfigTest, ParseKeyValuePairs) {
    std::string content = R"(
curve=p384
  loglevel  =  debug
format = raw
)";
    auto result = config_.ParseString(content);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.Size(), 3u);
    EXPECT_EQ(config_.GetString(ConfigKeys::CURVE, "secp256k1"), "p384");
    EXPECT_EQ(config_.GetString(ConfigKeys::LOGLEVEL, "warn"), "debug");
    EXPECT_EQ(config_.GetString(ConfigKeys::FORMAT, "hex"), "raw");
}

TEST_F(ConfigTest, ParseQuotedValue) {
    std::string content = R"(
key1="value with spaces"
key2='single quoted'
key3="with \"escaped\" quotes"
)";
    auto result = config_.ParseString(content);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.GetString("key1", ""), "value with spaces");
    EXPECT_EQ(config_.GetString("key2", ""), "single quoted");
    EXPECT_EQ(config_.GetString("key3", ""), "with \"escaped\" quotes");
}

TEST_F(ConfigTest, ParseFlagsAndNegation) {
    config_.AllowKey(ConfigKeys::NORMALIZE);
    config_.AllowKey("verbose");
    std::string content = R"(
normalize
noverbose
)";
    auto result = config_.ParseString(content);
    EXPECT_TRUE(result.success);
    EXPECT_TRUE(config_.GetBool(ConfigKeys::NORMALIZE, false));
    EXPECT_FALSE(config_.GetBool("verbose", true));
    EXPECT_FALSE(config_.HasKey("noverbose"));
    EXPECT_FALSE(config_.HasKey("rmalize"));
}

TEST_F(ConfigTest, ParseNegationWithoutRegisteredKeys) {
    config_.ParseString("noverbose\n");
    EXPECT_EQ(config_.TryGetBool("verbose"), std::optional<bool>(false));
}

TEST_F(ConfigTest, ParseSections) {
    std::string content = R"(
curve=secp256k1
[tool]
curve=p521
)";
    auto result = config_.ParseString(content);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.GetString("curve", ""), "secp256k1");
    EXPECT_EQ(config_.GetString("curve", "", "tool"), "p521");

    auto keys = config_.GetKeys("tool");
    ASSERT_EQ(keys.size(), 1u);
    EXPECT_EQ(keys[0], "curve");
}

TEST_F(ConfigTest, ParseLineContinuation) {
    auto result = config_.ParseString("logfile=/tmp/\\\necsig.log\n");
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.GetString(ConfigKeys::LOGFILE, ""), "/tmp/ecsig.log");
}

// ============================================================================
// Error Tests
// ============================================================================

TEST_F(ConfigTest, UnterminatedSectionFails) {
    auto result = config_.ParseString("a=1\n[tool\n", "test.conf");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorFile, "test.conf");
    EXPECT_EQ(result.errorLine, 2);
}

TEST_F(ConfigTest, InvalidKeyFails) {
    auto result = config_.ParseString("bad key=1");
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.errorMessage.find("Invalid character"), std::string::npos);
}

TEST_F(ConfigTest, EmptyKeyFails) {
    auto result = config_.ParseString("=value");
    EXPECT_FALSE(result.success);
}

TEST_F(ConfigTest, MissingFileFails) {
    auto result = config_.ParseFile("/nonexistent/ecsig/config.conf");
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.errorMessage.find("Cannot open"), std::string::npos);
}

// ============================================================================
// Value Conversion Tests
// ============================================================================

TEST_F(ConfigTest, BooleanValues) {
    config_.ParseString("a=yes\nb=off\nc=1\nd=maybe\n");
    EXPECT_EQ(config_.TryGetBool("a"), std::optional<bool>(true));
    EXPECT_EQ(config_.TryGetBool("b"), std::optional<bool>(false));
    EXPECT_EQ(config_.TryGetBool("c"), std::optional<bool>(true));
    EXPECT_FALSE(config_.TryGetBool("d").has_value());
    EXPECT_TRUE(config_.GetBool("d", true));
    EXPECT_FALSE(config_.TryGetBool("missing").has_value());
}

TEST_F(ConfigTest, BooleanValuesIgnoreCase) {
    config_.ParseString("a=TRUE\nb=Off\nc=\xC3\xA9t\xC3\xA9\n");
    EXPECT_EQ(config_.TryGetBool("a"), std::optional<bool>(true));
    EXPECT_EQ(config_.TryGetBool("b"), std::optional<bool>(false));
    EXPECT_FALSE(config_.TryGetBool("c").has_value());
}

TEST_F(ConfigTest, IntegerValues) {
    config_.ParseString("a=42\nb=-7\nc=12abc\n");
    EXPECT_EQ(config_.GetInt("a", 0), 42);
    EXPECT_EQ(config_.GetInt("b", 0), -7);
    EXPECT_FALSE(config_.TryGetInt("c").has_value());
    EXPECT_EQ(config_.GetInt("missing", 99), 99);
}

TEST_F(ConfigTest, EnvironmentExpansion) {
    setenv("ECSIG_TEST_CURVE", "p256", 1);
    config_.ParseString("curve=${ECSIG_TEST_CURVE}\nother=$ECSIG_TEST_CURVE-x\n");
    EXPECT_EQ(config_.GetString("curve", ""), "p256");
    EXPECT_EQ(config_.GetString("other", ""), "p256-x");
    unsetenv("ECSIG_TEST_CURVE");
}

TEST_F(ConfigTest, ExpandTilde) {
    setenv("HOME", "/home/ecsig", 1);
    EXPECT_EQ(ConfigManager::ExpandTilde("~/.ecsig.conf"), "/home/ecsig/.ecsig.conf");
    EXPECT_EQ(ConfigManager::ExpandTilde("/etc/ecsig.conf"), "/etc/ecsig.conf");
    EXPECT_EQ(ConfigManager::ExpandTilde("~user/x"), "~user/x");
}

// ============================================================================
// Priority Tests
// ============================================================================

TEST_F(ConfigTest, DefaultsAreOverridden) {
    config_.SetDefault("curve", "secp256k1");
    EXPECT_EQ(config_.GetString("curve", ""), "secp256k1");

    config_.ParseString("curve=p384");
    EXPECT_EQ(config_.GetString("curve", ""), "p384");
}

TEST_F(ConfigTest, SetDefaultDoesNotReplaceValue) {
    config_.Set("curve", "p521");
    config_.SetDefault("curve", "secp256k1");
    EXPECT_EQ(config_.GetString("curve", ""), "p521");
}

TEST_F(ConfigTest, FileDoesNotOverrideWithoutFlag) {
    config_.ParseString("curve=p256");
    config_.ParseString("curve=p384");
    EXPECT_EQ(config_.GetString("curve", ""), "p256");

    config_.ParseString("curve=p384", "<string>", true);
    EXPECT_EQ(config_.GetString("curve", ""), "p384");
}

TEST_F(ConfigTest, ParseFileAndInclude) {
    std::string inner = CreateTempFile("format=raw\n");
    std::string outer = CreateTempFile("curve=p521\ninclude " + inner + "\n");

    auto result = config_.ParseFile(outer);
    ASSERT_TRUE(result.success) << result.errorMessage;
    EXPECT_EQ(config_.GetString("curve", ""), "p521");
    EXPECT_EQ(config_.GetString("format", ""), "raw");
}

// ============================================================================
// Command Line Tests
// ============================================================================

TEST_F(ConfigTest, CommandLineOptionsAndPositionals) {
    config_.AllowKey(ConfigKeys::NORMALIZE);
    const char* argv[] = {"ecsig-tool", "-curve=p256", "--normalize", "fixed2der", "abcd"};
    auto result = config_.ParseCommandLine(5, argv);
    ASSERT_TRUE(result.success);

    EXPECT_EQ(config_.GetString("curve", ""), "p256");
    EXPECT_TRUE(config_.GetBool("normalize", false));

    const auto& positional = config_.GetPositionalArgs();
    ASSERT_EQ(positional.size(), 2u);
    EXPECT_EQ(positional[0], "fixed2der");
    EXPECT_EQ(positional[1], "abcd");
}

TEST_F(ConfigTest, CommandLineNegation) {
    const char* argv[] = {"ecsig-tool", "-nonormalize"};
    config_.ParseCommandLine(2, argv);
    EXPECT_EQ(config_.TryGetBool("normalize"), std::optional<bool>(false));
}

TEST_F(ConfigTest, CommandLineFlagStartingWithNo) {
    config_.AllowKey(ConfigKeys::NORMALIZE);
    config_.AllowKey(ConfigKeys::CURVE);

    const char* argv[] = {"ecsig-tool", "-normalize", "fixed2der"};
    ASSERT_TRUE(config_.ParseCommandLine(3, argv).success);

    EXPECT_EQ(config_.TryGetBool(ConfigKeys::NORMALIZE), std::optional<bool>(true));
    EXPECT_FALSE(config_.HasKey("rmalize"));
    EXPECT_TRUE(config_.Validate().empty());
}

TEST_F(ConfigTest, CommandLineNegatesRegisteredFlag) {
    config_.AllowKey(ConfigKeys::NORMALIZE);

    const char* argv[] = {"ecsig-tool", "-nonormalize"};
    ASSERT_TRUE(config_.ParseCommandLine(2, argv).success);
    EXPECT_EQ(config_.TryGetBool(ConfigKeys::NORMALIZE), std::optional<bool>(false));
    EXPECT_FALSE(config_.HasKey("rmalize"));
}

TEST_F(ConfigTest, CommandLineUnknownNoPrefixKept) {
    config_.AllowKey(ConfigKeys::CURVE);

    const char* argv[] = {"ecsig-tool", "-nothing"};
    ASSERT_TRUE(config_.ParseCommandLine(2, argv).success);
    EXPECT_TRUE(config_.HasKey("nothing"));
    EXPECT_FALSE(config_.HasKey("thing"));
    EXPECT_EQ(config_.Validate().size(), 1u);
}

TEST_F(ConfigTest, LoneDashIsPositional) {
    const char* argv[] = {"ecsig-tool", "fixed2der", "-"};
    auto result = config_.ParseCommandLine(3, argv);
    ASSERT_TRUE(result.success);

    const auto& positional = config_.GetPositionalArgs();
    ASSERT_EQ(positional.size(), 2u);
    EXPECT_EQ(positional[1], "-");
}

TEST_F(ConfigTest, DashesAloneFail) {
    const char* argv[] = {"ecsig-tool", "---"};
    EXPECT_FALSE(config_.ParseCommandLine(2, argv).success);
}

TEST_F(ConfigTest, CommandLineBeatsFile) {
    const char* argv[] = {"ecsig-tool", "-curve=p384"};
    config_.ParseCommandLine(2, argv);
    config_.ParseString("curve=p256");
    EXPECT_EQ(config_.GetString("curve", ""), "p384");
}

TEST_F(ConfigTest, DoubleDashEndsOptions) {
    const char* argv[] = {"ecsig-tool", "--", "-notanoption"};
    config_.ParseCommandLine(3, argv);
    EXPECT_FALSE(config_.HasKey("notanoption"));
    ASSERT_EQ(config_.GetPositionalArgs().size(), 1u);
    EXPECT_EQ(config_.GetPositionalArgs()[0], "-notanoption");
}

TEST_F(ConfigTest, CommandLineRejectsBadKey) {
    const char* argv[] = {"ecsig-tool", "-cur ve=1"};
    auto result = config_.ParseCommandLine(2, argv);
    EXPECT_FALSE(result.success);
}

// ============================================================================
// Validation Tests
// ============================================================================

TEST_F(ConfigTest, ValidateReportsUnknownKeys) {
    config_.AllowKey("curve");
    config_.ParseString("curve=p256\ncurv=p384\n", "user.conf");

    auto errors = config_.Validate();
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_NE(errors[0].find("curv"), std::string::npos);
    EXPECT_NE(errors[0].find("user.conf"), std::string::npos);
}

TEST_F(ConfigTest, DumpShowsSources) {
    config_.SetDefault("loglevel", "warn");
    config_.ParseString("curve=p256", "user.conf");
    std::string dump = config_.Dump();
    EXPECT_NE(dump.find("curve=p256  # user.conf:1"), std::string::npos);
    EXPECT_NE(dump.find("loglevel=warn  # (default)"), std::string::npos);
}

} // namespace test
} // namespace util
} // namespace ecsig
