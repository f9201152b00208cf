// cppcheck-suppress-file missingIncludeSystem
// cppcheck-suppress-file missingInclude
#include <gtest/gtest.h>

#include <filesystem>
#include <string>

#include "config.hpp"

namespace sysattr {
namespace {

std::string resolve_fixture(const std::string& name)
{
    // Try relative to build directory
    std::string path = "../tests/fixtures/config/" + name;
    if (std::filesystem::exists(path)) {
        return path;
    }
    path = (std::filesystem::path(SYSATTR_TEST_FIXTURE_DIR) / "config" / name).string();
    if (std::filesystem::exists(path)) {
        return path;
    }
    return "../tests/fixtures/config/" + name;
}

struct GoldenConfigCase {
    std::string fixture_name;
    std::string expected_root;
    size_t expected_max_name_length;
    size_t expected_whitelist;
    size_t expected_warnings;
};

class ConfigGoldenTest : public ::testing::TestWithParam<GoldenConfigCase> {};

TEST_P(ConfigGoldenTest, MatchesExpectedEntries)
{
    const auto& tc = GetParam();
    const std::string path = resolve_fixture(tc.fixture_name);
    ASSERT_TRUE(std::filesystem::exists(path)) << "Fixture not found: " << path;

    ConfigIssues issues;
    auto result = parse_config_file(path, issues);
    ASSERT_TRUE(result) << "Parse failed: " << (issues.has_errors() ? issues.errors[0] : "unknown");
    EXPECT_FALSE(issues.has_errors());

    EXPECT_EQ(result->version, 1);
    EXPECT_EQ(result->sysfs_root, tc.expected_root);
    EXPECT_EQ(result->max_name_length, tc.expected_max_name_length);
    EXPECT_EQ(result->whitelist.size(), tc.expected_whitelist);
    EXPECT_EQ(issues.warnings.size(), tc.expected_warnings);
}

INSTANTIATE_TEST_SUITE_P(GoldenVectors, ConfigGoldenTest,
                         ::testing::Values(GoldenConfigCase{"minimal.conf", "", kAttributeNameMax, 1, 0},
                                           GoldenConfigCase{"defaults_only.conf", "", kAttributeNameMax, 1, 0},
                                           GoldenConfigCase{"full.conf", "/host-sys", 40, 4, 0},
                                           GoldenConfigCase{"sys_prefixed.conf", "", kAttributeNameMax, 2, 2},
                                           GoldenConfigCase{"inline_comments.conf", "/host-sys", kAttributeNameMax, 2,
                                                            0}),
                         [](const ::testing::TestParamInfo<GoldenConfigCase>& info) {
                             std::string name = info.param.fixture_name;
                             auto pos = name.rfind('.');
                             if (pos != std::string::npos) {
                                 name = name.substr(0, pos);
                             }
                             return name;
                         });

TEST(ConfigTest, DefaultWhitelistIsSingleEmptyEntry)
{
    SysfsConfig config;
    ASSERT_EQ(config.whitelist.size(), 1u);
    EXPECT_EQ(config.whitelist[0], "");
    EXPECT_EQ(config.max_name_length, kAttributeNameMax);
}

TEST(ConfigTest, WhitelistKeepsOrder)
{
    ConfigIssues issues;
    auto result = parse_config_string("[sysfs_whitelist]\nb\na\nc\n", issues);
    ASSERT_TRUE(result);
    ASSERT_EQ(result->whitelist.size(), 3u);
    EXPECT_EQ(result->whitelist[0], "b");
    EXPECT_EQ(result->whitelist[1], "a");
    EXPECT_EQ(result->whitelist[2], "c");
}

TEST(ConfigTest, SysPrefixIsKeptAndWarned)
{
    ConfigIssues issues;
    auto result = parse_config_string("[sysfs_whitelist]\n/sys/class/net\n/sysfoo\n", issues);
    ASSERT_TRUE(result);
    EXPECT_EQ(result->whitelist[0], "/sys/class/net");
    ASSERT_EQ(issues.warnings.size(), 1u);
    EXPECT_NE(issues.warnings[0].find("/sys/class/net"), std::string::npos);
}

TEST(ConfigTest, InlineCommentsAreNotPartOfValues)
{
    ConfigIssues issues;
    auto result = parse_config_string("sysfs_root=/host-sys   # mounted by the daemonset\n"
                                      "max_name_length=40\t# shorter keys\n"
                                      "[sysfs_whitelist]\n"
                                      "class/net/eth0/mtu  # link MTU\n"
                                      "class/net/eth#1/mtu\n",
                                      issues);
    ASSERT_TRUE(result) << (issues.has_errors() ? issues.errors[0] : "unknown");
    EXPECT_EQ(result->sysfs_root, "/host-sys");
    EXPECT_EQ(result->max_name_length, 40u);
    ASSERT_EQ(result->whitelist.size(), 2u);
    EXPECT_EQ(result->whitelist[0], "class/net/eth0/mtu");
    // A '#' inside a token is kept.
    EXPECT_EQ(result->whitelist[1], "class/net/eth#1/mtu");
}

TEST(ConfigTest, NonIntegerVersionIsTypeMismatch)
{
    ConfigIssues issues;
    auto result = parse_config_string("version=one\n", issues);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigTypeMismatch);
    EXPECT_TRUE(issues.type_mismatch);
}

TEST(ConfigTest, RelativeRootIsTypeMismatch)
{
    ConfigIssues issues;
    auto result = parse_config_string("sysfs_root=host-sys\n", issues);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST(ConfigTest, OutOfRangeNameLengthIsRejected)
{
    ConfigIssues issues;
    auto result = parse_config_string("max_name_length=64\n", issues);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigParseFailed);
    EXPECT_FALSE(issues.type_mismatch);
}

TEST(ConfigTest, UnsupportedVersionIsRejected)
{
    ConfigIssues issues;
    auto result = parse_config_string("version=2\n", issues);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigParseFailed);
}

TEST(ConfigTest, UnknownKeysAndSectionsAreErrors)
{
    ConfigIssues issues;
    auto result = parse_config_string("colour=blue\n[deny_path]\n/etc\n", issues);
    ASSERT_FALSE(result);
    EXPECT_EQ(issues.errors.size(), 3u);
}

TEST(ConfigTest, MissingFileFails)
{
    ConfigIssues issues;
    auto result = parse_config_file("/nonexistent/sysattr/sysfs.conf", issues);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigParseFailed);
    EXPECT_TRUE(issues.has_errors());
}

TEST(ConfigTest, CloneProducesIndependentCopy)
{
    SysfsConfig config;
    config.whitelist = {"class/net"};
    auto copy = config.clone();
    config.whitelist.clear();

    auto* typed = dynamic_cast<SysfsConfig*>(copy.get());
    ASSERT_NE(typed, nullptr);
    ASSERT_EQ(typed->whitelist.size(), 1u);
    EXPECT_EQ(typed->whitelist[0], "class/net");
}

} // namespace
} // namespace sysattr
