// cppcheck-suppress-file missingIncludeSystem
#include <gtest/gtest.h>
#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include "commands.hpp"
#include "logging.hpp"

namespace sysattr {
namespace {

class CommandsTest : public ::testing::Test {
  protected:
    void SetUp() override
    {
        static uint64_t counter = 0;
        dir_ = std::filesystem::temp_directory_path() /
               ("sysattr_commands_test_" + std::to_string(getpid()) + "_" + std::to_string(counter++));
        std::filesystem::create_directories(dir_ / "sys");
        logger().set_output(&log_);
    }

    void TearDown() override
    {
        logger().set_output(&std::cerr);
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::string WriteConfig(const std::string& content)
    {
        auto path = dir_ / "sysfs.conf";
        std::ofstream out(path);
        out << content;
        return path.string();
    }

    std::filesystem::path dir_;
    std::ostringstream log_;
};

TEST(OutputFormatTest, LabelsText)
{
    Labels labels{{"class.net.eth0.mtu", "1500"}, {"class.dmi.id.sys_vendor", "LENOVO"}};
    EXPECT_EQ(build_labels_text(labels), "class.dmi.id.sys_vendor=LENOVO\nclass.net.eth0.mtu=1500\n");
}

TEST(OutputFormatTest, LabelsJson)
{
    Labels labels{{"a", "1"}, {"b", ""}};
    EXPECT_EQ(build_labels_json(labels), "{\"a\":\"1\",\"b\":\"\"}");
    EXPECT_EQ(build_labels_json({}), "{}");
}

TEST(OutputFormatTest, FeaturesJson)
{
    Features features;
    features.attributes[kAttributeFeature].elements["class.net.lo.mtu"] = "65536";
    EXPECT_EQ(build_features_json(features),
              "{\"attributes\":{\"attribute\":{\"elements\":{\"class.net.lo.mtu\":\"65536\"}}}}");
}

TEST_F(CommandsTest, LoadConfigReadsFile)
{
    const std::string path = WriteConfig("sysfs_root=" + (dir_ / "sys").string() + "\n[sysfs_whitelist]\nclass/x\n");
    auto config = load_config(path);
    ASSERT_TRUE(config);
    EXPECT_EQ(config->sysfs_root, (dir_ / "sys").string());
    ASSERT_EQ(config->whitelist.size(), 1u);
}

TEST_F(CommandsTest, LoadConfigPropagatesErrors)
{
    const std::string path = WriteConfig("version=abc\n");
    auto config = load_config(path);
    ASSERT_FALSE(config);
    EXPECT_EQ(config.error().code(), ErrorCode::ConfigTypeMismatch);
    EXPECT_NE(log_.str().find("Config error"), std::string::npos);
}

TEST_F(CommandsTest, CheckConfigExitCodes)
{
    EXPECT_EQ(cmd_check_config(""), 1);
    EXPECT_EQ(cmd_check_config(WriteConfig("[sysfs_whitelist]\nclass/net\n")), 0);
    EXPECT_EQ(cmd_check_config(WriteConfig("[unknown]\n")), 1);
}

TEST_F(CommandsTest, DiscoverSucceedsWithMissingAttributes)
{
    const std::string path =
        WriteConfig("sysfs_root=" + (dir_ / "sys").string() + "\n[sysfs_whitelist]\nclass/none/here\n");
    DiscoverOptions options;
    options.config_path = path;
    options.json_output = true;
    EXPECT_EQ(cmd_discover(options), 0);
    EXPECT_EQ(cmd_features(path), 0);
}

TEST_F(CommandsTest, DiscoverFailsOnInvalidConfig)
{
    DiscoverOptions options;
    options.config_path = WriteConfig("max_name_length=ten\n");
    EXPECT_EQ(cmd_discover(options), 1);
    EXPECT_NE(log_.str().find("Discovery failed"), std::string::npos);
}

} // namespace
} // namespace sysattr
