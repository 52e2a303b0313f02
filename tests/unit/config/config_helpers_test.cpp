#include <gtest/gtest.h>
#include <relsync/config/config_helpers.h>

#include "common/test_helpers.h"

#include <cstdlib>
#include <filesystem>

using namespace relsync::config;
namespace fs = std::filesystem;

class ConfigHelpersTest : public ::testing::Test {
protected:
    void SetUp() override { dir_ = relsync::tests::make_temp_dir("relsync_cfg_"); }
    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    fs::path dir_;
};

TEST_F(ConfigHelpersTest, TrimAndUnquote) {
    std::string s = "  \tvalue \n";
    trim(s);
    EXPECT_EQ(s, "value");
    EXPECT_EQ(unquote("\"quoted\""), "quoted");
    EXPECT_EQ(unquote(" 'single' "), "single");
    EXPECT_EQ(unquote("\"unbalanced"), "\"unbalanced");
    EXPECT_EQ(unquote("bare"), "bare");
}

TEST_F(ConfigHelpersTest, ReadsOnlyRequestedSection) {
    auto path = relsync::tests::write_file(dir_ / "config.toml", R"(# relsync configuration
[other]
rss_url = "https://wrong.example/feed"

[relsync]
rss_url = "https://example.org/releases.rss"   # upstream feed
user_id = 424242
token = 'abc:def#not-a-comment'
cron = "0 */5 * * * *"

[later]
token = "ignored"
)");

    auto values = parse_config_section(path, "relsync");
    ASSERT_EQ(values.size(), 4u);
    EXPECT_EQ(values["rss_url"], "https://example.org/releases.rss");
    EXPECT_EQ(values["user_id"], "424242");
    EXPECT_EQ(values["token"], "abc:def#not-a-comment");
    EXPECT_EQ(values["cron"], "0 */5 * * * *");
}

TEST_F(ConfigHelpersTest, DottedKeysAtTopLevel) {
    auto path = relsync::tests::write_file(dir_ / "config.toml", R"(relsync.domain = "https://mirror.example"
relsync.save_dir = "/var/lib/relsync"
other.domain = "nope"
)");
    auto values = parse_config_section(path, "relsync");
    ASSERT_EQ(values.size(), 2u);
    EXPECT_EQ(values["domain"], "https://mirror.example");
    EXPECT_EQ(values["save_dir"], "/var/lib/relsync");
}

TEST_F(ConfigHelpersTest, MissingFileIsEmpty) {
    EXPECT_TRUE(parse_config_section(dir_ / "absent.toml", "relsync").empty());
}

TEST_F(ConfigHelpersTest, ConfigPathOverrideAndXdg) {
    EXPECT_EQ(get_config_path("/etc/relsync.toml"), fs::path("/etc/relsync.toml"));

    const char* saved = std::getenv("XDG_CONFIG_HOME");
    std::string savedValue = saved ? saved : "";
    ::setenv("XDG_CONFIG_HOME", dir_.c_str(), 1);
    EXPECT_EQ(get_config_path(), dir_ / "relsync" / "config.toml");
    if (saved)
        ::setenv("XDG_CONFIG_HOME", savedValue.c_str(), 1);
    else
        ::unsetenv("XDG_CONFIG_HOME");
}
