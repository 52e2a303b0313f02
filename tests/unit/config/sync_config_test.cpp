#include <gtest/gtest.h>
#include <relsync/config/sync_config.h>

#include "common/test_helpers.h"

#include <filesystem>
#include <map>
#include <string>

using namespace relsync;
using namespace relsync::config;
namespace fs = std::filesystem;

namespace {

SyncConfig minimalConfig() {
    SyncConfig cfg;
    cfg.rssUrl = "https://example.org/releases.rss";
    cfg.userId = "424242";
    cfg.token = "123456:ABC";
    return cfg;
}

} // namespace

TEST(SyncConfigTest, DefaultsValidate) {
    auto cfg = minimalConfig();
    auto r = cfg.validate();
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_EQ(cfg.chatId, 424242u);
    EXPECT_EQ(cfg.listen.host, "0.0.0.0");
    EXPECT_EQ(cfg.listen.port, 8080);
    EXPECT_EQ(cfg.cron, schedule::kDefaultCronExpression);
    EXPECT_EQ(cfg.saveDir, fs::path("assets"));
    EXPECT_EQ(cfg.retryLimit, 5);
    EXPECT_EQ(cfg.publicUrlPrefix(), "http://localhost:8080/assets");
}

TEST(SyncConfigTest, RequiredValues) {
    for (auto clear : {&SyncConfig::rssUrl, &SyncConfig::userId, &SyncConfig::token}) {
        auto cfg = minimalConfig();
        cfg.*clear = "";
        auto r = cfg.validate();
        ASSERT_FALSE(r);
        EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
        EXPECT_NE(r.error().message.find("required"), std::string::npos);
    }
}

TEST(SyncConfigTest, UserIdMustBeNumeric) {
    auto cfg = minimalConfig();
    cfg.userId = "@someone";
    EXPECT_FALSE(cfg.validate());
}

TEST(SyncConfigTest, NormalizesTrailingSlashes) {
    auto cfg = minimalConfig();
    cfg.assetsPath = "/files/";
    cfg.domain = "https://mirror.example/";
    ASSERT_TRUE(cfg.validate());
    EXPECT_EQ(cfg.assetsPath, "/files");
    EXPECT_EQ(cfg.domain, "https://mirror.example");
    EXPECT_EQ(cfg.publicUrlPrefix(), "https://mirror.example/files");
}

TEST(SyncConfigTest, AssetsPathMustBeAbsolute) {
    auto cfg = minimalConfig();
    cfg.assetsPath = "assets";
    EXPECT_FALSE(cfg.validate());
}

TEST(SyncConfigTest, RejectsBadValues) {
    auto cfg = minimalConfig();
    cfg.cron = "every minute";
    EXPECT_FALSE(cfg.validate());

    cfg = minimalConfig();
    cfg.logLevel = "verbose";
    EXPECT_FALSE(cfg.validate());

    cfg = minimalConfig();
    cfg.retryLimit = 0;
    EXPECT_FALSE(cfg.validate());

    cfg = minimalConfig();
    cfg.listenAddr = "8080";
    EXPECT_FALSE(cfg.validate());
}

TEST(ListenAddressTest, Parses) {
    auto v4 = parseListenAddress("127.0.0.1:9000");
    ASSERT_TRUE(v4);
    EXPECT_EQ(v4.value().host, "127.0.0.1");
    EXPECT_EQ(v4.value().port, 9000);

    auto v6 = parseListenAddress("[::1]:8080");
    ASSERT_TRUE(v6);
    EXPECT_EQ(v6.value().host, "::1");
    EXPECT_EQ(v6.value().port, 8080);

    EXPECT_FALSE(parseListenAddress(":8080"));
    EXPECT_FALSE(parseListenAddress("host:"));
    EXPECT_FALSE(parseListenAddress("host:70000"));
    EXPECT_FALSE(parseListenAddress("::1:8080"));
    EXPECT_FALSE(parseListenAddress("[]:8080"));
}

TEST(ApplyConfigValuesTest, AppliesKnownAndReportsUnknown) {
    SyncConfig cfg;
    std::map<std::string, std::string> values{{"rss_url", "https://example.org/feed"},
                                              {"retry_limit", "7"},
                                              {"once", "true"},
                                              {"colour", "blue"}};
    auto r = applyConfigValues(cfg, values);
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_EQ(cfg.rssUrl, "https://example.org/feed");
    EXPECT_EQ(cfg.retryLimit, 7);
    EXPECT_TRUE(cfg.once);
    ASSERT_EQ(r.value().size(), 1u);
    EXPECT_EQ(r.value()[0], "colour");
}

TEST(ApplyConfigValuesTest, MalformedNumberIsError) {
    SyncConfig cfg;
    auto r = applyConfigValues(cfg, {{"retry_limit", "five"}});
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);

    r = applyConfigValues(cfg, {{"once", "maybe"}});
    ASSERT_FALSE(r);
}

TEST(ApplyConfigFileTest, MissingFileLeavesDefaults) {
    SyncConfig cfg;
    auto r = applyConfigFile(cfg, "/nonexistent/relsync/config.toml");
    ASSERT_TRUE(r);
    EXPECT_TRUE(r.value().empty());
    EXPECT_EQ(cfg.assetsPath, "/assets");
}

TEST(ApplyConfigFileTest, ReadsSection) {
    auto dir = relsync::tests::make_temp_dir("relsync_cfgfile_");
    auto path = relsync::tests::write_file(dir / "config.toml", R"([relsync]
rss_url = "https://example.org/feed"
listen_addr = "127.0.0.1:9999"
)");
    SyncConfig cfg;
    auto r = applyConfigFile(cfg, path);
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_EQ(cfg.rssUrl, "https://example.org/feed");
    EXPECT_EQ(cfg.listenAddr, "127.0.0.1:9999");

    std::error_code ec;
    fs::remove_all(dir, ec);
}

TEST(ApplyEnvironmentTest, UsesLookup) {
    std::map<std::string, std::string> env{{"RELSYNC_RSS_URL", "https://env.example/feed"},
                                           {"RELSYNC_CRON", "0 * * * * *"},
                                           {"RELSYNC_TOKEN", ""}};
    SyncConfig cfg;
    cfg.token = "from-file";
    auto r = applyEnvironment(cfg, [&env](const char* name) -> const char* {
        auto it = env.find(name);
        return it == env.end() ? nullptr : it->second.c_str();
    });
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_EQ(cfg.rssUrl, "https://env.example/feed");
    EXPECT_EQ(cfg.cron, "0 * * * * *");
    // Empty variables do not override.
    EXPECT_EQ(cfg.token, "from-file");
}
