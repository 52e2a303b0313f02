#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <CLI/CLI.hpp>

#include <relsync/config/config_helpers.h>
#include <relsync/config/sync_config.h>
#include <relsync/sync/sync_engine.h>

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

void configure_logging(const relsync::config::SyncConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    if (!config.logFile.empty()) {
        try {
            if (config.logFile.has_parent_path())
                std::filesystem::create_directories(config.logFile.parent_path());
            // Use rotating file sink to keep logs bounded
            const size_t max_size = 10 * 1024 * 1024; // 10MB per file
            const size_t max_files = 5;               // Keep 5 rotated files
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.logFile.string(), max_size, max_files));
        } catch (const std::exception& e) {
            std::cerr << "relsync: cannot open log file " << config.logFile.string() << ": "
                      << e.what() << "; logging to console only\n";
        }
    }

    auto logger = std::make_shared<spdlog::logger>("relsync", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);
    spdlog::flush_on(spdlog::level::info);

    if (config.logLevel == "trace") {
        spdlog::set_level(spdlog::level::trace);
    } else if (config.logLevel == "debug") {
        spdlog::set_level(spdlog::level::debug);
    } else if (config.logLevel == "info") {
        spdlog::set_level(spdlog::level::info);
    } else if (config.logLevel == "warn") {
        spdlog::set_level(spdlog::level::warn);
    } else if (config.logLevel == "error") {
        spdlog::set_level(spdlog::level::err);
    }
}

} // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"relsync - mirror the latest release of an RSS feed and announce it"};

    // Command-line values are kept apart and applied last so they override env and file.
    relsync::config::SyncConfig cli;
    std::string configPath;
    std::string saveDir;
    std::string logFile;

    auto* rssOpt = app.add_option("rss_url", cli.rssUrl, "Release feed URL");
    auto* userOpt = app.add_option("user_id", cli.userId, "Telegram chat id to notify");
    auto* tokenOpt = app.add_option("token", cli.token, "Telegram bot token");

    app.add_option("--config", configPath, "Configuration file path");
    auto* saveDirOpt = app.add_option("--save-dir", saveDir, "Directory downloads are saved to");
    auto* assetsOpt =
        app.add_option("--assets-path", cli.assetsPath, "URL path the save directory is served at");
    auto* domainOpt =
        app.add_option("--domain", cli.domain, "Public base URL used in download links");
    auto* cronOpt = app.add_option("--cron", cli.cron,
                                   "Check schedule: sec min hour day month weekday [year]");
    auto* listenOpt =
        app.add_option("--listen-addr", cli.listenAddr, "Static file server address (host:port)");
    auto* levelOpt =
        app.add_option("--log-level", cli.logLevel, "Log level (trace/debug/info/warn/error)");
    auto* logFileOpt = app.add_option("--log-file", logFile, "Log file path");
    auto* notifyOpt =
        app.add_option("--notify-api", cli.notifyApi, "Telegram bot API base URL");
    auto* agentOpt = app.add_option("--user-agent", cli.userAgent, "HTTP User-Agent");
    auto* retryOpt =
        app.add_option("--retry-limit", cli.retryLimit, "Attempts per download before giving up")
            ->check(CLI::PositiveNumber);
    bool once = false;
    app.add_flag("--once", once, "Run a single check, wait for its download and exit");

    CLI11_PARSE(app, argc, argv);

    relsync::config::SyncConfig config;
    const auto resolvedConfigPath = relsync::config::get_config_path(configPath);
    auto fromFile = relsync::config::applyConfigFile(config, resolvedConfigPath);
    if (!fromFile) {
        std::cerr << "relsync: " << resolvedConfigPath.string() << ": "
                  << fromFile.error().message << "\n";
        return 1;
    }
    if (auto env = relsync::config::applyEnvironment(config); !env) {
        std::cerr << "relsync: " << env.error().message << "\n";
        return 1;
    }

    if (*rssOpt)
        config.rssUrl = cli.rssUrl;
    if (*userOpt)
        config.userId = cli.userId;
    if (*tokenOpt)
        config.token = cli.token;
    if (*saveDirOpt)
        config.saveDir = saveDir;
    if (*assetsOpt)
        config.assetsPath = cli.assetsPath;
    if (*domainOpt)
        config.domain = cli.domain;
    if (*cronOpt)
        config.cron = cli.cron;
    if (*listenOpt)
        config.listenAddr = cli.listenAddr;
    if (*levelOpt)
        config.logLevel = cli.logLevel;
    if (*logFileOpt)
        config.logFile = logFile;
    if (*notifyOpt)
        config.notifyApi = cli.notifyApi;
    if (*agentOpt)
        config.userAgent = cli.userAgent;
    if (*retryOpt)
        config.retryLimit = cli.retryLimit;
    if (once)
        config.once = true;

    if (auto valid = config.validate(); !valid) {
        std::cerr << "relsync: " << valid.error().message << "\n";
        return 1;
    }

    configure_logging(config);
    for (const auto& key : fromFile.value()) {
        spdlog::warn("ignoring unknown config key '{}' in {}", key, resolvedConfigPath.string());
    }

    spdlog::info("starting");
    try {
        relsync::sync::SyncEngine engine(config);

        if (config.once) {
            auto outcome = engine.runOnce();
            if (!outcome) {
                spdlog::error("sync failed: {}", outcome.error().message);
                spdlog::info("stopped");
                return 1;
            }
            spdlog::info("cycle finished: {}", relsync::sync::toString(outcome.value()));
            spdlog::info("stopped");
            return outcome.value() == relsync::sync::CycleOutcome::ResolutionFailed ? 1 : 0;
        }

        auto result = engine.run();
        if (!result) {
            spdlog::error("Failed to start: {}", result.error().message);
            return 1;
        }
    } catch (const std::exception& e) {
        spdlog::error("relsync error: {}", e.what());
        return 1;
    }

    spdlog::info("stopped");
    return 0;
}
