#include <relsync/config/config_helpers.h>
#include <relsync/config/sync_config.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <charconv>
#include <cstdlib>
#include <optional>
#include <system_error>

namespace relsync::config {

namespace {

Error invalid(std::string message) {
    return Error{ErrorCode::InvalidArgument, std::move(message)};
}

template <typename T> std::optional<T> parseNumber(std::string_view s) {
    T v{};
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (s.empty() || ec != std::errc() || ptr != s.data() + s.size())
        return std::nullopt;
    return v;
}

Result<void> assignInt(int& target, std::string_view key, const std::string& value) {
    auto parsed = parseNumber<int>(value);
    if (!parsed)
        return invalid(std::string(key) + ": '" + value + "' is not an integer");
    target = *parsed;
    return Result<void>();
}

Result<bool> parseBool(std::string_view key, const std::string& value) {
    if (value == "true" || value == "1" || value == "yes")
        return true;
    if (value == "false" || value == "0" || value == "no")
        return false;
    return invalid(std::string(key) + ": '" + value + "' is not a boolean");
}

// Shared by the config file and environment layers; key is the config file key.
Result<bool> applyOne(SyncConfig& cfg, const std::string& key, const std::string& value) {
    if (key == "rss_url")
        cfg.rssUrl = value;
    else if (key == "user_id")
        cfg.userId = value;
    else if (key == "token")
        cfg.token = value;
    else if (key == "save_dir")
        cfg.saveDir = expand_tilde(value);
    else if (key == "assets_path")
        cfg.assetsPath = value;
    else if (key == "domain")
        cfg.domain = value;
    else if (key == "cron")
        cfg.cron = value;
    else if (key == "listen_addr")
        cfg.listenAddr = value;
    else if (key == "log_level")
        cfg.logLevel = value;
    else if (key == "log_file")
        cfg.logFile = expand_tilde(value);
    else if (key == "notify_api")
        cfg.notifyApi = value;
    else if (key == "user_agent")
        cfg.userAgent = value;
    else if (key == "retry_limit" || key == "io_threads" || key == "worker_threads") {
        int& target = key == "retry_limit" ? cfg.retryLimit
                      : key == "io_threads" ? cfg.ioThreads
                                            : cfg.workerThreads;
        auto r = assignInt(target, key, value);
        if (!r)
            return r.error();
    } else if (key == "once") {
        auto b = parseBool(key, value);
        if (!b)
            return b.error();
        cfg.once = b.value();
    } else {
        return false;
    }
    return true;
}

struct EnvBinding {
    const char* env;
    const char* key;
};

constexpr std::array<EnvBinding, 11> kEnvBindings = {{
    {"RELSYNC_RSS_URL", "rss_url"},
    {"RELSYNC_USER_ID", "user_id"},
    {"RELSYNC_TOKEN", "token"},
    {"RELSYNC_SAVE_DIR", "save_dir"},
    {"RELSYNC_ASSETS_PATH", "assets_path"},
    {"RELSYNC_DOMAIN", "domain"},
    {"RELSYNC_CRON", "cron"},
    {"RELSYNC_LISTEN_ADDR", "listen_addr"},
    {"RELSYNC_LOG_LEVEL", "log_level"},
    {"RELSYNC_LOG_FILE", "log_file"},
    {"RELSYNC_NOTIFY_API", "notify_api"},
}};

} // namespace

Result<ListenEndpoint> parseListenAddress(std::string_view addr) {
    auto colon = addr.rfind(':');
    if (colon == std::string_view::npos || colon == 0) {
        return invalid("listen address '" + std::string(addr) + "' is not host:port");
    }
    std::string host(addr.substr(0, colon));
    if (host.front() == '[') {
        if (host.size() < 3 || host.back() != ']')
            return invalid("listen address '" + std::string(addr) + "' has a malformed host");
        host = host.substr(1, host.size() - 2);
    } else if (host.find(':') != std::string::npos) {
        return invalid("listen address '" + std::string(addr) +
                       "': IPv6 hosts must be written as [addr]:port");
    }
    auto port = parseNumber<std::uint16_t>(addr.substr(colon + 1));
    if (!port) {
        return invalid("listen address '" + std::string(addr) + "' has an invalid port");
    }
    return ListenEndpoint{std::move(host), *port};
}

Result<void> SyncConfig::validate() {
    if (rssUrl.empty())
        return invalid("rss_url is required");
    if (userId.empty())
        return invalid("user_id is required");
    if (token.empty())
        return invalid("token is required");

    auto id = parseNumber<std::uint64_t>(userId);
    if (!id)
        return invalid("user_id '" + userId + "' must be a non-negative integer");
    chatId = *id;

    if (assetsPath.empty() || assetsPath.front() != '/')
        return invalid("assets_path '" + assetsPath + "' must start with '/'");
    while (!assetsPath.empty() && assetsPath.back() == '/')
        assetsPath.pop_back();

    while (!domain.empty() && domain.back() == '/')
        domain.pop_back();
    if (domain.empty())
        return invalid("domain must not be empty");

    if (saveDir.empty())
        return invalid("save_dir must not be empty");

    auto endpoint = parseListenAddress(listenAddr);
    if (!endpoint)
        return endpoint.error();
    listen = endpoint.value();

    auto parsedCron = schedule::CronSchedule::parse(cron);
    if (!parsedCron)
        return parsedCron.error();

    static constexpr std::array<std::string_view, 5> kLevels = {"trace", "debug", "info", "warn",
                                                                "error"};
    if (std::find(kLevels.begin(), kLevels.end(), logLevel) == kLevels.end())
        return invalid("log_level '" + logLevel + "' must be one of trace/debug/info/warn/error");

    if (retryLimit < 1)
        return invalid("retry_limit must be at least 1");
    if (ioThreads < 1 || workerThreads < 1)
        return invalid("io_threads and worker_threads must be at least 1");

    return Result<void>();
}

Result<std::vector<std::string>> applyConfigValues(SyncConfig& cfg,
                                                   const std::map<std::string, std::string>& values) {
    std::vector<std::string> unknown;
    for (const auto& [key, value] : values) {
        auto applied = applyOne(cfg, key, value);
        if (!applied)
            return applied.error();
        if (!applied.value())
            unknown.push_back(key);
    }
    return unknown;
}

Result<std::vector<std::string>> applyConfigFile(SyncConfig& cfg,
                                                 const std::filesystem::path& path) {
    std::error_code ec;
    if (path.empty() || !std::filesystem::exists(path, ec)) {
        return std::vector<std::string>{};
    }
    spdlog::debug("loading config from {}", path.string());
    return applyConfigValues(cfg, parse_config_section(path, kConfigSection));
}

Result<void> applyEnvironment(SyncConfig& cfg, const EnvLookup& lookup) {
    for (const auto& binding : kEnvBindings) {
        const char* value = lookup ? lookup(binding.env) : std::getenv(binding.env);
        if (!value || !*value)
            continue;
        auto applied = applyOne(cfg, binding.key, value);
        if (!applied)
            return applied.error();
    }
    return Result<void>();
}

} // namespace relsync::config
