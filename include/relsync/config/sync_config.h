#pragma once

#include <relsync/core/types.h>
#include <relsync/schedule/cron_schedule.h>

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace relsync::config {

/// Name of the config file section read by relsync.
inline constexpr const char* kConfigSection = "relsync";

struct ListenEndpoint {
    std::string host;
    std::uint16_t port{0};
};

/**
 * Parse "host:port". IPv6 hosts must be bracketed ("[::1]:8080"); the brackets are removed.
 */
Result<ListenEndpoint> parseListenAddress(std::string_view addr);

/**
 * Runtime configuration.
 *
 * Sources are layered by the caller from lowest to highest precedence: built-in defaults,
 * applyConfigFile(), applyEnvironment(), then command-line options. validate() must run last; it
 * normalizes some fields and fills the derived ones.
 */
struct SyncConfig {
    std::string rssUrl;
    std::string userId;
    std::string token;
    std::filesystem::path saveDir{"assets"};
    std::string assetsPath{"/assets"};
    std::string domain{"http://localhost:8080"};
    std::string cron{schedule::kDefaultCronExpression};
    std::string listenAddr{"0.0.0.0:8080"};
    std::string logLevel{"info"};
    std::filesystem::path logFile;
    std::string notifyApi{"https://api.telegram.org"};
    std::string userAgent{"Wget/1.21.4"};
    int retryLimit{5};
    int ioThreads{2};
    int workerThreads{4};
    bool once{false};

    // Filled by validate()
    std::uint64_t chatId{0};
    ListenEndpoint listen;

    /**
     * Check required values and formats. Strips a trailing '/' from assetsPath and domain.
     * Errors are InvalidArgument with a message naming the offending setting.
     */
    Result<void> validate();

    /// Base URL under which downloaded files are published, e.g. "http://host:8080/assets".
    [[nodiscard]] std::string publicUrlPrefix() const { return domain + assetsPath; }
};

/**
 * Copy values from a key/value map (one config file section) into cfg. Unknown keys are
 * returned so the caller can warn about them; malformed numbers are errors.
 */
Result<std::vector<std::string>> applyConfigValues(SyncConfig& cfg,
                                                   const std::map<std::string, std::string>& values);

/// Load the [relsync] section of path into cfg. A missing file leaves cfg untouched.
Result<std::vector<std::string>> applyConfigFile(SyncConfig& cfg, const std::filesystem::path& path);

using EnvLookup = std::function<const char*(const char*)>;

/**
 * Apply RELSYNC_* environment variables. lookup defaults to std::getenv.
 */
Result<void> applyEnvironment(SyncConfig& cfg, const EnvLookup& lookup = {});

} // namespace relsync::config
