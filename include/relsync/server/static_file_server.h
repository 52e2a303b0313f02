#pragma once

#include <relsync/core/types.h>

#include <utility> // Boost 1.74 awaitable.hpp uses std::exchange without including it

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace relsync::server {

namespace http = boost::beast::http;
namespace beast = boost::beast;
using tcp = boost::asio::ip::tcp;

/// Inclusive byte range of a file.
struct ByteRange {
    std::uint64_t first{0};
    std::uint64_t last{0};

    [[nodiscard]] std::uint64_t length() const noexcept { return last - first + 1; }
};

/**
 * Decode %XX escapes. Returns nullopt for a truncated or non-hex escape or an encoded NUL.
 */
std::optional<std::string> percentDecode(std::string_view in);

/**
 * Map a request target onto a file below root.
 *
 * The query string is dropped and the path percent-decoded. Errors:
 * - InvalidArgument: undecodable target or a ".." segment (reply 400)
 * - NotFound: the path is not below assetsPath or names the prefix itself (reply 404)
 *
 * assetsPath is expected without a trailing slash; an empty assetsPath serves from "/".
 */
Result<std::filesystem::path> resolveTarget(std::string_view target, std::string_view assetsPath,
                                            const std::filesystem::path& root);

/// Content-Type for a file, by extension; application/octet-stream when unknown.
std::string_view mimeTypeFor(const std::filesystem::path& path);

/**
 * Interpret a Range header against a file of fileSize bytes.
 *
 * nullopt means "send the whole file": no header, a unit other than bytes, multiple ranges, or a
 * malformed spec. An InvalidArgument error means the range is well formed but unsatisfiable
 * (reply 416).
 */
Result<std::optional<ByteRange>> parseRange(std::string_view header, std::uint64_t fileSize);

/**
 * Serves the save directory read-only over HTTP/1.1 (GET and HEAD) under the assets path.
 *
 * Files are looked up on every request, so a file becomes reachable as soon as it exists on
 * disk. A file still being written is served with whatever length it has at that moment.
 */
class StaticFileServer {
public:
    struct Config {
        std::string bindAddress = "0.0.0.0";
        std::uint16_t bindPort = 8080;
        std::string assetsPath = "/assets";
        std::filesystem::path root = "assets";
    };

    StaticFileServer(boost::asio::any_io_executor executor, Config cfg);
    ~StaticFileServer();

    StaticFileServer(const StaticFileServer&) = delete;
    StaticFileServer& operator=(const StaticFileServer&) = delete;

    /**
     * Bind, listen and start accepting. Bind failures are returned, never thrown.
     */
    Result<void> start();
    void stop();

    /// Port actually bound; differs from the configured one when that was 0.
    [[nodiscard]] std::uint16_t port() const noexcept { return boundPort_; }

    [[nodiscard]] const Config& config() const noexcept { return cfg_; }

private:
    struct Shared;

    static boost::asio::awaitable<void> acceptLoop(std::shared_ptr<Shared> shared);
    static boost::asio::awaitable<void> session(std::shared_ptr<Shared> shared, tcp::socket socket);
    static boost::asio::awaitable<bool> handleRequest(const Shared& shared, tcp::socket& socket,
                                                      const http::request<http::string_body>& req);

    boost::asio::any_io_executor executor_;
    Config cfg_;
    std::shared_ptr<Shared> shared_;
    std::uint16_t boundPort_{0};
};

} // namespace relsync::server
