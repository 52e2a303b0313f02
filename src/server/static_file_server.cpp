#include <relsync/server/static_file_server.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/file.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http/buffer_body.hpp>
#include <boost/beast/http/empty_body.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/write.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <exception>
#include <stdexcept>
#include <vector>

namespace relsync::server {

namespace fs = std::filesystem;
namespace asio = boost::asio;

namespace {

constexpr std::size_t kChunkSize = 64 * 1024;
constexpr std::uint64_t kRequestBodyLimit = 64 * 1024;
constexpr const char* kServerName = "relsync";

std::string_view toStd(beast::string_view s) {
    return std::string_view(s.data(), s.size());
}

int hexValue(char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

std::optional<std::uint64_t> parseUnsigned(std::string_view s) {
    if (s.empty())
        return std::nullopt;
    std::uint64_t v = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc() || ptr != s.data() + s.size())
        return std::nullopt;
    return v;
}

std::vector<std::string_view> splitPath(std::string_view path) {
    std::vector<std::string_view> out;
    std::size_t start = 0;
    while (start <= path.size()) {
        auto pos = path.find('/', start);
        if (pos == std::string_view::npos)
            pos = path.size();
        out.push_back(path.substr(start, pos - start));
        start = pos + 1;
    }
    return out;
}

void logSessionEnd(std::exception_ptr ep) {
    if (!ep)
        return;
    try {
        std::rethrow_exception(ep);
    } catch (const std::exception& e) {
        spdlog::debug("http session ended: {}", e.what());
    } catch (...) {
        spdlog::warn("http session ended: unknown exception");
    }
}

asio::awaitable<bool> sendText(tcp::socket& socket, const http::request<http::string_body>& req,
                               http::status status, std::string_view text) {
    http::response<http::string_body> res{status, req.version()};
    res.set(http::field::server, kServerName);
    res.set(http::field::content_type, "text/plain");
    if (status == http::status::method_not_allowed)
        res.set(http::field::allow, "GET, HEAD");
    if (req.method() != http::verb::head)
        res.body() = std::string(text);
    res.keep_alive(req.keep_alive());
    res.prepare_payload();
    co_await http::async_write(socket, res, asio::use_awaitable);
    spdlog::debug("{} {} -> {}", toStd(req.method_string()), toStd(req.target()),
                  static_cast<unsigned>(status));
    co_return req.keep_alive();
}

asio::awaitable<void> writeFileBody(tcp::socket& socket, http::response<http::buffer_body>& res,
                                    beast::file& file, std::uint64_t offset,
                                    std::uint64_t length) {
    http::response_serializer<http::buffer_body> sr{res};
    res.body().data = nullptr;
    res.body().more = true;
    co_await http::async_write_header(socket, sr, asio::use_awaitable);

    beast::error_code ec;
    file.seek(offset, ec);
    if (ec)
        throw boost::system::system_error(ec);

    std::vector<char> buf(kChunkSize);
    std::uint64_t remaining = length;
    while (remaining > 0) {
        auto want = static_cast<std::size_t>(std::min<std::uint64_t>(remaining, buf.size()));
        auto n = file.read(buf.data(), want, ec);
        if (ec)
            throw boost::system::system_error(ec);
        if (n == 0)
            throw std::runtime_error("file shrank while being served");
        res.body().data = buf.data();
        res.body().size = n;
        res.body().more = true;
        co_await http::async_write(socket, sr, asio::redirect_error(asio::use_awaitable, ec));
        if (ec == http::error::need_buffer)
            ec = {};
        if (ec)
            throw boost::system::system_error(ec);
        remaining -= n;
    }

    res.body().data = nullptr;
    res.body().size = 0;
    res.body().more = false;
    co_await http::async_write(socket, sr, asio::use_awaitable);
}

} // namespace

std::optional<std::string> percentDecode(std::string_view in) {
    std::string out;
    out.reserve(in.size());
    for (std::size_t i = 0; i < in.size(); ++i) {
        if (in[i] != '%') {
            out.push_back(in[i]);
            continue;
        }
        if (i + 2 >= in.size())
            return std::nullopt;
        int hi = hexValue(in[i + 1]);
        int lo = hexValue(in[i + 2]);
        if (hi < 0 || lo < 0)
            return std::nullopt;
        char c = static_cast<char>(hi * 16 + lo);
        if (c == '\0')
            return std::nullopt;
        out.push_back(c);
        i += 2;
    }
    return out;
}

Result<fs::path> resolveTarget(std::string_view target, std::string_view assetsPath,
                               const fs::path& root) {
    auto rawPath = target.substr(0, target.find_first_of("?#"));
    auto decoded = percentDecode(rawPath);
    if (!decoded) {
        return Error{ErrorCode::InvalidArgument, "undecodable request target"};
    }

    auto segments = splitPath(*decoded);
    if (std::find(segments.begin(), segments.end(), "..") != segments.end()) {
        return Error{ErrorCode::InvalidArgument, "'..' is not allowed in request paths"};
    }

    std::string prefix(assetsPath);
    prefix.push_back('/');
    if (decoded->rfind(prefix, 0) != 0) {
        return Error{ErrorCode::NotFound, "outside of " + prefix};
    }

    fs::path relative;
    for (auto seg : splitPath(std::string_view(*decoded).substr(prefix.size()))) {
        if (seg.empty() || seg == ".")
            continue;
        relative /= fs::path(std::string(seg));
    }
    if (relative.empty()) {
        return Error{ErrorCode::NotFound, "no file requested"};
    }
    return root / relative;
}

std::string_view mimeTypeFor(const fs::path& path) {
    auto ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (ext == ".zip")
        return "application/zip";
    if (ext == ".gz" || ext == ".tgz")
        return "application/gzip";
    if (ext == ".xz")
        return "application/x-xz";
    if (ext == ".7z")
        return "application/x-7z-compressed";
    if (ext == ".tar")
        return "application/x-tar";
    if (ext == ".apk")
        return "application/vnd.android.package-archive";
    if (ext == ".json")
        return "application/json";
    if (ext == ".xml")
        return "application/xml";
    if (ext == ".txt" || ext == ".md5" || ext == ".sha256")
        return "text/plain";
    if (ext == ".htm" || ext == ".html")
        return "text/html";
    if (ext == ".png")
        return "image/png";
    if (ext == ".jpg" || ext == ".jpeg")
        return "image/jpeg";
    return "application/octet-stream";
}

Result<std::optional<ByteRange>> parseRange(std::string_view header, std::uint64_t fileSize) {
    constexpr std::string_view kUnit = "bytes=";
    while (!header.empty() && (header.front() == ' ' || header.front() == '\t'))
        header.remove_prefix(1);
    while (!header.empty() && (header.back() == ' ' || header.back() == '\t'))
        header.remove_suffix(1);

    const std::optional<ByteRange> whole;
    if (header.rfind(kUnit, 0) != 0)
        return whole;
    auto spec = header.substr(kUnit.size());
    if (spec.find(',') != std::string_view::npos)
        return whole;
    auto dash = spec.find('-');
    if (dash == std::string_view::npos)
        return whole;

    auto firstText = spec.substr(0, dash);
    auto lastText = spec.substr(dash + 1);
    const Error unsatisfiable{ErrorCode::InvalidArgument,
                              "range not satisfiable for size " + std::to_string(fileSize)};

    if (firstText.empty()) {
        auto suffix = parseUnsigned(lastText);
        if (!suffix)
            return whole;
        if (*suffix == 0 || fileSize == 0)
            return unsatisfiable;
        ByteRange r{fileSize > *suffix ? fileSize - *suffix : 0, fileSize - 1};
        return std::optional<ByteRange>{r};
    }

    auto first = parseUnsigned(firstText);
    if (!first)
        return whole;
    std::uint64_t last = fileSize == 0 ? 0 : fileSize - 1;
    if (!lastText.empty()) {
        auto parsedLast = parseUnsigned(lastText);
        if (!parsedLast || *parsedLast < *first)
            return whole;
        last = std::min(last, *parsedLast);
    }
    if (*first >= fileSize)
        return unsatisfiable;
    return std::optional<ByteRange>{ByteRange{*first, last}};
}

struct StaticFileServer::Shared {
    asio::any_io_executor executor;
    asio::strand<asio::any_io_executor> strand;
    tcp::acceptor acceptor;
    Config cfg;
    std::atomic<bool> stopping{false};

    Shared(asio::any_io_executor exec, Config c)
        : executor(exec), strand(asio::make_strand(exec)), acceptor(strand), cfg(std::move(c)) {}
};

StaticFileServer::StaticFileServer(asio::any_io_executor executor, Config cfg)
    : executor_(std::move(executor)), cfg_(std::move(cfg)) {}

StaticFileServer::~StaticFileServer() {
    stop();
}

Result<void> StaticFileServer::start() {
    if (shared_) {
        return Error{ErrorCode::InternalError, "static file server already started"};
    }
    auto shared = std::make_shared<Shared>(executor_, cfg_);

    beast::error_code ec;
    const auto address = asio::ip::make_address(cfg_.bindAddress, ec);
    if (ec) {
        return Error{ErrorCode::InvalidArgument,
                     "Invalid bind address '" + cfg_.bindAddress + "': " + ec.message()};
    }
    const tcp::endpoint ep{address, cfg_.bindPort};
    shared->acceptor.open(ep.protocol(), ec);
    if (ec)
        return Error{ErrorCode::NetworkError, "acceptor open failed: " + ec.message()};
    shared->acceptor.set_option(asio::socket_base::reuse_address(true), ec);
    if (ec)
        return Error{ErrorCode::NetworkError, "reuse_address failed: " + ec.message()};
    shared->acceptor.bind(ep, ec);
    if (ec) {
        return Error{ErrorCode::NetworkError, "bind " + cfg_.bindAddress + ":" +
                                                  std::to_string(cfg_.bindPort) +
                                                  " failed: " + ec.message()};
    }
    shared->acceptor.listen(asio::socket_base::max_listen_connections, ec);
    if (ec)
        return Error{ErrorCode::NetworkError, "listen failed: " + ec.message()};

    auto local = shared->acceptor.local_endpoint(ec);
    boundPort_ = ec ? cfg_.bindPort : local.port();

    spdlog::info("serving {} at {}:{}{}", cfg_.root.string(), cfg_.bindAddress, boundPort_,
                 cfg_.assetsPath.empty() ? "/" : cfg_.assetsPath);
    asio::co_spawn(shared->strand, acceptLoop(shared), [](std::exception_ptr ep) {
        if (!ep)
            return;
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            spdlog::error("static file server accept loop failed: {}", e.what());
        } catch (...) {
            spdlog::error("static file server accept loop failed: unknown exception");
        }
    });
    shared_ = std::move(shared);
    return Result<void>();
}

void StaticFileServer::stop() {
    if (!shared_ || shared_->stopping.exchange(true))
        return;
    auto shared = shared_;
    asio::post(shared->strand, [shared]() {
        beast::error_code ec;
        shared->acceptor.close(ec);
        if (ec)
            spdlog::debug("acceptor close: {}", ec.message());
    });
}

asio::awaitable<void> StaticFileServer::acceptLoop(std::shared_ptr<Shared> shared) {
    for (;;) {
        beast::error_code ec;
        tcp::socket socket = co_await shared->acceptor.async_accept(
            shared->executor, asio::redirect_error(asio::use_awaitable, ec));
        if (ec) {
            if (ec == asio::error::operation_aborted || shared->stopping.load())
                break;
            spdlog::warn("accept error: {}", ec.message());
            continue;
        }
        asio::co_spawn(shared->executor, session(shared, std::move(socket)), logSessionEnd);
    }
    spdlog::debug("static file server stopped accepting");
}

asio::awaitable<void> StaticFileServer::session(std::shared_ptr<Shared> shared,
                                                tcp::socket socket) {
    beast::flat_buffer buffer;
    for (;;) {
        http::request_parser<http::string_body> parser;
        parser.body_limit(kRequestBodyLimit);
        beast::error_code ec;
        co_await http::async_read(socket, buffer, parser,
                                  asio::redirect_error(asio::use_awaitable, ec));
        if (ec == http::error::end_of_stream)
            break;
        if (ec) {
            spdlog::debug("http read error: {}", ec.message());
            break;
        }
        const bool keepAlive = co_await handleRequest(*shared, socket, parser.get());
        if (!keepAlive)
            break;
    }
    beast::error_code ec;
    socket.shutdown(tcp::socket::shutdown_send, ec);
}

asio::awaitable<bool> StaticFileServer::handleRequest(const Shared& shared, tcp::socket& socket,
                                                      const http::request<http::string_body>& req) {
    if (req.method() != http::verb::get && req.method() != http::verb::head) {
        co_return co_await sendText(socket, req, http::status::method_not_allowed,
                                    "method not allowed");
    }

    auto resolved = resolveTarget(toStd(req.target()), shared.cfg.assetsPath, shared.cfg.root);
    if (!resolved) {
        const auto status = resolved.error().code == ErrorCode::InvalidArgument
                                ? http::status::bad_request
                                : http::status::not_found;
        co_return co_await sendText(socket, req, status, resolved.error().message);
    }
    const auto& path = resolved.value();

    std::error_code fsErr;
    if (!fs::is_regular_file(path, fsErr)) {
        co_return co_await sendText(socket, req, http::status::not_found, "not found");
    }

    beast::error_code ec;
    beast::file file;
    file.open(path.c_str(), beast::file_mode::scan, ec);
    if (ec) {
        spdlog::debug("cannot open {}: {}", path.string(), ec.message());
        co_return co_await sendText(socket, req, http::status::not_found, "not found");
    }
    const std::uint64_t size = file.size(ec);
    if (ec) {
        spdlog::warn("cannot stat {}: {}", path.string(), ec.message());
        co_return co_await sendText(socket, req, http::status::internal_server_error,
                                    "cannot read file");
    }

    std::optional<ByteRange> range;
    if (auto it = req.find(http::field::range); it != req.end()) {
        auto parsed = parseRange(toStd(it->value()), size);
        if (!parsed) {
            http::response<http::string_body> res{http::status::range_not_satisfiable,
                                                  req.version()};
            res.set(http::field::server, kServerName);
            res.set(http::field::content_range, "bytes */" + std::to_string(size));
            res.keep_alive(req.keep_alive());
            res.prepare_payload();
            co_await http::async_write(socket, res, asio::use_awaitable);
            co_return req.keep_alive();
        }
        range = parsed.value();
    }

    const auto status = range ? http::status::partial_content : http::status::ok;
    const std::uint64_t offset = range ? range->first : 0;
    const std::uint64_t length = range ? range->length() : size;

    auto setHeaders = [&](auto& res) {
        res.set(http::field::server, kServerName);
        res.set(http::field::content_type, std::string(mimeTypeFor(path)));
        res.set(http::field::accept_ranges, "bytes");
        if (range) {
            res.set(http::field::content_range, "bytes " + std::to_string(range->first) + "-" +
                                                    std::to_string(range->last) + "/" +
                                                    std::to_string(size));
        }
        res.content_length(length);
        res.keep_alive(req.keep_alive());
    };

    if (req.method() == http::verb::head) {
        http::response<http::empty_body> res{status, req.version()};
        setHeaders(res);
        co_await http::async_write(socket, res, asio::use_awaitable);
    } else {
        http::response<http::buffer_body> res{status, req.version()};
        setHeaders(res);
        co_await writeFileBody(socket, res, file, offset, length);
    }
    spdlog::debug("{} {} -> {} ({} bytes)", toStd(req.method_string()), toStd(req.target()),
                  static_cast<unsigned>(status), length);
    co_return req.keep_alive();
}

} // namespace relsync::server
