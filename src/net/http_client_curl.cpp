/*
 * http_client_curl.cpp
 *
 * Notes
 * - libcurl easy API, one easy handle per request so the client can be shared between threads.
 * - Cookies live in a share handle owned by the client instance.
 * - Only a connect timeout is applied; a connected transfer is never cut off by a total timeout.
 *   cancelAll() reaches stalled transfers through the progress callback, which libcurl runs
 *   about once a second even when no bytes arrive.
 * - Response status lines are tracked in the header callback so body bytes of error replies
 *   never reach the sink, and so a broken stream can be told apart from a failed request.
 */

#include <relsync/net/http_client.h>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <charconv>
#include <mutex>
#include <optional>
#include <string_view>

namespace relsync::net {

namespace {

std::once_flag g_curlInitOnce;

void ensureCurlGlobalInit() {
    std::call_once(g_curlInitOnce, [] {
        CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (rc != CURLE_OK) {
            spdlog::error("curl_global_init failed: {}", curl_easy_strerror(rc));
        }
    });
}

struct EasyDeleter {
    void operator()(CURL* curl) const noexcept {
        if (curl)
            curl_easy_cleanup(curl);
    }
};
using EasyHandle = std::unique_ptr<CURL, EasyDeleter>;

struct SlistDeleter {
    void operator()(curl_slist* list) const noexcept {
        if (list)
            curl_slist_free_all(list);
    }
};
using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

// Case-insensitive starts_with
bool istarts_with(std::string_view s, std::string_view prefix) {
    if (s.size() < prefix.size())
        return false;
    for (size_t i = 0; i < prefix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(s[i])) !=
            std::tolower(static_cast<unsigned char>(prefix[i]))) {
            return false;
        }
    }
    return true;
}

// Header parser context
struct HeaderParseContext {
    bool responseStarted{false};
    long status{0};
};

// Parses "HTTP/1.1 206 Partial Content" style status lines; other header lines are ignored.
size_t header_cb(char* buffer, size_t size, size_t nitems, void* userdata) {
    const size_t total = size * nitems;
    if (total == 0 || userdata == nullptr)
        return total;

    auto* ctx = static_cast<HeaderParseContext*>(userdata);
    std::string_view line(buffer, total);
    if (!istarts_with(line, "HTTP/"))
        return total;

    auto sp = line.find(' ');
    if (sp == std::string_view::npos)
        return total;
    auto rest = line.substr(sp + 1);
    long code = 0;
    auto res = std::from_chars(rest.data(), rest.data() + rest.size(), code);
    if (res.ec == std::errc()) {
        ctx->status = code;
        ctx->responseStarted = true;
    }
    return total;
}

// Write sink context for streamFrom
struct WriteContext {
    const ChunkSink* sink{nullptr};
    const HeaderParseContext* headers{nullptr};
    const std::atomic<bool>* cancelled{nullptr};
    std::uint64_t delivered{0};
    std::optional<Error> sinkError;
    bool cancelRequested{false};
};

size_t stream_write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    if (userdata == nullptr)
        return 0;

    auto* ctx = static_cast<WriteContext*>(userdata);
    if (total == 0)
        return 0;

    if (ctx->cancelled && ctx->cancelled->load(std::memory_order_relaxed)) {
        ctx->cancelRequested = true;
        return 0;
    }

    // Error pages are drained without touching the destination.
    if (ctx->headers && ctx->headers->status >= 400)
        return total;

    std::span<const std::byte> bytes{reinterpret_cast<const std::byte*>(ptr), total};
    auto r = (*ctx->sink)(bytes);
    if (!r) {
        ctx->sinkError = r.error();
        return 0; // signal error to curl => CURLE_WRITE_ERROR
    }
    ctx->delivered += static_cast<std::uint64_t>(total);
    return total;
}

// Non-zero aborts the transfer with CURLE_ABORTED_BY_CALLBACK.
int xferinfo_cb(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* cancelled = static_cast<const std::atomic<bool>*>(clientp);
    return cancelled && cancelled->load(std::memory_order_relaxed) ? 1 : 0;
}

size_t collect_write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    if (userdata == nullptr)
        return 0;
    static_cast<std::string*>(userdata)->append(ptr, total);
    return total;
}

Error makeCurlError(CURLcode code, const HeaderParseContext& hctx, std::string_view where) {
    Error err;
    err.message = std::string(where) + ": " + curl_easy_strerror(code);
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            err.code = hctx.responseStarted ? ErrorCode::StreamInterrupted : ErrorCode::Timeout;
            break;
        case CURLE_ABORTED_BY_CALLBACK:
            err.code = ErrorCode::OperationCancelled;
            break;
        case CURLE_PARTIAL_FILE:
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING:
            err.code = hctx.responseStarted ? ErrorCode::StreamInterrupted
                                            : ErrorCode::NetworkError;
            break;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            err.code = ErrorCode::NetworkError;
            break;
        default:
            err.code = hctx.responseStarted ? ErrorCode::StreamInterrupted
                                            : ErrorCode::NetworkError;
            break;
    }
    return err;
}

} // namespace

class CurlHttpClient final : public IHttpClient {
public:
    explicit CurlHttpClient(HttpClientOptions options) : options_(std::move(options)) {
        ensureCurlGlobalInit();
        if (options_.cookies) {
            share_ = curl_share_init();
            if (share_) {
                curl_share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_COOKIE);
                curl_share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
                curl_share_setopt(share_, CURLSHOPT_LOCKFUNC, &CurlHttpClient::lockShare);
                curl_share_setopt(share_, CURLSHOPT_UNLOCKFUNC, &CurlHttpClient::unlockShare);
                curl_share_setopt(share_, CURLSHOPT_USERDATA, this);
            } else {
                spdlog::warn("curl_share_init failed; cookies will not persist between requests");
            }
        }
    }

    ~CurlHttpClient() override {
        if (share_)
            curl_share_cleanup(share_);
    }

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    Result<HttpResponse> fetch(std::string_view url) override {
        if (cancelled_.load()) {
            return Error{ErrorCode::OperationCancelled, "fetch: client cancelled"};
        }
        EasyHandle curl(curl_easy_init());
        if (!curl) {
            return Error{ErrorCode::InternalError, "curl_easy_init failed"};
        }
        HeaderList list(buildHeaderList({}));
        HeaderParseContext hctx{};
        HttpResponse out;

        const std::string urlStr(url);
        curl_easy_setopt(curl.get(), CURLOPT_URL, urlStr.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, list.get());
        curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, header_cb);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &hctx);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, collect_write_cb);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &out.body);
        configureCommon(curl.get());

        CURLcode rc = curl_easy_perform(curl.get());
        if (rc != CURLE_OK) {
            return makeCurlError(rc, hctx, "fetch(GET)");
        }
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &out.status);
        spdlog::trace("GET {} -> {} ({} bytes)", urlStr, out.status, out.body.size());
        return out;
    }

    Result<StreamResult> streamFrom(std::string_view url, std::uint64_t offset,
                                    const ChunkSink& sink) override {
        if (!sink) {
            return Error{ErrorCode::InvalidArgument, "streamFrom: no sink provided"};
        }
        if (cancelled_.load()) {
            return Error{ErrorCode::OperationCancelled, "streamFrom: client cancelled"};
        }
        EasyHandle curl(curl_easy_init());
        if (!curl) {
            return Error{ErrorCode::InternalError, "curl_easy_init failed"};
        }

        HeaderList list(buildHeaderList({Header{"Range", openRangeValue(offset)}}));
        HeaderParseContext hctx{};
        WriteContext wctx;
        wctx.sink = &sink;
        wctx.headers = &hctx;
        wctx.cancelled = &cancelled_;

        const std::string urlStr(url);
        curl_easy_setopt(curl.get(), CURLOPT_URL, urlStr.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, list.get());
        curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, header_cb);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &hctx);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, stream_write_cb);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &wctx);
        configureCommon(curl.get());

        spdlog::debug("GET {} (Range: {})", urlStr, openRangeValue(offset));
        CURLcode rc = curl_easy_perform(curl.get());

        long httpStatus = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &httpStatus);

        if (wctx.cancelRequested || rc == CURLE_ABORTED_BY_CALLBACK) {
            return Error{ErrorCode::OperationCancelled, "Transfer cancelled"};
        }
        if (wctx.sinkError) {
            return *wctx.sinkError;
        }
        if (httpStatus >= 400) {
            return Error{ErrorCode::ServerError, "HTTP error " + std::to_string(httpStatus)};
        }
        if (rc != CURLE_OK) {
            return makeCurlError(rc, hctx, "streamFrom(GET)");
        }
        return StreamResult{httpStatus, wctx.delivered};
    }

    Result<HttpResponse> postJson(std::string_view url, std::string_view json) override {
        if (cancelled_.load()) {
            return Error{ErrorCode::OperationCancelled, "postJson: client cancelled"};
        }
        EasyHandle curl(curl_easy_init());
        if (!curl) {
            return Error{ErrorCode::InternalError, "curl_easy_init failed"};
        }
        HeaderList list(buildHeaderList({Header{"Content-Type", "application/json"}}));
        HeaderParseContext hctx{};
        HttpResponse out;

        const std::string urlStr(url);
        curl_easy_setopt(curl.get(), CURLOPT_URL, urlStr.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, json.data());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(json.size()));
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, list.get());
        curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, header_cb);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &hctx);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, collect_write_cb);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &out.body);
        configureCommon(curl.get());

        CURLcode rc = curl_easy_perform(curl.get());
        if (rc != CURLE_OK) {
            return makeCurlError(rc, hctx, "postJson(POST)");
        }
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &out.status);
        return out;
    }

    void cancelAll() override { cancelled_.store(true); }

private:
    // Default headers first; per-request headers with the same name replace them.
    curl_slist* buildHeaderList(const std::vector<Header>& extra) const {
        curl_slist* list = nullptr;
        auto append = [&list](const Header& h) {
            std::string line = h.name;
            line.append(": ");
            line.append(h.value);
            list = curl_slist_append(list, line.c_str());
        };
        for (const auto& h : options_.defaultHeaders) {
            bool overridden = std::any_of(extra.begin(), extra.end(), [&h](const Header& e) {
                return e.name.size() == h.name.size() && istarts_with(e.name, h.name);
            });
            if (!overridden)
                append(h);
        }
        for (const auto& h : extra)
            append(h);
        return list;
    }

    void configureCommon(CURL* curl) {
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(options_.connectTimeout.count()));
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, 0L);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, xferinfo_cb);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &cancelled_);

        curl_easy_setopt(curl, CURLOPT_USERAGENT, options_.userAgent.c_str());

        // Redirects (SourceForge download links bounce through mirrors)
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, options_.followRedirects ? 1L : 0L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);

        if (share_) {
            curl_easy_setopt(curl, CURLOPT_SHARE, share_);
            // Empty file name turns the cookie engine on without reading a cookie jar.
            curl_easy_setopt(curl, CURLOPT_COOKIEFILE, "");
        }

        // Robustness
        curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
        curl_easy_setopt(curl, CURLOPT_TCP_KEEPIDLE, 30L);
        curl_easy_setopt(curl, CURLOPT_TCP_KEEPINTVL, 15L);
    }

    static void lockShare(CURL*, curl_lock_data data, curl_lock_access, void* userptr) {
        auto* self = static_cast<CurlHttpClient*>(userptr);
        self->shareLocks_[static_cast<std::size_t>(data) % self->shareLocks_.size()].lock();
    }

    static void unlockShare(CURL*, curl_lock_data data, void* userptr) {
        auto* self = static_cast<CurlHttpClient*>(userptr);
        self->shareLocks_[static_cast<std::size_t>(data) % self->shareLocks_.size()].unlock();
    }

    HttpClientOptions options_;
    CURLSH* share_{nullptr};
    std::atomic<bool> cancelled_{false};
    std::array<std::mutex, static_cast<std::size_t>(CURL_LOCK_DATA_LAST)> shareLocks_{};
};

std::shared_ptr<IHttpClient> makeCurlHttpClient(HttpClientOptions options) {
    return std::make_shared<CurlHttpClient>(std::move(options));
}

} // namespace relsync::net
