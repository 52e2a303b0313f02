#pragma once

/*
 * relsync HTTP client abstraction.
 *
 * Every outbound request (feed fetch, artifact download, notification) goes through an
 * IHttpClient. The libcurl implementation is created with makeCurlHttpClient(); tests substitute
 * their own implementation.
 */

#include <relsync/core/types.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace relsync::net {

/**
 * HTTP header key/value pair.
 */
struct Header {
    std::string name;
    std::string value;
};

/**
 * Client-wide settings applied to every request issued by one client instance.
 */
struct HttpClientOptions {
    std::string userAgent{"Wget/1.21.4"};
    std::chrono::milliseconds connectTimeout{10000};
    bool followRedirects{true};
    // Some feed hosts reject the default accept-encoding negotiation.
    std::vector<Header> defaultHeaders{{"Accept", "*/*"}, {"Accept-Encoding", "identity"}};
    bool cookies{true};
};

struct HttpResponse {
    long status{0};
    std::string body;
};

struct StreamResult {
    long status{0};
    std::uint64_t bytes{0};
};

/**
 * Receives body chunks in arrival order. Returning an error aborts the transfer.
 */
using ChunkSink = std::function<Result<void>(std::span<const std::byte>)>;

class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    /**
     * GET the whole body of url. Any status is returned as a value; transport failures are
     * errors (NetworkError, StreamInterrupted).
     */
    virtual Result<HttpResponse> fetch(std::string_view url) = 0;

    /**
     * GET url with "Range: bytes=<offset>-" and stream the body into sink.
     *
     * Error classification:
     * - NetworkError: no response was received (resolve, connect, TLS)
     * - StreamInterrupted: the body stream broke after the response started
     * - ServerError: HTTP status >= 400 (body is not delivered to sink)
     * - whatever the sink returned, when it rejected a chunk
     */
    virtual Result<StreamResult> streamFrom(std::string_view url, std::uint64_t offset,
                                            const ChunkSink& sink) = 0;

    /**
     * POST a JSON document and return the response.
     */
    virtual Result<HttpResponse> postJson(std::string_view url, std::string_view json) = 0;

    /**
     * Abort body streams in progress and refuse new ones with OperationCancelled. Used at
     * shutdown; there is no way to undo it.
     */
    virtual void cancelAll() {}
};

/**
 * Value for a Range header requesting everything from offset onwards.
 */
[[nodiscard]] inline std::string openRangeValue(std::uint64_t offset) {
    return "bytes=" + std::to_string(offset) + "-";
}

/**
 * Create the libcurl-backed client. Cookies persist across requests made through the returned
 * instance. The instance is safe to share between threads.
 */
std::shared_ptr<IHttpClient> makeCurlHttpClient(HttpClientOptions options = {});

} // namespace relsync::net
