#pragma once

#include <relsync/core/types.h>
#include <relsync/feed/artifact_record.h>
#include <relsync/net/http_client.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace relsync::feed {

/// Namespace URI of the Media RSS extension carrying the artifact hash.
inline constexpr const char* kMediaRssNamespace = "http://search.yahoo.com/mrss/";

/**
 * Turns the newest entry of a release feed into an ArtifactRecord.
 *
 * The feed is assumed to be sorted newest-first by its origin, so the first item in document
 * order is taken as the latest release. Every failure is returned as a Result error naming the
 * missing or malformed field; nothing here throws.
 */
class FeedEntryResolver {
public:
    /**
     * @param http client used to fetch the feed
     * @param publicUrlPrefix domain + serving path, e.g. "http://localhost:8080/assets"
     */
    FeedEntryResolver(std::shared_ptr<net::IHttpClient> http, std::string publicUrlPrefix);

    /**
     * Fetch feedUrl and resolve its newest entry.
     */
    Result<ArtifactRecord> resolve(std::string_view feedUrl) const;

    [[nodiscard]] const std::string& publicUrlPrefix() const noexcept { return publicUrlPrefix_; }

private:
    std::shared_ptr<net::IHttpClient> http_;
    std::string publicUrlPrefix_;
};

/**
 * Parse a feed document and build the record for its first entry.
 */
Result<ArtifactRecord> parseLatestEntry(std::string_view feedXml, std::string_view publicUrlPrefix);

/**
 * Final path component of an entry title ("rom/build-42.zip" -> "build-42.zip"). Only '/'
 * separates components; trailing '/' and "." components are skipped. Returns nullopt when no
 * component is left or the last one is "..".
 */
std::optional<std::string> fileNameFromTitle(std::string_view title);

} // namespace relsync::feed
