#include <relsync/feed/feed_resolver.h>
#include <relsync/feed/rfc2822.h>

#include <pugixml.hpp>
#include <spdlog/spdlog.h>

#include <cctype>
#include <cstring>
#include <string>
#include <string_view>

namespace relsync::feed {

namespace {

std::string trim(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return std::string{s.substr(b, e - b)};
}

Error missing(std::string_view field) {
    return Error{ErrorCode::MissingField, std::string(field) + " not found"};
}

// Prefix bound to the Media RSS namespace on the root, channel or item element.
std::string mediaPrefix(const pugi::xml_node& root, const pugi::xml_node& channel,
                        const pugi::xml_node& item) {
    for (const auto& node : {item, channel, root}) {
        for (const auto& attr : node.attributes()) {
            const char* name = attr.name();
            if (std::strncmp(name, "xmlns:", 6) == 0 &&
                std::strcmp(attr.value(), kMediaRssNamespace) == 0) {
                return std::string(name + 6);
            }
        }
    }
    return "media";
}

std::string childText(const pugi::xml_node& parent, const char* name) {
    return trim(parent.child(name).text().get());
}

} // namespace

std::optional<std::string> fileNameFromTitle(std::string_view title) {
    auto t = trim(title);
    // Empty and "." components do not count, so "a/b.zip/" and "a/b.zip/." both name b.zip.
    std::string_view rest(t);
    std::string_view last;
    while (!rest.empty()) {
        auto pos = rest.find('/');
        auto component = rest.substr(0, pos);
        if (!component.empty() && component != ".")
            last = component;
        if (pos == std::string_view::npos)
            break;
        rest.remove_prefix(pos + 1);
    }
    if (last.empty() || last == "..")
        return std::nullopt;
    return std::string(last);
}

Result<ArtifactRecord> parseLatestEntry(std::string_view feedXml,
                                        std::string_view publicUrlPrefix) {
    pugi::xml_document doc;
    pugi::xml_parse_result parsed = doc.load_buffer(feedXml.data(), feedXml.size());
    if (!parsed) {
        return Error{ErrorCode::InvalidData,
                     std::string("feed is not a valid XML document: ") + parsed.description()};
    }

    auto root = doc.child("rss");
    auto channel = root.child("channel");
    if (!channel) {
        return Error{ErrorCode::InvalidData, "feed has no rss channel"};
    }

    auto item = channel.child("item");
    if (!item) {
        return Error{ErrorCode::NotFound, "latest entry not found"};
    }

    auto pubDateText = childText(item, "pubDate");
    if (pubDateText.empty())
        return missing("pub date");
    auto publishedAt = parseRfc2822(pubDateText);
    if (!publishedAt) {
        return Error{ErrorCode::InvalidData,
                     "pub date '" + pubDateText + "' is not an RFC 2822 date"};
    }

    auto link = childText(item, "link");
    if (link.empty())
        return missing("link");

    const auto prefix = mediaPrefix(root, channel, item);
    auto content = item.child((prefix + ":content").c_str());
    if (!content)
        return missing("media:content");
    auto hashNode = content.child((prefix + ":hash").c_str());
    if (!hashNode)
        return missing("media:hash");
    auto hash = trim(hashNode.text().get());
    if (hash.empty())
        return missing("hash value");

    auto title = childText(item, "title");
    if (title.empty())
        return missing("title");
    auto fileName = fileNameFromTitle(title);
    if (!fileName)
        return missing("file name");

    spdlog::debug("pub_date: {}, md5: {}, name: {}", pubDateText, hash, *fileName);

    std::string publicUrl(publicUrlPrefix);
    publicUrl.push_back('/');
    publicUrl.append(*fileName);

    return ArtifactRecord{*publishedAt, std::move(link), std::move(hash), std::move(*fileName),
                          std::move(publicUrl)};
}

FeedEntryResolver::FeedEntryResolver(std::shared_ptr<net::IHttpClient> http,
                                     std::string publicUrlPrefix)
    : http_(std::move(http)), publicUrlPrefix_(std::move(publicUrlPrefix)) {}

Result<ArtifactRecord> FeedEntryResolver::resolve(std::string_view feedUrl) const {
    if (!http_) {
        return Error{ErrorCode::InternalError, "FeedEntryResolver has no http client"};
    }
    auto fetched = http_->fetch(feedUrl);
    if (!fetched) {
        return Error{fetched.error().code, "feed fetch failed: " + fetched.error().message};
    }
    const auto& response = fetched.value();
    if (response.status >= 400) {
        return Error{ErrorCode::ServerError,
                     "feed fetch failed: HTTP error " + std::to_string(response.status)};
    }
    return parseLatestEntry(response.body, publicUrlPrefix_);
}

} // namespace relsync::feed
