// Shared helpers and in-process fakes for relsync unit tests
#pragma once

#include <relsync/net/http_client.h>
#include <relsync/notify/notifier.h>

#include <unistd.h>

#include <algorithm>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <functional>
#include <fstream>
#include <iterator>
#include <map>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace relsync::tests {

inline std::filesystem::path make_temp_dir(const std::string& prefix = "relsync_test_") {
    auto base = std::filesystem::temp_directory_path();
    for (int i = 0; i < 1000; ++i) {
        auto p = base / (prefix + std::to_string(::getpid()) + "_" + std::to_string(i));
        if (std::filesystem::create_directories(p))
            return p;
    }
    return base;
}

inline std::filesystem::path write_file(const std::filesystem::path& p, const std::string& data) {
    std::filesystem::create_directories(p.parent_path());
    std::ofstream ofs(p, std::ios::binary);
    ofs << data;
    return p;
}

inline std::string read_file(const std::filesystem::path& p) {
    std::ifstream ifs(p, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
}

/**
 * Scripted IHttpClient.
 *
 * fetch() serves `pages`; streamFrom() serves `files` from the requested offset. Each entry of
 * `interruptions` makes one streamFrom() call deliver that many bytes and then fail with
 * StreamInterrupted. Every call is recorded.
 */
class FakeHttpClient final : public net::IHttpClient {
public:
    struct StreamCall {
        std::string url;
        std::uint64_t offset;
    };

    struct PostCall {
        std::string url;
        std::string body;
    };

    void setPage(const std::string& url, std::string body, long status = 200) {
        std::lock_guard<std::mutex> lk(mu_);
        pages_[url] = net::HttpResponse{status, std::move(body)};
    }

    void setFile(const std::string& url, std::string content) {
        std::lock_guard<std::mutex> lk(mu_);
        files_[url] = std::move(content);
    }

    void interruptAfter(std::uint64_t bytes) {
        std::lock_guard<std::mutex> lk(mu_);
        interruptions_.push_back(bytes);
    }

    void failStreamsWith(Error error) {
        std::lock_guard<std::mutex> lk(mu_);
        streamError_ = std::move(error);
    }

    void setPostResponse(net::HttpResponse response) {
        std::lock_guard<std::mutex> lk(mu_);
        postResponse_ = std::move(response);
    }

    void failPostsWith(Error error) {
        std::lock_guard<std::mutex> lk(mu_);
        postError_ = std::move(error);
    }

    // Reply 200 instead of 206 to ranged requests.
    void ignoreRange(bool ignore) {
        std::lock_guard<std::mutex> lk(mu_);
        ignoreRange_ = ignore;
    }

    // Runs at the start of every streamFrom, outside the lock.
    void setStreamHook(std::function<void()> hook) {
        std::lock_guard<std::mutex> lk(mu_);
        streamHook_ = std::move(hook);
    }

    Result<net::HttpResponse> fetch(std::string_view url) override {
        std::lock_guard<std::mutex> lk(mu_);
        fetched_.emplace_back(url);
        auto it = pages_.find(std::string(url));
        if (it == pages_.end())
            return Error{ErrorCode::NetworkError, "no route to " + std::string(url)};
        return it->second;
    }

    Result<net::StreamResult> streamFrom(std::string_view url, std::uint64_t offset,
                                         const net::ChunkSink& sink) override {
        std::function<void()> hook;
        {
            std::lock_guard<std::mutex> lk(mu_);
            hook = streamHook_;
        }
        if (hook)
            hook();

        std::string slice;
        std::optional<std::uint64_t> cut;
        long status = 200;
        {
            std::lock_guard<std::mutex> lk(mu_);
            streamCalls_.push_back(StreamCall{std::string(url), offset});
            if (streamError_)
                return *streamError_;
            auto it = files_.find(std::string(url));
            if (it == files_.end())
                return Error{ErrorCode::ServerError, "HTTP error 404"};
            const auto& content = it->second;
            const std::uint64_t from =
                ignoreRange_ ? 0 : std::min<std::uint64_t>(offset, content.size());
            slice = content.substr(static_cast<std::size_t>(from));
            status = (offset > 0 && !ignoreRange_) ? 206 : 200;
            if (!interruptions_.empty()) {
                cut = interruptions_.front();
                interruptions_.pop_front();
            }
        }

        const std::uint64_t deliver =
            cut ? std::min<std::uint64_t>(*cut, slice.size()) : slice.size();
        // Deliver in small chunks like a real transfer.
        std::uint64_t sent = 0;
        while (sent < deliver) {
            auto n = std::min<std::uint64_t>(7, deliver - sent);
            std::span<const std::byte> chunk{
                reinterpret_cast<const std::byte*>(slice.data() + sent), static_cast<std::size_t>(n)};
            auto r = sink(chunk);
            if (!r)
                return r.error();
            sent += n;
        }
        if (cut)
            return Error{ErrorCode::StreamInterrupted, "connection reset by peer"};
        return net::StreamResult{status, sent};
    }

    Result<net::HttpResponse> postJson(std::string_view url, std::string_view json) override {
        std::lock_guard<std::mutex> lk(mu_);
        posts_.push_back(PostCall{std::string(url), std::string(json)});
        if (postError_)
            return *postError_;
        return postResponse_;
    }

    std::vector<StreamCall> streamCalls() const {
        std::lock_guard<std::mutex> lk(mu_);
        return streamCalls_;
    }

    std::vector<std::string> fetched() const {
        std::lock_guard<std::mutex> lk(mu_);
        return fetched_;
    }

    std::vector<PostCall> posts() const {
        std::lock_guard<std::mutex> lk(mu_);
        return posts_;
    }

private:
    mutable std::mutex mu_;
    std::map<std::string, net::HttpResponse> pages_;
    std::map<std::string, std::string> files_;
    std::deque<std::uint64_t> interruptions_;
    std::optional<Error> streamError_;
    std::optional<Error> postError_;
    net::HttpResponse postResponse_{200, R"({"ok":true,"result":{}})"};
    bool ignoreRange_{false};
    std::function<void()> streamHook_;
    std::vector<StreamCall> streamCalls_;
    std::vector<std::string> fetched_;
    std::vector<PostCall> posts_;
};

/// Records messages; optionally fails every send.
class FakeNotifier final : public notify::INotifier {
public:
    Result<void> send(std::string_view text) override {
        std::lock_guard<std::mutex> lk(mu_);
        messages_.emplace_back(text);
        if (failure_)
            return *failure_;
        return Result<void>();
    }

    void failWith(Error error) {
        std::lock_guard<std::mutex> lk(mu_);
        failure_ = std::move(error);
    }

    std::vector<std::string> messages() const {
        std::lock_guard<std::mutex> lk(mu_);
        return messages_;
    }

private:
    mutable std::mutex mu_;
    std::vector<std::string> messages_;
    std::optional<Error> failure_;
};

/// A feed with one item, in the shape release hosts publish.
inline std::string make_feed(const std::string& title, const std::string& link,
                             const std::string& pubDate, const std::string& hash) {
    return R"(<?xml version="1.0" encoding="utf-8"?>
<rss version="2.0" xmlns:media="http://search.yahoo.com/mrss/">
  <channel>
    <title>Project releases</title>
    <item>
      <title><![CDATA[)" +
           title + R"(]]></title>
      <link>)" + link +
           R"(</link>
      <pubDate>)" +
           pubDate + R"(</pubDate>
      <media:content url=")" +
           link + R"(" type="application/zip">
        <media:hash algo="md5">)" +
           hash + R"(</media:hash>
      </media:content>
    </item>
  </channel>
</rss>
)";
}

} // namespace relsync::tests
