#pragma once

#include <relsync/core/types.h>

#include <compare>
#include <string>

namespace relsync::feed {

/**
 * One published release as announced by the feed.
 *
 * Equality means "same release": both records carry the same non-empty content hash. Ordering
 * compares publish times only, so two records may be equivalent in order without being equal.
 */
class ArtifactRecord {
public:
    ArtifactRecord(TimePoint publishedAt, std::string downloadUrl, std::string contentHash,
                   std::string fileName, std::string publicUrl)
        : publishedAt_(publishedAt), downloadUrl_(std::move(downloadUrl)),
          contentHash_(std::move(contentHash)), fileName_(std::move(fileName)),
          publicUrl_(std::move(publicUrl)) {}

    [[nodiscard]] TimePoint publishedAt() const noexcept { return publishedAt_; }
    [[nodiscard]] const std::string& downloadUrl() const noexcept { return downloadUrl_; }
    [[nodiscard]] const std::string& contentHash() const noexcept { return contentHash_; }
    [[nodiscard]] const std::string& fileName() const noexcept { return fileName_; }
    [[nodiscard]] const std::string& publicUrl() const noexcept { return publicUrl_; }

    friend bool operator==(const ArtifactRecord& a, const ArtifactRecord& b) noexcept {
        return !a.contentHash_.empty() && !b.contentHash_.empty() &&
               a.contentHash_ == b.contentHash_;
    }

    friend std::partial_ordering operator<=>(const ArtifactRecord& a,
                                             const ArtifactRecord& b) noexcept {
        return a.publishedAt_ <=> b.publishedAt_;
    }

    /**
     * Multi-line description used in completion notifications and logs.
     */
    [[nodiscard]] std::string summary() const;

private:
    TimePoint publishedAt_;
    std::string downloadUrl_;
    std::string contentHash_;
    std::string fileName_;
    std::string publicUrl_;
};

} // namespace relsync::feed
