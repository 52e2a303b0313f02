#include <relsync/feed/artifact_record.h>
#include <relsync/feed/rfc2822.h>

#include <spdlog/fmt/fmt.h>

namespace relsync::feed {

std::string ArtifactRecord::summary() const {
    return fmt::format("file name: {}\npub date: {}\ndownload url: {}\nmd5: {}\nstatic file url: {}",
                       fileName_, formatRfc2822(publishedAt_), downloadUrl_, contentHash_,
                       publicUrl_);
}

} // namespace relsync::feed
