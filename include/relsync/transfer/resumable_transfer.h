#pragma once

#include <relsync/core/types.h>
#include <relsync/feed/artifact_record.h>
#include <relsync/net/http_client.h>
#include <relsync/notify/notifier.h>

#include <cstdint>
#include <filesystem>
#include <memory>

namespace relsync::transfer {

struct TransferOptions {
    // Total attempts, first one included.
    int retryLimit{5};
    bool fsyncOnComplete{true};
};

/**
 * Downloads one artifact to a local file, resuming with a Range request after every broken
 * body stream.
 *
 * The destination is truncated once, on the first attempt. Each retry asks for the bytes after
 * what is already on disk and appends them, so the file is never rewritten. Only
 * StreamInterrupted is retried; any other failure ends the transfer at once. A failed transfer
 * leaves the partial file where it is.
 *
 * On success the notifier receives "download complete:" followed by the record summary. A
 * failed notification is logged and does not change the result.
 */
class ResumableTransfer {
public:
    ResumableTransfer(std::shared_ptr<net::IHttpClient> http,
                      std::shared_ptr<notify::INotifier> notifier, TransferOptions options = {});

    /**
     * @return total bytes written to dest
     */
    Result<std::uint64_t> download(const feed::ArtifactRecord& record,
                                   const std::filesystem::path& dest);

    [[nodiscard]] const TransferOptions& options() const noexcept { return options_; }

private:
    std::shared_ptr<net::IHttpClient> http_;
    std::shared_ptr<notify::INotifier> notifier_;
    TransferOptions options_;
};

} // namespace relsync::transfer
