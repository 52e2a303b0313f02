#include <relsync/transfer/resumable_transfer.h>

#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <unistd.h>

#include <fstream>
#include <system_error>

namespace relsync::transfer {

namespace fs = std::filesystem;

namespace {

Result<void> fsync_file(const fs::path& p) {
    int fd = ::open(p.c_str(), O_RDONLY);
    if (fd < 0) {
        return Error{ErrorCode::IoError, "open() failed for fsync: " + p.string()};
    }
    if (::fsync(fd) != 0) {
        ::close(fd);
        return Error{ErrorCode::IoError, "fsync() failed for: " + p.string()};
    }
    ::close(fd);
    return Result<void>();
}

} // namespace

ResumableTransfer::ResumableTransfer(std::shared_ptr<net::IHttpClient> http,
                                     std::shared_ptr<notify::INotifier> notifier,
                                     TransferOptions options)
    : http_(std::move(http)), notifier_(std::move(notifier)), options_(options) {
    if (options_.retryLimit < 1)
        options_.retryLimit = 1;
}

Result<std::uint64_t> ResumableTransfer::download(const feed::ArtifactRecord& record,
                                                  const fs::path& dest) {
    if (!http_) {
        return Error{ErrorCode::InternalError, "ResumableTransfer has no http client"};
    }

    std::error_code ec;
    if (dest.has_parent_path()) {
        fs::create_directories(dest.parent_path(), ec);
        if (ec) {
            return Error{ErrorCode::WriteError, "Failed to create directory " +
                                                    dest.parent_path().string() + ": " +
                                                    ec.message()};
        }
    }

    std::uint64_t savedLength = 0;
    {
        std::ofstream os(dest, std::ios::binary | std::ios::out | std::ios::trunc);
        if (!os.good()) {
            return Error{ErrorCode::WriteError, "Failed to open for write: " + dest.string()};
        }

        auto sink = [&](std::span<const std::byte> chunk) -> Result<void> {
            os.write(reinterpret_cast<const char*>(chunk.data()),
                     static_cast<std::streamsize>(chunk.size()));
            if (!os.good()) {
                return Error{ErrorCode::WriteError, "write failed on: " + dest.string()};
            }
            savedLength += chunk.size();
            return Result<void>();
        };

        int attempt = 1;
        for (;;) {
            const std::uint64_t offset = savedLength;
            auto streamed = http_->streamFrom(record.downloadUrl(), offset, sink);
            if (streamed) {
                if (offset > 0 && streamed.value().status == 200) {
                    spdlog::warn("{} ignored Range from offset {}; appended content may repeat",
                                 record.downloadUrl(), offset);
                }
                break;
            }

            const auto& err = streamed.error();
            if (err.code != ErrorCode::StreamInterrupted) {
                spdlog::debug("download of {} failed ({}): {}", record.fileName(),
                              errorToString(err.code), err.message);
                return err;
            }
            if (attempt >= options_.retryLimit) {
                return Error{ErrorCode::StreamInterrupted,
                             "stream failed after " + std::to_string(attempt) +
                                 " attempts: " + err.message};
            }
            // Keep what reached the disk before asking for the rest.
            os.flush();
            if (!os.good()) {
                return Error{ErrorCode::WriteError, "flush failed on: " + dest.string()};
            }
            ++attempt;
            spdlog::warn("download stream error: {}, retry {}/{} from byte {}", err.message,
                         attempt, options_.retryLimit, savedLength);
        }

        os.flush();
        if (!os.good()) {
            return Error{ErrorCode::WriteError, "flush failed on: " + dest.string()};
        }
    }

    if (options_.fsyncOnComplete) {
        auto synced = fsync_file(dest);
        if (!synced) {
            return Error{ErrorCode::WriteError, synced.error().message};
        }
    }

    spdlog::info("downloaded {} ({} bytes)", dest.string(), savedLength);
    notify::notifyBestEffort(notifier_.get(), "download complete:\n" + record.summary());
    return savedLength;
}

} // namespace relsync::transfer
