#pragma once

#include <relsync/core/types.h>
#include <relsync/feed/artifact_record.h>
#include <relsync/feed/feed_resolver.h>
#include <relsync/net/http_client.h>
#include <relsync/notify/notifier.h>
#include <relsync/transfer/resumable_transfer.h>

#include <boost/asio/any_io_executor.hpp>

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>

namespace relsync::sync {

/**
 * State shared by the scheduler task, every cycle, the transfer tasks and the static server.
 *
 * Held through std::shared_ptr; every coroutine that needs it keeps its own reference, so the
 * context lives until the last in-flight transfer is done. Fields are set up before the first
 * cycle runs and are read-only afterwards.
 */
struct SyncContext {
    std::string feedUrl;
    std::filesystem::path saveDir;

    std::shared_ptr<net::IHttpClient> http;
    std::shared_ptr<feed::FeedEntryResolver> resolver;
    std::shared_ptr<transfer::ResumableTransfer> transfer;
    std::shared_ptr<notify::INotifier> notifier;

    // Executor running cycle and transfer coroutines.
    boost::asio::any_io_executor ioExecutor;
    // Executor for blocking network and filesystem calls. Work runs inline when empty.
    boost::asio::any_io_executor workerExecutor;

    // Called once per launched transfer, success or not, from the io executor.
    std::function<void(const feed::ArtifactRecord&, const Result<std::uint64_t>&)>
        onTransferFinished;
};

} // namespace relsync::sync
