#include <relsync/core/offload.h>
#include <relsync/feed/rfc2822.h>
#include <relsync/storage/dedup_gate.h>
#include <relsync/sync/sync_cycle.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/this_coro.hpp>
#include <spdlog/spdlog.h>

#include <exception>

namespace relsync::sync {

namespace {

boost::asio::awaitable<void> transferTask(std::shared_ptr<SyncContext> ctx,
                                          feed::ArtifactRecord record) {
    const auto dest = storage::destinationPath(ctx->saveDir, record.fileName());
    Result<std::uint64_t> result = Error{ErrorCode::InternalError, "transfer did not run"};
    try {
        if (!ctx->transfer) {
            result = Error{ErrorCode::InternalError, "no transfer configured"};
        } else {
            auto transfer = ctx->transfer;
            result = co_await offloadToWorker(ctx->workerExecutor, [transfer, record, dest]() {
                return transfer->download(record, dest);
            });
        }
    } catch (const std::exception& e) {
        result = Error{ErrorCode::InternalError, e.what()};
    } catch (...) {
        result = Error{ErrorCode::InternalError, "unknown exception"};
    }

    if (!result) {
        spdlog::error("download {} failed: {}", record.fileName(), result.error().message);
    }
    if (ctx->onTransferFinished) {
        ctx->onTransferFinished(record, result);
    }
}

} // namespace

const char* toString(SyncState state) noexcept {
    switch (state) {
        case SyncState::Idle:
            return "Idle";
        case SyncState::Resolving:
            return "Resolving";
        case SyncState::Checking:
            return "Checking";
        case SyncState::Skipped:
            return "Skipped";
        case SyncState::Downloading:
            return "Downloading";
    }
    return "Unknown";
}

const char* toString(CycleOutcome outcome) noexcept {
    switch (outcome) {
        case CycleOutcome::ResolutionFailed:
            return "ResolutionFailed";
        case CycleOutcome::Skipped:
            return "Skipped";
        case CycleOutcome::TransferLaunched:
            return "TransferLaunched";
    }
    return "Unknown";
}

SyncCycle::SyncCycle(std::shared_ptr<SyncContext> ctx) : ctx_(std::move(ctx)) {}

void SyncCycle::transition(SyncState next) {
    spdlog::trace("[SyncCycle] {} -> {}", toString(state_), toString(next));
    state_ = next;
}

boost::asio::awaitable<CycleOutcome> SyncCycle::run() {
    transition(SyncState::Resolving);
    auto resolver = ctx_->resolver;
    if (!resolver) {
        spdlog::error("resolve feed failed: no resolver configured");
        transition(SyncState::Idle);
        co_return CycleOutcome::ResolutionFailed;
    }
    auto feedUrl = ctx_->feedUrl;
    auto resolved = co_await offloadToWorker(
        ctx_->workerExecutor, [resolver, feedUrl]() { return resolver->resolve(feedUrl); });
    if (!resolved) {
        spdlog::error("resolve feed failed: {}", resolved.error().message);
        transition(SyncState::Idle);
        co_return CycleOutcome::ResolutionFailed;
    }
    auto record = std::move(resolved).value();

    transition(SyncState::Checking);
    auto saveDir = ctx_->saveDir;
    auto fileName = record.fileName();
    const bool fetched = co_await offloadToWorker(ctx_->workerExecutor, [saveDir, fileName]() {
        return storage::alreadyFetched(saveDir, fileName);
    });
    if (fetched) {
        transition(SyncState::Skipped);
        spdlog::debug("{} already downloaded, nothing to do", fileName);
        transition(SyncState::Idle);
        co_return CycleOutcome::Skipped;
    }

    transition(SyncState::Downloading);
    spdlog::info("new release {} published {}: downloading {}", fileName,
                 feed::formatRfc2822(record.publishedAt()), record.downloadUrl());
    auto executor = ctx_->ioExecutor;
    if (!executor)
        executor = co_await boost::asio::this_coro::executor;
    boost::asio::co_spawn(executor, transferTask(ctx_, std::move(record)),
                          [](std::exception_ptr ep) {
                              if (!ep)
                                  return;
                              try {
                                  std::rethrow_exception(ep);
                              } catch (const std::exception& e) {
                                  spdlog::error("transfer task failed: {}", e.what());
                              } catch (...) {
                                  spdlog::error("transfer task failed: unknown exception");
                              }
                          });
    transition(SyncState::Idle);
    co_return CycleOutcome::TransferLaunched;
}

boost::asio::awaitable<CycleOutcome> runCycle(std::shared_ptr<SyncContext> ctx) {
    SyncCycle cycle(std::move(ctx));
    co_return co_await cycle.run();
}

} // namespace relsync::sync
