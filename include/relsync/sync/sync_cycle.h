#pragma once

#include <relsync/sync/sync_context.h>

#include <utility> // Boost 1.74 awaitable.hpp uses std::exchange without including it

#include <boost/asio/awaitable.hpp>

#include <memory>

namespace relsync::sync {

enum class SyncState { Idle, Resolving, Checking, Skipped, Downloading };

enum class CycleOutcome {
    ResolutionFailed, // feed could not be fetched or had no usable latest entry
    Skipped,          // latest release is already in the save directory
    TransferLaunched, // a transfer task was started in the background
};

const char* toString(SyncState state) noexcept;
const char* toString(CycleOutcome outcome) noexcept;

/**
 * One scheduler tick: resolve the newest feed entry, skip it when it is already on disk,
 * otherwise start a background transfer for it.
 *
 * run() does not wait for the transfer. The transfer task owns a copy of the record and a
 * reference to the context, logs its own failure, and never throws into the caller.
 *
 * Two cycles may check and launch the same release concurrently; nothing serializes the
 * existence check with the write.
 */
class SyncCycle {
public:
    explicit SyncCycle(std::shared_ptr<SyncContext> ctx);

    boost::asio::awaitable<CycleOutcome> run();

    [[nodiscard]] SyncState state() const noexcept { return state_; }

private:
    void transition(SyncState next);

    std::shared_ptr<SyncContext> ctx_;
    SyncState state_{SyncState::Idle};
};

/**
 * Run one SyncCycle on the calling coroutine. The cycle object lives in this coroutine's frame.
 */
boost::asio::awaitable<CycleOutcome> runCycle(std::shared_ptr<SyncContext> ctx);

} // namespace relsync::sync
