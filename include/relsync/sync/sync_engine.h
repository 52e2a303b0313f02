#pragma once

#include <relsync/config/sync_config.h>
#include <relsync/schedule/scheduler.h>
#include <relsync/server/static_file_server.h>
#include <relsync/sync/sync_context.h>
#include <relsync/sync/sync_cycle.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <cstdint>
#include <memory>

namespace relsync::sync {

/**
 * Wires the whole daemon together and owns its threads.
 *
 * One io_context (cfg.ioThreads threads) runs the scheduler, every cycle, the transfer tasks and
 * the static file server. Blocking HTTP and filesystem calls go to a separate thread pool
 * (cfg.workerThreads threads).
 */
class SyncEngine {
public:
    /// Collaborators to use instead of the libcurl client and the Telegram notifier.
    struct Dependencies {
        std::shared_ptr<net::IHttpClient> http;
        std::shared_ptr<notify::INotifier> notifier;
    };

    /**
     * @param cfg configuration that already passed SyncConfig::validate()
     */
    explicit SyncEngine(config::SyncConfig cfg, Dependencies deps = {});
    ~SyncEngine();

    SyncEngine(const SyncEngine&) = delete;
    SyncEngine& operator=(const SyncEngine&) = delete;

    /**
     * Start the static file server and the scheduler, then block until stop() or SIGINT/SIGTERM.
     * Startup failures (bind, cron, save directory) are returned before anything runs.
     */
    Result<void> run();

    /**
     * Execute a single cycle and wait for the transfer it launched, if any. A failed transfer is
     * returned as the error.
     */
    Result<CycleOutcome> runOnce();

    /// Safe from any thread, including a signal handler running on the io_context.
    void stop();

    [[nodiscard]] std::shared_ptr<SyncContext> context() const noexcept { return ctx_; }

    /// Port of the running static file server, 0 before run().
    [[nodiscard]] std::uint16_t serverPort() const noexcept;

    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }

private:
    Result<void> prepareSaveDir() const;
    void runIoThreads();

    config::SyncConfig cfg_;
    boost::asio::io_context io_;
    boost::asio::thread_pool workers_;
    std::shared_ptr<SyncContext> ctx_;
    std::unique_ptr<schedule::Scheduler> scheduler_;
    std::unique_ptr<server::StaticFileServer> server_;
    std::atomic<bool> stopRequested_{false};
    std::atomic<bool> running_{false};
};

} // namespace relsync::sync
