#include <relsync/sync/sync_engine.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/use_future.hpp>
#include <spdlog/spdlog.h>

#include <csignal>
#include <future>
#include <system_error>
#include <thread>
#include <vector>

namespace relsync::sync {

namespace fs = std::filesystem;

namespace {

boost::asio::awaitable<void> scheduledTick(std::shared_ptr<SyncContext> ctx) {
    auto outcome = co_await runCycle(std::move(ctx));
    spdlog::trace("cycle finished: {}", toString(outcome));
}

} // namespace

SyncEngine::SyncEngine(config::SyncConfig cfg, Dependencies deps)
    : cfg_(std::move(cfg)), io_(cfg_.ioThreads),
      workers_(static_cast<std::size_t>(cfg_.workerThreads)),
      ctx_(std::make_shared<SyncContext>()) {
    auto http = deps.http;
    if (!http) {
        net::HttpClientOptions options;
        options.userAgent = cfg_.userAgent;
        http = net::makeCurlHttpClient(std::move(options));
    }

    auto notifier = deps.notifier;
    if (!notifier) {
        notify::TelegramConfig tg;
        tg.apiBase = cfg_.notifyApi;
        tg.token = cfg_.token;
        tg.chatId = cfg_.chatId;
        notifier = notify::makeTelegramNotifier(http, std::move(tg));
    }

    transfer::TransferOptions transferOptions;
    transferOptions.retryLimit = cfg_.retryLimit;

    ctx_->feedUrl = cfg_.rssUrl;
    ctx_->saveDir = cfg_.saveDir;
    ctx_->http = http;
    ctx_->notifier = notifier;
    ctx_->resolver = std::make_shared<feed::FeedEntryResolver>(http, cfg_.publicUrlPrefix());
    ctx_->transfer = std::make_shared<transfer::ResumableTransfer>(http, notifier, transferOptions);
    ctx_->ioExecutor = io_.get_executor();
    ctx_->workerExecutor = workers_.get_executor();
}

SyncEngine::~SyncEngine() {
    stop();
    workers_.stop();
    workers_.join();
}

std::uint16_t SyncEngine::serverPort() const noexcept {
    return server_ ? server_->port() : 0;
}

Result<void> SyncEngine::prepareSaveDir() const {
    std::error_code ec;
    fs::create_directories(cfg_.saveDir, ec);
    if (ec) {
        return Error{ErrorCode::WriteError,
                     "Cannot create save directory " + cfg_.saveDir.string() + ": " + ec.message()};
    }
    return Result<void>();
}

void SyncEngine::runIoThreads() {
    std::vector<std::thread> threads;
    for (int i = 1; i < cfg_.ioThreads; ++i) {
        threads.emplace_back([this]() { io_.run(); });
    }
    io_.run();
    for (auto& t : threads) {
        if (t.joinable())
            t.join();
    }
}

Result<void> SyncEngine::run() {
    if (stopRequested_.load())
        return Result<void>();
    auto cron = schedule::CronSchedule::parse(cfg_.cron);
    if (!cron) {
        return cron.error();
    }
    auto dir = prepareSaveDir();
    if (!dir) {
        return dir.error();
    }

    io_.restart();
    server::StaticFileServer::Config serverCfg;
    serverCfg.bindAddress = cfg_.listen.host;
    serverCfg.bindPort = cfg_.listen.port;
    serverCfg.assetsPath = cfg_.assetsPath;
    serverCfg.root = cfg_.saveDir;
    server_ = std::make_unique<server::StaticFileServer>(io_.get_executor(), serverCfg);
    auto started = server_->start();
    if (!started) {
        return started.error();
    }

    scheduler_ = std::make_unique<schedule::Scheduler>(
        io_.get_executor(), std::move(cron).value(),
        [ctx = ctx_]() { return scheduledTick(ctx); });

    boost::asio::signal_set signals(io_, SIGINT, SIGTERM);
    signals.async_wait([this](const boost::system::error_code& ec, int signo) {
        if (ec)
            return;
        spdlog::info("received signal {}, shutting down", signo);
        stop();
    });

    spdlog::info("watching {} on '{}', publishing under {}", cfg_.rssUrl, cfg_.cron,
                 cfg_.publicUrlPrefix());
    running_.store(true);
    scheduler_->start();
    runIoThreads();
    running_.store(false);
    return Result<void>();
}

Result<CycleOutcome> SyncEngine::runOnce() {
    auto dir = prepareSaveDir();
    if (!dir) {
        return dir.error();
    }

    io_.restart();
    auto work = boost::asio::make_work_guard(io_);
    std::promise<Result<std::uint64_t>> transferDone;
    auto transferFuture = transferDone.get_future();
    ctx_->onTransferFinished = [&transferDone](const feed::ArtifactRecord&,
                                               const Result<std::uint64_t>& r) {
        transferDone.set_value(r);
    };

    std::vector<std::thread> threads;
    for (int i = 0; i < cfg_.ioThreads; ++i) {
        threads.emplace_back([this]() { io_.run(); });
    }

    running_.store(true);
    auto outcomeFuture = boost::asio::co_spawn(io_, runCycle(ctx_), boost::asio::use_future);
    Result<CycleOutcome> result = Error{ErrorCode::InternalError, "cycle did not run"};
    try {
        result = outcomeFuture.get();
        if (result.has_value() && result.value() == CycleOutcome::TransferLaunched) {
            auto transferred = transferFuture.get();
            if (!transferred) {
                result = transferred.error();
            }
        }
    } catch (const std::exception& e) {
        result = Error{ErrorCode::InternalError, std::string("cycle failed: ") + e.what()};
    } catch (...) {
        result = Error{ErrorCode::InternalError, "cycle failed: unknown exception"};
    }

    work.reset();
    io_.stop();
    for (auto& t : threads) {
        if (t.joinable())
            t.join();
    }
    running_.store(false);
    ctx_->onTransferFinished = nullptr;
    return result;
}

void SyncEngine::stop() {
    if (stopRequested_.exchange(true))
        return;
    spdlog::debug("SyncEngine stopping");
    if (scheduler_)
        scheduler_->stop();
    if (server_)
        server_->stop();
    if (ctx_ && ctx_->http)
        ctx_->http->cancelAll();
    io_.stop();
}

} // namespace relsync::sync
