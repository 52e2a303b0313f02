#include <relsync/schedule/scheduler.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <exception>

namespace relsync::schedule {

namespace {

void logTickFailure(std::exception_ptr ep) {
    if (!ep)
        return;
    try {
        std::rethrow_exception(ep);
    } catch (const std::exception& e) {
        spdlog::error("[Scheduler] tick failed: {}", e.what());
    } catch (...) {
        spdlog::error("[Scheduler] tick failed: unknown exception");
    }
}

} // namespace

Scheduler::State::State(boost::asio::any_io_executor exec, CronSchedule sched, Tick t,
                        std::shared_ptr<std::atomic<std::uint64_t>> fired)
    : executor(exec), strand(boost::asio::make_strand(exec)), timer(strand),
      schedule(std::move(sched)), tick(std::move(t)), ticksFired(std::move(fired)) {}

Scheduler::Scheduler(boost::asio::any_io_executor executor, CronSchedule schedule, Tick tick)
    : ticksFired_(std::make_shared<std::atomic<std::uint64_t>>(0)) {
    state_ = std::make_shared<State>(std::move(executor), std::move(schedule), std::move(tick),
                                     ticksFired_);
}

Scheduler::~Scheduler() {
    stop();
}

void Scheduler::start() {
    if (started_)
        return;
    started_ = true;
    spdlog::debug("[Scheduler] started with '{}'", state_->schedule.expression());
    boost::asio::co_spawn(state_->strand, loop(state_), [](std::exception_ptr ep) {
        logTickFailure(ep);
    });
}

void Scheduler::stop() {
    if (!state_ || state_->stopRequested.exchange(true))
        return;
    auto state = state_;
    boost::asio::post(state->strand, [state]() { state->timer.cancel(); });
}

boost::asio::awaitable<void> Scheduler::loop(std::shared_ptr<State> state) {
    using namespace std::chrono;

    while (!state->stopRequested.load(std::memory_order_acquire)) {
        auto fireAt = state->schedule.next(system_clock::now());
        if (!fireAt) {
            spdlog::warn("[Scheduler] '{}' has no future fire time; scheduler idle",
                         state->schedule.expression());
            break;
        }

        auto wait = *fireAt - system_clock::now();
        state->timer.expires_after(duration_cast<steady_clock::duration>(
            wait > system_clock::duration::zero() ? wait : system_clock::duration::zero()));
        try {
            co_await state->timer.async_wait(boost::asio::use_awaitable);
        } catch (const boost::system::system_error& e) {
            if (e.code() == boost::asio::error::operation_aborted) {
                break;
            }
            throw;
        }
        if (state->stopRequested.load(std::memory_order_acquire))
            break;

        state->ticksFired->fetch_add(1, std::memory_order_relaxed);
        spdlog::trace("[Scheduler] tick");
        boost::asio::co_spawn(state->executor, state->tick(), [](std::exception_ptr ep) {
            logTickFailure(ep);
        });
    }
    spdlog::debug("[Scheduler] stopped");
    co_return;
}

} // namespace relsync::schedule
