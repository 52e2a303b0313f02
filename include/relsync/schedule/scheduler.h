#pragma once

#include <relsync/schedule/cron_schedule.h>

#include <utility> // Boost 1.74 awaitable.hpp uses std::exchange without including it

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>

namespace relsync::schedule {

/**
 * Fires a coroutine on every cron tick.
 *
 * Each tick is spawned as its own coroutine and the loop goes straight back to waiting, so a
 * slow tick never delays the next one and ticks may overlap. The next fire time is computed
 * from the clock after waking: ticks missed while the process was busy or suspended are
 * dropped, never replayed.
 */
class Scheduler {
public:
    using Tick = std::function<boost::asio::awaitable<void>()>;

    Scheduler(boost::asio::any_io_executor executor, CronSchedule schedule, Tick tick);
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    void start();
    void stop();

    [[nodiscard]] std::uint64_t ticksFired() const noexcept {
        return ticksFired_->load(std::memory_order_relaxed);
    }

private:
    struct State {
        boost::asio::any_io_executor executor;
        boost::asio::strand<boost::asio::any_io_executor> strand;
        boost::asio::steady_timer timer;
        CronSchedule schedule;
        Tick tick;
        std::atomic<bool> stopRequested{false};
        std::shared_ptr<std::atomic<std::uint64_t>> ticksFired;

        State(boost::asio::any_io_executor exec, CronSchedule sched, Tick t,
              std::shared_ptr<std::atomic<std::uint64_t>> fired);
    };

    static boost::asio::awaitable<void> loop(std::shared_ptr<State> state);

    std::shared_ptr<State> state_;
    std::shared_ptr<std::atomic<std::uint64_t>> ticksFired_;
    bool started_{false};
};

} // namespace relsync::schedule
