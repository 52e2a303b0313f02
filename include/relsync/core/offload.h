#pragma once

#include <utility> // Boost 1.74 awaitable.hpp uses std::exchange without including it

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <memory>
#include <type_traits>
#include <utility>

namespace relsync {

/**
 * Run a blocking callable on the worker executor and resume the calling coroutine with its
 * result. The calling executor stays free for other coroutines while the work is in flight.
 * Exceptions thrown by fn propagate to the awaiting coroutine.
 */
template <typename Fn>
inline boost::asio::awaitable<std::remove_cvref_t<std::invoke_result_t<Fn&>>>
offloadToWorker(boost::asio::any_io_executor worker, Fn&& fn) {
    using ResultType = std::remove_cvref_t<std::invoke_result_t<Fn&>>;
    static_assert(!std::is_void_v<ResultType>, "offloadToWorker requires non-void result type");
    if (!worker) {
        co_return fn();
    }
    auto shared = co_await boost::asio::co_spawn(
        worker,
        [fn = std::forward<Fn>(fn)]() mutable -> boost::asio::awaitable<std::shared_ptr<ResultType>> {
            co_return std::make_shared<ResultType>(fn());
        },
        boost::asio::use_awaitable);
    co_return std::move(*shared);
}

} // namespace relsync
