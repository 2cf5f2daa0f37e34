#pragma once
// ============================================================================
// VIGIL - Timed External Calls
// ============================================================================
// Every call to the exchange or a market data source runs on a dedicated
// I/O pool and is awaited with a deadline. A call that misses its deadline
// is reported as TimeoutError; it keeps running in the background and its
// late result is discarded, so exchange-side requests are never torn down
// half way.
// ============================================================================

#include "vigil/core/errors.hpp"
#include "vigil/core/types.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <future>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace vigil {

class TimedCaller {
public:
    TimedCaller(size_t io_threads, Duration default_timeout)
        : pool_(io_threads == 0 ? 1 : io_threads), default_timeout_(default_timeout) {}

    ~TimedCaller() { shutdown(); }

    TimedCaller(const TimedCaller&) = delete;
    TimedCaller& operator=(const TimedCaller&) = delete;

    /// Run `fn` on the I/O pool and wait at most `timeout` for its result.
    /// Exceptions thrown by `fn` propagate unchanged.
    template <typename F>
    auto call(std::string_view what, F&& fn, Duration timeout) -> std::invoke_result_t<std::decay_t<F>&> {
        using Result = std::invoke_result_t<std::decay_t<F>&>;

        auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(fn));
        auto future = task->get_future();
        boost::asio::post(pool_, [task] { (*task)(); });

        if (future.wait_for(timeout) != std::future_status::ready) {
            timeouts_.fetch_add(1, std::memory_order_relaxed);
            const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(timeout).count();
            throw TimeoutError(std::string(what) + " timed out after " + std::to_string(ms) + " ms");
        }
        return future.get();
    }

    template <typename F>
    auto call(std::string_view what, F&& fn) -> std::invoke_result_t<std::decay_t<F>&> {
        return call(what, std::forward<F>(fn), default_timeout_);
    }

    /// Stop accepting calls and join the pool (waits for calls already running)
    void shutdown() {
        if (!stopped_.exchange(true)) {
            pool_.join();
        }
    }

    [[nodiscard]] Duration default_timeout() const noexcept { return default_timeout_; }
    [[nodiscard]] uint64_t timeouts() const noexcept { return timeouts_.load(std::memory_order_relaxed); }

private:
    boost::asio::thread_pool pool_;
    Duration default_timeout_;
    std::atomic<uint64_t> timeouts_{0};
    std::atomic<bool> stopped_{false};
};

}  // namespace vigil
