#pragma once
/**
 * @file monitor_loop.hpp
 * @brief Cancellable periodic ticker driving the failover cycle.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>

namespace skywan::control {

    /** @class MonitorLoop
     *  @brief Runs a tick immediately, then once per interval until stop() is called.
     *  @note stop() may be called from any thread; run() returns within one tick.
     */
    class MonitorLoop {
    public:
        using Tick = std::function<void()>;

        MonitorLoop(std::chrono::milliseconds interval, Tick tick)
            : interval_(interval), tick_(std::move(tick)) {}

        /// Block until stopped.
        void run();

        /// Request stop and wake the sleeping loop.
        void stop();

        [[nodiscard]] bool stop_requested() const noexcept { return stop_.load(std::memory_order_acquire); }
        [[nodiscard]] uint64_t ticks() const noexcept { return ticks_.load(std::memory_order_relaxed); }

    private:
        std::chrono::milliseconds interval_;
        Tick                      tick_;
        std::mutex                mu_;
        std::condition_variable   cv_;
        std::atomic<bool>         stop_{false};
        std::atomic<uint64_t>     ticks_{0};
    };

} // namespace skywan::control
