/**
 * @file monitor_loop.cpp
 * @brief MonitorLoop implementation.
 */
#include "skywan/control/monitor_loop.hpp"

namespace skywan::control {

void MonitorLoop::run() {
    while (!stop_requested()) {
        tick_();
        ticks_.fetch_add(1, std::memory_order_relaxed);

        std::unique_lock<std::mutex> lk(mu_);
        cv_.wait_for(lk, interval_, [this] { return stop_requested(); });
    }
}

void MonitorLoop::stop() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        stop_.store(true, std::memory_order_release);
    }
    cv_.notify_all();
}

} // namespace skywan::control
