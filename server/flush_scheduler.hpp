// server/flush_scheduler.hpp
#pragma once
#include "record_buffer.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>

// Time trigger for the buffer: fires once the buffer has been continuously
// non-empty for `interval`. The deadline is derived from the buffer's
// pending_since(), so a drain that empties the buffer cancels it and the next
// empty -> non-empty append restarts it.
class FlushScheduler {
private:
    RecordBuffer& buffer;
    const std::chrono::milliseconds interval;
    std::function<void()> on_fire;

    std::thread worker;
    std::mutex timer_mutex;
    std::condition_variable condition;
    bool stop_requested{false};
    bool kicked{false};
    std::optional<std::chrono::steady_clock::time_point> last_fired_for;
    std::atomic<size_t> fires{0};

    void run_loop();

public:
    FlushScheduler(RecordBuffer& buffer, std::chrono::milliseconds interval,
                   std::function<void()> on_fire);
    ~FlushScheduler();

    FlushScheduler(const FlushScheduler&) = delete;
    FlushScheduler& operator=(const FlushScheduler&) = delete;

    void start();
    // Cancels the timer and joins the worker. Safe to call more than once.
    void stop();

    // Wakes the worker after the buffer became non-empty.
    void notify_pending();

    size_t fire_count() const { return fires.load(); }
};
