// server/flush_scheduler.cpp
#include "flush_scheduler.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <utility>

FlushScheduler::FlushScheduler(RecordBuffer& b, std::chrono::milliseconds i,
                               std::function<void()> fire)
    : buffer(b), interval(i), on_fire(std::move(fire)) {
    if (interval.count() <= 0) {
        throw ConfigError("Flush interval must be positive");
    }
}

FlushScheduler::~FlushScheduler() {
    stop();
}

void FlushScheduler::start() {
    std::lock_guard<std::mutex> lock(timer_mutex);
    if (worker.joinable()) return;
    stop_requested = false;
    worker = std::thread([this] { run_loop(); });
    Logger::debug("Flush scheduler started (interval " + std::to_string(interval.count()) + " ms)");
}

void FlushScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(timer_mutex);
        stop_requested = true;
    }
    condition.notify_all();
    if (worker.joinable() && worker.get_id() != std::this_thread::get_id()) {
        worker.join();
    }
}

void FlushScheduler::notify_pending() {
    {
        std::lock_guard<std::mutex> lock(timer_mutex);
        kicked = true;
    }
    condition.notify_all();
}

void FlushScheduler::run_loop() {
    std::unique_lock<std::mutex> lock(timer_mutex);

    while (!stop_requested) {
        kicked = false;
        auto since = buffer.pending_since();

        // Disarmed: empty buffer, or this pending period already fired.
        if (!since || since == last_fired_for) {
            condition.wait(lock, [this] { return stop_requested || kicked; });
            continue;
        }

        auto deadline = *since + interval;
        if (std::chrono::steady_clock::now() < deadline) {
            condition.wait_until(lock, deadline, [this] { return stop_requested; });
            continue;
        }

        last_fired_for = since;
        ++fires;
        lock.unlock();
        try {
            on_fire();
        } catch (const std::exception& e) {
            Logger::error(std::string("Timed flush failed: ") + e.what());
        }
        lock.lock();
    }
}
