// server/record_buffer.hpp
#pragma once

#include "../common/protocol.hpp"
#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <vector>

// Ordered accumulation of decoded records between flushes. All access goes through
// append() and drain(), which are mutually exclusive.
class RecordBuffer {
private:
    const size_t capacity;
    std::vector<MeasurementRecord> records;
    mutable std::mutex records_mutex;
    std::optional<std::chrono::steady_clock::time_point> first_pending;

    // Invoked outside the lock when an append makes the buffer non-empty
    std::function<void()> on_pending;

public:
    explicit RecordBuffer(size_t max_size = 100);

    RecordBuffer(const RecordBuffer&) = delete;
    RecordBuffer& operator=(const RecordBuffer&) = delete;

    // Returns true when the buffer has reached max_size and must be flushed
    // before the next append.
    bool append(MeasurementRecord record);

    // Removes and returns everything appended so far, in insertion order.
    std::vector<MeasurementRecord> drain();

    size_t size() const;
    bool empty() const;

    // Instant of the last empty -> non-empty transition, or nullopt when empty.
    std::optional<std::chrono::steady_clock::time_point> pending_since() const;

    void set_pending_callback(std::function<void()> callback);
};
