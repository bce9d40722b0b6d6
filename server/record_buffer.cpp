// server/record_buffer.cpp
#include "record_buffer.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <utility>

RecordBuffer::RecordBuffer(size_t max_size) : capacity(max_size) {
    if (capacity == 0) {
        throw ConfigError("Buffer max size must be positive");
    }
    records.reserve(capacity);
    Logger::debug("RecordBuffer initialized - will flush every " + std::to_string(capacity) + " records");
}

bool RecordBuffer::append(MeasurementRecord record) {
    bool became_pending = false;
    bool flush_due = false;
    std::function<void()> callback;
    {
        std::lock_guard<std::mutex> lock(records_mutex);
        if (records.empty()) {
            first_pending = std::chrono::steady_clock::now();
            became_pending = true;
            callback = on_pending;
        }
        records.push_back(std::move(record));
        flush_due = records.size() >= capacity;
    }

    if (became_pending && callback) {
        callback();
    }
    return flush_due;
}

std::vector<MeasurementRecord> RecordBuffer::drain() {
    std::vector<MeasurementRecord> out;
    out.reserve(capacity);

    std::lock_guard<std::mutex> lock(records_mutex);
    out.swap(records);
    first_pending.reset();
    return out;
}

size_t RecordBuffer::size() const {
    std::lock_guard<std::mutex> lock(records_mutex);
    return records.size();
}

bool RecordBuffer::empty() const {
    std::lock_guard<std::mutex> lock(records_mutex);
    return records.empty();
}

std::optional<std::chrono::steady_clock::time_point> RecordBuffer::pending_since() const {
    std::lock_guard<std::mutex> lock(records_mutex);
    return first_pending;
}

void RecordBuffer::set_pending_callback(std::function<void()> callback) {
    std::lock_guard<std::mutex> lock(records_mutex);
    on_pending = std::move(callback);
}
