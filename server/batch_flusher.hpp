// server/batch_flusher.hpp
#pragma once
#include "batch_writer.hpp"
#include "ingest_stats.hpp"
#include "record_buffer.hpp"
#include "retry_policy.hpp"
#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>

enum class FlushTrigger {
    Size,
    Timer,
    Shutdown,
};

enum class FlushStatus {
    Empty,
    Written,
    Lost,
};

const char* to_string(FlushTrigger trigger);

struct FlushOutcome {
    FlushStatus status{FlushStatus::Empty};
    size_t records{0};
    size_t attempts{0};
};

// Drain + write as one ordered unit. Both the receive path and the timer path
// call flush(); the flush mutex keeps batches in drain order and keeps at most
// one batch in flight against the backend.
class BatchFlusher {
public:
    using SleepFn = std::function<void(std::chrono::milliseconds)>;

private:
    RecordBuffer& buffer;
    BatchWriter& writer;
    RetryPolicy policy;
    IngestStats& stats;
    SleepFn sleep;
    std::mutex flush_mutex;

    void count_trigger(FlushTrigger trigger);

public:
    BatchFlusher(RecordBuffer& buffer, BatchWriter& writer, RetryPolicy policy,
                 IngestStats& stats, SleepFn sleep = nullptr);

    FlushOutcome flush(FlushTrigger trigger);
};
