// server/batch_flusher.cpp
#include "batch_flusher.hpp"
#include "logger.hpp"
#include <sstream>
#include <thread>
#include <utility>

const char* to_string(FlushTrigger trigger) {
    switch (trigger) {
        case FlushTrigger::Size: return "size";
        case FlushTrigger::Timer: return "timer";
        case FlushTrigger::Shutdown: return "shutdown";
    }
    return "unknown";
}

BatchFlusher::BatchFlusher(RecordBuffer& b, BatchWriter& w, RetryPolicy p,
                           IngestStats& s, SleepFn sleep_fn)
    : buffer(b), writer(w), policy(p), stats(s), sleep(std::move(sleep_fn)) {
    if (!sleep) {
        sleep = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
}

void BatchFlusher::count_trigger(FlushTrigger trigger) {
    switch (trigger) {
        case FlushTrigger::Size: ++stats.flushes_by_size; break;
        case FlushTrigger::Timer: ++stats.flushes_by_timer; break;
        case FlushTrigger::Shutdown: ++stats.flushes_on_shutdown; break;
    }
}

FlushOutcome BatchFlusher::flush(FlushTrigger trigger) {
    std::lock_guard<std::mutex> lock(flush_mutex);

    FlushOutcome outcome;
    std::vector<MeasurementRecord> batch = buffer.drain();
    if (batch.empty()) {
        return outcome;
    }

    count_trigger(trigger);
    outcome.records = batch.size();

    while (true) {
        ++outcome.attempts;
        WriteErrorKind kind;
        std::string reason;
        try {
            size_t accepted = writer.write(batch);
            stats.batches_written++;
            stats.records_written += accepted;
            outcome.status = FlushStatus::Written;

            std::stringstream ss;
            ss << "Flushed " << accepted << " points to " << writer.describe()
               << " (" << to_string(trigger) << " trigger";
            if (outcome.attempts > 1) ss << ", attempt " << outcome.attempts;
            ss << ")";
            Logger::batch(ss.str());
            return outcome;
        } catch (const WriteError& e) {
            kind = e.kind();
            reason = e.what();
        } catch (const std::exception& e) {
            kind = WriteErrorKind::Rejected;
            reason = e.what();
        }

        RetryDecision decision = policy.decide(outcome.attempts, kind);
        if (!decision.retry) {
            stats.lost_batches++;
            stats.lost_records += batch.size();
            outcome.status = FlushStatus::Lost;

            std::stringstream ss;
            ss << "Batch of " << batch.size() << " records lost after " << outcome.attempts
               << " attempts (" << to_string(kind) << ": " << reason << ")";
            Logger::alert(ss.str());
            return outcome;
        }

        stats.write_retries++;
        std::stringstream ss;
        ss << "Write of " << batch.size() << " records failed (" << to_string(kind) << ": "
           << reason << "), retrying in " << decision.delay.count() << " ms";
        Logger::warning(ss.str());
        sleep(decision.delay);
    }
}
