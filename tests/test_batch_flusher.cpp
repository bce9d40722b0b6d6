/**
 * Batch flusher tests
 *
 * Covers:
 *   - Successful flush and counters
 *   - Retry exhaustion: retries + 1 attempts, one lost batch
 *   - Recovery after transient failures
 *   - Drain order across concurrent flushes
 */

#include <gtest/gtest.h>
#include <thread>
#include <vector>

#include "../server/batch_flusher.hpp"
#include "test_helpers.hpp"

using std::chrono::milliseconds;

namespace {

// Records requested backoff delays instead of sleeping.
struct SleepRecorder {
    std::vector<milliseconds> delays;

    BatchFlusher::SleepFn fn() {
        return [this](milliseconds d) { delays.push_back(d); };
    }
};

}  // namespace

TEST(BatchFlusherTest, EmptyBufferIsNoOp) {
    RecordBuffer buffer(10);
    RecordingWriter writer;
    IngestStats stats;
    BatchFlusher flusher(buffer, writer, RetryPolicy(3, milliseconds(1)), stats);

    FlushOutcome outcome = flusher.flush(FlushTrigger::Timer);

    EXPECT_EQ(outcome.status, FlushStatus::Empty);
    EXPECT_EQ(writer.batch_count(), 0u);
    EXPECT_EQ(stats.flushes_by_timer.load(), 0u);
}

TEST(BatchFlusherTest, WritesDrainedBatchInOrder) {
    RecordBuffer buffer(10);
    RecordingWriter writer;
    IngestStats stats;
    BatchFlusher flusher(buffer, writer, RetryPolicy(3, milliseconds(1)), stats);
    for (int i = 0; i < 4; ++i) buffer.append(make_record(i));

    FlushOutcome outcome = flusher.flush(FlushTrigger::Size);

    EXPECT_EQ(outcome.status, FlushStatus::Written);
    EXPECT_EQ(outcome.records, 4u);
    EXPECT_EQ(outcome.attempts, 1u);
    ASSERT_EQ(writer.batch_count(), 1u);
    auto batch = writer.batches()[0];
    for (int i = 0; i < 4; ++i) {
        EXPECT_DOUBLE_EQ(batch[i].active_power, make_record(i).active_power);
    }
    EXPECT_TRUE(buffer.empty());
    EXPECT_EQ(stats.flushes_by_size.load(), 1u);
    EXPECT_EQ(stats.batches_written.load(), 1u);
    EXPECT_EQ(stats.records_written.load(), 4u);
}

TEST(BatchFlusherTest, ExhaustedRetriesLoseBatchExactlyOnce) {
    RecordBuffer buffer(10);
    FailingWriter writer(WriteErrorKind::BackendUnreachable);
    IngestStats stats;
    SleepRecorder sleeper;
    BatchFlusher flusher(buffer, writer, RetryPolicy(3, milliseconds(100), milliseconds(1000)),
                         stats, sleeper.fn());
    buffer.append(make_record(0));
    buffer.append(make_record(1));

    FlushOutcome outcome = flusher.flush(FlushTrigger::Timer);

    EXPECT_EQ(outcome.status, FlushStatus::Lost);
    EXPECT_EQ(outcome.attempts, 4u);
    EXPECT_EQ(writer.attempts.load(), 4u);
    EXPECT_EQ(stats.lost_batches.load(), 1u);
    EXPECT_EQ(stats.lost_records.load(), 2u);
    EXPECT_EQ(stats.write_retries.load(), 3u);
    EXPECT_EQ(stats.batches_written.load(), 0u);
    EXPECT_EQ(sleeper.delays, (std::vector<milliseconds>{milliseconds(100), milliseconds(200), milliseconds(400)}));

    // The lost batch is not retried by later flushes.
    EXPECT_EQ(flusher.flush(FlushTrigger::Timer).status, FlushStatus::Empty);
    EXPECT_EQ(writer.attempts.load(), 4u);
}

TEST(BatchFlusherTest, RecoversAfterTransientFailures) {
    RecordBuffer buffer(10);
    FlakyWriter writer(2);
    IngestStats stats;
    SleepRecorder sleeper;
    BatchFlusher flusher(buffer, writer, RetryPolicy(3, milliseconds(10)), stats, sleeper.fn());
    buffer.append(make_record(0));

    FlushOutcome outcome = flusher.flush(FlushTrigger::Size);

    EXPECT_EQ(outcome.status, FlushStatus::Written);
    EXPECT_EQ(outcome.attempts, 3u);
    EXPECT_EQ(writer.accepted.size(), 1u);
    EXPECT_EQ(stats.write_retries.load(), 2u);
    EXPECT_EQ(stats.lost_batches.load(), 0u);
}

TEST(BatchFlusherTest, UnexpectedExceptionsCountAsWriteFailures) {
    class ThrowingWriter : public BatchWriter {
    public:
        size_t write(const std::vector<MeasurementRecord>&) override {
            throw std::runtime_error("disk full");
        }
        std::string describe() const override { return "throwing writer"; }
    };

    RecordBuffer buffer(10);
    ThrowingWriter writer;
    IngestStats stats;
    SleepRecorder sleeper;
    BatchFlusher flusher(buffer, writer, RetryPolicy(1, milliseconds(1)), stats, sleeper.fn());
    buffer.append(make_record(0));

    EXPECT_EQ(flusher.flush(FlushTrigger::Shutdown).status, FlushStatus::Lost);
    EXPECT_EQ(stats.lost_batches.load(), 1u);
    EXPECT_EQ(stats.flushes_on_shutdown.load(), 1u);
}

TEST(BatchFlusherTest, ConcurrentFlushesPreserveDrainOrder) {
    RecordBuffer buffer(1000);
    RecordingWriter writer(milliseconds(2));
    IngestStats stats;
    BatchFlusher flusher(buffer, writer, RetryPolicy(0, milliseconds(1)), stats);

    constexpr int kRecords = 400;
    std::thread producer([&] {
        for (int i = 0; i < kRecords; ++i) {
            buffer.append(make_record(i));
            if (i % 10 == 9) flusher.flush(FlushTrigger::Size);
        }
    });
    std::thread timer([&] {
        for (int i = 0; i < 50; ++i) {
            flusher.flush(FlushTrigger::Timer);
            std::this_thread::sleep_for(milliseconds(1));
        }
    });
    producer.join();
    timer.join();
    flusher.flush(FlushTrigger::Shutdown);

    std::vector<MeasurementRecord> all;
    for (const auto& batch : writer.batches()) all.insert(all.end(), batch.begin(), batch.end());
    ASSERT_EQ(all.size(), static_cast<size_t>(kRecords));
    for (int i = 0; i < kRecords; ++i) {
        EXPECT_DOUBLE_EQ(all[i].bus_voltage, make_record(i).bus_voltage) << "position " << i;
    }
}
