// server/ingestion_loop.hpp
#pragma once
#include "batch_flusher.hpp"
#include "batch_writer.hpp"
#include "flush_scheduler.hpp"
#include "ingest_stats.hpp"
#include "packet_decoder.hpp"
#include "record_buffer.hpp"
#include "retry_policy.hpp"
#include "udp_socket.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

class ServiceConfig;

enum class LoopState {
    Starting,
    Running,
    Draining,
    Stopped,
};

const char* to_string(LoopState state);

struct PipelineSettings {
    std::string host{"localhost"};
    uint16_t port{12345};
    size_t datagram_capacity{1024};
    std::chrono::milliseconds receive_timeout{1000};
    size_t log_interval{1000};
    DataFormat format{DataFormat::Binary};
    size_t max_size{100};
    std::chrono::milliseconds flush_interval{1000};
    RetryPolicy retry;

    static PipelineSettings from_config(const ServiceConfig& config);
};

// Receive path of the service: owns the socket and the buffer, drives
// decode -> append -> flush, and runs the Starting -> Running -> Draining ->
// Stopped state machine. The writer is owned by the caller.
class IngestionLoop {
private:
    PipelineSettings settings;
    PacketDecoder decoder;
    IngestStats counters;
    RecordBuffer buffer;
    BatchFlusher flusher;
    FlushScheduler scheduler;
    UdpSocket socket;
    int wake_pipe[2]{-1, -1};

    std::atomic<LoopState> current_state{LoopState::Starting};
    std::atomic<bool> stop_flag{false};
    std::chrono::steady_clock::time_point first_packet_time;
    bool first_packet_seen{false};

    void receive_pending(std::vector<uint8_t>& datagram);
    uint64_t count_packet();
    void report_decode_error(const DecodeError& e);
    void reject_oversized(size_t length);
    void backoff_sleep(std::chrono::milliseconds delay);
    void drain_wake_pipe();
    void log_progress(uint64_t packets);
    void shutdown();

public:
    // Without `sleep`, retry backoff sleeps end early once request_stop() is called.
    IngestionLoop(const PipelineSettings& settings, BatchWriter& writer,
                  BatchFlusher::SleepFn sleep = nullptr);
    ~IngestionLoop();

    IngestionLoop(const IngestionLoop&) = delete;
    IngestionLoop& operator=(const IngestionLoop&) = delete;

    // Binds the socket. On failure logs the error, moves to Stopped and returns false.
    bool start();

    // Blocks until request_stop(), then drains the buffer one last time and
    // releases the socket.
    void run();

    // Async-signal-safe.
    void request_stop();

    // Decodes one datagram and appends it, flushing when the buffer is full.
    // Decode failures are counted and logged, never thrown.
    void ingest(const uint8_t* data, size_t length);

    LoopState state() const { return current_state.load(); }
    uint16_t bound_port() const { return socket.local_port(); }
    size_t buffered() const { return buffer.size(); }
    size_t timer_fires() const { return scheduler.fire_count(); }
    const IngestStats& stats() const { return counters; }
};
