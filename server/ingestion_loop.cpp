// server/ingestion_loop.cpp
#include "ingestion_loop.hpp"
#include "config.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <iomanip>
#include <poll.h>
#include <sstream>
#include <thread>
#include <unistd.h>
#include <utility>

namespace {

// Datagrams read per poll wakeup before the stop flag is checked again
constexpr int kMaxDatagramsPerWake = 256;
// Decode failures logged at WARN before dropping to DEBUG
constexpr uint64_t kLoudDecodeErrors = 10;
// Longest stretch a backoff sleep runs without checking for a stop request
constexpr std::chrono::milliseconds kStopCheckInterval{50};

}  // namespace

const char* to_string(LoopState state) {
    switch (state) {
        case LoopState::Starting: return "Starting";
        case LoopState::Running: return "Running";
        case LoopState::Draining: return "Draining";
        case LoopState::Stopped: return "Stopped";
    }
    return "Unknown";
}

PipelineSettings PipelineSettings::from_config(const ServiceConfig& config) {
    PipelineSettings s;
    s.host = config.udp.host;
    s.port = static_cast<uint16_t>(config.udp.port);
    s.datagram_capacity = config.udp.buffer_size;
    s.receive_timeout = config.receive_timeout();
    s.log_interval = config.udp.log_interval;
    s.format = config.data_format();
    s.max_size = config.buffer.max_size;
    s.flush_interval = config.flush_interval();
    s.retry = config.retry_policy();
    return s;
}

IngestionLoop::IngestionLoop(const PipelineSettings& s, BatchWriter& writer, BatchFlusher::SleepFn sleep)
    : settings(s),
      decoder(s.format),
      buffer(s.max_size),
      flusher(buffer, writer, s.retry, counters,
              sleep ? std::move(sleep)
                    : BatchFlusher::SleepFn([this](std::chrono::milliseconds d) { backoff_sleep(d); })),
      scheduler(buffer, s.flush_interval, [this] { flusher.flush(FlushTrigger::Timer); }) {
    if (pipe2(wake_pipe, O_NONBLOCK | O_CLOEXEC) != 0) {
        throw std::runtime_error(std::string("pipe() failed: ") + std::strerror(errno));
    }
    buffer.set_pending_callback([this] { scheduler.notify_pending(); });
}

IngestionLoop::~IngestionLoop() {
    scheduler.stop();
    for (int& fd : wake_pipe) {
        if (fd != -1) {
            close(fd);
            fd = -1;
        }
    }
}

bool IngestionLoop::start() {
    if (current_state.load() != LoopState::Starting) {
        Logger::error("Ingestion loop already started");
        return false;
    }

    try {
        socket.bind(settings.host, settings.port);
    } catch (const BindError& e) {
        Logger::error(e.what());
        current_state.store(LoopState::Stopped);
        return false;
    }

    std::stringstream ss;
    ss << "Grid ingestion listening on udp://" << settings.host << ":" << socket.local_port()
       << " (format=" << to_string(settings.format)
       << ", max_size=" << settings.max_size
       << ", flush_interval=" << settings.flush_interval.count() << "ms"
       << ", retries=" << settings.retry.retries() << ")";
    Logger::success(ss.str());
    return true;
}

void IngestionLoop::run() {
    if (current_state.load() != LoopState::Starting || !socket.is_open()) {
        Logger::error("Ingestion loop not started - call start() first");
        return;
    }

    current_state.store(LoopState::Running);
    scheduler.start();
    Logger::info("Ingestion running - waiting for datagrams...");

    std::vector<uint8_t> datagram(settings.datagram_capacity);
    pollfd fds[2];
    fds[0].fd = socket.fd();
    fds[0].events = POLLIN;
    fds[1].fd = wake_pipe[0];
    fds[1].events = POLLIN;

    const int timeout_ms = static_cast<int>(std::max<long long>(1, settings.receive_timeout.count()));

    while (!stop_flag.load()) {
        int rc = poll(fds, 2, timeout_ms);
        if (rc < 0) {
            if (errno == EINTR) continue;
            Logger::error(std::string("poll() failed: ") + std::strerror(errno));
            break;
        }
        if (rc == 0) continue;

        if (fds[1].revents & POLLIN) {
            drain_wake_pipe();
        }
        if (stop_flag.load()) break;

        if (fds[0].revents & (POLLIN | POLLERR)) {
            receive_pending(datagram);
        }
    }

    shutdown();
}

void IngestionLoop::receive_pending(std::vector<uint8_t>& datagram) {
    for (int i = 0; i < kMaxDatagramsPerWake && !stop_flag.load(); ++i) {
        ssize_t n = socket.receive(datagram.data(), datagram.size());
        if (n < 0) {
            if (errno != EAGAIN && errno != EWOULDBLOCK) {
                Logger::warning(std::string("recv() failed: ") + std::strerror(errno));
            }
            return;
        }

        size_t length = static_cast<size_t>(n);
        if (length > datagram.size()) {
            reject_oversized(length);
            continue;
        }
        ingest(datagram.data(), length);
    }
}

uint64_t IngestionLoop::count_packet() {
    uint64_t packets = ++counters.packets_received;
    if (!first_packet_seen) {
        first_packet_seen = true;
        first_packet_time = std::chrono::steady_clock::now();
        Logger::info("First datagram received");
    }
    return packets;
}

void IngestionLoop::report_decode_error(const DecodeError& e) {
    counters.count_decode_error(e.kind());
    uint64_t errors = counters.decode_errors.load();
    std::string msg = std::string("Dropped datagram (") + to_string(e.kind()) + "): " + e.what();
    if (errors <= kLoudDecodeErrors ||
        (settings.log_interval > 0 && errors % settings.log_interval == 0)) {
        Logger::warning(msg + " [" + std::to_string(errors) + " decode errors so far]");
    } else {
        Logger::debug(msg);
    }
}

// The kernel cut the datagram to the receive buffer; the prefix is never decoded.
void IngestionLoop::reject_oversized(size_t length) {
    count_packet();
    DecodeErrorKind kind = decoder.data_format() == DataFormat::Binary ? DecodeErrorKind::LengthMismatch
                                                                      : DecodeErrorKind::MalformedPayload;
    report_decode_error(DecodeError(kind, "Datagram of " + std::to_string(length) +
                                          " bytes exceeds the " + std::to_string(settings.datagram_capacity) +
                                          "-byte receive buffer"));
}

void IngestionLoop::ingest(const uint8_t* data, size_t length) {
    uint64_t packets = count_packet();

    MeasurementRecord record;
    try {
        record = decoder.decode(data, length);
    } catch (const DecodeError& e) {
        report_decode_error(e);
        return;
    }

    ++counters.records_buffered;
    if (buffer.append(std::move(record))) {
        flusher.flush(FlushTrigger::Size);
    }

    if (settings.log_interval > 0 && packets % settings.log_interval == 0) {
        log_progress(packets);
    }
}

void IngestionLoop::log_progress(uint64_t packets) {
    auto elapsed = std::chrono::duration_cast<std::chrono::duration<double>>(
        std::chrono::steady_clock::now() - first_packet_time).count();
    double rate = elapsed > 0.0 ? static_cast<double>(packets) / elapsed : 0.0;

    std::stringstream ss;
    ss << "Received " << packets << " packets ("
       << std::fixed << std::setprecision(1) << rate << " packets/sec, "
       << counters.decode_errors.load() << " decode errors, "
       << counters.records_written.load() << " records written, "
       << counters.lost_batches.load() << " batches lost)";
    Logger::info(ss.str());
}

void IngestionLoop::drain_wake_pipe() {
    uint8_t tmp[64];
    while (read(wake_pipe[0], tmp, sizeof(tmp)) > 0) {
    }
}

// Cut short once a stop is requested so shutdown is bounded by write timeouts, not backoff.
void IngestionLoop::backoff_sleep(std::chrono::milliseconds delay) {
    auto deadline = std::chrono::steady_clock::now() + delay;
    while (!stop_flag.load()) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) return;
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(remaining + std::chrono::milliseconds(1), kStopCheckInterval));
    }
}

void IngestionLoop::request_stop() {
    stop_flag.store(true);
    if (wake_pipe[1] != -1) {
        const uint8_t b = 1;
        // EAGAIN means a wakeup is already pending
        ssize_t written = write(wake_pipe[1], &b, 1);
        (void)written;
    }
}

void IngestionLoop::shutdown() {
    current_state.store(LoopState::Draining);
    Logger::info("Shutting down - draining " + std::to_string(buffer.size()) + " buffered records");

    scheduler.stop();
    FlushOutcome outcome = flusher.flush(FlushTrigger::Shutdown);
    if (outcome.status == FlushStatus::Lost) {
        Logger::error("Final flush failed - " + std::to_string(outcome.records) + " records were not persisted");
    }

    socket.close();
    current_state.store(LoopState::Stopped);

    std::stringstream ss;
    ss << "Ingestion stopped: " << counters.packets_received.load() << " packets, "
       << counters.records_written.load() << " records written, "
       << counters.decode_errors.load() << " decode errors, "
       << counters.lost_batches.load() << " batches lost";
    Logger::info(ss.str());
}
