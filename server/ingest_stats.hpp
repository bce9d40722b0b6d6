// server/ingest_stats.hpp
#pragma once
#include "errors.hpp"
#include <array>
#include <atomic>
#include <cstdint>
#include <nlohmann/json.hpp>

struct IngestStats {
    std::atomic<uint64_t> packets_received{0};
    std::atomic<uint64_t> records_buffered{0};
    std::atomic<uint64_t> decode_errors{0};
    std::array<std::atomic<uint64_t>, 4> decode_errors_by_kind{};

    std::atomic<uint64_t> flushes_by_size{0};
    std::atomic<uint64_t> flushes_by_timer{0};
    std::atomic<uint64_t> flushes_on_shutdown{0};
    std::atomic<uint64_t> batches_written{0};
    std::atomic<uint64_t> records_written{0};
    std::atomic<uint64_t> write_retries{0};
    std::atomic<uint64_t> lost_batches{0};
    std::atomic<uint64_t> lost_records{0};

    void count_decode_error(DecodeErrorKind kind) {
        ++decode_errors;
        ++decode_errors_by_kind[static_cast<size_t>(kind)];
    }

    uint64_t decode_errors_of(DecodeErrorKind kind) const {
        return decode_errors_by_kind[static_cast<size_t>(kind)].load();
    }

    nlohmann::json to_json() const;
};
