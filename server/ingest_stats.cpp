// server/ingest_stats.cpp
#include "ingest_stats.hpp"

nlohmann::json IngestStats::to_json() const {
    nlohmann::json by_kind = nlohmann::json::object();
    for (auto kind : {DecodeErrorKind::LengthMismatch, DecodeErrorKind::MalformedPayload,
                      DecodeErrorKind::MissingField, DecodeErrorKind::InvalidFlag}) {
        by_kind[to_string(kind)] = decode_errors_of(kind);
    }

    return {
        {"packets_received", packets_received.load()},
        {"records_buffered", records_buffered.load()},
        {"decode_errors", decode_errors.load()},
        {"decode_errors_by_kind", by_kind},
        {"flushes", {
            {"size", flushes_by_size.load()},
            {"timer", flushes_by_timer.load()},
            {"shutdown", flushes_on_shutdown.load()},
        }},
        {"batches_written", batches_written.load()},
        {"records_written", records_written.load()},
        {"write_retries", write_retries.load()},
        {"lost_batches", lost_batches.load()},
        {"lost_records", lost_records.load()},
    };
}
