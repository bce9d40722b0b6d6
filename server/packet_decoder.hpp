// server/packet_decoder.hpp
#pragma once
#include "../common/protocol.hpp"
#include "errors.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

enum class DataFormat {
    Binary,
    Json,
};

const char* to_string(DataFormat format);
// "binary" or "json", case-insensitive; throws ConfigError otherwise.
DataFormat parse_data_format(const std::string& name);

class PacketDecoder {
private:
    DataFormat format;

    MeasurementRecord decode_binary(const uint8_t* data, size_t length,
                                    std::chrono::system_clock::time_point received_at) const;
    MeasurementRecord decode_json(const uint8_t* data, size_t length,
                                  std::chrono::system_clock::time_point received_at) const;

public:
    explicit PacketDecoder(DataFormat format);

    DataFormat data_format() const { return format; }

    // Throws DecodeError. Never produces a partially filled record.
    MeasurementRecord decode(const uint8_t* data, size_t length,
                             std::chrono::system_clock::time_point received_at =
                                 std::chrono::system_clock::now()) const;
    MeasurementRecord decode(const std::vector<uint8_t>& payload) const {
        return decode(payload.data(), payload.size());
    }

    static std::vector<uint8_t> encode_binary(const MeasurementRecord& record);
    static std::string encode_json(const MeasurementRecord& record, bool with_timestamp = true);

    // Validates and truncates a decoded flag value; throws DecodeError{InvalidFlag}.
    static int decode_flag(double value);

    // ISO-8601 date-time with optional fraction and zone designator, UTC when none is given.
    static std::optional<std::chrono::system_clock::time_point> parse_timestamp(const std::string& text);
    static std::string format_timestamp(std::chrono::system_clock::time_point tp);
};
