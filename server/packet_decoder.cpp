// server/packet_decoder.cpp
#include "packet_decoder.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <sstream>

using json = nlohmann::json;

namespace {

double read_le_double(const uint8_t* p) {
    uint64_t bits = 0;
    for (int i = 7; i >= 0; --i) {
        bits = (bits << 8) | static_cast<uint64_t>(p[i]);
    }
    double value;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
}

void write_le_double(double value, uint8_t* p) {
    uint64_t bits;
    std::memcpy(&bits, &value, sizeof(bits));
    for (int i = 0; i < 8; ++i) {
        p[i] = static_cast<uint8_t>(bits & 0xFF);
        bits >>= 8;
    }
}

bool parse_two_digits(const std::string& s, size_t pos, int& out) {
    if (pos + 2 > s.size()) return false;
    if (!std::isdigit(static_cast<unsigned char>(s[pos])) ||
        !std::isdigit(static_cast<unsigned char>(s[pos + 1]))) {
        return false;
    }
    out = (s[pos] - '0') * 10 + (s[pos + 1] - '0');
    return true;
}

}  // namespace

const char* to_string(DataFormat format) {
    return format == DataFormat::Json ? "json" : "binary";
}

DataFormat parse_data_format(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "binary") return DataFormat::Binary;
    if (lower == "json") return DataFormat::Json;
    throw ConfigError("Unknown data format: " + name + " (expected binary or json)");
}

PacketDecoder::PacketDecoder(DataFormat f) : format(f) {}

MeasurementRecord PacketDecoder::decode(const uint8_t* data, size_t length,
                                        std::chrono::system_clock::time_point received_at) const {
    if (format == DataFormat::Json) {
        return decode_json(data, length, received_at);
    }
    return decode_binary(data, length, received_at);
}

MeasurementRecord PacketDecoder::decode_binary(const uint8_t* data, size_t length,
                                               std::chrono::system_clock::time_point received_at) const {
    if (length != kBinaryPayloadSize) {
        throw DecodeError(DecodeErrorKind::LengthMismatch,
                          "Expected exactly " + std::to_string(kBinaryPayloadSize) +
                          " bytes, got " + std::to_string(length));
    }

    std::array<double, kFieldCount> values{};
    for (size_t i = 0; i < kFieldCount; ++i) {
        values[i] = read_le_double(data + i * sizeof(double));
    }

    MeasurementRecord record = from_values(values, decode_flag(values[kFieldCount - 1]));
    record.timestamp = received_at;
    return record;
}

MeasurementRecord PacketDecoder::decode_json(const uint8_t* data, size_t length,
                                             std::chrono::system_clock::time_point received_at) const {
    json doc = json::parse(data, data + length, nullptr, false);
    if (doc.is_discarded()) {
        throw DecodeError(DecodeErrorKind::MalformedPayload, "Payload is not valid JSON");
    }
    if (!doc.is_object()) {
        throw DecodeError(DecodeErrorKind::MalformedPayload, "Payload is not a JSON object");
    }

    std::array<double, kFieldCount> values{};
    for (size_t i = 0; i < kFieldCount; ++i) {
        auto it = doc.find(kFieldNames[i]);
        if (it == doc.end()) {
            throw DecodeError(DecodeErrorKind::MissingField,
                              std::string("Missing field: ") + kFieldNames[i]);
        }
        if (!it->is_number()) {
            throw DecodeError(DecodeErrorKind::MalformedPayload,
                              std::string("Field is not numeric: ") + kFieldNames[i]);
        }
        values[i] = it->get<double>();
    }

    MeasurementRecord record = from_values(values, decode_flag(values[kFieldCount - 1]));
    record.timestamp = received_at;

    auto ts = doc.find(kTimestampField);
    if (ts != doc.end() && ts->is_string()) {
        if (auto parsed = parse_timestamp(ts->get<std::string>())) {
            record.timestamp = *parsed;
        }
    }
    return record;
}

int PacketDecoder::decode_flag(double value) {
    if (std::isfinite(value)) {
        double truncated = std::trunc(value);
        if (truncated == 0.0) return 0;
        if (truncated == 1.0) return 1;
    }
    std::stringstream ss;
    ss << "fault_indicator must be 0 or 1, got " << value;
    throw DecodeError(DecodeErrorKind::InvalidFlag, ss.str());
}

std::vector<uint8_t> PacketDecoder::encode_binary(const MeasurementRecord& record) {
    std::vector<uint8_t> payload(kBinaryPayloadSize);
    auto values = to_values(record);
    for (size_t i = 0; i < kFieldCount; ++i) {
        write_le_double(values[i], payload.data() + i * sizeof(double));
    }
    return payload;
}

std::string PacketDecoder::encode_json(const MeasurementRecord& record, bool with_timestamp) {
    nlohmann::ordered_json doc;
    auto values = to_values(record);
    for (size_t i = 0; i + 1 < kFieldCount; ++i) {
        doc[kFieldNames[i]] = values[i];
    }
    doc[kFieldNames[kFieldCount - 1]] = record.fault_indicator;
    if (with_timestamp) {
        doc[kTimestampField] = format_timestamp(record.timestamp);
    }
    return doc.dump();
}

std::optional<std::chrono::system_clock::time_point> PacketDecoder::parse_timestamp(const std::string& text) {
    if (text.size() < 19) return std::nullopt;

    std::string head = text.substr(0, 19);
    if (head[10] == ' ') head[10] = 'T';

    std::tm tm{};
    std::istringstream in(head);
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (in.fail()) return std::nullopt;

    size_t pos = 19;
    long long millis = 0;
    if (pos < text.size() && (text[pos] == '.' || text[pos] == ',')) {
        ++pos;
        size_t digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 3) millis = millis * 10 + (text[pos] - '0');
            ++digits;
            ++pos;
        }
        if (digits == 0) return std::nullopt;
        for (size_t d = digits; d < 3; ++d) millis *= 10;
    }

    long offset_seconds = 0;
    if (pos < text.size()) {
        char designator = text[pos];
        if (designator == 'Z' || designator == 'z') {
            ++pos;
        } else if (designator == '+' || designator == '-') {
            int hours = 0;
            int minutes = 0;
            if (!parse_two_digits(text, pos + 1, hours)) return std::nullopt;
            pos += 3;
            if (pos < text.size() && text[pos] == ':') ++pos;
            if (pos < text.size()) {
                if (!parse_two_digits(text, pos, minutes)) return std::nullopt;
                pos += 2;
            }
            if (hours > 23 || minutes > 59) return std::nullopt;
            offset_seconds = (hours * 3600L + minutes * 60L) * (designator == '-' ? -1 : 1);
        } else {
            return std::nullopt;
        }
    }
    if (pos != text.size()) return std::nullopt;

    std::time_t seconds = timegm(&tm);
    if (seconds == static_cast<std::time_t>(-1)) return std::nullopt;

    return std::chrono::system_clock::from_time_t(seconds - offset_seconds) +
           std::chrono::milliseconds(millis);
}

std::string PacketDecoder::format_timestamp(std::chrono::system_clock::time_point tp) {
    auto since_epoch = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    auto seconds = static_cast<std::time_t>(since_epoch / 1000);
    auto millis = since_epoch % 1000;
    if (millis < 0) {
        millis += 1000;
        seconds -= 1;
    }

    std::tm utc{};
    gmtime_r(&seconds, &utc);
    std::stringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.'
       << std::setw(3) << std::setfill('0') << millis << 'Z';
    return ss.str();
}
