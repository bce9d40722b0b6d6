// server/line_protocol.cpp
#include "line_protocol.hpp"
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <locale>
#include <sstream>

namespace {

std::string escape(const std::string& text, const char* specials) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        for (const char* s = specials; *s; ++s) {
            if (c == *s) {
                out += '\\';
                break;
            }
        }
        out += c;
    }
    return out;
}

void append_tag(std::string& line, const char* key, const std::string& value) {
    if (value.empty()) return;
    line += ',';
    line += key;
    line += '=';
    line += escape(value, ", =");
}

}  // namespace

std::string format_field_value(double value) {
    std::string text;
    for (int precision = 15; precision <= 17; ++precision) {
        std::ostringstream ss;
        ss.imbue(std::locale::classic());
        ss << std::setprecision(precision) << value;
        text = ss.str();
        if (std::strtod(text.c_str(), nullptr) == value) break;
    }
    return text;
}

std::string format_point(const MeasurementRecord& record, const PointTags& tags) {
    std::string line = escape(tags.measurement, ", ");
    append_tag(line, "data_source", tags.data_source);
    append_tag(line, "grid_section", tags.grid_section);
    line += ' ';

    auto values = to_values(record);
    for (size_t i = 0; i + 1 < kFieldCount; ++i) {
        if (!std::isfinite(values[i])) continue;
        line += kFieldNames[i];
        line += '=';
        line += format_field_value(values[i]);
        line += ',';
    }
    line += kFieldNames[kFieldCount - 1];
    line += '=';
    line += std::to_string(record.fault_indicator);
    line += 'i';

    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        record.timestamp.time_since_epoch()).count();
    line += ' ';
    line += std::to_string(millis);
    return line;
}

std::string format_batch(const std::vector<MeasurementRecord>& batch, const PointTags& tags) {
    std::string body;
    body.reserve(batch.size() * 320);
    for (const auto& record : batch) {
        body += format_point(record, tags);
        body += '\n';
    }
    return body;
}
