// server/influx_writer.cpp
#include "influx_writer.hpp"
#include "logger.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <cstdio>

namespace {

// InfluxDB reports failures as {"code": "...", "message": "..."}.
std::string error_message(const HttpResponse& response) {
    auto doc = nlohmann::json::parse(response.body, nullptr, false);
    if (!doc.is_discarded() && doc.is_object()) {
        auto it = doc.find("message");
        if (it != doc.end() && it->is_string()) return it->get<std::string>();
    }
    if (response.body.size() > 200) return response.body.substr(0, 200) + "...";
    return response.body;
}

}  // namespace

std::string url_encode(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            char hex[4];
            std::snprintf(hex, sizeof(hex), "%%%02X", c);
            out += hex;
        }
    }
    return out;
}

WriteErrorKind classify_status(int status) {
    if (status == 429 || status >= 500) return WriteErrorKind::BackendUnreachable;
    return WriteErrorKind::Rejected;
}

InfluxWriter::InfluxWriter(const InfluxTarget& t, const PointTags& point_tags)
    : target(t),
      tags(point_tags),
      client(t.url, t.timeout, t.verify_tls),
      write_path("/api/v2/write?org=" + url_encode(t.org) + "&bucket=" + url_encode(t.bucket) +
                 "&precision=ms") {
    if (target.token.empty()) {
        Logger::warning("No InfluxDB token configured - writes will be unauthenticated");
    }
}

size_t InfluxWriter::write(const std::vector<MeasurementRecord>& batch) {
    if (batch.empty()) return 0;

    HttpClient::Headers headers = {
        {"Content-Type", "text/plain; charset=utf-8"},
        {"Accept", "application/json"},
    };
    if (!target.token.empty()) {
        headers.emplace_back("Authorization", "Token " + target.token);
    }

    HttpResponse response = client.post(write_path, headers, format_batch(batch, tags));
    if (response.status >= 200 && response.status < 300) {
        return batch.size();
    }

    throw WriteError(classify_status(response.status),
                     "HTTP " + std::to_string(response.status) + ": " + error_message(response));
}

std::string InfluxWriter::describe() const {
    return "InfluxDB " + target.url + " (bucket " + target.bucket + ")";
}
