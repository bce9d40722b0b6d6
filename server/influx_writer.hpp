// server/influx_writer.hpp
#pragma once
#include "batch_writer.hpp"
#include "http_client.hpp"
#include "line_protocol.hpp"
#include <chrono>
#include <string>

struct InfluxTarget {
    std::string url{"http://localhost:8086"};
    std::string token;
    std::string org{"smartgrid-org"};
    std::string bucket{"grid-data"};
    std::chrono::milliseconds timeout{10000};
    bool verify_tls{true};
};

// Writes batches through the InfluxDB v2 HTTP write endpoint.
class InfluxWriter : public BatchWriter {
private:
    InfluxTarget target;
    PointTags tags;
    HttpClient client;
    std::string write_path;

public:
    InfluxWriter(const InfluxTarget& target, const PointTags& tags);

    size_t write(const std::vector<MeasurementRecord>& batch) override;
    std::string describe() const override;
};

// Percent-encodes everything but unreserved characters.
std::string url_encode(const std::string& value);

// Maps a non-2xx status to the error kind used by the retry policy.
WriteErrorKind classify_status(int status);
