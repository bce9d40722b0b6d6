// server/config.hpp
#pragma once
#include "packet_decoder.hpp"
#include "retry_policy.hpp"
#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct UdpSettings {
    std::string host{"localhost"};
    int port{12345};
    size_t buffer_size{1024};
    double timeout{1.0};           // seconds, receive wait granularity
    size_t log_interval{1000};     // packets between progress lines
    std::string data_format{"binary"};
};

struct InfluxSettings {
    std::string url{"http://localhost:8086"};
    std::string token;
    std::string org{"smartgrid-org"};
    std::string bucket{"grid-data"};
    long timeout_ms{10000};
    bool verify_tls{true};
};

struct BufferSettings {
    size_t max_size{100};
    double flush_interval{1.0};    // seconds
    size_t retry_attempts{3};
    double retry_delay{1.0};       // seconds
    double retry_max_delay{30.0};  // seconds
};

struct StorageSettings {
    std::string backend{"influx"};
    std::string file{"grid-data.lp"};
};

struct LoggingSettings {
    std::string level{"INFO"};
};

struct GridSettings {
    std::string measurement_name{"grid_measurements"};
    std::string data_source_tag{"simulink"};
    std::string grid_section_tag{"main_bus"};
};

class ServiceConfig {
public:
    using EnvLookup = std::function<const char*(const char*)>;

    UdpSettings udp;
    InfluxSettings influx;
    BufferSettings buffer;
    StorageSettings storage;
    LoggingSettings logging;
    GridSettings grid;

    // Each loader overrides only the keys it finds. Malformed values throw ConfigError.
    void load_from_env(const EnvLookup& lookup);
    void load_from_env();
    void load_from_file(const std::string& path);
    void load_from_json(const nlohmann::json& doc);

    // Empty when the configuration is usable.
    std::vector<std::string> validate() const;

    // Effective configuration, token excluded.
    nlohmann::json to_json() const;

    DataFormat data_format() const;
    RetryPolicy retry_policy() const;
    std::chrono::milliseconds flush_interval() const;
    std::chrono::milliseconds receive_timeout() const;
};
