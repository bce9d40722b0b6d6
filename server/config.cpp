// server/config.cpp
#include "config.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>

using json = nlohmann::json;

namespace {

long long parse_integer(const char* key, const std::string& value) {
    try {
        size_t used = 0;
        long long parsed = std::stoll(value, &used);
        if (used != value.size()) throw std::invalid_argument(value);
        return parsed;
    } catch (const std::exception&) {
        throw ConfigError(std::string("Invalid integer for ") + key + ": '" + value + "'");
    }
}

int parse_port(const char* key, long long value) {
    if (value < 0 || value > 65535) {
        throw ConfigError(std::string("Port out of range for ") + key + ": " + std::to_string(value));
    }
    return static_cast<int>(value);
}

size_t parse_count(const char* key, long long value) {
    if (value < 0) {
        throw ConfigError(std::string("Negative value for ") + key + ": " + std::to_string(value));
    }
    return static_cast<size_t>(value);
}

double parse_real(const char* key, const std::string& value) {
    try {
        size_t used = 0;
        double parsed = std::stod(value, &used);
        if (used != value.size()) throw std::invalid_argument(value);
        return parsed;
    } catch (const std::exception&) {
        throw ConfigError(std::string("Invalid number for ") + key + ": '" + value + "'");
    }
}

bool parse_flag(const char* key, const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") return true;
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off") return false;
    throw ConfigError(std::string("Invalid boolean for ") + key + ": '" + value + "'");
}

// Longest duration setting accepted, in seconds
constexpr double kMaxDurationSeconds = 86400.0 * 365;

void check_seconds(std::vector<std::string>& errors, const std::string& name, double value, bool allow_zero) {
    bool in_range = std::isfinite(value) && value <= kMaxDurationSeconds &&
                    (allow_zero ? value >= 0 : value > 0);
    if (!in_range) {
        errors.push_back("Invalid " + name + ": " + std::to_string(value));
    }
}

std::chrono::milliseconds seconds_to_ms(double seconds) {
    return std::chrono::milliseconds(static_cast<long long>(std::llround(seconds * 1000.0)));
}

template <typename T>
void read_key(const json& section, const char* key, T& target) {
    auto it = section.find(key);
    if (it == section.end() || it->is_null()) return;
    target = it->get<T>();
}

void read_count(const json& section, const char* key, size_t& target) {
    auto it = section.find(key);
    if (it == section.end() || it->is_null()) return;
    target = parse_count(key, it->get<long long>());
}

}  // namespace

void ServiceConfig::load_from_env() {
    load_from_env([](const char* key) -> const char* { return std::getenv(key); });
}

void ServiceConfig::load_from_env(const EnvLookup& lookup) {
    auto str = [&](const char* key, std::string& target) {
        if (const char* v = lookup(key)) target = v;
    };
    auto count = [&](const char* key, size_t& target) {
        if (const char* v = lookup(key)) target = parse_count(key, parse_integer(key, v));
    };
    auto real = [&](const char* key, double& target) {
        if (const char* v = lookup(key)) target = parse_real(key, v);
    };

    str("UDP_HOST", udp.host);
    if (const char* v = lookup("UDP_PORT")) udp.port = parse_port("UDP_PORT", parse_integer("UDP_PORT", v));
    count("UDP_BUFFER_SIZE", udp.buffer_size);
    real("UDP_TIMEOUT", udp.timeout);
    count("UDP_LOG_INTERVAL", udp.log_interval);
    str("DATA_FORMAT", udp.data_format);

    str("INFLUX_URL", influx.url);
    str("INFLUX_TOKEN", influx.token);
    str("INFLUX_ORG", influx.org);
    str("INFLUX_BUCKET", influx.bucket);
    if (const char* v = lookup("INFLUX_TIMEOUT")) influx.timeout_ms = static_cast<long>(parse_integer("INFLUX_TIMEOUT", v));
    if (const char* v = lookup("INFLUX_VERIFY_TLS")) influx.verify_tls = parse_flag("INFLUX_VERIFY_TLS", v);

    count("BUFFER_MAX_SIZE", buffer.max_size);
    real("BUFFER_FLUSH_INTERVAL", buffer.flush_interval);
    count("BUFFER_RETRY_ATTEMPTS", buffer.retry_attempts);
    real("BUFFER_RETRY_DELAY", buffer.retry_delay);
    real("BUFFER_RETRY_MAX_DELAY", buffer.retry_max_delay);

    str("STORAGE_BACKEND", storage.backend);
    str("STORAGE_FILE", storage.file);

    str("LOG_LEVEL", logging.level);

    str("GRID_MEASUREMENT_NAME", grid.measurement_name);
    str("GRID_DATA_SOURCE_TAG", grid.data_source_tag);
    str("GRID_SECTION_TAG", grid.grid_section_tag);
}

void ServiceConfig::load_from_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("Cannot open config file: " + path);
    }

    json doc = json::parse(in, nullptr, false);
    if (doc.is_discarded()) {
        throw ConfigError("Config file is not valid JSON: " + path);
    }
    load_from_json(doc);
    Logger::info("Loaded configuration from " + path);
}

void ServiceConfig::load_from_json(const json& doc) {
    if (!doc.is_object()) {
        throw ConfigError("Configuration document must be a JSON object");
    }

    try {
        if (auto it = doc.find("udp"); it != doc.end()) {
            const json& s = *it;
            read_key(s, "host", udp.host);
            if (auto port = s.find("port"); port != s.end() && !port->is_null()) {
                udp.port = parse_port("port", port->get<long long>());
            }
            read_count(s, "buffer_size", udp.buffer_size);
            read_key(s, "timeout", udp.timeout);
            read_count(s, "log_interval", udp.log_interval);
            read_key(s, "data_format", udp.data_format);
        }
        if (auto it = doc.find("influx"); it != doc.end()) {
            const json& s = *it;
            read_key(s, "url", influx.url);
            read_key(s, "token", influx.token);
            read_key(s, "org", influx.org);
            read_key(s, "bucket", influx.bucket);
            read_key(s, "timeout", influx.timeout_ms);
            read_key(s, "verify_tls", influx.verify_tls);
        }
        if (auto it = doc.find("buffer"); it != doc.end()) {
            const json& s = *it;
            read_count(s, "max_size", buffer.max_size);
            read_key(s, "flush_interval", buffer.flush_interval);
            read_count(s, "retry_attempts", buffer.retry_attempts);
            read_key(s, "retry_delay", buffer.retry_delay);
            read_key(s, "retry_max_delay", buffer.retry_max_delay);
        }
        if (auto it = doc.find("storage"); it != doc.end()) {
            read_key(*it, "backend", storage.backend);
            read_key(*it, "file", storage.file);
        }
        if (auto it = doc.find("logging"); it != doc.end()) {
            read_key(*it, "level", logging.level);
        }
        if (auto it = doc.find("grid"); it != doc.end()) {
            read_key(*it, "measurement_name", grid.measurement_name);
            read_key(*it, "data_source_tag", grid.data_source_tag);
            read_key(*it, "grid_section_tag", grid.grid_section_tag);
        }
    } catch (const json::exception& e) {
        throw ConfigError(std::string("Invalid configuration value: ") + e.what());
    }
}

std::vector<std::string> ServiceConfig::validate() const {
    std::vector<std::string> errors;

    if (udp.port < 0 || udp.port > 65535) {
        errors.push_back("Invalid UDP port: " + std::to_string(udp.port));
    }
    if (udp.buffer_size < kBinaryPayloadSize) {
        errors.push_back("UDP buffer size must be at least " + std::to_string(kBinaryPayloadSize) +
                         " bytes, got " + std::to_string(udp.buffer_size));
    }
    check_seconds(errors, "UDP timeout", udp.timeout, false);
    try {
        parse_data_format(udp.data_format);
    } catch (const ConfigError& e) {
        errors.push_back(e.what());
    }

    if (storage.backend == "influx") {
        if (influx.url.empty()) errors.push_back("InfluxDB URL is required");
        if (influx.org.empty()) errors.push_back("InfluxDB organization is required");
        if (influx.bucket.empty()) errors.push_back("InfluxDB bucket is required");
        if (influx.timeout_ms <= 0) {
            errors.push_back("Invalid InfluxDB timeout: " + std::to_string(influx.timeout_ms));
        }
    } else if (storage.backend == "file") {
        if (storage.file.empty()) errors.push_back("Storage file path is required");
    } else {
        errors.push_back("Unknown storage backend: " + storage.backend + " (expected influx or file)");
    }

    if (buffer.max_size == 0) {
        errors.push_back("Invalid buffer max size: 0");
    }
    check_seconds(errors, "buffer flush interval", buffer.flush_interval, false);
    check_seconds(errors, "retry delay", buffer.retry_delay, true);
    check_seconds(errors, "retry max delay", buffer.retry_max_delay, true);

    try {
        Logger::parse_level(logging.level);
    } catch (const ConfigError& e) {
        errors.push_back(e.what());
    }

    if (grid.measurement_name.empty()) {
        errors.push_back("Measurement name is required");
    }

    return errors;
}

json ServiceConfig::to_json() const {
    return {
        {"udp", {
            {"host", udp.host},
            {"port", udp.port},
            {"buffer_size", udp.buffer_size},
            {"timeout", udp.timeout},
            {"log_interval", udp.log_interval},
            {"data_format", udp.data_format},
        }},
        {"influx", {
            {"url", influx.url},
            {"org", influx.org},
            {"bucket", influx.bucket},
            {"timeout", influx.timeout_ms},
            {"verify_tls", influx.verify_tls},
        }},
        {"buffer", {
            {"max_size", buffer.max_size},
            {"flush_interval", buffer.flush_interval},
            {"retry_attempts", buffer.retry_attempts},
            {"retry_delay", buffer.retry_delay},
            {"retry_max_delay", buffer.retry_max_delay},
        }},
        {"storage", {
            {"backend", storage.backend},
            {"file", storage.file},
        }},
        {"logging", {
            {"level", logging.level},
        }},
        {"grid", {
            {"measurement_name", grid.measurement_name},
            {"data_source_tag", grid.data_source_tag},
            {"grid_section_tag", grid.grid_section_tag},
        }},
    };
}

DataFormat ServiceConfig::data_format() const {
    return parse_data_format(udp.data_format);
}

RetryPolicy ServiceConfig::retry_policy() const {
    return RetryPolicy(buffer.retry_attempts, seconds_to_ms(buffer.retry_delay),
                       seconds_to_ms(buffer.retry_max_delay));
}

std::chrono::milliseconds ServiceConfig::flush_interval() const {
    return seconds_to_ms(buffer.flush_interval);
}

std::chrono::milliseconds ServiceConfig::receive_timeout() const {
    return seconds_to_ms(udp.timeout);
}
