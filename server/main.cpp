// server/main.cpp
#include "config.hpp"
#include "file_writer.hpp"
#include "influx_writer.hpp"
#include "ingestion_loop.hpp"
#include "logger.hpp"
#include <atomic>
#include <csignal>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

namespace {

std::atomic<IngestionLoop*> global_loop{nullptr};
// Set by a signal that arrives before the loop is published
std::atomic<bool> stop_pending{false};

void signal_handler(int /*signal*/) {
    stop_pending.store(true);
    IngestionLoop* loop = global_loop.load();
    if (loop) {
        loop->request_stop();
    }
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS]\n"
              << "Options:\n"
              << "  -c, --config FILE           Load JSON configuration (env vars override it)\n"
              << "  -p, --port PORT             UDP port (default: UDP_PORT or 12345)\n"
              << "  -f, --format FORMAT         Payload format: binary or json (default: DATA_FORMAT)\n"
              << "      --metrics FILE          Write final ingestion statistics as JSON to FILE\n"
              << "      --print-config          Print the effective configuration and exit\n"
              << "      --quiet                 Only log warnings and errors\n"
              << "  -h, --help                  Show this help\n";
}

std::unique_ptr<BatchWriter> make_writer(const ServiceConfig& config) {
    PointTags tags;
    tags.measurement = config.grid.measurement_name;
    tags.data_source = config.grid.data_source_tag;
    tags.grid_section = config.grid.grid_section_tag;

    if (config.storage.backend == "file") {
        return std::make_unique<FileWriter>(config.storage.file, tags);
    }

    InfluxTarget target;
    target.url = config.influx.url;
    target.token = config.influx.token;
    target.org = config.influx.org;
    target.bucket = config.influx.bucket;
    target.timeout = std::chrono::milliseconds(config.influx.timeout_ms);
    target.verify_tls = config.influx.verify_tls;
    return std::make_unique<InfluxWriter>(target, tags);
}

void write_metrics(const std::string& path, const ServiceConfig& config, const IngestStats& stats) {
    std::ofstream out(path);
    if (!out) {
        Logger::error("Failed to open metrics file: " + path);
        return;
    }
    nlohmann::json doc = {
        {"config", config.to_json()},
        {"stats", stats.to_json()},
    };
    out << doc.dump(2) << "\n";
    Logger::info("Wrote metrics to: " + path);
}

}  // namespace

int main(int argc, char* argv[]) {
    std::string config_file;
    std::string metrics_file;
    std::string port_override;
    std::string format_override;
    bool print_config = false;
    bool quiet = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_file = argv[++i];
        } else if ((arg == "-p" || arg == "--port") && i + 1 < argc) {
            port_override = argv[++i];
        } else if ((arg == "-f" || arg == "--format") && i + 1 < argc) {
            format_override = argv[++i];
        } else if (arg == "--metrics" && i + 1 < argc) {
            metrics_file = argv[++i];
        } else if (arg == "--print-config") {
            print_config = true;
        } else if (arg == "--quiet") {
            quiet = true;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    ServiceConfig config;
    try {
        if (!config_file.empty()) {
            config.load_from_file(config_file);
        }
        config.load_from_env();
        if (!port_override.empty()) {
            config.load_from_env([&](const char* key) -> const char* {
                return std::string(key) == "UDP_PORT" ? port_override.c_str() : nullptr;
            });
        }
        if (!format_override.empty()) {
            config.udp.data_format = format_override;
        }
    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 2;
    }

    auto problems = config.validate();
    if (!problems.empty()) {
        std::cerr << "Configuration validation errors:" << std::endl;
        for (const auto& problem : problems) {
            std::cerr << "  - " << problem << std::endl;
        }
        return 2;
    }

    if (print_config) {
        std::cout << config.to_json().dump(2) << std::endl;
        return 0;
    }

    Logger::set_level(quiet ? LogLevel::Warn : Logger::parse_level(config.logging.level));

    std::cout << CYAN BOLD "GridStream Ingestion Server v1.0" RESET << std::endl;
    std::cout << CYAN "Configuration: UDP=" << config.udp.host << ":" << config.udp.port
              << ", Format=" << config.udp.data_format
              << ", Buffer=" << config.buffer.max_size
              << ", Flush Interval=" << config.buffer.flush_interval << "s"
              << ", Storage=" << config.storage.backend
              << RESET << std::endl;

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::signal(SIGPIPE, SIG_IGN);

    try {
        std::unique_ptr<BatchWriter> writer = make_writer(config);
        Logger::info("Storage backend: " + writer->describe());

        IngestionLoop loop(PipelineSettings::from_config(config), *writer);
        if (!loop.start()) return 1;

        global_loop.store(&loop);
        if (stop_pending.load()) {
            loop.request_stop();
        }
        loop.run();
        global_loop.store(nullptr);

        if (!metrics_file.empty()) {
            write_metrics(metrics_file, config, loop.stats());
        }
    } catch (const std::exception& e) {
        global_loop.store(nullptr);
        Logger::error(std::string("Fatal: ") + e.what());
        return 1;
    }

    return 0;
}
