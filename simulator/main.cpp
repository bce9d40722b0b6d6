// simulator/main.cpp
// Sends synthetic grid telemetry to the ingestion server over UDP.
#include "../common/protocol.hpp"
#include "../server/logger.hpp"
#include "../server/packet_decoder.hpp"
#include <arpa/inet.h>
#include <netdb.h>
#include <sys/socket.h>
#include <unistd.h>
#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cmath>
#include <csignal>
#include <cstring>
#include <iostream>
#include <random>
#include <string>
#include <thread>
#include <vector>

namespace {

std::atomic<bool> running{true};

void signal_handler(int /*signal*/) {
    running.store(false);
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS]\n"
              << "Options:\n"
              << "  -H, --host HOST             Receiver host (default: localhost)\n"
              << "  -p, --port PORT             Receiver port (default: 12345)\n"
              << "  -f, --format FORMAT         binary or json (default: binary)\n"
              << "  -r, --rate HZ               Samples per second (default: 10)\n"
              << "  -d, --duration SECONDS      Stop after SECONDS (default: 60)\n"
              << "  -n, --count N               Stop after N samples (default: unlimited)\n"
              << "      --fault-probability P   Probability of a fault sample (default: 0.05)\n"
              << "      --seed N                Random seed (default: random)\n"
              << "  -h, --help                  Show this help\n";
}

class GridProfile {
private:
    std::mt19937_64 rng;
    std::normal_distribution<double> noise{0.0, 1.0};
    std::uniform_real_distribution<double> uniform{0.0, 1.0};
    double fault_probability;

public:
    GridProfile(uint64_t seed, double fault_prob) : rng(seed), fault_probability(fault_prob) {}

    MeasurementRecord sample(double t) {
        constexpr double kPi = 3.14159265358979323846;
        const double base_voltage = 13800.0;   // 13.8 kV
        const double base_frequency = 50.0;    // Hz
        const double base_power = 10000.0;     // kW

        double voltage_var = 0.05 * std::sin(2 * kPi * 0.1 * t) + 0.02 * noise(rng);
        double freq_var = 0.2 * std::sin(2 * kPi * 0.05 * t) + 0.1 * noise(rng);
        double power_var = 0.3 * std::sin(2 * kPi * 0.02 * t) + 0.1 * noise(rng);

        int fault = uniform(rng) < fault_probability ? 1 : 0;
        if (fault) voltage_var -= 0.2;

        double daily = std::sin(2 * kPi * t / 3600.0);

        MeasurementRecord r;
        r.bus_voltage = base_voltage * (1 + voltage_var);
        r.bus_frequency = base_frequency + freq_var;
        r.active_power = base_power * (1 + power_var);
        r.reactive_power = base_power * 0.3 * (1 + 0.5 * power_var);
        r.current_magnitude = std::abs(r.active_power / r.bus_voltage * std::sqrt(3.0));
        r.current_phase = 30 * std::sin(2 * kPi * 0.03 * t);
        r.temperature = 25 + 10 * daily + 2 * noise(rng);
        r.load_demand = base_power * (0.7 + 0.3 * daily);
        r.generation_output = r.load_demand * (1.05 + 0.05 * noise(rng));
        r.grid_stability_index = 1.0 - 0.1 * std::abs(voltage_var) - 0.1 * std::abs(freq_var / base_frequency);
        r.fault_indicator = fault;
        r.timestamp = std::chrono::system_clock::now();
        return r;
    }
};

}  // namespace

int main(int argc, char* argv[]) {
    std::string host = "localhost";
    int port = 12345;
    std::string format_name = "binary";
    double rate = 10.0;
    double duration = 60.0;
    size_t count = 0;
    double fault_probability = 0.05;
    uint64_t seed = std::random_device{}();

    try {
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];

            if (arg == "-h" || arg == "--help") {
                print_usage(argv[0]);
                return 0;
            } else if ((arg == "-H" || arg == "--host") && i + 1 < argc) {
                host = argv[++i];
            } else if ((arg == "-p" || arg == "--port") && i + 1 < argc) {
                port = std::stoi(argv[++i]);
            } else if ((arg == "-f" || arg == "--format") && i + 1 < argc) {
                format_name = argv[++i];
            } else if ((arg == "-r" || arg == "--rate") && i + 1 < argc) {
                rate = std::stod(argv[++i]);
            } else if ((arg == "-d" || arg == "--duration") && i + 1 < argc) {
                duration = std::stod(argv[++i]);
            } else if ((arg == "-n" || arg == "--count") && i + 1 < argc) {
                count = std::stoull(argv[++i]);
            } else if (arg == "--fault-probability" && i + 1 < argc) {
                fault_probability = std::stod(argv[++i]);
            } else if (arg == "--seed" && i + 1 < argc) {
                seed = std::stoull(argv[++i]);
            } else {
                std::cerr << "Unknown option: " << arg << std::endl;
                print_usage(argv[0]);
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Invalid argument: " << e.what() << std::endl;
        return 1;
    }

    DataFormat format;
    try {
        format = parse_data_format(format_name);
    } catch (const ConfigError& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }
    if (rate <= 0 || port <= 0 || port > 65535) {
        std::cerr << "Rate must be positive and port within 1-65535" << std::endl;
        return 1;
    }

    struct addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_DGRAM;
    struct addrinfo* target = nullptr;
    int rc = getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &target);
    if (rc != 0) {
        Logger::error("Cannot resolve " + host + ": " + gai_strerror(rc));
        return 1;
    }

    int sock = socket(AF_INET, SOCK_DGRAM, 0);
    if (sock < 0) {
        Logger::error(std::string("socket() failed: ") + std::strerror(errno));
        freeaddrinfo(target);
        return 1;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    Logger::info("Starting UDP test stream to " + host + ":" + std::to_string(port) +
                 " (format=" + to_string(format) + ", rate=" + std::to_string(rate) + " Hz)");

    GridProfile profile(seed, fault_probability);
    const auto period = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(1.0 / rate));
    const auto start = std::chrono::steady_clock::now();
    auto next = start;
    size_t sent = 0;
    size_t failed = 0;
    const size_t report_every = std::max<size_t>(1, static_cast<size_t>(rate * 10));

    while (running.load()) {
        double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
        if (elapsed >= duration || (count > 0 && sent >= count)) break;

        MeasurementRecord record = profile.sample(elapsed);
        ssize_t n;
        if (format == DataFormat::Json) {
            std::string payload = PacketDecoder::encode_json(record);
            n = sendto(sock, payload.data(), payload.size(), 0, target->ai_addr, target->ai_addrlen);
        } else {
            std::vector<uint8_t> payload = PacketDecoder::encode_binary(record);
            n = sendto(sock, payload.data(), payload.size(), 0, target->ai_addr, target->ai_addrlen);
        }
        if (n < 0) {
            if (++failed <= 5) Logger::warning(std::string("sendto() failed: ") + std::strerror(errno));
        } else {
            ++sent;
        }

        if (sent > 0 && sent % report_every == 0) {
            Logger::info("Sent " + std::to_string(sent) + " samples in " + std::to_string(elapsed) + "s");
        }

        next += period;
        std::this_thread::sleep_until(next);
    }

    close(sock);
    freeaddrinfo(target);
    Logger::success("Streaming complete. Total samples sent: " + std::to_string(sent) +
                    (failed ? " (" + std::to_string(failed) + " send failures)" : std::string()));
    return 0;
}
