#include "logger.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>

std::atomic<int> Logger::threshold{static_cast<int>(LogLevel::Info)};
std::mutex Logger::output_mutex;

std::string Logger::timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm local{};
    localtime_r(&time_t, &local);
    std::stringstream ss;
    ss << std::put_time(&local, "%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << ms;
    return ss.str();
}

void Logger::set_level(LogLevel level) {
    threshold.store(static_cast<int>(level));
}

LogLevel Logger::parse_level(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "DEBUG") return LogLevel::Debug;
    if (upper == "INFO") return LogLevel::Info;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::Warn;
    if (upper == "ERROR") return LogLevel::Error;
    throw ConfigError("Unknown log level: " + name);
}

bool Logger::enabled(LogLevel level) {
    return static_cast<int>(level) >= threshold.load();
}

void Logger::debug(const std::string& msg) {
    if (!enabled(LogLevel::Debug)) return;
    std::lock_guard<std::mutex> lock(output_mutex);
    std::cout << BLUE "[" << timestamp() << "] [DEBUG]" RESET " " << msg << std::endl;
}

void Logger::info(const std::string& msg) {
    if (!enabled(LogLevel::Info)) return;
    std::lock_guard<std::mutex> lock(output_mutex);
    std::cout << CYAN "[" << timestamp() << "] [INFO]" RESET " " << msg << std::endl;
}

void Logger::success(const std::string& msg) {
    if (!enabled(LogLevel::Info)) return;
    std::lock_guard<std::mutex> lock(output_mutex);
    std::cout << GREEN "[" << timestamp() << "] [OK]" RESET " " << msg << std::endl;
}

void Logger::warning(const std::string& msg) {
    if (!enabled(LogLevel::Warn)) return;
    std::lock_guard<std::mutex> lock(output_mutex);
    std::cout << YELLOW "[" << timestamp() << "] [WARN]" RESET " " << msg << std::endl;
}

void Logger::error(const std::string& msg) {
    if (!enabled(LogLevel::Error)) return;
    std::lock_guard<std::mutex> lock(output_mutex);
    std::cout << RED "[" << timestamp() << "] [ERROR]" RESET " " << msg << std::endl;
}

void Logger::alert(const std::string& msg) {
    if (!enabled(LogLevel::Error)) return;
    std::lock_guard<std::mutex> lock(output_mutex);
    std::cout << RED BOLD "[" << timestamp() << "] [ALERT]" RESET " " << msg << std::endl;
}

void Logger::batch(const std::string& msg) {
    if (!enabled(LogLevel::Info)) return;
    std::lock_guard<std::mutex> lock(output_mutex);
    std::cout << GREEN BOLD "[" << timestamp() << "] [FLUSH]" RESET " " << msg << std::endl;
}
