#pragma once
#include <string>
#include <iostream>
#include <sstream>
#include <iomanip>
#include <chrono>
#include <atomic>
#include <mutex>

#define RESET   "\033[0m"
#define RED     "\033[31m"
#define GREEN   "\033[32m"
#define YELLOW  "\033[33m"
#define BLUE    "\033[34m"
#define CYAN    "\033[36m"
#define BOLD    "\033[1m"

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

class Logger {
private:
    static std::atomic<int> threshold;
    static std::mutex output_mutex;

    static bool enabled(LogLevel level);

public:
    static std::string timestamp();

    static void set_level(LogLevel level);
    // Accepts DEBUG/INFO/WARN/WARNING/ERROR in any case; throws ConfigError otherwise.
    static LogLevel parse_level(const std::string& name);

    static void debug(const std::string& msg);
    static void info(const std::string& msg);
    static void success(const std::string& msg);
    static void warning(const std::string& msg);
    static void error(const std::string& msg);
    static void alert(const std::string& msg);
    static void batch(const std::string& msg);
};
