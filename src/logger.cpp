#include "logger.hpp"
#include <boost/asio/ip/host_name.hpp>
#include <chrono>
#include <ctime>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <pwd.h>
#include <unistd.h>

namespace logging {

namespace {

std::string format_now(const char* pattern) {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);
    std::ostringstream oss;
    oss << std::put_time(&local, pattern);
    return oss.str();
}

std::string current_user() {
    if (const char* user = std::getenv("USER")) {
        return user;
    }
    if (const passwd* pw = getpwuid(getuid())) {
        return pw->pw_name;
    }
    return "unknown";
}

std::string current_host() {
    boost::system::error_code ec;
    std::string host = boost::asio::ip::host_name(ec);
    return ec ? "localhost" : host;
}

} // namespace

LogLevel parse_log_level(const std::string& name) {
    if (name == "debug") return LogLevel::DEBUG;
    if (name == "info") return LogLevel::INFO;
    if (name == "warning" || name == "warn") return LogLevel::WARNING;
    if (name == "error") return LogLevel::ERROR;
    throw std::invalid_argument("Unknown log level: '" + name + "'. Valid values: debug, info, warning, error");
}

const char* to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR: return "ERROR";
    }
    return "UNKNOWN";
}

void Logger::log(LogLevel level, const std::string& message) {
    if (level < min_level_) {
        return;
    }
    try {
        write(level, message);
    } catch (const std::exception& e) {
        std::cerr << "Logger failure (" << e.what() << ") dropping: " << message << "\n";
    }
}

void ConsoleLogger::write(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level >= LogLevel::WARNING) {
        std::cerr << message << "\n";
    } else {
        std::cout << message << std::endl;
    }
}

FileLogger::FileLogger(const std::string& name, const std::filesystem::path& dir, LogLevel min_level)
    : Logger(min_level) {
    std::filesystem::create_directories(dir);

    std::string filename = current_host() + "_" + current_user() + "_" + name + "_" +
                           format_now("%Y-%m-%d_%H-%M-%S") + ".log";
    path_ = dir / filename;

    file_.open(path_, std::ios::app);
    if (!file_.is_open()) {
        throw std::runtime_error("Could not open log file: " + path_.string());
    }
}

void FileLogger::write(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    file_ << format_now("%Y-%m-%d %H:%M:%S") << " - [" << to_string(level) << "] - " << message << "\n";
    file_.flush();
    if (!file_) {
        throw std::runtime_error("write to " + path_.string() + " failed");
    }
}

void TeeLogger::write(LogLevel level, const std::string& message) {
    for (auto& sink : sinks_) {
        sink->log(level, message);
    }
}

std::filesystem::path default_log_dir() {
    if (const char* home = std::getenv("HOME")) {
        return std::filesystem::path(home) / "Logs";
    }
    if (const passwd* pw = getpwuid(getuid())) {
        return std::filesystem::path(pw->pw_dir) / "Logs";
    }
    return std::filesystem::path("Logs");
}

} // namespace logging
