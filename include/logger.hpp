#pragma once

#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace logging {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARNING = 2,
    ERROR = 3
};

// Throws std::invalid_argument for anything but debug/info/warning/error.
LogLevel parse_log_level(const std::string& name);
const char* to_string(LogLevel level);

// Every transfer operation takes a Logger by reference. A failing sink is
// reported on stderr and dropped; it never aborts the caller.
class Logger {
public:
    explicit Logger(LogLevel min_level = LogLevel::DEBUG) : min_level_(min_level) {}
    virtual ~Logger() = default;

    void debug(const std::string& message) { log(LogLevel::DEBUG, message); }
    void info(const std::string& message) { log(LogLevel::INFO, message); }
    void warn(const std::string& message) { log(LogLevel::WARNING, message); }
    void error(const std::string& message) { log(LogLevel::ERROR, message); }

    void log(LogLevel level, const std::string& message);

    void set_level(LogLevel level) { min_level_ = level; }
    LogLevel level() const { return min_level_; }

protected:
    virtual void write(LogLevel level, const std::string& message) = 0;

private:
    LogLevel min_level_;
};

// Plain messages: DEBUG/INFO to stdout, WARNING/ERROR to stderr.
class ConsoleLogger : public Logger {
public:
    using Logger::Logger;

protected:
    void write(LogLevel level, const std::string& message) override;

private:
    std::mutex mutex_;
};

// Writes "<dir>/<hostname>_<user>_<name>_<YYYY-mm-dd_HH-MM-SS>.log", creating
// dir if needed. Lines look like "2024-05-01 12:00:00 - [INFO] - message".
class FileLogger : public Logger {
public:
    FileLogger(const std::string& name, const std::filesystem::path& dir, LogLevel min_level = LogLevel::DEBUG);

    const std::filesystem::path& path() const { return path_; }

protected:
    void write(LogLevel level, const std::string& message) override;

private:
    std::filesystem::path path_;
    std::ofstream file_;
    std::mutex mutex_;
};

class TeeLogger : public Logger {
public:
    explicit TeeLogger(std::vector<std::shared_ptr<Logger>> sinks, LogLevel min_level = LogLevel::DEBUG)
        : Logger(min_level), sinks_(std::move(sinks)) {}

protected:
    void write(LogLevel level, const std::string& message) override;

private:
    std::vector<std::shared_ptr<Logger>> sinks_;
};

class NullLogger : public Logger {
protected:
    void write(LogLevel, const std::string&) override {}
};

// $HOME/Logs, falling back to the passwd entry when HOME is unset.
std::filesystem::path default_log_dir();

} // namespace logging
