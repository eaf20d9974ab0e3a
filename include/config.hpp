#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>
#include "logger.hpp"
#include "networking.hpp"
#include "retry.hpp"
#include "transfer.hpp"

namespace config {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct RetrySettings {
    int max_attempts = retry::RetryPolicy::DEFAULT_MAX_ATTEMPTS;
    std::chrono::milliseconds delay = retry::RetryPolicy::DEFAULT_DELAY;
};

struct LogSettings {
    std::string name = "labxfer";
    // Empty means logging::default_log_dir().
    std::string dir;
    logging::LogLevel level = logging::LogLevel::INFO;
    bool file = true;
};

struct AppConfig {
    std::chrono::milliseconds connect_timeout = networking::DEFAULT_CONNECT_TIMEOUT;
    std::optional<std::chrono::milliseconds> header_timeout;
    std::optional<std::chrono::milliseconds> chunk_timeout;
    std::size_t chunk_size = transfer::DEFAULT_CHUNK_SIZE;
    RetrySettings retry;
    LogSettings log;
};

// Missing keys keep their defaults, unknown keys are ignored, and a key of
// the wrong type or range throws ConfigError naming it.
AppConfig parse_config(const nlohmann::json& j);
AppConfig load_config(const std::string& path);

// Command-line values. Plain decimal digits only; anything else, including a
// sign or an out-of-range value, throws ConfigError naming the option.
unsigned short parse_port(const std::string& text);
std::size_t parse_chunk_size(const std::string& text);

networking::ConnectOptions connect_options(const AppConfig& cfg);
transfer::TransferOptions transfer_options(const AppConfig& cfg);
retry::RetryPolicy retry_policy(const AppConfig& cfg);

} // namespace config
