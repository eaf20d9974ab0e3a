#include "config.hpp"
#include <fstream>
#include <limits>

namespace config {

namespace {

using json = nlohmann::json;

const json* find_key(const json& j, const char* key) {
    auto it = j.find(key);
    return it == j.end() ? nullptr : &*it;
}

int64_t get_int(const json& value, const std::string& key, int64_t min_value,
                int64_t max_value = std::numeric_limits<int64_t>::max()) {
    if (!value.is_number_integer()) {
        throw ConfigError("Config key '" + key + "' must be an integer");
    }
    int64_t v = value.get<int64_t>();
    if (v < min_value) {
        throw ConfigError("Config key '" + key + "' must be >= " + std::to_string(min_value));
    }
    if (v > max_value) {
        throw ConfigError("Config key '" + key + "' must be <= " + std::to_string(max_value));
    }
    return v;
}

std::chrono::milliseconds get_millis(const json& value, const std::string& key) {
    return std::chrono::milliseconds(get_int(value, key, 0));
}

// null disables the deadline
std::optional<std::chrono::milliseconds> get_optional_millis(const json& value, const std::string& key) {
    if (value.is_null()) {
        return std::nullopt;
    }
    return get_millis(value, key);
}

std::string get_string(const json& value, const std::string& key) {
    if (!value.is_string()) {
        throw ConfigError("Config key '" + key + "' must be a string");
    }
    return value.get<std::string>();
}

const json& get_object(const json& value, const std::string& key) {
    if (!value.is_object()) {
        throw ConfigError("Config key '" + key + "' must be an object");
    }
    return value;
}

uint64_t parse_decimal(const std::string& text, const std::string& option, uint64_t max_value) {
    if (text.empty() || text.size() > 20 ||
        text.find_first_not_of("0123456789") != std::string::npos) {
        throw ConfigError("Option '" + option + "' expects a non-negative integer, got '" + text + "'");
    }
    uint64_t v = 0;
    try {
        v = std::stoull(text);
    } catch (const std::out_of_range&) {
        v = std::numeric_limits<uint64_t>::max();
    }
    if (v > max_value) {
        throw ConfigError("Option '" + option + "' must be <= " + std::to_string(max_value) + ", got '" + text + "'");
    }
    return v;
}

} // namespace

AppConfig parse_config(const json& j) {
    if (!j.is_object()) {
        throw ConfigError("Config root must be a JSON object");
    }

    AppConfig cfg;
    if (const json* v = find_key(j, "connect_timeout_ms")) {
        cfg.connect_timeout = get_millis(*v, "connect_timeout_ms");
    }
    if (const json* v = find_key(j, "header_timeout_ms")) {
        cfg.header_timeout = get_optional_millis(*v, "header_timeout_ms");
    }
    if (const json* v = find_key(j, "chunk_timeout_ms")) {
        cfg.chunk_timeout = get_optional_millis(*v, "chunk_timeout_ms");
    }
    if (const json* v = find_key(j, "chunk_size")) {
        cfg.chunk_size = static_cast<std::size_t>(get_int(*v, "chunk_size", 1));
    }

    if (const json* r = find_key(j, "retry")) {
        const json& retry = get_object(*r, "retry");
        if (const json* v = find_key(retry, "max_attempts")) {
            cfg.retry.max_attempts = static_cast<int>(
                get_int(*v, "retry.max_attempts", 1, std::numeric_limits<int>::max()));
        }
        if (const json* v = find_key(retry, "delay_ms")) {
            cfg.retry.delay = get_millis(*v, "retry.delay_ms");
        }
    }

    if (const json* l = find_key(j, "log")) {
        const json& log = get_object(*l, "log");
        if (const json* v = find_key(log, "name")) {
            cfg.log.name = get_string(*v, "log.name");
        }
        if (const json* v = find_key(log, "dir")) {
            cfg.log.dir = get_string(*v, "log.dir");
        }
        if (const json* v = find_key(log, "level")) {
            try {
                cfg.log.level = logging::parse_log_level(get_string(*v, "log.level"));
            } catch (const std::invalid_argument& e) {
                throw ConfigError(std::string("Config key 'log.level': ") + e.what());
            }
        }
        if (const json* v = find_key(log, "file")) {
            if (!v->is_boolean()) {
                throw ConfigError("Config key 'log.file' must be a boolean");
            }
            cfg.log.file = v->get<bool>();
        }
    }
    return cfg;
}

AppConfig load_config(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw ConfigError("Could not open config file: " + path);
    }
    json j;
    try {
        j = json::parse(in);
    } catch (const json::parse_error& e) {
        throw ConfigError("Could not parse config file " + path + ": " + e.what());
    }
    return parse_config(j);
}

unsigned short parse_port(const std::string& text) {
    return static_cast<unsigned short>(parse_decimal(text, "port", std::numeric_limits<unsigned short>::max()));
}

std::size_t parse_chunk_size(const std::string& text) {
    std::size_t v = static_cast<std::size_t>(
        parse_decimal(text, "--chunk-size", std::numeric_limits<std::size_t>::max()));
    if (v == 0) {
        throw ConfigError("Option '--chunk-size' must be greater than zero");
    }
    return v;
}

networking::ConnectOptions connect_options(const AppConfig& cfg) {
    networking::ConnectOptions options;
    options.connect_timeout = cfg.connect_timeout;
    return options;
}

transfer::TransferOptions transfer_options(const AppConfig& cfg) {
    transfer::TransferOptions options;
    options.chunk_size = cfg.chunk_size;
    options.header_timeout = cfg.header_timeout;
    options.chunk_timeout = cfg.chunk_timeout;
    return options;
}

retry::RetryPolicy retry_policy(const AppConfig& cfg) {
    return retry::RetryPolicy(cfg.retry.max_attempts, cfg.retry.delay);
}

} // namespace config
