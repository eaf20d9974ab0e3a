#pragma once

#include <algorithm>
#include <cstring>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include "logger.hpp"
#include "networking.hpp"
#include "protocol/byte_stream.hpp"
#include "protocol/errors.hpp"

namespace testing_support {

// In-memory peer: serves a fixed input, then reports closure. Records every
// read request so tests can check how the engine chunks its reads.
class ScriptedStream : public protocol::ByteStream {
public:
    explicit ScriptedStream(std::string input,
                            std::size_t max_per_read = std::numeric_limits<std::size_t>::max())
        : input_(std::move(input)), max_per_read_(max_per_read) {}

    std::size_t read_some(uint8_t* data, std::size_t max_bytes, protocol::Deadline) override {
        requested.push_back(max_bytes);
        std::size_t n = std::min({max_bytes, max_per_read_, input_.size() - pos_});
        std::memcpy(data, input_.data() + pos_, n);
        pos_ += n;
        returned.push_back(n);
        return n;
    }

    void write_all(const uint8_t* data, std::size_t size, protocol::Deadline) override {
        if (written.size() + size > write_limit) {
            std::size_t accepted = write_limit - written.size();
            written.append(reinterpret_cast<const char*>(data), accepted);
            throw protocol::ConnectionLost(accepted, size);
        }
        write_sizes.push_back(size);
        written.append(reinterpret_cast<const char*>(data), size);
    }

    std::string remaining() const { return input_.substr(pos_); }

    std::vector<std::size_t> requested;
    std::vector<std::size_t> returned;
    std::vector<std::size_t> write_sizes;
    std::string written;
    std::size_t write_limit = std::numeric_limits<std::size_t>::max();

private:
    std::string input_;
    std::size_t pos_ = 0;
    std::size_t max_per_read_;
};

// Forwards to a real stream and records read sizes.
class RecordingStream : public protocol::ByteStream {
public:
    explicit RecordingStream(protocol::ByteStream& inner) : inner_(inner) {}

    std::size_t read_some(uint8_t* data, std::size_t max_bytes, protocol::Deadline deadline) override {
        requested.push_back(max_bytes);
        std::size_t n = inner_.read_some(data, max_bytes, deadline);
        returned.push_back(n);
        return n;
    }

    void write_all(const uint8_t* data, std::size_t size, protocol::Deadline deadline) override {
        inner_.write_all(data, size, deadline);
    }

    std::vector<std::size_t> requested;
    std::vector<std::size_t> returned;

private:
    protocol::ByteStream& inner_;
};

class RecordingLogger : public logging::Logger {
public:
    using logging::Logger::Logger;

    std::vector<std::pair<logging::LogLevel, std::string>> lines;

protected:
    void write(logging::LogLevel level, const std::string& message) override {
        lines.emplace_back(level, message);
    }
};

class ThrowingLogger : public logging::Logger {
protected:
    void write(logging::LogLevel, const std::string&) override {
        throw std::runtime_error("sink unavailable");
    }
};

struct LoopbackPair {
    std::unique_ptr<networking::Session> client;
    std::unique_ptr<networking::Session> server;
};

// The kernel completes the handshake before accept() runs, so connecting
// first and accepting second does not block.
inline LoopbackPair make_loopback_pair(logging::Logger& logger) {
    networking::Listener listener(0, "127.0.0.1");
    LoopbackPair pair;
    pair.client = networking::connect_session("127.0.0.1", listener.port(), {}, logger);
    pair.server = listener.accept(logger);
    return pair;
}

inline std::vector<uint8_t> to_bytes(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

inline std::vector<uint8_t> pattern_bytes(std::size_t n) {
    std::vector<uint8_t> data(n);
    for (std::size_t i = 0; i < n; ++i) {
        data[i] = static_cast<uint8_t>((i * 31 + 7) & 0xFF);
    }
    return data;
}

} // namespace testing_support
