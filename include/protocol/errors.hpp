#pragma once

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace protocol {

// Base of every failure a single transfer session can raise.
class TransferError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class ConnectFailure {
    TIMEOUT,
    REFUSED
};

class ConnectError : public TransferError {
public:
    ConnectError(ConnectFailure kind, const std::string& host, unsigned short port, const std::string& detail)
        : TransferError("Connect to " + host + ":" + std::to_string(port) +
                        (kind == ConnectFailure::TIMEOUT ? " timed out" : " failed") +
                        (detail.empty() ? "" : ": " + detail)),
          kind_(kind) {}

    ConnectFailure kind() const { return kind_; }

private:
    ConnectFailure kind_;
};

// A header line that cannot be decoded. Never worth retrying.
class MalformedHeader : public TransferError {
public:
    MalformedHeader(const std::string& field, const std::string& text)
        : TransferError("Malformed " + field + " header: '" + text + "'"), field_(field), text_(text) {}

    const std::string& field() const { return field_; }
    const std::string& text() const { return text_; }

private:
    std::string field_;
    std::string text_;
};

// The peer closed (or the connection broke) before a frame was complete.
class ConnectionLost : public TransferError {
public:
    ConnectionLost(uint64_t bytes_transferred, uint64_t bytes_expected)
        : TransferError("Connection lost after " + std::to_string(bytes_transferred) + " of " +
                        std::to_string(bytes_expected) + " bytes"),
          bytes_transferred_(bytes_transferred), bytes_expected_(bytes_expected) {}

    // Header frames have no declared length.
    explicit ConnectionLost(const std::string& field)
        : TransferError("Connection lost before the " + field + " header was complete"),
          bytes_transferred_(0), bytes_expected_(0) {}

    uint64_t bytes_transferred() const { return bytes_transferred_; }
    uint64_t bytes_expected() const { return bytes_expected_; }

private:
    uint64_t bytes_transferred_;
    uint64_t bytes_expected_;
};

// A per-phase deadline expired. The session is closed by then.
class IoTimeout : public TransferError {
public:
    std::chrono::milliseconds limit() const { return limit_; }

protected:
    IoTimeout(const std::string& message, std::chrono::milliseconds limit)
        : TransferError(message), limit_(limit) {}

private:
    std::chrono::milliseconds limit_;
};

class ReadTimeout : public IoTimeout {
public:
    explicit ReadTimeout(std::chrono::milliseconds limit)
        : IoTimeout("Peer did not respond within " + std::to_string(limit.count()) + " ms", limit) {}
};

// The peer stopped draining its receive buffer.
class WriteTimeout : public IoTimeout {
public:
    explicit WriteTimeout(std::chrono::milliseconds limit)
        : IoTimeout("Peer did not accept data within " + std::to_string(limit.count()) + " ms", limit) {}
};

class TransferCancelled : public TransferError {
public:
    explicit TransferCancelled(uint64_t bytes_transferred)
        : TransferError("Transfer cancelled after " + std::to_string(bytes_transferred) + " bytes"),
          bytes_transferred_(bytes_transferred) {}

    uint64_t bytes_transferred() const { return bytes_transferred_; }

private:
    uint64_t bytes_transferred_;
};

} // namespace protocol
