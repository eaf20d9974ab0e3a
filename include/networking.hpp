#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <boost/asio.hpp>
#include "logger.hpp"
#include "protocol/byte_stream.hpp"

namespace networking {

constexpr std::chrono::milliseconds DEFAULT_CONNECT_TIMEOUT{10000};

struct ConnectOptions {
    std::chrono::milliseconds connect_timeout = DEFAULT_CONNECT_TIMEOUT;
};

// One established TCP connection carrying a single file transfer. Owns its
// io_context so sessions never share state; closing happens on destruction.
//
// Every blocking call runs the private io_context until the operation
// completes or the deadline passes. On expiry the socket is closed and the
// call throws ReadTimeout or WriteTimeout.
class Session : public protocol::ByteStream {
public:
    Session(std::unique_ptr<boost::asio::io_context> io_context, boost::asio::ip::tcp::socket socket);
    ~Session() override;

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    std::size_t read_some(uint8_t* data, std::size_t max_bytes, protocol::Deadline deadline) override;
    void write_all(const uint8_t* data, std::size_t size, protocol::Deadline deadline) override;

    // Safe from any thread. A blocked read observes it as a closed peer.
    void cancel();
    void close();

    bool is_open() const { return socket_.is_open(); }
    const std::string& peer() const { return peer_; }

private:
    // Returns false if the deadline passed before the pending operation finished.
    bool run_until_complete(protocol::Deadline deadline);

    std::unique_ptr<boost::asio::io_context> io_context_;
    boost::asio::ip::tcp::socket socket_;
    std::string peer_;
};

// Throws ConnectError (TIMEOUT or REFUSED). Never retries on its own.
std::unique_ptr<Session> connect_session(const std::string& host, unsigned short port,
                                         const ConnectOptions& options, logging::Logger& logger);

// Waits for one inbound peer. Port 0 picks an ephemeral port.
class Listener {
public:
    explicit Listener(unsigned short port, const std::string& bind_address = "0.0.0.0");

    unsigned short port() const;
    // Throws TransferCancelled once cancel() has closed the acceptor.
    std::unique_ptr<Session> accept(logging::Logger& logger);

    // Safe from any thread. Stops a pending or later accept().
    void cancel();

private:
    boost::asio::io_context io_context_;
    boost::asio::ip::tcp::acceptor acceptor_;
};

std::string format_size(uint64_t bytes);

} // namespace networking
