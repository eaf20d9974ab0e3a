#include "networking.hpp"
#include "protocol/errors.hpp"
#include <cstdio>

using boost::asio::ip::tcp;

namespace networking {

std::string format_size(uint64_t bytes) {
    double size = bytes;
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    int i = 0;
    while (size >= 1024 && i < 4) {
        size /= 1024;
        i++;
    }
    char buf[32];
    snprintf(buf, sizeof(buf), "%.1f%s", size, units[i]);
    return std::string(buf);
}

// ─── Session ────────────────────────────────────────────────────────────────

Session::Session(std::unique_ptr<boost::asio::io_context> io_context, tcp::socket socket)
    : io_context_(std::move(io_context)), socket_(std::move(socket)) {
    boost::system::error_code ec;
    tcp::endpoint remote = socket_.remote_endpoint(ec);
    peer_ = ec ? "unknown" : remote.address().to_string() + ":" + std::to_string(remote.port());
}

Session::~Session() {
    close();
}

bool Session::run_until_complete(protocol::Deadline deadline) {
    io_context_->restart();
    if (!deadline) {
        io_context_->run();
        return true;
    }

    io_context_->run_for(*deadline);
    if (io_context_->stopped()) {
        return true;
    }

    // Deadline hit: closing aborts the pending operation, then drain it.
    boost::system::error_code ignored;
    socket_.close(ignored);
    io_context_->run();
    return false;
}

std::size_t Session::read_some(uint8_t* data, std::size_t max_bytes, protocol::Deadline deadline) {
    boost::system::error_code ec;
    std::size_t length = 0;
    socket_.async_read_some(boost::asio::buffer(data, max_bytes),
        [&ec, &length](const boost::system::error_code& error, std::size_t n) {
            ec = error;
            length = n;
        });

    if (!run_until_complete(deadline)) {
        throw protocol::ReadTimeout(*deadline);
    }
    // eof, reset, aborted by cancel(): all mean the peer is gone
    if (ec) {
        return 0;
    }
    return length;
}

void Session::write_all(const uint8_t* data, std::size_t size, protocol::Deadline deadline) {
    boost::system::error_code ec;
    std::size_t written = 0;
    boost::asio::async_write(socket_, boost::asio::buffer(data, size),
        [&ec, &written](const boost::system::error_code& error, std::size_t n) {
            ec = error;
            written = n;
        });

    if (!run_until_complete(deadline)) {
        throw protocol::WriteTimeout(*deadline);
    }
    if (ec) {
        throw protocol::ConnectionLost(written, size);
    }
}

void Session::cancel() {
    boost::asio::post(*io_context_, [this]() {
        boost::system::error_code ignored;
        socket_.close(ignored);
    });
}

void Session::close() {
    if (!socket_.is_open()) {
        return;
    }
    boost::system::error_code ignored;
    socket_.shutdown(tcp::socket::shutdown_both, ignored);
    socket_.close(ignored);
}

// ─── Connect ────────────────────────────────────────────────────────────────

std::unique_ptr<Session> connect_session(const std::string& host, unsigned short port,
                                         const ConnectOptions& options, logging::Logger& logger) {
    auto io_context = std::make_unique<boost::asio::io_context>();
    boost::system::error_code ec;

    tcp::resolver resolver(*io_context);
    auto endpoints = resolver.resolve(host, std::to_string(port), ec);
    if (ec) {
        logger.info("Could not resolve " + host + ": " + ec.message());
        throw protocol::ConnectError(protocol::ConnectFailure::REFUSED, host, port, ec.message());
    }

    tcp::socket socket(*io_context);
    boost::asio::async_connect(socket, endpoints,
        [&ec](const boost::system::error_code& error, const tcp::endpoint&) {
            ec = error;
        });

    io_context->run_for(options.connect_timeout);
    if (!io_context->stopped()) {
        boost::system::error_code ignored;
        socket.close(ignored);
        io_context->run();
        logger.info("Connection timed out after " + std::to_string(options.connect_timeout.count()) + " ms.");
        throw protocol::ConnectError(protocol::ConnectFailure::TIMEOUT, host, port, "");
    }
    if (ec) {
        boost::system::error_code ignored;
        socket.close(ignored);
        logger.info("Connection to " + host + ":" + std::to_string(port) + " failed: " + ec.message());
        throw protocol::ConnectError(protocol::ConnectFailure::REFUSED, host, port, ec.message());
    }

    logger.info("Connected to server " + host + ":" + std::to_string(port));
    return std::make_unique<Session>(std::move(io_context), std::move(socket));
}

// ─── Listener ───────────────────────────────────────────────────────────────

Listener::Listener(unsigned short port, const std::string& bind_address)
    : acceptor_(io_context_, tcp::endpoint(boost::asio::ip::make_address(bind_address), port)) {}

unsigned short Listener::port() const {
    return acceptor_.local_endpoint().port();
}

std::unique_ptr<Session> Listener::accept(logging::Logger& logger) {
    auto io_context = std::make_unique<boost::asio::io_context>();
    tcp::socket socket(*io_context);
    boost::system::error_code ec;
    acceptor_.async_accept(socket, [&ec](const boost::system::error_code& error) {
        ec = error;
    });

    io_context_.restart();
    io_context_.run();
    if (ec) {
        if (ec == boost::asio::error::operation_aborted || !acceptor_.is_open()) {
            logger.info("Stopped waiting for a peer.");
            throw protocol::TransferCancelled(0);
        }
        throw boost::system::system_error(ec, "accept");
    }

    auto session = std::make_unique<Session>(std::move(io_context), std::move(socket));
    logger.info("Peer connected from " + session->peer());
    return session;
}

void Listener::cancel() {
    boost::asio::post(io_context_, [this]() {
        boost::system::error_code ignored;
        acceptor_.close(ignored);
    });
}

} // namespace networking
