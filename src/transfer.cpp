#include "transfer.hpp"
#include "networking.hpp"
#include "protocol/errors.hpp"
#include <algorithm>
#include <chrono>
#include <fstream>
#include <stdexcept>

namespace transfer {

namespace {

// Rate-limits progress reports to one per interval, plus the final one.
class ProgressMeter {
public:
    ProgressMeter(std::string name, uint64_t total, const TransferOptions& options)
        : name_(std::move(name)), total_(total), progress_cb_(options.progress_cb),
          interval_(options.progress_interval),
          start_time_(std::chrono::steady_clock::now()), last_cb_time_(start_time_) {}

    void update(uint64_t done) {
        if (!progress_cb_) {
            return;
        }
        auto now = std::chrono::steady_clock::now();
        if (now - last_cb_time_ >= interval_ || done == total_) {
            double elapsed = std::chrono::duration<double>(now - start_time_).count();
            double speed = (elapsed > 0) ? (done / elapsed / (1024.0 * 1024.0)) : 0;
            progress_cb_(name_, done, total_, speed);
            last_cb_time_ = now;
        }
    }

private:
    std::string name_;
    uint64_t total_;
    const TransferProgressCallback& progress_cb_;
    std::chrono::milliseconds interval_;
    std::chrono::steady_clock::time_point start_time_;
    std::chrono::steady_clock::time_point last_cb_time_;
};

void check_chunk_size(std::size_t chunk_size) {
    if (chunk_size == 0) {
        throw std::invalid_argument("chunk_size must be greater than zero");
    }
}

void check_cancelled(const TransferOptions& options, uint64_t done, logging::Logger& logger) {
    if (options.cancel_flag && options.cancel_flag->load()) {
        logger.info("Transfer cancelled locally after " + std::to_string(done) + " bytes.");
        throw protocol::TransferCancelled(done);
    }
}

std::size_t next_chunk(std::size_t chunk_size, uint64_t done, uint64_t total) {
    return static_cast<std::size_t>(std::min<uint64_t>(chunk_size, total - done));
}

} // namespace

// ─── Sending ────────────────────────────────────────────────────────────────

void MessageSender::send_line(protocol::ByteStream& stream, const std::string& message, protocol::Deadline deadline) {
    protocol::write_line(stream, message, deadline);
}

void MessageSender::send_file_name(protocol::ByteStream& stream, const std::string& name, logging::Logger& logger,
                                   const TransferOptions& options) {
    send_line(stream, name, options.header_timeout);
    logger.info("File name " + name + " sent over");
}

void MessageSender::send_file_size(protocol::ByteStream& stream, uint64_t size, logging::Logger& logger,
                                   const TransferOptions& options) {
    send_line(stream, protocol::format_file_size(size), options.header_timeout);
    logger.info("File size=" + std::to_string(size) + " sent over");
}

void MessageSender::send_body(protocol::ByteStream& stream, const std::string& name,
                              const std::vector<uint8_t>& payload, logging::Logger& logger,
                              const TransferOptions& options) {
    check_chunk_size(options.chunk_size);

    const uint64_t total = payload.size();
    uint64_t total_sent = 0;
    ProgressMeter meter(name, total, options);

    while (total_sent < total) {
        check_cancelled(options, total_sent, logger);
        std::size_t n = next_chunk(options.chunk_size, total_sent, total);
        try {
            stream.write_all(payload.data() + total_sent, n, options.chunk_timeout);
        } catch (const protocol::ConnectionLost& e) {
            logger.debug("Connection lost while sending file data.");
            throw protocol::ConnectionLost(total_sent + e.bytes_transferred(), total);
        }
        total_sent += n;
        meter.update(total_sent);
    }
    logger.info("Sent " + networking::format_size(total) + " of " + name + ".");
}

uint64_t MessageSender::send_file(protocol::ByteStream& stream, const std::filesystem::path& filepath,
                                  uint64_t expected_size, logging::Logger& logger, const TransferOptions& options) {
    check_chunk_size(options.chunk_size);

    std::ifstream file(filepath, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open file for reading: " + filepath.string());
    }

    uint64_t total_sent = 0;
    ProgressMeter meter(filepath.filename().string(), expected_size, options);
    std::vector<char> buffer(std::max<std::size_t>(1, next_chunk(options.chunk_size, 0, expected_size)));

    while (total_sent < expected_size) {
        check_cancelled(options, total_sent, logger);
        std::size_t want = next_chunk(buffer.size(), total_sent, expected_size);
        file.read(buffer.data(), static_cast<std::streamsize>(want));
        std::size_t bytes_read = static_cast<std::size_t>(file.gcount());
        if (bytes_read == 0) {
            // The size header is already on the wire; the peer will see a short body.
            throw std::runtime_error("File " + filepath.string() + " shrank to " + std::to_string(total_sent) +
                                     " bytes while sending");
        }
        try {
            stream.write_all(reinterpret_cast<const uint8_t*>(buffer.data()), bytes_read, options.chunk_timeout);
        } catch (const protocol::ConnectionLost& e) {
            logger.debug("Connection lost while sending file data.");
            throw protocol::ConnectionLost(total_sent + e.bytes_transferred(), expected_size);
        }
        total_sent += bytes_read;
        meter.update(total_sent);
    }
    logger.info("Sent " + networking::format_size(total_sent) + " from " + filepath.string() + ".");
    return total_sent;
}

// ─── Receiving ──────────────────────────────────────────────────────────────

protocol::LineResult MessageReceiver::receive_line(protocol::ByteStream& stream, protocol::Deadline deadline) {
    return protocol::read_line(stream, deadline);
}

protocol::LineResult MessageReceiver::receive_file_name(protocol::ByteStream& stream, logging::Logger& logger,
                                                        const TransferOptions& options) {
    protocol::LineResult result = receive_line(stream, options.header_timeout);
    if (result.closed()) {
        logger.debug("Connection closed before the file name delimiter (" + std::to_string(result.text.size()) +
                     " bytes pending).");
        return result;
    }
    if (!protocol::is_valid_utf8(result.text)) {
        logger.debug("File name is not valid UTF-8.");
        throw protocol::MalformedHeader("name", result.text);
    }
    logger.info("File name " + result.text + " received");
    return result;
}

uint64_t MessageReceiver::receive_file_size(protocol::ByteStream& stream, logging::Logger& logger,
                                            const TransferOptions& options) {
    protocol::LineResult result = receive_line(stream, options.header_timeout);
    if (result.closed()) {
        logger.debug("Connection closed before the file size delimiter.");
        throw protocol::ConnectionLost("size");
    }
    try {
        uint64_t file_size = protocol::parse_file_size(result.text);
        logger.info("File size=" + std::to_string(file_size) + " received");
        return file_size;
    } catch (const protocol::MalformedHeader&) {
        logger.debug("Could not parse file size as int: '" + result.text + "'");
        throw;
    }
}

std::vector<uint8_t> MessageReceiver::receive_body(protocol::ByteStream& stream, std::size_t chunk_size,
                                                   uint64_t file_size, logging::Logger& logger,
                                                   const TransferOptions& options) {
    check_chunk_size(chunk_size);

    std::vector<uint8_t> received_file;
    // Declared sizes come from the peer; grow on demand past 64 MiB.
    received_file.reserve(static_cast<std::size_t>(std::min<uint64_t>(file_size, 64ull * 1024 * 1024)));
    uint64_t bytes_received = 0;
    ProgressMeter meter("", file_size, options);

    logger.info("Receiving file of size " + std::to_string(file_size) + " bytes...");
    while (bytes_received < file_size) {
        check_cancelled(options, bytes_received, logger);
        std::size_t want = next_chunk(chunk_size, bytes_received, file_size);
        std::size_t offset = received_file.size();
        received_file.resize(offset + want);
        std::size_t n = stream.read_some(received_file.data() + offset, want, options.chunk_timeout);
        received_file.resize(offset + n);
        if (n == 0) {
            logger.debug("Connection lost while receiving file data.");
            throw protocol::ConnectionLost(bytes_received, file_size);
        }
        bytes_received += n;
        meter.update(bytes_received);
    }

    logger.info("Received the entire file from server.");
    return received_file;
}

void MessageReceiver::receive_file(protocol::ByteStream& stream, const std::filesystem::path& filepath,
                                   std::size_t chunk_size, uint64_t file_size, logging::Logger& logger,
                                   const TransferOptions& options) {
    check_chunk_size(chunk_size);

    std::filesystem::path part_file = filepath;
    part_file += ".part";

    std::filesystem::path parent = part_file.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }

    std::ofstream file(part_file, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open file for writing: " + part_file.string());
    }

    std::vector<uint8_t> buffer(std::max<std::size_t>(1, next_chunk(chunk_size, 0, file_size)));
    uint64_t bytes_received = 0;
    ProgressMeter meter(filepath.filename().string(), file_size, options);

    logger.info("Receiving " + filepath.string() + " (" + networking::format_size(file_size) + ")...");
    try {
        while (bytes_received < file_size) {
            check_cancelled(options, bytes_received, logger);
            std::size_t want = next_chunk(buffer.size(), bytes_received, file_size);
            std::size_t n = stream.read_some(buffer.data(), want, options.chunk_timeout);
            if (n == 0) {
                logger.debug("Connection lost while receiving file data.");
                throw protocol::ConnectionLost(bytes_received, file_size);
            }
            file.write(reinterpret_cast<const char*>(buffer.data()), static_cast<std::streamsize>(n));
            if (!file) {
                throw std::runtime_error("Write to " + part_file.string() + " failed");
            }
            bytes_received += n;
            meter.update(bytes_received);
        }
        file.close();
        if (!file) {
            throw std::runtime_error("Could not finish writing " + part_file.string());
        }
    } catch (...) {
        file.close();
        std::error_code ec;
        std::filesystem::remove(part_file, ec);
        throw;
    }

    std::filesystem::rename(part_file, filepath);
    logger.info("Received the entire file into " + filepath.string() + ".");
}

} // namespace transfer
