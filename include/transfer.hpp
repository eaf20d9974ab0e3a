#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>
#include "logger.hpp"
#include "protocol/byte_stream.hpp"
#include "protocol/line_codec.hpp"

namespace transfer {

// Progress callback: filename, bytes_transferred, bytes_total, speed_mbps
using TransferProgressCallback = std::function<void(const std::string&, uint64_t, uint64_t, double)>;

constexpr std::size_t DEFAULT_CHUNK_SIZE = 64 * 1024;

struct TransferOptions {
    std::size_t chunk_size = DEFAULT_CHUNK_SIZE;
    // Applies to each header byte read.
    protocol::Deadline header_timeout;
    // Applies to each body chunk read or write.
    protocol::Deadline chunk_timeout;
    TransferProgressCallback progress_cb;
    // Minimum gap between progress reports; the final report always fires.
    std::chrono::milliseconds progress_interval{300};
    // Checked between chunks; set from another thread to stop with TransferCancelled.
    std::atomic<bool>* cancel_flag = nullptr;
};

class MessageSender {
public:
    static void send_line(protocol::ByteStream& stream, const std::string& message, protocol::Deadline deadline = {});
    static void send_file_name(protocol::ByteStream& stream, const std::string& name, logging::Logger& logger,
                               const TransferOptions& options = {});
    static void send_file_size(protocol::ByteStream& stream, uint64_t size, logging::Logger& logger,
                               const TransferOptions& options = {});
    static void send_body(protocol::ByteStream& stream, const std::string& name, const std::vector<uint8_t>& payload,
                          logging::Logger& logger, const TransferOptions& options = {});
    // Streams the file body only; the header must already be sent. Returns bytes sent.
    static uint64_t send_file(protocol::ByteStream& stream, const std::filesystem::path& filepath,
                              uint64_t expected_size, logging::Logger& logger, const TransferOptions& options = {});
};

class MessageReceiver {
public:
    static protocol::LineResult receive_line(protocol::ByteStream& stream, protocol::Deadline deadline = {});
    static protocol::LineResult receive_file_name(protocol::ByteStream& stream, logging::Logger& logger,
                                                  const TransferOptions& options = {});
    // Throws MalformedHeader for a non-numeric line, ConnectionLost if the peer closed first.
    static uint64_t receive_file_size(protocol::ByteStream& stream, logging::Logger& logger,
                                      const TransferOptions& options = {});
    // Reads exactly file_size bytes in pieces of at most chunk_size.
    static std::vector<uint8_t> receive_body(protocol::ByteStream& stream, std::size_t chunk_size, uint64_t file_size,
                                             logging::Logger& logger, const TransferOptions& options = {});
    // Same loop, written to "<filepath>.part" and renamed on success. The part
    // file is removed on failure.
    static void receive_file(protocol::ByteStream& stream, const std::filesystem::path& filepath,
                             std::size_t chunk_size, uint64_t file_size, logging::Logger& logger,
                             const TransferOptions& options = {});
};

} // namespace transfer
