#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>

namespace protocol {

// An unset deadline blocks until the peer sends data or closes.
using Deadline = std::optional<std::chrono::milliseconds>;

// Blocking byte stream the codec and the transfer engine run on.
class ByteStream {
public:
    virtual ~ByteStream() = default;

    // Reads at most max_bytes. Returns 0 once the peer has closed or the
    // connection broke.
    // Throws ReadTimeout if nothing arrives before the deadline.
    virtual std::size_t read_some(uint8_t* data, std::size_t max_bytes, Deadline deadline) = 0;

    // Writes every byte, or throws ConnectionLost or WriteTimeout.
    virtual void write_all(const uint8_t* data, std::size_t size, Deadline deadline) = 0;
};

} // namespace protocol
