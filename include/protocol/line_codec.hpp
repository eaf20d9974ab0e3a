#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include "protocol/byte_stream.hpp"

namespace protocol {

// Header fields are terminated by a single LF. CR is never emitted or stripped.
constexpr uint8_t LINE_DELIMITER = 0x0A;
constexpr std::size_t DEFAULT_MAX_LINE_LENGTH = 4096;

// Outcome of reading one header line. An empty LINE is a legitimate empty
// field; CLOSED_BEFORE_DELIMITER means the peer went away mid-frame and text
// holds whatever arrived before that.
struct LineResult {
    enum class Status {
        LINE,
        CLOSED_BEFORE_DELIMITER
    };

    Status status;
    std::string text;

    bool closed() const { return status == Status::CLOSED_BEFORE_DELIMITER; }

    static LineResult line(std::string text) { return {Status::LINE, std::move(text)}; }
    static LineResult closed_before_delimiter(std::string partial) {
        return {Status::CLOSED_BEFORE_DELIMITER, std::move(partial)};
    }
};

// Throws std::invalid_argument if text contains the delimiter.
std::string encode_line(const std::string& text);

void write_line(ByteStream& stream, const std::string& text, Deadline deadline = {});

// Reads one byte at a time so nothing past the delimiter is consumed.
// Throws MalformedHeader if no delimiter shows up within max_length bytes.
LineResult read_line(ByteStream& stream, Deadline deadline = {},
                     std::size_t max_length = DEFAULT_MAX_LINE_LENGTH);

std::string format_file_size(uint64_t size);

// Accepts plain decimal digits only. Throws MalformedHeader otherwise.
uint64_t parse_file_size(const std::string& text);

bool is_valid_utf8(const std::string& text);

} // namespace protocol
