#include "protocol/line_codec.hpp"
#include "protocol/errors.hpp"
#include <stdexcept>

namespace protocol {

std::string encode_line(const std::string& text) {
    if (text.find(static_cast<char>(LINE_DELIMITER)) != std::string::npos) {
        throw std::invalid_argument("Header field must not contain a newline");
    }
    return text + static_cast<char>(LINE_DELIMITER);
}

void write_line(ByteStream& stream, const std::string& text, Deadline deadline) {
    std::string msg = encode_line(text);
    stream.write_all(reinterpret_cast<const uint8_t*>(msg.data()), msg.size(), deadline);
}

LineResult read_line(ByteStream& stream, Deadline deadline, std::size_t max_length) {
    std::string line;
    uint8_t byte = 0;
    while (true) {
        if (stream.read_some(&byte, 1, deadline) == 0) {
            return LineResult::closed_before_delimiter(std::move(line));
        }
        if (byte == LINE_DELIMITER) {
            return LineResult::line(std::move(line));
        }
        if (line.size() >= max_length) {
            throw MalformedHeader("line", line.substr(0, 64) + "...");
        }
        line.push_back(static_cast<char>(byte));
    }
}

std::string format_file_size(uint64_t size) {
    return std::to_string(size);
}

uint64_t parse_file_size(const std::string& text) {
    // uint64_t max has 20 digits
    if (text.empty() || text.size() > 20) {
        throw MalformedHeader("size", text);
    }
    for (char c : text) {
        if (c < '0' || c > '9') {
            throw MalformedHeader("size", text);
        }
    }
    try {
        return std::stoull(text);
    } catch (const std::out_of_range&) {
        throw MalformedHeader("size", text);
    }
}

bool is_valid_utf8(const std::string& text) {
    std::size_t i = 0;
    while (i < text.size()) {
        const auto c = static_cast<unsigned char>(text[i]);
        std::size_t extra = 0;
        uint32_t cp = 0;
        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            extra = 1;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            extra = 2;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            extra = 3;
            cp = c & 0x07;
        } else {
            return false;
        }
        if (i + extra >= text.size()) {
            return false;
        }
        for (std::size_t k = 1; k <= extra; ++k) {
            const auto cc = static_cast<unsigned char>(text[i + k]);
            if ((cc & 0xC0) != 0x80) {
                return false;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }
        // Overlong forms, surrogates and values past U+10FFFF
        if ((extra == 1 && cp < 0x80) || (extra == 2 && cp < 0x800) || (extra == 3 && cp < 0x10000) ||
            (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
            return false;
        }
        i += extra + 1;
    }
    return true;
}

} // namespace protocol
