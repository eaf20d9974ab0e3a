#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include "logger.hpp"
#include "protocol/byte_stream.hpp"
#include "transfer.hpp"

namespace transfer {

// Connected -> NameExchanged -> SizeExchanged -> BodyTransferred -> Done.
// A failed step leaves the phase where it was; there is no way back.
enum class TransferPhase {
    CONNECTED,
    NAME_EXCHANGED,
    SIZE_EXCHANGED,
    BODY_TRANSFERRED,
    DONE
};

const char* to_string(TransferPhase phase);

// An empty name line is a legal frame. The receiver decides what it means.
enum class EmptyNamePolicy {
    ACCEPT,
    REJECT
};

struct ReceivedFile {
    std::string name;
    uint64_t size = 0;
    std::vector<uint8_t> data;
    // Set by receive_to_directory; data stays empty in that case.
    std::filesystem::path path;
};

// Sends one file over an already connected stream. One use per instance,
// failed or not: a second call throws std::logic_error.
class FileSender {
public:
    FileSender(protocol::ByteStream& stream, logging::Logger& logger, TransferOptions options = {});

    void send(const std::string& name, const std::vector<uint8_t>& payload);
    // Announces the file under name, or under its base name if name is empty.
    void send_file(const std::filesystem::path& filepath, const std::string& name = "");

    TransferPhase phase() const { return phase_; }

private:
    void send_header(const std::string& name, uint64_t size);
    void claim();

    protocol::ByteStream& stream_;
    logging::Logger& logger_;
    TransferOptions options_;
    TransferPhase phase_ = TransferPhase::CONNECTED;
    bool used_ = false;
};

// Receives one file from an already connected stream. One use per instance.
class FileReceiver {
public:
    FileReceiver(protocol::ByteStream& stream, logging::Logger& logger, TransferOptions options = {},
                 EmptyNamePolicy empty_name_policy = EmptyNamePolicy::ACCEPT);

    ReceivedFile receive();
    // Writes into directory/<base name of the announced name>. Names that do
    // not reduce to a plain file name are MalformedHeader.
    ReceivedFile receive_to_directory(const std::filesystem::path& directory);

    TransferPhase phase() const { return phase_; }

private:
    std::string receive_name(EmptyNamePolicy policy);
    uint64_t receive_size();
    TransferOptions body_options(const std::string& name) const;
    void claim();

    protocol::ByteStream& stream_;
    logging::Logger& logger_;
    TransferOptions options_;
    EmptyNamePolicy empty_name_policy_;
    TransferPhase phase_ = TransferPhase::CONNECTED;
    bool used_ = false;
};

} // namespace transfer
