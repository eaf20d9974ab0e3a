#include "orchestrator.hpp"
#include "digest.hpp"
#include "networking.hpp"
#include "protocol/errors.hpp"
#include <stdexcept>

namespace transfer {

const char* to_string(TransferPhase phase) {
    switch (phase) {
        case TransferPhase::CONNECTED: return "connected";
        case TransferPhase::NAME_EXCHANGED: return "name exchanged";
        case TransferPhase::SIZE_EXCHANGED: return "size exchanged";
        case TransferPhase::BODY_TRANSFERRED: return "body transferred";
        case TransferPhase::DONE: return "done";
    }
    return "unknown";
}

// ─── FileSender ─────────────────────────────────────────────────────────────

FileSender::FileSender(protocol::ByteStream& stream, logging::Logger& logger, TransferOptions options)
    : stream_(stream), logger_(logger), options_(std::move(options)) {}

// Claimed on entry, so a call that failed part way still counts as the one use.
void FileSender::claim() {
    if (used_) {
        throw std::logic_error("FileSender already used; open a new session for the next file");
    }
    used_ = true;
}

void FileSender::send_header(const std::string& name, uint64_t size) {
    MessageSender::send_file_name(stream_, name, logger_, options_);
    phase_ = TransferPhase::NAME_EXCHANGED;

    MessageSender::send_file_size(stream_, size, logger_, options_);
    phase_ = TransferPhase::SIZE_EXCHANGED;
}

void FileSender::send(const std::string& name, const std::vector<uint8_t>& payload) {
    claim();
    send_header(name, payload.size());

    MessageSender::send_body(stream_, name, payload, logger_, options_);
    phase_ = TransferPhase::BODY_TRANSFERRED;

    logger_.info("Sent " + name + " blake2b=" + digest::blake2b_hex(payload));
    phase_ = TransferPhase::DONE;
}

void FileSender::send_file(const std::filesystem::path& filepath, const std::string& name) {
    claim();

    std::string announced = name.empty() ? filepath.filename().string() : name;
    uint64_t size = std::filesystem::file_size(filepath);
    std::string checksum = digest::file_blake2b_hex(filepath);

    send_header(announced, size);

    MessageSender::send_file(stream_, filepath, size, logger_, options_);
    phase_ = TransferPhase::BODY_TRANSFERRED;

    logger_.info("Sent " + announced + " (" + networking::format_size(size) + ") blake2b=" + checksum);
    phase_ = TransferPhase::DONE;
}

// ─── FileReceiver ───────────────────────────────────────────────────────────

FileReceiver::FileReceiver(protocol::ByteStream& stream, logging::Logger& logger, TransferOptions options,
                           EmptyNamePolicy empty_name_policy)
    : stream_(stream), logger_(logger), options_(std::move(options)), empty_name_policy_(empty_name_policy) {}

void FileReceiver::claim() {
    if (used_) {
        throw std::logic_error("FileReceiver already used; open a new session for the next file");
    }
    used_ = true;
}

std::string FileReceiver::receive_name(EmptyNamePolicy policy) {
    protocol::LineResult name = MessageReceiver::receive_file_name(stream_, logger_, options_);
    if (name.closed()) {
        throw protocol::ConnectionLost("name");
    }
    if (name.text.empty() && policy == EmptyNamePolicy::REJECT) {
        logger_.debug("Rejecting empty file name.");
        throw protocol::MalformedHeader("name", name.text);
    }
    return name.text;
}

uint64_t FileReceiver::receive_size() {
    uint64_t size = MessageReceiver::receive_file_size(stream_, logger_, options_);
    phase_ = TransferPhase::SIZE_EXCHANGED;
    return size;
}

TransferOptions FileReceiver::body_options(const std::string& name) const {
    TransferOptions options = options_;
    if (options_.progress_cb) {
        TransferProgressCallback progress_cb = options_.progress_cb;
        options.progress_cb = [progress_cb, name](const std::string&, uint64_t done, uint64_t total, double speed) {
            progress_cb(name, done, total, speed);
        };
    }
    return options;
}

ReceivedFile FileReceiver::receive() {
    claim();

    ReceivedFile file;
    file.name = receive_name(empty_name_policy_);
    phase_ = TransferPhase::NAME_EXCHANGED;

    file.size = receive_size();

    file.data = MessageReceiver::receive_body(stream_, options_.chunk_size, file.size, logger_,
                                              body_options(file.name));
    phase_ = TransferPhase::BODY_TRANSFERRED;

    logger_.info("Received " + file.name + " blake2b=" + digest::blake2b_hex(file.data));
    phase_ = TransferPhase::DONE;
    return file;
}

ReceivedFile FileReceiver::receive_to_directory(const std::filesystem::path& directory) {
    claim();

    ReceivedFile file;
    file.name = receive_name(EmptyNamePolicy::REJECT);

    // Only the last component is used so a peer cannot write outside directory.
    std::string base = std::filesystem::path(file.name).filename().string();
    if (base.empty() || base == "." || base == "..") {
        throw protocol::MalformedHeader("name", file.name);
    }
    if (base != file.name) {
        logger_.info("Stripping directories from announced name " + file.name);
    }
    phase_ = TransferPhase::NAME_EXCHANGED;

    file.size = receive_size();
    file.path = directory / base;

    MessageReceiver::receive_file(stream_, file.path, options_.chunk_size, file.size, logger_,
                                  body_options(base));
    phase_ = TransferPhase::BODY_TRANSFERRED;

    logger_.info("Received " + file.path.string() + " blake2b=" + digest::file_blake2b_hex(file.path));
    phase_ = TransferPhase::DONE;
    return file;
}

} // namespace transfer
