#include "digest.hpp"
#include <fstream>
#include <stdexcept>

namespace digest {

namespace {

void ensure_sodium() {
    if (sodium_init() < 0) {
        throw std::runtime_error("libsodium initialization failed");
    }
}

} // namespace

Blake2bHasher::Blake2bHasher() {
    ensure_sodium();
    crypto_generichash_init(&state_, nullptr, 0, crypto_generichash_BYTES);
}

void Blake2bHasher::update(const uint8_t* data, std::size_t size) {
    if (finished_) {
        throw std::logic_error("Blake2bHasher::update after finish_hex");
    }
    crypto_generichash_update(&state_, data, size);
}

std::string Blake2bHasher::finish_hex() {
    if (finished_) {
        throw std::logic_error("Blake2bHasher::finish_hex called twice");
    }
    finished_ = true;

    unsigned char hash[crypto_generichash_BYTES]; // 32 bytes
    crypto_generichash_final(&state_, hash, sizeof(hash));

    char hex[crypto_generichash_BYTES * 2 + 1];
    sodium_bin2hex(hex, sizeof(hex), hash, sizeof(hash));
    return std::string(hex);
}

std::string blake2b_hex(const std::vector<uint8_t>& data) {
    Blake2bHasher hasher;
    hasher.update(data.data(), data.size());
    return hasher.finish_hex();
}

std::string file_blake2b_hex(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open file for hashing: " + path.string());
    }

    Blake2bHasher hasher;
    std::vector<char> buffer(64 * 1024);
    while (file.read(buffer.data(), buffer.size()) || file.gcount() > 0) {
        hasher.update(reinterpret_cast<const uint8_t*>(buffer.data()), static_cast<std::size_t>(file.gcount()));
    }
    return hasher.finish_hex();
}

} // namespace digest
