#pragma once

#include <string>
#include <cstdint>
#include <vector>
#include <filesystem>
#include <sodium.h>

namespace digest {

// Incremental BLAKE2b-256 (libsodium crypto_generichash).
// Lets both peers log a fingerprint of the payload for out-of-band comparison.
class Blake2bHasher {
public:
    Blake2bHasher();

    void update(const uint8_t* data, std::size_t size);
    // Returns the 32-byte digest as lowercase hex. The hasher is spent afterwards.
    std::string finish_hex();

private:
    crypto_generichash_state state_;
    bool finished_ = false;
};

std::string blake2b_hex(const std::vector<uint8_t>& data);
std::string file_blake2b_hex(const std::filesystem::path& path);

} // namespace digest
