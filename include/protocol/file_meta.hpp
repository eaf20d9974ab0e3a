#pragma once

#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace protocol {

// Receipt for one completed transfer. Never sent on the wire; the header
// only carries filename and size.
struct FileInfo {
    std::string filename;
    uint64_t size;
    std::string blake2b;
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(FileInfo, filename, size, blake2b)

} // namespace protocol
