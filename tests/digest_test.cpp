#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "digest.hpp"
#include "test_streams.hpp"

TEST(DigestTest, EmptyInputMatchesReferenceValue)
{
    EXPECT_EQ(digest::blake2b_hex({}), "0e5751c026e543b2e8ab2eb06099daa1d1e5df47778f7787faab45cdf12fe3a8");
}

TEST(DigestTest, IncrementalMatchesOneShot)
{
    const std::vector<uint8_t> data = testing_support::pattern_bytes(100000);
    digest::Blake2bHasher hasher;
    for (std::size_t offset = 0; offset < data.size(); offset += 4099) {
        hasher.update(data.data() + offset, std::min<std::size_t>(4099, data.size() - offset));
    }
    const std::string hex = hasher.finish_hex();
    EXPECT_EQ(hex, digest::blake2b_hex(data));
    EXPECT_EQ(hex.size(), 64u);
    EXPECT_THROW(hasher.finish_hex(), std::logic_error);
}

TEST(DigestTest, FileDigestMatchesBuffer)
{
    const std::vector<uint8_t> data = testing_support::pattern_bytes(70000);
    const std::filesystem::path path = std::filesystem::temp_directory_path() / "labxfer_digest_test.bin";
    {
        std::ofstream out(path, std::ios::binary);
        out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    }
    EXPECT_EQ(digest::file_blake2b_hex(path), digest::blake2b_hex(data));
    EXPECT_NE(digest::blake2b_hex(data), digest::blake2b_hex(testing_support::to_bytes("other")));
    std::filesystem::remove(path);
}
