#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <filesystem>
#include <fstream>
#include <iterator>
#include "protocol/errors.hpp"
#include "test_streams.hpp"
#include "transfer.hpp"

using testing_support::RecordingLogger;
using testing_support::ScriptedStream;
using testing_support::pattern_bytes;
using testing_support::to_bytes;
using transfer::MessageReceiver;
using transfer::MessageSender;

namespace fs = std::filesystem;

class TransferTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        workdir_ = fs::temp_directory_path() /
                   ("labxfer_transfer_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(workdir_);
        fs::create_directories(workdir_);
    }

    void TearDown() override
    {
        std::error_code ec;
        fs::remove_all(workdir_, ec);
    }

    static std::string read_file(const fs::path& p)
    {
        std::ifstream in(p, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    fs::path workdir_;
    RecordingLogger logger_;
};

TEST_F(TransferTest, ReceiveBodyRequestsBoundedChunks)
{
    ScriptedStream stream("hello");
    std::vector<uint8_t> body = MessageReceiver::receive_body(stream, 2, 5, logger_);
    EXPECT_EQ(body, to_bytes("hello"));
    EXPECT_EQ(stream.requested, (std::vector<std::size_t>{2, 2, 1}));
}

TEST_F(TransferTest, PartialReadsNeverOvershootDeclaredSize)
{
    // Peer hands out at most 3 bytes per read; the engine asks for 4.
    ScriptedStream stream("0123456789TRAILING", 3);
    std::vector<uint8_t> body = MessageReceiver::receive_body(stream, 4, 10, logger_);
    EXPECT_EQ(body, to_bytes("0123456789"));
    EXPECT_EQ(stream.requested, (std::vector<std::size_t>{4, 4, 4, 1}));

    uint64_t received = 0;
    for (std::size_t i = 0; i < stream.returned.size(); ++i) {
        EXPECT_LE(stream.requested[i], 10 - received);
        received += stream.returned[i];
        EXPECT_LE(received, 10u);
    }
    EXPECT_EQ(stream.remaining(), "TRAILING");
}

TEST_F(TransferTest, ChunkSizeDoesNotChangeBody)
{
    const std::vector<uint8_t> payload = pattern_bytes(1000);
    const std::string wire(payload.begin(), payload.end());
    for (std::size_t chunk : {std::size_t{1}, std::size_t{17}, payload.size(), std::size_t{4096}}) {
        ScriptedStream stream(wire, 7);
        EXPECT_EQ(MessageReceiver::receive_body(stream, chunk, payload.size(), logger_), payload)
            << "chunk size " << chunk;
    }
}

TEST_F(TransferTest, ZeroDeclaredSizeReadsNothing)
{
    ScriptedStream stream("next");
    EXPECT_TRUE(MessageReceiver::receive_body(stream, 8, 0, logger_).empty());
    EXPECT_TRUE(stream.requested.empty());
}

TEST_F(TransferTest, ZeroChunkSizeIsRejected)
{
    ScriptedStream stream("abc");
    EXPECT_THROW(MessageReceiver::receive_body(stream, 0, 3, logger_), std::invalid_argument);
}

TEST_F(TransferTest, PrematureCloseReportsBytesReceived)
{
    ScriptedStream stream("abc");
    try {
        MessageReceiver::receive_body(stream, 2, 10, logger_);
        FAIL() << "expected ConnectionLost";
    } catch (const protocol::ConnectionLost& e) {
        EXPECT_EQ(e.bytes_transferred(), 3u);
        EXPECT_EQ(e.bytes_expected(), 10u);
    }
}

TEST_F(TransferTest, ProgressIsMonotonicAndEndsAtTotal)
{
    std::vector<uint64_t> seen;
    transfer::TransferOptions options;
    options.progress_interval = std::chrono::milliseconds(0);
    options.progress_cb = [&seen](const std::string&, uint64_t done, uint64_t total, double) {
        EXPECT_EQ(total, 300u);
        seen.push_back(done);
    };
    ScriptedStream stream(std::string(300, 'z'), 11);
    MessageReceiver::receive_body(stream, 32, 300, logger_, options);

    // One report per read: 27 reads of 11 bytes, then the last 3.
    ASSERT_EQ(seen.size(), 28u);
    EXPECT_EQ(seen.front(), 11u);
    EXPECT_EQ(seen.back(), 300u);
    EXPECT_TRUE(std::adjacent_find(seen.begin(), seen.end(), std::greater_equal<uint64_t>()) == seen.end());

    std::vector<uint64_t> totals;
    uint64_t sum = 0;
    for (std::size_t n : stream.returned) {
        sum += n;
        totals.push_back(sum);
    }
    EXPECT_EQ(seen, totals);
}

TEST_F(TransferTest, CancelFlagStopsBetweenChunks)
{
    std::atomic<bool> cancel{true};
    transfer::TransferOptions options;
    options.cancel_flag = &cancel;
    ScriptedStream stream("abcdef");
    EXPECT_THROW(MessageReceiver::receive_body(stream, 2, 6, logger_, options), protocol::TransferCancelled);
    EXPECT_TRUE(stream.requested.empty());
}

TEST_F(TransferTest, ReceiveFileSizeParsesLine)
{
    ScriptedStream stream("4096\n");
    EXPECT_EQ(MessageReceiver::receive_file_size(stream, logger_), 4096u);
}

TEST_F(TransferTest, ReceiveFileSizeRejectsText)
{
    ScriptedStream stream("abc\n");
    EXPECT_THROW(MessageReceiver::receive_file_size(stream, logger_), protocol::MalformedHeader);
}

TEST_F(TransferTest, ReceiveFileSizeOnClosedStreamIsConnectionLost)
{
    ScriptedStream stream("12");
    EXPECT_THROW(MessageReceiver::receive_file_size(stream, logger_), protocol::ConnectionLost);
}

TEST_F(TransferTest, ReceiveFileNameRejectsInvalidUtf8)
{
    ScriptedStream stream("bad\xFF.txt\n");
    EXPECT_THROW(MessageReceiver::receive_file_name(stream, logger_), protocol::MalformedHeader);
}

TEST_F(TransferTest, SendBodyWritesInChunks)
{
    ScriptedStream stream("");
    transfer::TransferOptions options;
    options.chunk_size = 4;
    MessageSender::send_body(stream, "x.bin", to_bytes("0123456789"), logger_, options);
    EXPECT_EQ(stream.written, "0123456789");
    EXPECT_EQ(stream.write_sizes, (std::vector<std::size_t>{4, 4, 2}));
}

TEST_F(TransferTest, SendBodyReportsBytesWrittenBeforeLoss)
{
    ScriptedStream stream("");
    stream.write_limit = 6;
    transfer::TransferOptions options;
    options.chunk_size = 4;
    try {
        MessageSender::send_body(stream, "x.bin", to_bytes("0123456789"), logger_, options);
        FAIL() << "expected ConnectionLost";
    } catch (const protocol::ConnectionLost& e) {
        EXPECT_EQ(e.bytes_transferred(), 6u);
        EXPECT_EQ(e.bytes_expected(), 10u);
    }
}

TEST_F(TransferTest, SendFileStreamsFromDisk)
{
    const fs::path src = workdir_ / "payload.bin";
    {
        std::ofstream out(src, std::ios::binary);
        out << "file contents on disk";
    }
    ScriptedStream stream("");
    transfer::TransferOptions options;
    options.chunk_size = 5;
    EXPECT_EQ(MessageSender::send_file(stream, src, fs::file_size(src), logger_, options), fs::file_size(src));
    EXPECT_EQ(stream.written, "file contents on disk");
}

TEST_F(TransferTest, ReceiveFileRenamesPartOnSuccess)
{
    const fs::path dst = workdir_ / "nested" / "out.bin";
    ScriptedStream stream("payload-bytes", 4);
    MessageReceiver::receive_file(stream, dst, 3, 13, logger_);

    EXPECT_EQ(read_file(dst), "payload-bytes");
    EXPECT_FALSE(fs::exists(workdir_ / "nested" / "out.bin.part"));
}

TEST_F(TransferTest, ReceiveFileRemovesPartOnFailure)
{
    const fs::path dst = workdir_ / "out.bin";
    ScriptedStream stream("short");
    EXPECT_THROW(MessageReceiver::receive_file(stream, dst, 3, 100, logger_), protocol::ConnectionLost);
    EXPECT_FALSE(fs::exists(dst));
    EXPECT_FALSE(fs::exists(workdir_ / "out.bin.part"));
}
