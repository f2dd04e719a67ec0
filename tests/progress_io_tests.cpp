#include <gtest/gtest.h>
#include "core/progress_io.h"
#include "core/channel.h"
#include "test_utils.h"
#include <sstream>
#include <thread>
#include <vector>

using namespace drive;

TEST(Md5Test, KnownVectors) {
    EXPECT_EQ(md5Hex(""), "d41d8cd98f00b204e9800998ecf8427e");
    EXPECT_EQ(md5Hex("abc"), "900150983cd24fb0d6963f7d28e17f72");
    EXPECT_EQ(md5Hex("The quick brown fox jumps over the lazy dog"),
              "9e107d9d372bb6826bd81d3542a419d6");
}

class Md5WriterTest : public drive::test::TempDirTest {};

TEST_F(Md5WriterTest, DigestCoversEveryChunk) {
    auto path = root() / "out.bin";
    Md5Writer writer(path);
    writer.write("The quick brown fox ");
    writer.write("jumps over the lazy dog");
    writer.close();

    EXPECT_EQ(writer.bytesWritten(), 43u);
    EXPECT_EQ(writer.md5(), "9e107d9d372bb6826bd81d3542a419d6");
    EXPECT_EQ(readFile(path), "The quick brown fox jumps over the lazy dog");
}

TEST_F(Md5WriterTest, DigestCanOnlyBeTakenOnce) {
    Md5Writer writer(root() / "once.bin");
    writer.close();
    EXPECT_EQ(writer.md5(), "d41d8cd98f00b204e9800998ecf8427e");
    EXPECT_THROW(writer.md5(), TransferError);
}

TEST_F(Md5WriterTest, UnwritableDestinationIsIoError) {
    try {
        Md5Writer writer(root() / "missing" / "out.bin");
        FAIL() << "expected TransferError";
    } catch (const TransferError& e) {
        EXPECT_EQ(e.kind(), TransferError::Kind::Io);
    }
}

TEST(ProgressReaderTest, ReportsBytesAsTheyAreRead) {
    std::istringstream source(std::string(100, 'x'));
    std::vector<uint64_t> reports;
    ProgressReader reader(source, CancelToken(), [&](uint64_t bytes) { reports.push_back(bytes); });

    char buffer[40];
    EXPECT_EQ(reader.read(buffer, 40), 40u);
    EXPECT_EQ(reader.read(buffer, 40), 40u);
    EXPECT_EQ(reader.read(buffer, 40), 20u);
    EXPECT_EQ(reader.read(buffer, 40), 0u);

    EXPECT_EQ(reports, (std::vector<uint64_t>{40, 80, 100}));
}

TEST(ProgressReaderTest, ProgressNeverGoesBackwardsAfterSeek) {
    std::istringstream source(std::string(100, 'x'));
    std::vector<uint64_t> reports;
    ProgressReader reader(source, CancelToken(), [&](uint64_t bytes) { reports.push_back(bytes); });

    char buffer[60];
    reader.read(buffer, 60);
    EXPECT_EQ(reader.seek(20), 20u);
    EXPECT_EQ(reader.position(), 20u);
    reader.read(buffer, 60);   // back at 80
    reader.read(buffer, 60);   // 100

    // The rewind to 20 is never reported
    EXPECT_EQ(reports, (std::vector<uint64_t>{60, 80, 100}));
    EXPECT_EQ(reader.reported(), 100u);
}

TEST(ProgressReaderTest, SeekAfterEndOfStreamRereadsData) {
    std::istringstream source("abcdef");
    ProgressReader reader(source, CancelToken(), nullptr);

    char buffer[16];
    EXPECT_EQ(reader.read(buffer, sizeof(buffer)), 6u);
    reader.seek(2);
    ASSERT_EQ(reader.read(buffer, sizeof(buffer)), 4u);
    EXPECT_EQ(std::string(buffer, 4), "cdef");
}

TEST(ProgressReaderTest, CancelledTokenStopsReadAndSeek) {
    std::istringstream source("abcdef");
    CancelToken cancel;
    ProgressReader reader(source, cancel, nullptr);

    char buffer[4];
    EXPECT_EQ(reader.read(buffer, 2), 2u);
    cancel.cancel();

    try {
        reader.read(buffer, 2);
        FAIL() << "expected TransferError";
    } catch (const TransferError& e) {
        EXPECT_EQ(e.kind(), TransferError::Kind::Cancelled);
    }
    EXPECT_THROW(reader.seek(0), TransferError);
}

TEST(CancelTokenTest, CopiesShareTheFlag) {
    CancelToken token;
    CancelToken copy = token;
    EXPECT_FALSE(copy.cancelled());
    token.cancel();
    EXPECT_TRUE(copy.cancelled());
    EXPECT_THROW(copy.throwIfCancelled(), TransferError);
}

TEST(ChannelTest, ConsumesInOrder) {
    Channel<int> channel;
    EXPECT_TRUE(channel.empty());
    channel.produce(1);
    channel.produce(2);
    EXPECT_EQ(channel.size(), 2u);

    int value = 0;
    EXPECT_TRUE(channel.consume(value));
    EXPECT_EQ(value, 1);
    EXPECT_TRUE(channel.consume(value));
    EXPECT_EQ(value, 2);
    EXPECT_FALSE(channel.consume(value));
}

TEST(ChannelTest, DrainLatestKeepsOnlyTheNewestSnapshot) {
    Channel<int> channel;
    int value = -1;
    EXPECT_FALSE(channel.drainLatest(value));
    EXPECT_EQ(value, -1);

    for (int i = 0; i < 5; ++i) channel.produce(i);
    EXPECT_TRUE(channel.drainLatest(value));
    EXPECT_EQ(value, 4);
    EXPECT_TRUE(channel.empty());
}

TEST(ChannelTest, ProducerThreadSnapshotsArriveMonotonic) {
    Channel<int> channel;
    std::thread producer([&] {
        for (int i = 1; i <= 1000; ++i) channel.produce(i);
    });

    int last = 0;
    int value = 0;
    while (last < 1000) {
        if (channel.drainLatest(value)) {
            EXPECT_GT(value, last);
            last = value;
        }
    }
    producer.join();
    EXPECT_EQ(last, 1000);
}
