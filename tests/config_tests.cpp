#include <gtest/gtest.h>
#include "config.h"
#include "test_utils.h"

using namespace drive;

TEST(ConfigTest, DefaultsMatchServiceLimits) {
    Config config;
    EXPECT_EQ(config.chunkSize, 8u * 1024 * 1024);
    EXPECT_EQ(config.maxRetries, 100000);
    EXPECT_EQ(config.maxFiles, 1000u);
    EXPECT_EQ(config.theme, "Default");
    EXPECT_TRUE(config.logFile.empty());

    UploadConfig upload = config.uploadConfig();
    EXPECT_EQ(upload.chunkSize, 8u * 1024 * 1024);
    EXPECT_EQ(upload.minBackoff, std::chrono::seconds(1));
    EXPECT_EQ(upload.maxBackoff, std::chrono::seconds(60));
}

TEST(ConfigTest, ParsesKeyValueLines) {
    Config config = Config::parse(
        "# drive-tui settings\n"
        "[upload]\n"
        "chunk_size = 524288\n"
        "max_retries=5\n"
        "  min_backoff_secs = 2  \n"
        "max_backoff_secs = 30\n"
        "\n"
        "[ui]\n"
        "theme = Nord\n"
        "poll_interval_ms = 100\n"
        "blink_interval_ms = 750\n"
        "max_files = 200\n"
        "log_file = /tmp/drive-tui.log\n"
        "log_level = debug\n");

    EXPECT_TRUE(config.warnings.empty());
    EXPECT_EQ(config.chunkSize, 524288u);
    EXPECT_EQ(config.maxRetries, 5);
    EXPECT_EQ(config.minBackoffSecs, 2);
    EXPECT_EQ(config.maxBackoffSecs, 30);
    EXPECT_EQ(config.theme, "Nord");
    EXPECT_EQ(config.pollInterval(), std::chrono::milliseconds(100));
    EXPECT_EQ(config.blinkInterval(), std::chrono::milliseconds(750));
    EXPECT_EQ(config.maxFiles, 200u);
    EXPECT_EQ(config.logFile, "/tmp/drive-tui.log");
    EXPECT_EQ(config.logLevel, "debug");
}

TEST(ConfigTest, ChunkSizeMustBeAlignedTo256KiB) {
    Config config = Config::parse("chunk_size = 100000\n");
    EXPECT_EQ(config.chunkSize, 8u * 1024 * 1024);
    ASSERT_EQ(config.warnings.size(), 1u);
    EXPECT_NE(config.warnings[0].find("262144"), std::string::npos);
}

TEST(ConfigTest, InvalidValuesKeepDefaults) {
    Config config = Config::parse(
        "max_retries = lots\n"
        "max_files = 0\n"
        "log_level = chatty\n"
        "colour = blue\n"
        "this line has no separator\n");

    EXPECT_EQ(config.maxRetries, 100000);
    EXPECT_EQ(config.maxFiles, 1000u);
    EXPECT_EQ(config.logLevel, "info");
    EXPECT_EQ(config.warnings.size(), 5u);
}

TEST(ConfigTest, InvertedBackoffFallsBackToDefaults) {
    Config config = Config::parse("min_backoff_secs = 90\nmax_backoff_secs = 10\n");
    EXPECT_EQ(config.minBackoffSecs, 1);
    EXPECT_EQ(config.maxBackoffSecs, 60);
    EXPECT_EQ(config.warnings.size(), 1u);
}

class ConfigFileTest : public drive::test::TempDirTest {};

TEST_F(ConfigFileTest, MissingFileYieldsDefaults) {
    Config config = Config::load(root() / "absent.ini");
    EXPECT_TRUE(config.warnings.empty());
    EXPECT_EQ(config.maxFiles, 1000u);
}

TEST_F(ConfigFileTest, LoadsFromDisk) {
    auto path = writeFile("drive-tui.ini", "theme = Dracula\nmax_files = 50\n");
    Config config = Config::load(path);
    EXPECT_EQ(config.theme, "Dracula");
    EXPECT_EQ(config.maxFiles, 50u);
}
