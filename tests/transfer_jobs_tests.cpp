#include <gtest/gtest.h>
#include "core/transfer_jobs.h"
#include "core/progress_io.h"
#include "test_utils.h"

using namespace drive;
using drive::test::waitFor;

class TransferEngineTest : public drive::test::TempDirTest {
protected:
    TransferEngineTest() : engine(hub, smallChunks()) {}

    static UploadConfig smallChunks() {
        UploadConfig config;
        config.chunkSize = 16;
        return config;
    }

    Item fileItem(const std::string& id) {
        RemoteFile record = hub.get(id);
        Item item;
        item.id = record.id;
        item.name = record.name;
        item.isFolder = record.isFolder;
        item.size = record.size;
        return item;
    }

    // Reconciles until one job has finished
    JobCompletion waitForCompletion() {
        std::vector<JobCompletion> done;
        bool finished = waitFor([&] {
            done = engine.reconcile();
            return !done.empty();
        });
        EXPECT_TRUE(finished) << "job did not finish in time";
        if (done.empty()) {
            return {JobKind::Upload, {false, std::nullopt, "timeout"}};
        }
        return done.front();
    }

    drive::test::GatedHub hub;
    TransferEngine engine;
};

TEST_F(TransferEngineTest, DownloadWritesVerifiedFile) {
    std::string content(100, 'd');
    std::string id = hub.addFile("data.bin", content);
    hub.setReadChunkSize(7);

    EXPECT_FALSE(engine.startDownload(fileItem(id), root()).has_value());
    EXPECT_TRUE(engine.downloadActive());

    JobCompletion completion = waitForCompletion();
    EXPECT_EQ(completion.kind, JobKind::Download);
    EXPECT_TRUE(completion.outcome.ok) << completion.outcome.error;
    EXPECT_TRUE(engine.idle());
    EXPECT_EQ(readFile(root() / "data.bin"), content);
    EXPECT_EQ(fileNames(root()), std::vector<std::string>{"data.bin"});
}

TEST_F(TransferEngineTest, DownloadRefusesToOverwrite) {
    std::string id = hub.addFile("report.txt", "new");
    writeFile("report.txt", "old");

    ASSERT_FALSE(engine.startDownload(fileItem(id), root()).has_value());
    JobCompletion completion = waitForCompletion();

    EXPECT_FALSE(completion.outcome.ok);
    EXPECT_EQ(completion.outcome.kind, TransferError::Kind::Invalid);
    EXPECT_NE(completion.outcome.error.find("already exists"), std::string::npos);
    EXPECT_EQ(readFile(root() / "report.txt"), "old");
}

TEST_F(TransferEngineTest, ChecksumMismatchLeavesNoFiles) {
    std::string id = hub.addFile("broken.bin", "payload");
    hub.setReportedChecksum(id, std::string("abc123"));

    ASSERT_FALSE(engine.startDownload(fileItem(id), root()).has_value());
    JobCompletion completion = waitForCompletion();

    EXPECT_EQ(completion.outcome.kind, TransferError::Kind::Integrity);
    EXPECT_EQ(completion.outcome.error,
              "MD5 mismatch, expected: abc123, actual: " + md5Hex("payload"));
    EXPECT_TRUE(fileNames(root()).empty());
}

TEST_F(TransferEngineTest, MissingChecksumSkipsVerification) {
    std::string id = hub.addFile("plain.txt", "plain");
    hub.setReportedChecksum(id, std::nullopt);

    ASSERT_FALSE(engine.startDownload(fileItem(id), root()).has_value());
    JobCompletion completion = waitForCompletion();

    EXPECT_TRUE(completion.outcome.ok) << completion.outcome.error;
    EXPECT_EQ(readFile(root() / "plain.txt"), "plain");
}

TEST_F(TransferEngineTest, DownloadDestinationMustBeDirectory) {
    std::string id = hub.addFile("a.txt", "a");
    writeFile("not-a-dir", "x");

    ASSERT_FALSE(engine.startDownload(fileItem(id), root() / "missing").has_value());
    JobCompletion missing = waitForCompletion();
    EXPECT_EQ(missing.outcome.kind, TransferError::Kind::Invalid);
    EXPECT_NE(missing.outcome.error.find("does not exist"), std::string::npos);

    ASSERT_FALSE(engine.startDownload(fileItem(id), root() / "not-a-dir").has_value());
    JobCompletion notDir = waitForCompletion();
    EXPECT_NE(notDir.outcome.error.find("is not a directory"), std::string::npos);
}

TEST_F(TransferEngineTest, RemoteNamesCannotLeaveDestination) {
    std::filesystem::create_directory(root() / "dest");
    const std::vector<std::string> names = {
        "../escaped.txt",
        "..",
        "nested/inner.txt",
        (root() / "absolute.txt").string(),
    };

    for (const auto& name : names) {
        std::string id = hub.addFile(name, "pwned");
        ASSERT_FALSE(engine.startDownload(fileItem(id), root() / "dest").has_value());
        JobCompletion completion = waitForCompletion();

        EXPECT_EQ(completion.outcome.kind, TransferError::Kind::Invalid) << name;
        EXPECT_EQ(completion.outcome.error, "Invalid file name '" + name + "'");
    }

    EXPECT_EQ(fileNames(root()), std::vector<std::string>{"dest"});
    EXPECT_TRUE(fileNames(root() / "dest").empty());
}

TEST_F(TransferEngineTest, ExistingTemporaryFileIsLeftAlone) {
    std::string id = hub.addFile("a.txt", "remote bytes");
    hub.setReportedChecksum(id, std::string("abc123"));
    auto userFile = writeFile("dest/a.txt.incomplete", "user data");

    ASSERT_FALSE(engine.startDownload(fileItem(id), root() / "dest").has_value());
    JobCompletion completion = waitForCompletion();

    EXPECT_EQ(completion.outcome.kind, TransferError::Kind::Invalid);
    EXPECT_NE(completion.outcome.error.find("a.txt.incomplete' already exists"), std::string::npos);
    EXPECT_EQ(readFile(userFile), "user data");
    EXPECT_EQ(fileNames(root() / "dest"), std::vector<std::string>{"a.txt.incomplete"});

    // A verified download is refused as well instead of taking the file over
    hub.setReportedChecksum(id, md5Hex("remote bytes"));
    ASSERT_FALSE(engine.startDownload(fileItem(id), root() / "dest").has_value());
    EXPECT_FALSE(waitForCompletion().outcome.ok);
    EXPECT_EQ(readFile(userFile), "user data");
    EXPECT_FALSE(std::filesystem::exists(root() / "dest" / "a.txt"));
}

TEST(TransferErrorTest, KindsHaveDisplayNames) {
    EXPECT_STREQ(transferErrorKindStr(TransferError::Kind::Integrity), "Integrity error");
    EXPECT_STREQ(transferErrorKindStr(TransferError::Kind::Cancelled), "Cancelled");
    EXPECT_STREQ(transferErrorKindStr(TransferError::Kind::Remote), "Remote error");
}

TEST_F(TransferEngineTest, ShortcutsAreRejected) {
    std::string id = hub.addShortcut("Shared");

    ASSERT_FALSE(engine.startDownload(fileItem(id), root()).has_value());
    JobCompletion completion = waitForCompletion();

    EXPECT_EQ(completion.outcome.kind, TransferError::Kind::Invalid);
    EXPECT_EQ(completion.outcome.error, "Shortcuts are not supported in TUI download");
}

TEST_F(TransferEngineTest, RemoteFailureIsReported) {
    std::string id = hub.addFile("a.txt", "a");
    hub.failNext(MemoryHub::Operation::Read, "connection reset");

    ASSERT_FALSE(engine.startDownload(fileItem(id), root()).has_value());
    JobCompletion completion = waitForCompletion();

    EXPECT_EQ(completion.outcome.kind, TransferError::Kind::Remote);
    EXPECT_EQ(completion.outcome.error, "connection reset");
    EXPECT_TRUE(fileNames(root()).empty());
}

TEST_F(TransferEngineTest, FoldersAndMissingIdsAreNotStarted) {
    Item folder;
    folder.id = hub.addFolder("Docs");
    folder.name = "Docs";
    folder.isFolder = true;
    EXPECT_EQ(engine.startDownload(folder, root()), std::string("Select a file to download"));

    Item noId;
    noId.name = "ghost.txt";
    EXPECT_EQ(engine.startDownload(noId, root()), std::string("Missing file id"));
    EXPECT_TRUE(engine.idle());
}

TEST_F(TransferEngineTest, CancelledDownloadRemovesTemporaryFile) {
    std::string id = hub.addFile("slow.bin", std::string(64, 's'));
    hub.setReadChunkSize(8);
    hub.gateReads = true;

    ASSERT_FALSE(engine.startDownload(fileItem(id), root()).has_value());
    bool entered = hub.readGate.waitEntered();
    bool tempExists = std::filesystem::exists(root() / "slow.bin.incomplete");
    engine.cancelAll();
    EXPECT_TRUE(engine.downloadCancelRequested());
    hub.readGate.open();

    EXPECT_TRUE(entered);
    EXPECT_TRUE(tempExists);
    JobCompletion completion = waitForCompletion();
    EXPECT_TRUE(completion.outcome.cancelled());
    EXPECT_TRUE(fileNames(root()).empty());
}

TEST_F(TransferEngineTest, SecondJobOfSameKindIsRejected) {
    std::string id = hub.addFile("one.bin", "1111");
    hub.gateReads = true;

    EXPECT_FALSE(engine.startDownload(fileItem(id), root()).has_value());
    StartError second = engine.startDownload(fileItem(id), root());
    hub.readGate.open();

    EXPECT_EQ(second, std::string("Download already in progress"));
    JobCompletion completion = waitForCompletion();
    EXPECT_TRUE(completion.outcome.ok) << completion.outcome.error;
}

TEST_F(TransferEngineTest, UploadAndDownloadRunConcurrently) {
    std::string id = hub.addFile("remote.txt", "remote");
    auto local = writeFile("local/up.txt", "local");
    hub.gateUploads = true;

    EXPECT_FALSE(engine.startUpload(local, std::nullopt).has_value());
    EXPECT_FALSE(engine.startDownload(fileItem(id), root()).has_value());
    EXPECT_EQ(engine.startUpload(local, std::nullopt), std::string("Upload already in progress"));

    // Download finishes while the upload is still held at the gate
    JobCompletion first = waitForCompletion();
    EXPECT_EQ(first.kind, JobKind::Download);
    EXPECT_TRUE(engine.uploadActive());
    hub.uploadGate.open();

    JobCompletion second = waitForCompletion();
    EXPECT_EQ(second.kind, JobKind::Upload);
    EXPECT_TRUE(second.outcome.ok) << second.outcome.error;
    EXPECT_TRUE(hub.findChild(std::nullopt, "up.txt").has_value());
}

TEST_F(TransferEngineTest, SingleFileUploadLandsInParentFolder) {
    std::string folder = hub.addFolder("Inbox");
    auto local = writeFile("note.txt", std::string(50, 'n'));

    ASSERT_FALSE(engine.startUpload(local, folder).has_value());
    JobCompletion completion = waitForCompletion();

    ASSERT_TRUE(completion.outcome.ok) << completion.outcome.error;
    auto uploaded = hub.findChild(folder, "note.txt");
    ASSERT_TRUE(uploaded.has_value());
    EXPECT_EQ(hub.contentOf(uploaded->id), std::string(50, 'n'));
}

TEST_F(TransferEngineTest, DirectoryUploadCreatesParentsFirst) {
    writeFile("album/cover.jpg", "jpg");
    writeFile("album/disc1/track1.mp3", "one");
    writeFile("album/disc1/track2.mp3", "two");
    writeFile("album/disc2/track1.mp3", "uno");

    ASSERT_FALSE(engine.startUpload(root() / "album", std::nullopt).has_value());
    JobCompletion completion = waitForCompletion();
    ASSERT_TRUE(completion.outcome.ok) << completion.outcome.error;

    auto album = hub.findChild(std::nullopt, "album");
    ASSERT_TRUE(album.has_value());
    auto disc1 = hub.findChild(album->id, "disc1");
    auto disc2 = hub.findChild(album->id, "disc2");
    ASSERT_TRUE(disc1.has_value());
    ASSERT_TRUE(disc2.has_value());
    EXPECT_TRUE(hub.findChild(album->id, "cover.jpg").has_value());
    auto track = hub.findChild(disc2->id, "track1.mp3");
    ASSERT_TRUE(track.has_value());
    EXPECT_EQ(hub.contentOf(track->id), "uno");

    // Every object is committed after the folder that contains it
    auto ops = hub.operations();
    ASSERT_EQ(ops.size(), 7u);
    std::vector<std::string> committed;
    for (const auto& op : ops) {
        std::string objectId = op.substr(op.find(':') + 1);
        auto parent = hub.parentOf(objectId);
        if (parent) {
            EXPECT_NE(std::find(committed.begin(), committed.end(), "mkdir:" + *parent),
                      committed.end()) << op;
        }
        committed.push_back(op);
    }
}

TEST_F(TransferEngineTest, DirectoryUploadReportsFileCounts) {
    writeFile("batch/a.txt", "a");
    writeFile("batch/b.txt", "b");
    writeFile("batch/sub/c.txt", "c");
    hub.gateUploads = true;

    ASSERT_FALSE(engine.startUpload(root() / "batch", std::nullopt).has_value());
    bool entered = hub.uploadGate.waitEntered();
    engine.reconcile();
    const UploadProgress* progress = engine.uploadProgress();
    std::optional<uint64_t> totalFiles = progress ? progress->totalFiles : std::nullopt;
    std::optional<std::string> currentFile = progress ? progress->currentFile : std::nullopt;
    hub.uploadGate.open();

    EXPECT_TRUE(entered);
    EXPECT_EQ(totalFiles, 3u);
    EXPECT_EQ(currentFile, (std::filesystem::path("batch") / "a.txt").string());

    JobCompletion completion = waitForCompletion();
    EXPECT_TRUE(completion.outcome.ok) << completion.outcome.error;
    EXPECT_EQ(engine.uploadProgress(), nullptr);
}

TEST_F(TransferEngineTest, CancelledUploadKeepsCompletedSteps) {
    writeFile("partial/a.txt", "a");
    writeFile("partial/b.txt", "b");
    hub.gateUploads = true;

    ASSERT_FALSE(engine.startUpload(root() / "partial", std::nullopt).has_value());
    bool entered = hub.uploadGate.waitEntered();
    engine.cancelAll();
    hub.uploadGate.open();

    EXPECT_TRUE(entered);
    JobCompletion completion = waitForCompletion();
    EXPECT_TRUE(completion.outcome.cancelled());

    auto folder = hub.findChild(std::nullopt, "partial");
    ASSERT_TRUE(folder.has_value());
    EXPECT_FALSE(hub.findChild(folder->id, "a.txt").has_value());
    EXPECT_FALSE(hub.findChild(folder->id, "b.txt").has_value());
}

TEST_F(TransferEngineTest, UploadRetriesTransientFailures) {
    auto local = writeFile("flaky.bin", std::string(40, 'f'));
    hub.failNextUploadChunks(3);

    ASSERT_FALSE(engine.startUpload(local, std::nullopt).has_value());
    JobCompletion completion = waitForCompletion();

    EXPECT_TRUE(completion.outcome.ok) << completion.outcome.error;
    EXPECT_EQ(hub.uploadRetries(), 3);
    auto uploaded = hub.findChild(std::nullopt, "flaky.bin");
    ASSERT_TRUE(uploaded.has_value());
    EXPECT_EQ(hub.contentOf(uploaded->id), std::string(40, 'f'));
}

TEST_F(TransferEngineTest, UploadOfMissingPathFails) {
    ASSERT_FALSE(engine.startUpload(root() / "nothing-here", std::nullopt).has_value());
    JobCompletion completion = waitForCompletion();

    EXPECT_EQ(completion.outcome.kind, TransferError::Kind::Invalid);
    EXPECT_NE(completion.outcome.error.find("does not exist"), std::string::npos);
}

TEST_F(TransferEngineTest, DroppedEngineCancelsAndJoinsJobs) {
    std::string id = hub.addFile("big.bin", std::string(1024, 'b'));
    hub.setReadChunkSize(1);
    hub.setReadDelay(std::chrono::milliseconds(1));

    {
        TransferEngine scoped(hub, UploadConfig{});
        ASSERT_FALSE(scoped.startDownload(fileItem(id), root()).has_value());
    }

    EXPECT_TRUE(fileNames(root()).empty());
}
