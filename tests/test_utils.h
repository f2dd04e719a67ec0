#ifndef DRIVE_TUI_TESTS_TEST_UTILS_H
#define DRIVE_TUI_TESTS_TEST_UTILS_H

#include "core/memory_hub.h"
#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <functional>
#include <mutex>
#include <random>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace drive {
namespace test {

namespace fs = std::filesystem;

// Scratch directory removed at the end of each test
class TempDirTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::random_device rd;
        std::mt19937_64 gen(rd());
        root_ = fs::temp_directory_path() / ("drive-tui-test-" + std::to_string(gen()));
        fs::create_directories(root_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    const fs::path& root() const { return root_; }

    fs::path writeFile(const fs::path& relative, const std::string& content) {
        fs::path path = root_ / relative;
        fs::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary);
        out << content;
        return path;
    }

    static std::string readFile(const fs::path& path) {
        std::ifstream in(path, std::ios::binary);
        std::ostringstream contents;
        contents << in.rdbuf();
        return contents.str();
    }

    // Sorted entry names directly inside `dir`
    static std::vector<std::string> fileNames(const fs::path& dir) {
        std::vector<std::string> names;
        for (const auto& entry : fs::directory_iterator(dir)) {
            names.push_back(entry.path().filename().string());
        }
        std::sort(names.begin(), names.end());
        return names;
    }

private:
    fs::path root_;
};

// Polls `done` until it holds or the timeout expires
inline bool waitFor(const std::function<bool()>& done,
                    std::chrono::milliseconds timeout = std::chrono::seconds(10)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (done()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return done();
}

// One-shot barrier a worker thread blocks on until the test opens it
class Gate {
public:
    void pass() {
        std::unique_lock<std::mutex> lock(mutex_);
        entered_ = true;
        cv_.notify_all();
        cv_.wait(lock, [this] { return open_; });
    }

    void open() {
        std::lock_guard<std::mutex> lock(mutex_);
        open_ = true;
        cv_.notify_all();
    }

    bool waitEntered(std::chrono::milliseconds timeout = std::chrono::seconds(10)) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return entered_; });
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool entered_ = false;
    bool open_ = false;
};

// Memory hub whose transfers stop at a gate, so tests can act while a
// job is known to be in flight
class GatedHub : public MemoryHub {
public:
    Gate readGate;
    Gate uploadGate;
    bool gateReads = false;
    bool gateUploads = false;

    std::unique_ptr<ByteStream> openReadStream(const std::string& id) override {
        auto inner = MemoryHub::openReadStream(id);
        if (!gateReads) {
            return inner;
        }
        return std::make_unique<GatedStream>(std::move(inner), readGate);
    }

    RemoteFile upload(ReadSeekStream& stream,
                      const UploadRequest& request,
                      const UploadConfig& config) override {
        if (gateUploads) {
            uploadGate.pass();
        }
        return MemoryHub::upload(stream, request, config);
    }

private:
    class GatedStream : public ByteStream {
    public:
        GatedStream(std::unique_ptr<ByteStream> inner, Gate& gate)
            : inner_(std::move(inner)), gate_(gate) {}

        bool next(std::string& chunk) override {
            if (first_) {
                first_ = false;
                gate_.pass();
            }
            return inner_->next(chunk);
        }

    private:
        std::unique_ptr<ByteStream> inner_;
        Gate& gate_;
        bool first_ = true;
    };
};

}  // namespace test
}  // namespace drive

#endif  // DRIVE_TUI_TESTS_TEST_UTILS_H
