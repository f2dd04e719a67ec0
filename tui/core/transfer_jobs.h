#ifndef DRIVE_TUI_CORE_TRANSFER_JOBS_H
#define DRIVE_TUI_CORE_TRANSFER_JOBS_H

#include "../state.h"
#include "hub.h"
#include "channel.h"
#include "cancel_token.h"
#include "transfer_error.h"
#include <chrono>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace drive {

struct UploadProgress {
    std::optional<std::string> currentFile;
    uint64_t currentBytes = 0;
    std::optional<uint64_t> totalBytes;      // size of the file in flight
    uint64_t doneFiles = 0;
    std::optional<uint64_t> totalFiles;      // known once planning finished
};

struct DownloadProgress {
    std::string fileName;
    uint64_t currentBytes = 0;
    std::optional<uint64_t> totalBytes;      // known once the remote record is fetched
};

// Terminal state of a job
struct JobOutcome {
    bool ok = true;
    std::optional<TransferError::Kind> kind;   // empty on success or lifecycle failure
    std::string error;

    bool cancelled() const { return kind == TransferError::Kind::Cancelled; }
};

// Error text describing why a job was not started, empty when it was
using StartError = std::optional<std::string>;

// Worker-side handle: keeps the current snapshot and publishes a copy
// after every change
template <typename Progress>
class ProgressReporter {
public:
    ProgressReporter(std::shared_ptr<Channel<Progress>> channel, Progress initial)
        : channel_(std::move(channel)), current_(std::move(initial)) {}

    template <typename Mutator>
    void update(Mutator&& mutate) {
        mutate(current_);
        channel_->produce(current_);
    }

    const Progress& current() const { return current_; }

private:
    std::shared_ptr<Channel<Progress>> channel_;
    Progress current_;
};

// One upload or download running on its own thread. The worker only
// talks to the UI thread through the progress channel and the completion
// future; finished() and collect() are the only ways to observe the end.
template <typename Progress>
class TransferJob {
public:
    using Work = std::function<void(ProgressReporter<Progress>&, const CancelToken&)>;

    TransferJob(Progress initial, Work work)
        : channel_(std::make_shared<Channel<Progress>>()), latest_(initial) {
        auto channel = channel_;
        CancelToken cancel = cancel_;
        done_ = std::async(std::launch::async,
            [channel, cancel, initial, work = std::move(work)]() {
                ProgressReporter<Progress> reporter(channel, initial);
                work(reporter, cancel);
            });
    }

    // Never leaves the worker running: a dropped job is cancelled and waited for
    ~TransferJob() {
        if (done_.valid()) {
            cancel_.cancel();
            done_.wait();
        }
    }

    void cancel() { cancel_.cancel(); }
    bool cancelRequested() const { return cancel_.cancelled(); }

    // Pulls the most recent progress snapshot published by the worker
    void pump() { channel_->drainLatest(latest_); }

    const Progress& progress() const { return latest_; }

    bool finished() const {
        return done_.valid() &&
            done_.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    }

    // Joins the worker and converts its result. Call once, after finished().
    JobOutcome collect() {
        pump();
        JobOutcome outcome;
        try {
            done_.get();
        } catch (const TransferError& e) {
            outcome.ok = false;
            outcome.kind = e.kind();
            outcome.error = e.what();
        } catch (const std::exception& e) {
            outcome.ok = false;
            outcome.error = std::string("Job terminated unexpectedly: ") + e.what();
        } catch (...) {
            outcome.ok = false;
            outcome.error = "Job terminated unexpectedly";
        }
        return outcome;
    }

private:
    std::shared_ptr<Channel<Progress>> channel_;
    CancelToken cancel_;
    Progress latest_;
    std::future<void> done_;

    TransferJob(const TransferJob&) = delete;
    TransferJob& operator=(const TransferJob&) = delete;
};

enum class JobKind {
    Upload,
    Download
};

struct JobCompletion {
    JobKind kind;
    JobOutcome outcome;
};

// Downloads `fileId` into `destination` (current directory when empty)
// through a temporary "<name>.incomplete" file that is only renamed after
// the checksum matched. Throws TransferError.
void runDownload(Hub& hub,
                 const std::string& fileId,
                 const std::optional<std::filesystem::path>& destination,
                 ProgressReporter<DownloadProgress>& progress,
                 const CancelToken& cancel);

// Uploads a file or a whole directory tree below `parents`. Completed
// steps are not rolled back on failure or cancellation. Throws TransferError.
void runUpload(Hub& hub,
               const std::filesystem::path& path,
               const std::vector<std::string>& parents,
               const UploadConfig& config,
               ProgressReporter<UploadProgress>& progress,
               const CancelToken& cancel);

// Owns the upload slot and the download slot
class TransferEngine {
public:
    TransferEngine(Hub& hub, UploadConfig config);
    ~TransferEngine();

    StartError startDownload(const Item& item,
                             const std::optional<std::filesystem::path>& destination);
    StartError startUpload(const std::filesystem::path& path,
                           const std::optional<std::string>& parentFolderId);

    bool uploadActive() const { return upload_ != nullptr; }
    bool downloadActive() const { return download_ != nullptr; }
    bool idle() const { return !upload_ && !download_; }

    // Signals every active job without waiting for it
    void cancelAll();
    bool uploadCancelRequested() const { return upload_ && upload_->cancelRequested(); }
    bool downloadCancelRequested() const { return download_ && download_->cancelRequested(); }

    // Refreshes progress snapshots, then joins and clears finished jobs.
    // The only place a job is observed as finished.
    std::vector<JobCompletion> reconcile();

    // Latest snapshot, nullptr when the slot is empty
    const UploadProgress* uploadProgress() const;
    const DownloadProgress* downloadProgress() const;

private:
    Hub& hub_;
    UploadConfig config_;
    std::unique_ptr<TransferJob<UploadProgress>> upload_;
    std::unique_ptr<TransferJob<DownloadProgress>> download_;

    TransferEngine(const TransferEngine&) = delete;
    TransferEngine& operator=(const TransferEngine&) = delete;
};

}  // namespace drive

#endif  // DRIVE_TUI_CORE_TRANSFER_JOBS_H
