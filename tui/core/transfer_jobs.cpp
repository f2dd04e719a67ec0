#include "transfer_jobs.h"
#include "file_tree.h"
#include "progress_io.h"
#include "../log.h"
#include <fstream>
#include <system_error>
#include <utility>

namespace drive {

namespace fs = std::filesystem;

namespace {

// Runs a hub call, turning service failures into transfer errors
template <typename F>
auto callHub(F&& call) -> decltype(call()) {
    try {
        return call();
    } catch (const HubError& e) {
        throw TransferError(TransferError::Kind::Remote, e.what());
    }
}

// Removes the temporary download file once armed, unless the download
// was promoted
class TempFileGuard {
public:
    explicit TempFileGuard(fs::path path) : path_(std::move(path)) {}

    ~TempFileGuard() {
        if (!armed_) return;
        std::error_code ec;
        fs::remove(path_, ec);
        if (ec) {
            logger()->warn("[DOWNLOAD] Failed to remove '{}': {}", path_.string(), ec.message());
        }
    }

    void arm() { armed_ = true; }
    void release() { armed_ = false; }

private:
    fs::path path_;
    bool armed_ = false;

    TempFileGuard(const TempFileGuard&) = delete;
    TempFileGuard& operator=(const TempFileGuard&) = delete;
};

// The remote name must name a single entry inside the destination
void checkFileName(const std::string& name) {
    fs::path path(name);
    if (name == "." || name == ".." || path.is_absolute() || path.has_root_path() ||
        name.find('/') != std::string::npos || name.find('\\') != std::string::npos) {
        throw TransferError(TransferError::Kind::Invalid,
            "Invalid file name '" + name + "'");
    }
}

fs::path resolveDestination(const std::optional<fs::path>& destination) {
    std::error_code ec;
    if (!destination) {
        fs::path cwd = fs::canonical(fs::current_path(ec), ec);
        if (ec) {
            throw TransferError(TransferError::Kind::Io,
                "Failed to canonicalize destination: " + ec.message());
        }
        return cwd;
    }

    const fs::path& path = *destination;
    if (!fs::exists(path, ec)) {
        throw TransferError(TransferError::Kind::Invalid,
            "Destination path '" + path.string() + "' does not exist");
    }
    if (!fs::is_directory(path, ec)) {
        throw TransferError(TransferError::Kind::Invalid,
            "Destination path '" + path.string() + "' is not a directory");
    }
    fs::path canonical = fs::canonical(path, ec);
    if (ec) {
        throw TransferError(TransferError::Kind::Io,
            "Failed to canonicalize destination: " + ec.message());
    }
    return canonical;
}

std::ifstream openForUpload(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw TransferError(TransferError::Kind::Io,
            "Failed to open '" + path.string() + "'");
    }
    return in;
}

void uploadSingleFile(Hub& hub,
                      const fs::path& path,
                      const std::vector<std::string>& parents,
                      const UploadConfig& config,
                      ProgressReporter<UploadProgress>& progress,
                      const CancelToken& cancel) {
    cancel.throwIfCancelled();

    std::error_code ec;
    uint64_t size = fs::file_size(path, ec);
    if (ec) {
        throw TransferError(TransferError::Kind::Io,
            "Failed to read size of '" + path.string() + "': " + ec.message());
    }

    UploadRequest request;
    request.name = path.filename().string();
    request.size = size;
    request.mimeType = guessMimeType(path);
    request.parents = parents;

    progress.update([&](UploadProgress& p) {
        p.currentFile = request.name;
        p.totalBytes = size;
        p.currentBytes = 0;
        p.doneFiles = 0;
        p.totalFiles = 1;
    });

    auto in = openForUpload(path);
    ProgressReader reader(in, cancel, [&progress](uint64_t bytes) {
        progress.update([bytes](UploadProgress& p) { p.currentBytes = bytes; });
    });

    logger()->info("[UPLOAD] '{}' ({} bytes)", path.string(), size);
    callHub([&] { return hub.upload(reader, request, config); });

    progress.update([](UploadProgress& p) { p.doneFiles = 1; });
}

void uploadDirectory(Hub& hub,
                     const fs::path& path,
                     const std::vector<std::string>& parents,
                     const UploadConfig& config,
                     ProgressReporter<UploadProgress>& progress,
                     const CancelToken& cancel) {
    cancel.throwIfCancelled();

    IdGen ids(hub);
    FileTree tree = callHub([&] { return FileTree::fromPath(path, ids, parents); });

    progress.update([&tree](UploadProgress& p) {
        p.totalFiles = tree.fileCount();
        p.doneFiles = 0;
    });

    for (const auto& folder : tree.folders()) {
        cancel.throwIfCancelled();

        RemoteFile created = callHub([&] {
            return hub.mkdir(folder.remoteId, folder.name, folder.parents);
        });
        if (created.id.empty()) {
            throw TransferError(TransferError::Kind::Remote, "Folder created on drive has no id");
        }
        logger()->info("[UPLOAD] Created folder '{}' ({})", folder.name, created.id);

        for (const auto& file : folder.files) {
            cancel.throwIfCancelled();

            progress.update([&file](UploadProgress& p) {
                p.currentFile = file.relativePath.string();
                p.totalBytes = file.size;
                p.currentBytes = 0;
            });

            UploadRequest request;
            request.name = file.name;
            request.size = file.size;
            request.mimeType = file.mimeType;
            request.parents = {created.id};
            request.id = file.remoteId;

            auto in = openForUpload(file.path);
            ProgressReader reader(in, cancel, [&progress](uint64_t bytes) {
                progress.update([bytes](UploadProgress& p) { p.currentBytes = bytes; });
            });

            callHub([&] { return hub.upload(reader, request, config); });
            logger()->debug("[UPLOAD] Uploaded '{}'", file.relativePath.string());

            progress.update([](UploadProgress& p) { p.doneFiles += 1; });
        }
    }
}

}  // namespace

void runDownload(Hub& hub,
                 const std::string& fileId,
                 const std::optional<fs::path>& destination,
                 ProgressReporter<DownloadProgress>& progress,
                 const CancelToken& cancel) {
    cancel.throwIfCancelled();

    RemoteFile file = callHub([&] { return hub.get(fileId); });
    if (file.isFolder) {
        throw TransferError(TransferError::Kind::Invalid, "Selected item is a directory");
    }
    if (file.isShortcut) {
        throw TransferError(TransferError::Kind::Invalid, "Shortcuts are not supported in TUI download");
    }
    if (file.name.empty()) {
        throw TransferError(TransferError::Kind::Invalid, "File does not have a name");
    }
    checkFileName(file.name);

    progress.update([&file](DownloadProgress& p) {
        p.fileName = file.name;
        p.totalBytes = file.size;
    });

    fs::path root = resolveDestination(destination);
    fs::path finalPath = root / file.name;
    std::error_code ec;
    if (fs::exists(finalPath, ec)) {
        throw TransferError(TransferError::Kind::Invalid,
            "File '" + finalPath.string() + "' already exists, delete it or use a different destination");
    }

    auto body = callHub([&] { return hub.openReadStream(fileId); });

    fs::path tmpPath = finalPath;
    tmpPath += ".incomplete";
    if (fs::exists(fs::symlink_status(tmpPath, ec))) {
        throw TransferError(TransferError::Kind::Invalid,
            "File '" + tmpPath.string() + "' already exists, delete it or use a different destination");
    }

    // Armed only once this job owns the file
    TempFileGuard guard(tmpPath);
    Md5Writer writer(tmpPath);
    guard.arm();

    logger()->info("[DOWNLOAD] '{}' -> '{}'", file.name, finalPath.string());

    std::string chunk;
    while (callHub([&] { return body->next(chunk); })) {
        cancel.throwIfCancelled();
        writer.write(chunk);
        uint64_t written = writer.bytesWritten();
        progress.update([written](DownloadProgress& p) { p.currentBytes = written; });
    }
    writer.close();
    cancel.throwIfCancelled();

    std::string actual = writer.md5();
    if (file.md5Checksum && *file.md5Checksum != actual) {
        logger()->warn("[DOWNLOAD] Checksum mismatch for '{}'", file.name);
        throw TransferError(TransferError::Kind::Integrity,
            "MD5 mismatch, expected: " + *file.md5Checksum + ", actual: " + actual);
    }

    fs::rename(tmpPath, finalPath, ec);
    if (ec) {
        throw TransferError(TransferError::Kind::Io,
            "Failed to rename '" + tmpPath.string() + "': " + ec.message());
    }
    guard.release();
    logger()->info("[DOWNLOAD] Completed '{}' ({} bytes, md5 {})",
        finalPath.string(), writer.bytesWritten(), actual);
}

void runUpload(Hub& hub,
               const fs::path& path,
               const std::vector<std::string>& parents,
               const UploadConfig& config,
               ProgressReporter<UploadProgress>& progress,
               const CancelToken& cancel) {
    std::error_code ec;
    if (fs::is_directory(path, ec)) {
        uploadDirectory(hub, path, parents, config, progress, cancel);
    } else if (fs::is_regular_file(path, ec)) {
        uploadSingleFile(hub, path, parents, config, progress, cancel);
    } else if (!fs::exists(path, ec)) {
        throw TransferError(TransferError::Kind::Invalid,
            "Path '" + path.string() + "' does not exist");
    } else {
        throw TransferError(TransferError::Kind::Invalid,
            "'" + path.string() + "' is not a regular file or directory");
    }
}

TransferEngine::TransferEngine(Hub& hub, UploadConfig config)
    : hub_(hub), config_(config) {}

TransferEngine::~TransferEngine() {
    // Job destructors wait for their workers
    cancelAll();
}

StartError TransferEngine::startDownload(const Item& item,
                                         const std::optional<fs::path>& destination) {
    if (download_) {
        return std::string("Download already in progress");
    }
    if (item.isFolder) {
        return std::string("Select a file to download");
    }
    if (item.id.empty()) {
        return std::string("Missing file id");
    }

    DownloadProgress initial;
    initial.fileName = item.name;

    Hub& hub = hub_;
    std::string fileId = item.id;
    download_ = std::make_unique<TransferJob<DownloadProgress>>(initial,
        [&hub, fileId, destination](ProgressReporter<DownloadProgress>& progress,
                                    const CancelToken& cancel) {
            runDownload(hub, fileId, destination, progress, cancel);
        });

    logger()->info("[JOB] Download started for '{}' ({})", item.name, item.id);
    return std::nullopt;
}

StartError TransferEngine::startUpload(const fs::path& path,
                                       const std::optional<std::string>& parentFolderId) {
    if (upload_) {
        return std::string("Upload already in progress");
    }

    std::vector<std::string> parents;
    if (parentFolderId) {
        parents.push_back(*parentFolderId);
    }

    Hub& hub = hub_;
    UploadConfig config = config_;
    upload_ = std::make_unique<TransferJob<UploadProgress>>(UploadProgress{},
        [&hub, path, parents, config](ProgressReporter<UploadProgress>& progress,
                                      const CancelToken& cancel) {
            runUpload(hub, path, parents, config, progress, cancel);
        });

    logger()->info("[JOB] Upload started for '{}'", path.string());
    return std::nullopt;
}

void TransferEngine::cancelAll() {
    if (upload_) upload_->cancel();
    if (download_) download_->cancel();
}

std::vector<JobCompletion> TransferEngine::reconcile() {
    std::vector<JobCompletion> completions;

    if (upload_) {
        upload_->pump();
        if (upload_->finished()) {
            completions.push_back({JobKind::Upload, upload_->collect()});
            upload_.reset();
        }
    }

    if (download_) {
        download_->pump();
        if (download_->finished()) {
            completions.push_back({JobKind::Download, download_->collect()});
            download_.reset();
        }
    }

    for (const auto& completion : completions) {
        const char* kind = completion.kind == JobKind::Upload ? "Upload" : "Download";
        if (completion.outcome.ok) {
            logger()->info("[JOB] {} finished", kind);
        } else {
            const auto& outcome = completion.outcome;
            logger()->warn("[JOB] {} ended ({}): {}", kind,
                outcome.kind ? transferErrorKindStr(*outcome.kind) : "Lifecycle error",
                outcome.error);
        }
    }
    return completions;
}

const UploadProgress* TransferEngine::uploadProgress() const {
    return upload_ ? &upload_->progress() : nullptr;
}

const DownloadProgress* TransferEngine::downloadProgress() const {
    return download_ ? &download_->progress() : nullptr;
}

}  // namespace drive
