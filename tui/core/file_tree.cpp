#include "file_tree.h"
#include "transfer_error.h"
#include "../log.h"
#include <algorithm>
#include <cctype>
#include <map>

namespace drive {

namespace fs = std::filesystem;

IdGen::IdGen(Hub& hub, size_t batchSize)
    : hub_(hub), batchSize_(std::max<size_t>(batchSize, 1)) {}

std::string IdGen::next() {
    if (buffer_.empty()) {
        auto ids = hub_.generateIds(batchSize_);
        if (ids.empty()) {
            throw HubError("Service returned no identifiers");
        }
        buffer_.assign(ids.begin(), ids.end());
    }
    std::string id = buffer_.front();
    buffer_.pop_front();
    return id;
}

FileTree FileTree::fromPath(const fs::path& root,
                            IdGenerator& ids,
                            const std::vector<std::string>& targetParents) {
    std::error_code ec;
    fs::path dir = fs::absolute(root, ec).lexically_normal();
    if (ec) {
        throw TransferError(TransferError::Kind::Io,
            "Failed to resolve '" + root.string() + "': " + ec.message());
    }
    // "photos/" normalizes to a path with an empty filename
    if (!dir.has_filename() && dir.has_parent_path() && dir != dir.root_path()) {
        dir = dir.parent_path();
    }

    // The root itself may be a symlink the user picked explicitly
    if (!fs::is_directory(dir, ec) || ec) {
        throw TransferError(TransferError::Kind::Io,
            "'" + root.string() + "' is not a directory");
    }

    FileTree tree;
    try {
        tree.addFolder(dir, dir.parent_path(), std::nullopt, targetParents, ids);
    } catch (const fs::filesystem_error& e) {
        throw TransferError(TransferError::Kind::Io, e.what());
    }

    logger()->debug("[TREE] Planned {} folders, {} files from '{}'",
        tree.folders_.size(), tree.fileCount(), dir.string());
    return tree;
}

void FileTree::addFolder(const fs::path& dir,
                         const fs::path& base,
                         std::optional<size_t> parent,
                         const std::vector<std::string>& targetParents,
                         IdGenerator& ids) {
    PlannedFolder folder;
    folder.name = dir.filename().string();
    if (folder.name.empty()) folder.name = dir.string();
    folder.path = dir;
    folder.remoteId = ids.next();
    folder.parent = parent;
    folder.parents = parent ? std::vector<std::string>{folders_[*parent].remoteId} : targetParents;

    // Sorted for a deterministic plan
    std::map<std::string, fs::path> files;
    std::map<std::string, fs::path> subdirs;
    for (const auto& entry : fs::directory_iterator(dir)) {
        auto status = entry.symlink_status();
        if (fs::is_symlink(status)) continue;
        if (fs::is_directory(status)) {
            subdirs.emplace(entry.path().filename().string(), entry.path());
        } else if (fs::is_regular_file(status)) {
            files.emplace(entry.path().filename().string(), entry.path());
        }
    }

    for (const auto& [name, path] : files) {
        PlannedFile file;
        file.name = name;
        file.path = path;
        file.relativePath = path.lexically_relative(base);
        file.size = fs::file_size(path);
        file.remoteId = ids.next();
        file.mimeType = guessMimeType(path);
        folder.files.push_back(std::move(file));
    }

    size_t index = folders_.size();
    folders_.push_back(std::move(folder));

    for (const auto& [name, path] : subdirs) {
        addFolder(path, base, index, targetParents, ids);
    }
}

size_t FileTree::fileCount() const {
    size_t count = 0;
    for (const auto& folder : folders_) {
        count += folder.files.size();
    }
    return count;
}

uint64_t FileTree::totalSize() const {
    uint64_t total = 0;
    for (const auto& folder : folders_) {
        for (const auto& file : folder.files) {
            total += file.size;
        }
    }
    return total;
}

std::string guessMimeType(const fs::path& path) {
    static const std::map<std::string, std::string> types = {
        {".txt", "text/plain"},
        {".md", "text/markdown"},
        {".csv", "text/csv"},
        {".html", "text/html"},
        {".json", "application/json"},
        {".xml", "application/xml"},
        {".pdf", "application/pdf"},
        {".zip", "application/zip"},
        {".gz", "application/gzip"},
        {".tar", "application/x-tar"},
        {".png", "image/png"},
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".gif", "image/gif"},
        {".svg", "image/svg+xml"},
        {".mp3", "audio/mpeg"},
        {".ogg", "audio/ogg"},
        {".flac", "audio/flac"},
        {".mp4", "video/mp4"},
        {".mkv", "video/x-matroska"},
    };

    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto it = types.find(ext);
    return it != types.end() ? it->second : "application/octet-stream";
}

}  // namespace drive
