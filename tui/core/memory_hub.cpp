#include "memory_hub.h"
#include "progress_io.h"
#include "../log.h"
#include <algorithm>
#include <thread>
#include <utility>

namespace drive {

namespace {

class MemoryReadStream : public ByteStream {
public:
    MemoryReadStream(std::string content, size_t chunkSize, std::chrono::milliseconds delay)
        : content_(std::move(content)), chunkSize_(chunkSize), delay_(delay) {}

    bool next(std::string& chunk) override {
        if (position_ >= content_.size()) {
            return false;
        }
        if (delay_.count() > 0) {
            std::this_thread::sleep_for(delay_);
        }
        size_t length = std::min(chunkSize_, content_.size() - position_);
        chunk.assign(content_, position_, length);
        position_ += length;
        return true;
    }

private:
    std::string content_;
    size_t chunkSize_;
    std::chrono::milliseconds delay_;
    size_t position_ = 0;
};

std::string demoContent(size_t size, char seed) {
    std::string content(size, '\0');
    for (size_t i = 0; i < size; i++) {
        content[i] = (char)(seed + (i % 23));
    }
    return content;
}

}  // namespace

MemoryHub::MemoryHub() = default;

std::string MemoryHub::addFolder(const std::string& name, const std::optional<std::string>& parent) {
    std::lock_guard<std::mutex> lock(mutex_);
    Node node;
    node.name = name;
    node.isFolder = true;
    node.parent = parent;
    return insertLocked(std::move(node));
}

std::string MemoryHub::addFile(const std::string& name,
                               const std::string& content,
                               const std::optional<std::string>& parent) {
    // Hashed outside the lock
    std::string digest = md5Hex(content);

    std::lock_guard<std::mutex> lock(mutex_);
    Node node;
    node.name = name;
    node.content = content;
    node.contentMd5 = std::move(digest);
    node.parent = parent;
    digestCount_++;
    return insertLocked(std::move(node));
}

std::string MemoryHub::addShortcut(const std::string& name, const std::optional<std::string>& parent) {
    std::lock_guard<std::mutex> lock(mutex_);
    Node node;
    node.name = name;
    node.isShortcut = true;
    node.parent = parent;
    return insertLocked(std::move(node));
}

void MemoryHub::setTrashed(const std::string& id, bool trashed) {
    std::lock_guard<std::mutex> lock(mutex_);
    nodeLocked(id);
    nodes_[id].trashed = trashed;
}

void MemoryHub::setReportedChecksum(const std::string& id, const std::optional<std::string>& md5) {
    std::lock_guard<std::mutex> lock(mutex_);
    nodeLocked(id);
    nodes_[id].checksumOverridden = true;
    nodes_[id].reportedMd5 = md5;
}

void MemoryHub::failNextUploadChunks(int count) {
    std::lock_guard<std::mutex> lock(mutex_);
    failChunks_ = count;
}

void MemoryHub::failNext(Operation op, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    failures_[op] = message;
}

void MemoryHub::setReadChunkSize(size_t size) {
    std::lock_guard<std::mutex> lock(mutex_);
    readChunkSize_ = std::max<size_t>(size, 1);
}

void MemoryHub::setReadDelay(std::chrono::milliseconds delay) {
    std::lock_guard<std::mutex> lock(mutex_);
    readDelay_ = delay;
}

void MemoryHub::seedDemo() {
    std::string documents = addFolder("Documents");
    std::string photos = addFolder("Photos");
    std::string music = addFolder("Music");
    addFolder("archive");

    addFile("report.pdf", demoContent(180 * 1024, 'A'), documents);
    addFile("notes.txt", "Buy milk\nCall the plumber\n", documents);
    std::string projects = addFolder("Projects", documents);
    addFile("plan.md", "# Plan\n\n- ship it\n", projects);
    addFile("budget.csv", "item,cost\nrent,1200\nfood,400\n", projects);

    addFile("beach.jpg", demoContent(2 * 1024 * 1024, 'b'), photos);
    addFile("Mountains.png", demoContent(3 * 1024 * 1024, 'm'), photos);
    addFile("album.flac", demoContent(6 * 1024 * 1024, 'f'), music);

    addFile("README.txt", "Welcome to drive-tui demo mode.\n");
    addFile("large-video.mp4", demoContent(24 * 1024 * 1024, 'v'));
    addShortcut("Shared with me");

    std::string corrupted = addFile("corrupted.bin", demoContent(512 * 1024, 'c'));
    setReportedChecksum(corrupted, std::string("00000000000000000000000000000000"));

    std::string trashed = addFile("old-draft.txt", "outdated\n");
    setTrashed(trashed, true);

    setReadDelay(std::chrono::milliseconds(15));
    logger()->info("[HUB] Seeded demo tree");
}

bool MemoryHub::exists(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return nodes_.count(id) > 0;
}

std::optional<std::string> MemoryHub::contentOf(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = nodes_.find(id);
    if (it == nodes_.end() || it->second.isFolder) {
        return std::nullopt;
    }
    return it->second.content;
}

std::optional<std::string> MemoryHub::parentOf(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = nodes_.find(id);
    if (it == nodes_.end()) {
        return std::nullopt;
    }
    return it->second.parent;
}

std::optional<RemoteFile> MemoryHub::findChild(const std::optional<std::string>& parent,
                                               const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, node] : nodes_) {
        if (node.parent == parent && node.name == name) {
            return recordLocked(node);
        }
    }
    return std::nullopt;
}

std::vector<std::string> MemoryHub::operations() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return operations_;
}

int MemoryHub::uploadRetries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return uploadRetries_;
}

int MemoryHub::digestCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return digestCount_;
}

std::vector<RemoteFile> MemoryHub::list(const ListScope& scope, size_t maxFiles) {
    std::lock_guard<std::mutex> lock(mutex_);
    checkFailureLocked(Operation::List);

    if (scope.folderId) {
        const Node& folder = nodeLocked(*scope.folderId);
        if (!folder.isFolder) {
            throw HubError("Not a folder: " + *scope.folderId);
        }
    }

    std::vector<const Node*> matches;
    for (const auto& [id, node] : nodes_) {
        if (scope.folderId) {
            if (node.parent == scope.folderId) matches.push_back(&node);
        } else if (!node.parent && !node.trashed) {
            matches.push_back(&node);
        }
    }

    // Service order is creation order
    std::sort(matches.begin(), matches.end(),
        [](const Node* a, const Node* b) { return a->order < b->order; });
    if (matches.size() > maxFiles) {
        matches.resize(maxFiles);
    }

    std::vector<RemoteFile> files;
    for (const Node* node : matches) {
        files.push_back(recordLocked(*node));
    }
    return files;
}

RemoteFile MemoryHub::get(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    checkFailureLocked(Operation::Get);
    return recordLocked(nodeLocked(id));
}

void MemoryHub::remove(const std::string& id, bool recurse) {
    std::lock_guard<std::mutex> lock(mutex_);
    checkFailureLocked(Operation::Remove);

    const Node& node = nodeLocked(id);
    if (node.isFolder && !recurse) {
        for (const auto& [childId, child] : nodes_) {
            if (child.parent == id) {
                throw HubError("Folder '" + node.name + "' is not empty");
            }
        }
    }
    removeLocked(id);
    logger()->debug("[HUB] Removed {}", id);
}

std::unique_ptr<ByteStream> MemoryHub::openReadStream(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    checkFailureLocked(Operation::Read);

    const Node& node = nodeLocked(id);
    if (node.isFolder) {
        throw HubError("Cannot download a folder: " + id);
    }
    return std::make_unique<MemoryReadStream>(node.content, readChunkSize_, readDelay_);
}

RemoteFile MemoryHub::upload(ReadSeekStream& stream,
                             const UploadRequest& request,
                             const UploadConfig& config) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        checkFailureLocked(Operation::Upload);
        checkParentsLocked(request.parents);
        if (request.id && nodes_.count(*request.id)) {
            throw HubError("Identifier already in use: " + *request.id);
        }
    }

    // Stream errors propagate unchanged, only injected chunk failures are retried
    size_t chunkSize = std::max<size_t>(config.chunkSize, 1);
    std::vector<char> buffer(chunkSize);
    std::string data;
    uint64_t offset = 0;
    int retries = 0;
    for (;;) {
        size_t got = 0;
        while (got < chunkSize) {
            size_t n = stream.read(buffer.data() + got, chunkSize - got);
            if (n == 0) break;
            got += n;
        }

        bool failed = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (failChunks_ > 0) {
                failChunks_--;
                uploadRetries_++;
                failed = true;
            }
        }
        if (failed) {
            if (++retries > config.maxRetries) {
                throw HubError("Upload of '" + request.name + "' failed after " +
                    std::to_string(config.maxRetries) + " retries");
            }
            stream.seek(offset);
            continue;
        }

        data.append(buffer.data(), got);
        offset += got;
        if (got < chunkSize) break;
    }

    std::string digest = md5Hex(data);

    std::lock_guard<std::mutex> lock(mutex_);
    checkParentsLocked(request.parents);

    Node node;
    node.name = request.name;
    node.content = std::move(data);
    node.contentMd5 = std::move(digest);
    digestCount_++;
    if (!request.parents.empty()) node.parent = request.parents.front();
    if (request.id) {
        if (nodes_.count(*request.id)) {
            throw HubError("Identifier already in use: " + *request.id);
        }
        node.id = *request.id;
    }
    std::string id = insertLocked(std::move(node));
    operations_.push_back("upload:" + id);
    return recordLocked(nodes_.at(id));
}

RemoteFile MemoryHub::mkdir(const std::optional<std::string>& id,
                            const std::string& name,
                            const std::vector<std::string>& parents) {
    std::lock_guard<std::mutex> lock(mutex_);
    checkFailureLocked(Operation::Mkdir);
    checkParentsLocked(parents);

    Node node;
    node.name = name;
    node.isFolder = true;
    if (!parents.empty()) node.parent = parents.front();
    if (id) {
        if (nodes_.count(*id)) {
            throw HubError("Identifier already in use: " + *id);
        }
        node.id = *id;
    }
    std::string created = insertLocked(std::move(node));
    operations_.push_back("mkdir:" + created);
    return recordLocked(nodes_.at(created));
}

std::vector<std::string> MemoryHub::generateIds(size_t count) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(count);
    for (size_t i = 0; i < count; i++) {
        ids.push_back(nextIdLocked());
    }
    return ids;
}

std::string MemoryHub::nextIdLocked() {
    return "mem-" + std::to_string(nextId_++);
}

std::string MemoryHub::insertLocked(Node node) {
    if (node.id.empty()) {
        node.id = nextIdLocked();
    }
    node.order = nextOrder_++;
    std::string id = node.id;
    nodes_[id] = std::move(node);
    return id;
}

void MemoryHub::checkFailureLocked(Operation op) {
    auto it = failures_.find(op);
    if (it == failures_.end()) {
        return;
    }
    std::string message = it->second;
    failures_.erase(it);
    throw HubError(message);
}

void MemoryHub::checkParentsLocked(const std::vector<std::string>& parents) const {
    for (const auto& parent : parents) {
        auto it = nodes_.find(parent);
        if (it == nodes_.end() || !it->second.isFolder) {
            throw HubError("Parent folder not found: " + parent);
        }
    }
}

const MemoryHub::Node& MemoryHub::nodeLocked(const std::string& id) const {
    auto it = nodes_.find(id);
    if (it == nodes_.end()) {
        throw HubError("File not found: " + id);
    }
    return it->second;
}

RemoteFile MemoryHub::recordLocked(const Node& node) const {
    RemoteFile file;
    file.id = node.id;
    file.name = node.name;
    file.isFolder = node.isFolder;
    file.isShortcut = node.isShortcut;
    if (!node.isFolder && !node.isShortcut) {
        file.size = node.content.size();
        file.md5Checksum = node.checksumOverridden ? node.reportedMd5 : node.contentMd5;
    }
    return file;
}

void MemoryHub::removeLocked(const std::string& id) {
    std::vector<std::string> children;
    for (const auto& [childId, child] : nodes_) {
        if (child.parent == id) children.push_back(childId);
    }
    for (const auto& child : children) {
        removeLocked(child);
    }
    nodes_.erase(id);
}

}  // namespace drive
