#ifndef DRIVE_TUI_CORE_MEMORY_HUB_H
#define DRIVE_TUI_CORE_MEMORY_HUB_H

#include "hub.h"
#include <chrono>
#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace drive {

// In-process storage service. Backs --demo mode and the tests.
class MemoryHub : public Hub {
public:
    enum class Operation {
        List,
        Get,
        Remove,
        Read,
        Upload,
        Mkdir
    };

    MemoryHub();

    // Seeding (parent empty = root)
    std::string addFolder(const std::string& name,
                          const std::optional<std::string>& parent = std::nullopt);
    std::string addFile(const std::string& name,
                        const std::string& content,
                        const std::optional<std::string>& parent = std::nullopt);
    std::string addShortcut(const std::string& name,
                            const std::optional<std::string>& parent = std::nullopt);
    void setTrashed(const std::string& id, bool trashed);

    // Overrides the checksum reported by get(), empty = no checksum
    void setReportedChecksum(const std::string& id, const std::optional<std::string>& md5);

    // The next `count` upload chunks fail as transient errors
    void failNextUploadChunks(int count);

    // The next call of `op` throws HubError(message)
    void failNext(Operation op, const std::string& message);

    void setReadChunkSize(size_t size);
    void setReadDelay(std::chrono::milliseconds delay);

    // Sample tree for --demo
    void seedDemo();

    // Inspection
    bool exists(const std::string& id) const;
    std::optional<std::string> contentOf(const std::string& id) const;
    std::optional<std::string> parentOf(const std::string& id) const;
    std::optional<RemoteFile> findChild(const std::optional<std::string>& parent,
                                        const std::string& name) const;

    // "mkdir:<id>" and "upload:<id>" in the order they were committed
    std::vector<std::string> operations() const;
    int uploadRetries() const;

    // Number of digests computed over stored content
    int digestCount() const;

    // Hub
    std::vector<RemoteFile> list(const ListScope& scope, size_t maxFiles) override;
    RemoteFile get(const std::string& id) override;
    void remove(const std::string& id, bool recurse) override;
    std::unique_ptr<ByteStream> openReadStream(const std::string& id) override;
    RemoteFile upload(ReadSeekStream& stream,
                      const UploadRequest& request,
                      const UploadConfig& config) override;
    RemoteFile mkdir(const std::optional<std::string>& id,
                     const std::string& name,
                     const std::vector<std::string>& parents) override;
    std::vector<std::string> generateIds(size_t count) override;

private:
    struct Node {
        std::string id;
        std::string name;
        bool isFolder = false;
        bool isShortcut = false;
        bool trashed = false;
        std::optional<std::string> parent;
        std::string content;
        std::string contentMd5;           // digest of content, computed once
        bool checksumOverridden = false;
        std::optional<std::string> reportedMd5;
        uint64_t order = 0;
    };

    std::string nextIdLocked();
    std::string insertLocked(Node node);
    void checkFailureLocked(Operation op);
    void checkParentsLocked(const std::vector<std::string>& parents) const;
    const Node& nodeLocked(const std::string& id) const;
    RemoteFile recordLocked(const Node& node) const;
    void removeLocked(const std::string& id);

    mutable std::mutex mutex_;
    std::map<std::string, Node> nodes_;
    std::map<Operation, std::string> failures_;
    std::vector<std::string> operations_;
    uint64_t nextId_ = 1;
    uint64_t nextOrder_ = 0;
    int failChunks_ = 0;
    int uploadRetries_ = 0;
    int digestCount_ = 0;
    size_t readChunkSize_ = 64 * 1024;
    std::chrono::milliseconds readDelay_{0};
};

}  // namespace drive

#endif  // DRIVE_TUI_CORE_MEMORY_HUB_H
