#ifndef DRIVE_TUI_CORE_FILE_TREE_H
#define DRIVE_TUI_CORE_FILE_TREE_H

#include "hub.h"
#include <cstddef>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace drive {

// Source of remote-style identifiers, allocated before the remote
// object exists so parent links are known up front
class IdGenerator {
public:
    virtual ~IdGenerator() = default;
    virtual std::string next() = 0;
};

// Buffers identifiers fetched in batches from the hub
class IdGen : public IdGenerator {
public:
    explicit IdGen(Hub& hub, size_t batchSize = 1000);

    // Throws HubError when a batch cannot be fetched
    std::string next() override;

private:
    Hub& hub_;
    size_t batchSize_;
    std::deque<std::string> buffer_;
};

struct PlannedFile {
    std::string name;
    std::filesystem::path path;           // absolute local path
    std::filesystem::path relativePath;   // for display, starts with the tree root name
    uint64_t size = 0;
    std::string remoteId;
    std::string mimeType;
};

struct PlannedFolder {
    std::string name;
    std::filesystem::path path;
    std::string remoteId;
    std::optional<size_t> parent;         // index into FileTree::folders(), empty for the tree root
    std::vector<std::string> parents;     // remote parent ids for mkdir
    std::vector<PlannedFile> files;       // files directly inside this folder
};

// Upload plan for a local directory. Folders are stored in pre-order, so
// every folder comes after its parent.
class FileTree {
public:
    // Walks `root` and allocates an identifier for every folder and regular
    // file. Symlinks and special files are skipped. The tree root is linked
    // to `targetParents` (empty = remote root).
    // Throws TransferError(Io) for local failures, HubError from `ids`.
    static FileTree fromPath(const std::filesystem::path& root,
                             IdGenerator& ids,
                             const std::vector<std::string>& targetParents = {});

    const std::vector<PlannedFolder>& folders() const { return folders_; }
    size_t fileCount() const;
    uint64_t totalSize() const;

private:
    void addFolder(const std::filesystem::path& dir,
                   const std::filesystem::path& base,
                   std::optional<size_t> parent,
                   const std::vector<std::string>& targetParents,
                   IdGenerator& ids);

    std::vector<PlannedFolder> folders_;
};

// Best-effort MIME type from the file extension
std::string guessMimeType(const std::filesystem::path& path);

}  // namespace drive

#endif  // DRIVE_TUI_CORE_FILE_TREE_H
