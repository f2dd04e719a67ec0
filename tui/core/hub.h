#ifndef DRIVE_TUI_CORE_HUB_H
#define DRIVE_TUI_CORE_HUB_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace drive {

// File record as reported by the storage service
struct RemoteFile {
    std::string id;
    std::string name;
    bool isFolder = false;
    bool isShortcut = false;
    std::optional<uint64_t> size;
    std::optional<std::string> md5Checksum;
};

// Listing scope: children of a folder, or root excluding trashed items
struct ListScope {
    std::optional<std::string> folderId;

    static ListScope root() { return {}; }
    static ListScope children(const std::string& id) { return {id}; }
};

// Knobs of the resumable chunked upload
struct UploadConfig {
    size_t chunkSize = 8 * 1024 * 1024;
    int maxRetries = 100000;
    std::chrono::seconds minBackoff{1};
    std::chrono::seconds maxBackoff{60};
};

struct UploadRequest {
    std::string name;
    uint64_t size = 0;
    std::string mimeType;
    std::vector<std::string> parents;   // empty = root
    std::optional<std::string> id;      // pre-assigned identifier
};

// Failure reported by the remote service or its transport
class HubError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Sequential, chunked body of a remote file
class ByteStream {
public:
    virtual ~ByteStream() = default;

    // Stores the next chunk in `chunk`. Returns false at end of body.
    // Throws HubError on transport failure.
    virtual bool next(std::string& chunk) = 0;
};

// Readable and seekable source consumed by chunked uploads
class ReadSeekStream {
public:
    virtual ~ReadSeekStream() = default;

    // Returns the number of bytes read, 0 at end of stream
    virtual size_t read(char* buffer, size_t length) = 0;

    // Absolute seek, returns the new position
    virtual uint64_t seek(uint64_t position) = 0;
};

// Remote storage service client. Shared by the UI thread and transfer
// jobs, so implementations must be safe to call concurrently.
class Hub {
public:
    virtual ~Hub() = default;

    virtual std::vector<RemoteFile> list(const ListScope& scope, size_t maxFiles) = 0;
    virtual RemoteFile get(const std::string& id) = 0;
    virtual void remove(const std::string& id, bool recurse) = 0;
    virtual std::unique_ptr<ByteStream> openReadStream(const std::string& id) = 0;

    // Uploads the whole stream, retrying transient failures internally.
    // Exceptions thrown by `stream` propagate unchanged.
    virtual RemoteFile upload(ReadSeekStream& stream,
                              const UploadRequest& request,
                              const UploadConfig& config) = 0;

    virtual RemoteFile mkdir(const std::optional<std::string>& id,
                             const std::string& name,
                             const std::vector<std::string>& parents) = 0;

    // Identifiers usable for later mkdir/upload calls
    virtual std::vector<std::string> generateIds(size_t count) = 0;
};

}  // namespace drive

#endif  // DRIVE_TUI_CORE_HUB_H
