#ifndef DRIVE_TUI_CORE_PROGRESS_IO_H
#define DRIVE_TUI_CORE_PROGRESS_IO_H

#include "hub.h"
#include "cancel_token.h"
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <istream>
#include <memory>
#include <string>

// OpenSSL digest context (forward declared to keep OpenSSL out of the header)
typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace drive {

// Wraps an input stream for chunked uploads. Every read and seek first
// checks the cancel token and throws TransferError(Cancelled) once it is
// set. Reported progress never decreases, even when the uploader seeks
// back to resend a chunk.
class ProgressReader : public ReadSeekStream {
public:
    using ProgressCallback = std::function<void(uint64_t bytes)>;

    ProgressReader(std::istream& inner, CancelToken cancel, ProgressCallback onProgress);

    size_t read(char* buffer, size_t length) override;
    uint64_t seek(uint64_t position) override;

    uint64_t position() const { return position_; }
    uint64_t reported() const { return reported_; }

private:
    void report();

    std::istream& inner_;
    CancelToken cancel_;
    ProgressCallback onProgress_;
    uint64_t position_ = 0;
    uint64_t reported_ = 0;
};

// Writes a file while feeding every byte into a running MD5 digest
class Md5Writer {
public:
    // Creates or truncates `path`. Throws TransferError(Io).
    explicit Md5Writer(const std::filesystem::path& path);
    ~Md5Writer();

    void write(const char* data, size_t length);
    void write(const std::string& data) { write(data.data(), data.size()); }

    // Flushes and closes the file. Throws TransferError(Io).
    void close();

    // Lowercase hex digest of everything written. Finalizes the digest,
    // so it may only be called once.
    std::string md5();

    uint64_t bytesWritten() const { return written_; }

private:
    std::ofstream out_;
    std::unique_ptr<EVP_MD_CTX, void (*)(EVP_MD_CTX*)> ctx_;
    uint64_t written_ = 0;
    bool finalized_ = false;

    Md5Writer(const Md5Writer&) = delete;
    Md5Writer& operator=(const Md5Writer&) = delete;
};

// Lowercase hex MD5 of a buffer
std::string md5Hex(const std::string& data);

}  // namespace drive

#endif  // DRIVE_TUI_CORE_PROGRESS_IO_H
