#include "progress_io.h"
#include <openssl/evp.h>
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <utility>

namespace drive {

namespace {

std::string toHex(const unsigned char* data, unsigned int length) {
    std::ostringstream oss;
    for (unsigned int i = 0; i < length; i++) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
    }
    return oss.str();
}

EVP_MD_CTX* newMd5Context() {
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        throw TransferError(TransferError::Kind::Io, "Failed to create MD5 context");
    }
    if (EVP_DigestInit_ex(ctx, EVP_md5(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx);
        throw TransferError(TransferError::Kind::Io, "Failed to initialize MD5 context");
    }
    return ctx;
}

}  // namespace

ProgressReader::ProgressReader(std::istream& inner, CancelToken cancel, ProgressCallback onProgress)
    : inner_(inner), cancel_(std::move(cancel)), onProgress_(std::move(onProgress)) {}

size_t ProgressReader::read(char* buffer, size_t length) {
    cancel_.throwIfCancelled();

    inner_.read(buffer, static_cast<std::streamsize>(length));
    if (inner_.bad()) {
        throw TransferError(TransferError::Kind::Io, "Failed to read upload source");
    }
    auto count = static_cast<size_t>(inner_.gcount());
    if (count > 0) {
        position_ += count;
        report();
    }
    return count;
}

uint64_t ProgressReader::seek(uint64_t position) {
    cancel_.throwIfCancelled();

    // A previous read may have hit EOF
    inner_.clear();
    inner_.seekg(static_cast<std::streamoff>(position), std::ios::beg);
    if (inner_.fail()) {
        throw TransferError(TransferError::Kind::Io,
            "Failed to seek upload source to offset " + std::to_string(position));
    }
    position_ = position;
    report();
    return position_;
}

void ProgressReader::report() {
    if (position_ <= reported_) return;
    reported_ = position_;
    if (onProgress_) {
        onProgress_(reported_);
    }
}

Md5Writer::Md5Writer(const std::filesystem::path& path)
    : out_(path, std::ios::binary | std::ios::trunc), ctx_(newMd5Context(), EVP_MD_CTX_free) {
    if (!out_.is_open()) {
        throw TransferError(TransferError::Kind::Io,
            "Failed to create '" + path.string() + "'");
    }
}

Md5Writer::~Md5Writer() = default;

void Md5Writer::write(const char* data, size_t length) {
    out_.write(data, static_cast<std::streamsize>(length));
    if (!out_) {
        throw TransferError(TransferError::Kind::Io, "Failed to write downloaded data");
    }
    if (EVP_DigestUpdate(ctx_.get(), data, length) != 1) {
        throw TransferError(TransferError::Kind::Io, "Failed to update MD5 digest");
    }
    written_ += length;
}

void Md5Writer::close() {
    if (!out_.is_open()) return;
    out_.flush();
    out_.close();
    if (out_.fail()) {
        throw TransferError(TransferError::Kind::Io, "Failed to flush downloaded data");
    }
}

std::string Md5Writer::md5() {
    if (finalized_) {
        throw TransferError(TransferError::Kind::Io, "MD5 digest already finalized");
    }
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), digest, &length) != 1) {
        throw TransferError(TransferError::Kind::Io, "Failed to finalize MD5 digest");
    }
    finalized_ = true;
    return toHex(digest, length);
}

std::string md5Hex(const std::string& data) {
    std::unique_ptr<EVP_MD_CTX, void (*)(EVP_MD_CTX*)> ctx(newMd5Context(), EVP_MD_CTX_free);
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest, &length) != 1) {
        throw TransferError(TransferError::Kind::Io, "Failed to compute MD5 digest");
    }
    return toHex(digest, length);
}

}  // namespace drive
