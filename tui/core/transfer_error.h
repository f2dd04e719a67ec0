#ifndef DRIVE_TUI_CORE_TRANSFER_ERROR_H
#define DRIVE_TUI_CORE_TRANSFER_ERROR_H

#include <stdexcept>
#include <string>

namespace drive {

// Terminal failure of an upload or download job
class TransferError : public std::runtime_error {
public:
    enum class Kind {
        Invalid,     // wrong item kind, bad destination, existing file
        Remote,      // listing/get/mkdir/upload/download failures
        Io,          // local filesystem failures
        Integrity,   // checksum mismatch
        Cancelled
    };

    TransferError(Kind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    Kind kind() const { return kind_; }

private:
    Kind kind_;
};

inline const char* transferErrorKindStr(TransferError::Kind kind) {
    switch (kind) {
        case TransferError::Kind::Invalid: return "Invalid request";
        case TransferError::Kind::Remote: return "Remote error";
        case TransferError::Kind::Io: return "I/O error";
        case TransferError::Kind::Integrity: return "Integrity error";
        case TransferError::Kind::Cancelled: return "Cancelled";
    }
    return "Undefined error";
}

}  // namespace drive

#endif  // DRIVE_TUI_CORE_TRANSFER_ERROR_H
