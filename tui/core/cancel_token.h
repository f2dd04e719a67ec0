#ifndef DRIVE_TUI_CORE_CANCEL_TOKEN_H
#define DRIVE_TUI_CORE_CANCEL_TOKEN_H

#include "transfer_error.h"
#include <atomic>
#include <memory>

namespace drive {

// Shared cancellation flag. Copies observe the same flag, which only
// ever goes from false to true.
class CancelToken {
public:
    CancelToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() const { flag_->store(true); }
    bool cancelled() const { return flag_->load(); }

    void throwIfCancelled() const {
        if (cancelled()) {
            throw TransferError(TransferError::Kind::Cancelled, "Cancelled");
        }
    }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

}  // namespace drive

#endif  // DRIVE_TUI_CORE_CANCEL_TOKEN_H
