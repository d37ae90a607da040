#pragma once

#include <atomic>
#include <memory>

// Run-level cancellation flag. Copies share state, so a token handed to the
// scheduler is cancelled by cancelling any copy.
class CancelToken {
public:
    CancelToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() const { flag_->store(true); }
    bool is_cancelled() const { return flag_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};
