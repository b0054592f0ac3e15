#include "cancel_token.h"
#include <sys/eventfd.h>
#include <unistd.h>
#include <cstdint>
#include <iostream>

namespace runcage {

CancelToken::CancelToken() {
    event_fd_ = eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
    if (event_fd_ < 0) {
        // Waits fall back to interval checks of is_cancelled()
        std::cerr << "[CancelToken] eventfd unavailable, falling back to polling" << std::endl;
    }
}

CancelToken::~CancelToken() {
    if (event_fd_ >= 0) {
        close(event_fd_);
    }
}

bool CancelToken::cancel() {
    bool expected = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!cancelled_.compare_exchange_strong(expected, true)) {
            return false;
        }
    }

    if (event_fd_ >= 0) {
        uint64_t one = 1;
        if (write(event_fd_, &one, sizeof(one)) != sizeof(one)) {
            std::cerr << "[CancelToken] Failed to signal eventfd" << std::endl;
        }
    }
    cv_.notify_all();
    return true;
}

bool CancelToken::wait_until(Clock::time_point deadline) const {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_until(lock, deadline, [this] { return cancelled_.load(); });
    return cancelled_.load();
}

} // namespace runcage
