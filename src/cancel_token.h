#pragma once

#include <atomic>
#include <mutex>
#include <condition_variable>
#include "types.h"

namespace runcage {

// One-shot cancellation signal shared between the Dispatcher (which fires it)
// and the Supervisor/Runner (which race it against process exit). Exposes an
// eventfd so it can sit in the same poll() set as the sandbox pipes.
class CancelToken {
public:
    CancelToken();
    ~CancelToken();

    CancelToken(const CancelToken&) = delete;
    CancelToken& operator=(const CancelToken&) = delete;

    // Fire the token. Returns false if it had already been fired.
    bool cancel();

    bool is_cancelled() const { return cancelled_.load(); }

    // Readable once cancelled; -1 when no eventfd could be created
    int fd() const { return event_fd_; }

    // Block until cancelled or the deadline passes. Returns is_cancelled().
    bool wait_until(Clock::time_point deadline) const;

private:
    std::atomic<bool> cancelled_{false};
    int event_fd_ = -1;
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
};

} // namespace runcage
