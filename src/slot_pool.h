#pragma once

#include <string>
#include <vector>
#include <optional>
#include <mutex>

namespace runcage {

// Fixed arena of execution slots. A job runs only while it holds a slot and
// a slot never has two holders.
class SlotPool {
public:
    explicit SlotPool(size_t size);

    // Take a free slot for `job_id`; nullopt when all are in use
    std::optional<size_t> acquire(const std::string& job_id);

    // Give a slot back. Returns false if it was not held.
    bool release(size_t slot);

    std::optional<std::string> holder(size_t slot) const;
    size_t in_use() const;
    size_t available() const;
    size_t size() const { return size_; }

private:
    const size_t size_;
    mutable std::mutex mutex_;
    std::vector<std::optional<std::string>> slots_;
    size_t in_use_ = 0;
};

} // namespace runcage
