#include "slot_pool.h"

namespace runcage {

SlotPool::SlotPool(size_t size) : size_(size), slots_(size) {}

std::optional<size_t> SlotPool::acquire(const std::string& job_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (size_t i = 0; i < slots_.size(); ++i) {
        if (!slots_[i]) {
            slots_[i] = job_id;
            ++in_use_;
            return i;
        }
    }
    return std::nullopt;
}

bool SlotPool::release(size_t slot) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (slot >= slots_.size() || !slots_[slot]) {
        return false;
    }
    slots_[slot].reset();
    --in_use_;
    return true;
}

std::optional<std::string> SlotPool::holder(size_t slot) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (slot >= slots_.size()) {
        return std::nullopt;
    }
    return slots_[slot];
}

size_t SlotPool::in_use() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_use_;
}

size_t SlotPool::available() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return size_ - in_use_;
}

} // namespace runcage
