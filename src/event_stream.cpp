#include "event_stream.h"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace runcage {

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
    auto time = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;
    std::tm utc{};
    gmtime_r(&time, &utc);

    std::ostringstream out;
    out << std::put_time(&utc, "%FT%T") << '.'
        << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return out.str();
}

Json::Value to_json(const LifecycleEvent& event) {
    Json::Value json;
    json["job_id"] = event.job_id;
    json["tenant_id"] = event.tenant_id;
    json["from"] = to_string(event.from);
    json["to"] = to_string(event.to);
    json["timestamp"] = format_timestamp(event.timestamp);
    json["sequence"] = static_cast<Json::UInt64>(event.sequence);
    json["script_sha256"] = event.script_sha256;
    if (!event.detail.empty()) {
        json["detail"] = event.detail;
    }
    return json;
}

void EventLog::append(LifecycleEvent event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        event.sequence = events_.size();
        if (event.to == JobState::TERMINAL) {
            closed_ = true;
        }
        events_.push_back(std::move(event));
    }
    changed_.notify_all();
}

std::optional<LifecycleEvent> EventLog::wait_for_event(
    size_t index,
    std::optional<Clock::time_point> deadline) const {
    std::unique_lock<std::mutex> lock(mutex_);
    auto ready = [this, index] { return index < events_.size() || closed_; };

    if (deadline) {
        changed_.wait_until(lock, *deadline, ready);
    } else {
        changed_.wait(lock, ready);
    }

    if (index < events_.size()) {
        return events_[index];
    }
    return std::nullopt;
}

std::vector<LifecycleEvent> EventLog::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_;
}

bool EventLog::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

EventStream::EventStream(std::shared_ptr<const EventLog> log) : log_(std::move(log)) {}

std::optional<LifecycleEvent> EventStream::next() {
    return advance(std::nullopt);
}

std::optional<LifecycleEvent> EventStream::next_for(std::chrono::milliseconds timeout) {
    return advance(Clock::now() + timeout);
}

std::optional<LifecycleEvent> EventStream::advance(std::optional<Clock::time_point> deadline) {
    if (finished_ || !log_) {
        finished_ = true;
        return std::nullopt;
    }

    auto event = log_->wait_for_event(cursor_, deadline);
    if (!event) {
        // Closed with nothing left to read means the stream is over
        if (log_->closed()) {
            finished_ = true;
        }
        return std::nullopt;
    }

    ++cursor_;
    if (event->to == JobState::TERMINAL) {
        finished_ = true;
    }
    return event;
}

} // namespace runcage
