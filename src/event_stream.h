#pragma once

#include <string>
#include <vector>
#include <mutex>
#include <memory>
#include <optional>
#include <condition_variable>
#include <chrono>
#include <cstdint>
#include <json/json.h>
#include "types.h"

namespace runcage {

// One state transition of one job
struct LifecycleEvent {
    std::string job_id;
    std::string tenant_id;
    JobState from = JobState::QUEUED;
    JobState to = JobState::QUEUED;
    std::chrono::system_clock::time_point timestamp;
    uint64_t sequence = 0;        // Position in the job's event log
    std::string script_sha256;
    std::string detail;           // Result kind on the terminal transition
};

Json::Value to_json(const LifecycleEvent& event);

// ISO 8601 UTC with milliseconds, e.g. 2024-05-01T12:00:00.250Z
std::string format_timestamp(std::chrono::system_clock::time_point tp);

// Append-only event history of one job. Closed by the terminal transition;
// late readers replay from the beginning.
class EventLog {
public:
    // Append an event, assigning its sequence. Ignored once closed.
    void append(LifecycleEvent event);

    // Event at `index`, waiting until it exists, the log closes, or the
    // deadline passes. nullopt when there is no such event (yet).
    std::optional<LifecycleEvent> wait_for_event(
        size_t index,
        std::optional<Clock::time_point> deadline = std::nullopt) const;

    std::vector<LifecycleEvent> snapshot() const;
    bool closed() const;

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable changed_;
    std::vector<LifecycleEvent> events_;
    bool closed_ = false;
};

// Lazy, finite sequence over one job's events. Ends after the transition
// into TERMINAL has been read.
class EventStream {
public:
    explicit EventStream(std::shared_ptr<const EventLog> log);

    // Block until the next event; nullopt once the stream has ended
    std::optional<LifecycleEvent> next();

    // Like next() but gives up after `timeout`; check finished() to tell a
    // timeout from the end of the stream
    std::optional<LifecycleEvent> next_for(std::chrono::milliseconds timeout);

    bool finished() const { return finished_; }

private:
    std::optional<LifecycleEvent> advance(std::optional<Clock::time_point> deadline);

    std::shared_ptr<const EventLog> log_;
    size_t cursor_ = 0;
    bool finished_ = false;
};

} // namespace runcage
