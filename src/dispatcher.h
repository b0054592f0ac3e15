#pragma once

#include <string>
#include <map>
#include <deque>
#include <vector>
#include <memory>
#include <mutex>
#include <thread>
#include <optional>
#include <unordered_map>
#include <condition_variable>
#include <json/json.h>
#include "types.h"
#include "execution_job.h"
#include "execution_result.h"
#include "event_stream.h"
#include "cancel_token.h"
#include "sandbox_runner.h"
#include "profile_resolver.h"
#include "tenant_quota.h"
#include "persistence.h"
#include "slot_pool.h"

namespace runcage {

struct DispatcherConfig {
    int pool_size = DEFAULT_POOL_SIZE;                   // Concurrent sandboxes
    size_t queue_capacity = DEFAULT_QUEUE_CAPACITY;      // Queued jobs across all tenants
    size_t max_script_bytes = MAX_SCRIPT_SIZE;
    std::chrono::milliseconds retention{JOB_RETENTION_SECONDS * 1000};
    NetworkPolicy network_policy = NetworkPolicy::TARGET_ONLY;
};

// Snapshot of one job as seen by get_status()
struct JobStatus {
    std::string job_id;
    std::string tenant_id;
    JobState state = JobState::QUEUED;
    std::optional<ExecutionResult> result;   // Present only when state == TERMINAL
    std::string script_sha256;
    std::string profile_name;
    std::chrono::system_clock::time_point submitted_at;
};

Json::Value to_json(const JobStatus& status);

// Admits jobs into a bounded ready queue, schedules them round-robin across
// tenants onto a fixed pool of workers, and owns the registry of live jobs.
class Dispatcher {
public:
    Dispatcher(const DispatcherConfig& config,
               SandboxRunner& runner,
               const ProfileResolver& resolver,
               TenantQuota& quota,
               std::shared_ptr<PersistenceSink> sink = nullptr);
    ~Dispatcher();

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    // Validate, resolve the profile, admit and enqueue. Non-blocking.
    // Throws ValidationError, BackpressureError or QuotaExceededError.
    // A caller-chosen id is rejected only while a record with that id is held,
    // live or terminal within the retention window. After the purge the id is
    // free again; generated ids are 128 random bits.
    std::string submit(ExecutionJob job);

    // Best-effort: removes a queued job, or signals the job's Supervisor.
    // False for unknown or already terminal jobs.
    bool cancel(const std::string& job_id);

    std::optional<JobStatus> status(const std::string& job_id) const;

    // Event history of a job; nullptr for unknown jobs
    std::shared_ptr<const EventLog> events(const std::string& job_id) const;

    size_t queued_count() const;
    size_t active_count() const;      // Jobs holding a slot
    size_t pool_size() const { return slots_.size(); }

    // Drop terminal records older than the retention period
    void purge_expired();

    // Cancel everything and stop the workers. Idempotent.
    void shutdown();

private:
    struct JobRecord {
        ExecutionJob job;
        JobState state = JobState::QUEUED;
        std::optional<ExecutionResult> result;
        std::shared_ptr<CancelToken> cancel = std::make_shared<CancelToken>();
        std::shared_ptr<EventLog> events = std::make_shared<EventLog>();
        std::optional<Clock::time_point> finished_at;
    };

    void validate(const ExecutionJob& job) const;
    void enqueue_locked(const std::shared_ptr<JobRecord>& record);
    std::shared_ptr<JobRecord> pop_next_locked();
    bool remove_queued_locked(const JobRecord& record);
    void finish_locked(JobRecord& record, ExecutionResult result);
    void purge_expired_locked(Clock::time_point now);

    void worker_loop(int worker_index);
    void run_job(const std::shared_ptr<JobRecord>& record);
    void on_transition(const std::shared_ptr<JobRecord>& record,
                       JobState from, JobState to, ExecutionResult* result);
    void publish(const std::shared_ptr<JobRecord>& record, JobState from, JobState to);

    DispatcherConfig config_;
    SandboxRunner& runner_;
    const ProfileResolver& resolver_;
    TenantQuota& quota_;
    std::shared_ptr<PersistenceSink> sink_;
    SlotPool slots_;

    mutable std::mutex mutex_;
    std::condition_variable work_available_;
    std::unordered_map<std::string, std::shared_ptr<JobRecord>> records_;
    std::map<std::string, std::deque<std::string>> tenant_queues_;   // Tenant -> queued job ids
    std::deque<std::string> tenant_ring_;                            // Round-robin order
    size_t queued_total_ = 0;
    bool stopping_ = false;

    std::mutex join_mutex_;
    std::vector<std::thread> workers_;
};

} // namespace runcage
