#include "dispatcher.h"
#include "supervisor.h"
#include "file_utils.h"
#include <iostream>
#include <algorithm>
#include <cctype>

namespace runcage {

namespace {

const size_t MAX_JOB_ID_LENGTH = 128;

bool valid_job_id(const std::string& id) {
    if (id.empty() || id.size() > MAX_JOB_ID_LENGTH) {
        return false;
    }
    return std::all_of(id.begin(), id.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '_' || c == '-';
    });
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

// CPU seconds charged against the tenant's budget for a finished job.
// Timeouts carry no rusage, so they are charged their full share.
double charged_cpu_seconds(const ExecutionResult& result, double cpu_share) {
    if (auto* r = std::get_if<SuccessResult>(&result)) {
        return r->usage.cpu_seconds;
    }
    if (auto* r = std::get_if<PartialOutputResult>(&result)) {
        return r->usage.cpu_seconds;
    }
    if (auto* r = std::get_if<FailureResult>(&result)) {
        return r->usage.cpu_seconds;
    }
    if (auto* r = std::get_if<TimedOutResult>(&result)) {
        return std::chrono::duration<double>(r->duration).count() * cpu_share;
    }
    return 0.0;
}

} // namespace

Json::Value to_json(const JobStatus& status) {
    Json::Value json;
    json["job_id"] = status.job_id;
    json["tenant_id"] = status.tenant_id;
    json["state"] = to_string(status.state);
    json["script_sha256"] = status.script_sha256;
    json["profile"] = status.profile_name;
    json["submitted_at"] = format_timestamp(status.submitted_at);
    if (status.result) {
        json["result"] = to_json(*status.result);
    }
    return json;
}

Dispatcher::Dispatcher(const DispatcherConfig& config,
                       SandboxRunner& runner,
                       const ProfileResolver& resolver,
                       TenantQuota& quota,
                       std::shared_ptr<PersistenceSink> sink)
    : config_(config),
      runner_(runner),
      resolver_(resolver),
      quota_(quota),
      sink_(std::move(sink)),
      slots_(config.pool_size > 0 ? static_cast<size_t>(config.pool_size) : 0) {
    if (config_.pool_size <= 0) {
        throw std::invalid_argument("Dispatcher pool size must be positive");
    }
    if (config_.queue_capacity == 0) {
        throw std::invalid_argument("Dispatcher queue capacity must be positive");
    }

    workers_.reserve(config_.pool_size);
    for (int i = 0; i < config_.pool_size; ++i) {
        workers_.emplace_back(&Dispatcher::worker_loop, this, i);
    }

    std::cout << "[Dispatcher] Started " << config_.pool_size << " workers (queue capacity "
              << config_.queue_capacity << ", network " << to_string(config_.network_policy)
              << ")" << std::endl;
}

Dispatcher::~Dispatcher() {
    shutdown();
}

void Dispatcher::validate(const ExecutionJob& job) const {
    if (job.tenant_id.empty()) {
        throw ValidationError("tenant id is required");
    }
    if (job.script.empty()) {
        throw ValidationError("script is empty");
    }
    if (job.script.size() > config_.max_script_bytes) {
        throw ValidationError("script is " + std::to_string(job.script.size()) +
                              " bytes, maximum is " + std::to_string(config_.max_script_bytes));
    }
    if (!job.id.empty() && !valid_job_id(job.id)) {
        throw ValidationError("job id must be 1-128 characters of [A-Za-z0-9._-]");
    }
    if (job.target_url && !starts_with(*job.target_url, "http://") &&
        !starts_with(*job.target_url, "https://")) {
        throw ValidationError("target URL must be http:// or https://");
    }
}

std::string Dispatcher::submit(ExecutionJob job) {
    validate(job);

    // Resolved outside the lock: the resolver is an external collaborator
    ResourceProfile ceiling = resolver_.resolve(job.tenant_id);
    job.profile = apply_overrides(ceiling, job.overrides);
    job.network_access = egress_allowed(config_.network_policy, job.target_url);
    job.script_sha256 = FileUtils::sha256_string(job.script);
    job.submitted_at = std::chrono::system_clock::now();

    auto record = std::make_shared<JobRecord>();
    std::string job_id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            throw BackpressureError("engine is shutting down");
        }
        purge_expired_locked(Clock::now());

        if (job.id.empty()) {
            do {
                job.id = FileUtils::random_hex(16);
            } while (records_.count(job.id));
        } else if (records_.count(job.id)) {
            throw ValidationError("job id already in use: " + job.id);
        }

        if (queued_total_ >= config_.queue_capacity) {
            std::cerr << "[Dispatcher] Rejected job for tenant " << job.tenant_id
                      << ": queue full (" << queued_total_ << ")" << std::endl;
            throw BackpressureError("ready queue is full (" +
                                    std::to_string(config_.queue_capacity) + " jobs)");
        }

        auto quota = quota_.check_quota(job.tenant_id);
        if (!quota.can_submit) {
            std::cerr << "[Dispatcher] Rejected job for tenant " << job.tenant_id
                      << ": " << quota.reason << std::endl;
            throw QuotaExceededError(quota.reason);
        }
        if (!quota_.register_job_start(job.tenant_id, job.id)) {
            throw ValidationError("job id already active: " + job.id);
        }

        job_id = job.id;
        record->job = std::move(job);
        records_[job_id] = record;
        enqueue_locked(record);
    }
    work_available_.notify_one();

    std::cout << "[Dispatcher] Admitted job " << job_id << " for tenant " << record->job.tenant_id
              << " (profile " << record->job.profile.name << ", "
              << record->job.script.size() << " bytes)" << std::endl;
    return job_id;
}

bool Dispatcher::cancel(const std::string& job_id) {
    std::shared_ptr<JobRecord> removed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = records_.find(job_id);
        if (it == records_.end() || it->second->state == JobState::TERMINAL) {
            return false;
        }
        auto& record = it->second;
        record->cancel->cancel();

        // Still waiting in the queue: never reaches a sandbox
        if (record->state == JobState::QUEUED && remove_queued_locked(*record)) {
            record->state = JobState::TERMINAL;
            finish_locked(*record, CancelledResult{});
            removed = record;
        }
    }

    if (removed) {
        std::cout << "[Dispatcher] Cancelled queued job " << job_id << std::endl;
        publish(removed, JobState::QUEUED, JobState::TERMINAL);
        work_available_.notify_all();
    } else {
        std::cout << "[Dispatcher] Cancellation signalled to job " << job_id << std::endl;
    }
    return true;
}

std::optional<JobStatus> Dispatcher::status(const std::string& job_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(job_id);
    if (it == records_.end()) {
        return std::nullopt;
    }
    const JobRecord& record = *it->second;
    if (record.finished_at && Clock::now() - *record.finished_at > config_.retention) {
        return std::nullopt;
    }

    JobStatus status;
    status.job_id = record.job.id;
    status.tenant_id = record.job.tenant_id;
    status.state = record.state;
    if (record.state == JobState::TERMINAL) {
        status.result = record.result;
    }
    status.script_sha256 = record.job.script_sha256;
    status.profile_name = record.job.profile.name;
    status.submitted_at = record.job.submitted_at;
    return status;
}

std::shared_ptr<const EventLog> Dispatcher::events(const std::string& job_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(job_id);
    if (it == records_.end()) {
        return nullptr;
    }
    return it->second->events;
}

size_t Dispatcher::queued_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queued_total_;
}

size_t Dispatcher::active_count() const {
    return slots_.in_use();
}

void Dispatcher::purge_expired() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        purge_expired_locked(Clock::now());
    }
    quota_.cleanup_old_entries();
}

void Dispatcher::shutdown() {
    std::vector<std::shared_ptr<JobRecord>> cancelled;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!stopping_) {
            stopping_ = true;
            for (auto& entry : records_) {
                auto& record = entry.second;
                if (record->state == JobState::TERMINAL) {
                    continue;
                }
                record->cancel->cancel();
                if (record->state == JobState::QUEUED && remove_queued_locked(*record)) {
                    record->state = JobState::TERMINAL;
                    finish_locked(*record, CancelledResult{});
                    cancelled.push_back(record);
                }
            }
            std::cout << "[Dispatcher] Shutting down (" << cancelled.size()
                      << " queued jobs cancelled)" << std::endl;
        }
    }
    work_available_.notify_all();

    for (auto& record : cancelled) {
        publish(record, JobState::QUEUED, JobState::TERMINAL);
    }

    std::lock_guard<std::mutex> join_lock(join_mutex_);
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void Dispatcher::enqueue_locked(const std::shared_ptr<JobRecord>& record) {
    const std::string& tenant = record->job.tenant_id;
    auto& queue = tenant_queues_[tenant];
    if (queue.empty()) {
        tenant_ring_.push_back(tenant);
    }
    queue.push_back(record->job.id);
    ++queued_total_;
}

std::shared_ptr<Dispatcher::JobRecord> Dispatcher::pop_next_locked() {
    while (!tenant_ring_.empty()) {
        std::string tenant = tenant_ring_.front();
        tenant_ring_.pop_front();

        auto queue_it = tenant_queues_.find(tenant);
        if (queue_it == tenant_queues_.end() || queue_it->second.empty()) {
            tenant_queues_.erase(tenant);
            continue;
        }

        std::string job_id = queue_it->second.front();
        queue_it->second.pop_front();
        --queued_total_;

        // Tenant goes to the back of the ring if it still has work
        if (queue_it->second.empty()) {
            tenant_queues_.erase(queue_it);
        } else {
            tenant_ring_.push_back(tenant);
        }

        auto record_it = records_.find(job_id);
        if (record_it != records_.end()) {
            return record_it->second;
        }
    }
    return nullptr;
}

bool Dispatcher::remove_queued_locked(const JobRecord& record) {
    const std::string& tenant = record.job.tenant_id;
    auto queue_it = tenant_queues_.find(tenant);
    if (queue_it == tenant_queues_.end()) {
        return false;
    }

    auto& queue = queue_it->second;
    auto pos = std::find(queue.begin(), queue.end(), record.job.id);
    if (pos == queue.end()) {
        return false;
    }
    queue.erase(pos);
    --queued_total_;

    if (queue.empty()) {
        tenant_queues_.erase(queue_it);
        tenant_ring_.erase(std::remove(tenant_ring_.begin(), tenant_ring_.end(), tenant),
                           tenant_ring_.end());
    }
    return true;
}

void Dispatcher::finish_locked(JobRecord& record, ExecutionResult result) {
    double cpu = charged_cpu_seconds(result, record.job.profile.cpu_share);
    record.result = std::move(result);
    record.finished_at = Clock::now();
    quota_.register_job_end(record.job.tenant_id, record.job.id, cpu);
}

void Dispatcher::purge_expired_locked(Clock::time_point now) {
    for (auto it = records_.begin(); it != records_.end();) {
        const auto& record = it->second;
        if (record->finished_at && now - *record->finished_at > config_.retention) {
            it = records_.erase(it);
        } else {
            ++it;
        }
    }
}

void Dispatcher::worker_loop(int worker_index) {
    while (true) {
        std::shared_ptr<JobRecord> record;
        std::optional<size_t> slot;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            work_available_.wait(lock, [this] {
                return stopping_ || (queued_total_ > 0 && slots_.available() > 0);
            });
            if (stopping_) {
                break;
            }

            record = pop_next_locked();
            if (!record) {
                continue;
            }
            // Slots are only taken under mutex_, so the wait predicate holds
            slot = slots_.acquire(record->job.id);
            if (!slot) {
                std::cerr << "[Dispatcher] Worker " << worker_index
                          << " found no free slot for job " << record->job.id << std::endl;
                enqueue_locked(record);
                continue;
            }
        }

        run_job(record);
        slots_.release(*slot);

        {
            std::lock_guard<std::mutex> lock(mutex_);
            purge_expired_locked(Clock::now());
        }
        work_available_.notify_all();
    }
}

void Dispatcher::run_job(const std::shared_ptr<JobRecord>& record) {
    Supervisor supervisor(runner_, [this, record](JobState from, JobState to, ExecutionResult* result) {
        on_transition(record, from, to, result);
    });
    supervisor.run(record->job, *record->cancel);
}

void Dispatcher::on_transition(const std::shared_ptr<JobRecord>& record,
                               JobState from, JobState to, ExecutionResult* result) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        record->state = to;
        if (to == JobState::TERMINAL && result) {
            // A cancel() that saw a non-terminal state must win
            if (record->cancel->is_cancelled()) {
                *result = CancelledResult{};
            }
            finish_locked(*record, *result);
        }
    }
    publish(record, from, to);
}

void Dispatcher::publish(const std::shared_ptr<JobRecord>& record, JobState from, JobState to) {
    LifecycleEvent event;
    event.job_id = record->job.id;
    event.tenant_id = record->job.tenant_id;
    event.from = from;
    event.to = to;
    event.timestamp = std::chrono::system_clock::now();
    event.script_sha256 = record->job.script_sha256;
    if (to == JobState::TERMINAL && record->result) {
        event.detail = result_kind(*record->result);
    }

    record->events->append(event);

    if (!sink_) {
        return;
    }
    try {
        sink_->record_event(event);
        if (to == JobState::TERMINAL && record->result) {
            sink_->record_result(record->job.id, record->job.tenant_id,
                                 record->job.script_sha256, *record->result);
        }
    } catch (const std::exception& e) {
        std::cerr << "[Dispatcher] Persistence sink failed for job " << record->job.id
                  << ": " << e.what() << std::endl;
    }
}

} // namespace runcage
