#pragma once

#include <string>
#include <map>
#include <set>
#include <deque>
#include <mutex>
#include <chrono>
#include "constants.h"

namespace runcage {

// Per-tenant admission accounting: active jobs, hourly submissions and an
// optional CPU-seconds-per-minute budget fed by measured usage.
class TenantQuota {
public:
    struct Limits {
        int max_active_jobs;            // Queued + running
        int max_jobs_per_hour;
        double cpu_seconds_per_minute;  // 0 disables the CPU budget

        Limits() :
            max_active_jobs(MAX_ACTIVE_JOBS_PER_TENANT),
            max_jobs_per_hour(MAX_JOBS_PER_HOUR),
            cpu_seconds_per_minute(CPU_SECONDS_PER_MINUTE) {}

        Limits(int active, int per_hour, double cpu_per_minute) :
            max_active_jobs(active),
            max_jobs_per_hour(per_hour),
            cpu_seconds_per_minute(cpu_per_minute) {}
    };

    struct Config {
        Limits standard;
        Limits premium;
        int cleanup_after_minutes;

        Config() :
            standard(),
            premium(PREMIUM_ACTIVE_JOBS_PER_TENANT, PREMIUM_JOBS_PER_HOUR, CPU_SECONDS_PER_MINUTE),
            cleanup_after_minutes(QUOTA_CLEANUP_MINUTES) {}
    };

    struct QuotaInfo {
        double cpu_seconds_used = 0;
        double cpu_seconds_available = 0;
        int active_jobs = 0;
        int jobs_this_hour = 0;
        bool can_submit = false;
        std::string reason;
    };

    explicit TenantQuota(const Config& config = Config());

    // Tenant-specific limits replace the tier defaults
    void set_tenant_limits(const std::string& tenant_id, const Limits& limits);
    void set_premium(const std::string& tenant_id, bool premium);

    // Check if tenant can submit a new job
    QuotaInfo check_quota(const std::string& tenant_id);

    // Register job admission. Returns false if the job is already active.
    bool register_job_start(const std::string& tenant_id, const std::string& job_id);

    // Register job completion with CPU usage
    void register_job_end(const std::string& tenant_id, const std::string& job_id, double cpu_seconds);

    // Remaining CPU seconds in the current minute (infinite when unlimited)
    double get_available_cpu_seconds(const std::string& tenant_id);

    // Forget tenants with no active jobs that were idle for a while
    void cleanup_old_entries();

    Limits limits_for(const std::string& tenant_id) const;

private:
    struct TenantState {
        std::deque<std::pair<std::chrono::steady_clock::time_point, double>> cpu_usage_history;
        std::set<std::string> active_jobs;
        std::deque<std::chrono::steady_clock::time_point> job_submissions;
        std::chrono::steady_clock::time_point last_seen;
    };

    Limits limits_locked(const std::string& tenant_id) const;
    void cleanup_history(TenantState& state, const std::chrono::steady_clock::time_point& now);
    double cpu_used_locked(const TenantState& state) const;

    Config config_;
    mutable std::mutex mutex_;
    std::map<std::string, TenantState> tenants_;
    std::map<std::string, Limits> tenant_limits_;
    std::set<std::string> premium_tenants_;
};

} // namespace runcage
