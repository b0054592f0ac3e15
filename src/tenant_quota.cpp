#include "tenant_quota.h"
#include <algorithm>
#include <limits>
#include <sstream>

namespace runcage {

TenantQuota::TenantQuota(const Config& config) : config_(config) {}

void TenantQuota::set_tenant_limits(const std::string& tenant_id, const Limits& limits) {
    std::lock_guard<std::mutex> lock(mutex_);
    tenant_limits_[tenant_id] = limits;
}

void TenantQuota::set_premium(const std::string& tenant_id, bool premium) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (premium) {
        premium_tenants_.insert(tenant_id);
    } else {
        premium_tenants_.erase(tenant_id);
    }
}

TenantQuota::Limits TenantQuota::limits_for(const std::string& tenant_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return limits_locked(tenant_id);
}

TenantQuota::Limits TenantQuota::limits_locked(const std::string& tenant_id) const {
    auto it = tenant_limits_.find(tenant_id);
    if (it != tenant_limits_.end()) {
        return it->second;
    }
    return premium_tenants_.count(tenant_id) ? config_.premium : config_.standard;
}

TenantQuota::QuotaInfo TenantQuota::check_quota(const std::string& tenant_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = std::chrono::steady_clock::now();
    auto& state = tenants_[tenant_id];
    state.last_seen = now;

    cleanup_history(state, now);
    Limits limits = limits_locked(tenant_id);

    QuotaInfo info;
    info.active_jobs = static_cast<int>(state.active_jobs.size());
    info.jobs_this_hour = static_cast<int>(state.job_submissions.size());
    info.cpu_seconds_used = cpu_used_locked(state);
    info.cpu_seconds_available = limits.cpu_seconds_per_minute > 0
        ? std::max(0.0, limits.cpu_seconds_per_minute - info.cpu_seconds_used)
        : std::numeric_limits<double>::infinity();

    std::ostringstream reason;
    if (info.active_jobs >= limits.max_active_jobs) {
        reason << "Too many active jobs (" << info.active_jobs << "/" << limits.max_active_jobs << ")";
    } else if (info.jobs_this_hour >= limits.max_jobs_per_hour) {
        reason << "Hourly job limit reached (" << limits.max_jobs_per_hour << " jobs/hour)";
    } else if (limits.cpu_seconds_per_minute > 0 && info.cpu_seconds_available <= 0) {
        reason << "CPU budget exhausted (" << limits.cpu_seconds_per_minute << " CPU seconds/minute)";
    }

    info.reason = reason.str();
    info.can_submit = info.reason.empty();
    return info;
}

bool TenantQuota::register_job_start(const std::string& tenant_id, const std::string& job_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = std::chrono::steady_clock::now();
    auto& state = tenants_[tenant_id];

    if (!state.active_jobs.insert(job_id).second) {
        return false;
    }
    state.job_submissions.push_back(now);
    state.last_seen = now;
    return true;
}

void TenantQuota::register_job_end(const std::string& tenant_id, const std::string& job_id,
                                   double cpu_seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = std::chrono::steady_clock::now();
    auto& state = tenants_[tenant_id];

    state.active_jobs.erase(job_id);
    if (cpu_seconds > 0) {
        state.cpu_usage_history.emplace_back(now, cpu_seconds);
    }
    state.last_seen = now;
}

double TenantQuota::get_available_cpu_seconds(const std::string& tenant_id) {
    return check_quota(tenant_id).cpu_seconds_available;
}

void TenantQuota::cleanup_old_entries() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = std::chrono::steady_clock::now();
    auto idle_limit = std::chrono::minutes(config_.cleanup_after_minutes);

    for (auto it = tenants_.begin(); it != tenants_.end();) {
        cleanup_history(it->second, now);
        bool idle = it->second.active_jobs.empty() && it->second.job_submissions.empty() &&
                    now - it->second.last_seen > idle_limit;
        it = idle ? tenants_.erase(it) : std::next(it);
    }
}

void TenantQuota::cleanup_history(TenantState& state, const std::chrono::steady_clock::time_point& now) {
    auto minute_ago = now - std::chrono::minutes(1);
    while (!state.cpu_usage_history.empty() && state.cpu_usage_history.front().first < minute_ago) {
        state.cpu_usage_history.pop_front();
    }

    auto hour_ago = now - std::chrono::hours(1);
    while (!state.job_submissions.empty() && state.job_submissions.front() < hour_ago) {
        state.job_submissions.pop_front();
    }
}

double TenantQuota::cpu_used_locked(const TenantState& state) const {
    double total = 0;
    for (const auto& [when, seconds] : state.cpu_usage_history) {
        total += seconds;
    }
    return total;
}

} // namespace runcage
