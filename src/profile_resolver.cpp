#include "profile_resolver.h"
#include <iostream>

namespace runcage {

namespace {

template <typename T>
void check_override(const char* name, T requested, T ceiling) {
    if (requested <= T{}) {
        throw ValidationError(std::string(name) + " override must be positive");
    }
    if (requested > ceiling) {
        throw QuotaExceededError(std::string(name) + " override exceeds the tenant ceiling");
    }
}

} // namespace

ResourceProfile apply_overrides(const ResourceProfile& ceiling, const ResourceOverrides& overrides) {
    ResourceProfile profile = ceiling;

    if (overrides.cpu_share) {
        check_override("cpu_share", *overrides.cpu_share, ceiling.cpu_share);
        profile.cpu_share = *overrides.cpu_share;
    }
    if (overrides.memory_limit_bytes) {
        check_override("memory_limit", *overrides.memory_limit_bytes, ceiling.memory_limit_bytes);
        profile.memory_limit_bytes = *overrides.memory_limit_bytes;
    }
    if (overrides.wall_clock_timeout) {
        check_override("wall_clock_timeout", overrides.wall_clock_timeout->count(),
                       ceiling.wall_clock_timeout.count());
        profile.wall_clock_timeout = *overrides.wall_clock_timeout;
    }
    if (overrides.max_output_bytes) {
        check_override("max_output", *overrides.max_output_bytes, ceiling.max_output_bytes);
        profile.max_output_bytes = *overrides.max_output_bytes;
    }

    if (profile != ceiling) {
        profile.name = ceiling.name + "+overrides";
    }
    return profile;
}

StaticProfileResolver::StaticProfileResolver(const ResourceProfile& default_profile,
                                             std::chrono::milliseconds hard_ceiling)
    : hard_ceiling_(hard_ceiling) {
    default_profile_ = clamp(default_profile);
    premium_profile_ = default_profile_;
    premium_profile_.name = "premium";
}

void StaticProfileResolver::set_premium_profile(const ResourceProfile& profile) {
    std::lock_guard<std::mutex> lock(mutex_);
    premium_profile_ = clamp(profile);
}

void StaticProfileResolver::set_premium(const std::string& tenant_id, bool premium) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (premium) {
        premium_tenants_.insert(tenant_id);
    } else {
        premium_tenants_.erase(tenant_id);
    }
}

void StaticProfileResolver::set_tenant_profile(const std::string& tenant_id,
                                               const ResourceProfile& profile) {
    std::lock_guard<std::mutex> lock(mutex_);
    tenant_profiles_[tenant_id] = clamp(profile);
}

ResourceProfile StaticProfileResolver::resolve(const std::string& tenant_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = tenant_profiles_.find(tenant_id);
    if (it != tenant_profiles_.end()) {
        return it->second;
    }
    if (premium_tenants_.count(tenant_id)) {
        return premium_profile_;
    }
    return default_profile_;
}

ResourceProfile StaticProfileResolver::clamp(ResourceProfile profile) const {
    if (profile.wall_clock_timeout > hard_ceiling_) {
        std::cerr << "[ProfileResolver] Profile " << profile.name << " timeout clamped to "
                  << hard_ceiling_.count() << "ms" << std::endl;
        profile.wall_clock_timeout = hard_ceiling_;
    }
    return profile;
}

} // namespace runcage
