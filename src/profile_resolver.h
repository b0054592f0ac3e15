#pragma once

#include <string>
#include <map>
#include <set>
#include <mutex>
#include <chrono>
#include "types.h"

namespace runcage {

// Collaborator that maps a tenant to its resource ceilings
class ProfileResolver {
public:
    virtual ~ProfileResolver() = default;

    // Ceiling profile for the tenant (never fails; unknown tenants get the
    // system-wide default)
    virtual ResourceProfile resolve(const std::string& tenant_id) const = 0;
};

// Narrow `ceiling` by per-submission overrides.
// Throws ValidationError for non-positive values and QuotaExceededError for
// values above the ceiling.
ResourceProfile apply_overrides(const ResourceProfile& ceiling, const ResourceOverrides& overrides);

// In-memory resolver: default profile, premium tier, per-tenant profiles.
// Every wall-clock timeout is clamped to the hard ceiling.
class StaticProfileResolver : public ProfileResolver {
public:
    StaticProfileResolver(const ResourceProfile& default_profile,
                          std::chrono::milliseconds hard_ceiling);

    void set_premium_profile(const ResourceProfile& profile);
    void set_premium(const std::string& tenant_id, bool premium);
    void set_tenant_profile(const std::string& tenant_id, const ResourceProfile& profile);

    ResourceProfile resolve(const std::string& tenant_id) const override;

    std::chrono::milliseconds hard_ceiling() const { return hard_ceiling_; }

private:
    ResourceProfile clamp(ResourceProfile profile) const;

    mutable std::mutex mutex_;
    ResourceProfile default_profile_;
    ResourceProfile premium_profile_;
    std::chrono::milliseconds hard_ceiling_;
    std::set<std::string> premium_tenants_;
    std::map<std::string, ResourceProfile> tenant_profiles_;
};

} // namespace runcage
