#pragma once

#include <string>
#include <map>
#include <chrono>
#include <optional>
#include <stdexcept>
#include "types.h"
#include "dispatcher.h"
#include "sandbox.h"
#include "tenant_quota.h"

namespace runcage {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error("Config error: " + message) {}
};

// Per-tenant settings from the "tenants" section
struct TenantConfig {
    bool premium = false;
    std::optional<ResourceProfile> profile;
    std::optional<TenantQuota::Limits> limits;
};

// Every tunable of one engine instance
struct EngineConfig {
    DispatcherConfig dispatcher;
    SandboxConfig sandbox;
    ResourceProfile default_profile;
    ResourceProfile premium_profile = premium_defaults();
    std::chrono::milliseconds hard_ceiling{HARD_TIMEOUT_CEILING_SECONDS * 1000};
    TenantQuota::Config tenant_limits;
    std::map<std::string, TenantConfig> tenants;
    std::optional<std::string> events_log;   // JSON-lines persistence file

    // Parse a JSON document; missing keys keep their defaults
    static EngineConfig from_json(const std::string& text);
    static EngineConfig from_file(const std::string& path);

    // Throws ConfigError on inconsistent values
    void validate() const;

    static ResourceProfile premium_defaults();
};

} // namespace runcage
