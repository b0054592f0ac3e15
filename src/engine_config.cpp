#include "engine_config.h"
#include <json/json.h>
#include <fstream>
#include <sstream>

namespace runcage {

namespace {

const size_t MB = 1024 * 1024;
const size_t KB = 1024;

const Json::Value& section(const Json::Value& root, const char* name) {
    const Json::Value& value = root[name];
    if (!value.isNull() && !value.isObject()) {
        throw ConfigError(std::string("'") + name + "' must be an object");
    }
    return value;
}

template <typename T>
void read_int(const Json::Value& obj, const char* key, const std::string& where, T& out) {
    if (!obj.isMember(key)) return;
    const Json::Value& v = obj[key];
    if (!v.isIntegral()) {
        throw ConfigError(where + "." + key + " must be an integer");
    }
    out = static_cast<T>(v.asInt64());
}

void read_double(const Json::Value& obj, const char* key, const std::string& where, double& out) {
    if (!obj.isMember(key)) return;
    const Json::Value& v = obj[key];
    if (!v.isNumeric()) {
        throw ConfigError(where + "." + key + " must be a number");
    }
    out = v.asDouble();
}

void read_bool(const Json::Value& obj, const char* key, const std::string& where, bool& out) {
    if (!obj.isMember(key)) return;
    const Json::Value& v = obj[key];
    if (!v.isBool()) {
        throw ConfigError(where + "." + key + " must be true or false");
    }
    out = v.asBool();
}

void read_string(const Json::Value& obj, const char* key, const std::string& where, std::string& out) {
    if (!obj.isMember(key)) return;
    const Json::Value& v = obj[key];
    if (!v.isString()) {
        throw ConfigError(where + "." + key + " must be a string");
    }
    out = v.asString();
}

// Sizes are given in MB/KB and times in seconds; negative values are
// rejected here because they would wrap in the unsigned fields
int64_t read_non_negative(const Json::Value& obj, const char* key, const std::string& where) {
    int64_t value = 0;
    read_int(obj, key, where, value);
    if (value < 0) {
        throw ConfigError(where + "." + key + " must not be negative");
    }
    return value;
}

ResourceProfile parse_profile(const Json::Value& obj, const std::string& where, ResourceProfile base) {
    if (!obj.isObject()) {
        throw ConfigError(where + " must be an object");
    }
    read_string(obj, "name", where, base.name);
    read_double(obj, "cpu_share", where, base.cpu_share);
    if (obj.isMember("memory_mb")) {
        base.memory_limit_bytes = static_cast<size_t>(read_non_negative(obj, "memory_mb", where)) * MB;
    }
    if (obj.isMember("timeout_seconds")) {
        base.wall_clock_timeout = std::chrono::seconds(read_non_negative(obj, "timeout_seconds", where));
    }
    if (obj.isMember("max_output_kb")) {
        base.max_output_bytes = static_cast<size_t>(read_non_negative(obj, "max_output_kb", where)) * KB;
    }
    read_int(obj, "max_processes", where, base.max_processes);
    return base;
}

TenantQuota::Limits parse_limits(const Json::Value& obj, const std::string& where, TenantQuota::Limits base) {
    if (!obj.isObject()) {
        throw ConfigError(where + " must be an object");
    }
    read_int(obj, "max_active_jobs", where, base.max_active_jobs);
    read_int(obj, "max_jobs_per_hour", where, base.max_jobs_per_hour);
    read_double(obj, "cpu_seconds_per_minute", where, base.cpu_seconds_per_minute);
    return base;
}

void validate_profile(const ResourceProfile& profile, const std::string& where) {
    if (profile.cpu_share <= 0) {
        throw ConfigError(where + ".cpu_share must be positive");
    }
    if (profile.memory_limit_bytes == 0) {
        throw ConfigError(where + ".memory_mb must be positive");
    }
    if (profile.wall_clock_timeout.count() <= 0) {
        throw ConfigError(where + ".timeout_seconds must be positive");
    }
    if (profile.max_output_bytes == 0) {
        throw ConfigError(where + ".max_output_kb must be positive");
    }
    if (profile.max_processes <= 0) {
        throw ConfigError(where + ".max_processes must be positive");
    }
}

void validate_limits(const TenantQuota::Limits& limits, const std::string& where) {
    if (limits.max_active_jobs <= 0) {
        throw ConfigError(where + ".max_active_jobs must be positive");
    }
    if (limits.max_jobs_per_hour <= 0) {
        throw ConfigError(where + ".max_jobs_per_hour must be positive");
    }
    if (limits.cpu_seconds_per_minute < 0) {
        throw ConfigError(where + ".cpu_seconds_per_minute must not be negative");
    }
}

} // namespace

ResourceProfile EngineConfig::premium_defaults() {
    ResourceProfile profile;
    profile.name = "premium";
    profile.cpu_share = PREMIUM_CPU_SHARE;
    profile.memory_limit_bytes = PREMIUM_MEMORY_LIMIT_BYTES;
    profile.wall_clock_timeout = std::chrono::seconds(PREMIUM_TIMEOUT_SECONDS);
    return profile;
}

EngineConfig EngineConfig::from_json(const std::string& text) {
    Json::Value root;
    Json::CharReaderBuilder builder;
    std::string errors;
    std::istringstream stream(text);
    if (!Json::parseFromStream(builder, stream, &root, &errors)) {
        throw ConfigError("invalid JSON: " + errors);
    }
    if (!root.isObject()) {
        throw ConfigError("top level must be an object");
    }

    EngineConfig config;

    const Json::Value& engine = section(root, "engine");
    if (engine.isObject()) {
        read_int(engine, "pool_size", "engine", config.dispatcher.pool_size);
        if (engine.isMember("queue_capacity")) {
            config.dispatcher.queue_capacity =
                static_cast<size_t>(read_non_negative(engine, "queue_capacity", "engine"));
        }
        if (engine.isMember("max_script_bytes")) {
            config.dispatcher.max_script_bytes =
                static_cast<size_t>(read_non_negative(engine, "max_script_bytes", "engine"));
        }
        if (engine.isMember("retention_seconds")) {
            config.dispatcher.retention =
                std::chrono::seconds(read_non_negative(engine, "retention_seconds", "engine"));
        }
        if (engine.isMember("network_policy")) {
            std::string name;
            read_string(engine, "network_policy", "engine", name);
            auto policy = parse_network_policy(name);
            if (!policy) {
                throw ConfigError("engine.network_policy must be none, target-only or allow");
            }
            config.dispatcher.network_policy = *policy;
        }
        if (engine.isMember("events_log")) {
            std::string path;
            read_string(engine, "events_log", "engine", path);
            config.events_log = path;
        }
    }

    const Json::Value& sandbox = section(root, "sandbox");
    if (sandbox.isObject()) {
        read_string(sandbox, "interpreter", "sandbox", config.sandbox.interpreter);
        read_string(sandbox, "work_root", "sandbox", config.sandbox.work_root);
        read_bool(sandbox, "use_namespaces", "sandbox", config.sandbox.use_namespaces);
        read_bool(sandbox, "use_cgroups", "sandbox", config.sandbox.use_cgroups);
        read_string(sandbox, "cgroup_root", "sandbox", config.sandbox.cgroup_root);
        read_bool(sandbox, "use_seccomp", "sandbox", config.sandbox.use_seccomp);
        if (sandbox.isMember("extra_readonly_path")) {
            std::string path;
            read_string(sandbox, "extra_readonly_path", "sandbox", path);
            config.sandbox.extra_readonly_path = path;
        }
    }

    if (root.isMember("default_profile")) {
        config.default_profile = parse_profile(root["default_profile"], "default_profile",
                                               config.default_profile);
    }
    if (root.isMember("premium_profile")) {
        config.premium_profile = parse_profile(root["premium_profile"], "premium_profile",
                                               config.premium_profile);
    }

    const Json::Value& ceiling = root["hard_ceiling"];
    if (ceiling.isIntegral()) {
        config.hard_ceiling = std::chrono::seconds(ceiling.asInt64());
    } else if (ceiling.isObject()) {
        if (ceiling.isMember("timeout_seconds")) {
            config.hard_ceiling =
                std::chrono::seconds(read_non_negative(ceiling, "timeout_seconds", "hard_ceiling"));
        }
    } else if (!ceiling.isNull()) {
        throw ConfigError("hard_ceiling must be a number of seconds or an object");
    }

    const Json::Value& limits = section(root, "tenant_limits");
    if (limits.isObject()) {
        if (limits.isMember("standard")) {
            config.tenant_limits.standard = parse_limits(limits["standard"], "tenant_limits.standard",
                                                         config.tenant_limits.standard);
        }
        if (limits.isMember("premium")) {
            config.tenant_limits.premium = parse_limits(limits["premium"], "tenant_limits.premium",
                                                        config.tenant_limits.premium);
        }
        read_int(limits, "cleanup_after_minutes", "tenant_limits",
                 config.tenant_limits.cleanup_after_minutes);
    }

    const Json::Value& tenants = section(root, "tenants");
    if (tenants.isObject()) {
        for (const auto& tenant_id : tenants.getMemberNames()) {
            const Json::Value& entry = tenants[tenant_id];
            std::string where = "tenants." + tenant_id;
            if (!entry.isObject()) {
                throw ConfigError(where + " must be an object");
            }

            TenantConfig tenant;
            read_bool(entry, "premium", where, tenant.premium);
            if (entry.isMember("profile")) {
                ResourceProfile base = tenant.premium ? config.premium_profile : config.default_profile;
                base.name = tenant_id;
                tenant.profile = parse_profile(entry["profile"], where + ".profile", base);
            }
            if (entry.isMember("limits")) {
                TenantQuota::Limits base = tenant.premium ? config.tenant_limits.premium
                                                          : config.tenant_limits.standard;
                tenant.limits = parse_limits(entry["limits"], where + ".limits", base);
            }
            config.tenants[tenant_id] = tenant;
        }
    }

    config.validate();
    return config;
}

EngineConfig EngineConfig::from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigError("cannot open " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json(buffer.str());
}

void EngineConfig::validate() const {
    if (dispatcher.pool_size <= 0) {
        throw ConfigError("engine.pool_size must be positive");
    }
    if (dispatcher.queue_capacity == 0) {
        throw ConfigError("engine.queue_capacity must be positive");
    }
    if (dispatcher.max_script_bytes == 0) {
        throw ConfigError("engine.max_script_bytes must be positive");
    }
    if (sandbox.interpreter.empty()) {
        throw ConfigError("sandbox.interpreter must not be empty");
    }
    if (sandbox.work_root.empty()) {
        throw ConfigError("sandbox.work_root must not be empty");
    }
    if (hard_ceiling.count() <= 0) {
        throw ConfigError("hard_ceiling must be positive");
    }

    validate_profile(default_profile, "default_profile");
    validate_profile(premium_profile, "premium_profile");
    validate_limits(tenant_limits.standard, "tenant_limits.standard");
    validate_limits(tenant_limits.premium, "tenant_limits.premium");

    for (const auto& entry : tenants) {
        const std::string where = "tenants." + entry.first;
        if (entry.second.profile) {
            validate_profile(*entry.second.profile, where + ".profile");
        }
        if (entry.second.limits) {
            validate_limits(*entry.second.limits, where + ".limits");
        }
    }
}

} // namespace runcage
